#include "ui/app.h"

#include <imgui.h>

#include <algorithm>
#include <cstdio>
#include <initializer_list>
#include <optional>

#include "agrisim/core/config_validation.h"
#include "agrisim/core/save_import.h"
#include "agrisim/util/log.h"
#include "agrisim/util/xml.h"

namespace agrisim::ui {
namespace {

constexpr int kSeedOutlookYears = 20;
const std::vector<int> kSeedTargets = {10, 20, 30, 50, 100, 150, 200, 250, 300, 350, 400};

void plot_series(const char* label, const std::vector<float>& data) {
  if (data.empty()) return;
  const float top = std::max(1.0f, *std::max_element(data.begin(), data.end()));
  ImGui::PlotLines(label, data.data(), static_cast<int>(data.size()), 0, nullptr, 0.0f, top, ImVec2(0, 80));
}

void row_int(const char* label, int v) {
  ImGui::TableNextRow();
  ImGui::TableSetColumnIndex(0);
  ImGui::TextUnformatted(label);
  ImGui::TableSetColumnIndex(1);
  ImGui::Text("%d", v);
}

bool input_count(const char* label, int& v) {
  const bool changed = ImGui::InputInt(label, &v);
  if (v < 0) v = 0;
  return changed;
}

} // namespace

App::App(std::string config_path, std::string overrides_path) {
  if (!config_path.empty()) std::snprintf(config_path_, sizeof(config_path_), "%s", config_path.c_str());
  std::snprintf(overrides_path_, sizeof(overrides_path_), "%s", overrides_path.c_str());
  load_config();
}

void App::on_event(const SDL_Event& e) {
  if (e.type != SDL_KEYDOWN || e.key.repeat) return;
  if (e.key.keysym.sym == SDLK_F5) {
    log::info(std::string("reloading ") + config_path_);
    load_config();
    return;
  }
  // Ctrl+R is left alone while a text field has focus.
  if (e.key.keysym.sym == SDLK_r && (e.key.keysym.mod & KMOD_CTRL) && !ImGui::GetIO().WantTextInput) {
    if (has_config_) rerun();
  }
}

void App::load_config() {
  errors_.clear();
  has_seeds_ = false;
  try {
    cfg_ = load_app_config_from_file(config_path_, overrides_path_);
    has_config_ = true;
  } catch (const std::exception& e) {
    has_config_ = false;
    has_report_ = false;
    errors_.push_back(e.what());
    log::warn(std::string("config load failed: ") + e.what());
    return;
  }
  if (is_save_file(config_path_)) load_seed_outlook();
  rerun();
}

void App::load_seed_outlook() {
  try {
    const xml::Document save = xml::Document::load_file(config_path_);
    save_date_ = read_save_date(save);
    const auto plants = find_ancient_plants(save);
    plant_sites_ = count_plant_sites(plants);
    const auto timeline = simulate_seed_timeline(plants, save_date_.day_of_year, kSeedOutlookYears * kDaysPerYear);
    seed_thresholds_ = seed_threshold_days(timeline, kSeedTargets);
    has_seeds_ = true;
  } catch (const std::exception& e) {
    // The report still works without the outlook.
    log::warn(std::string("ancient seed outlook unavailable: ") + e.what());
  }
}

void App::rerun() {
  errors_ = validate_app_config(cfg_);
  if (!errors_.empty()) {
    has_report_ = false;
    return;
  }
  try {
    report_ = build_year_report(cfg_);
    has_report_ = true;
    ++runs_;
  } catch (const std::exception& e) {
    has_report_ = false;
    errors_.push_back(e.what());
  }
}

void App::frame() {
  draw_farm_window();
  if (!has_report_) return;
  if (show_production_) draw_production_window();
  if (show_revenue_) draw_revenue_window();
  if (show_trace_) draw_trace_window();
  if (has_seeds_ && show_seeds_) draw_seeds_window();
}

void App::draw_farm_window() {
  ImGui::SetNextWindowPos(ImVec2(10, 10), ImGuiCond_FirstUseEver);
  ImGui::SetNextWindowSize(ImVec2(380, 520), ImGuiCond_FirstUseEver);
  if (!ImGui::Begin("Farm")) {
    ImGui::End();
    return;
  }

  ImGui::InputText("Config", config_path_, sizeof(config_path_));
  ImGui::InputText("Overrides", overrides_path_, sizeof(overrides_path_));
  if (ImGui::Button("Load")) load_config();
  ImGui::SameLine();
  ImGui::TextDisabled("F5 reload, Ctrl+R rerun");

  if (has_config_) {
    ImGui::SeparatorText("Machines");
    bool changed = false;
    changed |= input_count("Kegs", cfg_.kegs);
    changed |= input_count("Casks", cfg_.casks);
    changed |= input_count("Preserves jars", cfg_.preserves_jars);
    changed |= input_count("Dehydrators", cfg_.dehydrators);
    changed |= ImGui::Checkbox("Full cask batch required", &cfg_.economy.cask_full_batch_required);

    ImGui::SeparatorText("Growth");
    int fert = static_cast<int>(cfg_.growth.fertilizer);
    const char* ferts[] = {"none", "speed_gro", "deluxe_speed_gro", "hyper_speed_gro"};
    if (ImGui::Combo("Fertilizer", &fert, ferts, IM_ARRAYSIZE(ferts))) {
      cfg_.growth.fertilizer = static_cast<Fertilizer>(fert);
      changed = true;
    }
    int cadence = static_cast<int>(cfg_.simulation.fertilizer_cadence);
    const char* cadences[] = {"per_season", "per_regrowth_cycle"};
    if (ImGui::Combo("Fertilizer cadence", &cadence, cadences, IM_ARRAYSIZE(cadences))) {
      cfg_.simulation.fertilizer_cadence = static_cast<FertilizerCadence>(cadence);
      changed = true;
    }
    if (ImGui::Checkbox("Agriculturist", &cfg_.growth.agriculturist)) {
      cfg_.professions.farming.agriculturist = cfg_.growth.agriculturist;
      changed = true;
    }
    if (ImGui::Checkbox("Artisan", &cfg_.professions.farming.artisan)) {
      cfg_.economy.artisan = cfg_.professions.farming.artisan;
      changed = true;
    }
    if (changed) rerun();
  }

  if (!errors_.empty()) {
    ImGui::SeparatorText("Errors");
    for (const auto& e : errors_) ImGui::TextColored(ImVec4(1.0f, 0.4f, 0.4f, 1.0f), "%s", e.c_str());
  }

  if (has_report_) {
    ImGui::SeparatorText("Year");
    ImGui::TextDisabled("run #%d, %d days", runs_, report_.production.days_simulated);
    ImGui::Text("Total revenue: %d", report_.total_revenue);
    ImGui::Text("Total profit:  %d", report_.total_profit);
    ImGui::Text("Casks used: %d (%.2f uses each)", report_.production.casks_effective,
                report_.production.uses_per_cask);
    ImGui::Text("Kegs sufficient: %s", report_.production.kegs_sufficient ? "yes" : "no");
    for (const auto& tip : report_.quick_wins) ImGui::BulletText("%s", tip.c_str());

    ImGui::Separator();
    ImGui::Checkbox("Production", &show_production_);
    ImGui::SameLine();
    ImGui::Checkbox("Revenue", &show_revenue_);
    ImGui::SameLine();
    ImGui::Checkbox("Daily trace", &show_trace_);
    if (has_seeds_) {
      ImGui::SameLine();
      ImGui::Checkbox("Ancient seeds", &show_seeds_);
    }
  }
  ImGui::End();
}

void App::draw_production_window() {
  ImGui::SetNextWindowSize(ImVec2(760, 360), ImGuiCond_FirstUseEver);
  if (!ImGui::Begin("Production", &show_production_)) {
    ImGui::End();
    return;
  }

  const ImGuiTableFlags flags = ImGuiTableFlags_RowBg | ImGuiTableFlags_Borders | ImGuiTableFlags_ScrollX;
  if (ImGui::BeginTable("##products", 10, flags)) {
    const char* headers[] = {"Product", "Harvested", "Raw", "Wine", "Aged", "Wine sold",
                             "Jelly",   "Dried",     "Seeds", "Net"};
    for (const char* h : headers) ImGui::TableSetupColumn(h);
    ImGui::TableHeadersRow();
    for (const auto& p : report_.production.products) {
      const ProfitBreakdown* b = report_.crop_profit.find(p.product_id);
      ImGui::TableNextRow();
      ImGui::TableSetColumnIndex(0);
      ImGui::Text("%s%s", p.product_id.c_str(), p.external ? " (tree)" : "");
      const int cols[] = {p.fruit_harvested, p.fruit_unprocessed, p.base_goods_produced, p.base_goods_aged,
                          p.base_goods_sold, p.preserves_produced, p.dried_produced, p.seed_units,
                          b ? b->net_profit() : 0};
      for (int i = 0; i < IM_ARRAYSIZE(cols); ++i) {
        ImGui::TableSetColumnIndex(i + 1);
        ImGui::Text("%d", cols[i]);
      }
    }
    ImGui::EndTable();
  }
  ImGui::End();
}

void App::draw_revenue_window() {
  ImGui::SetNextWindowSize(ImVec2(360, 380), ImGuiCond_FirstUseEver);
  if (!ImGui::Begin("Revenue", &show_revenue_)) {
    ImGui::End();
    return;
  }
  if (ImGui::BeginTable("##categories", 2, ImGuiTableFlags_RowBg | ImGuiTableFlags_BordersInnerV)) {
    for (const auto& [name, value] : report_.category_totals) row_int(name.c_str(), value);
    row_int("seed cost", -report_.crop_profit.total_seed_cost);
    row_int("fertilizer cost", -report_.crop_profit.total_fertilizer_cost);
    ImGui::EndTable();
  }
  ImGui::End();
}

void App::draw_trace_window() {
  ImGui::SetNextWindowSize(ImVec2(760, 420), ImGuiCond_FirstUseEver);
  if (!ImGui::Begin("Daily trace", &show_trace_)) {
    ImGui::End();
    return;
  }

  std::vector<float> harvest, stock, kegs, jars, dehydrators;
  for (const auto& d : report_.production.trace) {
    harvest.push_back(static_cast<float>(d.harvested + d.external_fruit));
    stock.push_back(static_cast<float>(d.inventory));
    kegs.push_back(static_cast<float>(d.kegs_busy));
    jars.push_back(static_cast<float>(d.jars_busy));
    dehydrators.push_back(static_cast<float>(d.dehydrators_busy));
  }
  plot_series("Fruit in", harvest);
  plot_series("Unprocessed fruit", stock);
  plot_series("Busy kegs", kegs);
  plot_series("Busy jars", jars);
  plot_series("Busy dehydrators", dehydrators);
  ImGui::End();
}

void App::draw_seeds_window() {
  ImGui::SetNextWindowSize(ImVec2(560, 380), ImGuiCond_FirstUseEver);
  if (!ImGui::Begin("Ancient seeds", &show_seeds_)) {
    ImGui::End();
    return;
  }
  ImGui::Text("Save date: %s (day %d)", format_season_day(save_date_.day_of_year, 0).c_str(), save_date_.day_of_year);
  ImGui::Text("Plants: greenhouse %d, outdoors %d, year-round %d", plant_sites_.greenhouse, plant_sites_.outdoors,
              plant_sites_.always);
  ImGui::TextDisabled("Seed Maker yields %d..%d seeds per fruit (%.1f on average)", kAncientSeedsMin,
                      kAncientSeedsMax, kAncientSeedsAvg);

  const auto cell = [&](const std::optional<int>& day) {
    if (!day) {
      ImGui::TextDisabled("not reached");
      return;
    }
    ImGui::Text("%d (%s)", *day, format_season_day(save_date_.day_of_year, *day).c_str());
  };
  if (ImGui::BeginTable("##seeds", 4, ImGuiTableFlags_RowBg | ImGuiTableFlags_Borders)) {
    for (const char* h : {"Seeds", "Worst case", "Average", "Best case"}) ImGui::TableSetupColumn(h);
    ImGui::TableHeadersRow();
    for (const auto& t : seed_thresholds_) {
      ImGui::TableNextRow();
      ImGui::TableSetColumnIndex(0);
      ImGui::Text("%d", t.target);
      ImGui::TableSetColumnIndex(1);
      cell(t.min_day);
      ImGui::TableSetColumnIndex(2);
      cell(t.avg_day);
      ImGui::TableSetColumnIndex(3);
      cell(t.max_day);
    }
    ImGui::EndTable();
  }
  ImGui::End();
}

} // namespace agrisim::ui
