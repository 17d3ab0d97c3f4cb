#include "agrisim/core/fruit_trees.h"

#include <algorithm>

#include "agrisim/util/strings.h"

namespace agrisim {
namespace {

struct TreeInfo {
  const char* id;
  const char* object_id;
  Season season;
};

const TreeInfo kTrees[] = {
    {"cherry", "628", Season::Spring},  {"apricot", "629", Season::Spring}, {"orange", "630", Season::Summer},
    {"peach", "631", Season::Summer},   {"pomegranate", "632", Season::Fall}, {"apple", "633", Season::Fall},
    {"banana", "69", Season::Summer},   {"mango", "835", Season::Summer},
};

void add_positive(std::map<std::string, int>& out, const std::map<std::string, int>& scope) {
  for (const auto& [id, count] : scope) {
    if (count > 0) out[id] += count;
  }
}

} // namespace

const std::vector<std::string>& fruit_tree_ids() {
  static const std::vector<std::string> ids = [] {
    std::vector<std::string> v;
    for (const auto& t : kTrees) v.emplace_back(t.id);
    std::sort(v.begin(), v.end());
    return v;
  }();
  return ids;
}

std::string normalize_fruit_tree_name(const std::string& raw) {
  std::string key = normalize_key(raw);
  const std::string suffix = "tree";
  if (key.size() > suffix.size() && key.compare(key.size() - suffix.size(), suffix.size(), suffix) == 0) {
    key.resize(key.size() - suffix.size());
  }
  for (const auto& t : kTrees) {
    if (key == t.id || key == t.object_id) return t.id;
  }
  return {};
}

bool fruit_tree_season(const std::string& fruit_id, Season& out) {
  for (const auto& t : kTrees) {
    if (fruit_id == t.id) {
      out = t.season;
      return true;
    }
  }
  return false;
}

std::map<std::string, int> total_tree_counts(const FruitTreesConfig& cfg) {
  std::map<std::string, int> total;
  add_positive(total, cfg.greenhouse);
  add_positive(total, cfg.outdoors);
  add_positive(total, cfg.always);
  return total;
}

std::map<std::string, std::vector<int>> build_daily_fruit(const FruitTreesConfig& cfg, int start_day_of_year,
                                                          int days) {
  std::map<std::string, std::vector<int>> daily;
  days = std::max(0, days);
  start_day_of_year = std::max(1, start_day_of_year);
  const auto totals = total_tree_counts(cfg);
  if (totals.empty() || days == 0) return daily;

  for (const auto& [id, _] : totals) daily[id].assign(static_cast<std::size_t>(days), 0);

  std::map<std::string, int> year_round;
  add_positive(year_round, cfg.greenhouse);
  add_positive(year_round, cfg.always);

  for (int i = 0; i < days; ++i) {
    const int doy = ((start_day_of_year - 1 + i) % kDaysPerYear) + 1;
    const Season season = season_for_day_of_year(doy);
    for (const auto& [id, count] : year_round) daily[id][i] += count;
    for (const auto& [id, count] : cfg.outdoors) {
      if (count <= 0) continue;
      Season tree_season{};
      if (fruit_tree_season(id, tree_season) && tree_season == season) daily[id][i] += count;
    }
  }
  return daily;
}

} // namespace agrisim
