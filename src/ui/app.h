#pragma once

#include <string>
#include <vector>

#include <SDL.h>

#include "agrisim/core/ancient_seeds.h"
#include "agrisim/core/config.h"
#include "agrisim/core/report.h"

namespace agrisim::ui {

// Interactive report viewer: loads a config (or a game save plus overrides),
// lets the user adjust machine counts and reruns the year on demand.
class App {
 public:
  explicit App(std::string config_path, std::string overrides_path = "");

  // Called once per frame.
  void frame();

  // F5 reloads the config from disk; Ctrl+R reruns the year.
  void on_event(const SDL_Event& e);

  bool has_report() const { return has_report_; }
  // Number of simulated years since startup.
  int runs() const { return runs_; }

 private:
  void load_config();
  void rerun();

  void draw_farm_window();
  void draw_production_window();
  void draw_revenue_window();
  void draw_trace_window();
  void draw_seeds_window();

  void load_seed_outlook();

  char config_path_[256] = "data/configs/example.json";
  char overrides_path_[256] = "";

  bool has_config_{false};
  AppConfig cfg_;
  bool has_report_{false};
  YearReport report_;
  int runs_{0};
  std::vector<std::string> errors_;

  bool show_production_{true};
  bool show_revenue_{true};
  bool show_trace_{true};

  // Ancient seed outlook; only filled for game saves.
  bool has_seeds_{false};
  SaveDate save_date_;
  PlantSiteCounts plant_sites_;
  std::vector<SeedThreshold> seed_thresholds_;
  bool show_seeds_{true};
};

} // namespace agrisim::ui
