#pragma once

#include <map>
#include <string>
#include <vector>

#include "agrisim/core/animals.h"
#include "agrisim/core/bees.h"
#include "agrisim/core/crops.h"
#include "agrisim/core/economy.h"
#include "agrisim/core/fruit_trees.h"
#include "agrisim/core/growth.h"
#include "agrisim/core/plot_simulator.h"
#include "agrisim/core/simulation.h"
#include "agrisim/util/json.h"

namespace agrisim {

// Which catalog crops the farm grows.
enum class CropSelection { Both, Starfruit, Ancient };

const char* crop_selection_name(CropSelection c);

struct FarmingProfessions {
  bool rancher{false};
  bool tiller{false};
  bool coopmaster{false};
  bool shepherd{false};
  bool artisan{false};
  bool agriculturist{false};
};

struct ForagingProfessions {
  bool forester{false};
  bool gatherer{false};
  bool lumberjack{false};
  bool tapper{false};
  bool botanist{false};
  bool tracker{false};
};

// Professions outside farming and foraging do not affect any output; they are
// kept so a round-tripped config stays complete.
struct ProfessionsConfig {
  FarmingProfessions farming;
  ForagingProfessions foraging;
  std::map<std::string, bool> fishing;
  std::map<std::string, bool> mining;
  std::map<std::string, bool> combat;
};

struct SimulationSettings {
  int max_days{kDaysPerYear};
  bool assume_year_round{true};
  int start_day_of_year{1};
  FertilizerCadence fertilizer_cadence{FertilizerCadence::PerSeason};
};

struct StartingInventory {
  std::map<std::string, int> fruit;
  std::map<std::string, int> base_wine;
};

struct AppConfig {
  int tiles{0};
  int kegs{0};
  int casks{0};
  int preserves_jars{0};
  int dehydrators{0};
  int oil_makers{0};
  int mayo_machines{0};
  int cheese_presses{0};
  int looms{0};

  CropSelection crop{CropSelection::Both};
  // Empty means one always-active plot with `tiles` tiles for every crop.
  std::vector<Plot> plots;

  GrowthModifiers growth;
  ProfessionsConfig professions;
  SimulationSettings simulation;
  EconomyConfig economy;
  StartingInventory starting_inventory;

  AnimalsConfig animals;
  BeeConfig bees;
  FruitTreesConfig fruit_trees;
};

// Normalizes a product key from a config map: crop names, fruit tree names
// and the special "both"/"all" key. Throws std::runtime_error when unknown.
std::string normalize_product_name(const std::string& raw);

// Parses a config document. Throws std::runtime_error on missing required
// keys, wrong value types and unknown crop/fertilizer/season/fruit names.
AppConfig parse_app_config(const json::Value& root);

// Loads a JSON config, or imports a game save (see save_import.h) when `path`
// is one. `overrides_path` names a JSON overrides document and is only
// accepted together with a save; throws std::runtime_error otherwise.
AppConfig load_app_config_from_file(const std::string& path, const std::string& overrides_path = "");

// Applies the settings a save cannot provide on top of `base`: growth
// fertilizer/paddy bonus, economy prices and cask policy, simulation length,
// starting inventory, bee flower plans, fruit tree counts and the crop
// selection. Keys that are absent keep the base value.
AppConfig apply_config_overrides(AppConfig base, const json::Value& overrides);

// Catalog crops selected by `cfg.crop`, starfruit first.
std::vector<Crop> selected_crops(const AppConfig& cfg);

// The configured plots, or the implicit single plot.
std::vector<Plot> effective_plots(const AppConfig& cfg);

// External fruit products ordered by wine price, highest first.
std::vector<std::string> fruit_tree_priority(const AppConfig& cfg);

// Everything the year simulation needs. The year always starts on spring 1.
SimulationInputs build_simulation_inputs(const AppConfig& cfg);

} // namespace agrisim
