#include "agrisim/core/config_validation.h"

#include <algorithm>
#include <set>
#include <sstream>
#include <utility>

namespace agrisim {

namespace {

void push(std::vector<std::string>& out, std::string msg) { out.push_back(std::move(msg)); }

template <typename... Parts>
std::string join(Parts&&... parts) {
  std::ostringstream ss;
  (ss << ... << std::forward<Parts>(parts));
  return ss.str();
}

void non_negative(std::vector<std::string>& errors, int value, const char* name) {
  if (value < 0) push(errors, join(name, " must be >= 0 (got ", value, ")"));
}

std::string seasons_text(const std::vector<Season>& seasons) {
  std::string out = "(";
  for (std::size_t i = 0; i < seasons.size(); ++i) {
    if (i) out += ", ";
    out += season_name(seasons[i]);
  }
  return out + ")";
}

// Seasons in which each catalog crop can be grown outdoors.
const std::set<Season>* allowed_seasons(const std::string& crop_id) {
  static const std::set<Season> starfruit{Season::Summer};
  static const std::set<Season> ancient{Season::Spring, Season::Summer, Season::Fall};
  if (crop_id == kStarfruitId) return &starfruit;
  if (crop_id == kAncientFruitId) return &ancient;
  return nullptr;
}

void check_plot_seasons(std::vector<std::string>& errors, const Plot& plot, const std::string& crop_id,
                        CropSelection mode) {
  std::string target = crop_id;
  if (crop_id == kAllCropsKey) {
    if (mode == CropSelection::Both) return;
    target = crop_selection_name(mode);
  }
  const auto* allowed = allowed_seasons(target);
  if (!allowed) return;
  const auto& seasons = plot.calendar.seasons;
  const bool ok = std::all_of(seasons.begin(), seasons.end(), [&](Season s) { return allowed->count(s) > 0; });
  if (!ok) {
    push(errors, join("plot '", plot.name, "' seasons ", seasons_text(seasons), " invalid for crop '", target, "'"));
  }
}

void validate_plots(std::vector<std::string>& errors, const AppConfig& cfg) {
  for (const auto& plot : cfg.plots) {
    const bool seasonal = plot.calendar.kind == PlotCalendar::Kind::Seasons;
    if (seasonal && plot.calendar.seasons.empty()) {
      push(errors, join("plot '", plot.name, "' uses seasons calendar with no seasons"));
    }
    for (const auto& [crop_id, tiles] : plot.tiles_by_crop) {
      if (tiles < 0) {
        push(errors, join("plot '", plot.name, "' has negative tiles for ", crop_id, ": ", tiles));
        continue;
      }
      if (tiles == 0) continue;
      if (cfg.crop != CropSelection::Both && crop_id != kAllCropsKey && crop_id != crop_selection_name(cfg.crop)) {
        push(errors, join("plot '", plot.name, "' defines tiles for ", crop_id, ", but crop selection is '",
                          crop_selection_name(cfg.crop), "'"));
        continue;
      }
      if (seasonal) check_plot_seasons(errors, plot, crop_id, cfg.crop);
    }
  }
}

void validate_animals(std::vector<std::string>& errors, const AnimalsConfig& a) {
  for (const auto& c : a.coops) {
    if (c.chickens < 0 || c.ducks < 0 || c.rabbits < 0 || c.void_chickens < 0) {
      push(errors, join("coop '", c.name, "' has negative animal counts"));
    } else if (c.occupants() > kAnimalBuildingCapacity) {
      push(errors, join("coop '", c.name, "' has ", c.occupants(), " animals, exceeds capacity ",
                        kAnimalBuildingCapacity));
    }
  }
  for (const auto& b : a.barns) {
    if (b.cows < 0 || b.goats < 0 || b.pigs < 0 || b.sheep < 0) {
      push(errors, join("barn '", b.name, "' has negative animal counts"));
    } else if (b.occupants() > kAnimalBuildingCapacity) {
      push(errors, join("barn '", b.name, "' has ", b.occupants(), " animals, exceeds capacity ",
                        kAnimalBuildingCapacity));
    }
  }

  const std::pair<const char*, double> rates[] = {
      {"large_egg_rate", a.large_egg_rate},
      {"large_milk_rate", a.large_milk_rate},
      {"large_goat_milk_rate", a.large_goat_milk_rate},
      {"rabbit_foot_rate", a.rabbit_foot_rate},
  };
  for (const auto& [name, value] : rates) {
    if (value < 0.0 || value > 1.0) push(errors, join(name, " must be between 0 and 1 (got ", value, ")"));
  }
}

void validate_price_map(std::vector<std::string>& errors, const char* label, const std::map<std::string, int>& m) {
  for (const auto& [key, value] : m) {
    if (value < 0) push(errors, join(label, ".", key, " must be >= 0 (got ", value, ")"));
  }
}

void validate_economy(std::vector<std::string>& errors, const AppConfig& cfg) {
  const EconomyConfig& e = cfg.economy;
  const std::pair<const char*, double> multipliers[] = {
      {"aged_wine_multiplier", e.aged_wine_multiplier},
      {"wine_quality_multiplier", e.wine_quality_multiplier},
      {"fruit_quality_multiplier", e.fruit_quality_multiplier},
  };
  for (const auto& [name, value] : multipliers) {
    if (value <= 0.0) push(errors, join(name, " must be > 0 (got ", value, ")"));
  }
  if (e.casks_with_walkways) {
    if (*e.casks_with_walkways < 0) push(errors, "casks_with_walkways must be >= 0");
    if (*e.casks_with_walkways > cfg.casks) push(errors, "casks_with_walkways cannot exceed casks");
  }

  validate_price_map(errors, "wine_price", e.wine_price);
  validate_price_map(errors, "fruit_price", e.fruit_price);
  validate_price_map(errors, "seed_cost", e.seed_cost);
  for (const auto& [fert, value] : e.fertilizer_cost) {
    if (value < 0) push(errors, join("fertilizer_cost.", fertilizer_name(fert), " must be >= 0 (got ", value, ")"));
  }
}

void validate_inventory(std::vector<std::string>& errors, const StartingInventory& inv) {
  validate_price_map(errors, "starting_inventory.fruit", inv.fruit);
  validate_price_map(errors, "starting_inventory.base_wine", inv.base_wine);
}

void validate_bees(std::vector<std::string>& errors, const BeeConfig& bees) {
  if (bees.bee_houses <= 0) return;
  if (bees.seasons.empty()) {
    push(errors, "bees.seasons must include at least one season when bee_houses > 0");
    return;
  }
  for (const auto& [season, plan] : bees.flower_plan) {
    if (std::find(bees.seasons.begin(), bees.seasons.end(), season) == bees.seasons.end()) {
      push(errors, join("bees.flower_plan contains season '", season_name(season), "' not in bees.seasons"));
    }
    const std::pair<const char*, const FlowerSpec*> specs[] = {{"fast", &plan.fast}, {"expensive", &plan.expensive}};
    for (const auto& [label, spec] : specs) {
      if (spec->growth_days < 0) {
        push(errors, join("bees.flower_plan.", season_name(season), ".", label, ".growth_days must be >= 0"));
      }
      if (spec->base_price < 0) {
        push(errors, join("bees.flower_plan.", season_name(season), ".", label, ".base_price must be >= 0"));
      }
    }
  }
}

void validate_fruit_trees(std::vector<std::string>& errors, const FruitTreesConfig& trees) {
  validate_price_map(errors, "fruit_trees.greenhouse", trees.greenhouse);
  validate_price_map(errors, "fruit_trees.outdoors", trees.outdoors);
  validate_price_map(errors, "fruit_trees.always", trees.always);
}

} // namespace

std::vector<std::string> validate_app_config(const AppConfig& cfg) {
  std::vector<std::string> errors;

  non_negative(errors, cfg.kegs, "kegs");
  non_negative(errors, cfg.casks, "casks");
  non_negative(errors, cfg.preserves_jars, "preserves_jars");
  non_negative(errors, cfg.dehydrators, "dehydrators");
  non_negative(errors, cfg.oil_makers, "oil_makers");
  non_negative(errors, cfg.mayo_machines, "mayo_machines");
  non_negative(errors, cfg.cheese_presses, "cheese_presses");
  non_negative(errors, cfg.looms, "looms");
  non_negative(errors, cfg.bees.bee_houses, "bee_houses");
  non_negative(errors, cfg.tiles, "tiles");
  if (cfg.simulation.max_days < 1 || cfg.simulation.max_days > kDaysPerYear) {
    push(errors, join("simulation.max_days must be in 1..", kDaysPerYear, " (got ", cfg.simulation.max_days, ")"));
  }

  validate_animals(errors, cfg.animals);
  validate_plots(errors, cfg);
  validate_economy(errors, cfg);
  validate_inventory(errors, cfg.starting_inventory);
  validate_bees(errors, cfg.bees);
  validate_fruit_trees(errors, cfg.fruit_trees);
  return errors;
}

} // namespace agrisim
