#include <iostream>
#include <stdexcept>
#include <string>

#include "agrisim/core/config.h"
#include "agrisim/util/json.h"

#define AGRISIM_ASSERT(expr) \
  do { \
    if (!(expr)) { \
      std::cerr << "ASSERT failed: " #expr " (" << __FILE__ << ":" << __LINE__ << ")\n"; \
      return 1; \
    } \
  } while (0)

namespace {

agrisim::AppConfig parse(const std::string& text) { return agrisim::parse_app_config(agrisim::json::parse(text)); }

std::string parse_error(const std::string& text) {
  try {
    (void)parse(text);
  } catch (const std::runtime_error& e) {
    return e.what();
  }
  return {};
}

} // namespace

int test_config() {
  using namespace agrisim;

  AGRISIM_ASSERT(normalize_product_name("both") == "both");
  AGRISIM_ASSERT(normalize_product_name("ALL") == "both");
  AGRISIM_ASSERT(normalize_product_name("Ancient Fruit") == kAncientFruitId);
  AGRISIM_ASSERT(normalize_product_name("apricot tree") == "apricot");
  {
    bool threw = false;
    try {
      (void)normalize_product_name("pumpkin");
    } catch (const std::runtime_error&) {
      threw = true;
    }
    AGRISIM_ASSERT(threw);
  }

  // Older layout: profession flags live next to the values they change.
  {
    const AppConfig cfg = parse(R"({
      "tiles": 30, "kegs": 10, "casks": 5, "crop": "Ancient Fruit",
      "growth": {"fertilizer": "Deluxe Speed-Gro", "agriculturist": true},
      "economy": {"artisan": true, "wine_price": {"both": 1000, "Peach": 420}, "casks_with_walkways": 3},
      "starting_inventory": {"fruit": {"Starfruit": 4}},
      "fruit_trees": {"greenhouse": {"Peach Tree": 2, "628": 1}},
      "bees": {"bee_houses": 4, "flower_plan": {
        "fall": {"fast": {"growth_days": 8, "base_price": 80}, "expensive": {"growth_days": 12, "base_price": 290}},
        "spring": {"fast": {"growth_days": 6, "base_price": 30}}
      }}
    })");

    AGRISIM_ASSERT(cfg.tiles == 30);
    AGRISIM_ASSERT(cfg.kegs == 10);
    AGRISIM_ASSERT(cfg.casks == 5);
    AGRISIM_ASSERT(cfg.preserves_jars == 0);
    AGRISIM_ASSERT(cfg.crop == CropSelection::Ancient);
    AGRISIM_ASSERT(cfg.growth.fertilizer == Fertilizer::DeluxeSpeedGro);
    AGRISIM_ASSERT(cfg.growth.agriculturist);
    AGRISIM_ASSERT(cfg.professions.farming.artisan);
    AGRISIM_ASSERT(cfg.economy.artisan);
    AGRISIM_ASSERT(!cfg.economy.tiller);
    AGRISIM_ASSERT(cfg.economy.wine_price.at(kStarfruitId) == 1000);
    AGRISIM_ASSERT(cfg.economy.wine_price.at(kAncientFruitId) == 1000);
    AGRISIM_ASSERT(cfg.economy.wine_price.at("peach") == 420);
    AGRISIM_ASSERT(cfg.economy.casks_with_walkways.value_or(-1) == 3);
    AGRISIM_ASSERT(cfg.starting_inventory.fruit.at(kStarfruitId) == 4);
    AGRISIM_ASSERT(cfg.fruit_trees.greenhouse.at("peach") == 2);
    AGRISIM_ASSERT(cfg.fruit_trees.greenhouse.at("cherry") == 1);

    // Bee seasons default to the planned seasons, in calendar order.
    AGRISIM_ASSERT(cfg.bees.bee_houses == 4);
    AGRISIM_ASSERT(cfg.bees.seasons.size() == 2);
    AGRISIM_ASSERT(cfg.bees.seasons[0] == Season::Spring);
    AGRISIM_ASSERT(cfg.bees.seasons[1] == Season::Fall);
    AGRISIM_ASSERT(cfg.bees.flower_plan.at(Season::Fall).expensive.base_price == 290);

    const auto crops = selected_crops(cfg);
    AGRISIM_ASSERT(crops.size() == 1);
    AGRISIM_ASSERT(crops[0].id == kAncientFruitId);

    const auto plots = effective_plots(cfg);
    AGRISIM_ASSERT(plots.size() == 1);
    AGRISIM_ASSERT(plots[0].calendar.kind == PlotCalendar::Kind::Always);
    AGRISIM_ASSERT(plots[0].tiles_for_crop(kAncientFruitId) == 30);

    const auto trees = fruit_tree_priority(cfg);
    AGRISIM_ASSERT(trees.size() == 2);
    AGRISIM_ASSERT(trees[0] == "peach");
    AGRISIM_ASSERT(trees[1] == "cherry");

    const SimulationInputs in = build_simulation_inputs(cfg);
    AGRISIM_ASSERT(in.days == 112);
    AGRISIM_ASSERT(in.start_season == Season::Spring);
    AGRISIM_ASSERT(in.casks_with_walkways == 3);
    AGRISIM_ASSERT(in.external_daily_fruit.at("peach").size() == 112);
    AGRISIM_ASSERT(in.external_daily_fruit.at("peach")[0] == 2);
    AGRISIM_ASSERT(in.external_priority.front() == "peach");
  }

  // Professions block, explicit plots and the calendar start.
  {
    const AppConfig cfg = parse(R"({
      "kegs": 4, "casks": 0,
      "professions": {
        "farming": {"tiller": true, "shepherd": true},
        "foraging": {"botanist": 1},
        "mining": {"miner": true}
      },
      "economy": {"artisan": true},
      "simulation": {"calendar": {"current_season": "summer", "day": 3}, "fertilizer_cadence": "per_regrowth_cycle"},
      "plots": [
        {"name": "greenhouse", "tiles": 12},
        {"name": "field", "tiles": {"starfruit": 8, "all": 2},
         "calendar": {"type": "seasons", "seasons": ["summer"]}}
      ]
    })");

    // The professions block wins over the legacy economy flag.
    AGRISIM_ASSERT(!cfg.economy.artisan);
    AGRISIM_ASSERT(cfg.economy.tiller);
    AGRISIM_ASSERT(cfg.professions.farming.shepherd);
    AGRISIM_ASSERT(cfg.professions.foraging.botanist);
    AGRISIM_ASSERT(cfg.professions.mining.at("miner"));
    AGRISIM_ASSERT(cfg.professions.fishing.empty());

    AGRISIM_ASSERT(cfg.simulation.start_day_of_year == 31);
    AGRISIM_ASSERT(cfg.simulation.fertilizer_cadence == FertilizerCadence::PerRegrowthCycle);

    AGRISIM_ASSERT(cfg.plots.size() == 2);
    AGRISIM_ASSERT(cfg.tiles == 22);
    AGRISIM_ASSERT(cfg.plots[0].tiles_for_crop(kStarfruitId) == 12);
    AGRISIM_ASSERT(cfg.plots[1].tiles_for_crop(kStarfruitId) == 8);
    AGRISIM_ASSERT(cfg.plots[1].tiles_for_crop(kAncientFruitId) == 2);
    AGRISIM_ASSERT(cfg.plots[1].calendar.is_active(Season::Summer));
    AGRISIM_ASSERT(!cfg.plots[1].calendar.is_active(Season::Spring));

    // The year always simulates from spring 1.
    const SimulationInputs in = build_simulation_inputs(cfg);
    AGRISIM_ASSERT(in.start_season == Season::Spring);
    AGRISIM_ASSERT(in.fertilizer_cadence == FertilizerCadence::PerRegrowthCycle);
    AGRISIM_ASSERT(in.plots.size() == 2);
    AGRISIM_ASSERT(in.external_daily_fruit.empty());
  }

  // Rejected documents.
  AGRISIM_ASSERT(parse_error(R"({"tiles": 1, "casks": 1})").find("kegs") != std::string::npos);
  AGRISIM_ASSERT(parse_error(R"({"kegs": 1, "casks": 1})").find("tiles") != std::string::npos);
  AGRISIM_ASSERT(parse_error(R"({"tiles": 1, "kegs": 1, "casks": 1, "crop": "pumpkin"})").find("pumpkin") !=
                 std::string::npos);
  AGRISIM_ASSERT(parse_error(R"({"tiles": 1, "kegs": 1, "casks": 1, "growth": {"fertilizer": "compost"}})")
                     .find("fertilizer") != std::string::npos);
  AGRISIM_ASSERT(parse_error(R"({"kegs": 1, "casks": 1, "plots": [{"tiles": {"both": 3}}]})").find("both") !=
                 std::string::npos);
  AGRISIM_ASSERT(parse_error(R"({"kegs": 1, "casks": 1, "plots": [{"tiles": 3, "calendar": {"type": "moon"}}]})")
                     .find("calendar type") != std::string::npos);
  AGRISIM_ASSERT(parse_error(R"({"tiles": 1, "kegs": 1, "casks": 1, "fruit_trees": {"outdoors": {"durian": 2}}})")
                     .find("durian") != std::string::npos);
  AGRISIM_ASSERT(parse_error(R"([1, 2])").find("object") != std::string::npos);

  // The shipped example loads from any working directory.
  {
    const AppConfig cfg = load_app_config_from_file("data/configs/example.json");
    AGRISIM_ASSERT(cfg.tiles == 120);
    AGRISIM_ASSERT(cfg.plots.size() == 2);
    AGRISIM_ASSERT(cfg.crop == CropSelection::Both);
    AGRISIM_ASSERT(cfg.economy.cask_full_batch_required);
    AGRISIM_ASSERT(cfg.economy.casks_with_walkways.value_or(0) == 48);
    AGRISIM_ASSERT(cfg.bees.flower_plan.size() == 3);
    AGRISIM_ASSERT(cfg.animals.coops.size() == 1);
    AGRISIM_ASSERT(cfg.professions.farming.agriculturist);
    AGRISIM_ASSERT(cfg.growth.agriculturist);
  }

  return 0;
}
