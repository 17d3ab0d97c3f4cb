#include "agrisim/core/config.h"

#include <algorithm>
#include <stdexcept>

#include "agrisim/core/save_import.h"
#include "agrisim/util/file_io.h"
#include "agrisim/util/log.h"
#include "agrisim/util/strings.h"

namespace agrisim {
namespace {

const json::Value* find_key(const json::Object& o, const std::string& k) { return json::find(o, k); }

const json::Object& empty_object() {
  static const json::Object o;
  return o;
}

// Sub-object or an empty object when the key is absent.
const json::Object& object_or_empty(const json::Object& o, const std::string& key, const std::string& path) {
  const auto* v = find_key(o, key);
  if (!v || v->is_null()) return empty_object();
  if (!v->is_object()) throw std::runtime_error(path + " must be an object");
  return *v->as_object();
}

int get_int(const json::Object& o, const std::string& key, int def, const std::string& path) {
  const auto* v = find_key(o, key);
  if (!v || v->is_null()) return def;
  if (!v->is_number()) throw std::runtime_error(path + " must be a number");
  return static_cast<int>(v->int_value(def));
}

int require_int(const json::Object& o, const std::string& key) {
  const auto* v = find_key(o, key);
  if (!v) throw std::runtime_error("missing required config key: " + key);
  return get_int(o, key, 0, key);
}

double get_double(const json::Object& o, const std::string& key, double def, const std::string& path) {
  const auto* v = find_key(o, key);
  if (!v || v->is_null()) return def;
  if (!v->is_number()) throw std::runtime_error(path + " must be a number");
  return v->number_value(def);
}

bool get_bool(const json::Object& o, const std::string& key, bool def) {
  const auto* v = find_key(o, key);
  if (!v || v->is_null()) return def;
  if (v->is_bool()) return v->bool_value(def);
  if (v->is_number()) return v->number_value() != 0.0;
  return def;
}

std::string scalar_text(const json::Value& v) {
  if (v.is_string()) return v.string_value();
  if (v.is_number()) return std::to_string(v.int_value());
  return "";
}

CropSelection parse_crop_selection(const std::string& raw) {
  const std::string key = normalize_key(raw);
  if (key == "both" || key == "all") return CropSelection::Both;
  if (const Crop* c = find_catalog_crop(raw)) {
    return c->id == kStarfruitId ? CropSelection::Starfruit : CropSelection::Ancient;
  }
  throw std::runtime_error("Unknown crop name: " + raw);
}

Season require_season(const std::string& raw) {
  Season s{};
  if (!parse_season(raw, s)) throw std::runtime_error("Unknown season: " + raw);
  return s;
}

std::vector<Season> parse_seasons(const json::Value* v) {
  std::vector<Season> out;
  if (!v || v->is_null()) return out;
  if (v->is_array()) {
    for (const auto& s : v->array()) out.push_back(require_season(s.string_value()));
  } else {
    out.push_back(require_season(v->string_value()));
  }
  return out;
}

Fertilizer require_fertilizer(const std::string& raw) {
  Fertilizer f{};
  if (!parse_fertilizer(raw, f)) throw std::runtime_error("Unknown fertilizer: " + raw);
  return f;
}

FertilizerCadence parse_cadence(const std::string& raw) {
  const std::string key = normalize_key(raw);
  if (key == "perseason" || key == "season") return FertilizerCadence::PerSeason;
  if (key == "perregrowthcycle" || key == "perregrowth" || key == "regrowth") {
    return FertilizerCadence::PerRegrowthCycle;
  }
  throw std::runtime_error("Unknown fertilizer cadence: " + raw);
}

// Per-product integer map. The "both" key applies to both catalog crops.
std::map<std::string, int> parse_product_int_map(const json::Object& parent, const std::string& key,
                                                 const std::string& path) {
  std::map<std::string, int> out;
  const auto* v = find_key(parent, key);
  if (!v || v->is_null()) return out;
  if (!v->is_object()) throw std::runtime_error(path + ": expected a mapping for per-crop values");
  for (const auto& [name, value] : v->object()) {
    if (!value.is_number()) throw std::runtime_error(path + "." + name + " must be a number");
    const int n = static_cast<int>(value.int_value());
    const std::string id = normalize_product_name(name);
    if (id == "both") {
      out[kAncientFruitId] = n;
      out[kStarfruitId] = n;
    } else {
      out[id] = n;
    }
  }
  return out;
}

std::map<std::string, int> parse_tree_counts(const json::Object& parent, const std::string& key,
                                             const std::string& path) {
  std::map<std::string, int> out;
  const auto* v = find_key(parent, key);
  if (!v || v->is_null()) return out;
  if (!v->is_object()) throw std::runtime_error(path + " must be a mapping of fruit tree counts");
  for (const auto& [name, value] : v->object()) {
    const std::string id = normalize_fruit_tree_name(name);
    if (id.empty()) throw std::runtime_error("Unknown fruit tree: " + name);
    if (!value.is_number()) throw std::runtime_error(path + "." + name + " must be a number");
    out[id] += static_cast<int>(value.int_value());
  }
  return out;
}

std::map<Fertilizer, int> parse_fertilizer_costs(const json::Object& eco) {
  std::map<Fertilizer, int> out;
  for (const auto& [name, value] : object_or_empty(eco, "fertilizer_cost", "economy.fertilizer_cost")) {
    if (!value.is_number()) throw std::runtime_error("economy.fertilizer_cost." + name + " must be a number");
    out[require_fertilizer(name)] = static_cast<int>(value.int_value());
  }
  return out;
}

std::map<std::string, int> parse_plot_tiles(const json::Value* v, const std::string& plot_name) {
  if (!v || v->is_null()) throw std::runtime_error("plot '" + plot_name + "' is missing tiles");
  std::map<std::string, int> out;
  if (v->is_number()) {
    out[kAllCropsKey] = static_cast<int>(v->int_value());
    return out;
  }
  if (!v->is_object()) throw std::runtime_error("plot '" + plot_name + "' tiles must be a number or an object");
  for (const auto& [name, value] : v->object()) {
    if (!value.is_number()) throw std::runtime_error("plot '" + plot_name + "' tiles." + name + " must be a number");
    const int n = static_cast<int>(value.int_value());
    if (normalize_key(name) == "all") {
      out[kAllCropsKey] = n;
      continue;
    }
    if (normalize_key(name) == "both") throw std::runtime_error("plots[].tiles cannot use 'both' as a key");
    const Crop* c = find_catalog_crop(name);
    if (!c) throw std::runtime_error("Unknown crop name: " + name);
    out[c->id] = n;
  }
  return out;
}

Plot parse_plot(const json::Value& v) {
  if (!v.is_object()) throw std::runtime_error("plots[] entries must be objects");
  const auto& o = v.object();

  Plot p;
  if (const auto* n = find_key(o, "name")) p.name = n->string_value("plot");
  p.tiles_by_crop = parse_plot_tiles(find_key(o, "tiles"), p.name);

  const auto& cal = object_or_empty(o, "calendar", "plots[].calendar");
  const std::string type = to_lower(trim_copy(find_key(cal, "type") ? find_key(cal, "type")->string_value("always")
                                                                    : std::string("always")));
  if (type == "always") {
    p.calendar = PlotCalendar::always();
  } else if (type == "seasons") {
    p.calendar = PlotCalendar::in_seasons(parse_seasons(find_key(cal, "seasons")));
  } else {
    throw std::runtime_error("plot '" + p.name + "' has unknown calendar type '" + type + "'");
  }
  return p;
}

std::map<std::string, bool> parse_flag_group(const json::Object& o, const std::string& key,
                                             const std::vector<std::string>& names) {
  std::map<std::string, bool> out;
  const auto& g = object_or_empty(o, key, "professions." + key);
  for (const auto& n : names) {
    if (find_key(g, n)) out[n] = get_bool(g, n, false);
  }
  return out;
}

ProfessionsConfig parse_professions(const json::Object& root, const json::Object& growth, const json::Object& eco) {
  ProfessionsConfig p;
  const auto* raw = find_key(root, "professions");
  if (!raw || raw->is_null()) {
    // Older configs kept these three flags next to the values they affect.
    p.farming.artisan = get_bool(eco, "artisan", false);
    p.farming.tiller = get_bool(eco, "tiller", false);
    p.farming.agriculturist = get_bool(growth, "agriculturist", false);
    return p;
  }
  if (!raw->is_object()) throw std::runtime_error("professions must be a mapping");
  const auto& o = raw->object();

  const auto& farming = object_or_empty(o, "farming", "professions.farming");
  p.farming.rancher = get_bool(farming, "rancher", false);
  p.farming.tiller = get_bool(farming, "tiller", false);
  p.farming.coopmaster = get_bool(farming, "coopmaster", false);
  p.farming.shepherd = get_bool(farming, "shepherd", false);
  p.farming.artisan = get_bool(farming, "artisan", false);
  p.farming.agriculturist = get_bool(farming, "agriculturist", false);

  const auto& foraging = object_or_empty(o, "foraging", "professions.foraging");
  p.foraging.forester = get_bool(foraging, "forester", false);
  p.foraging.gatherer = get_bool(foraging, "gatherer", false);
  p.foraging.lumberjack = get_bool(foraging, "lumberjack", false);
  p.foraging.tapper = get_bool(foraging, "tapper", false);
  p.foraging.botanist = get_bool(foraging, "botanist", false);
  p.foraging.tracker = get_bool(foraging, "tracker", false);

  p.fishing = parse_flag_group(o, "fishing", {"fisher", "trapper", "angler", "pirate", "mariner", "luremaster"});
  p.mining = parse_flag_group(o, "mining", {"miner", "geologist", "blacksmith", "prospector", "excavator",
                                            "gemologist"});
  p.combat = parse_flag_group(o, "combat", {"fighter", "scout", "brute", "defender", "acrobat", "desperado"});
  return p;
}

FlowerSpec parse_flower(const json::Object& plan, const std::string& key, const std::string& path) {
  const auto& o = object_or_empty(plan, key, path);
  FlowerSpec f;
  f.name = find_key(o, "name") ? find_key(o, "name")->string_value(key) : key;
  f.growth_days = get_int(o, "growth_days", 0, path + ".growth_days");
  f.base_price = get_int(o, "base_price", 0, path + ".base_price");
  return f;
}

BeeConfig parse_bees(const json::Object& root) {
  const auto& o = object_or_empty(root, "bees", "bees");
  BeeConfig b;
  b.bee_houses = get_int(o, "bee_houses", 0, "bees.bee_houses");
  b.flower_base_price = get_int(o, "flower_base_price", 0, "bees.flower_base_price");

  std::vector<Season> plan_order;
  for (const auto& [season_key, plan] : object_or_empty(o, "flower_plan", "bees.flower_plan")) {
    const Season s = require_season(season_key);
    if (!plan.is_object()) throw std::runtime_error("bees.flower_plan entries must be objects");
    const std::string path = "bees.flower_plan." + std::string(season_name(s));
    FlowerPlan fp;
    fp.fast = parse_flower(plan.object(), "fast", path + ".fast");
    fp.expensive = parse_flower(plan.object(), "expensive", path + ".expensive");
    b.flower_plan[s] = fp;
    plan_order.push_back(s);
  }

  const auto* seasons = find_key(o, "seasons");
  if ((!seasons || seasons->is_null()) && !plan_order.empty()) {
    std::sort(plan_order.begin(), plan_order.end());
    b.seasons = plan_order;
  } else if (seasons && !seasons->is_null()) {
    b.seasons = parse_seasons(seasons);
  }
  return b;
}

AnimalsConfig parse_animals(const json::Object& root) {
  const auto& o = object_or_empty(root, "animals", "animals");
  AnimalsConfig a;
  if (const auto* coops = find_key(o, "coops"); coops && coops->is_array()) {
    for (const auto& cv : coops->array()) {
      const auto& c = cv.object();
      Coop coop;
      coop.name = find_key(c, "name") ? find_key(c, "name")->string_value("coop") : "coop";
      coop.chickens = get_int(c, "chickens", 0, "coops[].chickens");
      coop.ducks = get_int(c, "ducks", 0, "coops[].ducks");
      coop.rabbits = get_int(c, "rabbits", 0, "coops[].rabbits");
      coop.void_chickens = get_int(c, "void_chickens", 0, "coops[].void_chickens");
      a.coops.push_back(std::move(coop));
    }
  }
  if (const auto* barns = find_key(o, "barns"); barns && barns->is_array()) {
    for (const auto& bv : barns->array()) {
      const auto& b = bv.object();
      Barn barn;
      barn.name = find_key(b, "name") ? find_key(b, "name")->string_value("barn") : "barn";
      barn.cows = get_int(b, "cows", 0, "barns[].cows");
      barn.goats = get_int(b, "goats", 0, "barns[].goats");
      barn.pigs = get_int(b, "pigs", 0, "barns[].pigs");
      barn.sheep = get_int(b, "sheep", 0, "barns[].sheep");
      a.barns.push_back(std::move(barn));
    }
  }
  a.large_egg_rate = get_double(o, "large_egg_rate", 0.0, "animals.large_egg_rate");
  a.large_milk_rate = get_double(o, "large_milk_rate", 0.0, "animals.large_milk_rate");
  a.large_goat_milk_rate = get_double(o, "large_goat_milk_rate", 0.0, "animals.large_goat_milk_rate");
  a.rabbit_foot_rate = get_double(o, "rabbit_foot_rate", 0.0, "animals.rabbit_foot_rate");
  return a;
}

} // namespace

const char* crop_selection_name(CropSelection c) {
  switch (c) {
    case CropSelection::Both: return "both";
    case CropSelection::Starfruit: return "starfruit";
    case CropSelection::Ancient: return "ancient";
  }
  return "both";
}

std::string normalize_product_name(const std::string& raw) {
  const std::string key = normalize_key(raw);
  if (key == "both" || key == "all") return "both";
  if (const Crop* c = find_catalog_crop(raw)) return c->id;
  const std::string tree = normalize_fruit_tree_name(raw);
  if (!tree.empty()) return tree;
  throw std::runtime_error("Unknown product name: " + raw);
}

AppConfig parse_app_config(const json::Value& root_value) {
  if (!root_value.is_object()) throw std::runtime_error("config root must be a JSON object");
  const auto& root = root_value.object();

  const auto& growth = object_or_empty(root, "growth", "growth");
  const auto& sim = object_or_empty(root, "simulation", "simulation");
  const auto& eco = object_or_empty(root, "economy", "economy");
  const auto& inv = object_or_empty(root, "starting_inventory", "starting_inventory");
  const auto& trees = object_or_empty(root, "fruit_trees", "fruit_trees");

  AppConfig cfg;
  cfg.kegs = require_int(root, "kegs");
  cfg.casks = require_int(root, "casks");
  cfg.preserves_jars = get_int(root, "preserves_jars", 0, "preserves_jars");
  cfg.dehydrators = get_int(root, "dehydrators", 0, "dehydrators");
  cfg.oil_makers = get_int(root, "oil_makers", 0, "oil_makers");
  cfg.mayo_machines = get_int(root, "mayo_machines", 0, "mayo_machines");
  cfg.cheese_presses = get_int(root, "cheese_presses", 0, "cheese_presses");
  cfg.looms = get_int(root, "looms", 0, "looms");

  if (const auto* c = find_key(root, "crop"); c && !c->is_null()) cfg.crop = parse_crop_selection(c->string_value());

  cfg.professions = parse_professions(root, growth, eco);

  if (const auto* f = find_key(growth, "fertilizer")) cfg.growth.fertilizer = require_fertilizer(f->string_value("none"));
  cfg.growth.agriculturist = cfg.professions.farming.agriculturist;
  cfg.growth.paddy_bonus = get_bool(growth, "paddy_bonus", false);

  cfg.simulation.max_days = get_int(sim, "max_days", kDaysPerYear, "simulation.max_days");
  cfg.simulation.assume_year_round = get_bool(sim, "assume_year_round", true);
  int start_day = get_int(sim, "start_day_of_year", 0, "simulation.start_day_of_year");
  if (start_day == 0) {
    const auto& cal = object_or_empty(sim, "calendar", "simulation.calendar");
    const auto* season = find_key(cal, "current_season");
    const auto* day = find_key(cal, "day");
    if (season && day) {
      start_day = day_of_year_from_season_day(require_season(season->string_value()),
                                              static_cast<int>(day->int_value(1)));
    }
  }
  cfg.simulation.start_day_of_year = start_day > 0 ? start_day : 1;
  if (const auto* cad = find_key(sim, "fertilizer_cadence"); cad && !cad->is_null()) {
    cfg.simulation.fertilizer_cadence = parse_cadence(cad->string_value());
  }

  cfg.economy.wine_price = parse_product_int_map(eco, "wine_price", "economy.wine_price");
  cfg.economy.fruit_price = parse_product_int_map(eco, "fruit_price", "economy.fruit_price");
  cfg.economy.seed_cost = parse_product_int_map(eco, "seed_cost", "economy.seed_cost");
  cfg.economy.fertilizer_cost = parse_fertilizer_costs(eco);
  cfg.economy.aged_wine_multiplier = get_double(eco, "aged_wine_multiplier", 2.0, "economy.aged_wine_multiplier");
  cfg.economy.wine_quality_multiplier =
      get_double(eco, "wine_quality_multiplier", 1.0, "economy.wine_quality_multiplier");
  cfg.economy.fruit_quality_multiplier =
      get_double(eco, "fruit_quality_multiplier", 1.0, "economy.fruit_quality_multiplier");
  cfg.economy.artisan = cfg.professions.farming.artisan;
  cfg.economy.tiller = cfg.professions.farming.tiller;
  cfg.economy.cask_full_batch_required = get_bool(eco, "cask_full_batch_required", false);
  if (const auto* w = find_key(eco, "casks_with_walkways"); w && !w->is_null()) {
    cfg.economy.casks_with_walkways = get_int(eco, "casks_with_walkways", 0, "economy.casks_with_walkways");
  }

  cfg.starting_inventory.fruit = parse_product_int_map(inv, "fruit", "starting_inventory.fruit");
  cfg.starting_inventory.base_wine = parse_product_int_map(inv, "base_wine", "starting_inventory.base_wine");

  cfg.animals = parse_animals(root);
  cfg.bees = parse_bees(root);

  cfg.fruit_trees.greenhouse = parse_tree_counts(trees, "greenhouse", "fruit_trees.greenhouse");
  cfg.fruit_trees.outdoors = parse_tree_counts(trees, "outdoors", "fruit_trees.outdoors");
  cfg.fruit_trees.always = parse_tree_counts(trees, "always", "fruit_trees.always");

  if (const auto* plots = find_key(root, "plots"); plots && !plots->is_null()) {
    if (!plots->is_array()) throw std::runtime_error("plots must be an array");
    for (const auto& p : plots->array()) cfg.plots.push_back(parse_plot(p));
  }

  if (const auto* t = find_key(root, "tiles"); t && !t->is_null()) {
    cfg.tiles = get_int(root, "tiles", 0, "tiles");
  } else if (!cfg.plots.empty()) {
    for (const auto& p : cfg.plots) cfg.tiles += p.tiles_total();
  } else {
    throw std::runtime_error("missing required config key: tiles");
  }
  return cfg;
}

AppConfig load_app_config_from_file(const std::string& path, const std::string& overrides_path) {
  if (is_save_file(path)) return load_app_config_from_save(path, overrides_path);
  if (!overrides_path.empty()) {
    throw std::runtime_error("Overrides are only supported when loading from a save file (got '" + path + "')");
  }

  const auto txt = read_text_file(path);
  AppConfig cfg;
  try {
    cfg = parse_app_config(json::parse(txt));
  } catch (const std::exception& e) {
    throw std::runtime_error("Failed to load config '" + path + "': " + e.what());
  }
  log::debug("loaded config " + path + " (" + std::to_string(cfg.plots.size()) + " plots, crop=" +
             crop_selection_name(cfg.crop) + ")");
  return cfg;
}

AppConfig apply_config_overrides(AppConfig cfg, const json::Value& overrides) {
  if (!overrides.is_object()) throw std::runtime_error("overrides root must be a JSON object");
  const auto& root = overrides.object();

  const auto& growth = object_or_empty(root, "growth", "growth");
  if (const auto* f = find_key(growth, "fertilizer"); f && !f->is_null()) {
    cfg.growth.fertilizer = require_fertilizer(f->string_value("none"));
  }
  cfg.growth.paddy_bonus = get_bool(growth, "paddy_bonus", cfg.growth.paddy_bonus);

  // Professions come from the save; only prices and the cask policy change.
  const auto& eco = object_or_empty(root, "economy", "economy");
  if (find_key(eco, "wine_price")) cfg.economy.wine_price = parse_product_int_map(eco, "wine_price", "economy.wine_price");
  if (find_key(eco, "fruit_price")) cfg.economy.fruit_price = parse_product_int_map(eco, "fruit_price", "economy.fruit_price");
  if (find_key(eco, "seed_cost")) cfg.economy.seed_cost = parse_product_int_map(eco, "seed_cost", "economy.seed_cost");
  if (find_key(eco, "fertilizer_cost")) cfg.economy.fertilizer_cost = parse_fertilizer_costs(eco);
  cfg.economy.aged_wine_multiplier =
      get_double(eco, "aged_wine_multiplier", cfg.economy.aged_wine_multiplier, "economy.aged_wine_multiplier");
  cfg.economy.wine_quality_multiplier =
      get_double(eco, "wine_quality_multiplier", cfg.economy.wine_quality_multiplier, "economy.wine_quality_multiplier");
  cfg.economy.fruit_quality_multiplier = get_double(eco, "fruit_quality_multiplier",
                                                    cfg.economy.fruit_quality_multiplier, "economy.fruit_quality_multiplier");
  cfg.economy.cask_full_batch_required =
      get_bool(eco, "cask_full_batch_required", cfg.economy.cask_full_batch_required);
  if (const auto* w = find_key(eco, "casks_with_walkways"); w && !w->is_null()) {
    cfg.economy.casks_with_walkways = get_int(eco, "casks_with_walkways", 0, "economy.casks_with_walkways");
  }

  const auto& sim = object_or_empty(root, "simulation", "simulation");
  cfg.simulation.max_days = get_int(sim, "max_days", cfg.simulation.max_days, "simulation.max_days");
  cfg.simulation.assume_year_round = get_bool(sim, "assume_year_round", cfg.simulation.assume_year_round);
  cfg.simulation.start_day_of_year =
      get_int(sim, "start_day_of_year", cfg.simulation.start_day_of_year, "simulation.start_day_of_year");
  if (const auto* cad = find_key(sim, "fertilizer_cadence"); cad && !cad->is_null()) {
    cfg.simulation.fertilizer_cadence = parse_cadence(cad->string_value());
  }

  const auto& inv = object_or_empty(root, "starting_inventory", "starting_inventory");
  if (find_key(inv, "fruit")) cfg.starting_inventory.fruit = parse_product_int_map(inv, "fruit", "starting_inventory.fruit");
  if (find_key(inv, "base_wine")) {
    cfg.starting_inventory.base_wine = parse_product_int_map(inv, "base_wine", "starting_inventory.base_wine");
  }

  // Bee house counts come from the save; flower plans only from overrides.
  if (const auto* b = find_key(root, "bees"); b && !b->is_null()) {
    const auto& bees = object_or_empty(root, "bees", "bees");
    const BeeConfig parsed = parse_bees(root);
    cfg.bees.flower_base_price = get_int(bees, "flower_base_price", cfg.bees.flower_base_price, "bees.flower_base_price");
    if (!parsed.flower_plan.empty()) cfg.bees.flower_plan = parsed.flower_plan;
    const auto* seasons = find_key(bees, "seasons");
    if ((seasons && !seasons->is_null()) || !parsed.flower_plan.empty()) cfg.bees.seasons = parsed.seasons;
  }

  // A non-empty placement replaces the counts found in the save.
  const auto& trees = object_or_empty(root, "fruit_trees", "fruit_trees");
  const std::pair<const char*, std::map<std::string, int>*> placements[] = {
      {"greenhouse", &cfg.fruit_trees.greenhouse},
      {"outdoors", &cfg.fruit_trees.outdoors},
      {"always", &cfg.fruit_trees.always},
  };
  for (const auto& [key, counts] : placements) {
    auto parsed = parse_tree_counts(trees, key, std::string("fruit_trees.") + key);
    if (!parsed.empty()) *counts = std::move(parsed);
  }

  if (const auto* c = find_key(root, "crop"); c && !c->is_null()) cfg.crop = parse_crop_selection(c->string_value());
  return cfg;
}

std::vector<Crop> selected_crops(const AppConfig& cfg) {
  std::vector<Crop> out;
  if (cfg.crop != CropSelection::Ancient) out.push_back(starfruit_crop());
  if (cfg.crop != CropSelection::Starfruit) out.push_back(ancient_fruit_crop());
  return out;
}

std::vector<Plot> effective_plots(const AppConfig& cfg) {
  if (!cfg.plots.empty()) return cfg.plots;
  Plot p;
  p.name = "plot";
  p.calendar = PlotCalendar::always();
  p.tiles_by_crop[kAllCropsKey] = cfg.tiles;
  return {p};
}

std::vector<std::string> fruit_tree_priority(const AppConfig& cfg) {
  std::vector<std::string> ids;
  for (const auto& [id, _] : total_tree_counts(cfg.fruit_trees)) ids.push_back(id);
  std::stable_sort(ids.begin(), ids.end(), [&](const std::string& a, const std::string& b) {
    return wine_price_for(a, cfg.economy) > wine_price_for(b, cfg.economy);
  });
  return ids;
}

SimulationInputs build_simulation_inputs(const AppConfig& cfg) {
  if (cfg.simulation.start_day_of_year != 1) {
    log::info("note: start_day_of_year overridden to 1 (spring 1)");
  }

  SimulationInputs in;
  in.crops = selected_crops(cfg);
  in.plots = effective_plots(cfg);
  in.growth = cfg.growth;
  in.fertilizer_cadence = cfg.simulation.fertilizer_cadence;
  in.start_season = Season::Spring;
  in.days = cfg.simulation.max_days;

  in.kegs = cfg.kegs;
  in.preserves_jars = cfg.preserves_jars;
  in.dehydrators = cfg.dehydrators;
  in.casks = cfg.casks;
  in.cask_full_batch_required = cfg.economy.cask_full_batch_required;
  in.casks_with_walkways = std::max(0, cfg.economy.casks_with_walkways.value_or(0));

  in.starting_fruit = cfg.starting_inventory.fruit;
  in.starting_base_goods = cfg.starting_inventory.base_wine;

  in.external_daily_fruit = build_daily_fruit(cfg.fruit_trees, 1, in.days);
  in.external_priority = fruit_tree_priority(cfg);
  return in;
}

} // namespace agrisim
