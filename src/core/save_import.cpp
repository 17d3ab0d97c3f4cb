#include "agrisim/core/save_import.h"

#include <algorithm>
#include <cctype>
#include <fstream>
#include <initializer_list>
#include <stdexcept>
#include <utility>
#include <vector>

#include "agrisim/util/file_io.h"
#include "agrisim/util/json.h"
#include "agrisim/util/log.h"
#include "agrisim/util/strings.h"

namespace agrisim {
namespace {

using xml::Node;

// A location (or building interior) and the name machines are counted under.
struct Location {
  std::string name;
  Node node;
};

Node find_location(const xml::Document& save, const std::string& name) {
  for (const Node& loc : save.root().path("locations").children("GameLocation")) {
    if (loc.child_text("name") == name) return loc;
  }
  return Node();
}

// Top-level locations followed by the interiors of Farm buildings.
std::vector<Location> all_locations(const xml::Document& save) {
  std::vector<Location> out;
  for (const Node& loc : save.root().path("locations").children("GameLocation")) {
    out.push_back({loc.child_text("name", "(unknown)"), loc});
  }
  for (const Node& b : find_location(save, "Farm").child("buildings").children()) {
    const Node indoors = b.child("indoors");
    if (!indoors) continue;
    std::string name = indoors.child_text("name");
    if (name.empty()) name = b.child_text("buildingType", "(indoor)");
    out.push_back({name, indoors});
  }
  return out;
}

// The serialized Object of each entry in a location's object map.
std::vector<Node> placed_objects(const Node& location) {
  std::vector<Node> out;
  for (const Node& item : location.child("objects").children("item")) {
    const Node obj = item.path("value/Object");
    if (obj) out.push_back(obj);
  }
  return out;
}

// A game object is recognized by display name or by either id field.
bool object_is(const Node& obj, const std::string& name, std::initializer_list<const char*> ids) {
  if (obj.child_text("name") == name) return true;
  const std::string sheet = obj.child_text("parentSheetIndex");
  const std::string item = obj.child_text("itemId");
  for (const char* id : ids) {
    if (sheet == id || item == id) return true;
  }
  return false;
}

bool is_quality_sprinkler(const Node& obj) { return object_is(obj, "Quality Sprinkler", {"621"}); }
bool is_iridium_sprinkler(const Node& obj) { return object_is(obj, "Iridium Sprinkler", {"645"}); }

// HoeDirt terrain features; other feature types (trees, grass, paths) are skipped.
std::vector<Node> hoe_dirt(const Node& location) {
  std::vector<Node> out;
  for (const Node& item : location.child("terrainFeatures").children("item")) {
    const Node tf = item.path("value/TerrainFeature");
    if (!tf) continue;
    const std::string type = tf.xsi_type();
    if (!type.empty() && type != "HoeDirt") continue;
    out.push_back(tf);
  }
  return out;
}

// First run of digits in "(O)466" style ids.
std::string numeric_id(const std::string& raw) {
  auto first = std::find_if(raw.begin(), raw.end(), [](char c) { return std::isdigit(static_cast<unsigned char>(c)); });
  auto last = std::find_if(first, raw.end(), [](char c) { return !std::isdigit(static_cast<unsigned char>(c)); });
  return std::string(first, last);
}

Fertilizer fertilizer_from_id(const std::string& id) {
  if (id == "465") return Fertilizer::SpeedGro;
  if (id == "466") return Fertilizer::DeluxeSpeedGro;
  if (id == "918") return Fertilizer::HyperSpeedGro;
  return Fertilizer::None;
}

struct CropTiles {
  int starfruit{0};
  int ancient{0};
};

// Counts live catalog crops in a location. `where` only feeds the error text.
CropTiles count_crops(const Node& location, const std::string& where) {
  CropTiles tiles;
  for (const Node& tf : hoe_dirt(location)) {
    const Node crop = tf.child("crop");
    if (!crop || crop.child_flag("dead")) continue;
    const std::string harvest = crop.child_text("indexOfHarvest");
    if (harvest == kTruffleHarvestId) {
      throw std::runtime_error("Found truffle crop in " + where + " HoeDirt; truffles are not plantable crops.");
    }
    if (harvest == kStarfruitHarvestId) ++tiles.starfruit;
    if (harvest == kAncientFruitHarvestId) ++tiles.ancient;
  }
  return tiles;
}

// The fertilizer on most greenhouse tiles; ties go to the one seen first.
Fertilizer majority_fertilizer(const Node& greenhouse) {
  std::vector<std::pair<std::string, int>> seen;
  for (const Node& tf : hoe_dirt(greenhouse)) {
    const std::string id = numeric_id(tf.child_text("fertilizer"));
    if (id.empty()) continue;
    auto it = std::find_if(seen.begin(), seen.end(), [&](const auto& p) { return p.first == id; });
    if (it == seen.end()) {
      seen.emplace_back(id, 1);
    } else {
      ++it->second;
    }
  }
  if (seen.empty()) return Fertilizer::None;
  const auto best = std::max_element(seen.begin(), seen.end(),
                                     [](const auto& a, const auto& b) { return a.second < b.second; });
  return fertilizer_from_id(best->first);
}

ProfessionsConfig read_professions(const xml::Document& save) {
  // Profession ids in skill order: farming 0-5, fishing 6-11, foraging 12-17,
  // mining 18-23, combat 24-29.
  static const char* const kFishing[] = {"fisher", "trapper", "angler", "pirate", "mariner", "luremaster"};
  static const char* const kMining[] = {"miner", "geologist", "blacksmith", "prospector", "excavator", "gemologist"};
  static const char* const kCombat[] = {"fighter", "scout", "brute", "defender", "acrobat", "desperado"};

  ProfessionsConfig p;
  for (const Node& n : save.root().path("player/professions").children("int")) {
    const std::string txt = trim_copy(n.text());
    if (txt.empty() || txt.size() > 3 || numeric_id(txt) != txt) continue;
    const int id = std::stoi(txt);
    bool* farming[] = {&p.farming.rancher, &p.farming.tiller,  &p.farming.coopmaster,
                       &p.farming.shepherd, &p.farming.artisan, &p.farming.agriculturist};
    bool* foraging[] = {&p.foraging.forester, &p.foraging.gatherer, &p.foraging.lumberjack,
                        &p.foraging.tapper,   &p.foraging.botanist, &p.foraging.tracker};
    if (id >= 0 && id < 6) {
      *farming[id] = true;
    } else if (id < 12) {
      p.fishing[kFishing[id - 6]] = true;
    } else if (id < 18) {
      *foraging[id - 12] = true;
    } else if (id < 24) {
      p.mining[kMining[id - 18]] = true;
    } else if (id < 30) {
      p.combat[kCombat[id - 24]] = true;
    }
  }
  return p;
}

int building_capacity(const std::string& building_type) {
  const std::string t = to_lower(building_type);
  if (t.find("deluxe") != std::string::npos) return 12;
  if (t.find("big") != std::string::npos) return 8;
  return 4;
}

AnimalsConfig read_animals(const xml::Document& save) {
  AnimalsConfig a;
  for (const Node& b : find_location(save, "Farm").child("buildings").children()) {
    const std::string type = b.child_text("buildingType");
    const std::string lower = to_lower(type);
    const Node indoors = b.child("indoors");
    const Node animals = indoors.child("animals");
    if (!animals) continue;

    Coop coop;
    Barn barn;
    for (const Node& item : animals.children("item")) {
      const std::string kind = item.path("value/FarmAnimal").child_text("type");
      if (kind == "White Chicken" || kind == "Brown Chicken" || kind == "Blue Chicken" || kind == "Golden Chicken") {
        ++coop.chickens;
      } else if (kind == "Void Chicken") {
        ++coop.void_chickens;
      } else if (kind == "Duck") {
        ++coop.ducks;
      } else if (kind == "Rabbit") {
        ++coop.rabbits;
      } else if (kind == "White Cow" || kind == "Brown Cow") {
        ++barn.cows;
      } else if (kind == "Goat") {
        ++barn.goats;
      } else if (kind == "Pig") {
        ++barn.pigs;
      } else if (kind == "Sheep") {
        ++barn.sheep;
      }
    }

    const int capacity = building_capacity(type);
    const bool is_coop = lower.find("coop") != std::string::npos;
    const bool is_barn = !is_coop && lower.find("barn") != std::string::npos;
    const int occupants = is_coop ? coop.occupants() : barn.occupants();
    if ((is_coop || is_barn) && occupants > capacity) {
      throw std::runtime_error(std::string(is_coop ? "coop" : "barn") + " '" + indoors.child_text("name") + "' has " +
                               std::to_string(occupants) + " animals, exceeds capacity " + std::to_string(capacity));
    }
    if (is_coop) {
      coop.name = "coop" + std::to_string(a.coops.size() + 1);
      a.coops.push_back(std::move(coop));
    } else if (is_barn) {
      barn.name = "barn" + std::to_string(a.barns.size() + 1);
      a.barns.push_back(std::move(barn));
    }
  }
  return a;
}

// Mature, standing fruit trees. Greenhouse trees (or trees flagged as growing
// on a greenhouse tile) fruit all year, as do island trees.
FruitTreesConfig read_fruit_trees(const xml::Document& save) {
  FruitTreesConfig t;
  for (const Node& loc : save.root().path("locations").children("GameLocation")) {
    const std::string loc_name = loc.child_text("name");
    for (const Node& item : loc.child("terrainFeatures").children("item")) {
      const Node tf = item.path("value/TerrainFeature");
      if (tf.xsi_type() != "FruitTree") continue;
      if (tf.child_int("daysUntilMature") > 0 || tf.child_flag("stump")) continue;
      const std::string fruit = normalize_fruit_tree_name(tf.child_text("treeId"));
      if (fruit.empty()) continue;
      if (loc_name == "Greenhouse" || tf.child_flag("greenHouseTileTree")) {
        ++t.greenhouse[fruit];
      } else if (to_lower(loc_name).rfind("island", 0) == 0) {
        ++t.always[fruit];
      } else {
        ++t.outdoors[fruit];
      }
    }
  }
  return t;
}

struct MachineCounts {
  int kegs{0};
  int casks{0};
  int preserves_jars{0};
  int dehydrators{0};
  int oil_makers{0};
  int mayo_machines{0};
  int cheese_presses{0};
  int looms{0};
  int bee_houses{0};
};

MachineCounts count_machines(const std::vector<Location>& locations) {
  MachineCounts m;
  for (const auto& loc : locations) {
    for (const Node& obj : placed_objects(loc.node)) {
      const std::string name = obj.child_text("name");
      if (name == "Keg") {
        ++m.kegs;
      } else if (name == "Preserves Jar") {
        ++m.preserves_jars;
      } else if (name == "Dehydrator") {
        ++m.dehydrators;
      } else if (name == "Mayonnaise Machine") {
        ++m.mayo_machines;
      } else if (name == "Cheese Press") {
        ++m.cheese_presses;
      } else if (name == "Loom") {
        ++m.looms;
      } else if (name == "Bee House") {
        ++m.bee_houses;
      } else if (object_is(obj, "Oil Maker", {"19", "108017"})) {
        ++m.oil_makers;
      } else if (object_is(obj, "Cask", {"163", "108094"})) {
        // Casks elsewhere (a second cellar, the farm) cannot age wine.
        if (loc.name == "Cellar") ++m.casks;
      }
    }
  }
  return m;
}

SprinklerCounts stored_sprinklers(const std::vector<Location>& locations) {
  SprinklerCounts c;
  for (const auto& loc : locations) {
    for (const Node& container : placed_objects(loc.node)) {
      for (const Node& slot : container.child("items").children("Item")) {
        if (slot.xsi_nil()) continue;
        const Node inner = slot.child("Object");
        const Node item = inner ? inner : slot;
        const int stack = item.child_int("stack", 1);
        if (stack <= 0) continue;
        if (is_quality_sprinkler(item)) {
          c.quality += stack;
        } else if (is_iridium_sprinkler(item)) {
          c.iridium += stack;
        }
      }
    }
  }
  return c;
}

Plot make_plot(std::string name, std::map<std::string, int> tiles, PlotCalendar calendar) {
  Plot p;
  p.name = std::move(name);
  p.tiles_by_crop = std::move(tiles);
  p.calendar = std::move(calendar);
  return p;
}

} // namespace

bool is_save_file(const std::string& path) {
  const std::string lower = to_lower(path);
  const auto ends_with = [&](const char* ext) {
    const std::string e(ext);
    return lower.size() >= e.size() && lower.compare(lower.size() - e.size(), e.size(), e) == 0;
  };
  if (ends_with(".xml") || ends_with(".sav")) return true;

  std::ifstream in(resolve_data_path(path), std::ios::binary);
  if (!in) return false;
  std::string head(200, '\0');
  in.read(head.data(), static_cast<std::streamsize>(head.size()));
  head.resize(static_cast<std::size_t>(in.gcount()));
  return head.find("<SaveGame") != std::string::npos;
}

AppConfig app_config_from_save(const xml::Document& save) {
  AppConfig cfg;
  cfg.professions = read_professions(save);
  cfg.animals = read_animals(save);
  cfg.fruit_trees = read_fruit_trees(save);

  const MachineCounts m = count_machines(all_locations(save));
  cfg.kegs = m.kegs;
  cfg.casks = m.casks;
  cfg.preserves_jars = m.preserves_jars;
  cfg.dehydrators = m.dehydrators;
  cfg.oil_makers = m.oil_makers;
  cfg.mayo_machines = m.mayo_machines;
  cfg.cheese_presses = m.cheese_presses;
  cfg.looms = m.looms;

  cfg.bees.bee_houses = m.bee_houses;
  cfg.bees.flower_base_price = 0;
  cfg.bees.seasons = {Season::Spring, Season::Summer, Season::Fall};

  const Node greenhouse = find_location(save, "Greenhouse");
  const CropTiles inside = count_crops(greenhouse, "Greenhouse");
  const CropTiles outside = count_crops(find_location(save, "Farm"), "Farm");

  std::map<std::string, int> greenhouse_tiles;
  if (inside.starfruit > 0) greenhouse_tiles[kStarfruitId] = inside.starfruit;
  if (inside.ancient > 0) greenhouse_tiles[kAncientFruitId] = inside.ancient;
  if (!greenhouse_tiles.empty()) {
    cfg.plots.push_back(make_plot("greenhouse", std::move(greenhouse_tiles), PlotCalendar::always()));
  }
  if (outside.starfruit > 0) {
    cfg.plots.push_back(make_plot("outdoors_starfruit", {{kStarfruitId, outside.starfruit}},
                                  PlotCalendar::in_seasons({Season::Summer})));
  }
  if (outside.ancient > 0) {
    cfg.plots.push_back(make_plot("outdoors_ancient", {{kAncientFruitId, outside.ancient}},
                                  PlotCalendar::in_seasons({Season::Spring, Season::Summer, Season::Fall})));
  }
  for (const auto& p : cfg.plots) cfg.tiles += p.tiles_total();

  cfg.crop = CropSelection::Both;
  cfg.growth.fertilizer = majority_fertilizer(greenhouse);
  cfg.growth.agriculturist = cfg.professions.farming.agriculturist;
  cfg.growth.paddy_bonus = false;
  cfg.economy.artisan = cfg.professions.farming.artisan;
  cfg.economy.tiller = cfg.professions.farming.tiller;
  return cfg;
}

SprinklerSurvey survey_sprinklers(const xml::Document& save) {
  SprinklerSurvey s;
  for (const Node& obj : placed_objects(find_location(save, "Farm"))) {
    if (is_quality_sprinkler(obj)) {
      ++s.placed.quality;
    } else if (is_iridium_sprinkler(obj)) {
      ++s.placed.iridium;
    }
  }
  s.stored = stored_sprinklers(all_locations(save));
  return s;
}

AppConfig load_app_config_from_save(const std::string& save_path, const std::string& overrides_path) {
  AppConfig cfg;
  try {
    cfg = app_config_from_save(xml::Document::load_file(save_path));
  } catch (const std::exception& e) {
    throw std::runtime_error("Failed to load save '" + save_path + "': " + e.what());
  }
  log::debug("imported save " + save_path + ": " + std::to_string(cfg.tiles) + " crop tiles, " +
             std::to_string(cfg.kegs) + " kegs, " + std::to_string(cfg.casks) + " cellar casks");
  if (overrides_path.empty()) return cfg;

  try {
    cfg = apply_config_overrides(std::move(cfg), json::parse(read_text_file(overrides_path)));
  } catch (const std::exception& e) {
    throw std::runtime_error("Failed to apply overrides '" + overrides_path + "': " + e.what());
  }
  return cfg;
}

} // namespace agrisim
