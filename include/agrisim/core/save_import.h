#pragma once

#include <string>

#include "agrisim/core/config.h"
#include "agrisim/util/xml.h"

namespace agrisim {

// Harvest object ids of the catalog crops as they appear in a save.
inline const std::string kStarfruitHarvestId = "268";
inline const std::string kAncientFruitHarvestId = "454";
// Truffles show up in HoeDirt in some modded saves; they are not a crop.
inline const std::string kTruffleHarvestId = "430";

inline constexpr int kQualitySprinklerTiles = 8;
inline constexpr int kIridiumSprinklerTiles = 24;

struct SprinklerCounts {
  int quality{0};
  int iridium{0};

  int tiles() const { return quality * kQualitySprinklerTiles + iridium * kIridiumSprinklerTiles; }
};

// Sprinklers placed on the Farm plus those sitting in chests anywhere.
struct SprinklerSurvey {
  SprinklerCounts placed;
  SprinklerCounts stored;

  SprinklerCounts total() const { return {placed.quality + stored.quality, placed.iridium + stored.iridium}; }
  int tiles() const { return total().tiles(); }
};

// True for .xml/.sav paths and for files that start with a <SaveGame> element.
// Missing files are not saves.
bool is_save_file(const std::string& path);

// Builds a farm config from a game save:
//  - machines from every location (casks only count in the Cellar),
//  - greenhouse and Farm crops as plots, greenhouse fertilizer by majority,
//  - professions, coop/barn animals, mature fruit trees and bee houses.
// Throws std::runtime_error for truffles in HoeDirt and overfull buildings.
AppConfig app_config_from_save(const xml::Document& save);

SprinklerSurvey survey_sprinklers(const xml::Document& save);

// Loads a save and, when `overrides_path` is set, applies a JSON overrides
// document (prices, fertilizer, simulation, bees, fruit trees, crop).
AppConfig load_app_config_from_save(const std::string& save_path, const std::string& overrides_path = "");

} // namespace agrisim
