#pragma once

#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace agrisim {

// How fertilizer use is counted for crops that keep growing after harvest.
enum class FertilizerCadence {
  // Once at planting, then again on the first active day of every new season
  // for seasonal plots. Always-active plots keep their fertilized soil.
  PerSeason,
  // Once at planting and once per regrowth.
  PerRegrowthCycle,
};

const char* fertilizer_cadence_name(FertilizerCadence c);

// Inputs a lifecycle policy needs to decide how a crop restarts.
struct LifecycleContext {
  // Speed-adjusted length of the full phase sequence.
  int full_cycle_days{1};
  FertilizerCadence fertilizer_cadence{FertilizerCadence::PerSeason};
};

// What happens to a tile right after it was harvested.
struct CycleReset {
  int days_until_harvest{1};
  bool consumes_seed{false};
  bool fertilizes{false};
};

// Single-harvest crop: a fresh seed is planted after every harvest and the
// whole phase sequence starts over.
struct ReplantLifecycle {
  CycleReset after_harvest(const LifecycleContext& ctx) const { return {ctx.full_cycle_days, true, true}; }
  bool refertilizes_each_season(const LifecycleContext&) const { return false; }
};

// Planted once; after the first harvest the plant regrows in a fixed number
// of days that speed bonuses do not shorten.
struct PerennialLifecycle {
  int regrow_days{1};

  CycleReset after_harvest(const LifecycleContext& ctx) const {
    return {regrow_days, false, ctx.fertilizer_cadence == FertilizerCadence::PerRegrowthCycle};
  }
  bool refertilizes_each_season(const LifecycleContext& ctx) const {
    return ctx.fertilizer_cadence == FertilizerCadence::PerSeason;
  }
};

using CropLifecycle = std::variant<ReplantLifecycle, PerennialLifecycle>;

struct Crop {
  std::string id;
  std::string name;
  // Base phase lengths in days, before speed bonuses.
  std::vector<int> phase_days;
  CropLifecycle lifecycle{ReplantLifecycle{}};

  int base_days_to_first_harvest() const;
  bool replants_every_harvest() const { return std::holds_alternative<ReplantLifecycle>(lifecycle); }
  // Regrowth days for perennial crops, nullopt for replant crops.
  std::optional<int> regrow_days() const;
};

inline const std::string kStarfruitId = "starfruit";
inline const std::string kAncientFruitId = "ancient";

// Starfruit: phases 2,3,2,3,3 (13 days), replanted after every harvest.
Crop starfruit_crop();
// Ancient fruit: phases 2,7,7,7,5 (28 days), regrows every 7 days.
Crop ancient_fruit_crop();

// The fixed crop catalog, in default priority order.
const std::vector<Crop>& crop_catalog();

// Looks up a catalog crop by (normalized) name or id. Returns nullptr if unknown.
const Crop* find_catalog_crop(const std::string& name_or_id);

// Processing priority: starfruit first when present, then the remaining crops
// in the given order, then `extra_ids` (e.g. fruit tree products) not already
// listed.
std::vector<std::string> crop_priority(const std::vector<Crop>& crops,
                                       const std::vector<std::string>& extra_ids = {});

} // namespace agrisim
