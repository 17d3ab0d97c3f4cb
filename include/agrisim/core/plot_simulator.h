#pragma once

#include <map>
#include <optional>
#include <string>
#include <vector>

#include "agrisim/core/calendar.h"
#include "agrisim/core/crops.h"
#include "agrisim/core/growth.h"

namespace agrisim {

// Tile key that applies to every crop not listed explicitly in a plot.
inline const std::string kAllCropsKey = "all";

struct Plot {
  std::string name{"plot"};
  PlotCalendar calendar;
  std::map<std::string, int> tiles_by_crop;

  // Explicit entry first, then the shared "all" bucket, else 0.
  int tiles_for_crop(const std::string& crop_id) const;
  int tiles_total() const;
};

// Growth state of one crop on one plot. Only advanced on active days.
struct CropRuntimeState {
  std::string crop_id;
  int tiles{0};
  bool planted{false};
  int days_until_harvest{0};
  // Season in which fertilizer was last applied (for the per-season cadence).
  std::optional<Season> fertilized_season;

  int harvests{0};
  int seed_units_used{0};
  int fertilizer_units_used{0};
};

struct PlotHarvest {
  std::string crop_id;
  int fruit{0};
};

// Advances a single plot one day at a time.
//
// On the first active day a crop is planted; the planting day already counts
// as a growth day, so a crop with an adjusted length of N days is first
// harvested on its N-th active day. Inactive days freeze the state: timers are
// neither advanced nor reset.
class PlotSimulator {
 public:
  // Throws std::invalid_argument for negative tile counts or tiles assigned to
  // a crop that is not in `crops`.
  PlotSimulator(Plot plot, const std::vector<Crop>& crops, const GrowthModifiers& mods,
                FertilizerCadence cadence = FertilizerCadence::PerSeason);

  // Returns the fruit harvested today, one entry per crop that was harvested.
  std::vector<PlotHarvest> advance_day(Season season);

  bool is_active(Season season) const { return plot_.calendar.is_active(season); }

  const Plot& plot() const { return plot_; }
  const std::vector<CropRuntimeState>& crop_states() const { return states_; }
  const CropRuntimeState* state_for(const std::string& crop_id) const;

 private:
  struct TrackedCrop {
    Crop crop;
    LifecycleContext ctx;
  };

  void apply_fertilizer(CropRuntimeState& st, Season season) const;

  Plot plot_;
  bool uses_fertilizer_{false};
  std::vector<TrackedCrop> crops_;
  std::vector<CropRuntimeState> states_;
};

} // namespace agrisim
