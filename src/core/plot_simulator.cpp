#include "agrisim/core/plot_simulator.h"

#include <algorithm>
#include <stdexcept>

namespace agrisim {

int Plot::tiles_for_crop(const std::string& crop_id) const {
  if (auto it = tiles_by_crop.find(crop_id); it != tiles_by_crop.end()) return it->second;
  if (auto it = tiles_by_crop.find(kAllCropsKey); it != tiles_by_crop.end()) return it->second;
  return 0;
}

int Plot::tiles_total() const {
  int total = 0;
  for (const auto& [_, tiles] : tiles_by_crop) total += std::max(0, tiles);
  return total;
}

PlotSimulator::PlotSimulator(Plot plot, const std::vector<Crop>& crops, const GrowthModifiers& mods,
                             FertilizerCadence cadence)
    : plot_(std::move(plot)), uses_fertilizer_(mods.fertilizer != Fertilizer::None) {
  for (const auto& [crop_id, tiles] : plot_.tiles_by_crop) {
    if (tiles < 0) {
      throw std::invalid_argument("plot '" + plot_.name + "' has negative tiles for " + crop_id + ": " +
                                  std::to_string(tiles));
    }
    if (tiles == 0 || crop_id == kAllCropsKey) continue;
    const bool known = std::any_of(crops.begin(), crops.end(), [&](const Crop& c) { return c.id == crop_id; });
    if (!known) throw std::invalid_argument("plot '" + plot_.name + "' has tiles for unknown crop: " + crop_id);
  }
  if (plot_.calendar.kind == PlotCalendar::Kind::Seasons && plot_.calendar.seasons.empty()) {
    throw std::invalid_argument("plot '" + plot_.name + "' uses a seasons calendar with no seasons");
  }

  for (const Crop& crop : crops) {
    const int tiles = plot_.tiles_for_crop(crop.id);
    if (tiles <= 0) continue;

    TrackedCrop tc;
    tc.crop = crop;
    tc.ctx.full_cycle_days = std::max(1, days_to_first_harvest(crop, mods));
    tc.ctx.fertilizer_cadence = cadence;
    crops_.push_back(std::move(tc));

    CropRuntimeState st;
    st.crop_id = crop.id;
    st.tiles = tiles;
    states_.push_back(std::move(st));
  }
}

const CropRuntimeState* PlotSimulator::state_for(const std::string& crop_id) const {
  for (const auto& st : states_) {
    if (st.crop_id == crop_id) return &st;
  }
  return nullptr;
}

void PlotSimulator::apply_fertilizer(CropRuntimeState& st, Season season) const {
  if (uses_fertilizer_) st.fertilizer_units_used += st.tiles;
  st.fertilized_season = season;
}

std::vector<PlotHarvest> PlotSimulator::advance_day(Season season) {
  std::vector<PlotHarvest> out;
  // Out-of-season days leave every timer where it was.
  if (!is_active(season)) return out;

  const bool seasonal = plot_.calendar.kind == PlotCalendar::Kind::Seasons;

  for (std::size_t i = 0; i < states_.size(); ++i) {
    CropRuntimeState& st = states_[i];
    const TrackedCrop& tc = crops_[i];

    // Planting day counts as the first day of growth.
    if (!st.planted) {
      st.planted = true;
      st.seed_units_used += st.tiles;
      apply_fertilizer(st, season);
      st.days_until_harvest = std::max(1, tc.ctx.full_cycle_days - 1);
      continue;
    }

    // First active day of a new season on an outdoor plot: regrowing crops may
    // need a fresh application depending on the cadence.
    if (seasonal && st.fertilized_season != season) {
      const bool refertilize =
          std::visit([&](const auto& policy) { return policy.refertilizes_each_season(tc.ctx); }, tc.crop.lifecycle);
      if (refertilize) apply_fertilizer(st, season);
    }

    if (--st.days_until_harvest > 0) continue;

    out.push_back(PlotHarvest{st.crop_id, st.tiles});
    ++st.harvests;

    const CycleReset reset =
        std::visit([&](const auto& policy) { return policy.after_harvest(tc.ctx); }, tc.crop.lifecycle);
    st.days_until_harvest = std::max(1, reset.days_until_harvest);
    if (reset.consumes_seed) st.seed_units_used += st.tiles;
    if (reset.fertilizes) apply_fertilizer(st, season);
  }
  return out;
}

} // namespace agrisim
