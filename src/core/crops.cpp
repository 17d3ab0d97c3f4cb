#include "agrisim/core/crops.h"

#include <algorithm>
#include <numeric>

#include "agrisim/util/strings.h"

namespace agrisim {

const char* fertilizer_cadence_name(FertilizerCadence c) {
  switch (c) {
    case FertilizerCadence::PerSeason: return "per_season";
    case FertilizerCadence::PerRegrowthCycle: return "per_regrowth_cycle";
  }
  return "per_season";
}

int Crop::base_days_to_first_harvest() const {
  return std::accumulate(phase_days.begin(), phase_days.end(), 0);
}

std::optional<int> Crop::regrow_days() const {
  if (const auto* p = std::get_if<PerennialLifecycle>(&lifecycle)) return p->regrow_days;
  return std::nullopt;
}

Crop starfruit_crop() {
  Crop c;
  c.id = kStarfruitId;
  c.name = "Starfruit";
  c.phase_days = {2, 3, 2, 3, 3};
  c.lifecycle = ReplantLifecycle{};
  return c;
}

Crop ancient_fruit_crop() {
  Crop c;
  c.id = kAncientFruitId;
  c.name = "Ancient Fruit";
  c.phase_days = {2, 7, 7, 7, 5};
  c.lifecycle = PerennialLifecycle{7};
  return c;
}

const std::vector<Crop>& crop_catalog() {
  static const std::vector<Crop> catalog = {starfruit_crop(), ancient_fruit_crop()};
  return catalog;
}

const Crop* find_catalog_crop(const std::string& name_or_id) {
  const std::string key = normalize_key(name_or_id);
  for (const Crop& c : crop_catalog()) {
    if (key == normalize_key(c.id) || key == normalize_key(c.name)) return &c;
  }
  if (key == "star") return &crop_catalog()[0];
  return nullptr;
}

std::vector<std::string> crop_priority(const std::vector<Crop>& crops, const std::vector<std::string>& extra_ids) {
  std::vector<std::string> out;
  auto push_unique = [&](const std::string& id) {
    if (std::find(out.begin(), out.end(), id) == out.end()) out.push_back(id);
  };

  const bool has_starfruit = std::any_of(crops.begin(), crops.end(), [](const Crop& c) {
    return c.id == kStarfruitId;
  });
  if (has_starfruit) push_unique(kStarfruitId);
  for (const Crop& c : crops) push_unique(c.id);
  for (const std::string& id : extra_ids) push_unique(id);
  return out;
}

} // namespace agrisim
