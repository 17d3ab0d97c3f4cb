#pragma once

#include <string>
#include <vector>

namespace agrisim {

struct Crop;

enum class Fertilizer { None, SpeedGro, DeluxeSpeedGro, HyperSpeedGro };

const char* fertilizer_name(Fertilizer f);

// Accepts canonical names ("speed_gro") and loose spellings ("Deluxe Speed-Gro",
// "hypersg"). Returns false for unknown names.
bool parse_fertilizer(const std::string& raw, Fertilizer& out);

struct GrowthModifiers {
  Fertilizer fertilizer{Fertilizer::None};
  bool agriculturist{false};
  // Paddy crops watered by a nearby water source grow 25% faster.
  bool paddy_bonus{false};
};

// Total fractional speed increase (0.10 = 10% faster).
double speed_increase(const GrowthModifiers& mods);

// Shortens a phase sequence the way the game applies speed bonuses:
// ceil(total * speed) days are removed, one day per phase per pass, over at
// most three passes. The first phase never drops below one day.
std::vector<int> apply_speed_increases(const std::vector<int>& phase_days, double speed);

// Sum of the adjusted phase sequence.
int adjusted_total_days(const std::vector<int>& phase_days, double speed);

// Days from planting to the first harvest under `mods`.
int days_to_first_harvest(const Crop& crop, const GrowthModifiers& mods);

} // namespace agrisim
