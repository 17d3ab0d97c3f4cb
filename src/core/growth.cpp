#include "agrisim/core/growth.h"

#include <cmath>
#include <numeric>

#include "agrisim/core/crops.h"
#include "agrisim/util/strings.h"

namespace agrisim {

namespace {
constexpr int kMaxReductionPasses = 3;
} // namespace

const char* fertilizer_name(Fertilizer f) {
  switch (f) {
    case Fertilizer::None: return "none";
    case Fertilizer::SpeedGro: return "speed_gro";
    case Fertilizer::DeluxeSpeedGro: return "deluxe_speed_gro";
    case Fertilizer::HyperSpeedGro: return "hyper_speed_gro";
  }
  return "none";
}

bool parse_fertilizer(const std::string& raw, Fertilizer& out) {
  const std::string key = to_lower(trim_copy(raw));
  if (key == "none" || key == "no") {
    out = Fertilizer::None;
    return true;
  }
  const std::string norm = normalize_key(key);
  if (norm == "speedgro") {
    out = Fertilizer::SpeedGro;
    return true;
  }
  if (norm == "deluxespeedgro" || norm == "deluxesg") {
    out = Fertilizer::DeluxeSpeedGro;
    return true;
  }
  if (norm == "hyperspeedgro" || norm == "hypersg") {
    out = Fertilizer::HyperSpeedGro;
    return true;
  }
  return false;
}

double speed_increase(const GrowthModifiers& mods) {
  double speed = 0.0;
  switch (mods.fertilizer) {
    case Fertilizer::SpeedGro: speed += 0.10; break;
    case Fertilizer::DeluxeSpeedGro: speed += 0.25; break;
    case Fertilizer::HyperSpeedGro: speed += 0.33; break;
    case Fertilizer::None: break;
  }
  if (mods.paddy_bonus) speed += 0.25;
  if (mods.agriculturist) speed += 0.10;
  return speed;
}

std::vector<int> apply_speed_increases(const std::vector<int>& phase_days, double speed) {
  std::vector<int> phases = phase_days;
  const int total = std::accumulate(phases.begin(), phases.end(), 0);
  if (speed <= 0.0 || total <= 0) return phases;

  int to_remove = static_cast<int>(std::ceil(static_cast<double>(total) * speed));
  for (int pass = 0; pass < kMaxReductionPasses && to_remove > 0; ++pass) {
    for (std::size_t i = 0; i < phases.size() && to_remove > 0; ++i) {
      if (i > 0 || phases[i] > 1) {
        --phases[i];
        --to_remove;
      }
    }
  }
  return phases;
}

int adjusted_total_days(const std::vector<int>& phase_days, double speed) {
  const auto phases = apply_speed_increases(phase_days, speed);
  return std::accumulate(phases.begin(), phases.end(), 0);
}

int days_to_first_harvest(const Crop& crop, const GrowthModifiers& mods) {
  return adjusted_total_days(crop.phase_days, speed_increase(mods));
}

} // namespace agrisim
