#pragma once

#include <map>
#include <string>
#include <vector>

#include "agrisim/core/calendar.h"

namespace agrisim {

inline constexpr int kHoneyIntervalDays = 4;

struct FlowerSpec {
  std::string name;
  int growth_days{0};
  int base_price{0};
};

// Flowers planted near the bee houses at the start of a season. The cheap
// fast flower bridges the gap until the expensive one blooms.
struct FlowerPlan {
  FlowerSpec fast;
  FlowerSpec expensive;
};

struct BeeConfig {
  int bee_houses{0};
  // Flower price used in seasons without a plan (0 = wild honey).
  int flower_base_price{0};
  std::vector<Season> seasons{Season::Spring, Season::Summer, Season::Fall};
  std::map<Season, FlowerPlan> flower_plan;
};

struct BeeYearResult {
  // Honey count keyed by the flower price it was made with.
  std::map<int, int> honey_by_flower_price;
  int honey_total{0};
};

// One honey per house every 4 days of each configured season.
BeeYearResult simulate_bees(const BeeConfig& cfg, int days_per_season = kDaysPerSeason);

} // namespace agrisim
