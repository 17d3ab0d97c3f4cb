#include "agrisim/core/bees.h"

#include <algorithm>

namespace agrisim {

BeeYearResult simulate_bees(const BeeConfig& cfg, int days_per_season) {
  BeeYearResult out;
  const int houses = std::max(0, cfg.bee_houses);
  if (houses == 0 || cfg.seasons.empty() || days_per_season <= 0) return out;

  for (Season season : cfg.seasons) {
    auto plan_it = cfg.flower_plan.find(season);
    for (int day = kHoneyIntervalDays; day <= days_per_season; day += kHoneyIntervalDays) {
      int price = cfg.flower_base_price;
      if (plan_it != cfg.flower_plan.end()) {
        const FlowerPlan& plan = plan_it->second;
        // A flower seeded on day 1 blooms the day after its growth period.
        const int fast_ready = std::max(0, plan.fast.growth_days) + 1;
        const int expensive_ready = std::max(0, plan.expensive.growth_days) + 1;
        if (day >= expensive_ready) {
          price = plan.expensive.base_price;
        } else if (day >= fast_ready) {
          price = plan.fast.base_price;
        } else {
          price = 0;
        }
      }
      out.honey_by_flower_price[price] += houses;
      out.honey_total += houses;
    }
  }
  return out;
}

} // namespace agrisim
