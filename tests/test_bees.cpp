#include <iostream>

#include "agrisim/core/bees.h"
#include "agrisim/core/economy.h"

#define AGRISIM_ASSERT(expr) \
  do { \
    if (!(expr)) { \
      std::cerr << "ASSERT failed: " #expr " (" << __FILE__ << ":" << __LINE__ << ")\n"; \
      return 1; \
    } \
  } while (0)

int test_bees() {
  using namespace agrisim;

  // Wild honey: 7 harvests per season in three seasons.
  {
    BeeConfig cfg;
    cfg.bee_houses = 2;
    const BeeYearResult r = simulate_bees(cfg);
    AGRISIM_ASSERT(r.honey_total == 42);
    AGRISIM_ASSERT(r.honey_by_flower_price.size() == 1);
    AGRISIM_ASSERT(r.honey_by_flower_price.at(0) == 42);
    AGRISIM_ASSERT(compute_honey_revenue(r, EconomyConfig{}, 0) == 4200);
  }

  // A flower plan switches honey to the expensive flower once it blooms.
  {
    BeeConfig cfg;
    cfg.bee_houses = 2;
    cfg.flower_plan[Season::Summer] = FlowerPlan{{"poppy", 6, 50}, {"fairy rose", 12, 140}};
    const BeeYearResult r = simulate_bees(cfg);
    AGRISIM_ASSERT(r.honey_total == 42);
    // Summer day 4 is before anything blooms.
    AGRISIM_ASSERT(r.honey_by_flower_price.at(0) == 30);
    AGRISIM_ASSERT(r.honey_by_flower_price.at(50) == 4);
    AGRISIM_ASSERT(r.honey_by_flower_price.at(140) == 8);
    AGRISIM_ASSERT(compute_honey_revenue(r, EconomyConfig{}, 0) == 30 * 100 + 4 * 200 + 8 * 380);
  }

  // No houses or no seasons: no honey.
  {
    BeeConfig cfg;
    AGRISIM_ASSERT(simulate_bees(cfg).honey_total == 0);
    cfg.bee_houses = 3;
    cfg.seasons.clear();
    AGRISIM_ASSERT(simulate_bees(cfg).honey_total == 0);
  }

  AGRISIM_ASSERT(honey_price(0, false) == 100);
  AGRISIM_ASSERT(honey_price(290, false) == 680);
  AGRISIM_ASSERT(honey_price(-5, false) == 100);

  return 0;
}
