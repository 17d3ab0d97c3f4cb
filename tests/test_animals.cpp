#include <iostream>

#include "agrisim/core/animals.h"

#define AGRISIM_ASSERT(expr) \
  do { \
    if (!(expr)) { \
      std::cerr << "ASSERT failed: " #expr " (" << __FILE__ << ":" << __LINE__ << ")\n"; \
      return 1; \
    } \
  } while (0)

int test_animals() {
  using namespace agrisim;

  AGRISIM_ASSERT(non_winter_days(0) == 0);
  AGRISIM_ASSERT(non_winter_days(50) == 50);
  AGRISIM_ASSERT(non_winter_days(100) == 84);
  AGRISIM_ASSERT(non_winter_days(112) == 84);
  AGRISIM_ASSERT(non_winter_days(224) == 168);

  AnimalsConfig cfg;
  cfg.coops.push_back(Coop{"coop", 4, 2, 4, 0});
  cfg.barns.push_back(Barn{"barn", 2, 2, 1, 3});
  cfg.large_egg_rate = 0.25;
  cfg.large_milk_rate = 0.5;
  cfg.rabbit_foot_rate = 0.5;
  AGRISIM_ASSERT(!cfg.empty());
  AGRISIM_ASSERT(cfg.coops[0].occupants() == 10);

  // No machines: everything is sold raw.
  {
    const AnimalYearResult r = simulate_animals(cfg, 112, AnimalMachines{});
    AGRISIM_ASSERT(r.large_eggs == 112);
    AGRISIM_ASSERT(r.eggs == 336);
    AGRISIM_ASSERT(r.duck_eggs == 112);
    AGRISIM_ASSERT(r.large_milk == 112);
    AGRISIM_ASSERT(r.milk == 112);
    AGRISIM_ASSERT(r.goat_milk == 112);
    AGRISIM_ASSERT(r.large_goat_milk == 0);
    AGRISIM_ASSERT(r.rabbit_feet == 56);
    AGRISIM_ASSERT(r.wool == 56 + 3 * 37);
    AGRISIM_ASSERT(r.truffles == 84);
    AGRISIM_ASSERT(r.raw_truffles == 84);
    AGRISIM_ASSERT(r.mayo + r.duck_mayo + r.gold_mayo + r.void_mayo == 0);
  }

  // Machines take the most valuable inputs first.
  {
    AnimalMachines m;
    m.mayo_machines = 1;
    m.cheese_presses = 2;
    m.looms = 1;
    const AnimalYearResult r = simulate_animals(cfg, 112, m, true, true);
    AGRISIM_ASSERT(r.duck_mayo == 112);
    AGRISIM_ASSERT(r.gold_mayo == 0);
    AGRISIM_ASSERT(r.mayo == 0);
    AGRISIM_ASSERT(r.goat_cheese == 112);
    AGRISIM_ASSERT(r.gold_cheese == 112);
    AGRISIM_ASSERT(r.cheese == 0);
    // Shepherd: sheep produce every day.
    AGRISIM_ASSERT(r.wool == 56 + 3 * 112);
    AGRISIM_ASSERT(r.cloth == 112);
    // Gatherer: +20% truffles, floored.
    AGRISIM_ASSERT(r.truffles == 100);
  }

  // Oil makers cap truffle oil at one per machine per day.
  {
    AnimalsConfig pigs;
    pigs.barns.push_back(Barn{"pigs", 0, 0, 12, 0});
    AnimalMachines m;
    m.oil_makers = 2;
    const AnimalYearResult r = simulate_animals(pigs, 112, m);
    AGRISIM_ASSERT(r.truffles == 12 * 84);
    AGRISIM_ASSERT(r.truffle_oil == 224);
    AGRISIM_ASSERT(r.raw_truffles == 12 * 84 - 224);
  }

  {
    const AnimalYearResult r = simulate_animals(AnimalsConfig{}, 112, AnimalMachines{});
    AGRISIM_ASSERT(r.eggs == 0);
    AGRISIM_ASSERT(r.truffles == 0);
  }

  return 0;
}
