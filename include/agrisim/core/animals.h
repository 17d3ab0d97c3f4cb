#pragma once

#include <string>
#include <vector>

namespace agrisim {

inline constexpr int kAnimalBuildingCapacity = 12;

inline constexpr int kDuckEggDays = 2;
inline constexpr int kGoatMilkDays = 2;
inline constexpr int kRabbitWoolDays = 4;
inline constexpr int kSheepWoolDays = 3;

struct Coop {
  std::string name;
  int chickens{0};
  int ducks{0};
  int rabbits{0};
  int void_chickens{0};

  int occupants() const { return chickens + ducks + rabbits + void_chickens; }
};

struct Barn {
  std::string name;
  int cows{0};
  int goats{0};
  int pigs{0};
  int sheep{0};

  int occupants() const { return cows + goats + pigs + sheep; }
};

struct AnimalsConfig {
  std::vector<Coop> coops;
  std::vector<Barn> barns;
  // Share of eggs/milk that come out large, and of rabbit drops that are feet.
  double large_egg_rate{0.0};
  double large_milk_rate{0.0};
  double large_goat_milk_rate{0.0};
  double rabbit_foot_rate{0.0};

  bool empty() const { return coops.empty() && barns.empty(); }
};

// Machines that turn animal products into artisan goods, one item per machine
// per day.
struct AnimalMachines {
  int mayo_machines{0};
  int cheese_presses{0};
  int looms{0};
  int oil_makers{0};
};

struct AnimalYearResult {
  int eggs{0};
  int large_eggs{0};
  int void_eggs{0};
  int duck_eggs{0};
  int milk{0};
  int large_milk{0};
  int goat_milk{0};
  int large_goat_milk{0};
  int wool{0};
  int rabbit_feet{0};

  int mayo{0};
  int gold_mayo{0};
  int void_mayo{0};
  int duck_mayo{0};
  int cheese{0};
  int gold_cheese{0};
  int goat_cheese{0};
  int gold_goat_cheese{0};
  int cloth{0};

  int truffles{0};
  int truffle_oil{0};
  int raw_truffles{0};
};

// Number of non-winter days within the first `days` days of a spring start.
int non_winter_days(int days);

// Yearly animal output assuming every animal is fed every day.
//
// Eggs and cow milk are daily, duck eggs and goat milk every 2 days, rabbit
// drops every 4 and sheep wool every 3 (daily with the shepherd profession).
// Pigs find one truffle per day outside winter, +20% with the gatherer
// profession. Leftover raw products that no machine can take are sold raw.
AnimalYearResult simulate_animals(const AnimalsConfig& cfg, int days, const AnimalMachines& machines,
                                  bool gatherer = false, bool shepherd = false);

} // namespace agrisim
