#include "agrisim/core/animals.h"

#include <algorithm>
#include <array>
#include <tuple>
#include <utility>

#include "agrisim/core/calendar.h"

namespace agrisim {
namespace {

double clamp_rate(double r) { return std::clamp(r, 0.0, 1.0); }

// Splits `total` into (normal, large); the large share is floored.
std::pair<int, int> split_with_rate(int total, double rate) {
  const int large = static_cast<int>(total * clamp_rate(rate));
  return {std::max(0, total - large), large};
}

// Takes up to `capacity` items from the counters in order.
template <std::size_t N>
std::array<int, N> allocate_by_priority(const std::array<int, N>& available, int capacity) {
  std::array<int, N> taken{};
  capacity = std::max(0, capacity);
  for (std::size_t i = 0; i < N && capacity > 0; ++i) {
    const int use = std::min(std::max(0, available[i]), capacity);
    taken[i] = use;
    capacity -= use;
  }
  return taken;
}

} // namespace

int non_winter_days(int days) {
  if (days <= 0) return 0;
  const int non_winter_per_year = kDaysPerSeason * 3;
  return (days / kDaysPerYear) * non_winter_per_year + std::min(days % kDaysPerYear, non_winter_per_year);
}

AnimalYearResult simulate_animals(const AnimalsConfig& cfg, int days, const AnimalMachines& machines, bool gatherer,
                                  bool shepherd) {
  days = std::max(0, days);

  int chickens = 0, void_chickens = 0, ducks = 0, rabbits = 0;
  for (const auto& c : cfg.coops) {
    chickens += c.chickens;
    void_chickens += c.void_chickens;
    ducks += c.ducks;
    rabbits += c.rabbits;
  }
  int cows = 0, goats = 0, pigs = 0, sheep = 0;
  for (const auto& b : cfg.barns) {
    cows += b.cows;
    goats += b.goats;
    pigs += b.pigs;
    sheep += b.sheep;
  }

  AnimalYearResult r;
  std::tie(r.eggs, r.large_eggs) = split_with_rate(chickens * days, cfg.large_egg_rate);
  r.void_eggs = void_chickens * days;
  r.duck_eggs = ducks * (days / kDuckEggDays);

  std::tie(r.milk, r.large_milk) = split_with_rate(cows * days, cfg.large_milk_rate);
  std::tie(r.goat_milk, r.large_goat_milk) = split_with_rate(goats * (days / kGoatMilkDays), cfg.large_goat_milk_rate);

  const int rabbit_drops = rabbits * (days / kRabbitWoolDays);
  r.rabbit_feet = static_cast<int>(rabbit_drops * clamp_rate(cfg.rabbit_foot_rate));
  const int sheep_interval = shepherd ? 1 : kSheepWoolDays;
  r.wool = std::max(0, rabbit_drops - r.rabbit_feet) + sheep * (days / sheep_interval);

  r.truffles = pigs * non_winter_days(days);
  if (gatherer && r.truffles > 0) r.truffles += static_cast<int>(r.truffles * 0.2);
  r.truffle_oil = std::min(r.truffles, std::max(0, machines.oil_makers) * days);
  r.raw_truffles = std::max(0, r.truffles - r.truffle_oil);

  // Mayo: duck, void, large, then regular eggs.
  const auto eggs_used = allocate_by_priority<4>({r.duck_eggs, r.void_eggs, r.large_eggs, r.eggs},
                                                 std::max(0, machines.mayo_machines) * days);
  r.duck_mayo = eggs_used[0];
  r.void_mayo = eggs_used[1];
  r.gold_mayo = eggs_used[2];
  r.mayo = eggs_used[3];

  // Cheese: large goat, goat, large cow, then cow milk.
  const auto milk_used = allocate_by_priority<4>({r.large_goat_milk, r.goat_milk, r.large_milk, r.milk},
                                                 std::max(0, machines.cheese_presses) * days);
  r.gold_goat_cheese = milk_used[0];
  r.goat_cheese = milk_used[1];
  r.gold_cheese = milk_used[2];
  r.cheese = milk_used[3];

  r.cloth = std::min(r.wool, std::max(0, machines.looms) * days);
  return r;
}

} // namespace agrisim
