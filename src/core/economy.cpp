#include "agrisim/core/economy.h"

#include <algorithm>

namespace agrisim {
namespace {

int lookup(const std::map<std::string, int>& m, const std::string& key) {
  auto it = m.find(key);
  return it == m.end() ? 0 : it->second;
}

} // namespace

int fruit_price_for(const std::string& product_id, const EconomyConfig& eco) {
  return lookup(eco.fruit_price, product_id);
}

int wine_price_for(const std::string& product_id, const EconomyConfig& eco) {
  if (auto it = eco.wine_price.find(product_id); it != eco.wine_price.end()) return it->second;
  return fruit_price_for(product_id, eco) * 3;
}

UnitPrices unit_prices(const std::string& product_id, const EconomyConfig& eco) {
  const int fruit = fruit_price_for(product_id, eco);
  const int wine = wine_price_for(product_id, eco);

  double wine_unit = wine * eco.wine_quality_multiplier;
  double fruit_unit = fruit * eco.fruit_quality_multiplier;
  double jelly_unit = fruit > 0 ? fruit * 2.0 + 50.0 : 0.0;
  double dried_unit = fruit > 0 ? static_cast<int>(fruit * 7.5 + 25.0) : 0.0;
  if (eco.artisan) {
    wine_unit *= kArtisanMultiplier;
    jelly_unit *= kArtisanMultiplier;
    dried_unit *= kArtisanMultiplier;
  }
  if (eco.tiller) fruit_unit *= kTillerMultiplier;

  UnitPrices p;
  p.raw = static_cast<int>(fruit_unit);
  p.wine = static_cast<int>(wine_unit);
  p.jelly = static_cast<int>(jelly_unit);
  p.dried_batch = static_cast<int>(dried_unit);
  return p;
}

std::map<std::string, int> per_fruit_processing_values(int fruit_price, int wine_price, const EconomyConfig& eco) {
  double fruit_unit = fruit_price * eco.fruit_quality_multiplier;
  if (eco.tiller) fruit_unit *= kTillerMultiplier;
  double wine_unit = wine_price * eco.wine_quality_multiplier;
  double jelly_unit = fruit_price > 0 ? fruit_price * 2.0 + 50.0 : 0.0;
  double dried_unit = fruit_price > 0 ? fruit_price * 1.5 + 5.0 : 0.0;
  if (eco.artisan) {
    wine_unit *= kArtisanMultiplier;
    jelly_unit *= kArtisanMultiplier;
    dried_unit *= kArtisanMultiplier;
  }
  return {
      {"raw", static_cast<int>(fruit_unit)},
      {"wine", static_cast<int>(wine_unit)},
      {"jelly", static_cast<int>(jelly_unit)},
      {"dried", static_cast<int>(dried_unit)},
  };
}

const ProfitBreakdown* ProfitSummary::find(const std::string& product_id) const {
  for (const auto& p : per_product) {
    if (p.product_id == product_id) return &p;
  }
  return nullptr;
}

ProfitSummary compute_profit(const std::vector<CropYearResult>& products, const EconomyConfig& eco,
                             Fertilizer fertilizer) {
  ProfitSummary out;
  int fert_unit_cost = 0;
  if (auto it = eco.fertilizer_cost.find(fertilizer); it != eco.fertilizer_cost.end()) fert_unit_cost = it->second;

  for (const auto& r : products) {
    const UnitPrices u = unit_prices(r.product_id, eco);

    ProfitBreakdown b;
    b.product_id = r.product_id;
    b.base_wine_revenue = r.base_goods_sold * u.wine;
    b.aged_wine_revenue = static_cast<int>(r.base_goods_aged * u.wine * eco.aged_wine_multiplier);
    b.fruit_revenue = r.fruit_unprocessed * u.raw;
    b.jelly_revenue = r.preserves_produced * u.jelly;
    b.dried_fruit_revenue = r.dried_produced * u.dried_batch;
    b.seed_cost = r.seed_units * lookup(eco.seed_cost, r.product_id);
    b.fertilizer_cost = r.fertilizer_units * fert_unit_cost;

    out.total_revenue += b.revenue();
    out.total_seed_cost += b.seed_cost;
    out.total_fertilizer_cost += b.fertilizer_cost;
    out.per_product.push_back(std::move(b));
  }
  out.total_profit = out.total_revenue - out.total_seed_cost - out.total_fertilizer_cost;
  return out;
}

AnimalProfit compute_animal_profit(const AnimalYearResult& r, const EconomyConfig& eco, bool botanist,
                                   bool rancher) {
  AnimalProfit p;
  p.cheese_revenue = r.cheese * prices::kCheese + r.gold_cheese * prices::kGoldCheese +
                     r.goat_cheese * prices::kGoatCheese + r.gold_goat_cheese * prices::kGoldGoatCheese;
  p.mayo_revenue = r.mayo * prices::kMayo + r.gold_mayo * prices::kGoldMayo + r.duck_mayo * prices::kDuckMayo +
                   r.void_mayo * prices::kVoidMayo;
  p.cloth_revenue = r.cloth * prices::kCloth;
  p.truffle_oil_revenue = r.truffle_oil * prices::kTruffleOil;
  p.raw_truffle_revenue = r.raw_truffles * (botanist ? prices::kTruffleIridium : prices::kTruffle);

  auto left = [](int produced, int used) { return std::max(0, produced - used); };
  p.raw_animal_revenue = left(r.eggs, r.mayo) * prices::kEgg + left(r.large_eggs, r.gold_mayo) * prices::kLargeEgg +
                         left(r.duck_eggs, r.duck_mayo) * prices::kDuckEgg +
                         left(r.void_eggs, r.void_mayo) * prices::kVoidEgg + left(r.milk, r.cheese) * prices::kMilk +
                         left(r.large_milk, r.gold_cheese) * prices::kLargeMilk +
                         left(r.goat_milk, r.goat_cheese) * prices::kGoatMilk +
                         left(r.large_goat_milk, r.gold_goat_cheese) * prices::kLargeGoatMilk +
                         left(r.wool, r.cloth) * prices::kWool + r.rabbit_feet * prices::kRabbitFoot;

  if (eco.artisan) {
    p.cheese_revenue = static_cast<int>(p.cheese_revenue * kArtisanMultiplier);
    p.mayo_revenue = static_cast<int>(p.mayo_revenue * kArtisanMultiplier);
    p.cloth_revenue = static_cast<int>(p.cloth_revenue * kArtisanMultiplier);
    p.truffle_oil_revenue = static_cast<int>(p.truffle_oil_revenue * kArtisanMultiplier);
  }
  if (rancher) p.raw_animal_revenue = static_cast<int>(p.raw_animal_revenue * kRancherMultiplier);
  return p;
}

int honey_price(int flower_price, bool artisan) {
  int price = 100 + 2 * std::max(0, flower_price);
  if (artisan) price = static_cast<int>(price * kArtisanMultiplier);
  return price;
}

int compute_honey_revenue(const BeeYearResult& r, const EconomyConfig& eco, int flower_base_price) {
  if (r.honey_by_flower_price.empty()) return r.honey_total * honey_price(flower_base_price, eco.artisan);
  int revenue = 0;
  for (const auto& [flower_price, count] : r.honey_by_flower_price) {
    revenue += honey_price(flower_price, eco.artisan) * count;
  }
  return revenue;
}

std::map<std::string, int> build_category_totals(const ProfitSummary& crops, const AnimalProfit& animals,
                                                 int honey_revenue) {
  int aged = 0, base = 0, jelly = 0, dried = 0, raw = 0;
  for (const auto& p : crops.per_product) {
    aged += p.aged_wine_revenue;
    base += p.base_wine_revenue;
    jelly += p.jelly_revenue;
    dried += p.dried_fruit_revenue;
    raw += p.fruit_revenue;
  }
  return {
      {"cheese", animals.cheese_revenue},
      {"mayo", animals.mayo_revenue},
      {"cloth", animals.cloth_revenue},
      {"truffle_oil", animals.truffle_oil_revenue},
      {"raw_truffles", animals.raw_truffle_revenue},
      {"raw_animal_products", animals.raw_animal_revenue},
      {"aged_wine", aged},
      {"non_aged_wine", base},
      {"jarred_fruit", jelly},
      {"honey", honey_revenue},
      {"dehydrators", dried},
      {"raw_fruit", raw},
  };
}

} // namespace agrisim
