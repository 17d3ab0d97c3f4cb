#include <iostream>
#include <vector>

#include "agrisim/core/economy.h"

#define AGRISIM_ASSERT(expr) \
  do { \
    if (!(expr)) { \
      std::cerr << "ASSERT failed: " #expr " (" << __FILE__ << ":" << __LINE__ << ")\n"; \
      return 1; \
    } \
  } while (0)

namespace {

bool near(int value, int expected) { return value >= expected - 1 && value <= expected + 1; }

} // namespace

int test_economy() {
  using namespace agrisim;

  EconomyConfig eco;
  eco.fruit_price = {{"starfruit", 750}, {"apple", 100}};
  eco.wine_price = {{"starfruit", 2250}};
  eco.seed_cost = {{"starfruit", 400}};
  eco.fertilizer_cost = {{Fertilizer::DeluxeSpeedGro, 70}};

  AGRISIM_ASSERT(wine_price_for("starfruit", eco) == 2250);
  // Without an explicit wine price, wine sells for three times the fruit.
  AGRISIM_ASSERT(wine_price_for("apple", eco) == 300);
  AGRISIM_ASSERT(fruit_price_for("durian", eco) == 0);

  {
    const UnitPrices u = unit_prices("starfruit", eco);
    AGRISIM_ASSERT(u.raw == 750);
    AGRISIM_ASSERT(u.wine == 2250);
    AGRISIM_ASSERT(u.jelly == 1550);
    AGRISIM_ASSERT(u.dried_batch == 5650);
  }
  {
    EconomyConfig pro = eco;
    pro.artisan = true;
    pro.tiller = true;
    const UnitPrices u = unit_prices("starfruit", pro);
    AGRISIM_ASSERT(near(u.raw, 825));
    AGRISIM_ASSERT(near(u.wine, 3150));
    AGRISIM_ASSERT(near(u.jelly, 2170));
    AGRISIM_ASSERT(near(u.dried_batch, 7910));
  }

  {
    const auto v = per_fruit_processing_values(100, 300, eco);
    AGRISIM_ASSERT(v.at("raw") == 100);
    AGRISIM_ASSERT(v.at("wine") == 300);
    AGRISIM_ASSERT(v.at("jelly") == 250);
    AGRISIM_ASSERT(v.at("dried") == 155);
  }

  // Crop profit.
  {
    CropYearResult r;
    r.product_id = "starfruit";
    r.base_goods_sold = 10;
    r.base_goods_aged = 4;
    r.fruit_unprocessed = 3;
    r.preserves_produced = 2;
    r.dried_produced = 1;
    r.seed_units = 6;
    r.fertilizer_units = 6;

    const ProfitSummary s = compute_profit({r}, eco, Fertilizer::DeluxeSpeedGro);
    const ProfitBreakdown* b = s.find("starfruit");
    AGRISIM_ASSERT(b != nullptr);
    AGRISIM_ASSERT(b->base_wine_revenue == 22500);
    AGRISIM_ASSERT(b->aged_wine_revenue == 18000);
    AGRISIM_ASSERT(b->fruit_revenue == 2250);
    AGRISIM_ASSERT(b->jelly_revenue == 3100);
    AGRISIM_ASSERT(b->dried_fruit_revenue == 5650);
    AGRISIM_ASSERT(b->seed_cost == 2400);
    AGRISIM_ASSERT(b->fertilizer_cost == 420);
    AGRISIM_ASSERT(s.total_revenue == 51500);
    AGRISIM_ASSERT(s.total_profit == 51500 - 2400 - 420);
    AGRISIM_ASSERT(s.find("ancient") == nullptr);

    // Fertilizer with no configured cost is free.
    const ProfitSummary free = compute_profit({r}, eco, Fertilizer::SpeedGro);
    AGRISIM_ASSERT(free.total_fertilizer_cost == 0);
  }

  // Animal profit.
  {
    AnimalYearResult a;
    a.eggs = 5;
    a.mayo = 3;
    a.raw_truffles = 2;
    a.rabbit_feet = 1;

    const AnimalProfit p = compute_animal_profit(a, eco);
    AGRISIM_ASSERT(p.mayo_revenue == 3 * prices::kMayo);
    AGRISIM_ASSERT(p.raw_truffle_revenue == 2 * prices::kTruffle);
    AGRISIM_ASSERT(p.raw_animal_revenue == 2 * prices::kEgg + prices::kRabbitFoot);

    const AnimalProfit botanist = compute_animal_profit(a, eco, true, true);
    AGRISIM_ASSERT(botanist.raw_truffle_revenue == 2 * prices::kTruffleIridium);
    AGRISIM_ASSERT(near(botanist.raw_animal_revenue, 798));

    EconomyConfig artisan = eco;
    artisan.artisan = true;
    AGRISIM_ASSERT(near(compute_animal_profit(a, artisan).mayo_revenue, 798));
  }

  // Category totals cover every revenue stream.
  {
    ProfitSummary crops;
    ProfitBreakdown b;
    b.aged_wine_revenue = 10;
    b.base_wine_revenue = 20;
    b.fruit_revenue = 5;
    crops.per_product.push_back(b);
    AnimalProfit animals;
    animals.cheese_revenue = 7;

    const auto cats = build_category_totals(crops, animals, 40);
    AGRISIM_ASSERT(cats.size() == 12);
    AGRISIM_ASSERT(cats.at("aged_wine") == 10);
    AGRISIM_ASSERT(cats.at("non_aged_wine") == 20);
    AGRISIM_ASSERT(cats.at("raw_fruit") == 5);
    AGRISIM_ASSERT(cats.at("cheese") == 7);
    AGRISIM_ASSERT(cats.at("honey") == 40);
  }

  return 0;
}
