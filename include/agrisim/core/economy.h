#pragma once

#include <map>
#include <optional>
#include <string>
#include <vector>

#include "agrisim/core/animals.h"
#include "agrisim/core/bees.h"
#include "agrisim/core/growth.h"
#include "agrisim/core/simulation.h"

namespace agrisim {

// Sell prices of animal products (base quality).
namespace prices {
inline constexpr int kEgg = 50;
inline constexpr int kLargeEgg = 95;
inline constexpr int kDuckEgg = 95;
inline constexpr int kVoidEgg = 65;
inline constexpr int kMilk = 125;
inline constexpr int kLargeMilk = 190;
inline constexpr int kGoatMilk = 225;
inline constexpr int kLargeGoatMilk = 345;
inline constexpr int kWool = 340;
inline constexpr int kRabbitFoot = 565;

inline constexpr int kMayo = 190;
inline constexpr int kGoldMayo = 285;
inline constexpr int kDuckMayo = 375;
inline constexpr int kVoidMayo = 275;
inline constexpr int kCheese = 230;
inline constexpr int kGoldCheese = 345;
inline constexpr int kGoatCheese = 400;
inline constexpr int kGoldGoatCheese = 600;
inline constexpr int kCloth = 470;

inline constexpr int kTruffle = 625;
inline constexpr int kTruffleIridium = 1250;
inline constexpr int kTruffleOil = 1065;
} // namespace prices

inline constexpr double kArtisanMultiplier = 1.4;
inline constexpr double kTillerMultiplier = 1.1;
inline constexpr double kRancherMultiplier = 1.2;

struct EconomyConfig {
  // Prices keyed by product id (crops and fruit tree fruit).
  std::map<std::string, int> wine_price;
  std::map<std::string, int> fruit_price;
  std::map<std::string, int> seed_cost;
  std::map<Fertilizer, int> fertilizer_cost;

  double aged_wine_multiplier{2.0};
  double wine_quality_multiplier{1.0};
  double fruit_quality_multiplier{1.0};

  bool artisan{false};
  bool tiller{false};

  bool cask_full_batch_required{false};
  // Casks still usable when a full batch is not possible.
  std::optional<int> casks_with_walkways;
};

// Wine price for a product; falls back to 3x the fruit price.
int wine_price_for(const std::string& product_id, const EconomyConfig& eco);
int fruit_price_for(const std::string& product_id, const EconomyConfig& eco);

// Unit sale values of each way a product can be sold.
struct UnitPrices {
  int raw{0};
  int wine{0};
  int jelly{0};
  // Per dehydrator batch (5 fruit).
  int dried_batch{0};
};

UnitPrices unit_prices(const std::string& product_id, const EconomyConfig& eco);

// Per-fruit value of raw sale, wine, jelly and dried fruit. Used to rank uses.
std::map<std::string, int> per_fruit_processing_values(int fruit_price, int wine_price, const EconomyConfig& eco);

struct ProfitBreakdown {
  std::string product_id;
  int base_wine_revenue{0};
  int aged_wine_revenue{0};
  int jelly_revenue{0};
  int dried_fruit_revenue{0};
  int fruit_revenue{0};
  int seed_cost{0};
  int fertilizer_cost{0};

  int revenue() const {
    return base_wine_revenue + aged_wine_revenue + jelly_revenue + dried_fruit_revenue + fruit_revenue;
  }
  int net_profit() const { return revenue() - seed_cost - fertilizer_cost; }
};

struct ProfitSummary {
  std::vector<ProfitBreakdown> per_product;
  int total_revenue{0};
  int total_seed_cost{0};
  int total_fertilizer_cost{0};
  int total_profit{0};

  const ProfitBreakdown* find(const std::string& product_id) const;
};

ProfitSummary compute_profit(const std::vector<CropYearResult>& products, const EconomyConfig& eco,
                             Fertilizer fertilizer);

struct AnimalProfit {
  int cheese_revenue{0};
  int mayo_revenue{0};
  int cloth_revenue{0};
  int truffle_oil_revenue{0};
  int raw_truffle_revenue{0};
  int raw_animal_revenue{0};

  int total_revenue() const {
    return cheese_revenue + mayo_revenue + cloth_revenue + truffle_oil_revenue + raw_truffle_revenue +
           raw_animal_revenue;
  }
};

// Artisan applies to cheese, mayo, cloth and truffle oil; rancher to raw
// animal products; botanist makes raw truffles iridium quality.
AnimalProfit compute_animal_profit(const AnimalYearResult& r, const EconomyConfig& eco, bool botanist = false,
                                   bool rancher = false);

// Honey sells for 100 + 2x the flower price.
int honey_price(int flower_price, bool artisan);
int compute_honey_revenue(const BeeYearResult& r, const EconomyConfig& eco, int flower_base_price);

// Revenue grouped by category, keyed by stable names (cheese, mayo, cloth,
// truffle_oil, raw_truffles, raw_animal_products, aged_wine, non_aged_wine,
// jarred_fruit, honey, dehydrators, raw_fruit).
std::map<std::string, int> build_category_totals(const ProfitSummary& crops, const AnimalProfit& animals,
                                                 int honey_revenue);

} // namespace agrisim
