#include <iostream>
#include <string>

#include "agrisim/core/config.h"
#include "agrisim/core/report.h"
#include "agrisim/util/json.h"

#define AGRISIM_ASSERT(expr) \
  do { \
    if (!(expr)) { \
      std::cerr << "ASSERT failed: " #expr " (" << __FILE__ << ":" << __LINE__ << ")\n"; \
      return 1; \
    } \
  } while (0)

int test_report() {
  using namespace agrisim;

  const AppConfig cfg = load_app_config_from_file("data/configs/example.json");
  const YearReport r = build_year_report(cfg);

  // Revenue streams add up.
  {
    AGRISIM_ASSERT(r.production.days_simulated == 112);
    const int other = r.animal_profit.total_revenue() + r.honey_revenue;
    AGRISIM_ASSERT(r.total_revenue == r.crop_profit.total_revenue + other);
    AGRISIM_ASSERT(r.total_profit == r.crop_profit.total_profit + other);

    int categories = 0;
    for (const auto& [_, v] : r.category_totals) categories += v;
    AGRISIM_ASSERT(categories == r.total_revenue);

    AGRISIM_ASSERT(r.bees.honey_total == 10 * 7 * 3);
    AGRISIM_ASSERT(r.animals.truffles > 0);
    AGRISIM_ASSERT(r.production.uses_per_cask <= 2.0);
  }

  // Fruit trees show up as external products with their own advice.
  {
    const CropYearResult* peach = r.production.find("peach");
    AGRISIM_ASSERT(peach != nullptr);
    AGRISIM_ASSERT(peach->external);
    AGRISIM_ASSERT(peach->fruit_harvested == 4 * 112);
    AGRISIM_ASSERT(r.fruit_advice.size() == 5);
    for (const auto& a : r.fruit_advice) {
      AGRISIM_ASSERT(a.best_value >= a.next_value);
      AGRISIM_ASSERT(a.best != a.next);
    }
  }

  // Text report.
  {
    const std::string text = format_text_report(cfg, r);
    AGRISIM_ASSERT(text.find("TOTAL PROFIT (year): " + std::to_string(r.total_profit)) != std::string::npos);
    AGRISIM_ASSERT(text.find("cask uses per cask (max 2.00): ") != std::string::npos);
    AGRISIM_ASSERT(text.find("kegs sufficient for full conversion: ") != std::string::npos);
    AGRISIM_ASSERT(text.find("fertilizer cadence: per_season") != std::string::npos);
  }

  // JSON report.
  {
    const json::Value doc = json::parse(json::stringify(report_to_json(cfg, r, true)));
    AGRISIM_ASSERT(doc.at("days").int_value() == 112);
    AGRISIM_ASSERT(doc.at("crop").string_value() == "both");
    AGRISIM_ASSERT(doc.at("products").array().size() == r.production.products.size());
    AGRISIM_ASSERT(doc.at("totals").at("profit").int_value() == r.total_profit);
    AGRISIM_ASSERT(doc.at("aging").at("filled").array().size() == 2);
    AGRISIM_ASSERT(doc.at("trace").array().size() == 112);
    AGRISIM_ASSERT(doc.at("trace").array()[0].at("season").string_value() == "spring");

    const json::Value slim = report_to_json(cfg, r, false);
    AGRISIM_ASSERT(json::find(slim.object(), "trace") == nullptr);
  }

  // A farm without kegs backs up and says so.
  {
    AppConfig bare;
    bare.tiles = 10;
    const YearReport br = build_year_report(bare);
    AGRISIM_ASSERT(!br.production.kegs_sufficient);
    AGRISIM_ASSERT(br.production.totals.fruit_unprocessed > 0);
    bool tip = false;
    for (const auto& t : br.quick_wins) {
      if (t.find("Kegs are a bottleneck") != std::string::npos) tip = true;
    }
    AGRISIM_ASSERT(tip);
    AGRISIM_ASSERT(format_text_report(bare, br).find("kegs sufficient for full conversion: false") !=
                   std::string::npos);
  }

  return 0;
}
