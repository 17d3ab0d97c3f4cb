#pragma once

#include <map>
#include <string>
#include <vector>

#include "agrisim/core/animals.h"
#include "agrisim/core/bees.h"
#include "agrisim/core/config.h"
#include "agrisim/core/economy.h"
#include "agrisim/core/simulation.h"
#include "agrisim/util/json.h"

namespace agrisim {

// Best and second-best way to sell one fruit tree's fruit at current prices.
struct FruitUseAdvice {
  std::string fruit_id;
  int trees{0};
  std::string best;
  int best_value{0};
  std::string next;
  int next_value{0};
  int raw_value{0};
};

// Everything computed for one configured year.
struct YearReport {
  YearSimulationResult production;
  ProfitSummary crop_profit;

  AnimalYearResult animals;
  AnimalProfit animal_profit;

  BeeYearResult bees;
  int honey_revenue{0};

  std::vector<FruitUseAdvice> fruit_advice;
  std::map<std::string, int> category_totals;

  int total_revenue{0};
  int total_profit{0};

  std::vector<std::string> quick_wins;
};

// Runs the production simulation and every independent stream for `cfg`.
// The config is expected to have passed validate_app_config().
YearReport build_year_report(const AppConfig& cfg);

std::vector<FruitUseAdvice> fruit_use_advice(const AppConfig& cfg);

std::string format_text_report(const AppConfig& cfg, const YearReport& report);

// Machine-readable report. The daily trace is included when `include_trace`.
json::Value report_to_json(const AppConfig& cfg, const YearReport& report, bool include_trace = true);

} // namespace agrisim
