#pragma once

#include <map>
#include <memory>
#include <string>
#include <vector>

#include "agrisim/core/aging.h"
#include "agrisim/core/calendar.h"
#include "agrisim/core/crops.h"
#include "agrisim/core/growth.h"
#include "agrisim/core/plot_simulator.h"
#include "agrisim/core/processing.h"

namespace agrisim {

struct SimulationInputs {
  std::vector<Crop> crops;
  std::vector<Plot> plots;

  GrowthModifiers growth;
  FertilizerCadence fertilizer_cadence{FertilizerCadence::PerSeason};
  Season start_season{Season::Spring};
  int days{kDaysPerYear};

  int kegs{0};
  int preserves_jars{0};
  int dehydrators{0};

  int casks{0};
  bool cask_full_batch_required{false};
  int casks_with_walkways{0};

  std::map<std::string, int> starting_fruit;
  std::map<std::string, int> starting_base_goods;

  // Fruit that arrives every day from outside the plots (fruit trees).
  // Index 0 is day 1; missing days contribute nothing.
  std::map<std::string, std::vector<int>> external_daily_fruit;
  // Processing order for external products, after the crops.
  std::vector<std::string> external_priority;
};

// Year totals for one product (a crop or an external fruit).
struct CropYearResult {
  std::string product_id;
  bool external{false};

  int starting_fruit{0};
  int fruit_harvested{0};
  int fruit_consumed{0};
  int fruit_unprocessed{0};
  int harvests{0};

  int base_goods_produced{0};
  int starting_base_goods{0};
  int base_goods_aged{0};
  int base_goods_sold{0};
  int goods_fermenting{0};

  int preserves_produced{0};
  int preserves_in_jars{0};

  int dried_produced{0};
  int dried_in_dehydrators{0};

  int seed_units{0};
  int fertilizer_units{0};

  bool fully_processed() const { return fruit_unprocessed == 0; }
};

// One simulated day, for tracing and charts.
struct DayRecord {
  int day{0};
  int day_of_year{0};
  Season season{Season::Spring};
  int harvested{0};
  int external_fruit{0};
  int fruit_consumed{0};
  int inventory{0};
  int kegs_busy{0};
  int jars_busy{0};
  int dehydrators_busy{0};
  int aged{0};
};

struct YearSimulationResult {
  int days_simulated{0};
  std::vector<CropYearResult> products;
  CropYearResult totals;

  AgingOutcome aging;
  int casks_effective{0};
  bool full_batch_met{true};
  double uses_per_cask{0.0};
  bool kegs_sufficient{true};

  std::vector<DayRecord> trace;

  const CropYearResult* find(const std::string& product_id) const;
};

// Caller-owned state for one simulated year. Days are advanced strictly in
// order: plot growth and harvest, external fruit, processing, then aging on
// trigger days.
class YearSimulation {
 public:
  // Throws std::invalid_argument when the inputs violate a precondition.
  explicit YearSimulation(SimulationInputs inputs);

  // Simulates the next day. Throws std::out_of_range once the year is over.
  const DayRecord& advance_day();
  void advance_days(int n);
  // Simulates all remaining days.
  void run();
  bool done() const { return day_ >= inputs_.days; }
  int current_day() const { return day_; }

  // Summarizes the days simulated so far.
  YearSimulationResult finish() const;

  const SimulationInputs& inputs() const { return inputs_; }
  const ProcessingAllocator& processing() const { return processing_; }
  const AgingBatcher& aging() const { return aging_; }
  const std::vector<PlotSimulator>& plots() const { return plots_; }
  const std::vector<DayRecord>& trace() const { return trace_; }

 private:
  static void check_inputs(const SimulationInputs& in);

  SimulationInputs inputs_;
  std::vector<PlotSimulator> plots_;
  ProcessingAllocator processing_;
  AgingBatcher aging_;
  std::vector<DayRecord> trace_;
  int day_{0};
};

YearSimulationResult simulate_year(SimulationInputs inputs);

} // namespace agrisim
