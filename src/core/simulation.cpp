#include "agrisim/core/simulation.h"

#include <algorithm>
#include <set>
#include <stdexcept>

#include "agrisim/util/log.h"

namespace agrisim {
namespace {

std::vector<std::string> product_priority(const SimulationInputs& in) {
  std::vector<std::string> external = in.external_priority;
  for (const auto& [id, _] : in.external_daily_fruit) {
    if (std::find(external.begin(), external.end(), id) == external.end()) external.push_back(id);
  }
  std::vector<std::string> order = crop_priority(in.crops, external);
  for (const auto* inv : {&in.starting_fruit, &in.starting_base_goods}) {
    for (const auto& [id, _] : *inv) {
      if (std::find(order.begin(), order.end(), id) == order.end()) order.push_back(id);
    }
  }
  return order;
}

void check_non_negative(int v, const char* what) {
  if (v < 0) throw std::invalid_argument(std::string(what) + " must be >= 0, got " + std::to_string(v));
}

void check_inventory(const std::map<std::string, int>& inv, const char* what) {
  for (const auto& [id, units] : inv) {
    if (units < 0) {
      throw std::invalid_argument(std::string(what) + " for " + id + " must be >= 0, got " + std::to_string(units));
    }
  }
}

} // namespace

const CropYearResult* YearSimulationResult::find(const std::string& product_id) const {
  for (const auto& p : products) {
    if (p.product_id == product_id) return &p;
  }
  return nullptr;
}

void YearSimulation::check_inputs(const SimulationInputs& in) {
  if (in.days < 1 || in.days > kDaysPerYear) {
    throw std::invalid_argument("days must be in 1.." + std::to_string(kDaysPerYear) + ", got " +
                                std::to_string(in.days));
  }
  check_non_negative(in.kegs, "kegs");
  check_non_negative(in.preserves_jars, "preserves_jars");
  check_non_negative(in.dehydrators, "dehydrators");
  check_non_negative(in.casks, "casks");
  check_non_negative(in.casks_with_walkways, "casks_with_walkways");
  check_inventory(in.starting_fruit, "starting fruit");
  check_inventory(in.starting_base_goods, "starting base goods");

  std::set<std::string> ids;
  for (const auto& c : in.crops) {
    if (c.id.empty()) throw std::invalid_argument("crop id must not be empty");
    if (!ids.insert(c.id).second) throw std::invalid_argument("duplicate crop id: " + c.id);
    if (c.phase_days.empty()) throw std::invalid_argument("crop " + c.id + " has no growth phases");
  }
  for (const auto& [id, series] : in.external_daily_fruit) {
    if (ids.count(id)) throw std::invalid_argument("external product collides with crop id: " + id);
    if (static_cast<int>(series.size()) > kDaysPerYear) {
      throw std::invalid_argument("external fruit series for " + id + " is longer than a year");
    }
    for (int units : series) {
      if (units < 0) throw std::invalid_argument("external fruit for " + id + " must be >= 0");
    }
  }
}

YearSimulation::YearSimulation(SimulationInputs inputs)
    : inputs_((check_inputs(inputs), std::move(inputs))),
      processing_(inputs_.kegs, inputs_.preserves_jars, inputs_.dehydrators, product_priority(inputs_),
                  inputs_.starting_fruit),
      aging_(AgingPolicy{inputs_.casks, inputs_.cask_full_batch_required, inputs_.casks_with_walkways},
             processing_.priority(), inputs_.starting_base_goods) {
  plots_.reserve(inputs_.plots.size());
  for (const auto& plot : inputs_.plots) {
    plots_.emplace_back(plot, inputs_.crops, inputs_.growth, inputs_.fertilizer_cadence);
  }
  trace_.reserve(static_cast<std::size_t>(inputs_.days));
  log::debug("year simulation: " + std::to_string(inputs_.crops.size()) + " crops, " +
             std::to_string(plots_.size()) + " plots, " + std::to_string(inputs_.days) + " days");
}

const DayRecord& YearSimulation::advance_day() {
  if (done()) {
    throw std::out_of_range("year already complete after day " + std::to_string(day_));
  }
  ++day_;

  DayRecord rec;
  rec.day = day_;
  rec.day_of_year = day_of_year(day_, inputs_.start_season);
  rec.season = season_for_day_of_year(rec.day_of_year);

  for (auto& plot : plots_) {
    for (const auto& h : plot.advance_day(rec.season)) {
      processing_.add_fruit(h.crop_id, h.fruit);
      rec.harvested += h.fruit;
    }
  }

  for (const auto& [id, series] : inputs_.external_daily_fruit) {
    const std::size_t idx = static_cast<std::size_t>(day_ - 1);
    const int units = idx < series.size() ? series[idx] : 0;
    if (units <= 0) continue;
    processing_.add_fruit(id, units);
    rec.external_fruit += units;
  }

  const ProcessingDay pd = processing_.process_day();
  rec.fruit_consumed = pd.fruit_consumed;
  rec.aged = aging_.record_day(day_, pd.fermented);

  rec.inventory = processing_.total_inventory();
  rec.kegs_busy = processing_.kegs().busy_units();
  rec.jars_busy = processing_.jars().busy_units();
  rec.dehydrators_busy = processing_.dehydrators().busy_units();

  trace_.push_back(rec);
  return trace_.back();
}

void YearSimulation::advance_days(int n) {
  if (n < 0) throw std::invalid_argument("cannot advance a negative number of days");
  for (int i = 0; i < n; ++i) advance_day();
}

void YearSimulation::run() {
  while (!done()) advance_day();
}

YearSimulationResult YearSimulation::finish() const {
  YearSimulationResult res;
  res.days_simulated = day_;
  res.trace = trace_;
  res.aging = aging_.finalize();
  res.casks_effective = res.aging.effective_vessels;
  res.full_batch_met = res.aging.full_batch_met;
  res.uses_per_cask = res.aging.uses_per_vessel;

  std::set<std::string> external_ids;
  for (const auto& [id, _] : inputs_.external_daily_fruit) external_ids.insert(id);

  res.totals.product_id = "total";
  for (const auto& id : processing_.priority()) {
    const ProductLedger& l = processing_.product(id);

    CropYearResult r;
    r.product_id = id;
    r.external = external_ids.count(id) > 0;
    r.starting_fruit = l.starting;
    r.fruit_harvested = l.harvested;
    r.fruit_consumed = l.consumed;
    r.fruit_unprocessed = l.inventory;
    r.base_goods_produced = l.fermented;
    auto sb = inputs_.starting_base_goods.find(id);
    r.starting_base_goods = sb == inputs_.starting_base_goods.end() ? 0 : sb->second;
    r.base_goods_aged = res.aging.aged_for(id);
    r.base_goods_sold = res.aging.unaged_for(id);
    r.goods_fermenting = processing_.kegs().in_progress(id);
    r.preserves_produced = l.preserved;
    r.preserves_in_jars = processing_.jars().in_progress(id);
    r.dried_produced = l.dried;
    r.dried_in_dehydrators = processing_.dehydrators().in_progress(id);

    for (const auto& plot : plots_) {
      if (const CropRuntimeState* st = plot.state_for(id)) {
        r.harvests += st->harvests;
        r.seed_units += st->seed_units_used;
        r.fertilizer_units += st->fertilizer_units_used;
      }
    }

    CropYearResult& t = res.totals;
    t.starting_fruit += r.starting_fruit;
    t.fruit_harvested += r.fruit_harvested;
    t.fruit_consumed += r.fruit_consumed;
    t.fruit_unprocessed += r.fruit_unprocessed;
    t.harvests += r.harvests;
    t.base_goods_produced += r.base_goods_produced;
    t.starting_base_goods += r.starting_base_goods;
    t.base_goods_aged += r.base_goods_aged;
    t.base_goods_sold += r.base_goods_sold;
    t.goods_fermenting += r.goods_fermenting;
    t.preserves_produced += r.preserves_produced;
    t.preserves_in_jars += r.preserves_in_jars;
    t.dried_produced += r.dried_produced;
    t.dried_in_dehydrators += r.dried_in_dehydrators;
    t.seed_units += r.seed_units;
    t.fertilizer_units += r.fertilizer_units;

    res.products.push_back(std::move(r));
  }

  res.kegs_sufficient = res.totals.fruit_unprocessed == 0 && res.totals.goods_fermenting == 0;
  return res;
}

YearSimulationResult simulate_year(SimulationInputs inputs) {
  YearSimulation sim(std::move(inputs));
  sim.run();
  return sim.finish();
}

} // namespace agrisim
