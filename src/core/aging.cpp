#include "agrisim/core/aging.h"

#include <algorithm>
#include <stdexcept>

namespace agrisim {

int AgingOutcome::aged_for(const std::string& product) const {
  auto it = aged.find(product);
  return it == aged.end() ? 0 : it->second;
}

int AgingOutcome::unaged_for(const std::string& product) const {
  auto it = unaged.find(product);
  return it == unaged.end() ? 0 : it->second;
}

AgingBatcher::AgingBatcher(AgingPolicy policy, std::vector<std::string> priority,
                           const std::map<std::string, int>& starting_goods)
    : policy_(policy), priority_(std::move(priority)), starting_(starting_goods) {
  if (policy_.vessels < 0) throw std::invalid_argument("casks must be >= 0");
  if (policy_.fallback_vessels < 0) throw std::invalid_argument("casks_with_walkways must be >= 0");
  for (const auto& [id, units] : starting_) {
    if (units < 0) {
      throw std::invalid_argument("starting base goods for " + id + " must be >= 0, got " + std::to_string(units));
    }
    if (std::find(priority_.begin(), priority_.end(), id) == priority_.end()) priority_.push_back(id);
  }
  provisional_inventory_ = starting_;
}

bool AgingBatcher::is_trigger_day(int day) {
  return std::find(kAgingTriggerDays.begin(), kAgingTriggerDays.end(), day) != kAgingTriggerDays.end();
}

int AgingBatcher::fill_vessels(std::map<std::string, int>& inventory, std::map<std::string, int>& aged, int vessels,
                               const std::vector<std::string>& priority) {
  int remaining = vessels;
  for (const auto& id : priority) {
    if (remaining <= 0) break;
    auto it = inventory.find(id);
    if (it == inventory.end() || it->second <= 0) continue;
    const int take = std::min(remaining, it->second);
    it->second -= take;
    aged[id] += take;
    remaining -= take;
  }
  return vessels - remaining;
}

int AgingBatcher::record_day(int day, const std::map<std::string, int>& completed) {
  if (day <= last_day_) {
    throw std::invalid_argument("aging days must be recorded in increasing order (got day " + std::to_string(day) +
                                " after day " + std::to_string(last_day_) + ")");
  }
  last_day_ = day;
  days_.emplace_back(day, completed);

  for (const auto& [id, units] : completed) {
    if (std::find(priority_.begin(), priority_.end(), id) == priority_.end()) priority_.push_back(id);
    provisional_inventory_[id] += units;
  }
  if (!is_trigger_day(day)) return 0;
  return fill_vessels(provisional_inventory_, provisional_aged_, policy_.vessels, priority_);
}

int AgingBatcher::provisional_inventory() const {
  int total = 0;
  for (const auto& [_, units] : provisional_inventory_) total += units;
  return total;
}

AgingBatcher::ScheduleRun AgingBatcher::run_schedule(int vessels) const {
  ScheduleRun run;
  run.inventory = starting_;
  for (const auto& [day, completed] : days_) {
    for (const auto& [id, units] : completed) run.inventory[id] += units;
    for (std::size_t t = 0; t < kAgingTriggerDays.size(); ++t) {
      if (kAgingTriggerDays[t] == day) run.filled[t] = fill_vessels(run.inventory, run.aged, vessels, priority_);
    }
  }
  return run;
}

AgingOutcome AgingBatcher::finalize() const {
  AgingOutcome out;
  out.vessels = policy_.vessels;
  out.effective_vessels = policy_.vessels;

  ScheduleRun run = run_schedule(policy_.vessels);
  if (policy_.full_batch_required && policy_.vessels > 0) {
    // A trigger day past the end of a shortened run is not a shortfall.
    for (std::size_t t = 0; t < kAgingTriggerDays.size(); ++t) {
      if (kAgingTriggerDays[t] <= last_day_ && run.filled[t] < policy_.vessels) out.full_batch_met = false;
    }
    if (!out.full_batch_met) {
      out.effective_vessels = std::min(policy_.vessels, policy_.fallback_vessels);
      run = run_schedule(out.effective_vessels);
    }
  }

  out.filled = run.filled;
  out.aged = std::move(run.aged);
  out.unaged = std::move(run.inventory);
  for (const auto& [_, units] : out.aged) out.total_aged += units;
  if (out.effective_vessels > 0) {
    out.uses_per_vessel = std::min(kMaxUsesPerVessel, static_cast<double>(out.total_aged) / out.effective_vessels);
  }
  return out;
}

} // namespace agrisim
