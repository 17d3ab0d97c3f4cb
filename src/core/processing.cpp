#include "agrisim/core/processing.h"

#include <algorithm>
#include <stdexcept>

namespace agrisim {

const char* processor_kind_name(ProcessorKind k) {
  switch (k) {
    case ProcessorKind::Fermentation: return "kegs";
    case ProcessorKind::Preserving: return "preserves_jars";
    case ProcessorKind::Drying: return "dehydrators";
  }
  return "unknown";
}

TimedProcessorPool::TimedProcessorPool(ProcessorKind kind, int units, int duration_days, int input_per_cycle)
    : kind_(kind), duration_days_(duration_days), input_per_cycle_(input_per_cycle) {
  if (units < 0) {
    throw std::invalid_argument(std::string(processor_kind_name(kind)) + ": unit count must be >= 0, got " +
                                std::to_string(units));
  }
  if (duration_days < 1) throw std::invalid_argument("processor duration must be >= 1 day");
  if (input_per_cycle < 1) throw std::invalid_argument("processor input per cycle must be >= 1");
  slots_.resize(static_cast<std::size_t>(units));
}

// Advances every busy unit by one day and frees the ones that finish.
std::vector<std::string> TimedProcessorPool::tick() {
  std::vector<std::string> done;
  for (auto& s : slots_) {
    if (s.remaining <= 0) continue;
    if (--s.remaining == 0) {
      done.push_back(s.product);
      s.product.clear();
    }
  }
  return done;
}

std::map<std::string, int> TimedProcessorPool::fill(std::map<std::string, int>& inventory,
                                                    const std::vector<std::string>& priority) {
  std::map<std::string, int> started;
  for (auto& s : slots_) {
    if (s.remaining > 0) continue;

    const std::string* pick = nullptr;
    for (const auto& id : priority) {
      auto it = inventory.find(id);
      if (it != inventory.end() && it->second >= input_per_cycle_) {
        pick = &id;
        break;
      }
    }
    // Nothing left that fits a cycle; later units would find nothing either.
    if (!pick) break;

    inventory[*pick] -= input_per_cycle_;
    s.product = *pick;
    s.remaining = duration_days_;
    started[*pick] += 1;
  }
  return started;
}

int TimedProcessorPool::busy_units() const {
  return static_cast<int>(std::count_if(slots_.begin(), slots_.end(), [](const Slot& s) { return s.remaining > 0; }));
}

std::map<std::string, int> TimedProcessorPool::in_progress() const {
  std::map<std::string, int> out;
  for (const auto& s : slots_) {
    if (s.remaining > 0) out[s.product] += 1;
  }
  return out;
}

int TimedProcessorPool::in_progress(const std::string& product) const {
  return static_cast<int>(std::count_if(slots_.begin(), slots_.end(), [&](const Slot& s) {
    return s.remaining > 0 && s.product == product;
  }));
}

ProcessingAllocator::ProcessingAllocator(int kegs, int preserves_jars, int dehydrators,
                                         std::vector<std::string> priority,
                                         const std::map<std::string, int>& starting_fruit)
    : priority_(std::move(priority)),
      kegs_(TimedProcessorPool::kegs(kegs)),
      jars_(TimedProcessorPool::preserves_jars(preserves_jars)),
      dehydrators_(TimedProcessorPool::dehydrators(dehydrators)) {
  for (const auto& id : priority_) entry(id);
  for (const auto& [id, units] : starting_fruit) {
    if (units < 0) {
      throw std::invalid_argument("starting fruit for " + id + " must be >= 0, got " + std::to_string(units));
    }
    ProductLedger& l = entry(id);
    l.starting += units;
    l.inventory += units;
    inventory_[id] += units;
  }
}

ProductLedger& ProcessingAllocator::entry(const std::string& product) {
  auto it = ledger_.find(product);
  if (it != ledger_.end()) return it->second;
  if (std::find(priority_.begin(), priority_.end(), product) == priority_.end()) priority_.push_back(product);
  return ledger_[product];
}

void ProcessingAllocator::add_fruit(const std::string& product, int units) {
  if (units < 0) throw std::invalid_argument("cannot add negative fruit for " + product);
  ProductLedger& l = entry(product);
  l.harvested += units;
  l.inventory += units;
  inventory_[product] += units;
}

void ProcessingAllocator::take_inputs(TimedProcessorPool& pool, ProcessingDay& day) {
  const auto started = pool.fill(inventory_, priority_);
  for (const auto& [id, cycles] : started) {
    const int fruit = cycles * pool.input_per_cycle();
    ProductLedger& l = ledger_[id];
    l.inventory -= fruit;
    l.consumed += fruit;
    day.fruit_consumed += fruit;
  }
}

ProcessingDay ProcessingAllocator::process_day() {
  ProcessingDay day;

  // Collect finished goods before refilling so a unit freed today takes new
  // fruit the same day.
  for (const auto& id : kegs_.tick()) {
    ledger_[id].fermented += 1;
    day.fermented[id] += 1;
  }
  for (const auto& id : jars_.tick()) {
    ledger_[id].preserved += 1;
    day.preserved[id] += 1;
  }
  for (const auto& id : dehydrators_.tick()) {
    ledger_[id].dried += 1;
    day.dried[id] += 1;
  }

  // Kegs get first pick of the fruit, then jars, then dehydrators.
  take_inputs(kegs_, day);
  take_inputs(jars_, day);
  take_inputs(dehydrators_, day);
  return day;
}

const ProductLedger& ProcessingAllocator::product(const std::string& id) const {
  auto it = ledger_.find(id);
  if (it == ledger_.end()) throw std::out_of_range("unknown product: " + id);
  return it->second;
}

int ProcessingAllocator::inventory(const std::string& product) const {
  auto it = inventory_.find(product);
  return it == inventory_.end() ? 0 : it->second;
}

int ProcessingAllocator::total_inventory() const {
  int total = 0;
  for (const auto& [_, units] : inventory_) total += units;
  return total;
}

const TimedProcessorPool& ProcessingAllocator::pool(ProcessorKind kind) const {
  switch (kind) {
    case ProcessorKind::Fermentation: return kegs_;
    case ProcessorKind::Preserving: return jars_;
    case ProcessorKind::Drying: return dehydrators_;
  }
  return kegs_;
}

} // namespace agrisim
