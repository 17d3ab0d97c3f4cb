#pragma once

#include <map>
#include <string>
#include <vector>

namespace agrisim {

enum class ProcessorKind {
  Fermentation, // kegs -> base goods (wine)
  Preserving,   // preserves jars -> jelly
  Drying,       // dehydrators -> dried fruit
};

const char* processor_kind_name(ProcessorKind k);

inline constexpr int kKegDays = 7;
inline constexpr int kPreservesJarDays = 3;
inline constexpr int kDehydratorDays = 1;
inline constexpr int kDehydratorInput = 5;

// A finite set of identical units that each turn `input_per_cycle` fruit of a
// single product into one goods unit after `duration_days`.
class TimedProcessorPool {
 public:
  // Throws std::invalid_argument for units < 0, duration < 1 or input < 1.
  TimedProcessorPool(ProcessorKind kind, int units, int duration_days, int input_per_cycle = 1);

  static TimedProcessorPool kegs(int units) { return {ProcessorKind::Fermentation, units, kKegDays}; }
  static TimedProcessorPool preserves_jars(int units) { return {ProcessorKind::Preserving, units, kPreservesJarDays}; }
  static TimedProcessorPool dehydrators(int units) {
    return {ProcessorKind::Drying, units, kDehydratorDays, kDehydratorInput};
  }

  // Advances every busy unit by one day. Units that reach zero are freed and
  // their products returned (one entry per finished unit).
  std::vector<std::string> tick();

  // Loads free units (lowest index first). Each unit takes the highest
  // priority product with at least `input_per_cycle` units in `inventory`.
  // Returns the number of cycles started per product.
  std::map<std::string, int> fill(std::map<std::string, int>& inventory, const std::vector<std::string>& priority);

  ProcessorKind kind() const { return kind_; }
  int units() const { return static_cast<int>(slots_.size()); }
  int duration_days() const { return duration_days_; }
  int input_per_cycle() const { return input_per_cycle_; }
  int busy_units() const;
  int free_units() const { return units() - busy_units(); }

  // Goods currently being made, per product.
  std::map<std::string, int> in_progress() const;
  int in_progress(const std::string& product) const;

 private:
  struct Slot {
    int remaining{0};
    std::string product;
  };

  ProcessorKind kind_;
  int duration_days_{1};
  int input_per_cycle_{1};
  std::vector<Slot> slots_;
};

// Fruit bookkeeping for one product. starting + harvested == consumed + inventory.
struct ProductLedger {
  int starting{0};
  int harvested{0};
  int inventory{0};
  int consumed{0};

  int fermented{0};
  int preserved{0};
  int dried{0};
};

// What the three pools completed on one day.
struct ProcessingDay {
  std::map<std::string, int> fermented;
  std::map<std::string, int> preserved;
  std::map<std::string, int> dried;
  int fruit_consumed{0};
};

// Routes unprocessed fruit into kegs, then preserves jars, then dehydrators.
class ProcessingAllocator {
 public:
  ProcessingAllocator(int kegs, int preserves_jars, int dehydrators, std::vector<std::string> priority,
                      const std::map<std::string, int>& starting_fruit = {});

  // Adds harvested fruit. Products not in the priority list are appended to it.
  void add_fruit(const std::string& product, int units);

  // Ticks all pools, then fills kegs, jars and dehydrators in that order.
  ProcessingDay process_day();

  const std::vector<std::string>& priority() const { return priority_; }
  const std::map<std::string, ProductLedger>& ledger() const { return ledger_; }
  // Throws std::out_of_range for unknown products.
  const ProductLedger& product(const std::string& id) const;

  int inventory(const std::string& product) const;
  int total_inventory() const;

  const TimedProcessorPool& pool(ProcessorKind kind) const;
  const TimedProcessorPool& kegs() const { return kegs_; }
  const TimedProcessorPool& jars() const { return jars_; }
  const TimedProcessorPool& dehydrators() const { return dehydrators_; }

 private:
  ProductLedger& entry(const std::string& product);
  void take_inputs(TimedProcessorPool& pool, ProcessingDay& day);

  std::vector<std::string> priority_;
  std::map<std::string, ProductLedger> ledger_;
  std::map<std::string, int> inventory_;

  TimedProcessorPool kegs_;
  TimedProcessorPool jars_;
  TimedProcessorPool dehydrators_;
};

} // namespace agrisim
