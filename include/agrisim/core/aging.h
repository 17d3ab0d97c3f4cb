#pragma once

#include <array>
#include <map>
#include <string>
#include <vector>

namespace agrisim {

// Absolute days on which casks are filled: the first day of the year and the
// first day of its second half.
inline constexpr std::array<int, 2> kAgingTriggerDays{1, 57};
inline constexpr double kMaxUsesPerVessel = 2.0;

struct AgingPolicy {
  int vessels{0};
  // Only age when every vessel can be filled on each trigger day.
  bool full_batch_required{false};
  // Vessels usable when a full batch is not possible (casks reachable with
  // walkways). 0 means none.
  int fallback_vessels{0};
};

struct AgingOutcome {
  int vessels{0};
  int effective_vessels{0};
  // With the full-batch policy: whether the full vessel count was filled on
  // every trigger day the run reached. Always true without the policy.
  bool full_batch_met{true};
  std::array<int, 2> filled{0, 0};

  std::map<std::string, int> aged;
  // Base goods that were never aged and are sold as-is.
  std::map<std::string, int> unaged;
  int total_aged{0};
  double uses_per_vessel{0.0};

  int aged_for(const std::string& product) const;
  int unaged_for(const std::string& product) const;
};

// Collects the base goods completed each day and fills vessels on trigger
// days. The final outcome is only known once the whole schedule has been
// seen: with the full-batch policy a shortfall on either trigger day moves
// both days to the fallback count.
class AgingBatcher {
 public:
  // Throws std::invalid_argument for negative counts or starting goods.
  AgingBatcher(AgingPolicy policy, std::vector<std::string> priority,
               const std::map<std::string, int>& starting_goods = {});

  static bool is_trigger_day(int day);

  // Adds the base goods completed on `day`. On trigger days vessels are
  // filled at the full count; returns the units aged today under that
  // provisional schedule.
  int record_day(int day, const std::map<std::string, int>& completed);

  // Replays the recorded days and applies the full-batch policy.
  AgingOutcome finalize() const;

  const AgingPolicy& policy() const { return policy_; }
  int last_recorded_day() const { return last_day_; }
  // Unaged stock under the provisional full-count schedule.
  int provisional_inventory() const;

 private:
  struct ScheduleRun {
    std::array<int, 2> filled{0, 0};
    std::map<std::string, int> aged;
    std::map<std::string, int> inventory;
  };

  ScheduleRun run_schedule(int vessels) const;
  static int fill_vessels(std::map<std::string, int>& inventory, std::map<std::string, int>& aged, int vessels,
                          const std::vector<std::string>& priority);

  AgingPolicy policy_;
  std::vector<std::string> priority_;
  std::map<std::string, int> starting_;
  std::vector<std::pair<int, std::map<std::string, int>>> days_;
  int last_day_{0};

  std::map<std::string, int> provisional_inventory_;
  std::map<std::string, int> provisional_aged_;
};

} // namespace agrisim
