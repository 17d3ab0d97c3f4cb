#include <iostream>
#include <stdexcept>

#include "agrisim/core/aging.h"

#define AGRISIM_ASSERT(expr) \
  do { \
    if (!(expr)) { \
      std::cerr << "ASSERT failed: " #expr " (" << __FILE__ << ":" << __LINE__ << ")\n"; \
      return 1; \
    } \
  } while (0)

int test_aging() {
  using namespace agrisim;

  AGRISIM_ASSERT(AgingBatcher::is_trigger_day(1));
  AGRISIM_ASSERT(AgingBatcher::is_trigger_day(57));
  AGRISIM_ASSERT(!AgingBatcher::is_trigger_day(56));

  // Full batch required but the first trigger day is short: both days fall
  // back to the walkway casks, even though day 57 alone could fill all 10.
  {
    AgingBatcher batcher(AgingPolicy{10, true, 4}, {"wine"}, {{"wine", 6}});
    AGRISIM_ASSERT(batcher.record_day(1, {}) == 6);
    AGRISIM_ASSERT(batcher.record_day(30, {{"wine", 20}}) == 0);
    AGRISIM_ASSERT(batcher.record_day(57, {}) == 10);

    const AgingOutcome out = batcher.finalize();
    AGRISIM_ASSERT(!out.full_batch_met);
    AGRISIM_ASSERT(out.vessels == 10);
    AGRISIM_ASSERT(out.effective_vessels == 4);
    AGRISIM_ASSERT(out.filled[0] == 4);
    AGRISIM_ASSERT(out.filled[1] == 4);
    AGRISIM_ASSERT(out.total_aged == 8);
    AGRISIM_ASSERT(out.aged_for("wine") == 8);
    AGRISIM_ASSERT(out.unaged_for("wine") == 18);
    AGRISIM_ASSERT(out.uses_per_vessel == 2.0);
  }

  // Without walkway casks a missed full batch means no aging at all.
  {
    AgingBatcher batcher(AgingPolicy{10, true, 0}, {"wine"}, {{"wine", 6}});
    (void)batcher.record_day(1, {});
    (void)batcher.record_day(57, {{"wine", 20}});
    const AgingOutcome out = batcher.finalize();
    AGRISIM_ASSERT(out.effective_vessels == 0);
    AGRISIM_ASSERT(out.total_aged == 0);
    AGRISIM_ASSERT(out.uses_per_vessel == 0.0);
    AGRISIM_ASSERT(out.unaged_for("wine") == 26);
  }

  // Full batch met on both days.
  {
    AgingBatcher batcher(AgingPolicy{10, true, 4}, {"wine"}, {{"wine", 10}});
    (void)batcher.record_day(1, {});
    (void)batcher.record_day(57, {{"wine", 12}});
    const AgingOutcome out = batcher.finalize();
    AGRISIM_ASSERT(out.full_batch_met);
    AGRISIM_ASSERT(out.effective_vessels == 10);
    AGRISIM_ASSERT(out.total_aged == 20);
    AGRISIM_ASSERT(out.unaged_for("wine") == 2);
    AGRISIM_ASSERT(out.uses_per_vessel == 2.0);
  }

  // Partial batches are fine when the policy does not require full ones.
  {
    AgingBatcher batcher(AgingPolicy{10, false, 0}, {"starfruit", "ancient"}, {{"ancient", 6}});
    (void)batcher.record_day(1, {});
    (void)batcher.record_day(40, {{"ancient", 3}, {"starfruit", 7}});
    (void)batcher.record_day(57, {});
    const AgingOutcome out = batcher.finalize();
    AGRISIM_ASSERT(out.full_batch_met);
    AGRISIM_ASSERT(out.effective_vessels == 10);
    AGRISIM_ASSERT(out.filled[0] == 6);
    AGRISIM_ASSERT(out.filled[1] == 10);
    // Higher priority goods are aged first on day 57.
    AGRISIM_ASSERT(out.aged_for("starfruit") == 7);
    AGRISIM_ASSERT(out.aged_for("ancient") == 9);
    AGRISIM_ASSERT(out.unaged_for("ancient") == 0);
    AGRISIM_ASSERT(out.uses_per_vessel > 1.59 && out.uses_per_vessel < 1.61);
  }

  // A run that stops before day 57 is judged on day 1 alone.
  {
    AgingBatcher batcher(AgingPolicy{2, true, 1}, {"starfruit"}, {{"starfruit", 5}});
    for (int day = 1; day <= 30; ++day) (void)batcher.record_day(day, {});
    const AgingOutcome out = batcher.finalize();
    AGRISIM_ASSERT(out.full_batch_met);
    AGRISIM_ASSERT(out.effective_vessels == 2);
    AGRISIM_ASSERT(out.filled[0] == 2);
    AGRISIM_ASSERT(out.filled[1] == 0);
    AGRISIM_ASSERT(out.total_aged == 2);
    AGRISIM_ASSERT(out.unaged_for("starfruit") == 3);
    AGRISIM_ASSERT(out.uses_per_vessel == 1.0);
  }

  // The same short run still falls back when day 1 itself is short.
  {
    AgingBatcher batcher(AgingPolicy{2, true, 1}, {"starfruit"}, {{"starfruit", 1}});
    for (int day = 1; day <= 30; ++day) (void)batcher.record_day(day, {});
    const AgingOutcome out = batcher.finalize();
    AGRISIM_ASSERT(!out.full_batch_met);
    AGRISIM_ASSERT(out.effective_vessels == 1);
    AGRISIM_ASSERT(out.total_aged == 1);
  }

  // Without the policy the flag is not evaluated.
  {
    AgingBatcher batcher(AgingPolicy{10, false, 0}, {"wine"});
    (void)batcher.record_day(1, {{"wine", 3}});
    AGRISIM_ASSERT(batcher.finalize().full_batch_met);
  }

  // Uses per vessel never exceed two, whatever the stock.
  {
    AgingBatcher batcher(AgingPolicy{3, false, 0}, {"wine"}, {{"wine", 500}});
    for (int day = 1; day <= 112; ++day) (void)batcher.record_day(day, {{"wine", 50}});
    const AgingOutcome out = batcher.finalize();
    AGRISIM_ASSERT(out.total_aged == 6);
    AGRISIM_ASSERT(out.uses_per_vessel <= kMaxUsesPerVessel);
    AGRISIM_ASSERT(batcher.last_recorded_day() == 112);
  }

  // Days must be recorded in order.
  {
    AgingBatcher batcher(AgingPolicy{1, false, 0}, {"wine"});
    (void)batcher.record_day(5, {});
    bool threw = false;
    try {
      (void)batcher.record_day(5, {});
    } catch (const std::invalid_argument&) {
      threw = true;
    }
    AGRISIM_ASSERT(threw);
  }

  {
    bool threw = false;
    try {
      AgingBatcher batcher(AgingPolicy{-1, false, 0}, {"wine"});
    } catch (const std::invalid_argument&) {
      threw = true;
    }
    AGRISIM_ASSERT(threw);
  }

  return 0;
}
