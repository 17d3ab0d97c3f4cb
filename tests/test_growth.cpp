#include <iostream>
#include <vector>

#include "agrisim/core/crops.h"
#include "agrisim/core/growth.h"

#define AGRISIM_ASSERT(expr) \
  do { \
    if (!(expr)) { \
      std::cerr << "ASSERT failed: " #expr " (" << __FILE__ << ":" << __LINE__ << ")\n"; \
      return 1; \
    } \
  } while (0)

int test_growth() {
  using namespace agrisim;

  const Crop star = starfruit_crop();
  const Crop ancient = ancient_fruit_crop();

  // Speed bonuses stack additively.
  {
    GrowthModifiers m;
    AGRISIM_ASSERT(speed_increase(m) == 0.0);
    m.fertilizer = Fertilizer::SpeedGro;
    AGRISIM_ASSERT(speed_increase(m) > 0.099 && speed_increase(m) < 0.101);
    m.fertilizer = Fertilizer::HyperSpeedGro;
    m.agriculturist = true;
    AGRISIM_ASSERT(speed_increase(m) > 0.429 && speed_increase(m) < 0.431);
    m.paddy_bonus = true;
    AGRISIM_ASSERT(speed_increase(m) > 0.679 && speed_increase(m) < 0.681);
  }

  // Starfruit: 13 base days.
  AGRISIM_ASSERT(adjusted_total_days(star.phase_days, 0.0) == 13);
  AGRISIM_ASSERT((apply_speed_increases(star.phase_days, 0.10) == std::vector<int>{1, 2, 2, 3, 3}));
  AGRISIM_ASSERT(adjusted_total_days(star.phase_days, 0.10) == 11);
  AGRISIM_ASSERT(adjusted_total_days(star.phase_days, 0.25) == 9);
  AGRISIM_ASSERT(adjusted_total_days(star.phase_days, 0.33) == 8);
  AGRISIM_ASSERT(adjusted_total_days(star.phase_days, 0.25 + 0.10) == 8);
  AGRISIM_ASSERT(adjusted_total_days(star.phase_days, 0.33 + 0.10) == 7);

  // Ancient fruit: 28 base days.
  AGRISIM_ASSERT(adjusted_total_days(ancient.phase_days, 0.10) == 25);
  AGRISIM_ASSERT((apply_speed_increases(ancient.phase_days, 0.25) == std::vector<int>{1, 5, 5, 6, 4}));
  AGRISIM_ASSERT(adjusted_total_days(ancient.phase_days, 0.25) == 21);
  AGRISIM_ASSERT((apply_speed_increases(ancient.phase_days, 0.33 + 0.10) == std::vector<int>{1, 4, 4, 4, 2}));

  // The first phase never shrinks below one day.
  {
    const auto out = apply_speed_increases({1, 1}, 0.5);
    AGRISIM_ASSERT(!out.empty());
    AGRISIM_ASSERT(out[0] == 1);
  }

  {
    GrowthModifiers m;
    m.fertilizer = Fertilizer::DeluxeSpeedGro;
    AGRISIM_ASSERT(days_to_first_harvest(star, m) == 9);
    AGRISIM_ASSERT(days_to_first_harvest(ancient, m) == 21);
    m.agriculturist = true;
    AGRISIM_ASSERT(days_to_first_harvest(star, m) == 8);
  }

  Fertilizer f = Fertilizer::None;
  AGRISIM_ASSERT(parse_fertilizer("Deluxe Speed-Gro", f) && f == Fertilizer::DeluxeSpeedGro);
  AGRISIM_ASSERT(parse_fertilizer("hyper_speed_gro", f) && f == Fertilizer::HyperSpeedGro);
  AGRISIM_ASSERT(parse_fertilizer("none", f) && f == Fertilizer::None);
  AGRISIM_ASSERT(!parse_fertilizer("compost", f));
  AGRISIM_ASSERT(std::string(fertilizer_name(Fertilizer::SpeedGro)) == "speed_gro");

  return 0;
}
