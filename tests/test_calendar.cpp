#include <iostream>
#include <stdexcept>

#include "agrisim/core/calendar.h"

#define AGRISIM_ASSERT(expr) \
  do { \
    if (!(expr)) { \
      std::cerr << "ASSERT failed: " #expr " (" << __FILE__ << ":" << __LINE__ << ")\n"; \
      return 1; \
    } \
  } while (0)

int test_calendar() {
  using namespace agrisim;

  AGRISIM_ASSERT(kDaysPerYear == 112);
  AGRISIM_ASSERT(day_of_year(1) == 1);
  AGRISIM_ASSERT(day_of_year(112) == 112);
  AGRISIM_ASSERT(season_for_day(1) == Season::Spring);
  AGRISIM_ASSERT(season_for_day(28) == Season::Spring);
  AGRISIM_ASSERT(season_for_day(29) == Season::Summer);
  AGRISIM_ASSERT(season_for_day(57) == Season::Fall);
  AGRISIM_ASSERT(season_for_day(112) == Season::Winter);

  // A fall start wraps back into spring after 56 days.
  AGRISIM_ASSERT(day_of_year(1, Season::Fall) == 57);
  AGRISIM_ASSERT(season_for_day(56, Season::Fall) == Season::Winter);
  AGRISIM_ASSERT(season_for_day(57, Season::Fall) == Season::Spring);

  AGRISIM_ASSERT(day_of_year_from_season_day(Season::Summer, 1) == 29);
  AGRISIM_ASSERT(day_of_year_from_season_day(Season::Winter, 28) == 112);

  {
    bool threw = false;
    try {
      (void)day_of_year(0);
    } catch (const std::out_of_range&) {
      threw = true;
    }
    AGRISIM_ASSERT(threw);
  }
  {
    bool threw = false;
    try {
      (void)day_of_year(113);
    } catch (const std::out_of_range&) {
      threw = true;
    }
    AGRISIM_ASSERT(threw);
  }

  Season s = Season::Spring;
  AGRISIM_ASSERT(parse_season(" Autumn ", s) && s == Season::Fall);
  AGRISIM_ASSERT(parse_season("WINTER", s) && s == Season::Winter);
  AGRISIM_ASSERT(!parse_season("monsoon", s));
  AGRISIM_ASSERT(s == Season::Winter);
  AGRISIM_ASSERT(std::string(season_name(Season::Summer)) == "summer");

  const PlotCalendar always = PlotCalendar::always();
  AGRISIM_ASSERT(always.is_active(Season::Winter));

  const PlotCalendar summer = PlotCalendar::in_seasons({Season::Summer, Season::Fall});
  AGRISIM_ASSERT(!summer.is_active(Season::Spring));
  AGRISIM_ASSERT(summer.is_active(Season::Summer));
  AGRISIM_ASSERT(summer.is_active(Season::Fall));
  AGRISIM_ASSERT(!summer.is_active(Season::Winter));

  const PlotCalendar never = PlotCalendar::in_seasons({});
  AGRISIM_ASSERT(!never.is_active(Season::Spring));

  return 0;
}
