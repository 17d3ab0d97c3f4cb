#include "agrisim/core/calendar.h"

#include <algorithm>
#include <stdexcept>

#include "agrisim/util/strings.h"

namespace agrisim {

int day_of_year(int day, Season start_season) {
  if (day < 1 || day > kDaysPerYear) {
    throw std::out_of_range("simulation day out of range (1.." + std::to_string(kDaysPerYear) +
                            "): " + std::to_string(day));
  }
  const int start = static_cast<int>(start_season) * kDaysPerSeason;
  return ((start + day - 1) % kDaysPerYear) + 1;
}

Season season_for_day_of_year(int doy) {
  if (doy < 1) throw std::out_of_range("day of year must be >= 1: " + std::to_string(doy));
  const int idx = ((doy - 1) / kDaysPerSeason) % kSeasonsPerYear;
  return static_cast<Season>(idx);
}

Season season_for_day(int day, Season start_season) {
  return season_for_day_of_year(day_of_year(day, start_season));
}

int day_of_year_from_season_day(Season season, int day_of_month) {
  if (day_of_month < 1 || day_of_month > kDaysPerSeason) {
    throw std::out_of_range("day of month must be in 1..28: " + std::to_string(day_of_month));
  }
  return static_cast<int>(season) * kDaysPerSeason + day_of_month;
}

const char* season_name(Season s) {
  switch (s) {
    case Season::Spring: return "spring";
    case Season::Summer: return "summer";
    case Season::Fall: return "fall";
    case Season::Winter: return "winter";
  }
  return "spring";
}

bool parse_season(const std::string& raw, Season& out) {
  const std::string s = to_lower(trim_copy(raw));
  if (s == "spring") {
    out = Season::Spring;
    return true;
  }
  if (s == "summer") {
    out = Season::Summer;
    return true;
  }
  if (s == "fall" || s == "autumn") {
    out = Season::Fall;
    return true;
  }
  if (s == "winter") {
    out = Season::Winter;
    return true;
  }
  return false;
}

bool PlotCalendar::is_active(Season season) const {
  if (kind == Kind::Always) return true;
  return std::find(seasons.begin(), seasons.end(), season) != seasons.end();
}

} // namespace agrisim
