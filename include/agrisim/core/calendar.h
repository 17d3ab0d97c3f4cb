#pragma once

#include <string>
#include <vector>

namespace agrisim {

enum class Season { Spring = 0, Summer = 1, Fall = 2, Winter = 3 };

inline constexpr int kSeasonsPerYear = 4;
inline constexpr int kDaysPerSeason = 28;
inline constexpr int kDaysPerYear = kSeasonsPerYear * kDaysPerSeason;

// Maps an absolute simulation day (1-based, 1..kDaysPerYear) to the 1-based
// day of the in-game year, given the season the run starts in.
//
// Throws std::out_of_range for day indices outside 1..kDaysPerYear.
int day_of_year(int day, Season start_season = Season::Spring);

// Season of a 1-based day of year. Values past 112 wrap into the next year.
// Throws std::out_of_range for day_of_year < 1.
Season season_for_day_of_year(int day_of_year);

Season season_for_day(int day, Season start_season = Season::Spring);

// Converts a season + day-of-month pair (1..28) into a 1-based day of year.
int day_of_year_from_season_day(Season season, int day_of_month);

const char* season_name(Season s);

// Case-insensitive; returns false for unknown names.
bool parse_season(const std::string& raw, Season& out);

// A plot is either always active (greenhouse, island) or only during a set of
// seasons (outdoor fields).
struct PlotCalendar {
  enum class Kind { Always, Seasons };

  Kind kind{Kind::Always};
  std::vector<Season> seasons;

  static PlotCalendar always() { return PlotCalendar{}; }
  static PlotCalendar in_seasons(std::vector<Season> s) { return PlotCalendar{Kind::Seasons, std::move(s)}; }

  bool is_active(Season season) const;
};

} // namespace agrisim
