#pragma once

#include <optional>
#include <string>
#include <vector>

#include "agrisim/core/calendar.h"
#include "agrisim/util/xml.h"

namespace agrisim {

// A mature ancient fruit plant fruits again this many days after a harvest.
inline constexpr int kAncientRegrowDays = 7;

// Seeds a Seed Maker returns per ancient fruit.
inline constexpr int kAncientSeedsMin = 1;
inline constexpr double kAncientSeedsAvg = 2.0;
inline constexpr int kAncientSeedsMax = 3;

enum class PlantSite { Greenhouse, Outdoors, Always };

const char* plant_site_name(PlantSite s);

struct AncientPlant {
  PlantSite site{PlantSite::Outdoors};
  int days_until_harvest{0};
  PlotCalendar calendar;
};

struct SaveDate {
  Season season{Season::Spring};
  int day_of_month{1};
  int day_of_year{1};
};

// The in-game date a save was written on.
// Throws std::runtime_error when currentSeason or dayOfMonth is missing or bad.
SaveDate read_save_date(const xml::Document& save);

// Live ancient fruit plants in HoeDirt of every top-level location, each with
// the number of days until it next fruits. Greenhouse and island plants grow
// all year; everything else only from spring to fall.
std::vector<AncientPlant> find_ancient_plants(const xml::Document& save);

// Cumulative seed counts if every ancient fruit goes into a Seed Maker.
// Index 0 is the starting point (zero seeds); index d is the total after d days.
struct SeedTimeline {
  std::vector<int> min_seeds;
  std::vector<double> avg_seeds;
  std::vector<int> max_seeds;

  int days() const { return static_cast<int>(min_seeds.size()) - 1; }
};

// Throws std::invalid_argument for a negative day count or a start day
// outside 1..kDaysPerYear.
SeedTimeline simulate_seed_timeline(std::vector<AncientPlant> plants, int start_day_of_year, int days);

struct SeedThreshold {
  int target{0};
  std::optional<int> min_day;
  std::optional<int> avg_day;
  std::optional<int> max_day;
};

// First day index at which each curve reaches each target; empty when the
// timeline never gets there.
std::vector<SeedThreshold> seed_threshold_days(const SeedTimeline& timeline, const std::vector<int>& targets);

// "Summer 3" for the day `day_index` days after `start_day_of_year`.
std::string format_season_day(int start_day_of_year, int day_index);

struct PlantSiteCounts {
  int greenhouse{0};
  int outdoors{0};
  int always{0};
};

PlantSiteCounts count_plant_sites(const std::vector<AncientPlant>& plants);

} // namespace agrisim
