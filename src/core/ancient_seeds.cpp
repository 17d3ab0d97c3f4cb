#include "agrisim/core/ancient_seeds.h"

#include <algorithm>
#include <cctype>
#include <numeric>
#include <stdexcept>

#include "agrisim/core/save_import.h"
#include "agrisim/util/strings.h"

namespace agrisim {
namespace {

using xml::Node;

// Games store "never" phases (regrow markers) as 99999 at the end of phaseDays.
constexpr int kNeverPhaseDays = 99999;

int wrap_day_of_year(int start_day_of_year, int day_index) {
  return ((start_day_of_year - 1 + day_index) % kDaysPerYear) + 1;
}

int days_until_next_harvest(const Node& crop) {
  if (crop.child_flag("fullGrown") || crop.child_flag("fullyGrown")) {
    return std::max(0, kAncientRegrowDays - crop.child_int("dayOfCurrentPhase"));
  }

  std::vector<int> phases;
  for (const Node& n : crop.child("phaseDays").children("int")) {
    const std::string txt = trim_copy(n.text());
    phases.push_back(txt.empty() ? 0 : std::stoi(txt));
  }
  while (!phases.empty() && phases.back() >= kNeverPhaseDays) phases.pop_back();

  const int current = std::max(0, crop.child_int("currentPhase"));
  if (current >= static_cast<int>(phases.size())) return 0;
  const int remaining = std::accumulate(phases.begin() + current, phases.end(), 0) - crop.child_int("dayOfCurrentPhase");
  return std::max(0, remaining);
}

std::optional<int> first_reaching(const std::vector<double>& values, int target) {
  for (std::size_t i = 0; i < values.size(); ++i) {
    if (values[i] >= target) return static_cast<int>(i);
  }
  return std::nullopt;
}

std::vector<double> widen(const std::vector<int>& v) { return std::vector<double>(v.begin(), v.end()); }

} // namespace

const char* plant_site_name(PlantSite s) {
  switch (s) {
    case PlantSite::Greenhouse: return "greenhouse";
    case PlantSite::Outdoors: return "outdoors";
    case PlantSite::Always: return "always";
  }
  return "outdoors";
}

SaveDate read_save_date(const xml::Document& save) {
  const Node root = save.root();
  const std::string season_raw = root.child_text("currentSeason");
  if (season_raw.empty()) throw std::runtime_error("save file missing currentSeason");
  SaveDate d;
  if (!parse_season(season_raw, d.season)) throw std::runtime_error("save file has unknown season: " + season_raw);

  if (!root.child("dayOfMonth")) throw std::runtime_error("save file missing dayOfMonth");
  d.day_of_month = root.child_int("dayOfMonth", -1);
  if (d.day_of_month < 1 || d.day_of_month > kDaysPerSeason) {
    throw std::runtime_error("save file has invalid dayOfMonth: " + root.child_text("dayOfMonth"));
  }
  d.day_of_year = day_of_year_from_season_day(d.season, d.day_of_month);
  return d;
}

std::vector<AncientPlant> find_ancient_plants(const xml::Document& save) {
  std::vector<AncientPlant> plants;
  for (const Node& loc : save.root().path("locations").children("GameLocation")) {
    const std::string loc_name = loc.child_text("name");
    for (const Node& item : loc.child("terrainFeatures").children("item")) {
      const Node tf = item.path("value/TerrainFeature");
      if (!tf) continue;
      const std::string type = tf.xsi_type();
      if (!type.empty() && type != "HoeDirt") continue;
      const Node crop = tf.child("crop");
      if (!crop || crop.child_flag("dead")) continue;
      if (crop.child_text("indexOfHarvest") != kAncientFruitHarvestId) continue;

      AncientPlant p;
      p.days_until_harvest = days_until_next_harvest(crop);
      if (loc_name == "Greenhouse") {
        p.site = PlantSite::Greenhouse;
      } else if (to_lower(loc_name).rfind("island", 0) == 0) {
        p.site = PlantSite::Always;
      } else {
        p.site = PlantSite::Outdoors;
        p.calendar = PlotCalendar::in_seasons({Season::Spring, Season::Summer, Season::Fall});
      }
      plants.push_back(std::move(p));
    }
  }
  return plants;
}

SeedTimeline simulate_seed_timeline(std::vector<AncientPlant> plants, int start_day_of_year, int days) {
  if (days < 0) throw std::invalid_argument("seed timeline days must be >= 0, got " + std::to_string(days));
  if (start_day_of_year < 1 || start_day_of_year > kDaysPerYear) {
    throw std::invalid_argument("start day of year must be in 1.." + std::to_string(kDaysPerYear) + ", got " +
                                std::to_string(start_day_of_year));
  }

  SeedTimeline t;
  t.min_seeds.reserve(static_cast<std::size_t>(days) + 1);
  t.avg_seeds.reserve(static_cast<std::size_t>(days) + 1);
  t.max_seeds.reserve(static_cast<std::size_t>(days) + 1);
  t.min_seeds.push_back(0);
  t.avg_seeds.push_back(0.0);
  t.max_seeds.push_back(0);

  for (int day = 0; day < days; ++day) {
    const Season season = season_for_day_of_year(wrap_day_of_year(start_day_of_year, day));
    int harvested = 0;
    for (auto& p : plants) {
      if (!p.calendar.is_active(season)) continue;
      // A plant that is already ripe is picked today without ticking its timer.
      if (p.days_until_harvest > 0 && --p.days_until_harvest > 0) continue;
      ++harvested;
      p.days_until_harvest = kAncientRegrowDays;
    }
    t.min_seeds.push_back(t.min_seeds.back() + harvested * kAncientSeedsMin);
    t.avg_seeds.push_back(t.avg_seeds.back() + harvested * kAncientSeedsAvg);
    t.max_seeds.push_back(t.max_seeds.back() + harvested * kAncientSeedsMax);
  }
  return t;
}

std::vector<SeedThreshold> seed_threshold_days(const SeedTimeline& timeline, const std::vector<int>& targets) {
  const std::vector<double> mins = widen(timeline.min_seeds);
  const std::vector<double> maxs = widen(timeline.max_seeds);
  std::vector<SeedThreshold> out;
  out.reserve(targets.size());
  for (int target : targets) {
    SeedThreshold s;
    s.target = target;
    s.min_day = first_reaching(mins, target);
    s.avg_day = first_reaching(timeline.avg_seeds, target);
    s.max_day = first_reaching(maxs, target);
    out.push_back(s);
  }
  return out;
}

std::string format_season_day(int start_day_of_year, int day_index) {
  const int doy = wrap_day_of_year(start_day_of_year, day_index);
  std::string season = season_name(season_for_day_of_year(doy));
  season[0] = static_cast<char>(std::toupper(static_cast<unsigned char>(season[0])));
  return season + " " + std::to_string(((doy - 1) % kDaysPerSeason) + 1);
}

PlantSiteCounts count_plant_sites(const std::vector<AncientPlant>& plants) {
  PlantSiteCounts c;
  for (const auto& p : plants) {
    switch (p.site) {
      case PlantSite::Greenhouse: ++c.greenhouse; break;
      case PlantSite::Outdoors: ++c.outdoors; break;
      case PlantSite::Always: ++c.always; break;
    }
  }
  return c;
}

} // namespace agrisim
