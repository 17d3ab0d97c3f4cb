#include <iostream>
#include <stdexcept>
#include <string>
#include <vector>

#include "agrisim/core/ancient_seeds.h"

#define AGRISIM_ASSERT(expr) \
  do { \
    if (!(expr)) { \
      std::cerr << "ASSERT failed: " #expr " (" << __FILE__ << ":" << __LINE__ << ")\n"; \
      return 1; \
    } \
  } while (0)

namespace {

agrisim::AncientPlant plant(agrisim::PlantSite site, int days_until_harvest) {
  agrisim::AncientPlant p;
  p.site = site;
  p.days_until_harvest = days_until_harvest;
  if (site == agrisim::PlantSite::Outdoors) {
    using agrisim::Season;
    p.calendar = agrisim::PlotCalendar::in_seasons({Season::Spring, Season::Summer, Season::Fall});
  }
  return p;
}

std::string runtime_error_text(const std::string& xml) {
  try {
    (void)agrisim::read_save_date(agrisim::xml::Document::parse(xml));
  } catch (const std::runtime_error& e) {
    return e.what();
  }
  return {};
}

} // namespace

int test_ancient_seeds() {
  using namespace agrisim;

  // Plants and date from the fixture save.
  {
    const xml::Document doc = xml::Document::load_file("tests/data/save_fixture.xml");
    const SaveDate date = read_save_date(doc);
    AGRISIM_ASSERT(date.season == Season::Summer);
    AGRISIM_ASSERT(date.day_of_month == 3);
    AGRISIM_ASSERT(date.day_of_year == 31);

    const std::vector<AncientPlant> plants = find_ancient_plants(doc);
    // The dead Farm plant is skipped.
    AGRISIM_ASSERT(plants.size() == 4);
    // Growing: phases 5 + 6 + 4 left from phase 2, one day into it.
    AGRISIM_ASSERT(plants[0].site == PlantSite::Outdoors);
    AGRISIM_ASSERT(plants[0].days_until_harvest == 14);
    AGRISIM_ASSERT(!plants[0].calendar.is_active(Season::Winter));
    AGRISIM_ASSERT(plants[1].site == PlantSite::Outdoors);
    AGRISIM_ASSERT(plants[1].days_until_harvest == kAncientRegrowDays);
    AGRISIM_ASSERT(plants[2].site == PlantSite::Greenhouse);
    AGRISIM_ASSERT(plants[2].days_until_harvest == 4);
    AGRISIM_ASSERT(plants[2].calendar.is_active(Season::Winter));
    AGRISIM_ASSERT(plants[3].site == PlantSite::Always);
    AGRISIM_ASSERT(plants[3].days_until_harvest == 0);

    const PlantSiteCounts counts = count_plant_sites(plants);
    AGRISIM_ASSERT(counts.greenhouse == 1);
    AGRISIM_ASSERT(counts.outdoors == 2);
    AGRISIM_ASSERT(counts.always == 1);

    // Harvests land on days 0 (island), 3 (greenhouse), 6 (grown outdoor
    // plant), 7 (island), 10 (greenhouse) and 13 (both outdoor plants).
    const SeedTimeline t = simulate_seed_timeline(plants, date.day_of_year, 14);
    AGRISIM_ASSERT(t.days() == 14);
    AGRISIM_ASSERT(t.min_seeds[0] == 0);
    AGRISIM_ASSERT(t.min_seeds[1] == 1);
    AGRISIM_ASSERT(t.max_seeds[1] == 3);
    AGRISIM_ASSERT(t.avg_seeds[1] == 2.0);
    AGRISIM_ASSERT(t.min_seeds[3] == 1);
    AGRISIM_ASSERT(t.min_seeds[4] == 2);
    AGRISIM_ASSERT(t.min_seeds[7] == 3);
    AGRISIM_ASSERT(t.min_seeds[8] == 4);
    AGRISIM_ASSERT(t.min_seeds[11] == 5);
    AGRISIM_ASSERT(t.min_seeds[13] == 5);
    AGRISIM_ASSERT(t.min_seeds[14] == 7);

    const std::vector<SeedThreshold> th = seed_threshold_days(t, {4, 1000});
    AGRISIM_ASSERT(th.size() == 2);
    AGRISIM_ASSERT(th[0].target == 4);
    AGRISIM_ASSERT(th[0].min_day == 8);
    AGRISIM_ASSERT(th[0].avg_day == 4);
    AGRISIM_ASSERT(th[0].max_day == 4);
    AGRISIM_ASSERT(!th[1].min_day);
    AGRISIM_ASSERT(!th[1].avg_day);
    AGRISIM_ASSERT(!th[1].max_day);
  }

  // Outdoor plants wait out winter with their timer frozen.
  {
    const int winter_1 = 3 * kDaysPerSeason + 1;
    const SeedTimeline t = simulate_seed_timeline({plant(PlantSite::Outdoors, 0)}, winter_1, 36);
    AGRISIM_ASSERT(t.min_seeds[28] == 0);
    AGRISIM_ASSERT(t.min_seeds[29] == 1);
    // Next harvest a full regrow cycle later.
    AGRISIM_ASSERT(t.min_seeds[35] == 1);
    AGRISIM_ASSERT(t.min_seeds[36] == 2);
  }

  // A greenhouse plant fruits every week, all year.
  {
    const SeedTimeline t = simulate_seed_timeline({plant(PlantSite::Greenhouse, 7)}, 100, 28);
    AGRISIM_ASSERT(t.max_seeds[28] == 4 * kAncientSeedsMax);
    AGRISIM_ASSERT(t.avg_seeds[28] == 4 * kAncientSeedsAvg);
  }

  {
    const SeedTimeline t = simulate_seed_timeline({}, 1, 0);
    AGRISIM_ASSERT(t.days() == 0);
    AGRISIM_ASSERT(t.min_seeds.size() == 1);
  }

  {
    bool threw = false;
    try {
      (void)simulate_seed_timeline({}, 0, 10);
    } catch (const std::invalid_argument&) {
      threw = true;
    }
    AGRISIM_ASSERT(threw);
  }

  AGRISIM_ASSERT(format_season_day(31, 0) == "Summer 3");
  AGRISIM_ASSERT(format_season_day(31, 26) == "Fall 1");
  AGRISIM_ASSERT(format_season_day(kDaysPerYear, 1) == "Spring 1");
  AGRISIM_ASSERT(std::string(plant_site_name(PlantSite::Always)) == "always");

  AGRISIM_ASSERT(runtime_error_text("<SaveGame><dayOfMonth>3</dayOfMonth></SaveGame>") ==
                 "save file missing currentSeason");
  AGRISIM_ASSERT(runtime_error_text("<SaveGame><currentSeason>fall</currentSeason></SaveGame>") ==
                 "save file missing dayOfMonth");
  AGRISIM_ASSERT(runtime_error_text("<SaveGame><currentSeason>fall</currentSeason><dayOfMonth>30</dayOfMonth></SaveGame>")
                     .find("invalid dayOfMonth") != std::string::npos);

  return 0;
}
