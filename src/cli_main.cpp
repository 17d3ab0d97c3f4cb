#include <iostream>
#include <optional>
#include <string>
#include <vector>

#include "agrisim/core/ancient_seeds.h"
#include "agrisim/core/config.h"
#include "agrisim/core/config_validation.h"
#include "agrisim/core/report.h"
#include "agrisim/core/save_import.h"
#include "agrisim/util/file_io.h"
#include "agrisim/util/json.h"
#include "agrisim/util/log.h"
#include "agrisim/util/strings.h"
#include "agrisim/util/xml.h"

namespace {

#ifndef AGRISIM_VERSION
#define AGRISIM_VERSION "unknown"
#endif

int get_int_arg(int argc, char** argv, const std::string& key, int def) {
  for (int i = 1; i < argc - 1; ++i) {
    if (argv[i] == key) return std::stoi(argv[i + 1]);
  }
  return def;
}

std::string get_str_arg(int argc, char** argv, const std::string& key, const std::string& def) {
  for (int i = 1; i < argc - 1; ++i) {
    if (argv[i] == key) return argv[i + 1];
  }
  return def;
}

bool has_flag(int argc, char** argv, const std::string& flag) {
  for (int i = 1; i < argc; ++i) {
    if (argv[i] == flag) return true;
  }
  return false;
}

// A bare first argument is accepted as the config path.
std::string config_path_arg(int argc, char** argv) {
  const std::string path = get_str_arg(argc, argv, "--config", "");
  if (!path.empty()) return path;
  if (argc >= 2 && argv[1][0] != '-') return argv[1];
  return {};
}

void print_usage(const char* exe) {
  std::cout << "agrisim CLI v" << AGRISIM_VERSION << "\n\n";
  std::cout << "Usage: " << (exe ? exe : "agrisim_cli") << " --config PATH [options]\n\n";
  std::cout << "Options:\n";
  std::cout << "  --config PATH    Farm config JSON or game save XML (may also be the first argument)\n";
  std::cout << "  --overrides PATH JSON overrides applied on top of a game save\n";
  std::cout << "  --days N         Simulate only the first N days of the year (1..112, default: 112)\n";
  std::cout << "  --cadence NAME   Perennial fertilizer cadence (per_season|per_regrowth_cycle)\n";
  std::cout << "  --json PATH      Write the report as JSON\n";
  std::cout << "  --no-trace       Leave the per-day trace out of the JSON report\n";
  std::cout << "  --trace          Print the per-day trace after the report\n";
  std::cout << "  --validate       Validate the config and exit\n";
  std::cout << "  --sprinklers     Count placed and stored sprinklers in a save and exit\n";
  std::cout << "  --ancient-seeds  Project ancient seed counts from the plants in a save and exit\n";
  std::cout << "  --years N        Horizon for --ancient-seeds in years (default: 20)\n";
  std::cout << "  --quiet          Suppress the text report (useful with --json)\n";
  std::cout << "  --log-level L    debug|info|warn|error|off (default: info)\n";
  std::cout << "  -h, --help       Show this help\n";
  std::cout << "  --version        Print version and exit\n";
}

void print_trace(const agrisim::YearSimulationResult& prod) {
  std::cout << "\nday\tseason\tharvest\ttrees\tstock\tkegs\tjars\tdehyd\taged\n";
  for (const auto& d : prod.trace) {
    std::cout << d.day << "\t" << agrisim::season_name(d.season) << "\t" << d.harvested << "\t" << d.external_fruit
              << "\t" << d.inventory << "\t" << d.kegs_busy << "\t" << d.jars_busy << "\t" << d.dehydrators_busy
              << "\t" << d.aged << "\n";
  }
}

void print_sprinklers(const agrisim::SprinklerSurvey& s) {
  const auto row = [](const char* label, const agrisim::SprinklerCounts& c) {
    std::cout << "  " << label << "quality " << c.quality << ", iridium " << c.iridium << " (" << c.tiles()
              << " tiles)\n";
  };
  std::cout << "Sprinklers:\n";
  row("placed on farm:   ", s.placed);
  row("stored in chests: ", s.stored);
  row("total:            ", s.total());
}

std::string seed_day_label(const std::optional<int>& day, int start_day_of_year) {
  if (!day) return "not reached";
  return std::to_string(*day) + " (" + agrisim::format_season_day(start_day_of_year, *day) + ")";
}

void print_ancient_seeds(const agrisim::xml::Document& save, int years) {
  const std::vector<int> targets = {10, 20, 30, 50, 100, 150, 200, 250, 300, 350, 400};

  const agrisim::SaveDate date = agrisim::read_save_date(save);
  const auto plants = agrisim::find_ancient_plants(save);
  const auto counts = agrisim::count_plant_sites(plants);

  std::cout << "start date: " << agrisim::format_season_day(date.day_of_year, 0) << " (day " << date.day_of_year
            << ")\n";
  std::cout << "ancient plants: greenhouse=" << counts.greenhouse << " outdoors=" << counts.outdoors
            << " always=" << counts.always << "\n";
  std::cout << "seed maker per-fruit assumptions: min=" << agrisim::kAncientSeedsMin
            << ", avg=" << agrisim::format_fixed(agrisim::kAncientSeedsAvg, 1) << ", max=" << agrisim::kAncientSeedsMax
            << "\n";
  if (plants.empty()) {
    std::cout << "no ancient fruit plants found in the save file.\n";
    return;
  }

  const auto timeline = agrisim::simulate_seed_timeline(plants, date.day_of_year, years * agrisim::kDaysPerYear);
  std::cout << "\nseed timeline (days since today):\n";
  for (const auto& t : agrisim::seed_threshold_days(timeline, targets)) {
    std::cout << "  " << t.target << " seeds: min " << seed_day_label(t.min_day, date.day_of_year) << ", avg "
              << seed_day_label(t.avg_day, date.day_of_year) << ", max "
              << seed_day_label(t.max_day, date.day_of_year) << "\n";
  }
}

} // namespace

int main(int argc, char** argv) {
  try {
    if (has_flag(argc, argv, "--version")) {
      std::cout << AGRISIM_VERSION << "\n";
      return 0;
    }
    if (has_flag(argc, argv, "--help") || has_flag(argc, argv, "-h")) {
      print_usage(argv[0]);
      return 0;
    }

    const std::string level_name = get_str_arg(argc, argv, "--log-level", "info");
    agrisim::log::Level level = agrisim::log::Level::Info;
    if (!agrisim::log::parse_level(level_name, level)) {
      std::cerr << "Unknown --log-level: '" << level_name << "'\n\n";
      print_usage(argv[0]);
      return 2;
    }
    agrisim::log::set_level(level);

    const std::string config_path = config_path_arg(argc, argv);
    if (config_path.empty()) {
      print_usage(argv[0]);
      return 2;
    }
    const std::string json_path = get_str_arg(argc, argv, "--json", "");
    const std::string overrides_path = get_str_arg(argc, argv, "--overrides", "");
    const bool quiet = has_flag(argc, argv, "--quiet");

    const bool sprinklers = has_flag(argc, argv, "--sprinklers");
    const bool seeds = has_flag(argc, argv, "--ancient-seeds");
    if (sprinklers || seeds) {
      if (!agrisim::is_save_file(config_path)) {
        std::cerr << (sprinklers ? "--sprinklers" : "--ancient-seeds") << " needs a game save, got '" << config_path
                  << "'\n";
        return 2;
      }
      const int years = get_int_arg(argc, argv, "--years", 20);
      if (years < 1 || years > 1000) {
        std::cerr << "--years must be in 1..1000\n";
        return 2;
      }
      const auto save = agrisim::xml::Document::load_file(config_path);
      if (sprinklers) print_sprinklers(agrisim::survey_sprinklers(save));
      if (seeds) {
        if (sprinklers) std::cout << "\n";
        print_ancient_seeds(save, years);
      }
      return 0;
    }

    auto cfg = agrisim::load_app_config_from_file(config_path, overrides_path);

    const int days = get_int_arg(argc, argv, "--days", cfg.simulation.max_days);
    if (days < 1 || days > agrisim::kDaysPerYear) {
      std::cerr << "--days must be in 1.." << agrisim::kDaysPerYear << "\n";
      return 2;
    }
    cfg.simulation.max_days = days;

    const std::string cadence = get_str_arg(argc, argv, "--cadence", "");
    if (cadence == "per_season") {
      cfg.simulation.fertilizer_cadence = agrisim::FertilizerCadence::PerSeason;
    } else if (cadence == "per_regrowth_cycle") {
      cfg.simulation.fertilizer_cadence = agrisim::FertilizerCadence::PerRegrowthCycle;
    } else if (!cadence.empty()) {
      std::cerr << "Unknown --cadence: '" << cadence << "'\n\n";
      print_usage(argv[0]);
      return 2;
    }

    const auto errors = agrisim::validate_app_config(cfg);
    if (!errors.empty()) {
      std::cerr << "Config validation failed:\n";
      for (const auto& e : errors) std::cerr << "  - " << e << "\n";
      return 2;
    }
    if (has_flag(argc, argv, "--validate")) {
      if (!quiet) std::cout << "Config OK\n";
      return 0;
    }

    const auto report = agrisim::build_year_report(cfg);
    if (!quiet) {
      std::cout << agrisim::format_text_report(cfg, report);
      if (has_flag(argc, argv, "--trace")) print_trace(report.production);
    }

    if (!json_path.empty()) {
      const bool with_trace = !has_flag(argc, argv, "--no-trace");
      agrisim::write_text_file(json_path, agrisim::json::stringify(agrisim::report_to_json(cfg, report, with_trace)));
      agrisim::log::info("JSON report written to " + json_path);
    }
    return 0;
  } catch (const std::exception& e) {
    agrisim::log::error(std::string("Fatal: ") + e.what());
    return 1;
  }
}
