#include <iostream>
#include <string>

#include "agrisim/core/config.h"
#include "agrisim/core/config_validation.h"
#include "agrisim/core/report.h"
#include "agrisim/util/log.h"

#ifndef AGRISIM_VERSION
#define AGRISIM_VERSION "unknown"
#endif

#ifndef AGRISIM_UI_UNAVAILABLE_REASON
#define AGRISIM_UI_UNAVAILABLE_REASON "the UI dependencies are unavailable in this build."
#endif

// Built in place of the report window when SDL2 or Dear ImGui is missing. It
// accepts the same arguments and prints the text report instead.
int main(int argc, char** argv) {
  std::string config_path;
  std::string overrides_path;
  for (int i = 1; i < argc; ++i) {
    const std::string arg = argv[i];
    if (arg == "--version") {
      std::cout << AGRISIM_VERSION << "\n";
      return 0;
    }
    if (arg == "--help" || arg == "-h") {
      std::cout << "Usage: " << argv[0] << " [CONFIG | --config PATH] [--overrides PATH]\n\n"
                << "The report window is not part of this build: " << AGRISIM_UI_UNAVAILABLE_REASON << "\n"
                << "Given a config, the year report is printed as text. agrisim_cli has the full option set.\n";
      return 0;
    }
    if ((arg == "--config" || arg == "--overrides") && i + 1 < argc) {
      (arg == "--config" ? config_path : overrides_path) = argv[++i];
    } else if (!arg.empty() && arg[0] != '-') {
      config_path = arg;
    } else {
      std::cerr << "Unknown argument: '" << arg << "'\n";
      return 2;
    }
  }

  agrisim::log::warn(std::string("report window unavailable: ") + AGRISIM_UI_UNAVAILABLE_REASON);
  if (config_path.empty()) {
    std::cerr << "Pass a farm config or save to print its year report, e.g.\n"
              << "  " << argv[0] << " data/configs/example.json\n";
    return 0;
  }

  try {
    const auto cfg = agrisim::load_app_config_from_file(config_path, overrides_path);
    const auto errors = agrisim::validate_app_config(cfg);
    if (!errors.empty()) {
      std::cerr << "Config validation failed:\n";
      for (const auto& e : errors) std::cerr << "  - " << e << "\n";
      return 2;
    }
    std::cout << agrisim::format_text_report(cfg, agrisim::build_year_report(cfg));
    return 0;
  } catch (const std::exception& e) {
    agrisim::log::error(std::string("Fatal: ") + e.what());
    return 1;
  }
}
