#pragma once

#include <string>
#include <vector>

#include "agrisim/core/config.h"

namespace agrisim {

// Checks the logical consistency of a parsed config (counts, capacities,
// rates, plot seasons against the selected crops, prices).
//
// Returns a list of human-readable errors. Empty means the config is usable.
std::vector<std::string> validate_app_config(const AppConfig& cfg);

} // namespace agrisim
