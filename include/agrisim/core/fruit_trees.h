#pragma once

#include <map>
#include <string>
#include <vector>

#include "agrisim/core/calendar.h"

namespace agrisim {

// Tree counts by fruit id, per placement.
struct FruitTreesConfig {
  // Greenhouse trees fruit every day.
  std::map<std::string, int> greenhouse;
  // Outdoor trees only fruit in their own season.
  std::map<std::string, int> outdoors;
  // Trees on year-round ground (e.g. an island farm).
  std::map<std::string, int> always;

  bool empty() const { return greenhouse.empty() && outdoors.empty() && always.empty(); }
};

// Canonical fruit ids: apple, apricot, banana, cherry, mango, orange, peach,
// pomegranate.
const std::vector<std::string>& fruit_tree_ids();

// Maps a name ("Pomegranate", "apricot_tree") or a game object id ("632") to a
// canonical fruit id. Returns an empty string when unknown.
std::string normalize_fruit_tree_name(const std::string& raw);

// The season in which an outdoor tree bears fruit. Returns false for unknown ids.
bool fruit_tree_season(const std::string& fruit_id, Season& out);

// Total trees per fruit across all placements (positive counts only).
std::map<std::string, int> total_tree_counts(const FruitTreesConfig& cfg);

// Daily fruit per tree type for `days` days starting at `start_day_of_year`.
// Index 0 is the first simulated day.
std::map<std::string, std::vector<int>> build_daily_fruit(const FruitTreesConfig& cfg, int start_day_of_year,
                                                          int days);

} // namespace agrisim
