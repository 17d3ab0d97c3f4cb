#pragma once

#include <string>
#include <vector>

namespace agrisim {

std::string to_lower(std::string s);

std::string trim_copy(const std::string& s);

// Lower-cases and strips spaces, '_' and '-' so that "Ancient Fruit",
// "ancient_fruit" and "ancient-fruit" all compare equal.
std::string normalize_key(const std::string& s);

std::string join(const std::vector<std::string>& parts, const std::string& sep);

// Fixed-point formatting with `digits` decimals ("%.2f" style).
std::string format_fixed(double v, int digits);

} // namespace agrisim
