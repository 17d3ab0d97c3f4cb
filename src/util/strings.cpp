#include "agrisim/util/strings.h"

#include <algorithm>
#include <cctype>
#include <cstdio>

namespace agrisim {

std::string to_lower(std::string s) {
  std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) {
    return static_cast<char>(std::tolower(c));
  });
  return s;
}

std::string trim_copy(const std::string& s) {
  const auto not_space = [](unsigned char c) { return !std::isspace(c); };
  auto b = std::find_if(s.begin(), s.end(), not_space);
  auto e = std::find_if(s.rbegin(), s.rend(), not_space).base();
  if (b >= e) return {};
  return std::string(b, e);
}

std::string normalize_key(const std::string& s) {
  std::string out;
  out.reserve(s.size());
  for (char ch : to_lower(trim_copy(s))) {
    if (ch == ' ' || ch == '_' || ch == '-') continue;
    out.push_back(ch);
  }
  return out;
}

std::string join(const std::vector<std::string>& parts, const std::string& sep) {
  std::string out;
  for (std::size_t i = 0; i < parts.size(); ++i) {
    if (i > 0) out += sep;
    out += parts[i];
  }
  return out;
}

std::string format_fixed(double v, int digits) {
  char buf[64];
  std::snprintf(buf, sizeof(buf), "%.*f", std::max(0, digits), v);
  return buf;
}

} // namespace agrisim
