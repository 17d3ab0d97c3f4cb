#include "agrisim/util/file_io.h"

#include <filesystem>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <vector>

namespace agrisim {

namespace fs = std::filesystem;

namespace {

constexpr int kParentSearchDepth = 6;

bool is_file(const fs::path& p) {
  std::error_code ec;
  return fs::is_regular_file(p, ec) && !ec;
}

std::vector<fs::path> search_roots() {
  std::vector<fs::path> roots;
#ifdef AGRISIM_SOURCE_DIR
  roots.emplace_back(AGRISIM_SOURCE_DIR);
#endif
  std::error_code ec;
  fs::path dir = fs::current_path(ec);
  for (int depth = 0; !ec && !dir.empty() && depth < kParentSearchDepth; ++depth) {
    const fs::path parent = dir.parent_path();
    if (parent == dir) break;
    roots.push_back(parent);
    dir = parent;
  }
  return roots;
}

} // namespace

std::string resolve_data_path(const std::string& path) {
  const fs::path requested(path);
  if (requested.empty() || requested.is_absolute() || is_file(requested)) return path;
  for (const auto& root : search_roots()) {
    if (is_file(root / requested)) return (root / requested).string();
  }
  return path;
}

std::string read_text_file(const std::string& path) {
  const std::string resolved = resolve_data_path(path);
  std::ifstream in(resolved, std::ios::binary);
  if (!in) throw std::runtime_error("Failed to open file for reading: " + path);
  std::ostringstream ss;
  ss << in.rdbuf();
  if (in.bad()) throw std::runtime_error("Failed to read file: " + resolved);
  return ss.str();
}

void write_text_file(const std::string& path, const std::string& contents) {
  const fs::path target(path);
  std::error_code ec;
  if (target.has_parent_path()) {
    fs::create_directories(target.parent_path(), ec);
    if (ec) throw std::runtime_error("Failed to create directory for " + path + ": " + ec.message());
  }

  fs::path staging = target;
  staging += ".tmp";
  {
    std::ofstream out(staging, std::ios::binary | std::ios::trunc);
    out << contents;
    out.flush();
    if (!out) {
      fs::remove(staging, ec);
      throw std::runtime_error("Failed to write file: " + staging.string());
    }
  }

  fs::rename(staging, target, ec);
  if (ec) {
    const std::string reason = ec.message();
    fs::remove(staging, ec);
    throw std::runtime_error("Failed to replace file: " + path + " (" + reason + ")");
  }
}

} // namespace agrisim
