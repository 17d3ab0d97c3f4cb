#pragma once

#include <string>

namespace agrisim {

// Finds a config, save or overrides file. Absolute paths and paths that exist
// from the working directory are returned unchanged; otherwise the source
// tree (AGRISIM_SOURCE_DIR) and the parents of the working directory are
// tried, so `data/configs/example.json` works from a build directory.
// Returns `path` unchanged when nothing matches.
std::string resolve_data_path(const std::string& path);

// Reads a whole file (after resolve_data_path). Throws std::runtime_error.
std::string read_text_file(const std::string& path);

// Writes a report file, creating parent directories. The text is written to
// "<path>.tmp" and renamed over `path`, so a failed write never leaves a
// truncated report behind. Throws std::runtime_error.
void write_text_file(const std::string& path, const std::string& contents);

} // namespace agrisim
