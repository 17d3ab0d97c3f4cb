#include <chrono>
#include <filesystem>
#include <iostream>
#include <stdexcept>
#include <string>

#include "agrisim/util/file_io.h"

#define AGRISIM_ASSERT(expr) \
  do { \
    if (!(expr)) { \
      std::cerr << "ASSERT failed: " #expr " (" << __FILE__ << ":" << __LINE__ << ")\n"; \
      return 1; \
    } \
  } while (0)

int test_file_io() {
  namespace fs = std::filesystem;

  struct CwdGuard {
    fs::path saved;
    explicit CwdGuard(fs::path p) : saved(std::move(p)) {}
    ~CwdGuard() {
      std::error_code ec_restore;
      fs::current_path(saved, ec_restore);
    }
  };

  // Prefer the system temp dir, but fall back to the working directory.
  std::error_code ec;
  fs::path dir = fs::temp_directory_path(ec);
  if (ec || dir.empty()) dir = fs::path(".");

  const auto nonce = std::chrono::steady_clock::now().time_since_epoch().count();
  dir /= "agrisim_test_file_io";
  dir /= std::to_string(static_cast<long long>(nonce));

  fs::create_directories(dir, ec);
  AGRISIM_ASSERT(!ec);

  const fs::path target = dir / "reports" / "year.json";

  // Parent directories are created on demand.
  agrisim::write_text_file(target.string(), "{\"days\": 112}\n");
  AGRISIM_ASSERT(agrisim::read_text_file(target.string()) == "{\"days\": 112}\n");

  // Overwrites go through a temp file + rename, so the result is either the
  // old content or the new content, never a truncated partial write.
  agrisim::write_text_file(target.string(), "{\"days\": 56}\n");
  AGRISIM_ASSERT(agrisim::read_text_file(target.string()) == "{\"days\": 56}\n");

  // Relative data paths resolve from non-repo working directories too.
  const fs::path old_cwd = fs::current_path(ec);
  AGRISIM_ASSERT(!ec);
  CwdGuard cwd_guard(old_cwd);
  fs::current_path(dir, ec);
  AGRISIM_ASSERT(!ec);

  const std::string example = agrisim::read_text_file("data/configs/example.json");
  AGRISIM_ASSERT(example.find("\"kegs\"") != std::string::npos);
  AGRISIM_ASSERT(example.find("\"plots\"") != std::string::npos);

  fs::current_path(old_cwd, ec);
  AGRISIM_ASSERT(!ec);

  {
    bool threw = false;
    try {
      (void)agrisim::read_text_file((dir / "missing.json").string());
    } catch (const std::runtime_error&) {
      threw = true;
    }
    AGRISIM_ASSERT(threw);
  }

  // Ensure no temp siblings are left behind.
  const std::string tmp_prefix = target.filename().string() + ".tmp";
  for (const auto& entry : fs::directory_iterator(target.parent_path())) {
    const std::string name = entry.path().filename().string();
    const bool starts_with = name.rfind(tmp_prefix, 0) == 0;
    AGRISIM_ASSERT(!starts_with);
  }

  fs::remove_all(dir, ec);
  return 0;
}
