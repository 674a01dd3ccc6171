#pragma once

#include "util/Log.hpp"
#include <filesystem>
#include <string>

namespace mediamgr::app {

// Resolved once at startup and passed by value; nothing here is global.
struct Settings {
  std::filesystem::path config_path;    // storage configuration file
  std::filesystem::path registry_path;  // diagnostic registry export
  bool interactive{true};               // prompt before sharing a serial across groups
  util::LogLevel log_level{util::LogLevel::Info};
  std::filesystem::path log_file;       // empty: stderr only
  bool test_mode{false};
  std::filesystem::path test_root;
};

// $XDG_CONFIG_HOME/mediamgr/settings.toml or ~/.config/mediamgr/settings.toml
std::string settings_file_path();

// Directory holding the running executable (falls back to the cwd).
std::filesystem::path executable_dir();

// Resolve every setting from TOML -> env -> compiled default. In test mode
// every output path is rebased under the isolated test root.
Settings load_settings(const std::string& path = settings_file_path());

// Path a writer should use for p: unchanged normally, rebased under
// test_root in test mode. Command-line overrides go through this too.
std::filesystem::path output_path(const Settings& s, const std::filesystem::path& p);

// Apply level and mirror file to the process logger. False if the log
// file could not be opened (stderr logging still works).
bool apply_logging(const Settings& s);

} // namespace mediamgr::app
