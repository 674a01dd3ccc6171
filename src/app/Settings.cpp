#include "app/Settings.hpp"
#include "util/Env.hpp"
#include "util/TomlReader.hpp"

#include <cstdlib>

namespace mediamgr::app {

std::string settings_file_path() {
  if (const char* xdg = std::getenv("XDG_CONFIG_HOME"); xdg && *xdg)
    return std::string(xdg) + "/mediamgr/settings.toml";
  if (const char* home = std::getenv("HOME"); home && *home)
    return std::string(home) + "/.config/mediamgr/settings.toml";
  return {};
}

static std::filesystem::path state_dir() {
  if (const char* xdg = std::getenv("XDG_STATE_HOME"); xdg && *xdg)
    return std::filesystem::path(xdg) / "mediamgr";
  if (const char* home = std::getenv("HOME"); home && *home)
    return std::filesystem::path(home) / ".local/state/mediamgr";
  return std::filesystem::path(".");
}

std::filesystem::path executable_dir() {
  std::error_code ec;
  auto exe = std::filesystem::read_symlink("/proc/self/exe", ec);
  if (!ec && exe.has_parent_path()) return exe.parent_path();
  auto cwd = std::filesystem::current_path(ec);
  return ec ? std::filesystem::path(".") : cwd;
}

// Resolve a bool from TOML -> env -> compiled default
static bool resolve_bool(const util::TomlReader& toml, bool have_toml,
                         const char* section, const char* key,
                         const char* env_name, bool def) {
  if (have_toml && toml.has(section, key))
    return toml.get_bool(section, key, def);
  if (env_name)
    return util::env_flag(env_name, def);
  return def;
}

// Resolve a string from TOML -> env -> compiled default
static std::string resolve_string(const util::TomlReader& toml, bool have_toml,
                                  const char* section, const char* key,
                                  const char* env_name, const std::string& def) {
  if (have_toml && toml.has(section, key))
    return toml.get_string(section, key, def);
  if (env_name) {
    const char* v = util::getenv_compat(env_name);
    if (v && *v) return std::string(v);
  }
  return def;
}

std::filesystem::path output_path(const Settings& s, const std::filesystem::path& p) {
  if (!s.test_mode || p.empty()) return p;
  auto abs = p.is_absolute() ? p : std::filesystem::absolute(p);
  // already isolated (e.g. a path under MEDIAMGR_TEST_ROOT itself)
  auto rel = abs.lexically_relative(s.test_root);
  if (!rel.empty() && *rel.begin() != "..") return abs;
  return s.test_root / abs.relative_path();
}

Settings load_settings(const std::string& path) {
  Settings s{};
  util::TomlReader toml;
  bool have_toml = !path.empty() && toml.load(path);

  // --- [storage] ---
  s.config_path   = resolve_string(toml, have_toml, "storage", "config_path",   "MEDIAMGR_STORAGE_CONFIG",
                                   (executable_dir() / "storage.toml").string());
  s.registry_path = resolve_string(toml, have_toml, "storage", "registry_path", "MEDIAMGR_REGISTRY_PATH",
                                   (state_dir() / "registry.toml").string());
  s.interactive   = resolve_bool(toml, have_toml, "storage", "interactive", "MEDIAMGR_INTERACTIVE", true);

  // --- [log] ---
  s.log_level = util::parse_log_level(resolve_string(toml, have_toml, "log", "level", "MEDIAMGR_LOG_LEVEL", "info"));
  s.log_file  = resolve_string(toml, have_toml, "log", "file", "MEDIAMGR_LOG_FILE", "");

  // Test mode is environment-only so a settings file can never enable it.
  s.test_mode = util::test_mode_enabled();
  s.test_root = util::test_root();
  s.config_path   = output_path(s, s.config_path);
  s.registry_path = output_path(s, s.registry_path);
  s.log_file      = output_path(s, s.log_file);
  return s;
}

bool apply_logging(const Settings& s) {
  auto& lg = util::Logger::instance();
  lg.set_level(s.log_level);
  if (s.log_file.empty()) return true;
  return lg.attach_file(s.log_file);
}

} // namespace mediamgr::app
