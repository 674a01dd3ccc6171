#include "util/Procfs.hpp"
#include "util/Env.hpp"

#include <sys/types.h>
#include <dirent.h>
#include <unistd.h>

#include <cctype>
#include <cstring>
#include <filesystem>
#include <fstream>

namespace mediamgr::util {

// In test mode an unset root points into the isolated test tree so live
// devices are never probed.
static std::string root_for(const char* env_name) {
  const char* env = getenv_compat(env_name);
  if (env && *env) return std::string(env);
  if (test_mode_enabled()) return test_root().string();
  return std::string();
}

static std::string remap(const std::string& abs, const char* prefix, const char* env_name) {
  if (abs.rfind(prefix, 0) != 0) return abs;
  auto root = root_for(env_name);
  if (root.empty()) return abs;
  std::filesystem::path p(root);
  p /= std::filesystem::path(abs.substr(1)); // drop leading '/'
  return p.string();
}

auto map_proc_path(const std::string& abs) -> std::string {
  return remap(abs, "/proc", "MEDIAMGR_PROC_ROOT");
}

auto map_sys_path(const std::string& abs) -> std::string {
  return remap(abs, "/sys", "MEDIAMGR_SYS_ROOT");
}

auto map_run_path(const std::string& abs) -> std::string {
  return remap(abs, "/run", "MEDIAMGR_RUN_ROOT");
}

auto map_path(const std::string& abs) -> std::string {
  if (abs.rfind("/proc", 0) == 0) return map_proc_path(abs);
  if (abs.rfind("/sys", 0) == 0) return map_sys_path(abs);
  if (abs.rfind("/run", 0) == 0) return map_run_path(abs);
  return abs;
}

auto live_roots() -> bool {
  return root_for("MEDIAMGR_PROC_ROOT").empty() && root_for("MEDIAMGR_SYS_ROOT").empty() &&
         root_for("MEDIAMGR_RUN_ROOT").empty();
}

auto read_file_string(const std::string& abs) -> std::optional<std::string> {
  std::ifstream in(map_path(abs));
  if (!in) return std::nullopt;
  try {
    std::string s((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
    return s;
  } catch (const std::exception&) {
    // File disappeared or became unreadable between open and read
    return std::nullopt;
  }
}

auto read_first_line(const std::string& abs) -> std::optional<std::string> {
  auto txt = read_file_string(abs);
  if (!txt) return std::nullopt;
  std::string line = txt->substr(0, txt->find('\n'));
  size_t b = 0, e = line.size();
  while (b < e && std::isspace(static_cast<unsigned char>(line[b]))) ++b;
  while (e > b && std::isspace(static_cast<unsigned char>(line[e-1]))) --e;
  return line.substr(b, e - b);
}

auto list_dir(const std::string& abs) -> std::vector<std::string> {
  std::vector<std::string> out;
  auto path = map_path(abs);
  DIR* d = ::opendir(path.c_str());
  if (!d) return out;
  while (auto* ent = ::readdir(d)) {
    const char* name = ent->d_name;
    if (std::strcmp(name, ".") == 0 || std::strcmp(name, "..") == 0) continue;
    out.emplace_back(name);
  }
  ::closedir(d);
  return out;
}

auto path_exists(const std::string& abs) -> bool {
  std::error_code ec;
  return std::filesystem::exists(map_path(abs), ec);
}

} // namespace mediamgr::util
