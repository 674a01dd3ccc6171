#include "util/Env.hpp"

#include <cstdlib>
#include <string>

namespace mediamgr::util {

const char* getenv_compat(const char* name) {
  const char* v = std::getenv(name);
  if (v && *v) return v;
  std::string alt;
  std::string n(name);
  if (n.rfind("MEDIAMGR_", 0) == 0) {
    alt = std::string("mediamgr_") + n.substr(9);
  } else if (n.rfind("mediamgr_", 0) == 0) {
    alt = std::string("MEDIAMGR_") + n.substr(9);
  }
  if (!alt.empty()) {
    v = std::getenv(alt.c_str());
    if (v && *v) return v;
  }
  return nullptr;
}

bool env_flag(const char* name, bool defv) {
  const char* v = getenv_compat(name);
  if (!v) return defv;
  if (v[0]=='0'||v[0]=='f'||v[0]=='F'||v[0]=='n'||v[0]=='N') return false;
  return true;
}

bool test_mode_enabled() {
  return env_flag("MEDIAMGR_TEST_MODE", false);
}

std::filesystem::path test_root() {
  if (const char* r = getenv_compat("MEDIAMGR_TEST_ROOT")) return std::filesystem::path(r);
  std::error_code ec;
  auto tmp = std::filesystem::temp_directory_path(ec);
  if (ec) tmp = "/tmp";
  return tmp / "mediamgr-test";
}

} // namespace mediamgr::util
