#pragma once

#include <filesystem>
#include <string>

namespace mediamgr::util {

// getenv that also accepts the lowercase "mediamgr_" spelling of a
// "MEDIAMGR_" variable (and vice versa). Empty values count as unset.
const char* getenv_compat(const char* name);
bool env_flag(const char* name, bool defv);

// MEDIAMGR_TEST_MODE: suppress live probing and real-filesystem writes.
[[nodiscard]] bool test_mode_enabled();

// Isolated root used while test mode is on: MEDIAMGR_TEST_ROOT or
// <tmp>/mediamgr-test.
[[nodiscard]] std::filesystem::path test_root();

} // namespace mediamgr::util
