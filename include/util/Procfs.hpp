// Helpers for reading /proc, /sys and /run with optional root remap
#pragma once
#include <optional>
#include <string>
#include <vector>

namespace mediamgr::util {

// Map an absolute /proc path to an alternate root if MEDIAMGR_PROC_ROOT is set
auto map_proc_path(const std::string& abs) -> std::string;

// Map an absolute /sys path to an alternate root if MEDIAMGR_SYS_ROOT is set
auto map_sys_path(const std::string& abs) -> std::string;

// Map an absolute /run path to an alternate root if MEDIAMGR_RUN_ROOT is set
auto map_run_path(const std::string& abs) -> std::string;

// Apply whichever of the three mappings matches the path prefix.
auto map_path(const std::string& abs) -> std::string;

// True when the system roots are real (no remap and no test mode).
[[nodiscard]] auto live_roots() -> bool;

// Read entire file as string. Returns std::nullopt on error.
auto read_file_string(const std::string& abs) -> std::optional<std::string>;

// First line of a file with surrounding whitespace removed.
auto read_first_line(const std::string& abs) -> std::optional<std::string>;

// List directory entries (names only). Returns empty vector on error.
auto list_dir(const std::string& abs) -> std::vector<std::string>;

[[nodiscard]] auto path_exists(const std::string& abs) -> bool;

} // namespace mediamgr::util
