// Helpers for reading /proc and /sys with optional root remap
#pragma once
#include <optional>
#include <string>

namespace ifwatch::util {

// Map an absolute /proc path to an alternate root if IFWATCH_PROC_ROOT is set
auto map_proc_path(const std::string& abs) -> std::string;

// Map an absolute /sys path to an alternate root if IFWATCH_SYS_ROOT is set
auto map_sys_path(const std::string& abs) -> std::string;

// Read entire file as string. Returns std::nullopt on error.
auto read_file_string(const std::string& abs) -> std::optional<std::string>;

// True if the path (after /proc or /sys remap) exists.
auto path_exists(const std::string& abs) -> bool;

} // namespace ifwatch::util
