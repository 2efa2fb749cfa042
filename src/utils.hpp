#pragma once

#include "exception.hpp"

#include <filesystem>
#include <string>
#include <string_view>

namespace archivefile {

namespace fs = std::filesystem;

// Color codes
inline constexpr std::string_view COLOR_GREEN = "\033[1;32m";
inline constexpr std::string_view COLOR_WHITE = "\033[1;37m";
inline constexpr std::string_view COLOR_YELLOW = "\033[1;33m";
inline constexpr std::string_view COLOR_RED = "\033[1;31m";
inline constexpr std::string_view COLOR_BLUE = "\033[1;34m";
inline constexpr std::string_view COLOR_RESET = "\033[0m";

// Log functions, filtered by get_log_level()
void log_debug(std::string_view msg);
void log_info(std::string_view msg);
void log_warning(std::string_view msg);
void log_error(std::string_view msg);

// Filesystem utilities
void ensure_dir_exists(const fs::path& path);

// Expands a leading '~', makes the path absolute and resolves symlinks of the existing prefix.
fs::path real_path(const fs::path& path);

// Resolves an archive-relative path under root. Throws on absolute paths and '..' components.
fs::path validate_path(const fs::path& path, const fs::path& root);

} // namespace archivefile
