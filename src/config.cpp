#include "config.hpp"

#include <algorithm>
#include <atomic>
#include <cctype>
#include <cstdlib>

namespace fs = std::filesystem;

#ifndef ARCHIVEFILE_L10N_DIR
#define ARCHIVEFILE_L10N_DIR "/usr/share/archivefile/l10n/"
#endif

namespace archivefile {

fs::path L10N_DIR = ARCHIVEFILE_L10N_DIR;

namespace {
    std::atomic<LogLevel> log_level{LogLevel::WARNING};
}

void set_l10n_dir(const std::string& dir) {
    L10N_DIR = fs::path(dir).lexically_normal();
    if (L10N_DIR.empty()) L10N_DIR = ARCHIVEFILE_L10N_DIR;
}

void set_log_level(LogLevel level) {
    log_level = level;
}

LogLevel get_log_level() {
    return log_level;
}

LogLevel parse_log_level(const std::string& name) {
    std::string lowered = name;
    std::transform(lowered.begin(), lowered.end(), lowered.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (lowered == "debug") return LogLevel::DEBUG;
    if (lowered == "info") return LogLevel::INFO;
    if (lowered == "error") return LogLevel::ERROR;
    if (lowered == "quiet") return LogLevel::QUIET;
    return LogLevel::WARNING;
}

void init_config() {
    if (const char* dir = getenv("ARCHIVEFILE_L10N_DIR"); dir && *dir) {
        set_l10n_dir(dir);
    }
    if (const char* level = getenv("ARCHIVEFILE_LOG_LEVEL"); level && *level) {
        set_log_level(parse_log_level(level));
    }
}

} // namespace archivefile
