#include "utils.hpp"

#include "config.hpp"
#include "exception.hpp"
#include "localization.hpp"

#include <unistd.h>

#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <mutex>

namespace archivefile {

namespace {
    std::mutex log_mutex;
    bool is_stdout_tty = false;
    bool is_stderr_tty = false;
    bool tty_check_performed = false;

    // Helper function to reduce code duplication in logging
    void log_internal(LogLevel level, std::string_view prefix, std::string_view color, std::string_view msg, std::ostream& stream) {
        if (level < get_log_level()) {
            return;
        }

        std::lock_guard<std::mutex> lock(log_mutex);

        if (!tty_check_performed) {
            is_stdout_tty = isatty(STDOUT_FILENO);
            is_stderr_tty = isatty(STDERR_FILENO);
            tty_check_performed = true;
        }

        bool current_stream_is_tty = false;
        if (&stream == &std::cout) {
            current_stream_is_tty = is_stdout_tty;
        } else if (&stream == &std::cerr) {
            current_stream_is_tty = is_stderr_tty;
        }

        if (current_stream_is_tty) {
            stream << color << prefix << COLOR_WHITE << msg << COLOR_RESET << std::endl;
        } else {
            stream << prefix << msg << std::endl;
        }
    }
}

void log_debug(std::string_view msg) {
    log_internal(LogLevel::DEBUG, get_string("debug.prefix"), COLOR_BLUE, msg, std::cout);
}

void log_info(std::string_view msg) {
    log_internal(LogLevel::INFO, get_string("info.log_prefix"), COLOR_GREEN, msg, std::cout);
}

void log_warning(std::string_view msg) {
    log_internal(LogLevel::WARNING, get_string("warning.prefix") + " ", COLOR_YELLOW, msg, std::cerr);
}

void log_error(std::string_view msg) {
    log_internal(LogLevel::ERROR, get_string("error.prefix") + " ", COLOR_RED, msg, std::cerr);
}

void ensure_dir_exists(const fs::path& path) {
    if (!fs::exists(path)) {
        std::error_code ec;
        if (!fs::create_directories(path, ec) && ec) {
            throw ArchiveFileException(string_format("error.create_dir_failed", path.string()) + ": " + ec.message());
        }
    }
    else if (!fs::is_directory(path)) {
        throw ArchiveFileException(string_format("error.path_not_dir", path.string()));
    }
}

fs::path real_path(const fs::path& path) {
    fs::path expanded = path;
    std::string raw = path.string();
    if (raw == "~" || raw.starts_with("~/")) {
        if (const char* home = getenv("HOME"); home && *home) {
            expanded = fs::path(home) / raw.substr(raw.size() > 1 ? 2 : 1);
        }
    }

    std::error_code ec;
    fs::path absolute = fs::absolute(expanded, ec);
    if (ec) {
        return expanded.lexically_normal();
    }
    fs::path resolved = fs::weakly_canonical(absolute, ec);
    if (ec) {
        return absolute.lexically_normal();
    }
    return resolved;
}

fs::path validate_path(const fs::path& path, const fs::path& root) {
    if (path.is_absolute() || path.has_root_directory()) {
        throw ArchiveFileException(get_string("reason.absolute_path"));
    }

    fs::path normalized = path.lexically_normal();
    for (const auto& component : normalized) {
        if (component == "..") {
            throw ArchiveFileException(get_string("reason.path_traversal"));
        }
    }
    return root / normalized;
}

} // namespace archivefile
