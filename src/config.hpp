#pragma once

#include <cstddef>
#include <filesystem>
#include <string>

namespace archivefile {

enum class LogLevel {
    DEBUG,
    INFO,
    WARNING,
    ERROR,
    QUIET
};

// Directory holding <lang>.txt message catalogues
extern std::filesystem::path L10N_DIR;

// Block size handed to libarchive when opening an archive file
inline constexpr std::size_t READ_BLOCK_SIZE = 10240;

// Chunk size used when copying member data through memory
inline constexpr std::size_t COPY_BUFFER_SIZE = 1 << 16;

// Extraction logs progress every this many entries
inline constexpr long long PROGRESS_INTERVAL = 100;

void set_l10n_dir(const std::string& dir);

void set_log_level(LogLevel level);
LogLevel get_log_level();
LogLevel parse_log_level(const std::string& name);

// Applies ARCHIVEFILE_L10N_DIR and ARCHIVEFILE_LOG_LEVEL from the environment
void init_config();

} // namespace archivefile
