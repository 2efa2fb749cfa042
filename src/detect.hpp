#pragma once

#include <filesystem>
#include <optional>
#include <string>

namespace archivefile {

enum class ArchiveFormat {
    ZIP,
    TAR,
    SEVENZIP,
    RAR
};

std::string to_string(ArchiveFormat format);

// Whether the backend for format was built in and is supported by the installed codec library.
bool format_available(ArchiveFormat format);

// Content based detectors. They never throw and return false for anything
// that is not a readable regular file.
bool is_zipfile(const std::filesystem::path& path);
bool is_tarfile(const std::filesystem::path& path);
bool is_7zfile(const std::filesystem::path& path);
bool is_rarfile(const std::filesystem::path& path);

// Runs the detectors in the order ZIP, TAR, 7z, RAR.
std::optional<ArchiveFormat> detect_format(const std::filesystem::path& path);

bool is_archive(const std::filesystem::path& path);

} // namespace archivefile
