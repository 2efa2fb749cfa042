#include "detect.hpp"
#include "config.hpp"
#include "rar_backend.hpp"
#include "sevenzip_backend.hpp"
#include "tar_backend.hpp"
#include "zip_backend.hpp"

#include <system_error>

namespace fs = std::filesystem;

namespace archivefile {

namespace {
    bool is_regular_file(const fs::path& path) {
        std::error_code ec;
        return fs::is_regular_file(path, ec);
    }

    // Opens path with only the given formats enabled and reads the first header.
    bool probe_libarchive(const fs::path& path, void (*enable)(struct archive*)) {
        if (!is_regular_file(path)) {
            return false;
        }
        ArchiveReadHandle a(archive_read_new());
        if (!a) {
            return false;
        }
        enable(a.get());
        if (archive_read_open_filename(a.get(), path.c_str(), READ_BLOCK_SIZE) != ARCHIVE_OK) {
            return false;
        }
        struct archive_entry* entry;
        int r = archive_read_next_header(a.get(), &entry);
        return r == ARCHIVE_OK || r == ARCHIVE_WARN || r == ARCHIVE_EOF;
    }

    [[maybe_unused]] bool libarchive_supports(int (*support)(struct archive*)) {
        ArchiveReadHandle a(archive_read_new());
        return a && support(a.get()) == ARCHIVE_OK;
    }
}

std::string to_string(ArchiveFormat format) {
    switch (format) {
        case ArchiveFormat::ZIP: return "zip";
        case ArchiveFormat::TAR: return "tar";
        case ArchiveFormat::SEVENZIP: return "7z";
        case ArchiveFormat::RAR: return "rar";
    }
    return "unknown";
}

bool format_available(ArchiveFormat format) {
    switch (format) {
        case ArchiveFormat::ZIP:
        case ArchiveFormat::TAR:
            return true;
        case ArchiveFormat::SEVENZIP:
#if ARCHIVEFILE_WITH_7Z
            return libarchive_supports(archive_read_support_format_7zip);
#else
            return false;
#endif
        case ArchiveFormat::RAR:
#if ARCHIVEFILE_WITH_RAR
            return libarchive_supports(archive_read_support_format_rar) &&
                   libarchive_supports(archive_read_support_format_rar5);
#else
            return false;
#endif
    }
    return false;
}

bool is_zipfile(const fs::path& path) {
    std::error_code ec;
    // libzip opens a zero-length file as an empty archive
    if (!is_regular_file(path) || fs::file_size(path, ec) == 0 || ec) {
        return false;
    }
    int code = 0;
    ZipHandle za(zip_open(path.c_str(), ZIP_RDONLY, &code));
    return za != nullptr;
}

bool is_tarfile(const fs::path& path) {
    return probe_libarchive(path, TarBackend::enable_tar_formats);
}

bool is_7zfile(const fs::path& path) {
    return format_available(ArchiveFormat::SEVENZIP) && probe_libarchive(path, SevenZipBackend::enable_7z_formats);
}

bool is_rarfile(const fs::path& path) {
    return format_available(ArchiveFormat::RAR) && probe_libarchive(path, RarBackend::enable_rar_formats);
}

std::optional<ArchiveFormat> detect_format(const fs::path& path) {
    if (is_zipfile(path)) return ArchiveFormat::ZIP;
    if (is_tarfile(path)) return ArchiveFormat::TAR;
    if (is_7zfile(path)) return ArchiveFormat::SEVENZIP;
    if (is_rarfile(path)) return ArchiveFormat::RAR;
    return std::nullopt;
}

bool is_archive(const fs::path& path) {
    return detect_format(path).has_value();
}

} // namespace archivefile
