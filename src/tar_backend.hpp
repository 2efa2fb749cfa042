#pragma once

#include "libarchive_backend.hpp"

namespace archivefile {

// Plain and compressed (gzip, bzip2, xz, zstd, ...) tar archives.
// Tar has no encryption: the password is ignored.
class TarBackend : public LibarchiveBackend {
public:
    TarBackend(const std::filesystem::path& file, std::optional<std::string> password);

    std::string name() const override { return "TarBackend"; }

    static void enable_tar_formats(struct archive* a);

protected:
    void enable_formats(struct archive* a) const override;
    std::string canonical_name(struct archive_entry* entry) const override;
    std::string lookup_name(const std::string& name) const override;
    bool accepts_password() const override { return false; }
    void screen_entry(struct archive_entry* entry, const std::string& name) const override;
};

} // namespace archivefile
