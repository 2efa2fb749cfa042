#pragma once

#include "libarchive_backend.hpp"

namespace archivefile {

// 7-Zip archives. Member names carry no trailing '/', and a trailing '/' on a
// reference is ignored.
class SevenZipBackend : public LibarchiveBackend {
public:
    SevenZipBackend(const std::filesystem::path& file, std::optional<std::string> password);

    std::string name() const override { return "SevenZipBackend"; }

    static void enable_7z_formats(struct archive* a);

    Member get_member(const MemberRef& member) override;
    std::string read_bytes(const MemberRef& member) override;

protected:
    void enable_formats(struct archive* a) const override;
    std::string canonical_name(struct archive_entry* entry) const override;
    std::string lookup_name(const std::string& name) const override;
};

} // namespace archivefile
