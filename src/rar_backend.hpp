#pragma once

#include "libarchive_backend.hpp"

namespace archivefile {

// RAR 4 and RAR 5 archives. Directory members carry a trailing '/'.
// Member lookups scan the archive on every call.
class RarBackend : public LibarchiveBackend {
public:
    RarBackend(const std::filesystem::path& file, std::optional<std::string> password);

    std::string name() const override { return "RarBackend"; }

    static void enable_rar_formats(struct archive* a);

    Member get_member(const MemberRef& member) override;

protected:
    void enable_formats(struct archive* a) const override;
    std::string canonical_name(struct archive_entry* entry) const override;
    Member make_member(const EntryRecord& record) const override;
};

} // namespace archivefile
