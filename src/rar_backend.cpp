#include "rar_backend.hpp"
#include "exception.hpp"

namespace archivefile {

RarBackend::RarBackend(const std::filesystem::path& file, std::optional<std::string> password)
    : LibarchiveBackend(file, std::move(password)) {
    open();
}

void RarBackend::enable_rar_formats(struct archive* a) {
    archive_read_support_format_rar(a);
    archive_read_support_format_rar5(a);
}

void RarBackend::enable_formats(struct archive* a) const {
    enable_rar_formats(a);
}

std::string RarBackend::canonical_name(struct archive_entry* entry) const {
    const char* path = archive_entry_pathname_utf8(entry);
    if (!path) path = archive_entry_pathname(entry);
    std::string name = path ? path : "";
    if (archive_entry_filetype(entry) == AE_IFDIR && !name.ends_with('/')) {
        name += '/';
    }
    return name;
}

Member RarBackend::make_member(const EntryRecord& record) const {
    Member member = LibarchiveBackend::make_member(record);
    member.is_dir = record.name.ends_with('/');
    member.is_file = !member.is_dir;
    if (member.is_dir) {
        member.size = 0;
        member.compressed_size = 0;
    }
    return member;
}

Member RarBackend::get_member(const MemberRef& member) {
    std::string name = resolve_name(member);
    struct archive* a = rewind();
    std::optional<EntryRecord> found;
    while (struct archive_entry* entry = seek_entry(a, name)) {
        found = make_record(entry);
        check_status(a, archive_read_data_skip(a), name);
    }
    if (!found) {
        throw ArchiveMemberNotFound(name, file());
    }
    return make_member(*found);
}

} // namespace archivefile
