#include "sevenzip_backend.hpp"
#include "exception.hpp"

#include <algorithm>

namespace archivefile {

namespace {
    std::string strip_trailing_slash(std::string name) {
        while (name.size() > 1 && name.back() == '/') {
            name.pop_back();
        }
        return name;
    }
}

SevenZipBackend::SevenZipBackend(const std::filesystem::path& file, std::optional<std::string> password)
    : LibarchiveBackend(file, std::move(password)) {
    open();
}

void SevenZipBackend::enable_7z_formats(struct archive* a) {
    archive_read_support_format_7zip(a);
}

void SevenZipBackend::enable_formats(struct archive* a) const {
    enable_7z_formats(a);
}

std::string SevenZipBackend::canonical_name(struct archive_entry* entry) const {
    const char* path = archive_entry_pathname_utf8(entry);
    if (!path) path = archive_entry_pathname(entry);
    return strip_trailing_slash(path ? path : "");
}

std::string SevenZipBackend::lookup_name(const std::string& name) const {
    return strip_trailing_slash(name);
}

// There is no single-entry lookup in 7z: scan the whole listing.
Member SevenZipBackend::get_member(const MemberRef& member) {
    std::string name = lookup_name(resolve_name(member));
    std::vector<Member> members = get_members();
    auto it = std::find_if(members.rbegin(), members.rend(),
                           [&name](const Member& m) { return m.name == name; });
    if (it == members.rend()) {
        throw ArchiveMemberNotFound(name, file());
    }
    return *it;
}

// Decoded data blocks are routed into a MemorySink, then handed back as bytes.
std::string SevenZipBackend::read_bytes(const MemberRef& member) {
    Member info = get_member(member);
    if (info.is_dir) {
        throw ArchiveMemberNotAFile(info.name, file());
    }

    const EntryRecord* record = find_record(info.name);
    if (!record) {
        throw ArchiveMemberNotFound(info.name, file());
    }
    const EntryRecord& target = resolve_link(*record);
    if (make_member(target).is_dir) {
        throw ArchiveMemberNotAFile(info.name, file());
    }
    ArchiveReadHandle reader = open_record(target);
    struct archive* a = reader.get();

    MemorySink sink;
    const void* buff;
    size_t size;
    la_int64_t offset;
    while (true) {
        int r = archive_read_data_block(a, &buff, &size, &offset);
        if (r == ARCHIVE_EOF) break;
        if (r < ARCHIVE_OK) {
            check_status(a, r, info.name);
            break;
        }
        sink.write_at(offset, buff, size);
    }
    return sink.release();
}

} // namespace archivefile
