#include "libarchive_backend.hpp"
#include "config.hpp"
#include "exception.hpp"
#include "localization.hpp"
#include "utils.hpp"

#include <cstring>

namespace fs = std::filesystem;

namespace archivefile {

namespace {
    constexpr int EXTRACT_FLAGS =
        ARCHIVE_EXTRACT_TIME |
        ARCHIVE_EXTRACT_PERM |
        ARCHIVE_EXTRACT_SECURE_SYMLINKS |
        ARCHIVE_EXTRACT_SECURE_NODOTDOT |
        ARCHIVE_EXTRACT_UNLINK;

    constexpr int MAX_LINK_DEPTH = 32;

    std::string error_string(struct archive* a) {
        const char* err = archive_error_string(a);
        return err ? err : get_string("error.unknown");
    }

    // "./dir//a.txt/" and "dir/a.txt" name the same member
    std::string normalize_member_path(const std::string& name) {
        std::string normal = fs::path(name).lexically_normal().generic_string();
        while (normal.size() > 1 && normal.back() == '/') {
            normal.pop_back();
        }
        return normal;
    }
}

void MemorySink::write_at(std::int64_t offset, const void* data, std::size_t size) {
    if (offset < 0 || size == 0) {
        return;
    }
    const auto start = static_cast<std::size_t>(offset);
    if (buffer_.size() < start + size) {
        buffer_.resize(start + size, '\0');
    }
    std::memcpy(buffer_.data() + start, data, size);
}

LibarchiveBackend::LibarchiveBackend(const fs::path& file, std::optional<std::string> password)
    : ArchiveBackend(file, std::move(password)) {}

void LibarchiveBackend::open() {
    reader_ = new_reader();
    records_.clear();

    struct archive_entry* entry;
    while (true) {
        int r = archive_read_next_header(reader_.get(), &entry);
        if (r == ARCHIVE_EOF) break;
        check_status(reader_.get(), r);
        records_.push_back(make_record(entry));
        check_status(reader_.get(), archive_read_data_skip(reader_.get()), records_.back().name);
    }
}

ArchiveReadHandle LibarchiveBackend::new_reader() const {
    ArchiveReadHandle a(archive_read_new());
    if (!a) {
        throw ArchiveReadError(file(), get_string("error.out_of_memory"));
    }
    enable_formats(a.get());

    if (accepts_password() && password() && !password()->empty()) {
        if (archive_read_add_passphrase(a.get(), password()->c_str()) != ARCHIVE_OK) {
            throw ArchiveReadError(file(), get_string("error.passphrase_failed"));
        }
    }

    if (archive_read_open_filename(a.get(), file().c_str(), READ_BLOCK_SIZE) != ARCHIVE_OK) {
        throw ArchiveReadError(file(), error_string(a.get()));
    }
    return a;
}

struct archive* LibarchiveBackend::rewind() {
    if (closed_) {
        throw ArchiveClosed(file());
    }
    reader_ = new_reader();
    return reader_.get();
}

void LibarchiveBackend::check_status(struct archive* a, int status) const {
    if (status == ARCHIVE_OK || status == ARCHIVE_EOF) return;
    if (status == ARCHIVE_WARN) {
        log_warning(string_format("warning.codec", file().generic_string(), error_string(a)));
        return;
    }
    throw ArchiveReadError(file(), error_string(a));
}

void LibarchiveBackend::check_status(struct archive* a, int status, const std::string& member) const {
    if (status == ARCHIVE_OK || status == ARCHIVE_EOF) return;
    if (status == ARCHIVE_WARN) {
        log_warning(string_format("warning.codec", member, error_string(a)));
        return;
    }
    throw ArchiveReadError(file(), member, error_string(a));
}

LibarchiveBackend::EntryRecord LibarchiveBackend::make_record(struct archive_entry* entry) const {
    EntryRecord record;
    record.name = canonical_name(entry);
    if (archive_entry_size_is_set(entry) && archive_entry_size(entry) > 0) {
        record.size = static_cast<std::uint64_t>(archive_entry_size(entry));
    }
    record.filetype = archive_entry_filetype(entry);
    if (const char* link = archive_entry_hardlink(entry)) {
        record.hardlink = link;
    }
    if (const char* link = archive_entry_symlink(entry)) {
        record.symlink = link;
    }
    return record;
}

Member LibarchiveBackend::make_member(const EntryRecord& record) const {
    Member member;
    member.name = record.name;
    member.is_dir = record.filetype == AE_IFDIR;
    member.is_file = !member.is_dir;
    member.size = member.is_dir ? 0 : record.size;
    member.compressed_size = member.size;
    return member;
}

const LibarchiveBackend::EntryRecord* LibarchiveBackend::find_record(const std::string& name) const {
    for (auto it = records_.rbegin(); it != records_.rend(); ++it) {
        if (it->name == name) {
            return &*it;
        }
    }
    return nullptr;
}

// Searches the entries stored before limit, or the whole archive when limit is null
const LibarchiveBackend::EntryRecord* LibarchiveBackend::find_link_target(const std::string& target,
                                                                          const EntryRecord* limit) const {
    const std::string wanted = normalize_member_path(target);
    std::size_t end = limit ? static_cast<std::size_t>(limit - records_.data()) : records_.size();
    while (end > 0) {
        const EntryRecord& record = records_[--end];
        if (normalize_member_path(record.name) == wanted) {
            return &record;
        }
    }
    return nullptr;
}

const LibarchiveBackend::EntryRecord& LibarchiveBackend::resolve_link(const EntryRecord& record) const {
    const EntryRecord* current = &record;
    for (int depth = 0; depth < MAX_LINK_DEPTH; ++depth) {
        std::string target;
        const EntryRecord* found = nullptr;
        if (!current->hardlink.empty()) {
            target = current->hardlink;
            found = find_link_target(target, current);
        } else if (current->filetype == AE_IFLNK) {
            target = (fs::path(current->name).parent_path() / current->symlink).generic_string();
            found = find_link_target(target, nullptr);
        } else {
            return *current;
        }
        if (!found) {
            throw ArchiveReadError(file(), record.name, string_format("error.link_target_missing", target));
        }
        current = found;
    }
    throw ArchiveReadError(file(), record.name, get_string("error.link_loop"));
}

ArchiveReadHandle LibarchiveBackend::open_record(const EntryRecord& record) const {
    ArchiveReadHandle a = new_reader();
    const auto index = static_cast<std::size_t>(&record - records_.data());
    struct archive_entry* entry;
    for (std::size_t i = 0;; ++i) {
        int r = archive_read_next_header(a.get(), &entry);
        if (r == ARCHIVE_EOF) {
            throw ArchiveMemberNotFound(record.name, file());
        }
        check_status(a.get(), r);
        if (i == index) {
            return a;
        }
        check_status(a.get(), archive_read_data_skip(a.get()), record.name);
    }
}

struct archive_entry* LibarchiveBackend::seek_entry(struct archive* a, const std::string& key) {
    struct archive_entry* entry;
    while (true) {
        int r = archive_read_next_header(a, &entry);
        if (r == ARCHIVE_EOF) return nullptr;
        check_status(a, r);
        if (canonical_name(entry) == key) {
            return entry;
        }
        check_status(a, archive_read_data_skip(a));
    }
}

std::string LibarchiveBackend::read_entry_data(struct archive* a, const std::string& member) const {
    std::string content;
    std::vector<char> buffer(COPY_BUFFER_SIZE);
    while (true) {
        la_ssize_t n = archive_read_data(a, buffer.data(), buffer.size());
        if (n == 0) break;
        if (n < 0) {
            check_status(a, static_cast<int>(n), member);
            break;
        }
        content.append(buffer.data(), static_cast<std::size_t>(n));
    }
    return content;
}

Member LibarchiveBackend::get_member(const MemberRef& member) {
    if (closed_) throw ArchiveClosed(file());
    std::string name = lookup_name(resolve_name(member));
    const EntryRecord* record = find_record(name);
    if (!record) {
        throw ArchiveMemberNotFound(name, file());
    }
    return make_member(*record);
}

std::vector<Member> LibarchiveBackend::get_members() {
    if (closed_) throw ArchiveClosed(file());
    std::vector<Member> members;
    members.reserve(records_.size());
    for (const auto& record : records_) {
        members.push_back(make_member(record));
    }
    return members;
}

std::vector<std::string> LibarchiveBackend::get_names() {
    if (closed_) throw ArchiveClosed(file());
    std::vector<std::string> names;
    names.reserve(records_.size());
    for (const auto& record : records_) {
        names.push_back(record.name);
    }
    return names;
}

fs::path LibarchiveBackend::extract(const MemberRef& member, const fs::path& destination) {
    if (closed_) throw ArchiveClosed(file());
    std::string name = lookup_name(resolve_name(member));
    const EntryRecord* record = find_record(name);
    if (!record) {
        throw ArchiveMemberNotFound(name, file());
    }

    fs::path target_dir = prepare_destination(destination);
    const std::unordered_set<std::string> selected{record->name};
    extract_entries(target_dir, &selected);
    return target_dir / record->name;
}

fs::path LibarchiveBackend::extractall(const fs::path& destination, const std::optional<std::vector<MemberRef>>& members) {
    if (closed_) throw ArchiveClosed(file());
    if (!members) {
        fs::path target_dir = prepare_destination(destination);
        extract_entries(target_dir, nullptr);
        return target_dir;
    }

    std::vector<MemberRef> lookups;
    lookups.reserve(members->size());
    for (const auto& member : *members) {
        lookups.emplace_back(lookup_name(resolve_name(member)));
    }
    std::vector<std::string> names = validate_members(lookups, get_names(), file());
    fs::path target_dir = prepare_destination(destination);
    const std::unordered_set<std::string> selected(names.begin(), names.end());
    if (!selected.empty()) {
        extract_entries(target_dir, &selected);
    }
    return target_dir;
}

std::string LibarchiveBackend::read_bytes(const MemberRef& member) {
    if (closed_) throw ArchiveClosed(file());
    std::string name = lookup_name(resolve_name(member));
    const EntryRecord* record = find_record(name);
    if (!record) {
        throw ArchiveMemberNotFound(name, file());
    }
    if (make_member(*record).is_dir) {
        throw ArchiveMemberNotAFile(name, file());
    }

    const EntryRecord& target = resolve_link(*record);
    if (make_member(target).is_dir) {
        throw ArchiveMemberNotAFile(name, file());
    }
    ArchiveReadHandle a = open_record(target);
    return read_entry_data(a.get(), name);
}

void LibarchiveBackend::close() noexcept {
    reader_.reset();
    records_.clear();
    closed_ = true;
}

void LibarchiveBackend::screen_entry(struct archive_entry* entry, const std::string& name) const {
    if (archive_entry_filetype(entry) != AE_IFLNK) {
        return;
    }
    const char* link = archive_entry_symlink(entry);
    if (!link) {
        return;
    }

    fs::path target(link);
    if (target.is_absolute()) {
        throw UnsafeArchiveMember(name, file(), get_string("reason.absolute_link"));
    }
    fs::path resolved = (fs::path(name).parent_path() / target).lexically_normal();
    if (!resolved.empty() && *resolved.begin() == "..") {
        throw UnsafeArchiveMember(name, file(), get_string("reason.link_outside"));
    }
}

void LibarchiveBackend::extract_entries(const fs::path& destination, const std::unordered_set<std::string>* selected) {
    struct archive* a = rewind();

    ArchiveWriteHandle disk(archive_write_disk_new());
    if (!disk) {
        throw ArchiveReadError(file(), get_string("error.out_of_memory"));
    }
    archive_write_disk_set_options(disk.get(), EXTRACT_FLAGS);

    // Every copy of a selected name is written in archive order, so the last one stays on disk
    std::size_t remaining = 0;
    if (selected) {
        for (const auto& record : records_) {
            if (selected->contains(record.name)) ++remaining;
        }
    }

    std::unordered_set<std::string> written;
    struct archive_entry* entry;
    std::size_t index = 0;
    long long count = 0;
    while (true) {
        int r = archive_read_next_header(a, &entry);
        if (r == ARCHIVE_EOF) break;
        check_status(a, r);
        const EntryRecord* record = index < records_.size() ? &records_[index] : nullptr;
        ++index;

        std::string name = canonical_name(entry);
        if (selected && !selected->contains(name)) {
            check_status(a, archive_read_data_skip(a), name);
            continue;
        }

        // A hard link whose target is not on disk from this pass becomes a copy of the target
        if (record && !record->hardlink.empty() && !written.contains(normalize_member_path(record->hardlink))) {
            const EntryRecord& target = resolve_link(*record);
            ArchiveReadHandle source = open_record(target);
            const std::string content = read_entry_data(source.get(), target.name);
            archive_entry_set_hardlink(entry, nullptr);
            archive_entry_set_filetype(entry, AE_IFREG);
            archive_entry_set_size(entry, static_cast<la_int64_t>(content.size()));
            write_entry(a, disk.get(), entry, name, destination, &content);
        } else {
            write_entry(a, disk.get(), entry, name, destination);
        }
        written.insert(normalize_member_path(name));

        if (++count % PROGRESS_INTERVAL == 0) {
            log_info(string_format("info.extracting", count));
        }
        if (selected && --remaining == 0) {
            break;
        }
    }

    log_info(string_format("info.extract_complete", count));
}

void LibarchiveBackend::write_entry(struct archive* a, struct archive* disk, struct archive_entry* entry,
                                    const std::string& name, const fs::path& destination,
                                    const std::string* content) const {
    // SECURITY: Path traversal vulnerability mitigation.
    fs::path dest_path;
    try {
        dest_path = validate_path(name, destination);
    } catch (const ArchiveFileException& e) {
        throw UnsafeArchiveMember(name, file(), e.what());
    }
    screen_entry(entry, name);

    archive_entry_set_pathname(entry, dest_path.c_str());

    // Hardlink targets are archive paths too
    if (const char* hardlink = archive_entry_hardlink(entry)) {
        fs::path link_dest;
        try {
            link_dest = validate_path(hardlink, destination);
        } catch (const ArchiveFileException&) {
            throw UnsafeArchiveMember(name, file(), get_string("reason.link_outside"));
        }
        archive_entry_set_hardlink(entry, link_dest.c_str());
    }

    int r = archive_write_header(disk, entry);
    if (r < ARCHIVE_OK) {
        if (r < ARCHIVE_WARN) {
            throw ArchiveReadError(file(), name, error_string(disk));
        }
        log_warning(string_format("warning.codec", name, error_string(disk)));
        return;
    }

    if (content) {
        if (!content->empty() && archive_write_data(disk, content->data(), content->size()) < 0) {
            throw ArchiveReadError(file(), name, error_string(disk));
        }
    }

    const void* buff;
    size_t size;
    la_int64_t offset;
    while (!content) {
        r = archive_read_data_block(a, &buff, &size, &offset);
        if (r == ARCHIVE_EOF) break;
        if (r < ARCHIVE_OK) {
            check_status(a, r, name);
            break;
        }
        if (archive_write_data_block(disk, buff, size, offset) < ARCHIVE_OK) {
            throw ArchiveReadError(file(), name, error_string(disk));
        }
    }

    r = archive_write_finish_entry(disk);
    if (r < ARCHIVE_WARN) {
        throw ArchiveReadError(file(), name, error_string(disk));
    }
}

} // namespace archivefile
