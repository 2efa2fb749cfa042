#pragma once

#include "backend.hpp"

#include <archive.h>
#include <archive_entry.h>

#include <cstdint>
#include <memory>
#include <string>
#include <unordered_set>
#include <vector>

namespace archivefile {

// Custom deleters for libarchive handles
struct ArchiveReadDeleter {
    void operator()(struct archive* a) const {
        if (a) {
            archive_read_close(a);
            archive_read_free(a);
        }
    }
};

struct ArchiveWriteDeleter {
    void operator()(struct archive* a) const {
        if (a) {
            archive_write_close(a);
            archive_write_free(a);
        }
    }
};

using ArchiveReadHandle = std::unique_ptr<struct archive, ArchiveReadDeleter>;
using ArchiveWriteHandle = std::unique_ptr<struct archive, ArchiveWriteDeleter>;

// Positioned writes into a growing in-memory buffer. libarchive hands out data
// blocks with their offset, so holes are zero-filled.
class MemorySink {
public:
    void write_at(std::int64_t offset, const void* data, std::size_t size);
    std::size_t size() const { return buffer_.size(); }
    std::string release() { return std::move(buffer_); }

private:
    std::string buffer_;
};

// Shared plumbing for the formats read through libarchive. libarchive only
// streams forward, so every operation re-opens the read state; the entry
// listing is indexed once when the archive is opened.
class LibarchiveBackend : public ArchiveBackend {
public:
    Member get_member(const MemberRef& member) override;
    std::vector<Member> get_members() override;
    std::vector<std::string> get_names() override;
    std::filesystem::path extract(const MemberRef& member, const std::filesystem::path& destination) override;
    std::filesystem::path extractall(const std::filesystem::path& destination,
                                     const std::optional<std::vector<MemberRef>>& members) override;
    std::string read_bytes(const MemberRef& member) override;
    void close() noexcept override;

protected:
    struct EntryRecord {
        std::string name;
        std::uint64_t size = 0;
        unsigned int filetype = 0;
        std::string hardlink;
        std::string symlink;
    };

    LibarchiveBackend(const std::filesystem::path& file, std::optional<std::string> password);

    // Must be called by the derived constructor: the format hooks are virtual.
    void open();

    // Registers the formats and filters this backend reads
    virtual void enable_formats(struct archive* a) const = 0;

    // Name of an entry as reported by get_names()
    virtual std::string canonical_name(struct archive_entry* entry) const = 0;

    // Name a caller's reference is looked up under
    virtual std::string lookup_name(const std::string& name) const { return name; }

    virtual Member make_member(const EntryRecord& record) const;

    // Whether the password is handed to libarchive
    virtual bool accepts_password() const { return true; }

    // Extraction filter, called before an entry is written under destination.
    // Throws UnsafeArchiveMember to refuse the entry.
    virtual void screen_entry(struct archive_entry* entry, const std::string& name) const;

    const std::vector<EntryRecord>& records() const { return records_; }

    // Last entry stored under name: a later copy of a name replaces the earlier ones
    const EntryRecord* find_record(const std::string& name) const;
    EntryRecord make_record(struct archive_entry* entry) const;

    // Follows hard and symbolic links to the entry holding the data. Hard links
    // only point backwards; symbolic links are resolved against the link's directory.
    // Throws ArchiveReadError when a target is not in the archive.
    const EntryRecord& resolve_link(const EntryRecord& record) const;

    // Independent read state positioned at the data of record
    ArchiveReadHandle open_record(const EntryRecord& record) const;

    // Fresh read state positioned before the first header
    struct archive* rewind();

    // Advances to the next entry named key. nullptr once the end of the archive is reached.
    struct archive_entry* seek_entry(struct archive* a, const std::string& key);

    // Logs ARCHIVE_WARN, throws ArchiveReadError for anything worse
    void check_status(struct archive* a, int status) const;
    void check_status(struct archive* a, int status, const std::string& member) const;

    std::string read_entry_data(struct archive* a, const std::string& member) const;

private:
    ArchiveReadHandle new_reader() const;
    void extract_entries(const std::filesystem::path& destination, const std::unordered_set<std::string>* selected);
    const EntryRecord* find_link_target(const std::string& target, const EntryRecord* limit) const;
    // content replaces the entry's own data when given
    void write_entry(struct archive* a, struct archive* disk, struct archive_entry* entry,
                     const std::string& name, const std::filesystem::path& destination,
                     const std::string* content = nullptr) const;

    ArchiveReadHandle reader_;
    std::vector<EntryRecord> records_;
    bool closed_ = false;
};

} // namespace archivefile
