#pragma once

#include "backend.hpp"
#include "detect.hpp"
#include "member.hpp"

#include <filesystem>
#include <memory>
#include <optional>
#include <ostream>
#include <string>
#include <vector>

namespace archivefile {

// An open archive of any supported format. The format is detected from the
// file contents once, at construction. Closing is idempotent and happens at
// the latest when the handle is destroyed; any data operation on a closed
// handle throws ArchiveClosed.
class ArchiveFile {
public:
    explicit ArchiveFile(const std::filesystem::path& path, std::optional<std::string> password = std::nullopt);
    ~ArchiveFile();

    ArchiveFile(const ArchiveFile&) = delete;
    ArchiveFile& operator=(const ArchiveFile&) = delete;

    // The moved-from handle is closed
    ArchiveFile(ArchiveFile&& other) noexcept;
    ArchiveFile& operator=(ArchiveFile&& other) noexcept;

    Member get_member(const MemberRef& member);
    std::vector<Member> get_members();
    std::vector<std::string> get_names();

    std::filesystem::path extract(const MemberRef& member, const std::filesystem::path& destination = {});
    std::filesystem::path extractall(const std::filesystem::path& destination = {},
                                     const std::optional<std::vector<MemberRef>>& members = std::nullopt);

    std::string read_bytes(const MemberRef& member);
    std::string read_text(const MemberRef& member, const std::string& encoding = "utf-8",
                          const std::string& errors = "strict");

    void close() noexcept;
    bool is_closed() const { return backend_ == nullptr; }

    const std::filesystem::path& file() const { return file_; }
    const std::optional<std::string>& password() const { return password_; }
    ArchiveFormat format() const { return format_; }

    std::string to_string() const;

private:
    ArchiveBackend& backend();

    std::filesystem::path file_;
    std::optional<std::string> password_;
    ArchiveFormat format_ = ArchiveFormat::ZIP;
    std::unique_ptr<ArchiveBackend> backend_;
};

std::ostream& operator<<(std::ostream& os, const ArchiveFile& archive);

} // namespace archivefile
