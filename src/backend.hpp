#pragma once

#include "member.hpp"

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace archivefile {

// Operations every format adapter implements. Failures surface only as the
// exception types of exception.hpp; codec errors never leak through.
// An adapter is not thread-safe: use one ArchiveFile per thread.
class ArchiveBackend {
public:
    ArchiveBackend(const std::filesystem::path& file, std::optional<std::string> password);
    virtual ~ArchiveBackend() = default;

    ArchiveBackend(const ArchiveBackend&) = delete;
    ArchiveBackend& operator=(const ArchiveBackend&) = delete;

    const std::filesystem::path& file() const { return file_; }
    const std::optional<std::string>& password() const { return password_; }

    virtual Member get_member(const MemberRef& member) = 0;

    // Native stored order, same order as get_names()
    virtual std::vector<Member> get_members() = 0;
    virtual std::vector<std::string> get_names() = 0;

    // An empty destination means the current working directory.
    virtual std::filesystem::path extract(const MemberRef& member, const std::filesystem::path& destination) = 0;

    // std::nullopt extracts every member. Requested members are validated before anything is written.
    virtual std::filesystem::path extractall(const std::filesystem::path& destination,
                                             const std::optional<std::vector<MemberRef>>& members) = 0;

    virtual std::string read_bytes(const MemberRef& member) = 0;
    virtual std::string read_text(const MemberRef& member, const std::string& encoding, const std::string& errors);

    // Idempotent
    virtual void close() noexcept = 0;

    // Class name used by to_string()
    virtual std::string name() const = 0;

    std::string to_string() const;

protected:
    // Resolves the destination (cwd when empty) and creates it with its parents
    std::filesystem::path prepare_destination(const std::filesystem::path& destination) const;

private:
    std::filesystem::path file_;
    std::optional<std::string> password_;
};

} // namespace archivefile
