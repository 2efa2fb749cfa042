#pragma once

#include <cstddef>
#include <filesystem>
#include <optional>
#include <stdexcept>
#include <string>

namespace archivefile {

class ArchiveFileException : public std::runtime_error {
public:
    explicit ArchiveFileException(const std::string& message)
        : std::runtime_error(message) {}
};

// A member reference of a type that cannot name an archive member.
class MemberTypeMismatch : public ArchiveFileException {
public:
    explicit MemberTypeMismatch(const std::string& type_name);

    const std::string& type_name() const { return type_name_; }

private:
    std::string type_name_;
};

class TextDecodeError : public ArchiveFileException {
public:
    TextDecodeError(const std::string& message, const std::string& encoding, std::size_t position = 0);

    const std::string& encoding() const { return encoding_; }
    std::size_t position() const { return position_; }

private:
    std::string encoding_;
    std::size_t position_;
};

// Base of every failure tied to one archive file.
class ArchiveError : public ArchiveFileException {
public:
    ArchiveError(const std::string& message, const std::filesystem::path& file)
        : ArchiveFileException(message), file_(file) {}

    const std::filesystem::path& file() const { return file_; }

private:
    std::filesystem::path file_;
};

class ArchiveFileNotFound : public ArchiveError {
public:
    explicit ArchiveFileNotFound(const std::filesystem::path& file);
};

class UnsupportedArchiveFormat : public ArchiveError {
public:
    explicit UnsupportedArchiveFormat(const std::filesystem::path& file);
};

class ArchiveClosed : public ArchiveError {
public:
    explicit ArchiveClosed(const std::filesystem::path& file);
};

// Codec, password or I/O failure reported by an underlying library.
class ArchiveReadError : public ArchiveError {
public:
    ArchiveReadError(const std::filesystem::path& file, const std::string& reason);
    ArchiveReadError(const std::filesystem::path& file, const std::string& member, const std::string& reason);

    const std::optional<std::string>& member() const { return member_; }

private:
    std::optional<std::string> member_;
};

class UnsafeArchiveMember : public ArchiveError {
public:
    UnsafeArchiveMember(const std::string& member, const std::filesystem::path& file, const std::string& reason);

    const std::string& member() const { return member_; }

private:
    std::string member_;
};

class ArchiveMemberNotFound : public ArchiveError {
public:
    ArchiveMemberNotFound(const std::string& member, const std::filesystem::path& file);

    const std::string& member() const { return member_; }

private:
    std::string member_;
};

class ArchiveMemberNotAFile : public ArchiveError {
public:
    ArchiveMemberNotAFile(const std::string& member, const std::filesystem::path& file);

    const std::string& member() const { return member_; }

private:
    std::string member_;
};

} // namespace archivefile
