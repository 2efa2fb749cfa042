#include "exception.hpp"
#include "localization.hpp"

namespace archivefile {

MemberTypeMismatch::MemberTypeMismatch(const std::string& type_name)
    : ArchiveFileException(string_format("error.member_type_mismatch", type_name)),
      type_name_(type_name) {}

TextDecodeError::TextDecodeError(const std::string& message, const std::string& encoding, std::size_t position)
    : ArchiveFileException(message), encoding_(encoding), position_(position) {}

ArchiveFileNotFound::ArchiveFileNotFound(const std::filesystem::path& file)
    : ArchiveError(string_format("error.file_not_found", file.generic_string()), file) {}

UnsupportedArchiveFormat::UnsupportedArchiveFormat(const std::filesystem::path& file)
    : ArchiveError(string_format("error.unsupported_format", file.generic_string()), file) {}

ArchiveClosed::ArchiveClosed(const std::filesystem::path& file)
    : ArchiveError(string_format("error.archive_closed", file.generic_string()), file) {}

ArchiveReadError::ArchiveReadError(const std::filesystem::path& file, const std::string& reason)
    : ArchiveError(string_format("error.read_failed", file.generic_string(), reason), file) {}

ArchiveReadError::ArchiveReadError(const std::filesystem::path& file, const std::string& member, const std::string& reason)
    : ArchiveError(string_format("error.read_member_failed", member, file.generic_string(), reason), file),
      member_(member) {}

UnsafeArchiveMember::UnsafeArchiveMember(const std::string& member, const std::filesystem::path& file, const std::string& reason)
    : ArchiveError(string_format("error.unsafe_member", member, file.generic_string(), reason), file),
      member_(member) {}

ArchiveMemberNotFound::ArchiveMemberNotFound(const std::string& member, const std::filesystem::path& file)
    : ArchiveError(string_format("error.member_not_found", member, file.generic_string()), file),
      member_(member) {}

ArchiveMemberNotAFile::ArchiveMemberNotAFile(const std::string& member, const std::filesystem::path& file)
    : ArchiveError(string_format("error.member_not_a_file", member, file.generic_string()), file),
      member_(member) {}

} // namespace archivefile
