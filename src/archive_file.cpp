#include "archive_file.hpp"
#include "exception.hpp"
#include "localization.hpp"
#include "rar_backend.hpp"
#include "sevenzip_backend.hpp"
#include "tar_backend.hpp"
#include "utils.hpp"
#include "zip_backend.hpp"

#include <format>

namespace fs = std::filesystem;

namespace archivefile {

namespace {
    std::unique_ptr<ArchiveBackend> make_backend(ArchiveFormat format, const fs::path& file,
                                                 const std::optional<std::string>& password) {
        switch (format) {
            case ArchiveFormat::ZIP:
                return std::make_unique<ZipBackend>(file, password);
            case ArchiveFormat::TAR:
                return std::make_unique<TarBackend>(file, password);
            case ArchiveFormat::SEVENZIP:
                return std::make_unique<SevenZipBackend>(file, password);
            case ArchiveFormat::RAR:
                return std::make_unique<RarBackend>(file, password);
        }
        throw UnsupportedArchiveFormat(file);
    }
}

ArchiveFile::ArchiveFile(const fs::path& path, std::optional<std::string> password)
    : file_(real_path(path)), password_(std::move(password)) {
    std::error_code ec;
    if (!fs::is_regular_file(file_, ec)) {
        throw ArchiveFileNotFound(file_);
    }

    std::optional<ArchiveFormat> format = detect_format(file_);
    if (!format) {
        throw UnsupportedArchiveFormat(file_);
    }
    format_ = *format;
    backend_ = make_backend(format_, file_, password_);
    log_debug(string_format("debug.opened", archivefile::to_string(format_), file_.generic_string()));
}

ArchiveFile::~ArchiveFile() {
    close();
}

ArchiveFile::ArchiveFile(ArchiveFile&& other) noexcept
    : file_(std::move(other.file_)),
      password_(std::move(other.password_)),
      format_(other.format_),
      backend_(std::move(other.backend_)) {}

ArchiveFile& ArchiveFile::operator=(ArchiveFile&& other) noexcept {
    if (this != &other) {
        close();
        file_ = std::move(other.file_);
        password_ = std::move(other.password_);
        format_ = other.format_;
        backend_ = std::move(other.backend_);
    }
    return *this;
}

ArchiveBackend& ArchiveFile::backend() {
    if (!backend_) {
        throw ArchiveClosed(file_);
    }
    return *backend_;
}

Member ArchiveFile::get_member(const MemberRef& member) {
    return backend().get_member(member);
}

std::vector<Member> ArchiveFile::get_members() {
    return backend().get_members();
}

std::vector<std::string> ArchiveFile::get_names() {
    return backend().get_names();
}

fs::path ArchiveFile::extract(const MemberRef& member, const fs::path& destination) {
    return backend().extract(member, destination);
}

fs::path ArchiveFile::extractall(const fs::path& destination, const std::optional<std::vector<MemberRef>>& members) {
    return backend().extractall(destination, members);
}

std::string ArchiveFile::read_bytes(const MemberRef& member) {
    return backend().read_bytes(member);
}

std::string ArchiveFile::read_text(const MemberRef& member, const std::string& encoding, const std::string& errors) {
    return backend().read_text(member, encoding, errors);
}

void ArchiveFile::close() noexcept {
    if (backend_) {
        backend_->close();
        backend_.reset();
    }
}

std::string ArchiveFile::to_string() const {
    if (password_ && !password_->empty()) {
        return std::format("ArchiveFile('{}', password='********')", file_.generic_string());
    }
    return std::format("ArchiveFile('{}')", file_.generic_string());
}

std::ostream& operator<<(std::ostream& os, const ArchiveFile& archive) {
    return os << archive.to_string();
}

} // namespace archivefile
