#include "backend.hpp"
#include "exception.hpp"
#include "text.hpp"
#include "utils.hpp"

#include <format>

namespace fs = std::filesystem;

namespace archivefile {

ArchiveBackend::ArchiveBackend(const fs::path& file, std::optional<std::string> password)
    : file_(file), password_(std::move(password)) {}

std::string ArchiveBackend::read_text(const MemberRef& member, const std::string& encoding, const std::string& errors) {
    return decode_text(read_bytes(member), encoding, errors);
}

std::string ArchiveBackend::to_string() const {
    if (password_ && !password_->empty()) {
        return std::format("{}('{}', password='********')", name(), file_.generic_string());
    }
    return std::format("{}('{}')", name(), file_.generic_string());
}

fs::path ArchiveBackend::prepare_destination(const fs::path& destination) const {
    fs::path resolved;
    if (destination.empty()) {
        std::error_code ec;
        resolved = fs::current_path(ec);
        if (ec) {
            throw ArchiveReadError(file_, ec.message());
        }
    } else {
        resolved = real_path(destination);
    }

    try {
        ensure_dir_exists(resolved);
    } catch (const ArchiveFileException& e) {
        throw ArchiveReadError(file_, e.what());
    } catch (const fs::filesystem_error& e) {
        throw ArchiveReadError(file_, e.what());
    }
    return resolved;
}

} // namespace archivefile
