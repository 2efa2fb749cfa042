#include "zip_backend.hpp"
#include "config.hpp"
#include "exception.hpp"
#include "localization.hpp"
#include "utils.hpp"

#include <sys/stat.h>

#include <cerrno>
#include <cstring>
#include <fstream>
#include <vector>

namespace fs = std::filesystem;

namespace archivefile {

namespace {
    // MS-DOS attribute byte, directory flag
    constexpr zip_uint32_t DOS_DIRECTORY = 0x10;

    std::string open_error_string(int code) {
        zip_error_t error;
        zip_error_init_with_code(&error, code);
        std::string message = zip_error_strerror(&error);
        zip_error_fini(&error);
        return message;
    }
}

ZipBackend::ZipBackend(const fs::path& file, std::optional<std::string> password)
    : ArchiveBackend(file, std::move(password)) {
    int code = 0;
    archive_.reset(zip_open(file.c_str(), ZIP_RDONLY, &code));
    if (!archive_) {
        throw ArchiveReadError(file, open_error_string(code));
    }
}

zip_t* ZipBackend::handle() const {
    if (!archive_) {
        throw ArchiveClosed(file());
    }
    return archive_.get();
}

zip_uint64_t ZipBackend::locate(const std::string& name) const {
    zip_int64_t index = zip_name_locate(handle(), name.c_str(), 0);
    if (index < 0) {
        throw ArchiveMemberNotFound(name, file());
    }
    return static_cast<zip_uint64_t>(index);
}

bool ZipBackend::is_directory(zip_uint64_t index, const std::string& name) const {
    zip_uint8_t opsys;
    zip_uint32_t attributes;
    if (zip_file_get_external_attributes(handle(), index, 0, &opsys, &attributes) == 0) {
        if (opsys == ZIP_OPSYS_UNIX) {
            const auto mode = static_cast<mode_t>(attributes >> 16);
            if (mode != 0 && S_ISDIR(mode)) {
                return true;
            }
        }
        if (attributes & DOS_DIRECTORY) {
            return true;
        }
    }
    return name.ends_with('/');
}

Member ZipBackend::stat_member(zip_uint64_t index) const {
    zip_stat_t st;
    zip_stat_init(&st);
    if (zip_stat_index(handle(), index, 0, &st) != 0) {
        throw ArchiveReadError(file(), zip_strerror(handle()));
    }

    Member member;
    member.name = st.name ? st.name : "";
    member.is_dir = is_directory(index, member.name);
    member.is_file = !member.is_dir;
    if (!member.is_dir) {
        if (st.valid & ZIP_STAT_SIZE) {
            member.size = st.size;
        }
        member.compressed_size = (st.valid & ZIP_STAT_COMP_SIZE) ? st.comp_size : member.size;
    }
    return member;
}

ZipFileHandle ZipBackend::open_entry(zip_uint64_t index, const std::string& name) const {
    zip_t* za = handle();
    const bool encrypted = password() && !password()->empty();
    ZipFileHandle zf(encrypted ? zip_fopen_index_encrypted(za, index, 0, password()->c_str())
                                : zip_fopen_index(za, index, 0));
    if (!zf) {
        throw ArchiveReadError(file(), name, zip_error_strerror(zip_get_error(za)));
    }
    return zf;
}

Member ZipBackend::get_member(const MemberRef& member) {
    return stat_member(locate(resolve_name(member)));
}

std::vector<Member> ZipBackend::get_members() {
    zip_int64_t count = zip_get_num_entries(handle(), 0);
    std::vector<Member> members;
    members.reserve(static_cast<std::size_t>(count));
    for (zip_int64_t i = 0; i < count; ++i) {
        members.push_back(stat_member(static_cast<zip_uint64_t>(i)));
    }
    return members;
}

std::vector<std::string> ZipBackend::get_names() {
    zip_t* za = handle();
    zip_int64_t count = zip_get_num_entries(za, 0);
    std::vector<std::string> names;
    names.reserve(static_cast<std::size_t>(count));
    for (zip_int64_t i = 0; i < count; ++i) {
        const char* name = zip_get_name(za, static_cast<zip_uint64_t>(i), 0);
        if (!name) {
            throw ArchiveReadError(file(), zip_strerror(za));
        }
        names.emplace_back(name);
    }
    return names;
}

void ZipBackend::write_entry(zip_uint64_t index, const fs::path& destination) const {
    Member member = stat_member(index);

    // SECURITY: Path traversal vulnerability mitigation.
    fs::path dest_path;
    try {
        dest_path = validate_path(member.name, destination);
    } catch (const ArchiveFileException& e) {
        throw UnsafeArchiveMember(member.name, file(), e.what());
    }

    std::error_code ec;
    if (member.is_dir) {
        fs::create_directories(dest_path, ec);
        if (ec) {
            throw ArchiveReadError(file(), member.name, string_format("error.create_dir_failed", dest_path.string()));
        }
        return;
    }

    ZipFileHandle zf = open_entry(index, member.name);

    fs::create_directories(dest_path.parent_path(), ec);
    if (ec) {
        throw ArchiveReadError(file(), member.name,
                               string_format("error.create_dir_failed", dest_path.parent_path().string()));
    }

    std::ofstream out(dest_path, std::ios::binary | std::ios::trunc);
    if (!out) {
        throw ArchiveReadError(file(), member.name,
                               string_format("error.write_failed", dest_path.string(), std::strerror(errno)));
    }

    std::vector<char> buffer(COPY_BUFFER_SIZE);
    while (true) {
        zip_int64_t n = zip_fread(zf.get(), buffer.data(), buffer.size());
        if (n == 0) break;
        if (n < 0) {
            std::string reason = zip_file_strerror(zf.get());
            out.close();
            fs::remove(dest_path, ec);
            throw ArchiveReadError(file(), member.name, reason);
        }
        out.write(buffer.data(), n);
        if (!out) {
            std::string reason = string_format("error.write_failed", dest_path.string(), std::strerror(errno));
            out.close();
            fs::remove(dest_path, ec);
            throw ArchiveReadError(file(), member.name, reason);
        }
    }

    // Buffered data only reaches the disk here
    out.close();
    if (!out) {
        std::string reason = string_format("error.write_failed", dest_path.string(), std::strerror(errno));
        fs::remove(dest_path, ec);
        throw ArchiveReadError(file(), member.name, reason);
    }
}

fs::path ZipBackend::extract(const MemberRef& member, const fs::path& destination) {
    std::string name = resolve_name(member);
    zip_uint64_t index = locate(name);

    fs::path target_dir = prepare_destination(destination);
    write_entry(index, target_dir);
    return target_dir / name;
}

fs::path ZipBackend::extractall(const fs::path& destination, const std::optional<std::vector<MemberRef>>& members) {
    std::vector<zip_uint64_t> indices;
    if (members) {
        for (const auto& name : validate_members(*members, get_names(), file())) {
            indices.push_back(locate(name));
        }
    } else {
        zip_int64_t count = zip_get_num_entries(handle(), 0);
        for (zip_int64_t i = 0; i < count; ++i) {
            indices.push_back(static_cast<zip_uint64_t>(i));
        }
    }

    fs::path target_dir = prepare_destination(destination);
    long long count = 0;
    for (zip_uint64_t index : indices) {
        write_entry(index, target_dir);
        if (++count % PROGRESS_INTERVAL == 0) {
            log_info(string_format("info.extracting", count));
        }
    }
    log_info(string_format("info.extract_complete", count));
    return target_dir;
}

std::string ZipBackend::read_bytes(const MemberRef& member) {
    std::string name = resolve_name(member);
    zip_uint64_t index = locate(name);
    Member info = stat_member(index);
    if (info.is_dir) {
        throw ArchiveMemberNotAFile(name, file());
    }

    ZipFileHandle zf = open_entry(index, name);
    std::string content;
    content.reserve(static_cast<std::size_t>(info.size));
    std::vector<char> buffer(COPY_BUFFER_SIZE);
    while (true) {
        zip_int64_t n = zip_fread(zf.get(), buffer.data(), buffer.size());
        if (n == 0) break;
        if (n < 0) {
            throw ArchiveReadError(file(), name, zip_file_strerror(zf.get()));
        }
        content.append(buffer.data(), static_cast<std::size_t>(n));
    }
    return content;
}

void ZipBackend::close() noexcept {
    archive_.reset();
}

} // namespace archivefile
