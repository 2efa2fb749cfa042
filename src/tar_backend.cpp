#include "tar_backend.hpp"
#include "exception.hpp"
#include "localization.hpp"

namespace archivefile {

TarBackend::TarBackend(const std::filesystem::path& file, std::optional<std::string> password)
    : LibarchiveBackend(file, std::move(password)) {
    open();
}

void TarBackend::enable_tar_formats(struct archive* a) {
    archive_read_support_filter_all(a);
    archive_read_support_format_tar(a);
    archive_read_support_format_gnutar(a);
}

void TarBackend::enable_formats(struct archive* a) const {
    enable_tar_formats(a);
}

namespace {
    std::string strip_trailing_slash(std::string name) {
        while (name.size() > 1 && name.back() == '/') {
            name.pop_back();
        }
        return name;
    }
}

// Directory entries are stored as "dir/"; members are named without the slash
std::string TarBackend::canonical_name(struct archive_entry* entry) const {
    const char* path = archive_entry_pathname_utf8(entry);
    if (!path) path = archive_entry_pathname(entry);
    return strip_trailing_slash(path ? path : "");
}

std::string TarBackend::lookup_name(const std::string& name) const {
    return strip_trailing_slash(name);
}

// Tar members may carry anything a filesystem can hold. Refuse device nodes and
// FIFOs, never restore set-uid/set-gid/sticky bits or group/other write access.
void TarBackend::screen_entry(struct archive_entry* entry, const std::string& name) const {
    switch (archive_entry_filetype(entry)) {
        case AE_IFCHR:
        case AE_IFBLK:
        case AE_IFIFO:
        case AE_IFSOCK:
            throw UnsafeArchiveMember(name, file(), get_string("reason.special_file"));
        default:
            break;
    }

    mode_t perm = archive_entry_perm(entry) & 0755;
    if (archive_entry_filetype(entry) == AE_IFREG) {
        perm |= 0600;
    }
    archive_entry_set_perm(entry, perm);

    LibarchiveBackend::screen_entry(entry, name);
}

} // namespace archivefile
