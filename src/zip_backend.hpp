#pragma once

#include "backend.hpp"

#include <zip.h>

#include <memory>

namespace archivefile {

struct ZipDeleter {
    void operator()(zip_t* za) const {
        if (za) {
            zip_discard(za);
        }
    }
};

struct ZipFileDeleter {
    void operator()(zip_file_t* zf) const {
        if (zf) {
            zip_fclose(zf);
        }
    }
};

using ZipHandle = std::unique_ptr<zip_t, ZipDeleter>;
using ZipFileHandle = std::unique_ptr<zip_file_t, ZipFileDeleter>;

// ZIP archives through libzip. Member names are stored names, directories
// keep their trailing '/'. Compressed sizes are the real stored sizes.
class ZipBackend : public ArchiveBackend {
public:
    ZipBackend(const std::filesystem::path& file, std::optional<std::string> password);

    std::string name() const override { return "ZipBackend"; }

    Member get_member(const MemberRef& member) override;
    std::vector<Member> get_members() override;
    std::vector<std::string> get_names() override;
    std::filesystem::path extract(const MemberRef& member, const std::filesystem::path& destination) override;
    std::filesystem::path extractall(const std::filesystem::path& destination,
                                     const std::optional<std::vector<MemberRef>>& members) override;
    std::string read_bytes(const MemberRef& member) override;
    void close() noexcept override;

private:
    zip_t* handle() const;
    zip_uint64_t locate(const std::string& name) const;
    Member stat_member(zip_uint64_t index) const;
    bool is_directory(zip_uint64_t index, const std::string& name) const;
    ZipFileHandle open_entry(zip_uint64_t index, const std::string& name) const;
    void write_entry(zip_uint64_t index, const std::filesystem::path& destination) const;

    ZipHandle archive_;
};

} // namespace archivefile
