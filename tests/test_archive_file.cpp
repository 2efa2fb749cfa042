#include <gtest/gtest.h>
#include "archive_file.hpp"
#include "exception.hpp"
#include "localization.hpp"
#include "test_data.hpp"

#include <cctype>
#include <sstream>
#include <vector>

using namespace archivefile;

struct ArchiveCase {
    std::string file;
    ArchiveFormat format;
    std::vector<std::string> names;
    std::string directory;
};

void PrintTo(const ArchiveCase& c, std::ostream* os) {
    *os << c.file;
}

namespace {
    const std::vector<std::string> ZIP_NAMES = {
        "project/", "project/README.md", "project/docs/", "project/docs/guide.txt",
        "project/empty/", "project/latin1.txt", "project/src/", "project/src/main.c"};

    const std::vector<std::string> TAR_NAMES = {
        "project", "project/README.md", "project/docs", "project/docs/guide.txt",
        "project/empty", "project/latin1.txt", "project/src", "project/src/main.c"};

    const std::vector<std::string> SEVENZIP_NAMES = {
        "project/README.md", "project/docs/guide.txt", "project/latin1.txt", "project/src/main.c",
        "project/empty", "project/docs", "project/src", "project"};
}

class ArchiveFileTest : public ::testing::TestWithParam<ArchiveCase> {
protected:
    void SetUp() override {
        init_localization();
        if (!format_available(GetParam().format)) {
            GTEST_SKIP() << to_string(GetParam().format) << " support not available";
        }
        path = data_file(GetParam().file);
    }

    fs::path path;
};

TEST_P(ArchiveFileTest, DetectsFormat) {
    ArchiveFile archive(path);
    EXPECT_EQ(archive.format(), GetParam().format);
    EXPECT_EQ(archive.file(), fs::weakly_canonical(path));
    EXPECT_FALSE(archive.is_closed());
}

TEST_P(ArchiveFileTest, NamesInStoredOrder) {
    ArchiveFile archive(path);
    EXPECT_EQ(archive.get_names(), GetParam().names);
}

TEST_P(ArchiveFileTest, MembersMatchNames) {
    ArchiveFile archive(path);
    auto members = archive.get_members();
    auto names = archive.get_names();
    ASSERT_EQ(members.size(), names.size());
    for (size_t i = 0; i < members.size(); ++i) {
        EXPECT_EQ(members[i].name, names[i]);
        EXPECT_NE(members[i].is_dir, members[i].is_file) << members[i].name;
    }
}

TEST_P(ArchiveFileTest, GetMemberByName) {
    ArchiveFile archive(path);
    for (const auto& name : archive.get_names()) {
        EXPECT_EQ(archive.get_member(name).name, name);
    }

    Member main_c = archive.get_member("project/src/main.c");
    EXPECT_TRUE(main_c.is_file);
    EXPECT_FALSE(main_c.is_dir);
    EXPECT_EQ(main_c.size, 72u);
    EXPECT_GT(main_c.compressed_size, 0u);
}

TEST_P(ArchiveFileTest, GetMemberByPathAndMember) {
    ArchiveFile archive(path);
    Member by_name = archive.get_member("project/docs/guide.txt");
    EXPECT_EQ(archive.get_member(fs::path("project") / "docs" / "guide.txt"), by_name);
    EXPECT_EQ(archive.get_member(by_name), by_name);
}

TEST_P(ArchiveFileTest, DirectoryMember) {
    ArchiveFile archive(path);
    Member dir = archive.get_member(GetParam().directory);
    EXPECT_TRUE(dir.is_dir);
    EXPECT_FALSE(dir.is_file);
    EXPECT_EQ(dir.size, 0u);
    EXPECT_THROW(archive.read_bytes(GetParam().directory), ArchiveMemberNotAFile);
}

TEST_P(ArchiveFileTest, ReadBytes) {
    ArchiveFile archive(path);
    EXPECT_EQ(archive.read_bytes("project/README.md"), README_CONTENT);
    EXPECT_EQ(archive.read_bytes("project/src/main.c"), MAIN_C_CONTENT);
    EXPECT_EQ(archive.read_bytes("project/latin1.txt"), LATIN1_CONTENT);
}

TEST_P(ArchiveFileTest, ReadText) {
    ArchiveFile archive(path);
    EXPECT_EQ(archive.read_text("project/docs/guide.txt"), GUIDE_CONTENT);
    EXPECT_EQ(archive.read_text("project/latin1.txt", "latin-1"), "caf\xc3\xa9 cr\xc3\xa8me\n");
    EXPECT_THROW(archive.read_text("project/latin1.txt"), TextDecodeError);
    EXPECT_EQ(archive.read_text("project/latin1.txt", "utf-8", "backslashreplace"), "caf\\xe9 cr\\xe8me\n");
}

TEST_P(ArchiveFileTest, MissingMember) {
    ArchiveFile archive(path);
    try {
        archive.get_member("project/nope.txt");
        FAIL() << "expected ArchiveMemberNotFound";
    } catch (const ArchiveMemberNotFound& e) {
        EXPECT_EQ(e.member(), "project/nope.txt");
        EXPECT_EQ(e.file(), archive.file());
    }
    EXPECT_THROW(archive.read_bytes("project/nope.txt"), ArchiveMemberNotFound);
    EXPECT_THROW(archive.read_text("project/nope.txt"), ArchiveMemberNotFound);
}

TEST_P(ArchiveFileTest, CloseIsIdempotent) {
    ArchiveFile archive(path);
    archive.close();
    EXPECT_TRUE(archive.is_closed());
    EXPECT_NO_THROW(archive.close());
}

TEST_P(ArchiveFileTest, OperationsAfterCloseFail) {
    ArchiveFile archive(path);
    archive.close();
    EXPECT_THROW(archive.get_names(), ArchiveClosed);
    EXPECT_THROW(archive.get_members(), ArchiveClosed);
    EXPECT_THROW(archive.get_member("project/README.md"), ArchiveClosed);
    EXPECT_THROW(archive.read_bytes("project/README.md"), ArchiveClosed);
    EXPECT_THROW(archive.extractall(), ArchiveClosed);
}

TEST_P(ArchiveFileTest, MoveTransfersTheArchive) {
    ArchiveFile first(path);
    ArchiveFile second(std::move(first));
    EXPECT_TRUE(first.is_closed());
    EXPECT_FALSE(second.is_closed());
    EXPECT_EQ(second.get_names(), GetParam().names);
}

TEST_P(ArchiveFileTest, TextFormMasksPassword) {
    ArchiveFile plain(path);
    EXPECT_EQ(plain.to_string(), "ArchiveFile('" + plain.file().generic_string() + "')");

    ArchiveFile secret(path, "hunter2");
    EXPECT_EQ(secret.to_string(), "ArchiveFile('" + secret.file().generic_string() + "', password='********')");
    std::ostringstream os;
    os << secret;
    EXPECT_EQ(os.str().find("hunter2"), std::string::npos);
    EXPECT_EQ(secret.password(), std::optional<std::string>("hunter2"));
}

TEST_P(ArchiveFileTest, PasswordIsNotNeededToList) {
    ArchiveFile archive(path, "unused");
    EXPECT_EQ(archive.get_names(), GetParam().names);
}

INSTANTIATE_TEST_SUITE_P(
    Formats, ArchiveFileTest,
    ::testing::Values(
        ArchiveCase{"source.zip", ArchiveFormat::ZIP, ZIP_NAMES, "project/docs/"},
        ArchiveCase{"source_stored.zip", ArchiveFormat::ZIP, ZIP_NAMES, "project/docs/"},
        ArchiveCase{"source_GNU.tar", ArchiveFormat::TAR, TAR_NAMES, "project/docs"},
        ArchiveCase{"source_POSIX.tar.gz", ArchiveFormat::TAR, TAR_NAMES, "project/docs"},
        ArchiveCase{"source.7z", ArchiveFormat::SEVENZIP, SEVENZIP_NAMES, "project/docs"},
        ArchiveCase{"source.rar", ArchiveFormat::RAR, ZIP_NAMES, "project/docs/"}),
    [](const ::testing::TestParamInfo<ArchiveCase>& info) {
        std::string name = info.param.file;
        for (char& c : name) {
            if (!std::isalnum(static_cast<unsigned char>(c))) c = '_';
        }
        return name;
    });

class ArchiveFileOpenTest : public ::testing::Test {
protected:
    void SetUp() override {
        init_localization();
        work_dir = scratch_dir("open");
    }

    void TearDown() override {
        fs::remove_all(work_dir);
    }

    fs::path work_dir;
};

TEST_F(ArchiveFileOpenTest, MissingFile) {
    try {
        ArchiveFile archive(work_dir / "missing.zip");
        FAIL() << "expected ArchiveFileNotFound";
    } catch (const ArchiveFileNotFound& e) {
        EXPECT_EQ(e.file(), fs::weakly_canonical(work_dir / "missing.zip"));
    }
}

TEST_F(ArchiveFileOpenTest, DirectoryIsNotAnArchiveFile) {
    EXPECT_THROW(ArchiveFile archive(work_dir), ArchiveFileNotFound);
}

TEST_F(ArchiveFileOpenTest, UnsupportedFormat) {
    try {
        ArchiveFile archive(data_file("plain_text.zip"));
        FAIL() << "expected UnsupportedArchiveFormat";
    } catch (const UnsupportedArchiveFormat& e) {
        EXPECT_EQ(e.file(), fs::weakly_canonical(data_file("plain_text.zip")));
        EXPECT_NE(std::string(e.what()).find("7z"), std::string::npos);
    }
}

TEST_F(ArchiveFileOpenTest, RelativePathIsResolved) {
    fs::path saved = fs::current_path();
    fs::copy_file(data_file("source.zip"), work_dir / "copy.zip");
    fs::current_path(work_dir);
    {
        ArchiveFile archive("copy.zip");
        EXPECT_TRUE(archive.file().is_absolute());
        EXPECT_EQ(archive.file(), fs::weakly_canonical(work_dir / "copy.zip"));
    }
    fs::current_path(saved);
}

TEST_F(ArchiveFileOpenTest, SymlinkIsResolved) {
    fs::create_symlink(data_file("source_GNU.tar"), work_dir / "link.tar");
    ArchiveFile archive(work_dir / "link.tar");
    EXPECT_EQ(archive.file(), fs::weakly_canonical(data_file("source_GNU.tar")));
    EXPECT_EQ(archive.format(), ArchiveFormat::TAR);
}

TEST_F(ArchiveFileOpenTest, ScopedCloseOnDestruction) {
    std::vector<std::string> names;
    {
        ArchiveFile archive(data_file("source.zip"));
        names = archive.get_names();
    }
    EXPECT_EQ(names, ZIP_NAMES);
}

TEST_F(ArchiveFileOpenTest, MoveAssignmentClosesTheTarget) {
    ArchiveFile a(data_file("source.zip"));
    ArchiveFile b(data_file("source_GNU.tar"));
    b = std::move(a);
    EXPECT_TRUE(a.is_closed());
    EXPECT_EQ(b.format(), ArchiveFormat::ZIP);
    EXPECT_EQ(b.get_names(), ZIP_NAMES);
}
