#include <gtest/gtest.h>
#include "member.hpp"
#include "exception.hpp"
#include "localization.hpp"

#include <filesystem>
#include <sstream>
#include <vector>

namespace fs = std::filesystem;
using namespace archivefile;

class MemberTest : public ::testing::Test {
protected:
    void SetUp() override {
        init_localization();
        member.name = "project/src/main.c";
        member.size = 72;
        member.compressed_size = 69;
        member.is_file = true;
    }

    Member member;
    const std::vector<std::string> names = {"project/", "project/README.md", "project/src/main.c"};
};

TEST_F(MemberTest, ResolvesStringVerbatim) {
    EXPECT_EQ(resolve_name(std::string("project/README.md")), "project/README.md");
    EXPECT_EQ(resolve_name("project/"), "project/");
}

TEST_F(MemberTest, ResolvesPathWithForwardSlashes) {
    EXPECT_EQ(resolve_name(fs::path("project") / "src" / "main.c"), "project/src/main.c");
}

TEST_F(MemberTest, ResolvesMemberToItsName) {
    EXPECT_EQ(resolve_name(member), "project/src/main.c");
    EXPECT_EQ(resolve_name(MemberRef(member)), "project/src/main.c");
}

TEST_F(MemberTest, EmptyReferenceIsTypeMismatch) {
    EXPECT_THROW(resolve_name(MemberRef()), MemberTypeMismatch);
}

TEST_F(MemberTest, UnsupportedTypeNamesTheType) {
    try {
        resolve_name(42);
        FAIL() << "expected MemberTypeMismatch";
    } catch (const MemberTypeMismatch& e) {
        EXPECT_EQ(e.type_name(), "int");
        EXPECT_NE(std::string(e.what()).find("'int'"), std::string::npos);
    }
}

TEST_F(MemberTest, ValidateMembersKeepsRequestOrderWithoutDuplicates) {
    std::vector<MemberRef> requested = {"project/src/main.c", "project/", member, fs::path("project/README.md")};
    auto result = validate_members(requested, names, "/tmp/a.zip");
    EXPECT_EQ(result, (std::vector<std::string>{"project/src/main.c", "project/", "project/README.md"}));
}

TEST_F(MemberTest, ValidateMembersFailsOnFirstUnknownName) {
    std::vector<MemberRef> requested = {"project/", "missing.txt", "also_missing.txt"};
    try {
        validate_members(requested, names, "/tmp/a.zip");
        FAIL() << "expected ArchiveMemberNotFound";
    } catch (const ArchiveMemberNotFound& e) {
        EXPECT_EQ(e.member(), "missing.txt");
        EXPECT_EQ(e.file(), fs::path("/tmp/a.zip"));
    }
}

TEST_F(MemberTest, ValidateMembersAcceptsEmptyRequest) {
    EXPECT_TRUE(validate_members({}, names, "/tmp/a.zip").empty());
}

TEST_F(MemberTest, EqualityComparesEveryField) {
    Member copy = member;
    EXPECT_EQ(copy, member);
    copy.compressed_size = 72;
    EXPECT_NE(copy, member);
}

TEST_F(MemberTest, TextForms) {
    std::ostringstream os;
    os << member;
    EXPECT_EQ(os.str(), "project/src/main.c");
    EXPECT_EQ(member.to_string(),
              "Member(name='project/src/main.c', size=72, compressed_size=69, is_dir=false, is_file=true)");
}
