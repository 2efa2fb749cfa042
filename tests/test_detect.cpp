#include <gtest/gtest.h>
#include "detect.hpp"
#include "test_data.hpp"

using namespace archivefile;

class DetectTest : public ::testing::Test {
protected:
    void SetUp() override {
        work_dir = scratch_dir("detect");
    }

    void TearDown() override {
        fs::remove_all(work_dir);
    }

    fs::path work_dir;
};

TEST_F(DetectTest, Zip) {
    EXPECT_TRUE(is_zipfile(data_file("source.zip")));
    EXPECT_TRUE(is_zipfile(data_file("source_stored.zip")));
    EXPECT_TRUE(is_zipfile(data_file("encrypted.zip")));
    EXPECT_FALSE(is_zipfile(data_file("source_GNU.tar")));
    EXPECT_FALSE(is_zipfile(data_file("plain_text.zip")));
}

TEST_F(DetectTest, Tar) {
    EXPECT_TRUE(is_tarfile(data_file("source_GNU.tar")));
    EXPECT_TRUE(is_tarfile(data_file("source_POSIX.tar.gz")));
    EXPECT_TRUE(is_tarfile(data_file("traversal.tar")));
    EXPECT_FALSE(is_tarfile(data_file("plain_text.zip")));
    EXPECT_FALSE(is_tarfile(data_file("source.7z")));
}

TEST_F(DetectTest, SevenZip) {
    if (!format_available(ArchiveFormat::SEVENZIP)) {
        EXPECT_FALSE(is_7zfile(data_file("source.7z")));
        GTEST_SKIP() << "7z support not available";
    }
    EXPECT_TRUE(is_7zfile(data_file("source.7z")));
    EXPECT_FALSE(is_7zfile(data_file("source.zip")));
    EXPECT_FALSE(is_7zfile(data_file("source_GNU.tar")));
}

TEST_F(DetectTest, Rar) {
    if (!format_available(ArchiveFormat::RAR)) {
        EXPECT_FALSE(is_rarfile(data_file("source.rar")));
        GTEST_SKIP() << "RAR support not available";
    }
    EXPECT_TRUE(is_rarfile(data_file("source.rar")));
    EXPECT_FALSE(is_rarfile(data_file("source.zip")));
    EXPECT_FALSE(is_rarfile(data_file("source.7z")));
}

TEST_F(DetectTest, DetectFormatOrder) {
    EXPECT_EQ(detect_format(data_file("source.zip")), ArchiveFormat::ZIP);
    EXPECT_EQ(detect_format(data_file("source_GNU.tar")), ArchiveFormat::TAR);
    EXPECT_EQ(detect_format(data_file("source_POSIX.tar.gz")), ArchiveFormat::TAR);
    if (format_available(ArchiveFormat::SEVENZIP)) {
        EXPECT_EQ(detect_format(data_file("source.7z")), ArchiveFormat::SEVENZIP);
    }
    if (format_available(ArchiveFormat::RAR)) {
        EXPECT_EQ(detect_format(data_file("source.rar")), ArchiveFormat::RAR);
    }
    EXPECT_FALSE(detect_format(data_file("plain_text.zip")).has_value());
}

TEST_F(DetectTest, ContentNotExtensionDecides) {
    fs::path renamed = work_dir / "archive.txt";
    fs::copy_file(data_file("source.zip"), renamed);
    EXPECT_TRUE(is_archive(renamed));
    EXPECT_EQ(detect_format(renamed), ArchiveFormat::ZIP);
}

TEST_F(DetectTest, NonRegularFilesAreNotArchives) {
    EXPECT_FALSE(is_archive(work_dir / "missing.zip"));
    EXPECT_FALSE(is_archive(work_dir));
    EXPECT_FALSE(is_zipfile(work_dir));
    EXPECT_FALSE(is_tarfile(work_dir / "missing.tar"));
}

TEST_F(DetectTest, EmptyFileIsNotAnArchive) {
    fs::path empty = work_dir / "empty.zip";
    { std::ofstream f(empty); }
    EXPECT_FALSE(is_zipfile(empty));
    EXPECT_FALSE(is_archive(empty));
}

TEST_F(DetectTest, FormatNames) {
    EXPECT_EQ(to_string(ArchiveFormat::ZIP), "zip");
    EXPECT_EQ(to_string(ArchiveFormat::TAR), "tar");
    EXPECT_EQ(to_string(ArchiveFormat::SEVENZIP), "7z");
    EXPECT_EQ(to_string(ArchiveFormat::RAR), "rar");
    EXPECT_TRUE(format_available(ArchiveFormat::ZIP));
    EXPECT_TRUE(format_available(ArchiveFormat::TAR));
}
