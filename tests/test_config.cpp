#include <gtest/gtest.h>
#include "config.hpp"

#include <cstdlib>
#include <filesystem>

namespace fs = std::filesystem;
using namespace archivefile;

class ConfigTest : public ::testing::Test {
protected:
    void SetUp() override {
        saved_dir = L10N_DIR;
        saved_level = get_log_level();
    }

    void TearDown() override {
        L10N_DIR = saved_dir;
        set_log_level(saved_level);
        unsetenv("ARCHIVEFILE_L10N_DIR");
        unsetenv("ARCHIVEFILE_LOG_LEVEL");
    }

    fs::path saved_dir;
    LogLevel saved_level = LogLevel::WARNING;
};

TEST_F(ConfigTest, Defaults) {
    EXPECT_EQ(READ_BLOCK_SIZE, 10240u);
    EXPECT_FALSE(L10N_DIR.empty());
}

TEST_F(ConfigTest, CustomL10nDir) {
    set_l10n_dir("/opt/archivefile/l10n/");
    EXPECT_EQ(L10N_DIR, fs::path("/opt/archivefile/l10n/"));

    set_l10n_dir("/opt/./archivefile//l10n");
    EXPECT_EQ(L10N_DIR, fs::path("/opt/archivefile/l10n"));
}

TEST_F(ConfigTest, ParseLogLevel) {
    EXPECT_EQ(parse_log_level("debug"), LogLevel::DEBUG);
    EXPECT_EQ(parse_log_level("INFO"), LogLevel::INFO);
    EXPECT_EQ(parse_log_level("Error"), LogLevel::ERROR);
    EXPECT_EQ(parse_log_level("quiet"), LogLevel::QUIET);
    EXPECT_EQ(parse_log_level("warning"), LogLevel::WARNING);
    EXPECT_EQ(parse_log_level("bogus"), LogLevel::WARNING);
}

TEST_F(ConfigTest, EnvironmentOverrides) {
    setenv("ARCHIVEFILE_L10N_DIR", "/srv/l10n", 1);
    setenv("ARCHIVEFILE_LOG_LEVEL", "debug", 1);
    init_config();
    EXPECT_EQ(L10N_DIR, fs::path("/srv/l10n"));
    EXPECT_EQ(get_log_level(), LogLevel::DEBUG);
}

TEST_F(ConfigTest, EmptyEnvironmentIsIgnored) {
    set_log_level(LogLevel::ERROR);
    setenv("ARCHIVEFILE_LOG_LEVEL", "", 1);
    init_config();
    EXPECT_EQ(get_log_level(), LogLevel::ERROR);
}
