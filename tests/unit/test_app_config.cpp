// ╔══════════════════════════════════════════════════════════════════════════════╗
// ║  minisql - Driver Configuration Unit Tests                                   ║
// ╚══════════════════════════════════════════════════════════════════════════════╝

#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>
#include <string>

#include "driver/app_config.hpp"

using namespace minisql;
using minisql::driver::AppConfig;

namespace fs = std::filesystem;

class AppConfigTest : public ::testing::Test {
protected:
    void SetUp() override {
        path_ = fs::temp_directory_path() /
                ("minisql_config_" + std::string(::testing::UnitTest::GetInstance()
                                                     ->current_test_info()->name()) + ".conf");
    }

    void TearDown() override {
        std::error_code ec;
        fs::remove(path_, ec);
    }

    void write_config(const std::string& content) {
        std::ofstream file(path_, std::ios::trunc);
        file << content;
    }

    fs::path path_;
};

// ============================================================================
// Valid files
// ============================================================================

TEST_F(AppConfigTest, ReadsAllKeys) {
    write_config(
        "# comment\n"
        "output_dir = reports\n"
        "lex_errors = abort\n"
        "max_depth = 32\n"
        "log_level = debug\n"
        "no_report = true\n");

    AppConfig config;
    std::string error;
    ASSERT_TRUE(config.load_from_file(path_.string(), error)) << error;

    EXPECT_EQ(config.output_dir, "reports");
    EXPECT_EQ(config.max_depth, 32);
    EXPECT_EQ(config.log_level, "debug");
    EXPECT_TRUE(config.no_report);

    auto compiler_config = config.to_compiler_config();
    EXPECT_EQ(compiler_config.lexer.error_policy, sql::LexErrorPolicy::Abort);
    EXPECT_EQ(compiler_config.parser.max_condition_depth, 32);
}

// ============================================================================
// Rejected values
// ============================================================================

TEST_F(AppConfigTest, MalformedDepthIsReported) {
    write_config("max_depth = deep\n");

    AppConfig config;
    std::string error;
    EXPECT_FALSE(config.load_from_file(path_.string(), error));
    EXPECT_NE(error.find("max_depth"), std::string::npos);
    EXPECT_EQ(config.max_depth, 256);
}

TEST_F(AppConfigTest, ZeroDepthIsRejected) {
    write_config("max_depth = 0\n");

    AppConfig config;
    std::string error;
    EXPECT_FALSE(config.load_from_file(path_.string(), error));
    EXPECT_EQ(config.max_depth, 256);
}

TEST_F(AppConfigTest, TrailingGarbageInDepthIsRejected) {
    write_config("max_depth = 12abc\n");

    AppConfig config;
    std::string error;
    EXPECT_FALSE(config.load_from_file(path_.string(), error));
}

TEST_F(AppConfigTest, UnknownLexPolicyIsRejected) {
    write_config("lex_errors = ignore\n");

    AppConfig config;
    std::string error;
    EXPECT_FALSE(config.load_from_file(path_.string(), error));
    EXPECT_NE(error.find("lex_errors"), std::string::npos);
    EXPECT_EQ(config.lex_errors, "recover");
}

TEST_F(AppConfigTest, MissingFile) {
    AppConfig config;
    std::string error;
    EXPECT_FALSE(config.load_from_file((path_ / "absent").string(), error));
    EXPECT_FALSE(error.empty());
}
