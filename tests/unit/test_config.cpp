/**
 * @file test_config.cpp
 * @brief Unit tests for configuration loading.
 */

#include "core/config.hpp"

#include <gtest/gtest.h>
#include <filesystem>
#include <fstream>

using namespace plan_scope;

class ConfigTest : public ::testing::Test {
protected:
    std::filesystem::path temp_dir_;

    void SetUp() override {
        temp_dir_ = std::filesystem::temp_directory_path() / "ps_test_config";
        std::filesystem::create_directories(temp_dir_);
    }

    void TearDown() override {
        std::filesystem::remove_all(temp_dir_);
    }

    std::filesystem::path write_toml(const std::string& content) {
        auto path = temp_dir_ / "test.toml";
        std::ofstream ofs(path);
        ofs << content;
        return path;
    }
};

TEST_F(ConfigTest, DefaultConfig) {
    auto config = default_config();
    EXPECT_EQ(config.log.level, LogLevel::Info);
    EXPECT_EQ(config.log.sink, LogSinkKind::Stderr);
    EXPECT_EQ(config.log.max_file_size_mb, 10u);
    EXPECT_EQ(config.log.rotate_count, 3u);
    EXPECT_EQ(config.report.format, ReportFormat::Text);
    EXPECT_EQ(config.report.sections.size(), 5u);
}

TEST_F(ConfigTest, LoadFullConfig) {
    auto path = write_toml(R"(
        [log]
        level = "debug"
        sink = "file"
        dir = "/tmp/ps_logs"
        max_file_size_mb = 2
        rotate_count = 5

        [report]
        format = "json"
        sections = ["risks", "health"]
    )");

    auto result = load_config(path);
    ASSERT_TRUE(result.has_value()) << result.error().message;

    auto& config = *result;
    EXPECT_EQ(config.log.level, LogLevel::Debug);
    EXPECT_EQ(config.log.sink, LogSinkKind::File);
    EXPECT_EQ(config.log.dir, std::filesystem::path{"/tmp/ps_logs"});
    EXPECT_EQ(config.log.max_file_size_mb, 2u);
    EXPECT_EQ(config.log.rotate_count, 5u);
    EXPECT_EQ(config.report.format, ReportFormat::Json);
    EXPECT_EQ(config.report.sections, (std::vector<std::string>{"risks", "health"}));
}

TEST_F(ConfigTest, PartialConfig) {
    auto result = parse_config(R"(
        [log]
        level = "warn"
    )");
    ASSERT_TRUE(result.has_value());

    // Overridden field
    EXPECT_EQ(result->log.level, LogLevel::Warn);
    // Defaults for everything else
    EXPECT_EQ(result->log.sink, LogSinkKind::Stderr);
    EXPECT_EQ(result->report.format, ReportFormat::Text);
}

TEST_F(ConfigTest, EmptyDocumentKeepsDefaults) {
    auto result = parse_config("");
    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(result->report.sections.size(), 5u);
}

TEST_F(ConfigTest, NonexistentFile) {
    auto result = load_config("/nonexistent/path/config.toml");
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, ErrorCode::NotFound);
}

TEST_F(ConfigTest, MalformedToml) {
    auto path = write_toml("this is [[ not valid toml }}}}");
    auto result = load_config(path);
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, ErrorCode::Parse);
}

TEST_F(ConfigTest, UnknownLogLevel) {
    auto result = parse_config(R"(
        [log]
        level = "chatty"
    )");
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, ErrorCode::InvalidInput);
}

TEST_F(ConfigTest, UnknownSink) {
    auto result = parse_config(R"(
        [log]
        sink = "syslog"
    )");
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, ErrorCode::InvalidInput);
}

TEST_F(ConfigTest, UnknownReportFormat) {
    auto result = parse_config(R"(
        [report]
        format = "yaml"
    )");
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, ErrorCode::InvalidInput);
}

TEST_F(ConfigTest, UnknownReportSection) {
    auto result = parse_config(R"(
        [report]
        sections = ["risks", "gantt"]
    )");
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, ErrorCode::InvalidInput);
    EXPECT_NE(result.error().message.find("gantt"), std::string::npos);
}

TEST_F(ConfigTest, ShippedDefaultConfigParses) {
    auto path = std::filesystem::path{PLAN_SCOPE_SOURCE_DIR} / "config" / "default.toml";
    auto result = load_config(path);
    ASSERT_TRUE(result.has_value()) << result.error().message;
    EXPECT_EQ(result->log.sink, LogSinkKind::Stderr);
}
