/**
 * @file test_log_sinks.cpp
 * @brief Unit tests for Logger records and the file sink rotation.
 */

#include "core/logger.hpp"
#include "telemetry/log_sinks.hpp"

#include <gtest/gtest.h>
#include <nlohmann/json.hpp>
#include <unistd.h>
#include <filesystem>
#include <fstream>
#include <limits>

using namespace fleet_usage;

namespace {

class CaptureSink : public ILogSink {
public:
    explicit CaptureSink(std::vector<std::string>& lines) : lines_(lines) {}
    void write(std::string_view json_line) override { lines_.emplace_back(json_line); }
    void flush() override {}

private:
    std::vector<std::string>& lines_;
};

size_t count_lines(const std::filesystem::path& path) {
    std::ifstream in(path);
    std::string line;
    size_t n = 0;
    while (std::getline(in, line)) ++n;
    return n;
}

}  // namespace

TEST(LoggerTest, RecordIsJsonWithFields) {
    std::vector<std::string> lines;
    Logger logger(std::make_unique<CaptureSink>(lines), LogLevel::Info);

    logger.warn("gather failed", {{"host", "m2"}, {"cause", "quote \" and\nnewline"}});
    ASSERT_EQ(lines.size(), 1u);

    auto record = nlohmann::json::parse(lines[0]);
    EXPECT_EQ(record.at("level"), "warn");
    EXPECT_EQ(record.at("msg"), "gather failed");
    EXPECT_EQ(record.at("host"), "m2");
    EXPECT_EQ(record.at("cause"), "quote \" and\nnewline");
    EXPECT_TRUE(record.at("ts").get<std::string>().ends_with("Z"));
}

TEST(LoggerTest, LevelFilter) {
    std::vector<std::string> lines;
    Logger logger(std::make_unique<CaptureSink>(lines), LogLevel::Warn);

    logger.debug("d");
    logger.info("i");
    logger.warn("w");
    logger.error("e");
    EXPECT_EQ(lines.size(), 2u);

    logger.set_level(LogLevel::Debug);
    logger.debug("d");
    EXPECT_EQ(lines.size(), 3u);
    EXPECT_EQ(logger.level(), LogLevel::Debug);
}

TEST(LoggerTest, InvalidUtf8DoesNotThrow) {
    std::vector<std::string> lines;
    Logger logger(std::make_unique<CaptureSink>(lines));
    EXPECT_NO_THROW(logger.info("process", {{"name", std::string{"\xff\xfe bad"}}}));
    EXPECT_EQ(lines.size(), 1u);
}

TEST(LoggerTest, ParseLevel) {
    EXPECT_EQ(parse_log_level("debug"), LogLevel::Debug);
    EXPECT_EQ(parse_log_level("error"), LogLevel::Error);
    EXPECT_FALSE(parse_log_level("verbose").has_value());
}

class JsonFileSinkTest : public ::testing::Test {
protected:
    std::filesystem::path dir_;

    void SetUp() override {
        dir_ = std::filesystem::temp_directory_path()
             / ("fleet_usage_test_logs_" + std::to_string(::getpid()));
        std::filesystem::remove_all(dir_);
    }

    void TearDown() override {
        std::filesystem::remove_all(dir_);
    }
};

TEST_F(JsonFileSinkTest, AppendsLines) {
    {
        JsonFileSink sink(dir_, "fleet_gather");
        sink.write(R"({"msg":"one"})");
        sink.write(R"({"msg":"two"})");
    }
    EXPECT_EQ(count_lines(dir_ / "fleet_gather.ndjson"), 2u);
}

TEST_F(JsonFileSinkTest, RotatesAndKeepsLimitedHistory) {
    JsonFileSink sink(dir_, "app", 50, 2);
    sink.set_max_file_size_bytes(20);

    // Each line is 15 bytes with its newline, so every write rotates.
    for (int i = 0; i < 5; ++i) {
        sink.write(R"({"n":"abcdef"})");
    }
    sink.flush();

    EXPECT_EQ(count_lines(sink.current_path()), 1u);
    EXPECT_TRUE(std::filesystem::exists(sink.rotated_path(1)));
    EXPECT_TRUE(std::filesystem::exists(sink.rotated_path(2)));
    EXPECT_FALSE(std::filesystem::exists(sink.rotated_path(3)));
}

TEST_F(JsonFileSinkTest, HugeRotateCountIsCapped) {
    JsonFileSink sink(dir_, "p", 50, std::numeric_limits<uint32_t>::max());
    sink.set_max_file_size_bytes(1);

    // Each write rotates; with an uncapped count this would not return.
    sink.write(R"({"n":1})");
    sink.write(R"({"n":2})");
    sink.write(R"({"n":3})");
    sink.flush();

    EXPECT_EQ(count_lines(sink.current_path()), 1u);
    EXPECT_TRUE(std::filesystem::exists(sink.rotated_path(2)));
    EXPECT_FALSE(std::filesystem::exists(sink.rotated_path(3)));
}

TEST_F(JsonFileSinkTest, FactoryPicksSink) {
    TelemetryConfig stderr_config;
    auto to_stderr = make_log_sink(stderr_config, "x");
    ASSERT_TRUE(to_stderr.has_value());
    EXPECT_NE(dynamic_cast<StderrSink*>(to_stderr->get()), nullptr);

    TelemetryConfig file_config;
    file_config.log_dir = dir_ / "nested";
    auto to_file = make_log_sink(file_config, "x");
    ASSERT_TRUE(to_file.has_value());
    EXPECT_NE(dynamic_cast<JsonFileSink*>(to_file->get()), nullptr);
    EXPECT_TRUE(std::filesystem::is_directory(dir_ / "nested"));
}
