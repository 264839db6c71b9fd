/**
 * @file logger.cpp
 * @brief Logger implementation with ISO 8601 timestamps.
 */

#include "core/logger.hpp"

#include <nlohmann/json.hpp>

#include <chrono>
#include <ctime>
#include <iomanip>
#include <sstream>

namespace fleet_usage {

namespace {

std::string iso8601_now() {
    auto now = std::chrono::system_clock::now();
    auto time_t_now = std::chrono::system_clock::to_time_t(now);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch()) % 1000;

    std::tm utc{};
    gmtime_r(&time_t_now, &utc);

    std::ostringstream oss;
    oss << std::put_time(&utc, "%FT%T")
        << '.' << std::setfill('0') << std::setw(3) << ms.count() << 'Z';
    return oss.str();
}

}  // anonymous namespace

std::optional<LogLevel> parse_log_level(std::string_view text) noexcept {
    if (text == "debug") return LogLevel::Debug;
    if (text == "info")  return LogLevel::Info;
    if (text == "warn")  return LogLevel::Warn;
    if (text == "error") return LogLevel::Error;
    return std::nullopt;
}

Logger::Logger(std::unique_ptr<ILogSink> sink, LogLevel min_level)
    : sink_(std::move(sink)), min_level_(min_level) {}

void Logger::debug(std::string_view message, const LogFields& fields) { log(LogLevel::Debug, message, fields); }
void Logger::info(std::string_view message, const LogFields& fields)  { log(LogLevel::Info, message, fields); }
void Logger::warn(std::string_view message, const LogFields& fields)  { log(LogLevel::Warn, message, fields); }
void Logger::error(std::string_view message, const LogFields& fields) { log(LogLevel::Error, message, fields); }

void Logger::log(LogLevel level, std::string_view message, const LogFields& fields) {
    if (level < min_level_) return;

    nlohmann::ordered_json record;
    record["level"] = to_string(level);
    record["ts"] = iso8601_now();
    record["msg"] = message;
    for (const auto& [key, value] : fields) {
        record[key] = value;
    }
    // Invalid UTF-8 in process names or remote stderr must not throw here.
    auto line = record.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);

    std::lock_guard lock(mutex_);
    sink_->write(line);
}

void Logger::flush() {
    std::lock_guard lock(mutex_);
    sink_->flush();
}

void Logger::set_level(LogLevel level) noexcept { min_level_ = level; }
LogLevel Logger::level() const noexcept { return min_level_; }

}  // namespace fleet_usage
