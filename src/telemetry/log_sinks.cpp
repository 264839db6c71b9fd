/**
 * @file log_sinks.cpp
 * @brief Log sink implementations.
 */

#include "telemetry/log_sinks.hpp"

#include <algorithm>
#include <iostream>
#include <system_error>

namespace fleet_usage {

// ── JsonFileSink ─────────────────────────────

JsonFileSink::JsonFileSink(const std::filesystem::path& log_dir,
                           const std::string& prefix,
                           uint32_t max_file_size_mb,
                           uint32_t max_files)
    : log_dir_(log_dir)
    , prefix_(prefix)
    , max_file_size_bytes_(static_cast<uint64_t>(max_file_size_mb) * 1024 * 1024)
    , max_files_(static_cast<uint32_t>(std::min<int64_t>(max_files, kMaxRotateCount))) {
    std::error_code ec;
    std::filesystem::create_directories(log_dir_, ec);
    open_current();
}

JsonFileSink::~JsonFileSink() {
    if (current_file_.is_open()) {
        current_file_.flush();
        current_file_.close();
    }
}

std::filesystem::path JsonFileSink::current_path() const {
    return log_dir_ / (prefix_ + ".ndjson");
}

std::filesystem::path JsonFileSink::rotated_path(uint32_t index) const {
    return log_dir_ / (prefix_ + "." + std::to_string(index) + ".ndjson");
}

void JsonFileSink::open_current() {
    current_file_.open(current_path(), std::ios::app);
    std::error_code ec;
    auto size = std::filesystem::file_size(current_path(), ec);
    current_size_ = ec ? 0 : size;
}

void JsonFileSink::write(std::string_view json_line) {
    rotate_if_needed(json_line.size() + 1);
    if (current_file_.is_open()) {
        current_file_ << json_line << '\n';
        current_size_ += json_line.size() + 1;
    }
}

void JsonFileSink::flush() {
    if (current_file_.is_open()) {
        current_file_.flush();
    }
}

void JsonFileSink::rotate_if_needed(size_t incoming) {
    if (current_size_ == 0 || current_size_ + incoming <= max_file_size_bytes_) return;

    current_file_.close();
    std::error_code ec;
    if (max_files_ == 0) {
        std::filesystem::remove(current_path(), ec);
    } else {
        std::filesystem::remove(rotated_path(max_files_), ec);
        for (uint32_t i = max_files_; i > 1; --i) {
            std::filesystem::rename(rotated_path(i - 1), rotated_path(i), ec);
        }
        std::filesystem::rename(current_path(), rotated_path(1), ec);
    }
    open_current();
}

// ── StderrSink ───────────────────────────────

void StderrSink::write(std::string_view json_line) {
    std::cerr << json_line << '\n';
}

void StderrSink::flush() {
    std::cerr.flush();
}

// ── Factory ──────────────────────────────────

Result<std::unique_ptr<ILogSink>> make_log_sink(const TelemetryConfig& config,
                                                const std::string& prefix) {
    if (config.log_dir.empty()) {
        return std::unique_ptr<ILogSink>(std::make_unique<StderrSink>());
    }

    std::error_code ec;
    std::filesystem::create_directories(config.log_dir, ec);
    if (ec) {
        return Error{ErrorKind::Config,
                     "cannot create log directory " + config.log_dir.string() + ": " + ec.message()};
    }
    return std::unique_ptr<ILogSink>(std::make_unique<JsonFileSink>(
        config.log_dir, prefix, config.max_file_size_mb, config.rotate_count));
}

}  // namespace fleet_usage
