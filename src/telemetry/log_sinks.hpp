/**
 * @file log_sinks.hpp
 * @brief NDJSON log destinations: rotating files, stderr, or nowhere.
 */

#pragma once

#include "core/config.hpp"
#include "core/logger.hpp"

#include <filesystem>
#include <fstream>
#include <memory>
#include <string>

namespace fleet_usage {

/**
 * @brief Appends NDJSON to `<log_dir>/<prefix>.ndjson`.
 *
 * When the current file would grow past the size limit it is renamed to
 * `<prefix>.1.ndjson` (older files shift up by one) and a fresh file is
 * started. At most `max_files` rotated files are kept, capped at
 * kMaxRotateCount.
 */
class JsonFileSink : public ILogSink {
public:
    JsonFileSink(const std::filesystem::path& log_dir,
                 const std::string& prefix,
                 uint32_t max_file_size_mb = 50,
                 uint32_t max_files = 5);
    ~JsonFileSink() override;

    void write(std::string_view json_line) override;
    void flush() override;

    [[nodiscard]] std::filesystem::path current_path() const;
    [[nodiscard]] std::filesystem::path rotated_path(uint32_t index) const;

    /// Byte limit override, mainly so tests can exercise rotation.
    void set_max_file_size_bytes(uint64_t bytes) noexcept { max_file_size_bytes_ = bytes; }

private:
    void rotate_if_needed(size_t incoming);
    void open_current();

    std::filesystem::path log_dir_;
    std::string prefix_;
    uint64_t max_file_size_bytes_;
    uint32_t max_files_;
    std::ofstream current_file_;
    uint64_t current_size_{0};
};

/**
 * @brief Writes to stderr. stdout is reserved for program output.
 */
class StderrSink : public ILogSink {
public:
    void write(std::string_view json_line) override;
    void flush() override;
};

/**
 * @brief Discards all output.
 */
class NullSink : public ILogSink {
public:
    void write(std::string_view /*json_line*/) override {}
    void flush() override {}
};

/**
 * @brief Build the sink described by the [telemetry] section.
 *
 * An empty log_dir selects StderrSink. A log directory that cannot be
 * created is a Config error.
 */
Result<std::unique_ptr<ILogSink>> make_log_sink(const TelemetryConfig& config,
                                                const std::string& prefix);

}  // namespace fleet_usage
