/**
 * @file config.hpp
 * @brief Gatherer and viewer configuration with TOML deserialization.
 */

#pragma once

#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

#include "core/result.hpp"

namespace fleet_usage {

// Accepted ranges for numeric keys; anything outside is a Config error.
inline constexpr int64_t kMaxConcurrency = 1024;
inline constexpr int64_t kMaxHostTimeoutMs = 24LL * 60 * 60 * 1000;
inline constexpr int64_t kMaxRepeatIntervalS = 7LL * 24 * 60 * 60;
inline constexpr int64_t kMaxOutputBytes = 1LL << 30;
inline constexpr int64_t kMaxRefreshIntervalMs = 60LL * 60 * 1000;
inline constexpr int64_t kMaxStaleAfterS = 7LL * 24 * 60 * 60;
inline constexpr int64_t kMaxLogFileSizeMb = 4096;
inline constexpr int64_t kMaxRotateCount = 100;

struct GatherConfig {
    std::filesystem::path roster;
    std::filesystem::path output;
    std::string sampler;                ///< Sampler path as seen from each remote host
    std::string sampler_policy;         ///< Optional policy path passed to the sampler
    uint32_t max_concurrency = 16;
    uint32_t host_timeout_ms = 30000;
    uint32_t repeat_interval_s = 0;     ///< 0 = single run
};

struct SshConfig {
    std::string program = "ssh";
    std::vector<std::string> options = {"-o", "BatchMode=yes", "-o", "ConnectTimeout=10"};
    uint64_t max_output_bytes = 16ULL * 1024 * 1024;
};

struct ViewerConfig {
    std::filesystem::path data_path = "/var/lib/fleet_usage/cluster.json";
    bool show_room = false;
    uint32_t refresh_interval_ms = 1000;
    uint32_t stale_after_s = 120;
};

struct TelemetryConfig {
    std::filesystem::path log_dir;      ///< Empty = diagnostic stream (stderr)
    uint32_t max_file_size_mb = 50;
    uint32_t rotate_count = 5;
    std::string log_level = "info";
};

/**
 * @brief Top-level configuration shared by fleet_gather and fleet_view.
 */
struct Config {
    GatherConfig gather;
    SshConfig ssh;
    ViewerConfig viewer;
    TelemetryConfig telemetry;
};

/**
 * @brief Load configuration from a TOML file. Missing keys keep their defaults.
 */
Result<Config> load_config(const std::filesystem::path& path);

/**
 * @brief Create a default configuration.
 */
Config default_config();

}  // namespace fleet_usage
