/**
 * @file config.cpp
 * @brief Configuration loading from TOML files using toml++.
 */

#include "core/config.hpp"

#include <toml++/toml.hpp>

#include <optional>
#include <string_view>

namespace fleet_usage {

namespace {

std::vector<std::string> string_array(const toml::node_view<toml::node>& node,
                                      std::vector<std::string> fallback) {
    const auto* array = node.as_array();
    if (!array) return fallback;

    std::vector<std::string> values;
    values.reserve(array->size());
    for (const auto& element : *array) {
        if (auto value = element.value<std::string>()) {
            values.push_back(*value);
        }
    }
    return values;
}

/**
 * @brief Read an optional integer key into `out`, keeping `out` when absent.
 *
 * A key of the wrong type or outside [min, max] is an error rather than a
 * silent wrap into an unsigned field.
 */
template <typename T>
std::optional<Error> read_bounded(const toml::node_view<toml::node>& section,
                                  std::string_view section_name, std::string_view key,
                                  T& out, int64_t min, int64_t max) {
    auto node = section[key];
    if (!node) return std::nullopt;

    auto name = std::string{section_name} + "." + std::string{key};
    auto value = node.value<int64_t>();
    if (!node.is_integer() || !value) {
        return Error{ErrorKind::Config, name + " must be an integer"};
    }
    if (*value < min || *value > max) {
        return Error{ErrorKind::Config,
                     name + " must be between " + std::to_string(min) + " and "
                         + std::to_string(max) + ", got " + std::to_string(*value)};
    }
    out = static_cast<T>(*value);
    return std::nullopt;
}

}  // anonymous namespace

Result<Config> load_config(const std::filesystem::path& path) {
    if (!std::filesystem::exists(path)) {
        return Error{ErrorKind::Config, "Configuration file not found: " + path.string()};
    }

    try {
        auto tbl = toml::parse_file(path.string());
        Config config;
        std::optional<Error> error;

        // [gather]
        if (auto gather = tbl["gather"]; gather.is_table()) {
            config.gather.roster = gather["roster"].value_or(std::string{});
            config.gather.output = gather["output"].value_or(std::string{});
            config.gather.sampler = gather["sampler"].value_or(std::string{});
            config.gather.sampler_policy = gather["sampler_policy"].value_or(std::string{});
            if (!error) error = read_bounded(gather, "gather", "max_concurrency",
                                             config.gather.max_concurrency, 1, kMaxConcurrency);
            if (!error) error = read_bounded(gather, "gather", "host_timeout_ms",
                                             config.gather.host_timeout_ms, 1, kMaxHostTimeoutMs);
            if (!error) error = read_bounded(gather, "gather", "repeat_interval_s",
                                             config.gather.repeat_interval_s, 0, kMaxRepeatIntervalS);
        }

        // [ssh]
        if (auto ssh = tbl["ssh"]; ssh.is_table()) {
            config.ssh.program = ssh["program"].value_or(std::string{"ssh"});
            config.ssh.options = string_array(ssh["options"], config.ssh.options);
            if (!error) error = read_bounded(ssh, "ssh", "max_output_bytes",
                                             config.ssh.max_output_bytes, 1, kMaxOutputBytes);
        }

        // [viewer]
        if (auto viewer = tbl["viewer"]; viewer.is_table()) {
            config.viewer.data_path = viewer["data_path"].value_or(
                config.viewer.data_path.string());
            config.viewer.show_room = viewer["show_room"].value_or(false);
            if (!error) error = read_bounded(viewer, "viewer", "refresh_interval_ms",
                                             config.viewer.refresh_interval_ms, 1,
                                             kMaxRefreshIntervalMs);
            if (!error) error = read_bounded(viewer, "viewer", "stale_after_s",
                                             config.viewer.stale_after_s, 0, kMaxStaleAfterS);
        }

        // [telemetry]
        if (auto telemetry = tbl["telemetry"]; telemetry.is_table()) {
            config.telemetry.log_dir = telemetry["log_dir"].value_or(std::string{});
            if (!error) error = read_bounded(telemetry, "telemetry", "max_file_size_mb",
                                             config.telemetry.max_file_size_mb, 1,
                                             kMaxLogFileSizeMb);
            if (!error) error = read_bounded(telemetry, "telemetry", "rotate_count",
                                             config.telemetry.rotate_count, 0, kMaxRotateCount);
            config.telemetry.log_level = telemetry["log_level"].value_or(std::string{"info"});
        }

        if (error) return *error;
        return config;

    } catch (const toml::parse_error& err) {
        return Error{ErrorKind::Config,
                     std::string{"TOML parse error: "} + std::string{err.description()}};
    }
}

Config default_config() {
    return Config{};
}

}  // namespace fleet_usage
