/**
 * @file host_info.hpp
 * @brief Who is running a viewer, and the best-effort access log.
 */

#pragma once

#include <filesystem>
#include <string>

namespace fleet_usage {

/// Environment variable overriding the access log location.
inline constexpr const char* kAccessLogEnv = "FLEET_USAGE_ACCESS_LOG";
inline constexpr const char* kDefaultAccessLogPath = "/var/log/fleet_usage/access.log";

struct HostInfo {
    std::string hostname;
    std::string user;
    std::string os;          ///< Kernel name, e.g. "Linux"
    std::string os_release;

    /// Gather from the running system; unknown fields become "?".
    static HostInfo current();
};

/// FLEET_USAGE_ACCESS_LOG if set and non-empty, else the default path.
[[nodiscard]] std::filesystem::path access_log_path();

/// "<rfc3339>\tfrom user@host\t(os release)"
[[nodiscard]] std::string format_access_line(const HostInfo& info, const std::string& timestamp);

/**
 * @brief Append one access line to an existing log file.
 *
 * The file is never created. Returns false on any failure.
 */
bool log_access(const HostInfo& info, const std::filesystem::path& path);

}  // namespace fleet_usage
