/**
 * @file host_info.cpp
 * @brief HostInfo discovery and access logging.
 */

#include "view/host_info.hpp"

#include <fcntl.h>
#include <pwd.h>
#include <sys/utsname.h>
#include <unistd.h>

#include <chrono>
#include <cstdlib>
#include <ctime>
#include <vector>

namespace fleet_usage {

namespace {

constexpr const char* kUnknown = "?";

std::string current_user() {
    std::vector<char> buffer(16384);
    struct passwd pwd{};
    struct passwd* found = nullptr;
    if (::getpwuid_r(::geteuid(), &pwd, buffer.data(), buffer.size(), &found) == 0 && found) {
        return found->pw_name;
    }
    return kUnknown;
}

/// Local time with numeric offset, e.g. 2024-05-01T12:00:00+02:00.
std::string rfc3339_now() {
    auto now = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
    std::tm local{};
    localtime_r(&now, &local);

    char stamp[32];
    char offset[8];
    std::strftime(stamp, sizeof(stamp), "%Y-%m-%dT%H:%M:%S", &local);
    std::strftime(offset, sizeof(offset), "%z", &local);   // +0200

    std::string text = stamp;
    std::string zone = offset;
    if (zone.size() == 5) zone.insert(3, ":");
    return text + zone;
}

}  // anonymous namespace

HostInfo HostInfo::current() {
    HostInfo info{kUnknown, current_user(), kUnknown, kUnknown};

    char hostname[256] = {};
    if (::gethostname(hostname, sizeof(hostname) - 1) == 0) info.hostname = hostname;

    struct utsname uts{};
    if (::uname(&uts) == 0) {
        info.os = uts.sysname;
        info.os_release = uts.release;
    }
    return info;
}

std::filesystem::path access_log_path() {
    const char* value = std::getenv(kAccessLogEnv);
    if (value && *value) return value;
    return kDefaultAccessLogPath;
}

std::string format_access_line(const HostInfo& info, const std::string& timestamp) {
    return timestamp + "\tfrom " + info.user + "@" + info.hostname
         + "\t(" + info.os + " " + info.os_release + ")\n";
}

bool log_access(const HostInfo& info, const std::filesystem::path& path) {
    // O_APPEND without O_CREAT: a missing log means logging is switched off.
    int fd = ::open(path.c_str(), O_WRONLY | O_APPEND | O_CLOEXEC);
    if (fd < 0) return false;

    auto line = format_access_line(info, rfc3339_now());
    auto written = ::write(fd, line.data(), line.size());
    bool ok = written == static_cast<ssize_t>(line.size());
    if (::close(fd) != 0) ok = false;
    return ok;
}

}  // namespace fleet_usage
