/**
 * @file linux_probe.cpp
 * @brief LinuxProbe: reads per-process, per-core, memory and load figures
 *        from the Linux /proc filesystem.
 *
 * Each refresh() takes a full reading. CPU percentages are derived from the
 * difference between the current and the previous reading.
 */

#include "probe/probe.hpp"

#include <pwd.h>
#include <unistd.h>

#include <algorithm>
#include <charconv>
#include <fstream>
#include <sstream>
#include <string>
#include <system_error>
#include <vector>

namespace fleet_usage {

// Use the header-defined internal types
using CpuTimes = LinuxProbe::CpuTimesInternal;
using ProcessTimes = LinuxProbe::ProcessTimesInternal;

// ─────────────────────────────────────────────
// Internal helpers for /proc parsing
// ─────────────────────────────────────────────
namespace {

std::string read_file_line(const std::filesystem::path& path) {
    std::ifstream ifs(path);
    std::string line;
    if (ifs.is_open()) {
        std::getline(ifs, line);
    }
    return line;
}

std::vector<std::string> read_file_lines(const std::filesystem::path& path) {
    std::ifstream ifs(path);
    std::vector<std::string> lines;
    std::string line;
    while (std::getline(ifs, line)) {
        lines.push_back(std::move(line));
    }
    return lines;
}

/**
 * @brief Parse a CPU line from /proc/stat.
 * Format: "cpu[N] user nice system idle iowait irq softirq steal ..."
 */
CpuTimes parse_cpu_line(const std::string& line) {
    CpuTimes times;
    std::istringstream iss(line);
    std::string label;
    iss >> label >> times.user >> times.nice >> times.system >> times.idle
        >> times.iowait >> times.irq >> times.softirq >> times.steal;
    return times;
}

bool is_core_line(const std::string& line) {
    return line.size() > 3 && line.starts_with("cpu")
        && line[3] >= '0' && line[3] <= '9';
}

float compute_cpu_percent(const CpuTimes& prev, const CpuTimes& curr) {
    auto prev_total = prev.user + prev.nice + prev.system + prev.idle
                    + prev.iowait + prev.irq + prev.softirq + prev.steal;
    auto curr_total = curr.user + curr.nice + curr.system + curr.idle
                    + curr.iowait + curr.irq + curr.softirq + curr.steal;
    auto prev_active = prev.user + prev.nice + prev.system
                     + prev.irq + prev.softirq + prev.steal;
    auto curr_active = curr.user + curr.nice + curr.system
                     + curr.irq + curr.softirq + curr.steal;

    if (curr_total <= prev_total || curr_active < prev_active) return 0.0f;
    uint64_t total_delta = curr_total - prev_total;
    uint64_t active_delta = curr_active - prev_active;
    return 100.0f * static_cast<float>(active_delta) / static_cast<float>(total_delta);
}

std::optional<Pid> parse_pid(const std::string& name) {
    Pid pid = 0;
    auto [ptr, ec] = std::from_chars(name.data(), name.data() + name.size(), pid);
    if (ec != std::errc{} || ptr != name.data() + name.size()) return std::nullopt;
    return pid;
}

/**
 * @brief Parse /proc/<pid>/stat.
 * Format: "pid (comm) state ppid ... utime(14) stime(15) ..."
 * comm may contain spaces and parentheses, so split on the last ')'.
 */
std::optional<ProcessTimes> parse_process_stat(const std::string& content) {
    auto lp = content.find('(');
    auto rp = content.rfind(')');
    if (lp == std::string::npos || rp == std::string::npos || rp < lp) return std::nullopt;

    ProcessTimes times;
    times.name = content.substr(lp + 1, rp - lp - 1);

    std::istringstream iss(content.substr(rp + 1));
    std::string field;
    // Fields after comm start at 3 (state); utime is field 14.
    for (int i = 3; i < 14; ++i) {
        if (!(iss >> field)) return std::nullopt;
    }
    uint64_t utime = 0;
    uint64_t stime = 0;
    if (!(iss >> utime >> stime)) return std::nullopt;
    times.ticks = utime + stime;
    return times;
}

/**
 * @brief Read "Uid: real effective saved fs" from /proc/<pid>/status.
 */
void parse_process_uids(const std::filesystem::path& status_path, ProcessTimes& times) {
    for (const auto& line : read_file_lines(status_path)) {
        if (!line.starts_with("Uid:")) continue;
        std::istringstream iss(line.substr(4));
        Uid real = 0;
        Uid effective = 0;
        if (iss >> real) times.real_uid = real;
        if (iss >> effective) times.effective_uid = effective;
        return;
    }
}

}  // anonymous namespace

// ─────────────────────────────────────────────
// LinuxProbe implementation
// ─────────────────────────────────────────────

LinuxProbe::LinuxProbe(std::filesystem::path proc_root)
    : proc_root_(std::move(proc_root)) {}

Result<void> LinuxProbe::refresh() {
    auto now = std::chrono::steady_clock::now();

    // CPU
    auto stat_lines = read_file_lines(proc_root_ / "stat");
    if (stat_lines.empty() || !stat_lines[0].starts_with("cpu ")) {
        return Error{ErrorKind::Probe, "could not read " + (proc_root_ / "stat").string()};
    }
    auto cpu_times = parse_cpu_line(stat_lines[0]);
    std::vector<CpuTimes> core_times;
    for (size_t i = 1; i < stat_lines.size() && is_core_line(stat_lines[i]); ++i) {
        core_times.push_back(parse_cpu_line(stat_lines[i]));
    }

    bool have_previous = primed_ && core_times.size() == prev_per_core_times_.size();
    per_core_percent_.assign(core_times.size(), 0.0f);
    global_cpu_percent_ = 0.0f;
    if (have_previous) {
        global_cpu_percent_ = compute_cpu_percent(prev_cpu_times_, cpu_times);
        for (size_t i = 0; i < core_times.size(); ++i) {
            per_core_percent_[i] = compute_cpu_percent(prev_per_core_times_[i], core_times[i]);
        }
    }

    // Memory
    uint64_t total_kb = 0;
    uint64_t available_kb = 0;
    for (const auto& line : read_file_lines(proc_root_ / "meminfo")) {
        if (line.starts_with("MemTotal:")) {
            std::istringstream iss(line.substr(9));
            iss >> total_kb;
        } else if (line.starts_with("MemAvailable:")) {
            std::istringstream iss(line.substr(13));
            iss >> available_kb;
        }
    }
    if (total_kb == 0) {
        return Error{ErrorKind::Probe, "could not read " + (proc_root_ / "meminfo").string()};
    }
    memory_.total = total_kb * 1024;
    memory_.used = (total_kb - std::min(available_kb, total_kb)) * 1024;

    // Load average
    {
        std::istringstream iss(read_file_line(proc_root_ / "loadavg"));
        LoadAverage load;
        if (!(iss >> load.one >> load.five >> load.fifteen)) {
            return Error{ErrorKind::Probe, "could not read " + (proc_root_ / "loadavg").string()};
        }
        load_avg_ = load;
    }

    // Processes
    std::error_code ec;
    std::filesystem::directory_iterator it(proc_root_, ec);
    if (ec) {
        return Error{ErrorKind::Probe, "could not list " + proc_root_.string() + ": " + ec.message()};
    }

    auto elapsed_s = std::chrono::duration<double>(now - prev_refresh_).count();
    auto ticks_per_second = static_cast<double>(::sysconf(_SC_CLK_TCK));

    std::unordered_map<Pid, ProcessTimes> current;
    processes_.clear();
    for (; it != std::filesystem::directory_iterator{}; it.increment(ec)) {
        if (ec) break;
        const auto& entry = *it;
        auto pid = parse_pid(entry.path().filename().string());
        if (!pid) continue;

        // Processes may exit while we walk the directory.
        auto stat = parse_process_stat(read_file_line(entry.path() / "stat"));
        if (!stat) continue;
        parse_process_uids(entry.path() / "status", *stat);

        float cpu_percent = 0.0f;
        if (primed_ && elapsed_s > 0.0 && ticks_per_second > 0.0) {
            auto prev = prev_processes_.find(*pid);
            if (prev != prev_processes_.end() && prev->second.name == stat->name
                && stat->ticks >= prev->second.ticks) {
                auto cpu_seconds = static_cast<double>(stat->ticks - prev->second.ticks)
                                 / ticks_per_second;
                cpu_percent = static_cast<float>(100.0 * cpu_seconds / elapsed_s);
            }
        }

        processes_.push_back(ProcessReading{
            .pid = *pid,
            .name = stat->name,
            .effective_uid = stat->effective_uid,
            .real_uid = stat->real_uid,
            .cpu_percent = cpu_percent,
        });
        current.emplace(*pid, std::move(*stat));
    }

    prev_cpu_times_ = cpu_times;
    prev_per_core_times_ = std::move(core_times);
    prev_processes_ = std::move(current);
    prev_refresh_ = now;
    primed_ = true;
    return Result<void>{};
}

std::string LinuxProbe::hostname() const {
    char buffer[256] = {};
    if (::gethostname(buffer, sizeof(buffer) - 1) != 0) {
        return std::string{kUnknownUser};
    }
    return buffer;
}

std::optional<std::string> LinuxProbe::user_name(Uid uid) {
    if (auto cached = user_cache_.find(uid); cached != user_cache_.end()) {
        return cached->second;
    }

    std::vector<char> buffer(16384);
    struct passwd pwd{};
    struct passwd* found = nullptr;
    std::optional<std::string> name;
    if (::getpwuid_r(uid, &pwd, buffer.data(), buffer.size(), &found) == 0 && found) {
        name = found->pw_name;
    }
    user_cache_.emplace(uid, name);
    return name;
}

Pid LinuxProbe::self_pid() const noexcept {
    return static_cast<Pid>(::getpid());
}

}  // namespace fleet_usage
