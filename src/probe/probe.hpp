/**
 * @file probe.hpp
 * @brief System probe implementations.
 *
 * Provides LinuxProbe (reads /proc) and MockProbe (testing). Both satisfy the
 * ProbeLike concept so the local sampler is resolved at compile time.
 */

#pragma once

#include "core/concepts.hpp"
#include "core/result.hpp"
#include "core/types.hpp"

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace fleet_usage {

// ─────────────────────────────────────────────
// LinuxProbe
// ─────────────────────────────────────────────

/**
 * @brief Reads usage from Linux pseudo-filesystems.
 *
 * Data sources:
 *   /proc/stat           aggregate and per-core jiffies
 *   /proc/<pid>/stat     process name and utime/stime
 *   /proc/<pid>/status   real and effective uid
 *   /proc/meminfo        MemTotal and MemAvailable
 *   /proc/loadavg        1/5/15 minute load averages
 *
 * CPU figures are deltas between the last two refresh() calls; after a single
 * refresh they are all zero.
 */
class LinuxProbe {
public:
    /// sysinfo-compatible lower bound between two CPU reads.
    static constexpr std::chrono::milliseconds kMinRefreshInterval{200};

    explicit LinuxProbe(std::filesystem::path proc_root = "/proc");

    // Non-copyable
    LinuxProbe(const LinuxProbe&) = delete;
    LinuxProbe& operator=(const LinuxProbe&) = delete;

    // ProbeLike interface
    Result<void> refresh();
    [[nodiscard]] std::chrono::milliseconds min_refresh_interval() const noexcept {
        return kMinRefreshInterval;
    }
    [[nodiscard]] std::vector<ProcessReading> processes() const { return processes_; }
    [[nodiscard]] std::vector<float> per_core_percent() const { return per_core_percent_; }
    [[nodiscard]] float global_cpu_percent() const noexcept { return global_cpu_percent_; }
    [[nodiscard]] MemoryUsage memory() const noexcept { return memory_; }
    [[nodiscard]] LoadAverage load_average() const noexcept { return load_avg_; }
    [[nodiscard]] std::string hostname() const;
    std::optional<std::string> user_name(Uid uid);
    [[nodiscard]] Pid self_pid() const noexcept;

    // Internal types exposed for implementation (do not use externally)
    struct CpuTimesInternal {
        uint64_t user{0}, nice{0}, system{0}, idle{0};
        uint64_t iowait{0}, irq{0}, softirq{0}, steal{0};
    };

    struct ProcessTimesInternal {
        std::string name;
        std::optional<Uid> effective_uid;
        std::optional<Uid> real_uid;
        uint64_t ticks{0};     ///< utime + stime
    };

private:
    std::filesystem::path proc_root_;
    bool primed_{false};
    std::chrono::steady_clock::time_point prev_refresh_{};
    CpuTimesInternal prev_cpu_times_{};
    std::vector<CpuTimesInternal> prev_per_core_times_;
    std::unordered_map<Pid, ProcessTimesInternal> prev_processes_;

    std::vector<ProcessReading> processes_;
    std::vector<float> per_core_percent_;
    float global_cpu_percent_{0.0f};
    MemoryUsage memory_{};
    LoadAverage load_avg_{};

    std::unordered_map<Uid, std::optional<std::string>> user_cache_;
};

// ─────────────────────────────────────────────
// MockProbe
// ─────────────────────────────────────────────

/**
 * @brief Scripted probe for tests.
 *
 * Readings become visible only after the second refresh(), mirroring the
 * warm-up behaviour of a real probe.
 */
class MockProbe {
public:
    explicit MockProbe(std::string hostname = "mock-host", size_t core_count = 4);

    // ProbeLike interface
    Result<void> refresh();
    [[nodiscard]] std::chrono::milliseconds min_refresh_interval() const noexcept {
        return min_interval_;
    }
    [[nodiscard]] std::vector<ProcessReading> processes() const;
    [[nodiscard]] std::vector<float> per_core_percent() const;
    [[nodiscard]] float global_cpu_percent() const;
    [[nodiscard]] MemoryUsage memory() const noexcept { return memory_; }
    [[nodiscard]] LoadAverage load_average() const noexcept { return load_avg_; }
    [[nodiscard]] std::string hostname() const { return hostname_; }
    std::optional<std::string> user_name(Uid uid);
    [[nodiscard]] Pid self_pid() const noexcept { return self_pid_; }

    // Test helpers
    void add_process(ProcessReading reading);
    void add_user(Uid uid, std::string name);
    void set_per_core(std::vector<float> percent);
    void set_memory(uint64_t used, uint64_t total);
    void set_load_average(LoadAverage load);
    void set_self_pid(Pid pid) noexcept { self_pid_ = pid; }
    void set_min_interval(std::chrono::milliseconds interval) noexcept { min_interval_ = interval; }
    void fail_refresh(std::string message);

    [[nodiscard]] size_t refresh_count() const noexcept { return refresh_count_; }

private:
    [[nodiscard]] bool warmed_up() const noexcept { return refresh_count_ >= 2; }

    std::string hostname_;
    std::vector<ProcessReading> processes_;
    std::unordered_map<Uid, std::string> users_;
    std::vector<float> per_core_;
    MemoryUsage memory_{};
    LoadAverage load_avg_{};
    Pid self_pid_{1};
    std::chrono::milliseconds min_interval_{0};
    std::optional<std::string> refresh_error_;
    size_t refresh_count_{0};
};

// Verify concept satisfaction at compile time
static_assert(ProbeLike<LinuxProbe>);
static_assert(ProbeLike<MockProbe>);

}  // namespace fleet_usage
