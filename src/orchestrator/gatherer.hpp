/**
 * @file gatherer.hpp
 * @brief Fleet-wide fan-out: run the sampler on every roster host and
 *        aggregate the results into one ClusterSnapshot.
 *
 * Each host gets exactly one attempt per gather(). A host that cannot be
 * reached, whose sampler exits non-zero or whose output does not decode is
 * logged and left out; it never affects the other hosts.
 */

#pragma once

#include "core/logger.hpp"
#include "core/result.hpp"
#include "core/types.hpp"
#include "model/roster.hpp"
#include "remote/remote_executor.hpp"

#include <chrono>
#include <cstddef>
#include <filesystem>
#include <functional>
#include <mutex>
#include <string>
#include <vector>

namespace fleet_usage {

struct GatherOptions {
    std::string sampler_command;                   ///< Command line run on each host
    size_t max_concurrency = 16;                   ///< Simultaneous remote sessions
    std::chrono::milliseconds host_timeout{30000};
};

struct GatherSummary {
    size_t successes = 0;
    size_t total = 0;

    bool operator==(const GatherSummary&) const = default;
};

struct HostFailure {
    Hostname host;
    Error error;
};

struct GatherOutcome {
    ClusterSnapshot snapshot;
    GatherSummary summary;
    std::vector<HostFailure> failures;
};

/**
 * @brief Drives one gather run at a time over an IRemoteExecutor.
 *
 * Successive gather() calls on the same instance produce non-decreasing
 * timestamps even if the wall clock steps backwards.
 */
class Gatherer {
public:
    using Clock = std::function<UnixSeconds()>;

    Gatherer(IRemoteExecutor& executor, Logger& logger, GatherOptions options,
             Clock clock = unix_now);

    Gatherer(const Gatherer&) = delete;
    Gatherer& operator=(const Gatherer&) = delete;

    /// Gather from every distinct roster host; blocks until all are done.
    GatherOutcome gather(const Roster& roster);

    /// One host: run the sampler and decode its output.
    Result<Snapshot> gather_one(const MachineIdentity& identity);

private:
    /// Drop repeated hostnames, keeping the first entry.
    Roster distinct_hosts(const Roster& roster);
    UnixSeconds next_timestamp();

    IRemoteExecutor& executor_;
    Logger& logger_;
    GatherOptions options_;
    Clock clock_;
    std::mutex gather_mutex_;
    UnixSeconds last_timestamp_{0};
};

/**
 * @brief Build the remote command line for the sampler.
 *
 * The policy path is appended as a single shell-quoted argument when set.
 */
[[nodiscard]] std::string sampler_command(const std::string& sampler,
                                          const std::string& policy_path = {});

/**
 * @brief Serialize fully in memory, write `<path>.tmp`, then rename over path.
 *
 * Readers see either the old file or the new one. Any failure is a
 * Persistence error and leaves the previous file untouched.
 */
Result<void> persist(const ClusterSnapshot& snapshot, const std::filesystem::path& path);

}  // namespace fleet_usage
