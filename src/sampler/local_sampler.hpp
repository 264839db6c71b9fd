/**
 * @file local_sampler.hpp
 * @brief Produces one machine's Snapshot from a probe and a filter policy.
 *
 * The sampler is templated on ProbeLike so that production code reads /proc
 * while tests drive it with a MockProbe.
 */

#pragma once

#include "core/concepts.hpp"
#include "core/result.hpp"
#include "core/types.hpp"
#include "model/filter_policy.hpp"

#include <algorithm>
#include <chrono>
#include <optional>
#include <string>
#include <thread>
#include <utility>
#include <vector>

namespace fleet_usage {

struct SampleOptions {
    float threshold_percent = kProcessUsageThresholdPercent;
    /// Extra wait between the two refreshes; never shorter than the probe minimum.
    std::chrono::milliseconds warmup{0};
};

/**
 * @brief Apply the ignore and rename rules to one process observation.
 *
 * Ignore rules match the original process name; the rename is applied to
 * whatever survives.
 */
[[nodiscard]] std::optional<Sample> apply_policy(const FilterPolicy& policy,
                                                 const std::string& process_name,
                                                 const std::string& user,
                                                 float cpu_percent,
                                                 float threshold_percent);

/// Resolve the owner of a reading, preferring the effective uid.
template <ProbeLike P>
std::string resolve_user(P& probe, const ProcessReading& reading) {
    for (const auto& uid : {reading.effective_uid, reading.real_uid}) {
        if (!uid) continue;
        if (auto name = probe.user_name(*uid)) return *name;
    }
    return std::string{kUnknownUser};
}

/**
 * @brief Take a Snapshot of the machine the probe observes.
 *
 * Two refreshes separated by the probe's minimum interval are required
 * before CPU figures mean anything. A failing refresh aborts the sample.
 */
template <ProbeLike P>
Result<Snapshot> sample(P& probe, const FilterPolicy& policy, const SampleOptions& options = {}) {
    if (auto first = probe.refresh(); !first) {
        return first.error().context("probe initialisation failed");
    }
    // The sampler's own activity must not show up in the load figures.
    auto load = probe.load_average();

    std::this_thread::sleep_for(std::max(options.warmup, probe.min_refresh_interval()));

    if (auto second = probe.refresh(); !second) {
        return second.error().context("probe refresh failed");
    }

    Snapshot snapshot{
        .hostname = probe.hostname(),
        .global_cpu_percent = probe.global_cpu_percent(),
        .per_core_percent = probe.per_core_percent(),
        .load_avg = load,
        .memory = probe.memory(),
        .samples = {},
    };

    const auto self = probe.self_pid();
    for (const auto& reading : probe.processes()) {
        if (reading.pid == self) continue;
        // Cheap check first; user lookups may hit the password database.
        if (reading.cpu_percent < options.threshold_percent) continue;

        auto user = resolve_user(probe, reading);
        if (auto kept = apply_policy(policy, reading.name, user, reading.cpu_percent,
                                     options.threshold_percent)) {
            snapshot.samples.push_back(std::move(*kept));
        }
    }
    return snapshot;
}

}  // namespace fleet_usage
