/**
 * @file types.hpp
 * @brief Fundamental data model shared by the sampler, gatherer and viewers.
 *
 * Defines machine identities, per-process samples, single-machine snapshots
 * and the fleet-wide ClusterSnapshot. All types are plain values; a Snapshot
 * is never mutated after the sampler produced it.
 */

#pragma once

#include <chrono>
#include <compare>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace fleet_usage {

// ─────────────────────────────────────────────
// Identity Types
// ─────────────────────────────────────────────

using Hostname = std::string;
using UserName = std::string;
using UnixSeconds = uint64_t;
using Timestamp = std::chrono::system_clock::time_point;

/// Processes below this CPU% are never stored in a Snapshot.
inline constexpr float kProcessUsageThresholdPercent = 10.0f;

/// Substituted when a process owner cannot be resolved.
inline constexpr std::string_view kUnknownUser = "?";

// ─────────────────────────────────────────────
// Ownership
// ─────────────────────────────────────────────

enum class OwnerKind : uint8_t {
    Member,
    Visitor,
    Student,
    Reserved,
    Unowned
};

[[nodiscard]] constexpr std::string_view to_string(OwnerKind kind) noexcept {
    switch (kind) {
        case OwnerKind::Member:   return "member";
        case OwnerKind::Visitor:  return "visitor";
        case OwnerKind::Student:  return "student";
        case OwnerKind::Reserved: return "reserved";
        case OwnerKind::Unowned:  return "unowned";
    }
    return "unowned";
}

/**
 * @brief Who a machine belongs to. `name` is empty for Reserved and Unowned.
 */
struct OwnerTag {
    OwnerKind kind{OwnerKind::Unowned};
    std::string name;

    bool operator==(const OwnerTag&) const = default;
};

/**
 * @brief A roster entry: where a machine is and who owns it.
 */
struct MachineIdentity {
    Hostname hostname;
    std::string room;
    OwnerTag owner;

    bool operator==(const MachineIdentity&) const = default;
};

// ─────────────────────────────────────────────
// Snapshot
// ─────────────────────────────────────────────

/// One (process, user) observation that passed the filter policy.
struct Sample {
    std::string process_name;
    UserName user;
    float cpu_percent{0.0f};

    bool operator==(const Sample&) const = default;
};

struct LoadAverage {
    double one{0.0};
    double five{0.0};
    double fifteen{0.0};

    bool operator==(const LoadAverage&) const = default;
};

struct MemoryUsage {
    uint64_t used{0};   ///< Bytes
    uint64_t total{0};  ///< Bytes

    bool operator==(const MemoryUsage&) const = default;
};

/**
 * @brief A point-in-time usage report of a single machine.
 */
struct Snapshot {
    Hostname hostname;
    float global_cpu_percent{0.0f};
    std::vector<float> per_core_percent;   ///< One reading per core
    LoadAverage load_avg;
    MemoryUsage memory;
    std::vector<Sample> samples;

    [[nodiscard]] size_t core_count() const noexcept { return per_core_percent.size(); }

    bool operator==(const Snapshot&) const = default;
};

// ─────────────────────────────────────────────
// ClusterSnapshot
// ─────────────────────────────────────────────

struct ClusterEntry {
    MachineIdentity identity;
    Snapshot snapshot;

    bool operator==(const ClusterEntry&) const = default;
};

/**
 * @brief Fleet-wide usage report persisted by the gatherer.
 *
 * Holds at most one entry per identity hostname; machines whose gather
 * failed are absent.
 */
struct ClusterSnapshot {
    UnixSeconds timestamp{0};
    std::vector<ClusterEntry> entries;

    [[nodiscard]] Timestamp time() const noexcept {
        return Timestamp{std::chrono::seconds{timestamp}};
    }

    [[nodiscard]] size_t core_count() const noexcept {
        size_t cores = 0;
        for (const auto& entry : entries) cores += entry.snapshot.core_count();
        return cores;
    }

    bool operator==(const ClusterSnapshot&) const = default;
};

// ─────────────────────────────────────────────
// Probe Readings
// ─────────────────────────────────────────────

using Pid = int32_t;
using Uid = uint32_t;

/**
 * @brief Raw per-process reading from the system probe, before filtering.
 */
struct ProcessReading {
    Pid pid{0};
    std::string name;
    std::optional<Uid> effective_uid;
    std::optional<Uid> real_uid;
    float cpu_percent{0.0f};   ///< 100% = one fully busy core
};

/// Current wall-clock time in whole unix seconds.
[[nodiscard]] inline UnixSeconds unix_now() noexcept {
    return static_cast<UnixSeconds>(std::chrono::duration_cast<std::chrono::seconds>(
        std::chrono::system_clock::now().time_since_epoch()).count());
}

}  // namespace fleet_usage
