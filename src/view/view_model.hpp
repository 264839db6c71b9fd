/**
 * @file view_model.hpp
 * @brief Display-ready figures derived from a Snapshot or ClusterSnapshot.
 *
 * Everything here is a pure function of its input. Results never depend on
 * the order of entries or samples: ties are broken by name.
 */

#pragma once

#include "core/types.hpp"

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace fleet_usage {

/// Number of hotness gradient steps.
inline constexpr size_t kHotnessSteps = 10;

/// Users below this share of fleet cores are left out of the ranking.
inline constexpr double kRankingThresholdPercent = 1.0;

// ─────────────────────────────────────────────
// Per-machine
// ─────────────────────────────────────────────

/// The user whose samples add up to the most CPU on a machine.
struct ActiveUser {
    UserName user;
    size_t core_count{0};   ///< Number of that user's samples
    std::string task;       ///< Name of that user's busiest sample

    bool operator==(const ActiveUser&) const = default;
};

struct CpuUsage {
    size_t used{0};    ///< Cores above the usage threshold
    size_t total{0};

    bool operator==(const CpuUsage&) const = default;
};

struct MachineView {
    MachineIdentity identity;
    CpuUsage cpu;
    size_t hotness{0};
    LoadAverage load_avg;
    MemoryUsage memory;
    std::optional<ActiveUser> active_user;
    bool owner_is_active{false};   ///< The owner is the active user
    bool used_by_other{false};     ///< Owned by someone, but another user is active
};

/**
 * @brief Pick the active user of a machine.
 *
 * Equal CPU sums resolve to the smallest user name; equal sample CPU within
 * that user resolves to the smallest process name. Absent when there are no
 * samples.
 */
[[nodiscard]] std::optional<ActiveUser> active_user(const Snapshot& snapshot);

/// clamp(round(ratio * (steps - 1)), 0, steps - 1); NaN counts as 0.
[[nodiscard]] size_t hotness_bucket(double load_ratio, size_t steps = kHotnessSteps) noexcept;

/// Bucket of the five-minute load per core; 0 for a machine without cores.
[[nodiscard]] size_t machine_hotness(const Snapshot& snapshot, size_t steps = kHotnessSteps) noexcept;

/// Per-core readings strictly above kProcessUsageThresholdPercent.
[[nodiscard]] size_t used_core_count(const Snapshot& snapshot) noexcept;

[[nodiscard]] MachineView build_machine_view(const ClusterEntry& entry);

// ─────────────────────────────────────────────
// Fleet-wide
// ─────────────────────────────────────────────

/// Sum of per-core CPU over (cores * 100); 0 when the fleet has no cores.
[[nodiscard]] double fleet_total_usage(const ClusterSnapshot& cluster) noexcept;

struct RankingEntry {
    UserName user;
    size_t count{0};                 ///< Samples across the fleet
    std::optional<double> percent;   ///< 100 * count / cores; absent with no cores

    /// "12.5" style text, or "??" when the fleet has no cores.
    [[nodiscard]] std::string percent_label() const;

    bool operator==(const RankingEntry&) const = default;
};

/// All users, by sample count descending then name ascending.
[[nodiscard]] std::vector<RankingEntry> rank_users(const ClusterSnapshot& cluster);

/// rank_users() without users under kRankingThresholdPercent.
[[nodiscard]] std::vector<RankingEntry> fleet_user_ranking(const ClusterSnapshot& cluster);

struct FleetView {
    UnixSeconds timestamp{0};
    double total_usage{0.0};
    size_t total_cores{0};
    std::vector<MachineView> machines;   ///< Sorted by hostname
    std::vector<RankingEntry> ranking;
};

[[nodiscard]] FleetView build_fleet_view(const ClusterSnapshot& cluster);

}  // namespace fleet_usage
