/**
 * @file view_model.cpp
 * @brief View-model computations.
 */

#include "view/view_model.hpp"

#include "model/owner.hpp"

#include <algorithm>
#include <cmath>
#include <cstdio>
#include <map>

namespace fleet_usage {

// ─────────────────────────────────────────────
// Per-machine
// ─────────────────────────────────────────────

std::optional<ActiveUser> active_user(const Snapshot& snapshot) {
    struct UserTotals {
        double cpu_sum{0.0};
        size_t samples{0};
        const Sample* busiest{nullptr};
    };

    // Ordered map: iteration visits users by ascending name.
    std::map<UserName, UserTotals> by_user;
    for (const auto& sample : snapshot.samples) {
        auto& totals = by_user[sample.user];
        totals.cpu_sum += sample.cpu_percent;
        ++totals.samples;
        if (!totals.busiest
            || sample.cpu_percent > totals.busiest->cpu_percent
            || (sample.cpu_percent == totals.busiest->cpu_percent
                && sample.process_name < totals.busiest->process_name)) {
            totals.busiest = &sample;
        }
    }

    const std::pair<const UserName, UserTotals>* best = nullptr;
    for (const auto& entry : by_user) {
        // Strictly greater keeps the first, i.e. smallest, name on ties.
        if (!best || entry.second.cpu_sum > best->second.cpu_sum) best = &entry;
    }
    if (!best) return std::nullopt;

    return ActiveUser{
        .user = best->first,
        .core_count = best->second.samples,
        .task = best->second.busiest->process_name,
    };
}

size_t hotness_bucket(double load_ratio, size_t steps) noexcept {
    if (steps == 0) return 0;
    if (std::isnan(load_ratio) || load_ratio <= 0.0) return 0;

    const auto top = static_cast<double>(steps - 1);
    auto scaled = std::round(load_ratio * top);
    if (scaled >= top) return steps - 1;
    return static_cast<size_t>(scaled);
}

size_t machine_hotness(const Snapshot& snapshot, size_t steps) noexcept {
    if (snapshot.core_count() == 0) return hotness_bucket(0.0, steps);
    return hotness_bucket(snapshot.load_avg.five / static_cast<double>(snapshot.core_count()),
                          steps);
}

size_t used_core_count(const Snapshot& snapshot) noexcept {
    return static_cast<size_t>(std::count_if(
        snapshot.per_core_percent.begin(), snapshot.per_core_percent.end(),
        [](float usage) { return usage > kProcessUsageThresholdPercent; }));
}

MachineView build_machine_view(const ClusterEntry& entry) {
    MachineView view{
        .identity = entry.identity,
        .cpu = CpuUsage{used_core_count(entry.snapshot), entry.snapshot.core_count()},
        .hotness = machine_hotness(entry.snapshot),
        .load_avg = entry.snapshot.load_avg,
        .memory = entry.snapshot.memory,
        .active_user = active_user(entry.snapshot),
    };

    auto owner = owner_name(entry.identity.owner);
    if (owner && view.active_user) {
        view.owner_is_active = *owner == view.active_user->user;
        view.used_by_other = !view.owner_is_active;
    }
    return view;
}

// ─────────────────────────────────────────────
// Fleet-wide
// ─────────────────────────────────────────────

double fleet_total_usage(const ClusterSnapshot& cluster) noexcept {
    double used = 0.0;
    size_t cores = 0;
    for (const auto& entry : cluster.entries) {
        for (float usage : entry.snapshot.per_core_percent) used += usage;
        cores += entry.snapshot.core_count();
    }
    if (cores == 0) return 0.0;
    return used / (static_cast<double>(cores) * 100.0);
}

std::string RankingEntry::percent_label() const {
    if (!percent) return "??";
    char buffer[32];
    std::snprintf(buffer, sizeof(buffer), "%.1f", *percent);
    return buffer;
}

std::vector<RankingEntry> rank_users(const ClusterSnapshot& cluster) {
    std::map<UserName, size_t> counts;
    for (const auto& entry : cluster.entries) {
        for (const auto& sample : entry.snapshot.samples) {
            ++counts[sample.user];
        }
    }

    const auto cores = cluster.core_count();
    std::vector<RankingEntry> ranking;
    ranking.reserve(counts.size());
    for (const auto& [user, count] : counts) {
        std::optional<double> percent;
        if (cores > 0) percent = 100.0 * static_cast<double>(count) / static_cast<double>(cores);
        ranking.push_back(RankingEntry{user, count, percent});
    }

    std::sort(ranking.begin(), ranking.end(), [](const RankingEntry& a, const RankingEntry& b) {
        if (a.count != b.count) return a.count > b.count;
        return a.user < b.user;
    });
    return ranking;
}

std::vector<RankingEntry> fleet_user_ranking(const ClusterSnapshot& cluster) {
    auto ranking = rank_users(cluster);
    // Without cores there is no percentage to filter on.
    std::erase_if(ranking, [](const RankingEntry& entry) {
        return entry.percent && *entry.percent < kRankingThresholdPercent;
    });
    return ranking;
}

FleetView build_fleet_view(const ClusterSnapshot& cluster) {
    FleetView view{
        .timestamp = cluster.timestamp,
        .total_usage = fleet_total_usage(cluster),
        .total_cores = cluster.core_count(),
        .machines = {},
        .ranking = fleet_user_ranking(cluster),
    };

    view.machines.reserve(cluster.entries.size());
    for (const auto& entry : cluster.entries) {
        view.machines.push_back(build_machine_view(entry));
    }
    std::sort(view.machines.begin(), view.machines.end(),
              [](const MachineView& a, const MachineView& b) {
                  return a.identity.hostname < b.identity.hostname;
              });
    return view;
}

}  // namespace fleet_usage
