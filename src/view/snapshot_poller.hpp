/**
 * @file snapshot_poller.hpp
 * @brief Re-reads the persisted ClusterSnapshot and keeps the last good one.
 */

#pragma once

#include "core/result.hpp"
#include "core/types.hpp"

#include <chrono>
#include <filesystem>
#include <optional>

namespace fleet_usage {

/**
 * @brief Viewer-side cache of the persisted ClusterSnapshot.
 *
 * refresh() reads the whole file before decoding it. A failed refresh keeps
 * the previously loaded snapshot and only flips last_refresh_ok().
 */
class SnapshotPoller {
public:
    explicit SnapshotPoller(std::filesystem::path path);

    /// Read and decode the file; failures are ViewerRead errors.
    Result<void> refresh();

    [[nodiscard]] const std::optional<ClusterSnapshot>& snapshot() const noexcept { return snapshot_; }
    [[nodiscard]] bool has_snapshot() const noexcept { return snapshot_.has_value(); }
    [[nodiscard]] bool last_refresh_ok() const noexcept { return last_refresh_ok_; }
    [[nodiscard]] const std::optional<Error>& last_error() const noexcept { return last_error_; }
    [[nodiscard]] const std::filesystem::path& path() const noexcept { return path_; }

    /// Time since the snapshot's own timestamp; negative if it lies in the future.
    [[nodiscard]] std::chrono::seconds age(Timestamp now) const noexcept;

    /// No snapshot at all, or one older than `threshold`.
    [[nodiscard]] bool is_stale(Timestamp now, std::chrono::seconds threshold) const noexcept;

private:
    std::filesystem::path path_;
    std::optional<ClusterSnapshot> snapshot_;
    std::optional<Error> last_error_;
    bool last_refresh_ok_{false};
};

}  // namespace fleet_usage
