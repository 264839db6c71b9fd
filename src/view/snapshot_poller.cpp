/**
 * @file snapshot_poller.cpp
 * @brief SnapshotPoller implementation.
 */

#include "view/snapshot_poller.hpp"

#include "model/snapshot_codec.hpp"
#include "model/text_file.hpp"

namespace fleet_usage {

SnapshotPoller::SnapshotPoller(std::filesystem::path path) : path_(std::move(path)) {}

Result<void> SnapshotPoller::refresh() {
    last_refresh_ok_ = false;

    // One read of the whole file narrows the window for catching a writer mid-way.
    auto text = read_text_file(path_, ErrorKind::ViewerRead);
    if (!text) {
        last_error_ = text.error();
        return text.error();
    }

    auto decoded = decode_cluster_snapshot(*text);
    if (!decoded) {
        Error error{ErrorKind::ViewerRead, decoded.error().message};
        last_error_ = error.context("cannot parse " + path_.string());
        return *last_error_;
    }

    snapshot_ = std::move(*decoded);
    last_error_.reset();
    last_refresh_ok_ = true;
    return Result<void>{};
}

std::chrono::seconds SnapshotPoller::age(Timestamp now) const noexcept {
    if (!snapshot_) return std::chrono::seconds{0};
    return std::chrono::duration_cast<std::chrono::seconds>(now - snapshot_->time());
}

bool SnapshotPoller::is_stale(Timestamp now, std::chrono::seconds threshold) const noexcept {
    if (!snapshot_) return true;
    return age(now) > threshold;
}

}  // namespace fleet_usage
