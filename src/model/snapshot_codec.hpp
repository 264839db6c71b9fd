/**
 * @file snapshot_codec.hpp
 * @brief JSON wire format for Snapshot and ClusterSnapshot.
 *
 * Snapshot:
 *   {"hostname": str, "global_cpu_percent": num, "per_core_percent": [num],
 *    "load_avg": {"one","five","fifteen"}, "memory": {"used","total"},
 *    "samples": [{"process_name","user","cpu_percent"}]}
 * ClusterSnapshot:
 *   {"timestamp": uint, "entries": [{"identity": {"hostname","room",
 *    "owner": {"kind","name"}}, "snapshot": Snapshot}]}
 */

#pragma once

#include "core/result.hpp"
#include "core/types.hpp"

#include <string>
#include <string_view>

namespace fleet_usage {

[[nodiscard]] std::string encode_snapshot(const Snapshot& snapshot, bool pretty = false);
[[nodiscard]] std::string encode_cluster_snapshot(const ClusterSnapshot& cluster, bool pretty = false);

/// Parse a Snapshot. Malformed input yields a Deserialization error.
Result<Snapshot> decode_snapshot(std::string_view text);

/// Parse a ClusterSnapshot. Malformed input yields a Deserialization error.
Result<ClusterSnapshot> decode_cluster_snapshot(std::string_view text);

}  // namespace fleet_usage
