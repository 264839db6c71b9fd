/**
 * @file concepts.hpp
 * @brief C++20 concept definitions for FleetUsage interfaces.
 *
 * The sampler is templated on the probe so tests can drive it with scripted
 * readings while production uses /proc, without virtual dispatch.
 */

#pragma once

#include "core/result.hpp"
#include "core/types.hpp"

#include <chrono>
#include <concepts>
#include <optional>
#include <string>
#include <vector>

namespace fleet_usage {

// ─────────────────────────────────────────────
// ProbeLike
// ─────────────────────────────────────────────

/**
 * @concept ProbeLike
 * @brief Constrains types that can report OS-level usage readings.
 *
 * CPU percentages are only meaningful after two refresh() calls separated by
 * at least min_refresh_interval().
 */
template <typename T>
concept ProbeLike = requires(T probe, const T& cprobe, Uid uid) {
    { probe.refresh() } -> std::same_as<Result<void>>;
    { cprobe.min_refresh_interval() } -> std::convertible_to<std::chrono::milliseconds>;
    { cprobe.processes() } -> std::convertible_to<std::vector<ProcessReading>>;
    { cprobe.per_core_percent() } -> std::convertible_to<std::vector<float>>;
    { cprobe.global_cpu_percent() } -> std::convertible_to<float>;
    { cprobe.memory() } -> std::convertible_to<MemoryUsage>;
    { cprobe.load_average() } -> std::convertible_to<LoadAverage>;
    { cprobe.hostname() } -> std::convertible_to<std::string>;
    { probe.user_name(uid) } -> std::convertible_to<std::optional<std::string>>;
    { cprobe.self_pid() } -> std::convertible_to<Pid>;
};

}  // namespace fleet_usage
