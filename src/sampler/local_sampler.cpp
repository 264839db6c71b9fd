/**
 * @file local_sampler.cpp
 * @brief Filter policy application for the local sampler.
 */

#include "sampler/local_sampler.hpp"

namespace fleet_usage {

std::optional<Sample> apply_policy(const FilterPolicy& policy,
                                   const std::string& process_name,
                                   const std::string& user,
                                   float cpu_percent,
                                   float threshold_percent) {
    if (cpu_percent < threshold_percent) return std::nullopt;
    if (policy.is_ignored_user(user)) return std::nullopt;
    if (policy.is_ignored_process(process_name)) return std::nullopt;

    return Sample{
        .process_name = policy.canonical_name(process_name).value_or(process_name),
        .user = user,
        .cpu_percent = cpu_percent,
    };
}

}  // namespace fleet_usage
