/**
 * @file filter_policy.hpp
 * @brief Which processes the local sampler drops or renames.
 *
 * Format:
 *   ignore-user: <name>
 *   ignore-proc: <name>
 *   rename-proc: <from> -> <to>
 * '#' starts a comment; blank lines are ignored.
 */

#pragma once

#include "core/result.hpp"

#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <unordered_set>

namespace fleet_usage {

/**
 * @brief Read-only filtering and renaming rules for the local sampler.
 */
struct FilterPolicy {
    std::unordered_set<std::string> ignored_users;
    std::unordered_set<std::string> ignored_processes;
    std::unordered_map<std::string, std::string> rename_map;

    [[nodiscard]] bool is_ignored_user(const std::string& user) const {
        return ignored_users.contains(user);
    }

    [[nodiscard]] bool is_ignored_process(const std::string& name) const {
        return ignored_processes.contains(name);
    }

    /// Canonical name for a process, if one is configured.
    [[nodiscard]] std::optional<std::string> canonical_name(const std::string& name) const {
        auto it = rename_map.find(name);
        if (it == rename_map.end()) return std::nullopt;
        return it->second;
    }

    [[nodiscard]] bool empty() const noexcept {
        return ignored_users.empty() && ignored_processes.empty() && rename_map.empty();
    }
};

Result<FilterPolicy> parse_filter_policy(std::string_view text);

Result<FilterPolicy> load_filter_policy(const std::filesystem::path& path);

/**
 * @brief Load a policy, falling back to an empty one when the file is
 *        missing or unreadable. A malformed file is still an error.
 */
Result<FilterPolicy> load_filter_policy_or_empty(const std::filesystem::path& path);

}  // namespace fleet_usage
