/**
 * @file roster.hpp
 * @brief Static machine roster loaded from a line-oriented room file.
 *
 * Format:
 *   # comment
 *   [room-name]
 *   hostname: owner note   # trailing comment
 *   other-host:
 * Entries that appear before any header belong to the "orphan" room.
 */

#pragma once

#include "core/result.hpp"
#include "core/types.hpp"

#include <filesystem>
#include <string_view>
#include <vector>

namespace fleet_usage {

inline constexpr std::string_view kOrphanRoom = "orphan";

using Roster = std::vector<MachineIdentity>;

/**
 * @brief Parse roster text. Malformed lines yield a Config error naming the
 *        line number and its text.
 */
Result<Roster> parse_roster(std::string_view text);

/**
 * @brief Read and parse a roster file.
 */
Result<Roster> load_roster(const std::filesystem::path& path);

}  // namespace fleet_usage
