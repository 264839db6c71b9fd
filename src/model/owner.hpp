/**
 * @file owner.hpp
 * @brief Grammar for the free-text ownership note of a roster entry.
 */

#pragma once

#include "core/types.hpp"

#include <optional>
#include <string_view>

namespace fleet_usage {

/**
 * @brief Parse an ownership note into an OwnerTag.
 *
 * Total: never fails. Recognized forms, after trimming:
 *   ""                      -> Unowned
 *   "Reservation Required"  -> Reserved
 *   "<name> (Student)"      -> Student(name)
 *   "<name> (Visitor)"      -> Visitor(name)
 *   anything else           -> Member(text)
 * A marker with nothing in front of it is treated as Unowned.
 */
[[nodiscard]] OwnerTag parse_owner(std::string_view note);

/// The person behind a Member, Visitor or Student tag.
[[nodiscard]] std::optional<std::string_view> owner_name(const OwnerTag& owner) noexcept;

/// Parse the wire name of an owner kind ("member", "student", ...).
[[nodiscard]] std::optional<OwnerKind> parse_owner_kind(std::string_view text) noexcept;

}  // namespace fleet_usage
