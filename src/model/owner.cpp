/**
 * @file owner.cpp
 * @brief Ownership note parsing.
 */

#include "model/owner.hpp"

#include "model/text_file.hpp"

#include <string>

namespace fleet_usage {

namespace {

constexpr std::string_view kReservationMarker = "Reservation Required";
constexpr std::string_view kStudentSuffix = "(Student)";
constexpr std::string_view kVisitorSuffix = "(Visitor)";


OwnerTag tagged(OwnerKind kind, std::string_view name) {
    auto trimmed = trim(name);
    if (trimmed.empty()) return OwnerTag{};
    return OwnerTag{.kind = kind, .name = std::string{trimmed}};
}

}  // anonymous namespace

OwnerTag parse_owner(std::string_view note) {
    auto text = trim(note);
    if (text.empty()) return OwnerTag{};
    if (text == kReservationMarker) return OwnerTag{.kind = OwnerKind::Reserved, .name = {}};

    if (text.ends_with(kStudentSuffix)) {
        return tagged(OwnerKind::Student, text.substr(0, text.size() - kStudentSuffix.size()));
    }
    if (text.ends_with(kVisitorSuffix)) {
        return tagged(OwnerKind::Visitor, text.substr(0, text.size() - kVisitorSuffix.size()));
    }
    return OwnerTag{.kind = OwnerKind::Member, .name = std::string{text}};
}

std::optional<std::string_view> owner_name(const OwnerTag& owner) noexcept {
    switch (owner.kind) {
        case OwnerKind::Member:
        case OwnerKind::Visitor:
        case OwnerKind::Student:
            return std::string_view{owner.name};
        case OwnerKind::Reserved:
        case OwnerKind::Unowned:
            break;
    }
    return std::nullopt;
}

std::optional<OwnerKind> parse_owner_kind(std::string_view text) noexcept {
    for (auto kind : {OwnerKind::Member, OwnerKind::Visitor, OwnerKind::Student,
                      OwnerKind::Reserved, OwnerKind::Unowned}) {
        if (to_string(kind) == text) return kind;
    }
    return std::nullopt;
}

}  // namespace fleet_usage
