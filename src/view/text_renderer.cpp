/**
 * @file text_renderer.cpp
 * @brief Plain-text FleetView renderer.
 */

#include "view/text_renderer.hpp"

#include <algorithm>
#include <iomanip>
#include <sstream>

namespace fleet_usage {

namespace {

std::string pad_right(const std::string& text, size_t width) {
    if (text.size() >= width) return text;
    return text + std::string(width - text.size(), ' ');
}

std::string pad_left(const std::string& text, size_t width) {
    if (text.size() >= width) return text;
    return std::string(width - text.size(), ' ') + text;
}

std::string render_notes(const RenderNotes& notes) {
    std::ostringstream out;
    out << "Last update: ";
    if (notes.age.count() >= 0) {
        out << notes.age.count() << " s ago.";
    } else {
        out << -notes.age.count() << " s in the future.";
    }
    out << (notes.refresh_ok ? "  :)" : "  :(")
        << (notes.logged ? "  Logged." : "  Not logged.");
    if (notes.stale) out << "  STALE";
    out << '\n';
    return out.str();
}

}  // anonymous namespace

std::string owner_cell(const MachineView& machine) {
    const auto& owner = machine.identity.owner;
    // '!' flags a visitor or student machine used by somebody else.
    std::string flag = machine.used_by_other ? "!" : " ";
    std::string name = owner.name + (machine.owner_is_active ? "*" : "");
    switch (owner.kind) {
        case OwnerKind::Member:   return "  " + name;
        case OwnerKind::Visitor:  return "v" + flag + name;
        case OwnerKind::Student:  return "s" + flag + name;
        case OwnerKind::Reserved: return "Reservation required";
        case OwnerKind::Unowned:  return "";
    }
    return "";
}

std::string memory_bar(const MemoryUsage& memory, size_t width) {
    size_t filled = 0;
    if (memory.total > 0) {
        auto used = std::min(memory.used, memory.total);
        // Widen before multiplying so large byte counts cannot overflow.
        filled = static_cast<size_t>(static_cast<long double>(used) * width
                                     / static_cast<long double>(memory.total));
    }
    filled = std::min(filled, width);
    return std::string(filled, '#') + std::string(width - filled, '-');
}

std::string active_user_cell(const MachineView& machine) {
    if (!machine.active_user) return "";
    const auto& au = *machine.active_user;
    std::string cell = pad_left(au.user, 8) + ":" + au.task;
    if (au.core_count > 1) cell += "@" + std::to_string(au.core_count);
    return cell;
}

std::string render_text(const FleetView& view, const RenderOptions& options) {
    std::ostringstream out;

    // ── Header ───────────────────────────────
    if (options.viewer) {
        const auto& v = *options.viewer;
        out << v.user << "@" << v.hostname << " (" << v.os << " " << v.os_release << ")  ";
    }
    out << "fleet usage " << std::fixed << std::setprecision(1)
        << view.total_usage * 100.0 << "% of " << view.total_cores << " cores\n\n";

    // ── Machines ─────────────────────────────
    size_t host_width = 8;
    size_t owner_width = 5;
    size_t room_width = 4;
    for (const auto& machine : view.machines) {
        host_width = std::max(host_width, machine.identity.hostname.size() + 1);
        owner_width = std::max(owner_width, owner_cell(machine).size());
        room_width = std::max(room_width, machine.identity.room.size());
    }

    for (const auto& machine : view.machines) {
        bool all_busy = machine.cpu.total > 0 && machine.cpu.used == machine.cpu.total;
        out << pad_right(machine.identity.hostname + (all_busy ? "*" : ""), host_width)
            << " [" << machine.hotness << "] "
            << pad_right(owner_cell(machine), owner_width) << ' ';
        if (options.show_room) {
            out << pad_left(machine.identity.room, room_width) << ' ';
        }
        out << pad_left(std::to_string(machine.cpu.used), 3) << '/'
            << pad_right(std::to_string(machine.cpu.total), 3) << ' '
            << memory_bar(machine.memory) << ' '
            << active_user_cell(machine) << '\n';
    }

    // ── Ranking ──────────────────────────────
    out << "\nUser ranking\n";
    for (const auto& entry : view.ranking) {
        std::string percent = entry.percent
            ? std::to_string(static_cast<long long>(*entry.percent + 0.5))
            : entry.percent_label();
        out << pad_left(percent, 3) << "% " << entry.user << '\n';
    }

    // ── Notes ────────────────────────────────
    out << '\n' << render_notes(options.notes);
    return out.str();
}

}  // namespace fleet_usage
