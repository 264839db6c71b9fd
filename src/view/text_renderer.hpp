/**
 * @file text_renderer.hpp
 * @brief Plain-text rendering of a FleetView for terminals and pipes.
 */

#pragma once

#include "view/host_info.hpp"
#include "view/view_model.hpp"

#include <chrono>
#include <optional>
#include <string>

namespace fleet_usage {

/// Status shown beneath the ranking.
struct RenderNotes {
    std::chrono::seconds age{0};   ///< Since the snapshot timestamp
    bool refresh_ok{false};        ///< The latest poll succeeded
    bool logged{false};            ///< The access log line was written
    bool stale{false};
};

struct RenderOptions {
    bool show_room{false};
    std::optional<HostInfo> viewer;
    RenderNotes notes;
};

/// Cells of one machine row, before padding.
[[nodiscard]] std::string owner_cell(const MachineView& machine);
[[nodiscard]] std::string memory_bar(const MemoryUsage& memory, size_t width = 5);
[[nodiscard]] std::string active_user_cell(const MachineView& machine);

/**
 * @brief Render header, machine table, user ranking and notes.
 *
 * Hotness is printed as its bucket digit; a trailing '*' after the hostname
 * marks a machine with every core busy.
 */
[[nodiscard]] std::string render_text(const FleetView& view, const RenderOptions& options);

}  // namespace fleet_usage
