#ifndef PANEL_RENDERER_HPP
#define PANEL_RENDERER_HPP

#include "lvmview/inventory.hpp"
#include "lvmview/surface.hpp"
#include "lvmview/ui_state.hpp"

#include <cstddef>      // for size_t
#include <string_view>  // for string_view

namespace lvmview::ui {

using namespace std::string_view_literals;

inline constexpr auto TOO_SMALL_MESSAGE = "Terminal too small. Please resize to at least 80x10."sv;
inline constexpr auto SCANNING_MESSAGE  = "Scanning storage devices..."sv;

struct FrameOptions {
    /// Without root most LVM and partition data is unavailable.
    bool is_root{true};
};

/// @brief Draws one frame of the three panels and the status line.
/// @param snapshot Latest topology, nullptr before the first refresh finished.
/// @return Number of writes the surface rejected.
auto render_frame(const inventory::Snapshot* snapshot, const UiState& state, Surface& surface, const FrameOptions& options = {}) noexcept -> std::size_t;

}  // namespace lvmview::ui

#endif  // PANEL_RENDERER_HPP
