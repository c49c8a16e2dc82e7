#ifndef UI_STATE_HPP
#define UI_STATE_HPP

#include "lvmview/layout.hpp"
#include "lvmview/topology.hpp"

#include <array>        // for array
#include <cstddef>      // for size_t
#include <cstdint>      // for uint8_t
#include <string>       // for string
#include <string_view>  // for string_view
#include <vector>       // for vector

namespace lvmview::ui {

enum class PanelId : std::uint8_t {
    VolumeGroupList,
    PhysicalVolumeDetail,
    BlockDeviceList,
};

inline constexpr std::size_t PANEL_COUNT = 3;

struct PanelState {
    std::size_t selected{};
    std::size_t scroll_offset{};
    std::size_t visible_rows{1};
};

/// Navigation state, kept across snapshots.
///
/// Holds for every panel with N items:
///   selected < N (0 when N == 0),
///   scroll_offset <= selected < scroll_offset + visible_rows.
class UiState final {
 public:
    [[nodiscard]] auto focus() const noexcept -> PanelId { return m_focus; }
    [[nodiscard]] auto panel(PanelId id) const noexcept -> const PanelState&;

    /// @brief VG list -> PV panel -> block device panel -> VG list.
    void cycle_focus() noexcept;

    /// @brief Moves the selection of the focused panel, clamped to [0, item_count).
    /// The scroll offset moves only as far as needed to keep the selection visible.
    void move_selection(int direction, std::size_t item_count) noexcept;
    void move_selection(PanelId id, int direction, std::size_t item_count) noexcept;

    /// @brief Changes how many rows a panel shows, keeping the selection visible.
    void set_visible_rows(PanelId id, std::size_t rows) noexcept;

    /// @brief Applies the list heights of a layout to every panel.
    void fit_viewports(const layout::Layout& layout) noexcept;

    /// @brief Adopts a new snapshot. A panel whose selected item still exists
    /// keeps its selection and scroll offset (clamped to the new item count),
    /// otherwise both reset to 0.
    void refresh(const topology::Topology* previous, const topology::Topology& next) noexcept;

 private:
    auto panel_state(PanelId id) noexcept -> PanelState&;
    void clamp_panel(PanelId id, std::size_t item_count) noexcept;

    PanelId m_focus{PanelId::VolumeGroupList};
    std::array<PanelState, PANEL_COUNT> m_panels{};
};

auto panel_title(PanelId id) noexcept -> std::string_view;

/// @brief Identifiers of the items a panel lists, in display order:
/// VG names (the synthetic group last), PV device paths, block device paths.
auto panel_item_ids(const topology::Topology& topology, PanelId id) noexcept -> std::vector<std::string>;

auto panel_item_count(const topology::Topology& topology, PanelId id) noexcept -> std::size_t;

/// @brief VG under the VG list cursor, nullptr if there is none.
auto selected_vg(const topology::Topology& topology, const UiState& state) noexcept -> const topology::VgNode*;

}  // namespace lvmview::ui

#endif  // UI_STATE_HPP
