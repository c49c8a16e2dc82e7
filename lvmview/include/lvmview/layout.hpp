#ifndef LAYOUT_HPP
#define LAYOUT_HPP

#include <optional>  // for optional

namespace lvmview::layout {

/// Smallest terminal the panels are drawn in.
inline constexpr int MIN_COLUMNS = 80;
inline constexpr int MIN_ROWS    = 10;

/// Rectangle in terminal cells.
struct Region {
    int top{};
    int left{};
    int height{};
    int width{};

    [[nodiscard]] constexpr auto bottom() const noexcept -> int { return top + height; }
    [[nodiscard]] constexpr auto right() const noexcept -> int { return left + width; }
    [[nodiscard]] constexpr auto empty() const noexcept -> bool { return height <= 0 || width <= 0; }
};

/// @brief Region shrunk by `margin` cells on every side (never negative).
constexpr auto inset(const Region& region, int margin = 1) noexcept -> Region {
    const int height = region.height - (2 * margin);
    const int width  = region.width - (2 * margin);
    return Region{
        .top    = region.top + margin,
        .left   = region.left + margin,
        .height = height > 0 ? height : 0,
        .width  = width > 0 ? width : 0,
    };
}

/// Three bordered panels and a status line:
///
///   +---------+---------+
///   |   VG    |   PV    |
///   |         +---------+
///   |         |  block  |
///   +---------+---------+
///   status line
struct Layout {
    Region vg_panel;
    /// Selectable VG rows inside vg_panel.
    Region vg_list;
    /// Details of the selected VG, below vg_list and a separator row.
    Region vg_detail;
    Region pv_panel;
    Region pv_header;
    Region pv_list;
    Region block_panel;
    Region block_header;
    Region block_list;
    Region status_line;
};

/// @brief Splits the terminal into panels.
/// @return std::nullopt when the terminal is smaller than MIN_COLUMNS x MIN_ROWS.
auto compute_layout(int width, int height) noexcept -> std::optional<Layout>;

}  // namespace lvmview::layout

#endif  // LAYOUT_HPP
