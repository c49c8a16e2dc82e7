#ifndef SCREEN_SURFACE_HPP
#define SCREEN_SURFACE_HPP

// import lvmview
#include "lvmview/surface.hpp"

#include <cstddef>      // for size_t
#include <functional>   // for function
#include <string_view>  // for string_view

#include <ftxui/dom/elements.hpp>  // for Element
#include <ftxui/screen/box.hpp>    // for Box
#include <ftxui/screen/screen.hpp>  // for Screen

namespace tui {

// Surface over the cells of an ftxui::Screen inside `box`
class ScreenSurface final : public lvmview::ui::Surface {
 public:
    ScreenSurface(ftxui::Screen& screen, const ftxui::Box& box) noexcept
      : m_screen(screen), m_box(box) { }

    [[nodiscard]] auto width() const noexcept -> int override;
    [[nodiscard]] auto height() const noexcept -> int override;

    // Throws std::out_of_range when a glyph would land outside the box.
    void put(int row, int col, std::string_view text, const lvmview::ui::Style& style) override;

    // Cell count as ftxui lays the text out.
    [[nodiscard]] auto columns(std::string_view text) const noexcept -> std::size_t override;

 private:
    ftxui::Screen& m_screen;
    ftxui::Box m_box;
};

using draw_fn_t = std::function<void(lvmview::ui::Surface&)>;

/// @brief Element filling all available space, drawn by `draw` on every render.
auto surface_element(draw_fn_t draw) noexcept -> ftxui::Element;

}  // namespace tui

#endif  // SCREEN_SURFACE_HPP
