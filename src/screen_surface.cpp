#include "screen_surface.hpp"

#include <algorithm>  // for max
#include <memory>     // for make_shared
#include <stdexcept>  // for out_of_range
#include <string>     // for string
#include <utility>    // for move
#include <vector>     // for vector

#include <ftxui/dom/node.hpp>          // for Node
#include <ftxui/dom/requirement.hpp>   // for Requirement
#include <ftxui/screen/string.hpp>     // for Utf8ToGlyphs, string_width

#include <fmt/compile.h>
#include <fmt/format.h>

namespace {

class SurfaceNode final : public ftxui::Node {
 public:
    explicit SurfaceNode(tui::draw_fn_t draw) : m_draw(std::move(draw)) { }

    void ComputeRequirement() override {
        requirement_.min_x         = 0;
        requirement_.min_y         = 0;
        requirement_.flex_grow_x   = 1;
        requirement_.flex_grow_y   = 1;
        requirement_.flex_shrink_x = 1;
        requirement_.flex_shrink_y = 1;
    }

    void Render(ftxui::Screen& screen) override {
        tui::ScreenSurface surface{screen, box_};
        if (m_draw) {
            m_draw(surface);
        }
    }

 private:
    tui::draw_fn_t m_draw;
};

}  // namespace

namespace tui {

auto ScreenSurface::width() const noexcept -> int {
    return std::max(0, m_box.x_max - m_box.x_min + 1);
}

auto ScreenSurface::height() const noexcept -> int {
    return std::max(0, m_box.y_max - m_box.y_min + 1);
}

void ScreenSurface::put(int row, int col, std::string_view text, const lvmview::ui::Style& style) {
    if (row < 0 || row >= height() || col < 0) {
        throw std::out_of_range(fmt::format(FMT_COMPILE("cell {}:{} outside {}x{}"), row, col, width(), height()));
    }

    // fullwidth glyphs are followed by an empty glyph for their second cell
    const auto glyphs = ftxui::Utf8ToGlyphs(std::string{text});
    if (col + static_cast<int>(glyphs.size()) > width()) {
        throw std::out_of_range(fmt::format(FMT_COMPILE("{} cells at column {} exceed width {}"), glyphs.size(), col, width()));
    }

    const int y = m_box.y_min + row;
    int x       = m_box.x_min + col;
    for (auto&& glyph : glyphs) {
        auto& pixel      = m_screen.PixelAt(x, y);
        pixel.character  = glyph;
        pixel.bold       = style.bold;
        pixel.inverted   = style.inverted;
        pixel.underlined = style.underlined;
        pixel.dim        = style.dim;
        ++x;
    }
}

auto ScreenSurface::columns(std::string_view text) const noexcept -> std::size_t {
    return static_cast<std::size_t>(std::max(0, ftxui::string_width(std::string{text})));
}

auto surface_element(draw_fn_t draw) noexcept -> ftxui::Element {
    return std::make_shared<SurfaceNode>(std::move(draw));
}

}  // namespace tui
