#ifndef SURFACE_HPP
#define SURFACE_HPP

#include "lvmview/string_utils.hpp"

#include <cstddef>      // for size_t
#include <string_view>  // for string_view

namespace lvmview::ui {

struct Style {
    bool bold{};
    bool inverted{};
    bool underlined{};
    bool dim{};
};

/// Character grid the renderer draws on. Rows and columns are 0-based.
class Surface {
 public:
    virtual ~Surface() noexcept = default;

    [[nodiscard]] virtual auto width() const noexcept -> int  = 0;
    [[nodiscard]] virtual auto height() const noexcept -> int = 0;

    /// Writes `text` starting at (row, col). Fullwidth glyphs take two cells.
    /// Implementations may throw when the text does not fit.
    virtual void put(int row, int col, std::string_view text, const Style& style) = 0;

    /// Number of cells `put` uses for `text`.
    [[nodiscard]] virtual auto columns(std::string_view text) const noexcept -> std::size_t { return utils::utf8_width(text); }
};

}  // namespace lvmview::ui

#endif  // SURFACE_HPP
