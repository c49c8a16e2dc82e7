#ifndef BOUNDED_WRITER_HPP
#define BOUNDED_WRITER_HPP

#include "lvmview/layout.hpp"
#include "lvmview/surface.hpp"

#include <cstddef>      // for size_t
#include <string_view>  // for string_view

namespace lvmview::ui {

/// The only way the renderer touches a Surface.
///
/// Text is clipped by terminal cells to the region and to the surface,
/// using the surface's own glyph widths. Rows outside the region are
/// skipped, and a surface that still fails is counted instead of aborting
/// the frame.
class BoundedWriter final {
 public:
    explicit BoundedWriter(Surface& surface) noexcept : m_surface(surface) { }

    /// @param row, col Position relative to the region.
    /// @return true when (part of) the text was written.
    auto write(const layout::Region& region, int row, int col, std::string_view text, const Style& style = {}) noexcept -> bool;

    /// @brief Writes a full region row, padding the text with spaces.
    auto write_line(const layout::Region& region, int row, std::string_view text, const Style& style = {}) noexcept -> bool;

    /// Writes the surface rejected.
    [[nodiscard]] auto failures() const noexcept -> std::size_t { return m_failures; }

    [[nodiscard]] auto surface() const noexcept -> const Surface& { return m_surface; }

 private:
    /// Longest prefix of `text` the surface lays out in `columns` cells.
    auto fit(std::string_view text, std::size_t columns) const noexcept -> std::string_view;

    Surface& m_surface;
    std::size_t m_failures{};
};

}  // namespace lvmview::ui

#endif  // BOUNDED_WRITER_HPP
