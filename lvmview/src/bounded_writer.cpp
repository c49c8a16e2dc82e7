#include "lvmview/bounded_writer.hpp"
#include "lvmview/string_utils.hpp"

#include <algorithm>  // for min
#include <exception>  // for exception
#include <string>     // for string

#include <spdlog/spdlog.h>

namespace lvmview::ui {

auto BoundedWriter::write(const layout::Region& region, int row, int col, std::string_view text, const Style& style) noexcept -> bool {
    if (row < 0 || row >= region.height || col < 0 || col >= region.width) {
        return false;
    }

    const int abs_row = region.top + row;
    const int abs_col = region.left + col;
    if (abs_row < 0 || abs_row >= m_surface.height() || abs_col < 0) {
        return false;
    }

    const int right   = std::min(region.right(), m_surface.width());
    const int columns = right - abs_col;
    if (columns <= 0) {
        return false;
    }

    const auto clipped = fit(text, static_cast<std::size_t>(columns));
    if (clipped.empty()) {
        return true;
    }
    try {
        m_surface.put(abs_row, abs_col, clipped, style);
    } catch (const std::exception& e) {
        ++m_failures;
        spdlog::trace("[render] write at {}:{} rejected: {}", abs_row, abs_col, e.what());
        return false;
    }
    return true;
}

auto BoundedWriter::write_line(const layout::Region& region, int row, std::string_view text, const Style& style) noexcept -> bool {
    if (region.width <= 0) {
        return false;
    }
    const auto width = static_cast<std::size_t>(region.width);
    std::string line{fit(text, width)};
    const auto used = m_surface.columns(line);
    line.append(width - std::min(used, width), ' ');
    return write(region, row, 0, line, style);
}

auto BoundedWriter::fit(std::string_view text, std::size_t columns) const noexcept -> std::string_view {
    auto clipped = utils::utf8_truncate(text, columns);
    // the surface may measure some glyphs wider than we do
    for (auto budget = columns; budget > 0 && m_surface.columns(clipped) > columns;) {
        clipped = utils::utf8_truncate(text, --budget);
    }
    return clipped;
}

}  // namespace lvmview::ui
