#include "lvmview/layout.hpp"

#include <algorithm>  // for max, min

namespace {

using lvmview::layout::Region;

// A column header row on top of the list rows
void split_header(const Region& content, Region& header, Region& list) noexcept {
    header = Region{.top = content.top, .left = content.left, .height = std::min(content.height, 1), .width = content.width};
    list   = Region{.top = content.top + header.height, .left = content.left, .height = content.height - header.height, .width = content.width};
}

}  // namespace

namespace lvmview::layout {

auto compute_layout(int width, int height) noexcept -> std::optional<Layout> {
    if (width < MIN_COLUMNS || height < MIN_ROWS) {
        return std::nullopt;
    }

    const int body_height = height - 1;
    const int left_width  = width / 2;
    const int right_width = width - left_width;
    const int pv_height   = body_height / 2;

    Layout layout{
        .vg_panel    = Region{.top = 0, .left = 0, .height = body_height, .width = left_width},
        .pv_panel    = Region{.top = 0, .left = left_width, .height = pv_height, .width = right_width},
        .block_panel = Region{.top = pv_height, .left = left_width, .height = body_height - pv_height, .width = right_width},
        .status_line = Region{.top = body_height, .left = 0, .height = 1, .width = width},
    };

    // VG list takes a third of the panel, the rest shows the selected VG
    const auto vg_content = inset(layout.vg_panel);
    const int list_rows   = std::max(1, vg_content.height / 3);
    layout.vg_list        = Region{.top = vg_content.top, .left = vg_content.left, .height = list_rows, .width = vg_content.width};
    const int detail_top  = layout.vg_list.bottom() + 1;
    layout.vg_detail      = Region{.top = detail_top, .left = vg_content.left, .height = std::max(0, vg_content.bottom() - detail_top), .width = vg_content.width};

    split_header(inset(layout.pv_panel), layout.pv_header, layout.pv_list);
    split_header(inset(layout.block_panel), layout.block_header, layout.block_list);
    return layout;
}

}  // namespace lvmview::layout
