#include "lvmview/panel_renderer.hpp"
#include "lvmview/bounded_writer.hpp"
#include "lvmview/layout.hpp"
#include "lvmview/string_utils.hpp"
#include "lvmview/units.hpp"

#include <algorithm>         // for find
#include <chrono>            // for system_clock
#include <initializer_list>  // for initializer_list
#include <optional>          // for optional
#include <string>            // for string
#include <utility>           // for move
#include <vector>            // for vector

#include <fmt/chrono.h>
#include <fmt/compile.h>
#include <fmt/format.h>

using namespace std::string_literals;
using namespace std::string_view_literals;

namespace {

namespace cmd      = lvmview::cmd;
namespace topology = lvmview::topology;
namespace units    = lvmview::units;
namespace utils    = lvmview::utils;
using lvmview::inventory::Snapshot;
using lvmview::layout::Region;
using lvmview::ui::BoundedWriter;
using lvmview::ui::PanelId;
using lvmview::ui::Style;

// unresolved entity / reported membership differs
static constexpr char UNRESOLVED_MARKER = '?';
static constexpr char MISMATCH_MARKER   = '!';

static constexpr auto KEY_HELP = "Tab: panel  Up/k Down/j: move  r: refresh  q: quit"sv;

struct Line {
    std::string text;
    Style style{};
};

auto repeat(std::string_view glyph, int count) noexcept -> std::string {
    std::string res{};
    for (int i = 0; i < count; ++i) {
        res += glyph;
    }
    return res;
}

auto or_placeholder(const std::optional<std::string>& value, std::string_view placeholder = "Unknown"sv) noexcept -> std::string_view {
    if (!value || value->empty()) {
        return placeholder;
    }
    return *value;
}

auto source_notice(const Snapshot* snapshot, cmd::Command command) noexcept -> std::string {
    if (snapshot == nullptr) {
        return {};
    }
    const auto* error = snapshot->source_error(command);
    if (error == nullptr) {
        return {};
    }
    if (error->kind == cmd::ErrorKind::PermissionDenied) {
        return fmt::format(FMT_COMPILE("{}: permission denied"), cmd::command_name(command));
    }
    return fmt::format(FMT_COMPILE("{} unavailable: {}"), cmd::command_name(command), cmd::describe_error(*error));
}

/// Notices of every failed source a panel is built from, joined with "; ".
auto sources_notice(const Snapshot* snapshot, std::initializer_list<cmd::Command> commands) noexcept -> std::string {
    std::vector<std::string> notices{};
    for (const auto command : commands) {
        if (auto notice = source_notice(snapshot, command); !notice.empty()) {
            notices.emplace_back(std::move(notice));
        }
    }
    return utils::join(notices, "; ");
}

// an empty list is only a fact when its source succeeded
auto empty_list_text(const Snapshot* snapshot, cmd::Command command, std::string_view no_items) noexcept -> std::string {
    auto notice = source_notice(snapshot, command);
    return notice.empty() ? std::string{no_items} : notice;
}

void draw_box(BoundedWriter& writer, const Region& panel, std::string_view title, std::string_view notice, bool focused) noexcept {
    if (panel.empty()) {
        return;
    }
    const Style border_style{.bold = focused, .dim = !focused};
    const int inner = panel.width - 2;

    writer.write(panel, 0, 0, fmt::format(FMT_COMPILE("┌{}┐"), repeat("─"sv, inner)), border_style);
    for (int row = 1; row < panel.height - 1; ++row) {
        writer.write(panel, row, 0, "│"sv, border_style);
        writer.write(panel, row, panel.width - 1, "│"sv, border_style);
    }
    if (panel.height > 1) {
        writer.write(panel, panel.height - 1, 0, fmt::format(FMT_COMPILE("└{}┘"), repeat("─"sv, inner)), border_style);
    }

    // title sits on the top border, clipped before the right corner
    const Region title_region{.top = panel.top, .left = panel.left + 2, .height = 1, .width = panel.width - 4};
    const auto title_text = notice.empty()
        ? fmt::format(FMT_COMPILE(" {} "), title)
        : fmt::format(FMT_COMPILE(" {} [{}] "), title, notice);
    writer.write(title_region, 0, 0, title_text, Style{.bold = focused, .inverted = focused});
}

void draw_lines(BoundedWriter& writer, const Region& region, const std::vector<Line>& lines) noexcept {
    for (std::size_t i = 0; i < lines.size() && static_cast<int>(i) < region.height; ++i) {
        writer.write(region, static_cast<int>(i), 0, lines[i].text, lines[i].style);
    }
}

/// Draws the visible window of a selectable list.
void draw_list(BoundedWriter& writer, const Region& region, const lvmview::ui::PanelState& state, const std::vector<Line>& items, bool focused, std::string_view empty_text) noexcept {
    if (items.empty()) {
        writer.write(region, 0, 0, empty_text, Style{.dim = true});
        return;
    }
    for (int row = 0; row < region.height; ++row) {
        const auto index = state.scroll_offset + static_cast<std::size_t>(row);
        if (index >= items.size()) {
            break;
        }
        auto style = items[index].style;
        if (index == state.selected) {
            style.inverted   = focused;
            style.underlined = !focused;
        }
        writer.write_line(region, row, items[index].text, style);
    }
}

auto vg_list_lines(const topology::Topology& topo) noexcept -> std::vector<Line> {
    std::vector<Line> lines{};
    for (auto&& vg : topo.vgs) {
        const char marker = vg.synthetic ? UNRESOLVED_MARKER : (vg.membership_mismatch ? MISMATCH_MARKER : ' ');
        lines.emplace_back(Line{
            .text = fmt::format(FMT_COMPILE("{}{:<16} {:>10} {:>10}"), marker, utils::ellipsize(vg.record.name, 16), units::format_size(vg.record.size), units::format_size(vg.record.free)),
        });
    }
    return lines;
}

void append_segment_table(std::vector<Line>& lines, const Snapshot& snapshot, const topology::LvNode& lv) noexcept {
    if (lv.segments.empty()) {
        const auto* error = snapshot.source_error(cmd::Command::ReportSegments);
        lines.emplace_back(Line{
            .text  = error != nullptr ? fmt::format(FMT_COMPILE("    segments unavailable: {}"), cmd::describe_error(*error)) : "    no segments reported"s,
            .style = Style{.dim = true},
        });
        return;
    }

    lines.emplace_back(Line{
        .text  = fmt::format(FMT_COMPILE("    {:>8} {:>8} {:>8} {:>10} {:<14} {:>8}"), "LE Start", "LE End", "PE Count", "PE Size", "PVs", "PE Start"),
        .style = Style{.underlined = true},
    });
    for (auto&& segment : lv.segments) {
        if (segment.mappings.empty()) {
            lines.emplace_back(Line{
                .text = fmt::format(FMT_COMPILE("    {:>8} {:>8} {:>8} {:>10} {:<14} {:>8}"), segment.le_start, segment.le_end, segment.pe_count, units::format_size(segment.pe_size), "---", "---"),
            });
            continue;
        }
        // striped and mirrored segments map onto several PVs, one row each
        for (std::size_t i = 0; i < segment.mappings.size(); ++i) {
            const auto& mapping = segment.mappings[i];
            if (i == 0) {
                lines.emplace_back(Line{
                    .text = fmt::format(FMT_COMPILE("    {:>8} {:>8} {:>8} {:>10} {:<14} {:>8}"), segment.le_start, segment.le_end, segment.pe_count, units::format_size(segment.pe_size), utils::ellipsize(mapping.pv, 14), mapping.pe_start),
                });
            } else {
                lines.emplace_back(Line{
                    .text = fmt::format(FMT_COMPILE("    {:>8} {:>8} {:>8} {:>10} {:<14} {:>8}"), "", "", "", "", utils::ellipsize(mapping.pv, 14), mapping.pe_start),
                });
            }
        }
    }
    if (!lv.contiguous) {
        lines.emplace_back(Line{.text = fmt::format(FMT_COMPILE("    {} segment data incomplete"), UNRESOLVED_MARKER), .style = Style{.dim = true}});
    }
}

auto vg_detail_lines(const Snapshot& snapshot, const topology::VgNode& vg) noexcept -> std::vector<Line> {
    const auto& topo = snapshot.topology;
    std::vector<Line> lines{};
    const auto& record = vg.record;

    if (vg.synthetic) {
        lines.emplace_back(Line{.text = fmt::format(FMT_COMPILE("{} {}"), record.name, UNRESOLVED_MARKER), .style = Style{.bold = true}});
        lines.emplace_back(Line{.text = "Volume group not reported by vgs"s, .style = Style{.dim = true}});
    } else {
        lines.emplace_back(Line{
            .text  = vg.membership_mismatch ? fmt::format(FMT_COMPILE("{} {}"), record.name, MISMATCH_MARKER) : record.name,
            .style = Style{.bold = true},
        });
        lines.emplace_back(Line{.text = fmt::format(FMT_COMPILE("Format: {:<8} PE Size: {}"), record.format.empty() ? "Unknown"sv : std::string_view{record.format}, units::format_size(record.extent_size))});
        lines.emplace_back(Line{.text = fmt::format(FMT_COMPILE("Size:   {}  Free: {}"), units::format_size(record.size), units::format_size(record.free))});
        if (vg.membership_mismatch) {
            lines.emplace_back(Line{.text = fmt::format(FMT_COMPILE("{} PVs: {} reported, {} found"), MISMATCH_MARKER, record.pv_count.value_or(0), vg.pvs.size())});
        }
    }

    std::vector<std::string> lv_names{};
    for (const auto lv_index : vg.lvs) {
        lv_names.emplace_back(topo.lvs[lv_index].record.name);
    }
    if (const auto* lvs_error = snapshot.source_error(cmd::Command::ReportLogicalVolumes); lvs_error != nullptr && lv_names.empty()) {
        lines.emplace_back(Line{.text = fmt::format(FMT_COMPILE("LVs: unavailable: {}"), cmd::describe_error(*lvs_error)), .style = Style{.dim = true}});
    } else {
        lines.emplace_back(Line{.text = fmt::format(FMT_COMPILE("LVs: {}"), lv_names.empty() ? "none"s : utils::join(lv_names, ", "))});
    }
    if (vg.synthetic && !vg.pvs.empty()) {
        std::vector<std::string> pv_names{};
        for (const auto pv_index : vg.pvs) {
            pv_names.emplace_back(topo.pvs[pv_index].id);
        }
        lines.emplace_back(Line{.text = fmt::format(FMT_COMPILE("PVs: {}"), utils::join(pv_names, ", "))});
    }

    if (vg.lvs.empty()) {
        return lines;
    }
    lines.emplace_back(Line{.text = "[ Discovered LVols.. ]"s, .style = Style{.bold = true}});
    const auto df_notice = source_notice(&snapshot, cmd::Command::FilesystemUsage);
    for (const auto lv_index : vg.lvs) {
        const auto& lv = topo.lvs[lv_index];
        lines.emplace_back(Line{
            .text  = lv.resolved ? fmt::format(FMT_COMPILE("{}:"), lv.record.name) : fmt::format(FMT_COMPILE("{} {}:"), lv.record.name, UNRESOLVED_MARKER),
            .style = Style{.underlined = true},
        });
        lines.emplace_back(Line{
            .text = fmt::format(FMT_COMPILE("  Mounted: {}  Capacity: {}"), or_placeholder(lv.mountpoint, df_notice.empty() ? "N/A"sv : "unavailable"sv), units::format_size(lv.record.size)),
        });
        if (df_notice.empty()) {
            lines.emplace_back(Line{.text = fmt::format(FMT_COMPILE("  Used: {}  Available: {}"), units::format_size(lv.fs_used), units::format_size(lv.fs_avail))});
        } else {
            lines.emplace_back(Line{.text = fmt::format(FMT_COMPILE("  Used: N/A  Available: N/A  [{}]"), df_notice), .style = Style{.dim = true}});
        }
        append_segment_table(lines, snapshot, lv);
    }
    return lines;
}

auto pv_header() noexcept -> std::string {
    return fmt::format(FMT_COMPILE("{:<18} {:>10} {:>4} {:>10} {}"), "Block dev", "Size", "LV #", "Free", "VG");
}

auto pv_lines(const topology::Topology& topo, const topology::VgNode* selected) noexcept -> std::vector<Line> {
    std::vector<Line> lines{};
    for (std::size_t i = 0; i < topo.pvs.size(); ++i) {
        const auto& pv      = topo.pvs[i];
        const auto vg_label = pv.resolved
            ? std::string{or_placeholder(pv.record.vg_name)}
            : fmt::format(FMT_COMPILE("{} {}"), or_placeholder(pv.record.vg_name), UNRESOLVED_MARKER);
        const bool member = selected != nullptr && std::ranges::find(selected->pvs, i) != selected->pvs.end();
        lines.emplace_back(Line{
            .text  = fmt::format(FMT_COMPILE("{:<18} {:>10} {:>4} {:>10} {}"), utils::ellipsize(pv.id, 18), units::format_size(pv.record.size), pv.lv_count, units::format_size(pv.record.free), vg_label),
            .style = Style{.bold = member},
        });
    }
    return lines;
}

auto block_header() noexcept -> std::string {
    return fmt::format(FMT_COMPILE("{:<16} {:>10} {:<4} {:<5} {:<12} {:<5} {:<10} {}"), "Device", "Size", "Part", "Type", "FS", "Table", "Flags", "Model");
}

auto format_flags(const std::vector<std::string>& flags) noexcept -> std::string {
    std::vector<std::string> shown{};
    for (auto&& flag : flags) {
        shown.emplace_back(flag == "lvm"sv ? "LVM"s : flag);
    }
    return shown.empty() ? "---"s : utils::join(shown, ",");
}

auto block_lines(const topology::Topology& topo) noexcept -> std::vector<Line> {
    std::vector<Line> lines{};
    for (auto&& device : topo.block_devices) {
        lines.emplace_back(Line{
            .text = fmt::format(FMT_COMPILE("{:<16} {:>10} {:<4} {:<5} {:<12} {:<5} {:<10} {}"),
                utils::ellipsize(device.name, 16),
                units::format_size(device.size),
                lvmview::disk::partition_role_label(device),
                utils::ellipsize(device.type, 5),
                utils::ellipsize(or_placeholder(device.fstype), 12),
                utils::ellipsize(or_placeholder(device.pttype, "---"sv), 5),
                utils::ellipsize(format_flags(device.flags), 10),
                or_placeholder(device.model)),
        });
    }
    return lines;
}

auto status_text(const Snapshot* snapshot, const lvmview::ui::FrameOptions& options) noexcept -> std::string {
    auto text = std::string{KEY_HELP};
    if (snapshot == nullptr) {
        text += " | scanning...";
    } else {
        const auto taken_at = std::chrono::system_clock::to_time_t(snapshot->taken_at);
        text += fmt::format(" | updated {:%H:%M:%S}", fmt::localtime(taken_at));
        if (const auto skipped = snapshot->total_skipped(); skipped > 0) {
            text += fmt::format(FMT_COMPILE(" | skipped: {}"), skipped);
        }
    }
    if (!options.is_root) {
        text += " | not root: data may be incomplete";
    }
    return text;
}

}  // namespace

namespace lvmview::ui {

auto render_frame(const inventory::Snapshot* snapshot, const UiState& state, Surface& surface, const FrameOptions& options) noexcept -> std::size_t {
    BoundedWriter writer{surface};
    const Region screen{.top = 0, .left = 0, .height = surface.height(), .width = surface.width()};

    const auto layout = layout::compute_layout(surface.width(), surface.height());
    if (!layout) {
        writer.write(screen, 0, 0, TOO_SMALL_MESSAGE, Style{.bold = true});
        return writer.failures();
    }

    const auto focus = state.focus();
    const auto vg_notice    = sources_notice(snapshot, {cmd::Command::ReportVolumeGroups, cmd::Command::ReportLogicalVolumes, cmd::Command::ReportSegments});
    const auto pv_notice    = sources_notice(snapshot, {cmd::Command::ReportPhysicalVolumes, cmd::Command::ReportSegments});
    const auto block_notice = sources_notice(snapshot, {cmd::Command::ListBlockDevices, cmd::Command::ListPartitionTable, cmd::Command::ListPartitionLayout});
    draw_box(writer, layout->vg_panel, panel_title(PanelId::VolumeGroupList), vg_notice, focus == PanelId::VolumeGroupList);
    draw_box(writer, layout->pv_panel, panel_title(PanelId::PhysicalVolumeDetail), pv_notice, focus == PanelId::PhysicalVolumeDetail);
    draw_box(writer, layout->block_panel, panel_title(PanelId::BlockDeviceList), block_notice, focus == PanelId::BlockDeviceList);

    // separator between the VG list and the selected VG
    const int separator_row = layout->vg_list.bottom() - layout->vg_panel.top;
    if (separator_row < layout->vg_panel.height - 1) {
        writer.write(layout->vg_panel, separator_row, 0, fmt::format(FMT_COMPILE("├{}┤"), repeat("─"sv, layout->vg_panel.width - 2)), Style{.dim = focus != PanelId::VolumeGroupList});
    }

    writer.write(layout->pv_header, 0, 0, pv_header(), Style{.underlined = true});
    writer.write(layout->block_header, 0, 0, block_header(), Style{.underlined = true});

    if (snapshot == nullptr) {
        writer.write(layout->vg_list, 0, 0, SCANNING_MESSAGE, Style{.dim = true});
    } else {
        const auto& topo = snapshot->topology;
        draw_list(writer, layout->vg_list, state.panel(PanelId::VolumeGroupList), vg_list_lines(topo), focus == PanelId::VolumeGroupList,
            empty_list_text(snapshot, cmd::Command::ReportVolumeGroups, "No volume groups found"sv));
        if (const auto* vg = selected_vg(topo, state)) {
            draw_lines(writer, layout->vg_detail, vg_detail_lines(*snapshot, *vg));
        }
        draw_list(writer, layout->pv_list, state.panel(PanelId::PhysicalVolumeDetail), pv_lines(topo, selected_vg(topo, state)), focus == PanelId::PhysicalVolumeDetail,
            empty_list_text(snapshot, cmd::Command::ReportPhysicalVolumes, "No physical volumes found"sv));
        draw_list(writer, layout->block_list, state.panel(PanelId::BlockDeviceList), block_lines(topo), focus == PanelId::BlockDeviceList,
            empty_list_text(snapshot, cmd::Command::ListBlockDevices, "No block devices found"sv));
    }

    writer.write_line(layout->status_line, 0, status_text(snapshot, options), Style{.inverted = true});
    return writer.failures();
}

}  // namespace lvmview::ui
