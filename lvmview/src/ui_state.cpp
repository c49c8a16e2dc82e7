#include "lvmview/ui_state.hpp"

#include <algorithm>  // for find, min
#include <utility>    // for to_underlying

using namespace std::string_view_literals;

namespace {

namespace ui = lvmview::ui;

constexpr std::array ALL_PANELS{
    ui::PanelId::VolumeGroupList,
    ui::PanelId::PhysicalVolumeDetail,
    ui::PanelId::BlockDeviceList,
};

/// Smallest change of the scroll offset that keeps `selected` visible.
constexpr void scroll_to_selection(ui::PanelState& state) noexcept {
    const auto rows = std::max<std::size_t>(state.visible_rows, 1);
    if (state.selected < state.scroll_offset) {
        state.scroll_offset = state.selected;
    } else if (state.selected >= state.scroll_offset + rows) {
        state.scroll_offset = state.selected - rows + 1;
    }
}

auto to_rows(int height) noexcept -> std::size_t {
    return static_cast<std::size_t>(std::max(height, 1));
}

}  // namespace

namespace lvmview::ui {

auto UiState::panel(PanelId id) const noexcept -> const PanelState& {
    return m_panels[std::to_underlying(id)];
}

auto UiState::panel_state(PanelId id) noexcept -> PanelState& {
    return m_panels[std::to_underlying(id)];
}

void UiState::cycle_focus() noexcept {
    const auto next = (std::to_underlying(m_focus) + 1) % PANEL_COUNT;
    m_focus         = static_cast<PanelId>(next);
}

void UiState::move_selection(int direction, std::size_t item_count) noexcept {
    move_selection(m_focus, direction, item_count);
}

void UiState::move_selection(PanelId id, int direction, std::size_t item_count) noexcept {
    auto& state = panel_state(id);
    if (item_count == 0) {
        state.selected      = 0;
        state.scroll_offset = 0;
        return;
    }

    const auto last = item_count - 1;
    state.selected  = std::min(state.selected, last);
    if (direction < 0) {
        const auto step = static_cast<std::size_t>(-static_cast<long long>(direction));
        state.selected  = (step > state.selected) ? 0 : state.selected - step;
    } else {
        const auto step = static_cast<std::size_t>(direction);
        state.selected  = std::min(state.selected + step, last);
    }
    scroll_to_selection(state);
}

void UiState::set_visible_rows(PanelId id, std::size_t rows) noexcept {
    auto& state        = panel_state(id);
    state.visible_rows = std::max<std::size_t>(rows, 1);
    scroll_to_selection(state);
}

void UiState::fit_viewports(const layout::Layout& layout) noexcept {
    set_visible_rows(PanelId::VolumeGroupList, to_rows(layout.vg_list.height));
    set_visible_rows(PanelId::PhysicalVolumeDetail, to_rows(layout.pv_list.height));
    set_visible_rows(PanelId::BlockDeviceList, to_rows(layout.block_list.height));
}

void UiState::clamp_panel(PanelId id, std::size_t item_count) noexcept {
    auto& state = panel_state(id);
    if (item_count == 0) {
        state.selected      = 0;
        state.scroll_offset = 0;
        return;
    }
    state.selected      = std::min(state.selected, item_count - 1);
    state.scroll_offset = std::min(state.scroll_offset, state.selected);
    scroll_to_selection(state);
}

void UiState::refresh(const topology::Topology* previous, const topology::Topology& next) noexcept {
    for (const auto id : ALL_PANELS) {
        const auto next_ids = panel_item_ids(next, id);
        auto& state         = panel_state(id);

        bool keep{false};
        if (previous != nullptr) {
            const auto previous_ids = panel_item_ids(*previous, id);
            if (state.selected < previous_ids.size()) {
                keep = std::ranges::find(next_ids, previous_ids[state.selected]) != next_ids.end();
            }
        }
        if (!keep) {
            state.selected      = 0;
            state.scroll_offset = 0;
        }
        clamp_panel(id, next_ids.size());
    }
}

auto panel_title(PanelId id) noexcept -> std::string_view {
    switch (id) {
    case PanelId::VolumeGroupList:
        return "Volume Groups"sv;
    case PanelId::PhysicalVolumeDetail:
        return "Physical Volumes"sv;
    case PanelId::BlockDeviceList:
        return "Block Devices"sv;
    }
    return ""sv;
}

auto panel_item_ids(const topology::Topology& topology, PanelId id) noexcept -> std::vector<std::string> {
    std::vector<std::string> ids{};
    switch (id) {
    case PanelId::VolumeGroupList:
        for (auto&& vg : topology.vgs) {
            ids.emplace_back(vg.record.name);
        }
        break;
    case PanelId::PhysicalVolumeDetail:
        for (auto&& pv : topology.pvs) {
            ids.emplace_back(pv.id);
        }
        break;
    case PanelId::BlockDeviceList:
        for (auto&& device : topology.block_devices) {
            ids.emplace_back(device.name);
        }
        break;
    }
    return ids;
}

auto panel_item_count(const topology::Topology& topology, PanelId id) noexcept -> std::size_t {
    switch (id) {
    case PanelId::VolumeGroupList:
        return topology.vgs.size();
    case PanelId::PhysicalVolumeDetail:
        return topology.pvs.size();
    case PanelId::BlockDeviceList:
        return topology.block_devices.size();
    }
    return 0;
}

auto selected_vg(const topology::Topology& topology, const UiState& state) noexcept -> const topology::VgNode* {
    const auto index = state.panel(PanelId::VolumeGroupList).selected;
    if (index >= topology.vgs.size()) {
        return nullptr;
    }
    return &topology.vgs[index];
}

}  // namespace lvmview::ui
