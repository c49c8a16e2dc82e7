#include "doctest_compatibility.h"

#include "lvmview/ui_state.hpp"

#include <random>       // for mt19937, uniform_int_distribution
#include <string>       // for string
#include <string_view>  // for string_view
#include <vector>       // for vector

using namespace std::string_view_literals;

namespace {

using lvmview::ui::PanelId;

auto make_topology(const std::vector<std::string>& device_names) -> lvmview::topology::Topology {
    lvmview::topology::Topology topology{};
    for (auto&& name : device_names) {
        topology.block_devices.emplace_back(lvmview::disk::BlockDevice{.name = name, .type = "disk"});
    }
    return topology;
}

void check_viewport(const lvmview::ui::UiState& state, PanelId id, std::size_t item_count) {
    const auto& panel = state.panel(id);
    if (item_count == 0) {
        REQUIRE_EQ(panel.selected, 0);
        return;
    }
    REQUIRE(panel.selected < item_count);
    REQUIRE(panel.scroll_offset <= panel.selected);
    REQUIRE(panel.selected < panel.scroll_offset + panel.visible_rows);
}

}  // namespace

TEST_CASE("ui state test")
{
    SECTION("focus cycle")
    {
        lvmview::ui::UiState state{};
        REQUIRE_EQ(state.focus(), PanelId::VolumeGroupList);
        state.cycle_focus();
        REQUIRE_EQ(state.focus(), PanelId::PhysicalVolumeDetail);
        state.cycle_focus();
        REQUIRE_EQ(state.focus(), PanelId::BlockDeviceList);
        state.cycle_focus();
        REQUIRE_EQ(state.focus(), PanelId::VolumeGroupList);
    }
    SECTION("empty and single item panels")
    {
        lvmview::ui::UiState state{};
        state.move_selection(1, 0);
        state.move_selection(-1, 0);
        REQUIRE_EQ(state.panel(PanelId::VolumeGroupList).selected, 0);
        REQUIRE_EQ(state.panel(PanelId::VolumeGroupList).scroll_offset, 0);

        state.move_selection(1, 1);
        REQUIRE_EQ(state.panel(PanelId::VolumeGroupList).selected, 0);
        state.move_selection(-1, 1);
        REQUIRE_EQ(state.panel(PanelId::VolumeGroupList).selected, 0);
    }
    SECTION("scrolling follows the selection")
    {
        lvmview::ui::UiState state{};
        state.set_visible_rows(PanelId::VolumeGroupList, 3);

        for (int i = 0; i < 5; ++i) {
            state.move_selection(1, 10);
            check_viewport(state, PanelId::VolumeGroupList, 10);
        }
        REQUIRE_EQ(state.panel(PanelId::VolumeGroupList).selected, 5);
        REQUIRE_EQ(state.panel(PanelId::VolumeGroupList).scroll_offset, 3);

        // moving back inside the window does not scroll
        state.move_selection(-1, 10);
        state.move_selection(-1, 10);
        REQUIRE_EQ(state.panel(PanelId::VolumeGroupList).selected, 3);
        REQUIRE_EQ(state.panel(PanelId::VolumeGroupList).scroll_offset, 3);

        state.move_selection(-1, 10);
        REQUIRE_EQ(state.panel(PanelId::VolumeGroupList).selected, 2);
        REQUIRE_EQ(state.panel(PanelId::VolumeGroupList).scroll_offset, 2);

        state.move_selection(100, 10);
        REQUIRE_EQ(state.panel(PanelId::VolumeGroupList).selected, 9);
        REQUIRE_EQ(state.panel(PanelId::VolumeGroupList).scroll_offset, 7);

        state.move_selection(-100, 10);
        REQUIRE_EQ(state.panel(PanelId::VolumeGroupList).selected, 0);
        REQUIRE_EQ(state.panel(PanelId::VolumeGroupList).scroll_offset, 0);
    }
    SECTION("random moves stay in bounds")
    {
        std::mt19937 rng{42};
        std::uniform_int_distribution<int> step_dist(-3, 3);
        for (const std::size_t item_count : {std::size_t{0}, std::size_t{1}, std::size_t{37}}) {
            lvmview::ui::UiState state{};
            state.set_visible_rows(PanelId::VolumeGroupList, 5);
            for (int i = 0; i < 1000; ++i) {
                state.move_selection(step_dist(rng), item_count);
                check_viewport(state, PanelId::VolumeGroupList, item_count);
            }
        }
    }
    SECTION("moves only touch the focused panel")
    {
        lvmview::ui::UiState state{};
        state.cycle_focus();
        state.move_selection(1, 4);
        REQUIRE_EQ(state.panel(PanelId::PhysicalVolumeDetail).selected, 1);
        REQUIRE_EQ(state.panel(PanelId::VolumeGroupList).selected, 0);
        REQUIRE_EQ(state.panel(PanelId::BlockDeviceList).selected, 0);
    }
    SECTION("shrinking the viewport keeps the selection visible")
    {
        lvmview::ui::UiState state{};
        state.set_visible_rows(PanelId::VolumeGroupList, 3);
        state.move_selection(5, 10);
        REQUIRE_EQ(state.panel(PanelId::VolumeGroupList).scroll_offset, 3);

        state.set_visible_rows(PanelId::VolumeGroupList, 1);
        REQUIRE_EQ(state.panel(PanelId::VolumeGroupList).scroll_offset, 5);
        check_viewport(state, PanelId::VolumeGroupList, 10);

        state.set_visible_rows(PanelId::VolumeGroupList, 0);
        REQUIRE_EQ(state.panel(PanelId::VolumeGroupList).visible_rows, 1);
    }
    SECTION("viewports follow the layout")
    {
        const auto layout = lvmview::layout::compute_layout(80, 10);
        REQUIRE(layout.has_value());

        lvmview::ui::UiState state{};
        state.fit_viewports(*layout);
        REQUIRE_EQ(state.panel(PanelId::VolumeGroupList).visible_rows, 2);
        REQUIRE_EQ(state.panel(PanelId::PhysicalVolumeDetail).visible_rows, 1);
        REQUIRE_EQ(state.panel(PanelId::BlockDeviceList).visible_rows, 2);
    }
    SECTION("refresh keeps a selection that still exists")
    {
        const auto previous = make_topology({"/dev/sda", "/dev/sdb", "/dev/sdc", "/dev/sdd", "/dev/sde", "/dev/sdf", "/dev/sdg", "/dev/sdh"});

        lvmview::ui::UiState state{};
        state.set_visible_rows(PanelId::BlockDeviceList, 3);
        state.move_selection(PanelId::BlockDeviceList, 5, previous.block_devices.size());
        REQUIRE_EQ(state.panel(PanelId::BlockDeviceList).selected, 5);
        REQUIRE_EQ(state.panel(PanelId::BlockDeviceList).scroll_offset, 3);

        const auto next = make_topology({"/dev/sdb", "/dev/sdc", "/dev/sdd", "/dev/sde", "/dev/sdf", "/dev/sdg", "/dev/sdh"});
        state.refresh(&previous, next);
        REQUIRE_EQ(state.panel(PanelId::BlockDeviceList).selected, 5);
        REQUIRE_EQ(state.panel(PanelId::BlockDeviceList).scroll_offset, 3);
        check_viewport(state, PanelId::BlockDeviceList, next.block_devices.size());

        // the selected device is still listed, but the list got shorter
        const auto shorter = make_topology({"/dev/sdf", "/dev/sdg"});
        state.refresh(&next, shorter);
        REQUIRE_EQ(state.panel(PanelId::BlockDeviceList).selected, 1);
        check_viewport(state, PanelId::BlockDeviceList, shorter.block_devices.size());
    }
    SECTION("refresh resets a selection that disappeared")
    {
        const auto previous = make_topology({"/dev/sda", "/dev/sdb", "/dev/sdc", "/dev/sdd"});

        lvmview::ui::UiState state{};
        state.set_visible_rows(PanelId::BlockDeviceList, 2);
        state.move_selection(PanelId::BlockDeviceList, 3, previous.block_devices.size());
        REQUIRE_EQ(state.panel(PanelId::BlockDeviceList).scroll_offset, 2);

        const auto next = make_topology({"/dev/sda", "/dev/sdb", "/dev/sdc"});
        state.refresh(&previous, next);
        REQUIRE_EQ(state.panel(PanelId::BlockDeviceList).selected, 0);
        REQUIRE_EQ(state.panel(PanelId::BlockDeviceList).scroll_offset, 0);

        state.move_selection(PanelId::BlockDeviceList, 2, next.block_devices.size());
        state.refresh(nullptr, next);
        REQUIRE_EQ(state.panel(PanelId::BlockDeviceList).selected, 0);

        state.refresh(&next, make_topology({}));
        check_viewport(state, PanelId::BlockDeviceList, 0);
    }
    SECTION("panel items")
    {
        auto topology = make_topology({"/dev/sda"});
        topology.vgs.emplace_back(lvmview::topology::VgNode{.record = lvmview::lvm::VolumeGroup{.name = "vg_data"}});
        topology.vgs.emplace_back(lvmview::topology::VgNode{.record = lvmview::lvm::VolumeGroup{.name = "vg_root"}});

        REQUIRE_EQ(lvmview::ui::panel_item_ids(topology, PanelId::VolumeGroupList), std::vector<std::string>{"vg_data", "vg_root"});
        REQUIRE_EQ(lvmview::ui::panel_item_count(topology, PanelId::BlockDeviceList), 1);
        REQUIRE_EQ(lvmview::ui::panel_item_count(topology, PanelId::PhysicalVolumeDetail), 0);
        REQUIRE_EQ(lvmview::ui::panel_title(PanelId::BlockDeviceList), "Block Devices"sv);

        lvmview::ui::UiState state{};
        state.move_selection(1, 2);
        const auto* vg = lvmview::ui::selected_vg(topology, state);
        REQUIRE(vg != nullptr);
        REQUIRE_EQ(vg->record.name, "vg_root");

        REQUIRE(lvmview::ui::selected_vg(lvmview::topology::Topology{}, state) == nullptr);
    }
}
