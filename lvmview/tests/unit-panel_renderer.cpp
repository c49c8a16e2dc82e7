#include "doctest_compatibility.h"

#include "lvmview/logger.hpp"
#include "lvmview/panel_renderer.hpp"
#include "lvmview/string_utils.hpp"

#include <algorithm>    // for any_of
#include <string>       // for string
#include <string_view>  // for string_view
#include <vector>       // for vector

#include <spdlog/sinks/callback_sink.h>
#include <spdlog/spdlog.h>

using namespace std::string_literals;
using namespace std::string_view_literals;

namespace {

namespace cmd = lvmview::cmd;

struct Put {
    int row{};
    int col{};
    std::string text;
    lvmview::ui::Style style{};
};

class RecordingSurface final : public lvmview::ui::Surface {
 public:
    RecordingSurface(int width, int height) noexcept : m_width(width), m_height(height) { }

    [[nodiscard]] auto width() const noexcept -> int override { return m_width; }
    [[nodiscard]] auto height() const noexcept -> int override { return m_height; }

    void put(int row, int col, std::string_view text, const lvmview::ui::Style& style) override {
        m_puts.emplace_back(Put{.row = row, .col = col, .text = std::string{text}, .style = style});
    }

    [[nodiscard]] auto puts() const noexcept -> const std::vector<Put>& { return m_puts; }

    [[nodiscard]] auto find(std::string_view needle) const noexcept -> const Put* {
        auto it = std::ranges::find_if(m_puts, [needle](auto&& put) { return put.text.find(needle) != std::string::npos; });
        return (it != m_puts.end()) ? &*it : nullptr;
    }

 private:
    int m_width;
    int m_height;
    std::vector<Put> m_puts{};
};

static constexpr auto LSBLK_OUTPUT = R"({"blockdevices": [
   {"name":"/dev/sda", "type":"disk", "size":107374182400, "model":"VBOX HARDDISK", "pttype":"gpt",
      "children": [
         {"name":"/dev/sda1", "type":"part", "size":53687091200, "fstype":"LVM2_member", "pkname":"/dev/sda",
            "children": [
               {"name":"/dev/mapper/vg_data-lv_home", "type":"lvm", "size":85899345920, "fstype":"ext4", "mountpoint":"/home", "pkname":"/dev/sda1"}
            ]
         },
         {"name":"/dev/sda2", "type":"part", "size":53687091200, "fstype":"LVM2_member", "pkname":"/dev/sda"}
      ]
   }
]})"sv;

auto make_outputs() -> lvmview::inventory::RawOutputs {
    lvmview::inventory::RawOutputs outputs{};
    outputs.emplace(cmd::Command::ListBlockDevices, std::string{LSBLK_OUTPUT});
    outputs.emplace(cmd::Command::ListPartitionTable, std::unexpected(cmd::CommandError{.kind = cmd::ErrorKind::NotFound}));
    outputs.emplace(cmd::Command::ListPartitionLayout, std::unexpected(cmd::CommandError{.kind = cmd::ErrorKind::NotFound}));
    outputs.emplace(cmd::Command::ReportPhysicalVolumes, "  /dev/sda1|vg_data|lvm2|53687091200|0\n  /dev/sda2|vg_data|lvm2|53687091200|21474836480\n"s);
    outputs.emplace(cmd::Command::ReportVolumeGroups, "  vg_data|lvm2|wz--n-|4194304|107374182400|21474836480|2|1\n"s);
    outputs.emplace(cmd::Command::ReportLogicalVolumes, "  vg_data|lv_home|-wi-ao----|85899345920|/dev/vg_data/lv_home\n"s);
    outputs.emplace(cmd::Command::ReportSegments,
        "  vg_data|lv_home|linear|0|12800|/dev/sda1(0)\n"
        "  vg_data|lv_home|striped|12800|7680|/dev/sda1(12800),/dev/sda2(0)\n"s);
    outputs.emplace(cmd::Command::FilesystemUsage, "Filesystem 1B-blocks Used Avail Mounted on\n/dev/mapper/vg_data-lv_home 84402851840 21474836480 58590420992 /home\n"s);
    return outputs;
}

void check_bounds(const RecordingSurface& surface) {
    for (auto&& put : surface.puts()) {
        REQUIRE(put.row >= 0);
        REQUIRE(put.row < surface.height());
        REQUIRE(put.col >= 0);
        REQUIRE(put.col + static_cast<int>(lvmview::utils::utf8_width(put.text)) <= surface.width());
    }
}

}  // namespace

TEST_CASE("panel renderer test")
{
    auto callback_sink = std::make_shared<spdlog::sinks::callback_sink_mt>([](const spdlog::details::log_msg&) {
        // noop
    });
    auto logger        = std::make_shared<spdlog::logger>("default", callback_sink);
    spdlog::set_default_logger(logger);
    lvmview::logger::set_logger(logger);

    const lvmview::ui::UiState state{};

    SECTION("terminal too small")
    {
        RecordingSurface surface{40, 5};
        REQUIRE_EQ(lvmview::ui::render_frame(nullptr, state, surface), 0);
        REQUIRE_EQ(surface.puts().size(), 1);
        REQUIRE_EQ(surface.puts()[0].row, 0);
        REQUIRE_EQ(surface.puts()[0].col, 0);
        REQUIRE_EQ(surface.puts()[0].text, std::string{lvmview::ui::TOO_SMALL_MESSAGE.substr(0, 40)});

        RecordingSurface wide_but_short{200, 9};
        lvmview::ui::render_frame(nullptr, state, wide_but_short);
        REQUIRE_EQ(wide_but_short.puts().size(), 1);
        REQUIRE_EQ(wide_but_short.puts()[0].text, std::string{lvmview::ui::TOO_SMALL_MESSAGE});
    }
    SECTION("empty terminal")
    {
        RecordingSurface surface{0, 0};
        REQUIRE_EQ(lvmview::ui::render_frame(nullptr, state, surface), 0);
        REQUIRE(surface.puts().empty());
    }
    SECTION("before the first snapshot")
    {
        RecordingSurface surface{100, 30};
        REQUIRE_EQ(lvmview::ui::render_frame(nullptr, state, surface), 0);
        check_bounds(surface);
        REQUIRE(surface.find(lvmview::ui::SCANNING_MESSAGE) != nullptr);
        REQUIRE(surface.find("Volume Groups"sv) != nullptr);
        REQUIRE(surface.find("Physical Volumes"sv) != nullptr);
        REQUIRE(surface.find("Block Devices"sv) != nullptr);
    }
    SECTION("full frame")
    {
        const auto snapshot = lvmview::inventory::build_snapshot(make_outputs());

        for (const auto [width, height] : {std::pair{80, 10}, std::pair{100, 30}, std::pair{160, 50}}) {
            RecordingSurface surface{width, height};
            REQUIRE_EQ(lvmview::ui::render_frame(&snapshot, state, surface), 0);
            check_bounds(surface);
        }

        RecordingSurface surface{160, 50};
        lvmview::ui::render_frame(&snapshot, state, surface);

        // VG list cursor on the focused panel
        const auto* vg_row = surface.find(" vg_data"sv);
        REQUIRE(vg_row != nullptr);
        REQUIRE(vg_row->style.inverted);

        REQUIRE(surface.find("[ Discovered LVols.. ]"sv) != nullptr);
        REQUIRE(surface.find("Mounted: /home"sv) != nullptr);
        REQUIRE(surface.find("LE Start"sv) != nullptr);
        REQUIRE(surface.find("/dev/sda2"sv) != nullptr);
        REQUIRE(surface.find("VBOX HDD"sv) != nullptr);
        REQUIRE(surface.find("updated "sv) != nullptr);
        REQUIRE(surface.find("not root"sv) == nullptr);
    }
    SECTION("unavailable source is shown in the panel title")
    {
        auto outputs = make_outputs();
        outputs.insert_or_assign(cmd::Command::ReportPhysicalVolumes, std::unexpected(cmd::CommandError{.kind = cmd::ErrorKind::PermissionDenied}));
        outputs.insert_or_assign(cmd::Command::ReportVolumeGroups, std::unexpected(cmd::CommandError{.kind = cmd::ErrorKind::ExecutionFailed, .reason = "timed out"}));
        const auto snapshot = lvmview::inventory::build_snapshot(outputs);

        RecordingSurface surface{120, 30};
        REQUIRE_EQ(lvmview::ui::render_frame(&snapshot, state, surface), 0);
        check_bounds(surface);
        REQUIRE(surface.find("[pvs: permission denied]"sv) != nullptr);
        REQUIRE(surface.find("[vgs unavailable: timed out]"sv) != nullptr);
    }
    SECTION("failed lv sources are never shown as empty data")
    {
        const cmd::CommandError timed_out{.kind = cmd::ErrorKind::ExecutionFailed, .reason = "timed out"};

        auto outputs = make_outputs();
        outputs.insert_or_assign(cmd::Command::ReportSegments, std::unexpected(timed_out));
        outputs.insert_or_assign(cmd::Command::FilesystemUsage, std::unexpected(timed_out));
        const auto snapshot = lvmview::inventory::build_snapshot(outputs);

        RecordingSurface surface{160, 50};
        REQUIRE_EQ(lvmview::ui::render_frame(&snapshot, state, surface), 0);
        check_bounds(surface);
        REQUIRE(surface.find("[lvs --segments unavailable: timed out]"sv) != nullptr);
        REQUIRE(surface.find("segments unavailable: timed out"sv) != nullptr);
        REQUIRE(surface.find("no segments reported"sv) == nullptr);
        REQUIRE(surface.find("Used: N/A  Available: N/A  [df unavailable: timed out]"sv) != nullptr);
        // lsblk still knows the mount point
        REQUIRE(surface.find("Mounted: /home"sv) != nullptr);

        outputs.insert_or_assign(cmd::Command::ReportLogicalVolumes, std::unexpected(timed_out));
        const auto without_lvs = lvmview::inventory::build_snapshot(outputs);

        RecordingSurface lvs_surface{160, 50};
        REQUIRE_EQ(lvmview::ui::render_frame(&without_lvs, state, lvs_surface), 0);
        check_bounds(lvs_surface);
        REQUIRE(lvs_surface.find("[vgs"sv) == nullptr);
        REQUIRE(lvs_surface.find("[lvs unavailable: timed out; lvs --segments"sv) != nullptr);
        REQUIRE(lvs_surface.find("LVs: unavailable: timed out"sv) != nullptr);
        REQUIRE(lvs_surface.find("LVs: none"sv) == nullptr);
    }
    SECTION("failed list sources replace the empty list text")
    {
        auto outputs = make_outputs();
        outputs.insert_or_assign(cmd::Command::ReportVolumeGroups, std::unexpected(cmd::CommandError{.kind = cmd::ErrorKind::PermissionDenied}));
        const auto snapshot = lvmview::inventory::build_snapshot(outputs);

        RecordingSurface surface{160, 50};
        REQUIRE_EQ(lvmview::ui::render_frame(&snapshot, state, surface), 0);
        REQUIRE(surface.find("No volume groups found"sv) == nullptr);
        REQUIRE(surface.find("vgs: permission denied"sv) != nullptr);

        // partition tools feed the block device panel
        REQUIRE(surface.find("[fdisk unavailable: command not found; parted unavailable: command not found"sv) != nullptr);
    }
    SECTION("missing identity fields read unknown")
    {
        auto outputs = make_outputs();
        outputs.insert_or_assign(cmd::Command::ReportPhysicalVolumes, "  /dev/sda1|vg_data|lvm2|53687091200|0\n  /dev/sda2||lvm2|53687091200|53687091200\n"s);
        const auto snapshot = lvmview::inventory::build_snapshot(outputs);

        RecordingSurface surface{160, 50};
        REQUIRE_EQ(lvmview::ui::render_frame(&snapshot, state, surface), 0);
        // the PV row, not the block device or segment rows of the same device
        const auto orphan = std::ranges::find_if(surface.puts(), [](auto&& put) {
            return put.text.starts_with("/dev/sda2") && put.text.find("LVM2_member") == std::string::npos;
        });
        REQUIRE(orphan != surface.puts().end());
        REQUIRE(orphan->text.find("Unknown") != std::string::npos);
        REQUIRE(orphan->text.find("---") == std::string::npos);
    }
    SECTION("not root notice")
    {
        const auto snapshot = lvmview::inventory::build_snapshot(make_outputs());

        RecordingSurface surface{160, 30};
        lvmview::ui::render_frame(&snapshot, state, surface, {.is_root = false});
        REQUIRE(surface.find("not root: data may be incomplete"sv) != nullptr);
    }
}
