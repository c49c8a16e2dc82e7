#include "lvmview/inventory.hpp"
#include "lvmview/block_devices.hpp"
#include "lvmview/fs_usage.hpp"
#include "lvmview/lvm.hpp"
#include "lvmview/partition_tools.hpp"

#include <utility>  // for move
#include <vector>   // for vector

#include <spdlog/spdlog.h>

using namespace std::string_literals;

namespace {

namespace cmd = lvmview::cmd;
using lvmview::inventory::RawOutputs;
using lvmview::inventory::SourceReport;

/// Output of a command, nullptr (with the failure recorded) if there is none.
auto take_output(const RawOutputs& outputs, cmd::Command command, SourceReport& report) noexcept -> const std::string* {
    auto it = outputs.find(command);
    if (it == outputs.end()) {
        report.error = cmd::CommandError{.kind = cmd::ErrorKind::ExecutionFailed, .reason = "not run"s};
        return nullptr;
    }
    if (!it->second) {
        spdlog::warn("[inventory] {} unavailable: {}", cmd::command_name(command), cmd::describe_error(it->second.error()));
        report.error = it->second.error();
        return nullptr;
    }
    return &*it->second;
}

/// Parses one report, keeping the records and recording the skipped count.
template <typename T, typename Parser>
auto parse_source(const RawOutputs& outputs, cmd::Command command, std::map<cmd::Command, SourceReport>& sources, Parser&& parser) noexcept -> std::vector<T> {
    auto& report       = sources[command];
    const auto* output = take_output(outputs, command, report);
    if (output == nullptr) {
        return {};
    }
    auto result    = parser(*output);
    report.skipped = result.skipped;
    if (result.skipped > 0) {
        spdlog::info("[inventory] {}: {} records skipped", cmd::command_name(command), result.skipped);
    }
    return std::move(result.records);
}

}  // namespace

namespace lvmview::inventory {

auto Snapshot::source_error(cmd::Command command) const noexcept -> const cmd::CommandError* {
    auto it = sources.find(command);
    if (it == sources.end() || !it->second.error) {
        return nullptr;
    }
    return &*it->second.error;
}

auto Snapshot::total_skipped() const noexcept -> std::size_t {
    std::size_t total = topology.stats.malformed_segments + topology.stats.overlapping_segments + topology.stats.orphan_segments;
    for (auto&& [command, report] : sources) {
        total += report.skipped;
    }
    return total;
}

auto collect(const cmd::CommandGateway& gateway) noexcept -> RawOutputs {
    return gateway.execute_all({cmd::ALL_COMMANDS.begin(), cmd::ALL_COMMANDS.end()});
}

auto build_snapshot(const RawOutputs& outputs) noexcept -> Snapshot {
    Snapshot snapshot{.taken_at = std::chrono::system_clock::now()};
    auto& sources = snapshot.sources;

    std::vector<disk::BlockDevice> block_devices{};
    {
        auto& report = sources[cmd::Command::ListBlockDevices];
        if (const auto* output = take_output(outputs, cmd::Command::ListBlockDevices, report)) {
            auto parsed = disk::parse_lsblk_json(*output);
            if (parsed) {
                report.skipped = parsed->skipped;
                block_devices  = std::move(parsed->records);
            } else {
                spdlog::error("[inventory] {}", parsed.error());
                report.error = cmd::CommandError{.kind = cmd::ErrorKind::ExecutionFailed, .reason = std::move(parsed.error())};
            }
        }
    }

    const auto parted_disks = parse_source<disk::PartedDisk>(outputs, cmd::Command::ListPartitionLayout, sources, disk::parse_parted_machine);
    const auto fdisk_disks  = parse_source<disk::FdiskDisk>(outputs, cmd::Command::ListPartitionTable, sources, disk::parse_fdisk_listing);
    disk::annotate_block_devices(block_devices, parted_disks, fdisk_disks);

    const auto pvs      = parse_source<lvm::PhysicalVolume>(outputs, cmd::Command::ReportPhysicalVolumes, sources, lvm::parse_pvs);
    const auto vgs      = parse_source<lvm::VolumeGroup>(outputs, cmd::Command::ReportVolumeGroups, sources, lvm::parse_vgs);
    const auto lvs      = parse_source<lvm::LogicalVolume>(outputs, cmd::Command::ReportLogicalVolumes, sources, lvm::parse_lvs);
    const auto segments = parse_source<lvm::SegmentRecord>(outputs, cmd::Command::ReportSegments, sources, lvm::parse_segments);
    const auto fs_usage = parse_source<fs::FsUsage>(outputs, cmd::Command::FilesystemUsage, sources, fs::parse_df_output);

    snapshot.topology = topology::build(block_devices, pvs, vgs, lvs, segments, fs_usage);
    return snapshot;
}

auto SnapshotStore::load() const noexcept -> std::shared_ptr<const Snapshot> {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_current;
}

void SnapshotStore::publish(Snapshot&& snapshot) noexcept {
    auto next = std::make_shared<const Snapshot>(std::move(snapshot));
    std::lock_guard<std::mutex> lock(m_mutex);
    m_current = std::move(next);
}

}  // namespace lvmview::inventory
