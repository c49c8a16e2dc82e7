#ifndef TOPOLOGY_HPP
#define TOPOLOGY_HPP

#include "lvmview/block_devices.hpp"
#include "lvmview/fs_usage.hpp"
#include "lvmview/lvm.hpp"

#include <cstddef>      // for size_t
#include <cstdint>      // for uint64_t
#include <optional>     // for optional
#include <string>       // for string
#include <string_view>  // for string_view
#include <vector>       // for vector

namespace lvmview::topology {

using namespace std::string_view_literals;

/// Name of the group collecting LVs and PVs whose VG is not reported.
inline constexpr auto UNKNOWN_VG_NAME = "Unknown VG"sv;

struct PvNode {
    lvm::PhysicalVolume record;
    /// Normalized device path.
    std::string id;
    /// Index into Topology::block_devices.
    std::optional<std::size_t> block_device;
    /// Number of distinct LVs with extents on this PV.
    std::size_t lv_count{};
    /// False when the named VG is not reported.
    bool resolved{true};
};

struct VgNode {
    lvm::VolumeGroup record;
    /// Indices into Topology::pvs, in report order.
    std::vector<std::size_t> pvs{};
    /// Indices into Topology::lvs, in report order.
    std::vector<std::size_t> lvs{};
    bool synthetic{};
    /// Reported PV count differs from the PVs naming this VG.
    bool membership_mismatch{};
};

struct LvNode {
    lvm::LogicalVolume record;
    /// "<vg>/<lv>"
    std::string id;
    /// Segments in LE order, never overlapping.
    std::vector<lvm::ExtentSegment> segments{};
    /// Index into Topology::block_devices.
    std::optional<std::size_t> block_device;
    std::optional<std::string> mountpoint;
    std::optional<std::uint64_t> fs_size;
    std::optional<std::uint64_t> fs_used;
    std::optional<std::uint64_t> fs_avail;
    /// False when the named VG is not reported.
    bool resolved{true};
    /// Segments cover LE 0..N without gaps.
    bool contiguous{true};
};

struct BuildStats {
    /// Segments with a zero extent count.
    std::size_t malformed_segments{};
    /// Segments overlapping a previous one of the same LV.
    std::size_t overlapping_segments{};
    /// Segments of LVs that are not reported.
    std::size_t orphan_segments{};
};

/// Immutable join of all inventory records.
struct Topology {
    std::vector<disk::BlockDevice> block_devices{};
    std::vector<PvNode> pvs{};
    std::vector<VgNode> vgs{};
    std::vector<LvNode> lvs{};
    BuildStats stats{};
};

/// @brief Cross-references parsed records into one topology.
///
/// PVs or LVs naming a VG that is not reported are kept, marked unresolved
/// and listed under a synthetic UNKNOWN_VG_NAME group. Segments with a zero
/// extent count, overlapping segments and segments of unknown LVs are
/// dropped and counted in Topology::stats.
/// VG and PV free sizes are taken from their own records only.
auto build(const std::vector<disk::BlockDevice>& block_devices,
    const std::vector<lvm::PhysicalVolume>& pvs,
    const std::vector<lvm::VolumeGroup>& vgs,
    const std::vector<lvm::LogicalVolume>& lvs,
    const std::vector<lvm::SegmentRecord>& segments,
    const std::vector<fs::FsUsage>& fs_usage = {}) noexcept -> Topology;

auto find_vg(const Topology& topology, std::string_view name) noexcept -> const VgNode*;
auto find_pv(const Topology& topology, std::string_view device) noexcept -> const PvNode*;
auto find_lv(const Topology& topology, std::string_view id) noexcept -> const LvNode*;

/// @brief Block device backing a PV or LV, nullptr if lsblk did not list it.
auto find_block_device(const Topology& topology, const std::optional<std::size_t>& index) noexcept -> const disk::BlockDevice*;

}  // namespace lvmview::topology

#endif  // TOPOLOGY_HPP
