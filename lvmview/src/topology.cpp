#include "lvmview/topology.hpp"
#include "lvmview/identifiers.hpp"

#include <algorithm>      // for stable_sort, find_if
#include <limits>         // for numeric_limits
#include <unordered_map>  // for unordered_map
#include <unordered_set>  // for unordered_set
#include <utility>        // for move

#include <spdlog/spdlog.h>

namespace {

namespace lvm   = lvmview::lvm;
namespace ident = lvmview::ident;
using namespace lvmview::topology;

using index_map_t = std::unordered_map<std::string, std::size_t>;

auto checked_multiply(std::optional<std::uint64_t> lhs, std::uint64_t rhs) noexcept -> std::optional<std::uint64_t> {
    if (!lhs) {
        return std::nullopt;
    }
    if (*lhs != 0 && rhs > std::numeric_limits<std::uint64_t>::max() / *lhs) {
        return std::nullopt;
    }
    return *lhs * rhs;
}

// Segment targets are PV paths or, for raid/mirror types, sub-LV names
auto normalize_mapping_target(std::string_view target) noexcept -> std::string {
    if (target.starts_with('/')) {
        return ident::normalize_device_path(target);
    }
    return std::string{target};
}

/// Orders the segments of one LV by LE start and drops the ones overlapping
/// an earlier segment. Returns the number of dropped segments.
auto order_segments(std::vector<lvm::ExtentSegment>& segments, std::string_view lv_id) noexcept -> std::size_t {
    std::ranges::stable_sort(segments, {}, &lvm::ExtentSegment::le_start);

    std::vector<lvm::ExtentSegment> kept{};
    kept.reserve(segments.size());
    for (auto&& segment : segments) {
        if (!kept.empty() && segment.le_start <= kept.back().le_end) {
            spdlog::warn("[topology] {}: segment LE {}-{} overlaps LE {}-{}, dropped", lv_id, segment.le_start, segment.le_end, kept.back().le_start, kept.back().le_end);
            continue;
        }
        kept.emplace_back(std::move(segment));
    }
    const auto dropped = segments.size() - kept.size();
    segments           = std::move(kept);
    return dropped;
}

auto is_contiguous(const std::vector<lvm::ExtentSegment>& segments) noexcept -> bool {
    std::uint64_t next_le{0};
    for (auto&& segment : segments) {
        if (segment.le_start != next_le) {
            return false;
        }
        next_le = segment.le_end + 1;
    }
    return true;
}

class TopologyBuilder final {
 public:
    explicit TopologyBuilder(const std::vector<lvmview::disk::BlockDevice>& block_devices) noexcept {
        m_topology.block_devices = block_devices;
        for (std::size_t i = 0; i < m_topology.block_devices.size(); ++i) {
            auto& device = m_topology.block_devices[i];
            device.name  = ident::normalize_device_path(device.name);
            if (device.pkname) {
                device.pkname = ident::normalize_device_path(*device.pkname);
            }
            m_devices.try_emplace(device.name, i);
            if (device.type == "lvm") {
                if (auto lv_id = ident::lv_id_from_device_path(device.name)) {
                    m_lv_devices.try_emplace(std::move(*lv_id), i);
                }
            }
        }
    }

    void add_volume_groups(const std::vector<lvm::VolumeGroup>& vgs) noexcept {
        for (auto&& vg : vgs) {
            if (!m_vgs.try_emplace(vg.name, m_topology.vgs.size()).second) {
                spdlog::warn("[topology] duplicate VG '{}' ignored", vg.name);
                continue;
            }
            m_topology.vgs.emplace_back(VgNode{.record = vg});
        }
    }

    void add_physical_volumes(const std::vector<lvm::PhysicalVolume>& pvs) noexcept {
        for (auto&& pv : pvs) {
            auto id = ident::normalize_device_path(pv.device);
            if (!m_pvs.try_emplace(id, m_topology.pvs.size()).second) {
                spdlog::warn("[topology] duplicate PV '{}' ignored", id);
                continue;
            }

            PvNode node{.record = pv, .id = id};
            node.record.device = std::move(id);
            if (auto it = m_devices.find(node.id); it != m_devices.end()) {
                node.block_device = it->second;
            }

            const auto pv_index = m_topology.pvs.size();
            if (node.record.vg_name) {
                if (auto it = m_vgs.find(*node.record.vg_name); it != m_vgs.end()) {
                    m_topology.vgs[it->second].pvs.push_back(pv_index);
                } else {
                    spdlog::warn("[topology] PV '{}' names unknown VG '{}'", node.id, *node.record.vg_name);
                    node.resolved = false;
                    m_topology.vgs[unknown_vg()].pvs.push_back(pv_index);
                }
            }
            m_topology.pvs.emplace_back(std::move(node));
        }
    }

    void add_logical_volumes(const std::vector<lvm::LogicalVolume>& lvs) noexcept {
        for (auto&& lv : lvs) {
            auto id = ident::lv_id(lv.vg_name, lv.name);
            if (!m_lvs.try_emplace(id, m_topology.lvs.size()).second) {
                spdlog::warn("[topology] duplicate LV '{}' ignored", id);
                continue;
            }

            LvNode node{.record = lv, .id = std::move(id)};
            if (auto it = m_lv_devices.find(node.id); it != m_lv_devices.end()) {
                node.block_device = it->second;
            }

            const auto lv_index = m_topology.lvs.size();
            if (auto it = m_vgs.find(lv.vg_name); it != m_vgs.end()) {
                m_topology.vgs[it->second].lvs.push_back(lv_index);
            } else {
                spdlog::warn("[topology] LV '{}' names unknown VG '{}'", node.id, lv.vg_name);
                node.resolved = false;
                m_topology.vgs[unknown_vg()].lvs.push_back(lv_index);
            }
            m_topology.lvs.emplace_back(std::move(node));
        }
    }

    void add_segments(const std::vector<lvm::SegmentRecord>& segments) noexcept {
        auto& stats = m_topology.stats;
        for (auto&& record : segments) {
            const auto lv_id = ident::lv_id(record.vg_name, record.lv_name);
            auto it          = m_lvs.find(lv_id);
            if (it == m_lvs.end()) {
                spdlog::debug("[topology] segment of unknown LV '{}'", lv_id);
                ++stats.orphan_segments;
                continue;
            }
            if (record.segment.pe_count == 0) {
                spdlog::debug("[topology] {}: zero sized segment at LE {}", lv_id, record.segment.le_start);
                ++stats.malformed_segments;
                continue;
            }

            auto segment = record.segment;
            for (auto& mapping : segment.mappings) {
                mapping.pv = normalize_mapping_target(mapping.pv);
            }
            m_topology.lvs[it->second].segments.emplace_back(std::move(segment));
        }

        std::vector<std::unordered_set<std::size_t>> lvs_per_pv(m_topology.pvs.size());
        for (std::size_t lv_index = 0; lv_index < m_topology.lvs.size(); ++lv_index) {
            auto& lv = m_topology.lvs[lv_index];
            stats.overlapping_segments += order_segments(lv.segments, lv.id);
            lv.contiguous = is_contiguous(lv.segments);

            std::optional<std::uint64_t> extent_size{};
            if (auto vg_it = m_vgs.find(lv.record.vg_name); vg_it != m_vgs.end()) {
                extent_size = m_topology.vgs[vg_it->second].record.extent_size;
            }
            for (auto& segment : lv.segments) {
                segment.pe_size = checked_multiply(extent_size, segment.pe_count);
                for (auto&& mapping : segment.mappings) {
                    if (auto pv_it = m_pvs.find(mapping.pv); pv_it != m_pvs.end()) {
                        lvs_per_pv[pv_it->second].insert(lv_index);
                    }
                }
            }
        }
        for (std::size_t pv_index = 0; pv_index < m_topology.pvs.size(); ++pv_index) {
            m_topology.pvs[pv_index].lv_count = lvs_per_pv[pv_index].size();
        }
    }

    void add_filesystem_usage(const std::vector<lvmview::fs::FsUsage>& fs_usage) noexcept {
        for (auto&& usage : fs_usage) {
            if (!usage.source.starts_with('/')) {
                continue;
            }
            const auto lv_id = ident::lv_id_from_device_path(usage.source);
            if (!lv_id) {
                continue;
            }
            if (auto it = m_lvs.find(*lv_id); it != m_lvs.end()) {
                auto& lv      = m_topology.lvs[it->second];
                lv.mountpoint = usage.target;
                lv.fs_size    = usage.size;
                lv.fs_used    = usage.used;
                lv.fs_avail   = usage.avail;
            }
        }

        // lsblk knows mount points of filesystems df could not stat
        for (auto& lv : m_topology.lvs) {
            if (lv.mountpoint || !lv.block_device) {
                continue;
            }
            const auto& device = m_topology.block_devices[*lv.block_device];
            if (device.mountpoint && !device.mountpoint->empty()) {
                lv.mountpoint = device.mountpoint;
            }
        }
    }

    auto finish() noexcept -> lvmview::topology::Topology {
        for (auto& vg : m_topology.vgs) {
            if (!vg.synthetic && vg.record.pv_count && *vg.record.pv_count != vg.pvs.size()) {
                spdlog::warn("[topology] VG '{}' reports {} PVs, {} found", vg.record.name, *vg.record.pv_count, vg.pvs.size());
                vg.membership_mismatch = true;
            }
        }
        return std::move(m_topology);
    }

 private:
    auto unknown_vg() noexcept -> std::size_t {
        if (!m_unknown_vg) {
            m_unknown_vg = m_topology.vgs.size();
            m_topology.vgs.emplace_back(VgNode{
                .record    = lvm::VolumeGroup{.name = std::string{UNKNOWN_VG_NAME}},
                .synthetic = true,
            });
        }
        return *m_unknown_vg;
    }

    lvmview::topology::Topology m_topology{};
    index_map_t m_devices{};
    index_map_t m_lv_devices{};
    index_map_t m_vgs{};
    index_map_t m_pvs{};
    index_map_t m_lvs{};
    std::optional<std::size_t> m_unknown_vg{};
};

}  // namespace

namespace lvmview::topology {

auto build(const std::vector<disk::BlockDevice>& block_devices,
    const std::vector<lvm::PhysicalVolume>& pvs,
    const std::vector<lvm::VolumeGroup>& vgs,
    const std::vector<lvm::LogicalVolume>& lvs,
    const std::vector<lvm::SegmentRecord>& segments,
    const std::vector<fs::FsUsage>& fs_usage) noexcept -> Topology {
    TopologyBuilder builder{block_devices};
    builder.add_volume_groups(vgs);
    builder.add_physical_volumes(pvs);
    builder.add_logical_volumes(lvs);
    builder.add_segments(segments);
    builder.add_filesystem_usage(fs_usage);
    return builder.finish();
}

auto find_vg(const Topology& topology, std::string_view name) noexcept -> const VgNode* {
    auto it = std::ranges::find_if(topology.vgs, [name](auto&& vg) { return vg.record.name == name; });
    return (it != topology.vgs.end()) ? &*it : nullptr;
}

auto find_pv(const Topology& topology, std::string_view device) noexcept -> const PvNode* {
    const auto id = ident::normalize_device_path(device);
    auto it       = std::ranges::find_if(topology.pvs, [&id](auto&& pv) { return pv.id == id; });
    return (it != topology.pvs.end()) ? &*it : nullptr;
}

auto find_lv(const Topology& topology, std::string_view id) noexcept -> const LvNode* {
    auto it = std::ranges::find_if(topology.lvs, [id](auto&& lv) { return lv.id == id; });
    return (it != topology.lvs.end()) ? &*it : nullptr;
}

auto find_block_device(const Topology& topology, const std::optional<std::size_t>& index) noexcept -> const disk::BlockDevice* {
    if (!index || *index >= topology.block_devices.size()) {
        return nullptr;
    }
    return &topology.block_devices[*index];
}

}  // namespace lvmview::topology
