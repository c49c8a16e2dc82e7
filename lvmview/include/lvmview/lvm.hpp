#ifndef LVM_HPP
#define LVM_HPP

#include "lvmview/parse_result.hpp"

#include <array>        // for array
#include <cstdint>      // for uint64_t, uint32_t
#include <optional>     // for optional
#include <string>       // for string
#include <string_view>  // for string_view
#include <vector>       // for vector

namespace lvmview::lvm {

using namespace std::string_view_literals;

// Field separator requested from the LVM reporting tools.
// Must not be ',' since the `devices` field is itself comma separated.
inline constexpr char REPORT_SEPARATOR = '|';

// Exact column layout of each report. The same arrays build the `-o` argument
// of the reporting command, so parser and command cannot drift apart.
inline constexpr std::array PV_REPORT_FIELDS{"pv_name"sv, "vg_name"sv, "pv_fmt"sv, "pv_size"sv, "pv_free"sv};
inline constexpr std::array VG_REPORT_FIELDS{"vg_name"sv, "vg_fmt"sv, "vg_attr"sv, "vg_extent_size"sv, "vg_size"sv, "vg_free"sv, "pv_count"sv, "lv_count"sv};
inline constexpr std::array LV_REPORT_FIELDS{"vg_name"sv, "lv_name"sv, "lv_attr"sv, "lv_size"sv, "lv_path"sv};
inline constexpr std::array SEGMENT_REPORT_FIELDS{"vg_name"sv, "lv_name"sv, "segtype"sv, "seg_start_pe"sv, "seg_size_pe"sv, "devices"sv};

struct PhysicalVolume {
    /// Device path as reported (e.g. /dev/sda1).
    std::string device;
    /// Owning volume group, empty optional for orphan PVs.
    std::optional<std::string> vg_name;
    /// Metadata format (e.g. lvm2).
    std::string format;
    std::optional<std::uint64_t> size;
    std::optional<std::uint64_t> free;
};

struct VolumeGroup {
    std::string name;
    std::string format;
    std::string attributes;
    std::optional<std::uint64_t> extent_size;
    std::optional<std::uint64_t> size;
    std::optional<std::uint64_t> free;
    std::optional<std::uint32_t> pv_count;
    std::optional<std::uint32_t> lv_count;
};

struct LogicalVolume {
    std::string vg_name;
    std::string name;
    std::string attributes;
    std::optional<std::uint64_t> size;
    /// Device path (e.g. /dev/vg_data/lv_home), empty for hidden LVs.
    std::string path;
};

/// One target of a segment: a PV (or sub-LV) and the first physical extent used on it.
struct PeMapping {
    std::string pv;
    std::uint64_t pe_start{};
};

/// One contiguous run of logical extents of a logical volume.
struct ExtentSegment {
    std::uint64_t le_start{};
    std::uint64_t le_end{};
    std::uint64_t pe_count{};
    /// Size of the run in bytes, known once the volume group extent size is.
    std::optional<std::uint64_t> pe_size;
    /// LVM segment type (linear, striped, raid1, ...).
    std::string type;
    std::vector<PeMapping> mappings;
};

struct SegmentRecord {
    std::string vg_name;
    std::string lv_name;
    ExtentSegment segment;
};

/// @brief Parses `devices` field like "/dev/sda1(0),/dev/sdb1(128)".
/// @return The mappings, std::nullopt when any entry is malformed.
auto parse_pe_mappings(std::string_view devices) noexcept -> std::optional<std::vector<PeMapping>>;

/// @brief Parses `pvs` output laid out as PV_REPORT_FIELDS.
auto parse_pvs(std::string_view output) noexcept -> ParseResult<PhysicalVolume>;

/// @brief Parses `vgs` output laid out as VG_REPORT_FIELDS.
auto parse_vgs(std::string_view output) noexcept -> ParseResult<VolumeGroup>;

/// @brief Parses `lvs` output laid out as LV_REPORT_FIELDS.
auto parse_lvs(std::string_view output) noexcept -> ParseResult<LogicalVolume>;

/// @brief Parses `lvs --segments` output laid out as SEGMENT_REPORT_FIELDS.
auto parse_segments(std::string_view output) noexcept -> ParseResult<SegmentRecord>;

}  // namespace lvmview::lvm

#endif  // LVM_HPP
