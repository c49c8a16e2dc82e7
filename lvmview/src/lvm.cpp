#include "lvmview/lvm.hpp"
#include "lvmview/string_utils.hpp"
#include "lvmview/units.hpp"

#include <algorithm>  // for transform
#include <utility>    // for move

#include <spdlog/spdlog.h>

namespace {

using lvmview::ParseResult;
using row_t = std::vector<std::string_view>;

/// Splits report output into rows of trimmed fields. Rows whose field count
/// differs from the schema are counted and dropped.
auto split_report(std::string_view output, std::size_t field_count, std::string_view report_name, std::size_t& skipped) noexcept -> std::vector<row_t> {
    namespace utils = lvmview::utils;

    std::vector<row_t> rows{};
    for (auto&& raw_line : utils::make_split_view(output)) {
        const auto line = utils::trim(raw_line);
        if (line.empty()) {
            continue;
        }
        auto fields = utils::split_fields(line, lvmview::lvm::REPORT_SEPARATOR);
        if (fields.size() != field_count) {
            spdlog::debug("[{}] skipping line with {} fields (expected {}): '{}'", report_name, fields.size(), field_count, line);
            ++skipped;
            continue;
        }
        std::ranges::transform(fields, fields.begin(), [](std::string_view field) { return utils::trim(field); });
        rows.emplace_back(std::move(fields));
    }
    return rows;
}

auto optional_string(std::string_view field) noexcept -> std::optional<std::string> {
    if (field.empty()) {
        return std::nullopt;
    }
    return std::string{field};
}

}  // namespace

namespace lvmview::lvm {

auto parse_pe_mappings(std::string_view devices) noexcept -> std::optional<std::vector<PeMapping>> {
    std::vector<PeMapping> mappings{};
    for (auto&& raw_entry : utils::make_split_view(devices, ',')) {
        const auto entry = utils::trim(raw_entry);
        if (entry.empty()) {
            continue;
        }

        // e.g format: <device>(<first pe>)
        const auto open_pos  = entry.rfind('(');
        const auto close_pos = entry.rfind(')');
        if (open_pos == std::string_view::npos || open_pos == 0 || close_pos != entry.size() - 1 || close_pos < open_pos) {
            return std::nullopt;
        }
        const auto pe_start = utils::parse_uint<std::uint64_t>(entry.substr(open_pos + 1, close_pos - open_pos - 1));
        if (!pe_start) {
            return std::nullopt;
        }
        mappings.emplace_back(PeMapping{.pv = std::string{entry.substr(0, open_pos)}, .pe_start = *pe_start});
    }
    return mappings;
}

auto parse_pvs(std::string_view output) noexcept -> ParseResult<PhysicalVolume> {
    ParseResult<PhysicalVolume> result{};
    for (auto&& row : split_report(output, PV_REPORT_FIELDS.size(), "pvs", result.skipped)) {
        // pv_name,vg_name,pv_fmt,pv_size,pv_free
        if (row[0].empty()) {
            ++result.skipped;
            continue;
        }
        result.records.emplace_back(PhysicalVolume{
            .device  = std::string{row[0]},
            .vg_name = optional_string(row[1]),
            .format  = std::string{row[2]},
            .size    = units::parse_size(row[3]),
            .free    = units::parse_size(row[4]),
        });
    }
    return result;
}

auto parse_vgs(std::string_view output) noexcept -> ParseResult<VolumeGroup> {
    ParseResult<VolumeGroup> result{};
    for (auto&& row : split_report(output, VG_REPORT_FIELDS.size(), "vgs", result.skipped)) {
        // vg_name,vg_fmt,vg_attr,vg_extent_size,vg_size,vg_free,pv_count,lv_count
        if (row[0].empty()) {
            ++result.skipped;
            continue;
        }
        result.records.emplace_back(VolumeGroup{
            .name        = std::string{row[0]},
            .format      = std::string{row[1]},
            .attributes  = std::string{row[2]},
            .extent_size = units::parse_size(row[3]),
            .size        = units::parse_size(row[4]),
            .free        = units::parse_size(row[5]),
            .pv_count    = utils::parse_uint<std::uint32_t>(row[6]),
            .lv_count    = utils::parse_uint<std::uint32_t>(row[7]),
        });
    }
    return result;
}

auto parse_lvs(std::string_view output) noexcept -> ParseResult<LogicalVolume> {
    ParseResult<LogicalVolume> result{};
    for (auto&& row : split_report(output, LV_REPORT_FIELDS.size(), "lvs", result.skipped)) {
        // vg_name,lv_name,lv_attr,lv_size,lv_path
        if (row[0].empty() || row[1].empty()) {
            ++result.skipped;
            continue;
        }
        result.records.emplace_back(LogicalVolume{
            .vg_name    = std::string{row[0]},
            .name       = std::string{row[1]},
            .attributes = std::string{row[2]},
            .size       = units::parse_size(row[3]),
            .path       = std::string{row[4]},
        });
    }
    return result;
}

auto parse_segments(std::string_view output) noexcept -> ParseResult<SegmentRecord> {
    ParseResult<SegmentRecord> result{};
    for (auto&& row : split_report(output, SEGMENT_REPORT_FIELDS.size(), "segments", result.skipped)) {
        // vg_name,lv_name,segtype,seg_start_pe,seg_size_pe,devices
        const auto le_start = utils::parse_uint<std::uint64_t>(row[3]);
        const auto pe_count = utils::parse_uint<std::uint64_t>(row[4]);
        auto mappings       = parse_pe_mappings(row[5]);
        if (row[0].empty() || row[1].empty() || !le_start || !pe_count || !mappings) {
            spdlog::debug("[segments] skipping malformed segment of '{}/{}'", row[0], row[1]);
            ++result.skipped;
            continue;
        }

        // a zero sized run has no last extent, the topology builder drops it
        const auto le_end = (*pe_count == 0) ? *le_start : *le_start + *pe_count - 1;
        result.records.emplace_back(SegmentRecord{
            .vg_name = std::string{row[0]},
            .lv_name = std::string{row[1]},
            .segment = ExtentSegment{
                .le_start = *le_start,
                .le_end   = le_end,
                .pe_count = *pe_count,
                .pe_size  = std::nullopt,
                .type     = std::string{row[2]},
                .mappings = std::move(*mappings),
            },
        });
    }
    return result;
}

}  // namespace lvmview::lvm
