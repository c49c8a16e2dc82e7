#include "lvmview/partition_tools.hpp"
#include "lvmview/string_utils.hpp"
#include "lvmview/units.hpp"

#include <algorithm>  // for any_of, find_if
#include <array>      // for array
#include <cctype>     // for isdigit
#include <utility>    // for move

#include <fmt/compile.h>
#include <fmt/format.h>

#include <spdlog/spdlog.h>

using namespace std::string_view_literals;

namespace {

namespace utils = lvmview::utils;
using lvmview::disk::BlockDevice;
using lvmview::disk::FdiskDisk;
using lvmview::disk::PartedDisk;
using lvmview::disk::PartitionRole;

// DOS partition ids of extended partition containers
static constexpr std::array EXTENDED_PARTITION_IDS{"5"sv, "f"sv, "85"sv};
static constexpr std::array EXTENDED_PARTITION_TYPES{"0x5"sv, "0xf"sv, "0x85"sv};

// first partition number inside an extended container
static constexpr std::uint32_t FIRST_LOGICAL_PARTITION = 5;

// parted machine format: disk line has 8 fields, partition line has 7
static constexpr std::size_t PARTED_DISK_FIELDS      = 8;
static constexpr std::size_t PARTED_PARTITION_FIELDS = 7;

/// Joins fields[first, last] back with ':' (model and name may contain one).
auto rejoin_fields(const std::vector<std::string_view>& fields, std::size_t first, std::size_t last) noexcept -> std::string {
    std::string res{};
    for (std::size_t i = first; i <= last; ++i) {
        if (i != first) {
            res += ':';
        }
        res += fields[i];
    }
    return res;
}

auto split_flags(std::string_view flags) noexcept -> std::vector<std::string> {
    std::vector<std::string> res{};
    for (auto&& flag : utils::make_split_view(flags, ',')) {
        const auto trimmed = utils::trim(flag);
        if (!trimmed.empty()) {
            res.emplace_back(trimmed);
        }
    }
    return res;
}

auto is_extended(const BlockDevice& device, const lvmview::disk::FdiskPartition* fdisk_part) noexcept -> bool {
    if (fdisk_part != nullptr && std::ranges::any_of(EXTENDED_PARTITION_IDS, [&](auto&& id) { return fdisk_part->type_id == id; })) {
        return true;
    }
    return device.parttype.has_value() && std::ranges::any_of(EXTENDED_PARTITION_TYPES, [&](auto&& type) { return *device.parttype == type; });
}

template <typename T>
auto find_disk(const std::vector<T>& disks, std::string_view device) noexcept -> const T* {
    auto it = std::ranges::find_if(disks, [device](auto&& disk) { return disk.device == device; });
    return (it != disks.end()) ? &*it : nullptr;
}

void apply_partition_role(BlockDevice& device, std::string_view label_type, const lvmview::disk::FdiskPartition* fdisk_part) noexcept {
    if (label_type != "dos"sv && label_type != "msdos"sv) {
        device.role = PartitionRole::Primary;
        return;
    }
    if (is_extended(device, fdisk_part)) {
        device.role = PartitionRole::Extended;
    } else if (device.part_number >= FIRST_LOGICAL_PARTITION) {
        device.role = PartitionRole::Logical;
    } else {
        device.role = PartitionRole::Primary;
    }
}

}  // namespace

namespace lvmview::disk {

auto clean_device_info(std::string_view text) noexcept -> std::string {
    static constexpr std::array replacements{
        std::pair{"Linux device-mapper (linear) (dm)"sv, "LINUX Dev-map"sv},
        std::pair{"HARDDISK"sv, "HDD"sv},
        std::pair{"(iscsi)"sv, ""sv},
    };

    std::string res{text};
    for (auto&& [from, to] : replacements) {
        for (auto pos = res.find(from); pos != std::string::npos; pos = res.find(from, pos + to.size())) {
            res.replace(pos, from.size(), to);
        }
    }
    return std::string{utils::trim(res)};
}

auto partition_device_path(std::string_view disk, std::uint32_t number) noexcept -> std::string {
    if (!disk.empty() && std::isdigit(static_cast<unsigned char>(disk.back())) != 0) {
        return fmt::format(FMT_COMPILE("{}p{}"), disk, number);
    }
    return fmt::format(FMT_COMPILE("{}{}"), disk, number);
}

auto parse_parted_machine(std::string_view output) noexcept -> ParseResult<PartedDisk> {
    ParseResult<PartedDisk> result{};

    for (auto&& raw_line : utils::make_split_view(output)) {
        auto line = utils::trim(raw_line);
        if (line.ends_with(';')) {
            line.remove_suffix(1);
        }
        // unit markers: BYT, CHS, CYL
        if (line.empty() || line == "BYT"sv || line == "CHS"sv || line == "CYL"sv) {
            continue;
        }

        const auto fields = utils::split_fields(line, ':');
        if (line.starts_with('/')) {
            // e.g format: <path>:<size>:<transport>:<lss>:<pss>:<table>:<model>:<flags>
            if (fields.size() < PARTED_DISK_FIELDS) {
                ++result.skipped;
                continue;
            }
            result.records.emplace_back(PartedDisk{
                .device    = std::string{fields[0]},
                .size      = units::parse_size(fields[1]),
                .transport = std::string{fields[2]},
                .table     = std::string{fields[5]},
                .model     = clean_device_info(rejoin_fields(fields, 6, fields.size() - 2)),
            });
            continue;
        }

        // e.g format: <number>:<start>:<end>:<size>:<fs>:<name>:<flags>
        const auto number = utils::parse_uint<std::uint32_t>(fields[0]);
        if (!number || fields.size() < PARTED_PARTITION_FIELDS || result.records.empty()) {
            spdlog::debug("[parted] skipping line: '{}'", line);
            ++result.skipped;
            continue;
        }
        auto& disk = result.records.back();
        disk.partitions.emplace_back(PartedPartition{
            .number     = *number,
            .device     = partition_device_path(disk.device, *number),
            .size       = units::parse_size(fields[3]),
            .filesystem = std::string{fields[4]},
            .name       = rejoin_fields(fields, 5, fields.size() - 2),
            .flags      = split_flags(fields.back()),
        });
    }
    return result;
}

auto parse_fdisk_listing(std::string_view output) noexcept -> ParseResult<FdiskDisk> {
    ParseResult<FdiskDisk> result{};
    bool in_partition_table{false};
    bool has_id_column{false};

    for (auto&& raw_line : utils::make_split_view(output)) {
        const auto line = utils::trim(raw_line);
        if (line.empty()) {
            continue;
        }

        // e.g format: Disk /dev/sda: 20 GiB, 21474836480 bytes, 41943040 sectors
        if (line.starts_with("Disk /"sv)) {
            const auto colon_pos = line.find(':');
            if (colon_pos == std::string_view::npos) {
                ++result.skipped;
                continue;
            }
            result.records.emplace_back(FdiskDisk{.device = std::string{line.substr(5, colon_pos - 5)}});
            in_partition_table = false;
            continue;
        }
        if (result.records.empty()) {
            continue;
        }

        auto& disk = result.records.back();
        if (auto model = utils::extract_after(line, "Disk model:"sv, '\0')) {
            disk.model = clean_device_info(*model);
        } else if (auto label = utils::extract_after(line, "Disklabel type:"sv, '\0')) {
            disk.label_type = std::string{utils::trim(*label)};
        } else if (line.starts_with("Device"sv) && line.find("Start"sv) != std::string_view::npos) {
            const auto columns = utils::split_whitespace(line);
            in_partition_table = true;
            has_id_column      = std::ranges::any_of(columns, [](auto&& col) { return col == "Id"sv; });
        } else if (in_partition_table && line.starts_with('/')) {
            // dos: <device> [*] <start> <end> <sectors> <size> <id> <type...>
            // gpt: <device> <start> <end> <sectors> <size> <type...>
            const auto tokens    = utils::split_whitespace(line);
            const bool boot      = tokens.size() > 1 && tokens[1] == "*"sv;
            const auto first_col = static_cast<std::size_t>(boot ? 6 : 5);
            const auto type_col  = has_id_column ? first_col + 1 : first_col;
            if (tokens.size() <= type_col) {
                spdlog::debug("[fdisk] skipping partition line: '{}'", line);
                ++result.skipped;
                continue;
            }

            std::vector<std::string> type_words{};
            for (std::size_t i = type_col; i < tokens.size(); ++i) {
                type_words.emplace_back(tokens[i]);
            }
            disk.partitions.emplace_back(FdiskPartition{
                .device    = std::string{tokens[0]},
                .boot      = boot,
                .type_id   = has_id_column ? std::string{tokens[first_col]} : std::string{},
                .type_name = utils::join(type_words, " "),
            });
        }
    }
    return result;
}

void annotate_block_devices(std::vector<BlockDevice>& devices, const std::vector<PartedDisk>& parted_disks, const std::vector<FdiskDisk>& fdisk_disks) noexcept {
    for (auto& device : devices) {
        if (device.model) {
            device.model = clean_device_info(*device.model);
        }

        if (device.type == "disk"sv) {
            const auto* parted_disk = find_disk(parted_disks, device.name);
            const auto* fdisk_disk  = find_disk(fdisk_disks, device.name);
            if (!device.model || device.model->empty()) {
                if (parted_disk != nullptr && !parted_disk->model.empty()) {
                    device.model = parted_disk->model;
                } else if (fdisk_disk != nullptr && !fdisk_disk->model.empty()) {
                    device.model = fdisk_disk->model;
                }
            }
            if (!device.pttype) {
                if (parted_disk != nullptr && !parted_disk->table.empty()) {
                    device.pttype = parted_disk->table;
                } else if (fdisk_disk != nullptr && !fdisk_disk->label_type.empty()) {
                    device.pttype = fdisk_disk->label_type;
                }
            }
        } else if (device.type == "part"sv) {
            const auto* parent_disk = device.pkname ? find_device_by_name(devices, *device.pkname) : nullptr;
            const auto disk_path    = device.pkname.value_or(std::string{});

            const FdiskPartition* fdisk_part = nullptr;
            if (const auto* fdisk_disk = find_disk(fdisk_disks, disk_path)) {
                auto it = std::ranges::find_if(fdisk_disk->partitions, [&](auto&& part) { return part.device == device.name; });
                if (it != fdisk_disk->partitions.end()) {
                    fdisk_part = &*it;
                }
                if (!device.pttype && !fdisk_disk->label_type.empty()) {
                    device.pttype = fdisk_disk->label_type;
                }
            }
            if (const auto* parted_disk = find_disk(parted_disks, disk_path)) {
                auto it = std::ranges::find_if(parted_disk->partitions, [&](auto&& part) { return part.number == device.part_number; });
                if (it != parted_disk->partitions.end()) {
                    device.flags = it->flags;
                }
                if (!device.pttype && !parted_disk->table.empty()) {
                    device.pttype = parted_disk->table;
                }
            }
            if (!device.pttype && parent_disk != nullptr) {
                device.pttype = parent_disk->pttype;
            }
            if ((!device.parttypename || device.parttypename->empty()) && fdisk_part != nullptr && !fdisk_part->type_name.empty()) {
                device.parttypename = fdisk_part->type_name;
            }
            apply_partition_role(device, device.pttype.value_or(std::string{}), fdisk_part);
        }

        const bool has_lvm_flag = std::ranges::any_of(device.flags, [](auto&& flag) { return flag == "lvm"sv; });
        if (device.fstype == "LVM2_member"sv && !has_lvm_flag) {
            device.flags.emplace_back("lvm");
        }
    }
}

}  // namespace lvmview::disk
