#ifndef PARTITION_TOOLS_HPP
#define PARTITION_TOOLS_HPP

#include "lvmview/block_devices.hpp"
#include "lvmview/parse_result.hpp"

#include <cstdint>      // for uint64_t, uint32_t
#include <optional>     // for optional
#include <string>       // for string
#include <string_view>  // for string_view
#include <vector>       // for vector

namespace lvmview::disk {

struct PartedPartition {
    std::uint32_t number{};
    /// Device path derived from the disk path and the number.
    std::string device;
    std::optional<std::uint64_t> size;
    std::string filesystem;
    std::string name;
    std::vector<std::string> flags{};
};

/// One disk of `parted -m` machine output.
struct PartedDisk {
    std::string device;
    std::optional<std::uint64_t> size;
    std::string transport;
    std::string table;
    std::string model;
    std::vector<PartedPartition> partitions{};
};

struct FdiskPartition {
    std::string device;
    bool boot{};
    /// DOS partition id (e.g. 83, 8e), empty for GPT.
    std::string type_id;
    std::string type_name;
};

/// One disk of `fdisk -l` listing.
struct FdiskDisk {
    std::string device;
    std::string model;
    std::string label_type;
    std::vector<FdiskPartition> partitions{};
};

/// @brief Parses `parted -s -m unit B print all` output.
auto parse_parted_machine(std::string_view output) noexcept -> ParseResult<PartedDisk>;

/// @brief Parses `fdisk -l` output (C locale).
auto parse_fdisk_listing(std::string_view output) noexcept -> ParseResult<FdiskDisk>;

/// @brief Shortens vendor strings for display (e.g. "VBOX HARDDISK" -> "VBOX HDD").
auto clean_device_info(std::string_view text) noexcept -> std::string;

/// @brief Builds the device path of partition `number` on `disk`
/// (/dev/sda + 1 -> /dev/sda1, /dev/nvme0n1 + 1 -> /dev/nvme0n1p1).
auto partition_device_path(std::string_view disk, std::uint32_t number) noexcept -> std::string;

/// @brief Merges partition table details into the lsblk devices:
/// model, table type, flags, partition type names and partition roles.
void annotate_block_devices(std::vector<BlockDevice>& devices, const std::vector<PartedDisk>& parted_disks, const std::vector<FdiskDisk>& fdisk_disks) noexcept;

}  // namespace lvmview::disk

#endif  // PARTITION_TOOLS_HPP
