#ifndef BLOCK_DEVICES_HPP
#define BLOCK_DEVICES_HPP

#include "lvmview/parse_result.hpp"

#include <cstdint>      // for uint64_t, uint32_t, uint8_t
#include <expected>     // for expected
#include <optional>     // for optional
#include <string>       // for string
#include <string_view>  // for string_view
#include <vector>       // for vector

namespace lvmview::disk {

/// Role of a partition inside its partition table.
enum class PartitionRole : std::uint8_t {
    None,
    Primary,
    Extended,
    Logical,
};

/// @brief Represents a block device with its properties.
struct BlockDevice {
    /// Device path (e.g., /dev/nvme0n1p2).
    std::string name;
    /// Device type (e.g., disk, part, lvm, loop, crypt).
    std::string type;
    /// Size of the device in bytes.
    std::optional<std::uint64_t> size;
    /// Filesystem type (e.g., ext4, LVM2_member).
    std::optional<std::string> fstype;
    /// Filesystem label.
    std::optional<std::string> label;
    /// Mount point.
    std::optional<std::string> mountpoint;
    /// Device model.
    std::optional<std::string> model;
    /// Parent device name.
    std::optional<std::string> pkname;
    /// Partition table type of the disk (e.g., gpt, dos).
    std::optional<std::string> pttype;
    /// Partition type code (GUID for gpt, 0xNN for dos).
    std::optional<std::string> parttype;
    /// Human readable partition type (e.g., Linux LVM).
    std::optional<std::string> parttypename;
    /// Partition number, 0 for whole devices.
    std::uint32_t part_number{};
    PartitionRole role{PartitionRole::None};
    /// Partition flags (e.g., boot, esp, lvm).
    std::vector<std::string> flags{};

    /// @brief Whether the device carries LVM physical volume metadata.
    [[nodiscard]] auto is_lvm_member() const noexcept -> bool;
};

/// @brief Parses `lsblk -J` output, flattening the device tree depth-first.
/// Devices listed more than once (e.g. a PV shared by several LVs) are kept once.
/// @param json_output The raw JSON text.
/// @return The devices, or a description of why the document could not be parsed.
auto parse_lsblk_json(std::string_view json_output) noexcept -> std::expected<ParseResult<BlockDevice>, std::string>;

/// @brief Finds a block device by its path.
/// @param devices A vector of BlockDevice objects.
/// @param device_name The path of the device to find.
/// @return Pointer into `devices` if found, nullptr otherwise.
auto find_device_by_name(const std::vector<BlockDevice>& devices, std::string_view device_name) noexcept -> const BlockDevice*;

/// @brief Extracts the partition number from a device path (e.g. /dev/nvme0n1p3 -> 3).
auto parse_partition_number(std::string_view device) noexcept -> std::uint32_t;

/// @brief Short label for the partition role ("Pri", "Extd", "Logi", "Disk" or "---").
auto partition_role_label(const BlockDevice& device) noexcept -> std::string_view;

}  // namespace lvmview::disk

#endif  // BLOCK_DEVICES_HPP
