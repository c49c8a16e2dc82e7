#include "lvmview/block_devices.hpp"
#include "lvmview/units.hpp"

#include <algorithm>      // for find_if, any_of
#include <charconv>       // for from_chars
#include <unordered_set>  // for unordered_set
#include <utility>        // for move

#if defined(__clang__)
#pragma clang diagnostic push
#pragma clang diagnostic ignored "-Wold-style-cast"
#elif defined(__GNUC__)
#pragma GCC diagnostic push
#pragma GCC diagnostic ignored "-Wuseless-cast"
#pragma GCC diagnostic ignored "-Wold-style-cast"
#endif

#include <rapidjson/document.h>
#include <rapidjson/error/en.h>

#if defined(__clang__)
#pragma clang diagnostic pop
#elif defined(__GNUC__)
#pragma GCC diagnostic pop
#endif

#include <fmt/compile.h>
#include <fmt/format.h>

#include <spdlog/spdlog.h>

using namespace std::string_view_literals;

static constexpr auto DEV_PATH_PREFIX  = "/dev/"sv;
static constexpr auto TRAILING_NUMBERS = "0123456789"sv;

namespace {

using BlockDevice = lvmview::disk::BlockDevice;

auto get_optional_string(const rapidjson::Value& doc, const char* key) -> std::optional<std::string> {
    if (doc.HasMember(key) && doc[key].IsString()) {
        return std::string{doc[key].GetString(), doc[key].GetStringLength()};
    }
    return std::nullopt;
}

auto get_size(const rapidjson::Value& doc) -> std::optional<std::uint64_t> {
    if (!doc.HasMember("size")) {
        return std::nullopt;
    }
    const auto& size = doc["size"];
    if (size.IsUint64()) {
        return size.GetUint64();
    }
    // older util-linux prints sizes as strings even with -b
    if (size.IsString()) {
        return lvmview::units::parse_size(size.GetString());
    }
    return std::nullopt;
}

/// Constructs a BlockDevice from a RapidJSON object.
auto get_blockdevice_from_json(const rapidjson::Value& doc) -> BlockDevice {
    auto device = BlockDevice{};
    if (doc.HasMember("name") && doc["name"].IsString()) {
        device.name = doc["name"].GetString();
    }
    if (doc.HasMember("type") && doc["type"].IsString()) {
        device.type = doc["type"].GetString();
    }
    device.size         = get_size(doc);
    device.fstype       = get_optional_string(doc, "fstype");
    device.label        = get_optional_string(doc, "label");
    device.mountpoint   = get_optional_string(doc, "mountpoint");
    device.model        = get_optional_string(doc, "model");
    device.pkname       = get_optional_string(doc, "pkname");
    device.pttype       = get_optional_string(doc, "pttype");
    device.parttype     = get_optional_string(doc, "parttype");
    device.parttypename = get_optional_string(doc, "parttypename");

    if (device.type == "part"sv) {
        device.part_number = lvmview::disk::parse_partition_number(device.name);
        device.role        = lvmview::disk::PartitionRole::Primary;
    }
    return device;
}

void collect_devices(const rapidjson::Value& doc, std::unordered_set<std::string>& seen, lvmview::ParseResult<BlockDevice>& result) {
    if (!doc.IsObject()) {
        ++result.skipped;
        return;
    }

    auto device = get_blockdevice_from_json(doc);
    if (device.name.empty()) {
        ++result.skipped;
    } else if (seen.insert(device.name).second) {
        result.records.emplace_back(std::move(device));
    }

    if (doc.HasMember("children") && doc["children"].IsArray()) {
        for (const auto& child : doc["children"].GetArray()) {
            collect_devices(child, seen, result);
        }
    }
}

}  // namespace

namespace lvmview::disk {

auto BlockDevice::is_lvm_member() const noexcept -> bool {
    if (fstype.has_value() && *fstype == "LVM2_member"sv) {
        return true;
    }
    return std::ranges::any_of(flags, [](auto&& flag) { return flag == "lvm"sv; });
}

auto parse_lsblk_json(std::string_view json_output) noexcept -> std::expected<ParseResult<BlockDevice>, std::string> {
    rapidjson::Document document;

    document.Parse(json_output.data(), json_output.size());
    if (document.HasParseError()) {
        return std::unexpected(fmt::format(FMT_COMPILE("malformed lsblk output: {}"), rapidjson::GetParseError_En(document.GetParseError())));
    }
    if (!document.IsObject() || !document.HasMember("blockdevices") || !document["blockdevices"].IsArray()) {
        return std::unexpected("lsblk output has no 'blockdevices' array");
    }

    ParseResult<BlockDevice> result{};
    std::unordered_set<std::string> seen{};
    for (const auto& device_json : document["blockdevices"].GetArray()) {
        collect_devices(device_json, seen, result);
    }
    return result;
}

auto find_device_by_name(const std::vector<BlockDevice>& devices, std::string_view device_name) noexcept -> const BlockDevice* {
    auto it = std::ranges::find_if(devices, [device_name](auto&& dev) {
        return dev.name == device_name;
    });
    if (it != std::ranges::end(devices)) {
        return &*it;
    }
    return nullptr;
}

auto parse_partition_number(std::string_view device) noexcept -> std::uint32_t {
    if (device.starts_with(DEV_PATH_PREFIX)) {
        device.remove_prefix(DEV_PATH_PREFIX.size());
    }

    const auto pos = device.find_last_not_of(TRAILING_NUMBERS);
    if (pos == std::string_view::npos || pos == device.size() - 1) {
        return 0;
    }
    // nvme0n1p3, mmcblk0p1: a disk name ending with a digit gets a 'p' separator
    if (device[pos] != 'p' && (device.starts_with("nvme"sv) || device.starts_with("mmcblk"sv))) {
        return 0;
    }

    auto num_str = device.substr(pos + 1);
    std::uint32_t result{0};
    std::from_chars(num_str.data(), num_str.data() + num_str.size(), result);
    return result;
}

auto partition_role_label(const BlockDevice& device) noexcept -> std::string_view {
    if (device.type == "disk"sv) {
        return "Disk"sv;
    }
    switch (device.role) {
    case PartitionRole::Primary:
        return "Pri"sv;
    case PartitionRole::Extended:
        return "Extd"sv;
    case PartitionRole::Logical:
        return "Logi"sv;
    case PartitionRole::None:
    default:
        return "---"sv;
    }
}

}  // namespace lvmview::disk
