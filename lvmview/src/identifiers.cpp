#include "lvmview/identifiers.hpp"
#include "lvmview/string_utils.hpp"

#include <algorithm>  // for any_of
#include <array>      // for array

#include <fmt/compile.h>
#include <fmt/format.h>

using namespace std::string_view_literals;

namespace {

static constexpr auto DEV_PREFIX    = "/dev/"sv;
static constexpr auto MAPPER_PREFIX = "/dev/mapper/"sv;

// /dev/<dir>/<name> entries that are never volume groups
static constexpr std::array NON_VG_DIRS{"disk"sv, "block"sv, "char"sv, "bus"sv, "input"sv, "pts"sv, "shm"sv, "snd"sv, "dri"sv, "net"sv, "cpu"sv, "fd"sv};

}  // namespace

namespace lvmview::ident {

auto normalize_device_path(std::string_view path) noexcept -> std::string {
    path = utils::trim(path);
    if (path.empty()) {
        return {};
    }

    std::string res{};
    if (!path.starts_with('/')) {
        res += DEV_PREFIX;
    }
    for (const char ch : path) {
        if (ch == '/' && !res.empty() && res.back() == '/') {
            continue;
        }
        res += ch;
    }
    return res;
}

auto lv_id(std::string_view vg_name, std::string_view lv_name) noexcept -> std::string {
    return fmt::format(FMT_COMPILE("{}/{}"), vg_name, lv_name);
}

auto lv_id_from_device_path(std::string_view path) noexcept -> std::optional<std::string> {
    const auto normalized = normalize_device_path(path);
    std::string_view device{normalized};

    if (device.starts_with(MAPPER_PREFIX)) {
        // device-mapper doubles every dash inside VG and LV names
        device.remove_prefix(MAPPER_PREFIX.size());
        std::string vg_name{};
        std::string lv_name{};
        bool in_lv{false};
        for (std::size_t i = 0; i < device.size(); ++i) {
            auto& current = in_lv ? lv_name : vg_name;
            if (device[i] != '-') {
                current += device[i];
            } else if (i + 1 < device.size() && device[i + 1] == '-') {
                current += '-';
                ++i;
            } else if (!in_lv) {
                in_lv = true;
            } else {
                current += '-';
            }
        }
        if (!in_lv || vg_name.empty() || lv_name.empty()) {
            return std::nullopt;
        }
        return lv_id(vg_name, lv_name);
    }

    if (!device.starts_with(DEV_PREFIX)) {
        return std::nullopt;
    }
    device.remove_prefix(DEV_PREFIX.size());
    const auto slash_pos = device.find('/');
    if (slash_pos == std::string_view::npos || slash_pos == 0 || slash_pos == device.size() - 1) {
        return std::nullopt;
    }
    const auto vg_name = device.substr(0, slash_pos);
    const auto lv_name = device.substr(slash_pos + 1);
    if (lv_name.find('/') != std::string_view::npos || std::ranges::any_of(NON_VG_DIRS, [&](auto&& dir) { return dir == vg_name; })) {
        return std::nullopt;
    }
    return lv_id(vg_name, lv_name);
}

}  // namespace lvmview::ident
