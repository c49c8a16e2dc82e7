#ifndef IDENTIFIERS_HPP
#define IDENTIFIERS_HPP

#include <optional>     // for optional
#include <string>       // for string
#include <string_view>  // for string_view

namespace lvmview::ident {

/// @brief Canonical form of a device path used for every join.
/// Bare kernel names gain the /dev/ prefix, repeated slashes collapse
/// (e.g. "sda1" -> "/dev/sda1", "/dev//sda1" -> "/dev/sda1").
auto normalize_device_path(std::string_view path) noexcept -> std::string;

/// @brief Identifier of a logical volume, "<vg>/<lv>".
auto lv_id(std::string_view vg_name, std::string_view lv_name) noexcept -> std::string;

/// @brief Maps an LV device path to its identifier.
/// Accepts /dev/<vg>/<lv> and /dev/mapper/<vg>-<lv> (with "--" escaping a dash).
/// @return "<vg>/<lv>", or std::nullopt if the path is not an LV path.
auto lv_id_from_device_path(std::string_view path) noexcept -> std::optional<std::string>;

}  // namespace lvmview::ident

#endif  // IDENTIFIERS_HPP
