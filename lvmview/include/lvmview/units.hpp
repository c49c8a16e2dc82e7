#ifndef UNITS_HPP
#define UNITS_HPP

#include <cstdint>      // for uint64_t
#include <optional>     // for optional
#include <string>       // for string
#include <string_view>  // for string_view

namespace lvmview::units {

// All sizes are normalized to bytes at parse time.
//
// Suffix policy:
//   <none>, b, B                 bytes
//   s, S                         512-byte sectors
//   k m g t p e (any case)       binary, 1024^n
//   KiB MiB GiB TiB PiB EiB      binary, 1024^n
//   kB KB MB GB TB PB EB         decimal, 1000^n
// A leading '<' or '>' (LVM rounding hint) is ignored.

/// @brief Parses a size string into bytes.
/// @return Number of bytes, std::nullopt if the string is not a valid size.
[[nodiscard]] auto parse_size(std::string_view str) noexcept -> std::optional<std::uint64_t>;

/// @brief Formats bytes as a right-aligned human readable size (e.g. "  4.00 GiB").
/// @return The formatted size, or "N/A" when the size is unknown.
[[nodiscard]] auto format_size(std::optional<std::uint64_t> bytes) noexcept -> std::string;

}  // namespace lvmview::units

#endif  // UNITS_HPP
