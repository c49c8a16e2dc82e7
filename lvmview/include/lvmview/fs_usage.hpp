#ifndef FS_USAGE_HPP
#define FS_USAGE_HPP

#include "lvmview/parse_result.hpp"

#include <cstdint>      // for uint64_t
#include <optional>     // for optional
#include <string>       // for string
#include <string_view>  // for string_view

namespace lvmview::fs {

// Mounted filesystem usage as reported by `df -B1 --output=source,size,used,avail,target`.
struct FsUsage {
    std::string source;
    std::optional<std::uint64_t> size;
    std::optional<std::uint64_t> used;
    std::optional<std::uint64_t> avail;
    std::string target;
};

/// @brief Parses `df` output. The header line is skipped, mount points may contain spaces.
auto parse_df_output(std::string_view output) noexcept -> ParseResult<FsUsage>;

}  // namespace lvmview::fs

#endif  // FS_USAGE_HPP
