#include "lvmview/fs_usage.hpp"
#include "lvmview/string_utils.hpp"
#include "lvmview/units.hpp"

#include <string>  // for string

#include <spdlog/spdlog.h>

using namespace std::string_view_literals;

namespace {

// source, size, used, avail, target
static constexpr std::size_t DF_MIN_COLUMNS = 5;

}  // namespace

namespace lvmview::fs {

auto parse_df_output(std::string_view output) noexcept -> ParseResult<FsUsage> {
    ParseResult<FsUsage> result{};

    for (auto&& line : utils::make_split_view(output)) {
        const auto tokens = utils::split_whitespace(line);
        if (tokens.empty() || tokens[0] == "Filesystem"sv) {
            continue;
        }
        if (tokens.size() < DF_MIN_COLUMNS) {
            spdlog::debug("[df] skipping line: '{}'", line);
            ++result.skipped;
            continue;
        }

        // e.g format: <source> <size> <used> <avail> <target with spaces>
        const auto target_pos = static_cast<std::size_t>(tokens[4].data() - line.data());
        result.records.emplace_back(FsUsage{
            .source = std::string{tokens[0]},
            .size   = units::parse_size(tokens[1]),
            .used   = units::parse_size(tokens[2]),
            .avail  = units::parse_size(tokens[3]),
            .target = std::string{utils::rtrim(line.substr(target_pos))},
        });
    }
    return result;
}

}  // namespace lvmview::fs
