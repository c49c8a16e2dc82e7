#include "lvmview/units.hpp"
#include "lvmview/string_utils.hpp"

#include <array>     // for array
#include <cctype>    // for tolower
#include <charconv>  // for from_chars
#include <cmath>     // for isfinite, round

#include <fmt/compile.h>
#include <fmt/format.h>

using namespace std::string_view_literals;

namespace {

constexpr std::string_view UNIT_LETTERS = "kmgtpe"sv;

// Multiplier for the suffix, 0 when the suffix is not recognized
auto suffix_multiplier(std::string_view suffix) noexcept -> double {
    if (suffix.empty() || suffix == "b"sv || suffix == "B"sv) {
        return 1.0;
    }
    if (suffix == "s"sv || suffix == "S"sv) {
        return 512.0;
    }

    const auto letter = static_cast<char>(std::tolower(static_cast<unsigned char>(suffix.front())));
    const auto pos    = UNIT_LETTERS.find(letter);
    if (pos == std::string_view::npos) {
        return 0.0;
    }

    double base{};
    const auto rest = suffix.substr(1);
    if (rest.empty() || rest == "iB"sv || rest == "ib"sv) {
        base = 1024.0;
    } else if (rest == "B"sv) {
        base = 1000.0;
    } else {
        return 0.0;
    }

    double multiplier{1.0};
    for (std::size_t i = 0; i <= pos; ++i) {
        multiplier *= base;
    }
    return multiplier;
}

}  // namespace

namespace lvmview::units {

auto parse_size(std::string_view str) noexcept -> std::optional<std::uint64_t> {
    str = utils::trim(str);
    if (!str.empty() && (str.front() == '<' || str.front() == '>')) {
        str.remove_prefix(1);
    }
    if (str.empty()) {
        return std::nullopt;
    }

    double value{};
    const auto* end              = str.data() + str.size();
    const auto [ptr, error_code] = std::from_chars(str.data(), end, value);
    if (error_code != std::errc{} || ptr == str.data()) {
        return std::nullopt;
    }

    const auto multiplier = suffix_multiplier(utils::trim(std::string_view{ptr, static_cast<std::size_t>(end - ptr)}));
    if (multiplier == 0.0 || !std::isfinite(value) || value < 0.0) {
        return std::nullopt;
    }

    const auto bytes = value * multiplier;
    // 2^64 does not fit
    if (bytes >= 18446744073709551616.0) {
        return std::nullopt;
    }
    return static_cast<std::uint64_t>(std::round(bytes));
}

auto format_size(std::optional<std::uint64_t> bytes) noexcept -> std::string {
    static constexpr std::array units{"B"sv, "KiB"sv, "MiB"sv, "GiB"sv, "TiB"sv};

    if (!bytes.has_value()) {
        return "N/A";
    }

    auto size = static_cast<double>(*bytes);
    std::size_t unit_index{};
    while (size >= 1024.0 && unit_index + 1 < units.size()) {
        size /= 1024.0;
        ++unit_index;
    }
    return fmt::format(FMT_COMPILE("{:6.2f} {}"), size, units[unit_index]);
}

}  // namespace lvmview::units
