#ifndef STRING_UTILS_HPP
#define STRING_UTILS_HPP

#include <algorithm>    // for transform
#include <charconv>     // for from_chars
#include <concepts>     // for unsigned_integral
#include <cstddef>      // for size_t
#include <optional>     // for optional
#include <ranges>       // for ranges::*
#include <string>       // for string
#include <string_view>  // for string_view
#include <vector>       // for vector

namespace lvmview::utils {

/// @brief Split a string into views of multiple lines based on a delimiter.
/// @param str The string to split.
/// @param delim The delimiter to split the string.
/// @return A vector of string views representing the non-empty split lines.
auto make_multiline_view(std::string_view str, char delim = '\n') noexcept -> std::vector<std::string_view>;

/// @brief Split a string into fields, keeping empty fields.
/// @param str The string to split.
/// @param delim The field delimiter.
/// @return A vector of string views, one per field (always at least one).
auto split_fields(std::string_view str, char delim) noexcept -> std::vector<std::string_view>;

/// @brief Split a string on runs of whitespace.
auto split_whitespace(std::string_view str) noexcept -> std::vector<std::string_view>;

/// @brief Join a vector of strings into a single string using a delimiter.
/// @param lines The lines to join.
/// @param delim The delimiter to join the lines.
/// @return The joined lines as a single string.
auto join(const std::vector<std::string>& lines, std::string_view delim = "\n") noexcept -> std::string;

/// @brief Make a split view from a string into multiple lines based on a delimiter.
/// @param str The string to split.
/// @param delim The delimiter to split the string.
/// @return A range view representing the split lines.
constexpr auto make_split_view(std::string_view str, char delim = '\n') noexcept {
    constexpr auto functor = [](auto&& rng) {
        return std::string_view(&*rng.begin(), static_cast<size_t>(std::ranges::distance(rng)));
    };
    constexpr auto non_empty = [](auto&& rng) { return !std::ranges::empty(rng); };

    return str
        | std::ranges::views::split(delim)
        | std::ranges::views::filter(non_empty)
        | std::ranges::views::transform(functor);
}

constexpr auto ltrim(std::string_view str) noexcept -> std::string_view {
    constexpr std::string_view whitespace{" \t\n\r\f\v"};
    const auto pos = str.find_first_not_of(whitespace);
    return pos == std::string_view::npos ? std::string_view{} : str.substr(pos);
}

constexpr auto rtrim(std::string_view str) noexcept -> std::string_view {
    constexpr std::string_view whitespace{" \t\n\r\f\v"};
    const auto pos = str.find_last_not_of(whitespace);
    return pos == std::string_view::npos ? std::string_view{} : str.substr(0, pos + 1);
}

constexpr auto trim(std::string_view str) noexcept -> std::string_view {
    return ltrim(rtrim(str));
}

/// @brief Extract the value following a prefix up to a delimiter.
/// @param str The string to search in.
/// @param prefix The prefix to look for.
/// @param delim The delimiter terminating the value, '\0' means end of string.
/// @return The value, or std::nullopt if the prefix was not found.
constexpr auto extract_after(std::string_view str, std::string_view prefix, char delim = ' ') noexcept -> std::optional<std::string_view> {
    const auto pos = str.find(prefix);
    if (pos == std::string_view::npos) {
        return std::nullopt;
    }
    auto rest = str.substr(pos + prefix.size());
    if (delim == '\0') {
        return rest;
    }
    return rest.substr(0, rest.find(delim));
}

/// @brief Parse an unsigned integer, the whole input must be consumed.
template <std::unsigned_integral T>
constexpr auto parse_uint(std::string_view str) noexcept -> std::optional<T> {
    str = trim(str);
    if (str.empty()) {
        return std::nullopt;
    }
    T result{};
    const auto* end            = str.data() + str.size();
    const auto [ptr, error_code] = std::from_chars(str.data(), end, result);
    if (error_code != std::errc{} || ptr != end) {
        return std::nullopt;
    }
    return result;
}

/// @brief Number of terminal cells the UTF-8 string occupies.
///
/// Fullwidth (CJK, Hangul, fullwidth forms) glyphs take two cells, combining
/// marks and control characters none.
auto utf8_width(std::string_view str) noexcept -> std::size_t;

/// @brief Cut the string to at most `columns` terminal cells, on a glyph boundary.
auto utf8_truncate(std::string_view str, std::size_t columns) noexcept -> std::string_view;

/// @brief Fit the string into `columns`, replacing the tail with "..." when it is cut.
auto ellipsize(std::string_view str, std::size_t columns) noexcept -> std::string;

}  // namespace lvmview::utils

#endif  // STRING_UTILS_HPP
