#include "lvmview/string_utils.hpp"

#include <ranges>  // for views::join_with, to

namespace {

// UTF-8 continuation bytes have the form 10xxxxxx
constexpr auto is_continuation_byte(char ch) noexcept -> bool {
    return (static_cast<unsigned char>(ch) & 0xC0U) == 0x80U;
}

/// Decodes the code point starting at `pos` and advances `pos` past it.
/// Malformed sequences decode to U+FFFD.
constexpr auto decode_utf8(std::string_view str, std::size_t& pos) noexcept -> char32_t {
    const auto first = static_cast<unsigned char>(str[pos++]);
    if (first < 0x80U) {
        return first;
    }

    std::size_t extra{};
    char32_t codepoint{};
    if ((first & 0xE0U) == 0xC0U) {
        extra     = 1;
        codepoint = first & 0x1FU;
    } else if ((first & 0xF0U) == 0xE0U) {
        extra     = 2;
        codepoint = first & 0x0FU;
    } else if ((first & 0xF8U) == 0xF0U) {
        extra     = 3;
        codepoint = first & 0x07U;
    } else {
        return U'\uFFFD';
    }
    for (std::size_t i = 0; i < extra; ++i) {
        if (pos >= str.size() || !is_continuation_byte(str[pos])) {
            return U'\uFFFD';
        }
        codepoint = (codepoint << 6U) | (static_cast<unsigned char>(str[pos++]) & 0x3FU);
    }
    return codepoint;
}

constexpr auto is_zero_width(char32_t codepoint) noexcept -> bool {
    return codepoint < 0x20 || (codepoint >= 0x7F && codepoint < 0xA0)  // control characters
        || (codepoint >= 0x0300 && codepoint <= 0x036F)                  // combining diacritical marks
        || (codepoint >= 0x1AB0 && codepoint <= 0x1AFF)
        || (codepoint >= 0x1DC0 && codepoint <= 0x1DFF)
        || (codepoint >= 0x200B && codepoint <= 0x200F)                  // zero width space, joiners
        || (codepoint >= 0x20D0 && codepoint <= 0x20FF)
        || (codepoint >= 0xFE00 && codepoint <= 0xFE0F)                  // variation selectors
        || (codepoint >= 0xFE20 && codepoint <= 0xFE2F);
}

constexpr auto is_wide(char32_t codepoint) noexcept -> bool {
    return (codepoint >= 0x1100 && codepoint <= 0x115F)     // Hangul Jamo
        || (codepoint >= 0x2329 && codepoint <= 0x232A)     // angle brackets
        || (codepoint >= 0x2E80 && codepoint <= 0x303E)     // CJK radicals, symbols and punctuation
        || (codepoint >= 0x3041 && codepoint <= 0x33FF)     // kana, Bopomofo, CJK compatibility
        || (codepoint >= 0x3400 && codepoint <= 0x4DBF)     // CJK extension A
        || (codepoint >= 0x4E00 && codepoint <= 0x9FFF)     // CJK unified ideographs
        || (codepoint >= 0xA000 && codepoint <= 0xA4CF)     // Yi
        || (codepoint >= 0xAC00 && codepoint <= 0xD7A3)     // Hangul syllables
        || (codepoint >= 0xF900 && codepoint <= 0xFAFF)     // CJK compatibility ideographs
        || (codepoint >= 0xFE10 && codepoint <= 0xFE19)     // vertical forms
        || (codepoint >= 0xFE30 && codepoint <= 0xFE6F)     // CJK compatibility forms
        || (codepoint >= 0xFF00 && codepoint <= 0xFF60)     // fullwidth forms
        || (codepoint >= 0xFFE0 && codepoint <= 0xFFE6)
        || (codepoint >= 0x1F300 && codepoint <= 0x1F64F)   // pictographs, emoticons
        || (codepoint >= 0x1F900 && codepoint <= 0x1F9FF)
        || (codepoint >= 0x20000 && codepoint <= 0x3FFFD);  // CJK extensions B to F
}

constexpr auto cell_width(char32_t codepoint) noexcept -> std::size_t {
    if (is_zero_width(codepoint)) {
        return 0;
    }
    return is_wide(codepoint) ? 2 : 1;
}

}  // namespace

namespace lvmview::utils {

auto make_multiline_view(std::string_view str, char delim) noexcept -> std::vector<std::string_view> {
    std::vector<std::string_view> lines{};
    std::ranges::for_each(utils::make_split_view(str, delim), [&](auto&& rng) { lines.emplace_back(rng); });
    return lines;
}

auto split_fields(std::string_view str, char delim) noexcept -> std::vector<std::string_view> {
    std::vector<std::string_view> fields{};
    std::size_t start{};
    while (true) {
        const auto pos = str.find(delim, start);
        if (pos == std::string_view::npos) {
            fields.emplace_back(str.substr(start));
            break;
        }
        fields.emplace_back(str.substr(start, pos - start));
        start = pos + 1;
    }
    return fields;
}

auto split_whitespace(std::string_view str) noexcept -> std::vector<std::string_view> {
    static constexpr std::string_view whitespace{" \t\n\r\f\v"};

    std::vector<std::string_view> tokens{};
    std::size_t pos = str.find_first_not_of(whitespace);
    while (pos != std::string_view::npos) {
        const auto end = str.find_first_of(whitespace, pos);
        tokens.emplace_back(str.substr(pos, end == std::string_view::npos ? std::string_view::npos : end - pos));
        pos = (end == std::string_view::npos) ? end : str.find_first_not_of(whitespace, end);
    }
    return tokens;
}

auto join(const std::vector<std::string>& lines, std::string_view delim) noexcept -> std::string {
    return lines | std::ranges::views::join_with(delim) | std::ranges::to<std::string>();
}

auto utf8_width(std::string_view str) noexcept -> std::size_t {
    std::size_t cells{};
    for (std::size_t pos = 0; pos < str.size();) {
        cells += cell_width(decode_utf8(str, pos));
    }
    return cells;
}

auto utf8_truncate(std::string_view str, std::size_t columns) noexcept -> std::string_view {
    std::size_t cells{};
    for (std::size_t pos = 0; pos < str.size();) {
        const auto start = pos;
        const auto width = cell_width(decode_utf8(str, pos));
        // a wide glyph is never split, combining marks stay with their base
        if (cells + width > columns) {
            return str.substr(0, start);
        }
        cells += width;
    }
    return str;
}

auto ellipsize(std::string_view str, std::size_t columns) noexcept -> std::string {
    if (utf8_width(str) <= columns) {
        return std::string{str};
    }
    if (columns <= 3) {
        return std::string{utf8_truncate(str, columns)};
    }
    auto result = std::string{utf8_truncate(str, columns - 3)};
    result += "...";
    return result;
}

}  // namespace lvmview::utils
