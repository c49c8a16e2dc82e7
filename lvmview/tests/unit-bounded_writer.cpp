#include "doctest_compatibility.h"

#include "lvmview/bounded_writer.hpp"
#include "lvmview/string_utils.hpp"

#include <array>        // for array
#include <cstddef>      // for size_t
#include <random>       // for mt19937, uniform_int_distribution
#include <stdexcept>    // for out_of_range
#include <string>       // for string
#include <string_view>  // for string_view
#include <vector>       // for vector

using namespace std::string_view_literals;

namespace {

struct Put {
    int row{};
    int col{};
    std::string text;
    lvmview::ui::Style style{};
};

class RecordingSurface final : public lvmview::ui::Surface {
 public:
    RecordingSurface(int width, int height) noexcept : m_width(width), m_height(height) { }

    [[nodiscard]] auto width() const noexcept -> int override { return m_width; }
    [[nodiscard]] auto height() const noexcept -> int override { return m_height; }

    void put(int row, int col, std::string_view text, const lvmview::ui::Style& style) override {
        if (m_reject) {
            throw std::out_of_range("rejected");
        }
        if (col + static_cast<int>(columns(text)) > m_width) {
            throw std::out_of_range("past the right edge");
        }
        m_puts.emplace_back(Put{.row = row, .col = col, .text = std::string{text}, .style = style});
    }

    [[nodiscard]] auto columns(std::string_view text) const noexcept -> std::size_t override {
        const auto cells = lvmview::utils::utf8_width(text);
        return m_double_width ? cells * 2 : cells;
    }

    [[nodiscard]] auto puts() const noexcept -> const std::vector<Put>& { return m_puts; }
    void reject_all() noexcept { m_reject = true; }
    void double_width() noexcept { m_double_width = true; }

 private:
    int m_width;
    int m_height;
    bool m_reject{};
    bool m_double_width{};
    std::vector<Put> m_puts{};
};

}  // namespace

TEST_CASE("bounded writer test")
{
    using lvmview::layout::Region;

    SECTION("text is clipped to the region")
    {
        RecordingSurface surface{80, 24};
        lvmview::ui::BoundedWriter writer{surface};
        const Region region{.top = 2, .left = 10, .height = 3, .width = 8};

        REQUIRE(writer.write(region, 1, 2, "/dev/mapper/vg_data-lv_home"sv, {.bold = true}));
        REQUIRE_EQ(surface.puts().size(), 1);
        const auto& put = surface.puts()[0];
        REQUIRE_EQ(put.row, 3);
        REQUIRE_EQ(put.col, 12);
        REQUIRE_EQ(put.text, "/dev/m");
        REQUIRE(put.style.bold);
    }
    SECTION("positions outside the region are skipped")
    {
        RecordingSurface surface{80, 24};
        lvmview::ui::BoundedWriter writer{surface};
        const Region region{.top = 2, .left = 10, .height = 3, .width = 8};

        REQUIRE_FALSE(writer.write(region, 3, 0, "x"sv));
        REQUIRE_FALSE(writer.write(region, -1, 0, "x"sv));
        REQUIRE_FALSE(writer.write(region, 0, 8, "x"sv));
        REQUIRE_FALSE(writer.write(region, 0, -2, "x"sv));
        REQUIRE(surface.puts().empty());
        REQUIRE_EQ(writer.failures(), 0);
    }
    SECTION("region larger than the surface")
    {
        RecordingSurface surface{20, 5};
        lvmview::ui::BoundedWriter writer{surface};
        const Region region{.top = 3, .left = 15, .height = 10, .width = 30};

        REQUIRE(writer.write(region, 0, 0, "0123456789"sv));
        REQUIRE_EQ(surface.puts()[0].text, "01234");
        REQUIRE_FALSE(writer.write(region, 2, 0, "beyond the last row"sv));
        REQUIRE_EQ(surface.puts().size(), 1);
    }
    SECTION("multibyte glyphs count as one column")
    {
        RecordingSurface surface{80, 24};
        lvmview::ui::BoundedWriter writer{surface};
        const Region region{.top = 0, .left = 0, .height = 1, .width = 4};

        REQUIRE(writer.write(region, 0, 0, "┌──────┐"sv));
        REQUIRE_EQ(surface.puts()[0].text, "┌───");
    }
    SECTION("fullwidth glyphs are clipped by cells")
    {
        RecordingSurface surface{80, 24};
        lvmview::ui::BoundedWriter writer{surface};
        const Region region{.top = 0, .left = 0, .height = 2, .width = 10};

        REQUIRE(writer.write(region, 0, 0, "/mnt/データ領域"sv));
        REQUIRE_EQ(surface.puts()[0].text, "/mnt/デー");

        REQUIRE(writer.write_line(region, 1, "データ"sv));
        REQUIRE_EQ(surface.puts()[1].text, "データ    ");
        REQUIRE_EQ(writer.failures(), 0);
    }
    SECTION("surface glyph widths take precedence")
    {
        RecordingSurface surface{80, 24};
        surface.double_width();
        lvmview::ui::BoundedWriter writer{surface};
        const Region region{.top = 0, .left = 70, .height = 2, .width = 10};

        REQUIRE(writer.write(region, 0, 0, "abcdefghijkl"sv));
        REQUIRE_EQ(surface.puts()[0].text, "abcde");

        REQUIRE(writer.write_line(region, 1, "ab"sv));
        REQUIRE_EQ(surface.columns(surface.puts()[1].text), 10);
        REQUIRE_EQ(writer.failures(), 0);
    }
    SECTION("write line pads to the region width")
    {
        RecordingSurface surface{80, 24};
        lvmview::ui::BoundedWriter writer{surface};
        const Region region{.top = 1, .left = 1, .height = 2, .width = 6};

        REQUIRE(writer.write_line(region, 0, "ab"sv, {.inverted = true}));
        REQUIRE_EQ(surface.puts()[0].text, "ab    ");
        REQUIRE(surface.puts()[0].style.inverted);

        REQUIRE(writer.write_line(region, 1, "abcdefgh"sv));
        REQUIRE_EQ(surface.puts()[1].text, "abcdef");

        REQUIRE_FALSE(writer.write_line(Region{}, 0, "ab"sv));
    }
    SECTION("surface failures are counted")
    {
        RecordingSurface surface{80, 24};
        surface.reject_all();
        lvmview::ui::BoundedWriter writer{surface};
        const Region region{.top = 0, .left = 0, .height = 2, .width = 10};

        REQUIRE_FALSE(writer.write(region, 0, 0, "one"sv));
        REQUIRE_FALSE(writer.write_line(region, 1, "two"sv));
        REQUIRE_EQ(writer.failures(), 2);
    }
    SECTION("random text never leaves the region")
    {
        static constexpr std::array GLYPHS{"a"sv, "Z"sv, "0"sv, " "sv, "/"sv, "é"sv, "─"sv, "│"sv, "ü"sv, "デ"sv, "領"sv, "Ａ"sv, "한"sv};

        std::mt19937 rng{20241019};
        std::uniform_int_distribution<int> glyph_dist(0, GLYPHS.size() - 1);
        std::uniform_int_distribution<int> len_dist(0, 120);
        std::uniform_int_distribution<int> pos_dist(-5, 90);
        std::uniform_int_distribution<int> size_dist(0, 60);

        RecordingSurface surface{80, 24};
        lvmview::ui::BoundedWriter writer{surface};
        for (int iteration = 0; iteration < 500; ++iteration) {
            std::string text{};
            const int length = len_dist(rng);
            for (int i = 0; i < length; ++i) {
                text += GLYPHS[static_cast<std::size_t>(glyph_dist(rng))];
            }
            const Region region{.top = pos_dist(rng) / 3, .left = pos_dist(rng), .height = size_dist(rng) / 4, .width = size_dist(rng)};
            const int row = size_dist(rng) / 8;
            const int col = size_dist(rng) / 2;

            const auto before = surface.puts().size();
            writer.write(region, row, col, text);
            if (surface.puts().size() == before) {
                continue;
            }

            const auto& put = surface.puts().back();
            REQUIRE(put.row >= region.top);
            REQUIRE(put.row < region.bottom());
            REQUIRE(put.row < surface.height());
            REQUIRE(put.col >= region.left);
            REQUIRE(put.col >= 0);
            const auto width = static_cast<int>(lvmview::utils::utf8_width(put.text));
            REQUIRE(put.col + width <= region.right());
            REQUIRE(put.col + width <= surface.width());
        }
        REQUIRE_EQ(writer.failures(), 0);
    }
}
