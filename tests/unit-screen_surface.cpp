#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN
#include "doctest_compatibility.h"

#include "screen_surface.hpp"

// import lvmview
#include "lvmview/bounded_writer.hpp"

#include <stdexcept>    // for out_of_range
#include <string>       // for string
#include <string_view>  // for string_view

#include <ftxui/dom/elements.hpp>  // for Render
#include <ftxui/screen/screen.hpp>  // for Screen

using namespace std::string_view_literals;

TEST_CASE("screen surface test")
{
    SECTION("writes glyphs and styles into the box")
    {
        auto screen = ftxui::Screen(20, 5);
        const ftxui::Box box{.x_min = 2, .x_max = 11, .y_min = 1, .y_max = 3};
        tui::ScreenSurface surface{screen, box};

        REQUIRE_EQ(surface.width(), 10);
        REQUIRE_EQ(surface.height(), 3);

        surface.put(1, 2, "vg┤"sv, {.bold = true, .inverted = true});
        REQUIRE_EQ(screen.PixelAt(4, 2).character, "v");
        REQUIRE_EQ(screen.PixelAt(5, 2).character, "g");
        REQUIRE_EQ(screen.PixelAt(6, 2).character, "┤");
        REQUIRE(screen.PixelAt(4, 2).bold);
        REQUIRE(screen.PixelAt(6, 2).inverted);
        REQUIRE_FALSE(screen.PixelAt(6, 2).underlined);
    }
    SECTION("rejects text outside the box")
    {
        auto screen = ftxui::Screen(20, 5);
        const ftxui::Box box{.x_min = 0, .x_max = 9, .y_min = 0, .y_max = 1};
        tui::ScreenSurface surface{screen, box};

        REQUIRE_THROWS_AS(surface.put(2, 0, "x"sv, {}), std::out_of_range);
        REQUIRE_THROWS_AS(surface.put(0, -1, "x"sv, {}), std::out_of_range);
        REQUIRE_THROWS_AS(surface.put(0, 5, "0123456789"sv, {}), std::out_of_range);
        REQUIRE_NOTHROW(surface.put(0, 0, "0123456789"sv, {}));
    }
    SECTION("fullwidth glyphs take two cells")
    {
        auto screen = ftxui::Screen(20, 2);
        const ftxui::Box box{.x_min = 0, .x_max = 9, .y_min = 0, .y_max = 1};
        tui::ScreenSurface surface{screen, box};

        REQUIRE_EQ(surface.columns("データ"sv), 6);
        REQUIRE_EQ(surface.columns("vg_data"sv), 7);
        REQUIRE_THROWS_AS(surface.put(0, 0, "/mnt/データ領域"sv, {}), std::out_of_range);

        // the writer clips by the same widths, so nothing is dropped
        lvmview::ui::BoundedWriter writer{surface};
        const lvmview::layout::Region region{.top = 0, .left = 0, .height = 2, .width = 10};
        REQUIRE(writer.write(region, 0, 0, "/mnt/データ領域"sv));
        REQUIRE(writer.write_line(region, 1, "データ"sv));
        REQUIRE_EQ(writer.failures(), 0);
        REQUIRE_EQ(screen.PixelAt(5, 0).character, "デ");
        REQUIRE_EQ(screen.PixelAt(7, 0).character, "ー");
        REQUIRE_EQ(screen.PixelAt(4, 1).character, "タ");
    }
    SECTION("element draws on every render")
    {
        int width{};
        int height{};
        auto element = tui::surface_element([&](lvmview::ui::Surface& surface) {
            width  = surface.width();
            height = surface.height();
            surface.put(0, 0, "lvmview"sv, {.underlined = true});
        });

        auto screen = ftxui::Screen(30, 4);
        ftxui::Render(screen, element);
        REQUIRE_EQ(width, 30);
        REQUIRE_EQ(height, 4);
        REQUIRE_EQ(screen.PixelAt(0, 0).character, "l");
        REQUIRE_EQ(screen.PixelAt(6, 0).character, "w");
        REQUIRE(screen.PixelAt(6, 0).underlined);
    }
}
