#include "doctest_compatibility.h"

#include "lvmview/fs_usage.hpp"
#include "lvmview/logger.hpp"

#include <string_view>

#include <spdlog/sinks/callback_sink.h>
#include <spdlog/spdlog.h>

using namespace std::string_view_literals;

static constexpr auto DF_OUTPUT = R"(Filesystem                        1B-blocks        Used       Avail Mounted on
/dev/mapper/vg_data-lv_home     84402851840 21474836480 58590420992 /home
/dev/mapper/vg_data-lv_media    10434662400  1073741824  8821080064 /mnt/my data
tmpfs                            8264269824           0  8264269824 /tmp
/dev/sdb1 1024
)"sv;

TEST_CASE("df parsing test")
{
    auto callback_sink = std::make_shared<spdlog::sinks::callback_sink_mt>([](const spdlog::details::log_msg&) {
        // noop
    });
    auto logger        = std::make_shared<spdlog::logger>("default", callback_sink);
    spdlog::set_default_logger(logger);
    lvmview::logger::set_logger(logger);

    const auto result = lvmview::fs::parse_df_output(DF_OUTPUT);
    REQUIRE_EQ(result.records.size(), 3);
    REQUIRE_EQ(result.skipped, 1);

    const auto& home = result.records[0];
    REQUIRE_EQ(home.source, "/dev/mapper/vg_data-lv_home");
    REQUIRE_EQ(home.size, 84402851840ULL);
    REQUIRE_EQ(home.used, 21474836480ULL);
    REQUIRE_EQ(home.avail, 58590420992ULL);
    REQUIRE_EQ(home.target, "/home");

    // mount point with a space
    REQUIRE_EQ(result.records[1].target, "/mnt/my data");
    REQUIRE_EQ(result.records[2].source, "tmpfs");
    REQUIRE_EQ(result.records[2].used, 0ULL);

    REQUIRE(lvmview::fs::parse_df_output(""sv).records.empty());

    // runs of spaces inside the mount point are kept
    const auto spaced = lvmview::fs::parse_df_output("/dev/mapper/vg_data-lv_media 1024 0 1024 /mnt/backup  2024   old\n"sv);
    REQUIRE_EQ(spaced.records.size(), 1);
    REQUIRE_EQ(spaced.records[0].target, "/mnt/backup  2024   old");
}
