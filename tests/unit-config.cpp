#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN
#include "doctest_compatibility.h"

#include "config.hpp"

#include <cstdlib>  // for setenv, unsetenv
#include <string>
#include <variant>

using namespace std::string_literals;

namespace {

void clear_environment() {
    ::unsetenv("LVMVIEW_REFRESH_INTERVAL");
    ::unsetenv("LVMVIEW_COMMAND_TIMEOUT");
    ::unsetenv("LVMVIEW_LOG_FILE");
}

}  // namespace

TEST_CASE("config test")
{
    clear_environment();

    SECTION("defaults")
    {
        Config config{};
        Config::set_defaults(config.data());
        config.apply_environment();

        const auto& data = config.data();
        REQUIRE_EQ(std::get<std::int32_t>(data.at("REFRESH_INTERVAL")), 5);
        REQUIRE_EQ(std::get<std::int32_t>(data.at("COMMAND_TIMEOUT")), 10000);
        REQUIRE_EQ(std::get<std::string>(data.at("LOG_FILE")), "/tmp/lvmview.log"s);
        REQUIRE(config.rejected_overrides().empty());
    }
    SECTION("environment overrides")
    {
        ::setenv("LVMVIEW_REFRESH_INTERVAL", "30", 1);
        ::setenv("LVMVIEW_COMMAND_TIMEOUT", " 2500 ", 1);
        ::setenv("LVMVIEW_LOG_FILE", "/var/log/lvmview.log", 1);

        Config config{};
        Config::set_defaults(config.data());
        config.apply_environment();

        const auto& data = config.data();
        REQUIRE_EQ(std::get<std::int32_t>(data.at("REFRESH_INTERVAL")), 30);
        REQUIRE_EQ(std::get<std::int32_t>(data.at("COMMAND_TIMEOUT")), 2500);
        REQUIRE_EQ(std::get<std::string>(data.at("LOG_FILE")), "/var/log/lvmview.log"s);
        REQUIRE(config.rejected_overrides().empty());
        clear_environment();
    }
    SECTION("invalid overrides keep the defaults")
    {
        ::setenv("LVMVIEW_REFRESH_INTERVAL", "0", 1);
        ::setenv("LVMVIEW_COMMAND_TIMEOUT", "abc", 1);

        Config config{};
        Config::set_defaults(config.data());
        config.apply_environment();

        const auto& data = config.data();
        REQUIRE_EQ(std::get<std::int32_t>(data.at("REFRESH_INTERVAL")), 5);
        REQUIRE_EQ(std::get<std::int32_t>(data.at("COMMAND_TIMEOUT")), 10000);

        const auto& rejected = config.rejected_overrides();
        REQUIRE_EQ(rejected.size(), 2);
        REQUIRE_EQ(rejected[0], "LVMVIEW_REFRESH_INTERVAL=0");
        REQUIRE_EQ(rejected[1], "LVMVIEW_COMMAND_TIMEOUT=abc");
        clear_environment();
    }
    SECTION("out of range override")
    {
        ::setenv("LVMVIEW_COMMAND_TIMEOUT", "4294967295", 1);

        Config config{};
        Config::set_defaults(config.data());
        config.apply_environment();

        REQUIRE_EQ(std::get<std::int32_t>(config.data().at("COMMAND_TIMEOUT")), 10000);
        REQUIRE_EQ(config.rejected_overrides().size(), 1);
        clear_environment();
    }
    SECTION("singleton")
    {
        REQUIRE(Config::instance() == nullptr);
        REQUIRE(Config::initialize());
        REQUIRE(Config::instance() != nullptr);
        REQUIRE_EQ(std::get<std::int32_t>(Config::instance()->data().at("REFRESH_INTERVAL")), 5);
    }
}
