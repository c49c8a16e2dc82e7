#include "config.hpp"
#include "definitions.hpp"  // for error_inter

// import lvmview
#include "lvmview/io_utils.hpp"
#include "lvmview/string_utils.hpp"

#include <array>    // for array
#include <limits>   // for numeric_limits
#include <memory>   // for unique_ptr, make_unique, operator==
#include <utility>  // for pair

#include <fmt/compile.h>
#include <fmt/format.h>

using namespace std::string_view_literals;

static std::unique_ptr<Config> s_config = nullptr;

namespace {

// config key, environment variable
constexpr std::array NUMERIC_OVERRIDES{
    std::pair{"REFRESH_INTERVAL"sv, "LVMVIEW_REFRESH_INTERVAL"},
    std::pair{"COMMAND_TIMEOUT"sv, "LVMVIEW_COMMAND_TIMEOUT"},
};

}  // namespace

bool Config::initialize() noexcept {
    if (s_config != nullptr) {
        error_inter("You should only initialize it once!\n");
        return false;
    }
    s_config = std::make_unique<Config>();
    if (s_config) {
        set_defaults(s_config->m_data);
        s_config->apply_environment();
    }

    return s_config.get();
}

auto Config::instance() -> Config* {
    return s_config.get();
}

void Config::set_defaults(reference data) noexcept {
    data["REFRESH_INTERVAL"] = 5;
    data["COMMAND_TIMEOUT"]  = 10000;
    data["LOG_FILE"]         = "/tmp/lvmview.log";
}

void Config::apply_environment() noexcept {
    for (auto&& [key, env_name] : NUMERIC_OVERRIDES) {
        const auto env_value = lvmview::utils::safe_getenv(env_name);
        if (env_value.empty()) {
            continue;
        }
        const auto parsed = lvmview::utils::parse_uint<std::uint32_t>(env_value);
        if (!parsed || *parsed == 0 || *parsed > static_cast<std::uint32_t>(std::numeric_limits<std::int32_t>::max())) {
            m_rejected.emplace_back(fmt::format(FMT_COMPILE("{}={}"), env_name, env_value));
            continue;
        }
        m_data[key] = static_cast<std::int32_t>(*parsed);
    }

    const auto log_file = lvmview::utils::safe_getenv("LVMVIEW_LOG_FILE");
    if (!log_file.empty()) {
        m_data["LOG_FILE"] = std::string{log_file};
    }
}
