#include "config.hpp"          // for Config
#include "definitions.hpp"     // for error_inter
#include "screen_service.hpp"  // for screen_service
#include "tui.hpp"             // for init

// import lvmview
#include "lvmview/io_utils.hpp"
#include "lvmview/logger.hpp"

#include <chrono>     // for seconds
#include <exception>  // for exception
#include <string>     // for string

#include <spdlog/async.h>                  // for create_async
#include <spdlog/common.h>                 // for debug
#include <spdlog/sinks/basic_file_sink.h>  // for basic_file_sink_mt
#include <spdlog/spdlog.h>                 // for set_default_logger, set_level

int main() {
    // The panels need a real terminal, not a pipe.
    if (!lvmview::utils::has_terminal()) {
        error_inter("lvmview must be run in an interactive terminal!\n");
        return 1;
    }

    // Initialize default config.
    if (!Config::initialize()) {
        return 1;
    }
    auto* config_instance = Config::instance();
    auto& config_data     = config_instance->data();

    // Initialize logger.
    const auto log_file = std::get<std::string>(config_data["LOG_FILE"]);
    std::shared_ptr<spdlog::logger> logger{};
    try {
        logger = spdlog::create_async<spdlog::sinks::basic_file_sink_mt>("lvmview_logger", log_file);
    } catch (const spdlog::spdlog_ex& ex) {
        error_inter("Failed to open log file '{}': {}\n", log_file, ex.what());
        return 1;
    }
    spdlog::set_default_logger(logger);
    spdlog::set_pattern("[%r][%^---%L---%$] %v");
    spdlog::set_level(spdlog::level::debug);
    spdlog::flush_every(std::chrono::seconds(5));

    // Set lvmview logger.
    lvmview::logger::set_logger(logger);

    for (auto&& rejected : config_instance->rejected_overrides()) {
        spdlog::warn("[config] ignoring invalid override {}", rejected);
    }
    spdlog::info("[config] refresh interval {}s, command timeout {}ms", std::get<std::int32_t>(config_data["REFRESH_INTERVAL"]), std::get<std::int32_t>(config_data["COMMAND_TIMEOUT"]));

    if (!lvmview::utils::is_root()) {
        spdlog::warn("Running without root privileges, LVM and partition data may be incomplete");
    }

    if (!tui::screen_service::initialize()) {
        spdlog::shutdown();
        return 1;
    }

    int exit_code{};
    try {
        tui::init();
    } catch (const std::exception& e) {
        // FTXUI restored the terminal while unwinding
        spdlog::error("Terminal failure: {}", e.what());
        error_inter("lvmview: terminal failure: {}\n", e.what());
        exit_code = 1;
    }

    spdlog::shutdown();
    return exit_code;
}
