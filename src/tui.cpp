#include "tui.hpp"
#include "config.hpp"
#include "screen_service.hpp"
#include "screen_surface.hpp"

// import lvmview
#include "lvmview/command_gateway.hpp"
#include "lvmview/inventory.hpp"
#include "lvmview/io_utils.hpp"
#include "lvmview/layout.hpp"
#include "lvmview/panel_renderer.hpp"
#include "lvmview/refresh_worker.hpp"
#include "lvmview/ui_state.hpp"

#include <chrono>   // for seconds, milliseconds
#include <memory>   // for shared_ptr
#include <utility>  // for move

#include <spdlog/spdlog.h>

/* clang-format off */
#include <ftxui/component/component.hpp>           // for Renderer, CatchEvent
#include <ftxui/component/event.hpp>               // for Event
#include <ftxui/component/screen_interactive.hpp>  // for ScreenInteractive
/* clang-format on */

using namespace ftxui;

namespace tui {

void init() {
    auto* config_instance       = Config::instance();
    auto& config_data           = config_instance->data();
    const auto refresh_interval = std::chrono::seconds(std::get<std::int32_t>(config_data["REFRESH_INTERVAL"]));
    const auto command_timeout  = std::chrono::milliseconds(std::get<std::int32_t>(config_data["COMMAND_TIMEOUT"]));

    auto& screen = screen_service::instance()->data();

    const lvmview::cmd::CommandGateway gateway{command_timeout};
    lvmview::inventory::SnapshotStore store{};
    lvmview::inventory::RefreshWorker worker{
        store,
        [&gateway] { return lvmview::inventory::collect(gateway); },
        refresh_interval,
        [] { screen_service::instance()->post_refresh(); },
    };

    lvmview::ui::UiState state{};
    std::shared_ptr<const lvmview::inventory::Snapshot> current{};
    const lvmview::ui::FrameOptions frame_options{.is_root = lvmview::utils::is_root()};

    // swap in the latest snapshot, keeping selections that still exist
    auto adopt_snapshot = [&] {
        auto next = store.load();
        if (!next || next == current) {
            return;
        }
        state.refresh(current ? &current->topology : nullptr, next->topology);
        current = std::move(next);
    };

    auto renderer = Renderer([&] {
        return surface_element([&](lvmview::ui::Surface& surface) {
            if (const auto layout = lvmview::layout::compute_layout(surface.width(), surface.height())) {
                state.fit_viewports(*layout);
            }
            const auto failures = lvmview::ui::render_frame(current.get(), state, surface, frame_options);
            if (failures > 0) {
                spdlog::debug("[tui] {} writes rejected in frame", failures);
            }
        });
    });

    auto handler = CatchEvent(renderer, [&](const Event& event) {
        if (event == Event::Custom) {
            adopt_snapshot();
            return true;
        }
        if (event == Event::Tab) {
            state.cycle_focus();
            return true;
        }

        const auto item_count = current ? lvmview::ui::panel_item_count(current->topology, state.focus()) : 0;
        if (event == Event::ArrowUp || event == Event::Character('k')) {
            state.move_selection(-1, item_count);
            return true;
        }
        if (event == Event::ArrowDown || event == Event::Character('j')) {
            state.move_selection(1, item_count);
            return true;
        }
        if (event == Event::Character('r')) {
            spdlog::info("[tui] manual refresh requested");
            worker.trigger();
            return true;
        }
        if (event == Event::Character('q') || event == Event::Escape) {
            screen.ExitLoopClosure()();
            return true;
        }
        return false;
    });

    if (!worker.start()) {
        // no background thread: show one snapshot taken now
        store.publish(lvmview::inventory::build_snapshot(lvmview::inventory::collect(gateway)));
        adopt_snapshot();
    }

    screen.Loop(handler);
    worker.stop();
}

}  // namespace tui
