#include "screen_service.hpp"
#include "definitions.hpp"

#include <memory>  // for unique_ptr, make_unique

#include <ftxui/component/event.hpp>  // for Event

namespace tui {
static std::unique_ptr<screen_service> s_screen = nullptr;

bool screen_service::initialize() noexcept {
    if (s_screen != nullptr) {
        error_inter("You should only initialize it once!\n");
        return false;
    }
    s_screen = std::make_unique<screen_service>();
    return s_screen.get();
}

auto screen_service::instance() -> screen_service* {
    return s_screen.get();
}

void screen_service::post_refresh() noexcept {
    m_screen.PostEvent(ftxui::Event::Custom);
}

}  // namespace tui
