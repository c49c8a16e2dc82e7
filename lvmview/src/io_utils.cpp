#include "lvmview/io_utils.hpp"

#include <unistd.h>  // for geteuid, isatty

#include <cstdlib>  // for getenv

namespace lvmview::utils {

auto safe_getenv(const char* env_name) noexcept -> std::string_view {
    const char* const raw_val = getenv(env_name);
    return raw_val != nullptr ? std::string_view{raw_val} : std::string_view{};
}

auto is_root() noexcept -> bool {
    return geteuid() == 0;
}

auto has_terminal() noexcept -> bool {
    return isatty(STDIN_FILENO) == 1 && isatty(STDOUT_FILENO) == 1;
}

}  // namespace lvmview::utils
