#ifndef IO_UTILS_HPP
#define IO_UTILS_HPP

#include <string_view>  // for string_view

namespace lvmview::utils {

auto safe_getenv(const char* env_name) noexcept -> std::string_view;

// Whether the effective user can read full device/LVM metadata
auto is_root() noexcept -> bool;

// Whether both stdin and stdout are attached to a terminal
auto has_terminal() noexcept -> bool;

}  // namespace lvmview::utils

#endif  // IO_UTILS_HPP
