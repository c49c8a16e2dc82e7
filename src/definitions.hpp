#ifndef DEFINITIONS_HPP
#define DEFINITIONS_HPP

#include <cstdio>  // for stderr

#include <fmt/color.h>
#include <fmt/core.h>

// Messages printed before the TUI owns the terminal, or after it released it
#define output_inter(...)  fmt::print(__VA_ARGS__)
#define error_inter(...)   fmt::print(stderr, fmt::fg(fmt::color::red), __VA_ARGS__)
#define warning_inter(...) fmt::print(stderr, fmt::fg(fmt::color::yellow), __VA_ARGS__)

#endif  // DEFINITIONS_HPP
