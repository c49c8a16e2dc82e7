#ifndef PARSE_RESULT_HPP
#define PARSE_RESULT_HPP

#include <cstddef>  // for size_t
#include <vector>   // for vector

namespace lvmview {

/// Records parsed from one tool's output. Malformed lines are not fatal,
/// they are dropped and counted in `skipped`.
template <typename T>
struct ParseResult {
    std::vector<T> records{};
    std::size_t skipped{};
};

}  // namespace lvmview

#endif  // PARSE_RESULT_HPP
