#ifndef SUBPROCESS_HPP
#define SUBPROCESS_HPP

#include <chrono>       // for milliseconds
#include <cstdint>      // for int32_t
#include <expected>     // for expected
#include <memory>       // for unique_ptr
#include <optional>     // for optional
#include <string>       // for string
#include <string_view>  // for string_view
#include <vector>       // for vector

namespace lvmview::utils {

// Wrapper around thirdparty subprocess handle
class SubProcess final {
 public:
    SubProcess();
    ~SubProcess();

    // explicitly deleted (move-only)
    SubProcess(const SubProcess&)     = delete;
    auto operator=(const SubProcess&) = delete;

    SubProcess(SubProcess&& other) noexcept;
    auto operator=(SubProcess&& other) noexcept -> SubProcess&;

    /// @brief Spawn the process with separate stdout/stderr pipes.
    /// @param args The program (absolute path) and its arguments.
    /// @param environment Null-terminated environment block.
    /// @return true on success.
    auto spawn(const std::vector<std::string>& args, const char* const environment[]) noexcept -> bool;

    /// @return true when the process has been spawned and has a valid child pid.
    [[nodiscard]] auto has_child() const noexcept -> bool;

    /// @brief Send SIGKILL to the child.
    /// @return true on success.
    auto terminate() noexcept -> bool;

    /// @brief Read stdout until the child closes it.
    auto read_stdout() noexcept -> std::string;

    /// @brief Read stderr until the child closes it.
    auto read_stderr() noexcept -> std::string;

    /// @brief Wait for the child to exit.
    /// @return The exit code, std::nullopt if the join failed.
    auto join() noexcept -> std::optional<std::int32_t>;

 private:
    struct Impl;
    std::unique_ptr<Impl> m_impl;
};

/// Captured result of a finished (or killed) process.
struct ProcessOutput {
    std::string out{};
    std::string err{};
    std::int32_t exit_code{};
    bool timed_out{};
};

/// Fixed search path used to resolve inventory programs.
inline constexpr std::string_view SEARCH_PATH = "/sbin:/bin:/usr/local/sbin:/usr/local/bin:/usr/bin:/usr/sbin";

/// @brief Resolves a program name against SEARCH_PATH.
/// @return The absolute path of an executable file, std::nullopt otherwise.
auto find_program(std::string_view name) noexcept -> std::optional<std::string>;

/// @brief Runs a program to completion, killing it once the timeout expires.
/// @param args The program (absolute path) and its arguments.
/// @param timeout Upper bound for the whole invocation.
/// @return Captured output, or the reason the process could not be started.
auto run_captured(const std::vector<std::string>& args, std::chrono::milliseconds timeout) noexcept
    -> std::expected<ProcessOutput, std::string>;

}  // namespace lvmview::utils

#endif  // SUBPROCESS_HPP
