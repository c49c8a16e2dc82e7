#ifndef COMMAND_GATEWAY_HPP
#define COMMAND_GATEWAY_HPP

#include "lvmview/subprocess.hpp"

#include <array>        // for array
#include <chrono>       // for milliseconds
#include <cstdint>      // for uint8_t
#include <expected>     // for expected
#include <functional>   // for function
#include <map>          // for map
#include <string>       // for string
#include <string_view>  // for string_view
#include <vector>       // for vector

namespace lvmview::cmd {

/// Logical inventory commands. Each maps to one fixed program invocation.
enum class Command : std::uint8_t {
    ListBlockDevices,
    ListPartitionTable,
    ListPartitionLayout,
    ReportPhysicalVolumes,
    ReportVolumeGroups,
    ReportLogicalVolumes,
    ReportSegments,
    FilesystemUsage,
};

inline constexpr std::array ALL_COMMANDS{
    Command::ListBlockDevices,
    Command::ListPartitionTable,
    Command::ListPartitionLayout,
    Command::ReportPhysicalVolumes,
    Command::ReportVolumeGroups,
    Command::ReportLogicalVolumes,
    Command::ReportSegments,
    Command::FilesystemUsage,
};

enum class ErrorKind : std::uint8_t {
    ExecutionFailed,
    PermissionDenied,
    NotFound,
};

struct CommandError {
    ErrorKind kind{ErrorKind::ExecutionFailed};
    /// Human readable reason, set for ExecutionFailed.
    std::string reason{};
};

using CommandResult = std::expected<std::string, CommandError>;

/// Program name and arguments (argv[0] unresolved).
using CommandLine = std::vector<std::string>;

/// Executes a resolved command line. Tests substitute their own.
using Runner = std::function<CommandResult(const CommandLine&, std::chrono::milliseconds)>;

/// @brief Fixed argument list of a logical command.
auto command_line(Command command) noexcept -> CommandLine;

/// @brief Short name used in logs and the status line (e.g. "lsblk", "lvs --segments").
auto command_name(Command command) noexcept -> std::string_view;

/// @brief One line description of an error (e.g. "permission denied").
auto describe_error(const CommandError& error) noexcept -> std::string;

/// @brief Maps a finished process to a CommandResult.
/// Non-zero exit codes are classified by the diagnostics on stderr.
auto classify_output(std::string_view program, utils::ProcessOutput&& output) noexcept -> CommandResult;

/// @brief Resolves the program against the fixed search path and runs it.
auto run_system_command(const CommandLine& command, std::chrono::milliseconds timeout) noexcept -> CommandResult;

class CommandGateway final {
 public:
    explicit CommandGateway(std::chrono::milliseconds timeout, Runner runner = run_system_command) noexcept;

    /// @brief Runs one command to completion or timeout.
    auto execute(Command command) const noexcept -> CommandResult;

    /// @brief Runs the commands concurrently.
    /// Returns once every command has completed or timed out.
    auto execute_all(const std::vector<Command>& commands) const noexcept -> std::map<Command, CommandResult>;

    [[nodiscard]] auto timeout() const noexcept -> std::chrono::milliseconds { return m_timeout; }

 private:
    std::chrono::milliseconds m_timeout;
    Runner m_runner;
};

}  // namespace lvmview::cmd

#endif  // COMMAND_GATEWAY_HPP
