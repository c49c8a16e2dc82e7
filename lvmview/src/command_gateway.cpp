#include "lvmview/command_gateway.hpp"
#include "lvmview/lvm.hpp"
#include "lvmview/string_utils.hpp"

#include <algorithm>     // for any_of, transform
#include <cctype>        // for tolower
#include <future>        // for async, future
#include <system_error>  // for system_error
#include <utility>       // for move, pair

#include <fmt/compile.h>
#include <fmt/format.h>
#include <fmt/ranges.h>

#include <spdlog/spdlog.h>

using namespace std::string_literals;
using namespace std::string_view_literals;

namespace {

namespace lvm = lvmview::lvm;
using lvmview::cmd::CommandError;
using lvmview::cmd::CommandLine;
using lvmview::cmd::ErrorKind;

static constexpr auto LSBLK_COLUMNS = "NAME,TYPE,SIZE,FSTYPE,LABEL,MOUNTPOINT,MODEL,PKNAME,PTTYPE,PARTTYPE,PARTTYPENAME"sv;

// stderr fragments of tools that need root to open devices or the LVM lock
static constexpr std::array PERMISSION_DIAGNOSTICS{
    "permission denied"sv,
    "must be root"sv,
    "operation not permitted"sv,
    "requires root"sv,
};

template <std::size_t N>
auto lvm_report_line(std::string_view program, bool segments, const std::array<std::string_view, N>& fields) noexcept -> CommandLine {
    CommandLine line{std::string{program}};
    if (segments) {
        line.emplace_back("--segments"s);
    }
    line.insert(line.end(), {"--noheadings"s, "--units"s, "b"s, "--nosuffix"s, "--separator"s, std::string(1, lvm::REPORT_SEPARATOR)});
    line.emplace_back("-o"s);
    line.emplace_back(fmt::format(FMT_COMPILE("{}"), fmt::join(fields, ",")));
    return line;
}

auto to_lower(std::string_view str) noexcept -> std::string {
    std::string res{str};
    std::ranges::transform(res, res.begin(), [](unsigned char ch) { return static_cast<char>(std::tolower(ch)); });
    return res;
}

/// First non-blank diagnostic line, prefixed `WARNING:` lines of LVM are noise.
auto first_error_line(std::string_view err) noexcept -> std::string_view {
    std::string_view fallback{};
    for (auto&& raw_line : lvmview::utils::make_split_view(err)) {
        const auto line = lvmview::utils::trim(raw_line);
        if (line.empty()) {
            continue;
        }
        if (!line.starts_with("WARNING:"sv)) {
            return line;
        }
        if (fallback.empty()) {
            fallback = line;
        }
    }
    return fallback;
}

}  // namespace

namespace lvmview::cmd {

auto command_line(Command command) noexcept -> CommandLine {
    switch (command) {
    case Command::ListBlockDevices:
        return {"lsblk"s, "-J"s, "-b"s, "-p"s, "-o"s, std::string{LSBLK_COLUMNS}};
    case Command::ListPartitionTable:
        return {"fdisk"s, "-l"s};
    case Command::ListPartitionLayout:
        return {"parted"s, "-s"s, "-m"s, "unit"s, "B"s, "print"s, "all"s};
    case Command::ReportPhysicalVolumes:
        return lvm_report_line("pvs"sv, false, lvm::PV_REPORT_FIELDS);
    case Command::ReportVolumeGroups:
        return lvm_report_line("vgs"sv, false, lvm::VG_REPORT_FIELDS);
    case Command::ReportLogicalVolumes:
        return lvm_report_line("lvs"sv, false, lvm::LV_REPORT_FIELDS);
    case Command::ReportSegments:
        return lvm_report_line("lvs"sv, true, lvm::SEGMENT_REPORT_FIELDS);
    case Command::FilesystemUsage:
        return {"df"s, "-B1"s, "--output=source,size,used,avail,target"s};
    }
    return {};
}

auto command_name(Command command) noexcept -> std::string_view {
    switch (command) {
    case Command::ListBlockDevices:
        return "lsblk"sv;
    case Command::ListPartitionTable:
        return "fdisk"sv;
    case Command::ListPartitionLayout:
        return "parted"sv;
    case Command::ReportPhysicalVolumes:
        return "pvs"sv;
    case Command::ReportVolumeGroups:
        return "vgs"sv;
    case Command::ReportLogicalVolumes:
        return "lvs"sv;
    case Command::ReportSegments:
        return "lvs --segments"sv;
    case Command::FilesystemUsage:
        return "df"sv;
    }
    return "unknown"sv;
}

auto describe_error(const CommandError& error) noexcept -> std::string {
    switch (error.kind) {
    case ErrorKind::PermissionDenied:
        return "permission denied"s;
    case ErrorKind::NotFound:
        return "command not found"s;
    case ErrorKind::ExecutionFailed:
    default:
        return error.reason.empty() ? "execution failed"s : error.reason;
    }
}

auto classify_output(std::string_view program, utils::ProcessOutput&& output) noexcept -> CommandResult {
    if (output.timed_out) {
        return std::unexpected(CommandError{.kind = ErrorKind::ExecutionFailed, .reason = "timed out"s});
    }
    if (output.exit_code == 0) {
        return std::move(output.out);
    }

    const auto err_lower = to_lower(output.err);
    if (std::ranges::any_of(PERMISSION_DIAGNOSTICS, [&](auto&& diag) { return err_lower.find(diag) != std::string::npos; })) {
        spdlog::warn("[{}] permission denied: {}", program, first_error_line(output.err));
        return std::unexpected(CommandError{.kind = ErrorKind::PermissionDenied});
    }

    const auto err_line = first_error_line(output.err);
    auto reason         = err_line.empty()
        ? fmt::format(FMT_COMPILE("exit code {}"), output.exit_code)
        : std::string{err_line};
    spdlog::error("[{}] failed with exit code {}: {}", program, output.exit_code, reason);
    return std::unexpected(CommandError{.kind = ErrorKind::ExecutionFailed, .reason = std::move(reason)});
}

auto run_system_command(const CommandLine& command, std::chrono::milliseconds timeout) noexcept -> CommandResult {
    if (command.empty()) {
        return std::unexpected(CommandError{.kind = ErrorKind::ExecutionFailed, .reason = "empty command"s});
    }

    const auto program_path = utils::find_program(command.front());
    if (!program_path) {
        spdlog::error("[{}] not found in {}", command.front(), utils::SEARCH_PATH);
        return std::unexpected(CommandError{.kind = ErrorKind::NotFound});
    }

    auto resolved  = command;
    resolved.front() = *program_path;

    auto output = utils::run_captured(resolved, timeout);
    if (!output) {
        spdlog::error("[{}] {}", command.front(), output.error());
        return std::unexpected(CommandError{.kind = ErrorKind::ExecutionFailed, .reason = std::move(output.error())});
    }
    return classify_output(command.front(), std::move(*output));
}

CommandGateway::CommandGateway(std::chrono::milliseconds timeout, Runner runner) noexcept
  : m_timeout(timeout), m_runner(std::move(runner)) { }

auto CommandGateway::execute(Command command) const noexcept -> CommandResult {
    if (!m_runner) {
        return std::unexpected(CommandError{.kind = ErrorKind::ExecutionFailed, .reason = "no runner"s});
    }
    try {
        return m_runner(command_line(command), m_timeout);
    } catch (const std::exception& e) {
        spdlog::error("[{}] runner failed: {}", command_name(command), e.what());
        return std::unexpected(CommandError{.kind = ErrorKind::ExecutionFailed, .reason = e.what()});
    }
}

auto CommandGateway::execute_all(const std::vector<Command>& commands) const noexcept -> std::map<Command, CommandResult> {
    std::vector<std::pair<Command, std::future<CommandResult>>> pending{};
    std::map<Command, CommandResult> results{};

    for (const auto command : commands) {
        try {
            pending.emplace_back(command, std::async(std::launch::async, [this, command] { return execute(command); }));
        } catch (const std::system_error& err) {
            // no thread available, run it on the caller
            spdlog::warn("[gateway] cannot start worker for '{}': {}", command_name(command), err.what());
            results.insert_or_assign(command, execute(command));
        }
    }
    for (auto& [command, future] : pending) {
        results.insert_or_assign(command, future.get());
    }
    return results;
}

}  // namespace lvmview::cmd
