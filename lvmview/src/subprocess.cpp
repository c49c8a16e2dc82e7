#include "lvmview/subprocess.hpp"
#include "lvmview/io_utils.hpp"
#include "lvmview/string_utils.hpp"

#include <unistd.h>  // for access

#include <subprocess.h>

#include <algorithm>     // for transform
#include <array>         // for array
#include <chrono>        // for steady_clock
#include <filesystem>    // for path, is_regular_file
#include <future>        // for async, future_status
#include <iterator>      // for back_inserter
#include <system_error>  // for system_error
#include <utility>       // for move, exchange

#include <fmt/ranges.h>
#include <spdlog/spdlog.h>

namespace fs = std::filesystem;
using namespace std::string_view_literals;

namespace {

// Locale is pinned so numbers and unit suffixes do not depend on the user's environment
constexpr const char* PROCESS_ENVIRONMENT[] = {
    "PATH=/sbin:/bin:/usr/local/sbin:/usr/local/bin:/usr/bin:/usr/sbin",
    "LC_ALL=C",
    nullptr,
};

using read_fn_t = unsigned (*)(subprocess_s*, char*, unsigned);

auto read_all(subprocess_s* process, read_fn_t read_fn) noexcept -> std::string {
    std::string result{};
    std::array<char, 8192> buf{};
    std::uint32_t bytes_read{};
    do {
        bytes_read = read_fn(process, buf.data(), static_cast<std::uint32_t>(buf.size()));
        if (bytes_read > 0) {
            result.append(buf.data(), bytes_read);
        }
    } while (bytes_read != 0);
    return result;
}

}  // namespace

namespace lvmview::utils {

struct SubProcess::Impl {
    subprocess_s proc{};
    bool spawned{};
    bool joined{};
};

SubProcess::SubProcess() : m_impl(std::make_unique<Impl>()) { }

SubProcess::~SubProcess() {
    if (!m_impl || !m_impl->spawned) {
        return;
    }
    if (!m_impl->joined) {
        subprocess_terminate(&m_impl->proc);
        [[maybe_unused]] auto exit_code = join();
    }
    if (subprocess_destroy(&m_impl->proc) != 0) {
        spdlog::warn("[subprocess] Failed to destroy process handle");
    }
}

SubProcess::SubProcess(SubProcess&& other) noexcept
  : m_impl(std::exchange(other.m_impl, nullptr)) { }

auto SubProcess::operator=(SubProcess&& other) noexcept -> SubProcess& {
    if (this != &other) {
        SubProcess discarded{std::move(*this)};
        m_impl = std::exchange(other.m_impl, nullptr);
    }
    return *this;
}

auto SubProcess::spawn(const std::vector<std::string>& args, const char* const environment[]) noexcept -> bool {
    if (!m_impl || m_impl->spawned || args.empty()) {
        return false;
    }

    std::vector<const char*> command{};
    std::transform(args.cbegin(), args.cend(), std::back_inserter(command),
        [](const std::string& arg) -> const char* { return arg.c_str(); });
    command.push_back(nullptr);

    if (subprocess_create_ex(command.data(), subprocess_option_enable_async, environment, &m_impl->proc) != 0) {
        return false;
    }
    m_impl->spawned = true;
    return true;
}

auto SubProcess::has_child() const noexcept -> bool {
    return m_impl && m_impl->spawned && m_impl->proc.child != 0;
}

auto SubProcess::terminate() noexcept -> bool {
    return has_child() && subprocess_terminate(&m_impl->proc) == 0;
}

auto SubProcess::read_stdout() noexcept -> std::string {
    if (!has_child()) {
        return {};
    }
    return read_all(&m_impl->proc, subprocess_read_stdout);
}

auto SubProcess::read_stderr() noexcept -> std::string {
    if (!has_child()) {
        return {};
    }
    return read_all(&m_impl->proc, subprocess_read_stderr);
}

auto SubProcess::join() noexcept -> std::optional<std::int32_t> {
    if (!has_child() || m_impl->joined) {
        return std::nullopt;
    }
    int ret{};
    if (subprocess_join(&m_impl->proc, &ret) != 0) {
        spdlog::error("[subprocess] Failed to join process: return code {}", ret);
        return std::nullopt;
    }
    m_impl->joined = true;
    return static_cast<std::int32_t>(ret);
}

auto find_program(std::string_view name) noexcept -> std::optional<std::string> {
    if (name.empty()) {
        return std::nullopt;
    }
    for (auto&& dir : utils::make_split_view(SEARCH_PATH, ':')) {
        const auto candidate = fs::path{dir} / name;
        std::error_code err_code{};
        if (fs::is_regular_file(candidate, err_code) && access(candidate.c_str(), X_OK) == 0) {
            return candidate.string();
        }
    }
    return std::nullopt;
}

auto run_captured(const std::vector<std::string>& args, std::chrono::milliseconds timeout) noexcept
    -> std::expected<ProcessOutput, std::string> {
    const bool log_exec_cmds = utils::safe_getenv("LOG_EXEC_CMDS") == "1"sv;
    if (log_exec_cmds && spdlog::default_logger_raw() != nullptr) {
        spdlog::debug("[run_captured] cmd := {}", args);
    }

    SubProcess child{};
    if (!child.spawn(args, PROCESS_ENVIRONMENT)) {
        return std::unexpected(fmt::format("failed to spawn '{}'", args.empty() ? ""sv : std::string_view{args.front()}));
    }

    // stdout and stderr are drained on their own threads: a child filling one
    // pipe must not stall behind a reader blocked on the other
    const auto deadline = std::chrono::steady_clock::now() + timeout;
    std::future<std::string> out_reader{};
    std::future<std::string> err_reader{};
    try {
        out_reader = std::async(std::launch::async, [&child] { return child.read_stdout(); });
        err_reader = std::async(std::launch::async, [&child] { return child.read_stderr(); });
    } catch (const std::system_error& err) {
        child.terminate();
        if (out_reader.valid()) {
            out_reader.wait();
        }
        return std::unexpected(fmt::format("failed to start reader for '{}': {}", args.front(), err.what()));
    }

    bool timed_out{};
    if (out_reader.wait_until(deadline) == std::future_status::timeout
        || err_reader.wait_until(deadline) == std::future_status::timeout) {
        spdlog::warn("[run_captured] '{}' timed out after {}ms, killing it", args.front(), timeout.count());
        timed_out = true;
        child.terminate();
    }

    ProcessOutput output{};
    output.out       = out_reader.get();
    output.err       = err_reader.get();
    output.timed_out = timed_out;

    const auto exit_code = child.join();
    if (!exit_code) {
        return std::unexpected(fmt::format("failed to wait for '{}'", args.front()));
    }
    output.exit_code = *exit_code;
    return output;
}

}  // namespace lvmview::utils
