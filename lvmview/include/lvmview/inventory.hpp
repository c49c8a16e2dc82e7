#ifndef INVENTORY_HPP
#define INVENTORY_HPP

#include "lvmview/command_gateway.hpp"
#include "lvmview/topology.hpp"

#include <chrono>    // for system_clock
#include <cstddef>   // for size_t
#include <map>       // for map
#include <memory>    // for shared_ptr
#include <mutex>     // for mutex
#include <optional>  // for optional

namespace lvmview::inventory {

/// Outcome of one inventory command.
struct SourceReport {
    /// Set when the command failed or its output was unusable.
    std::optional<cmd::CommandError> error{};
    /// Records dropped while parsing the output.
    std::size_t skipped{};
};

/// Everything one refresh cycle learned about the host.
struct Snapshot {
    topology::Topology topology{};
    std::map<cmd::Command, SourceReport> sources{};
    std::chrono::system_clock::time_point taken_at{};

    /// @return The error of a source, nullptr when it succeeded.
    [[nodiscard]] auto source_error(cmd::Command command) const noexcept -> const cmd::CommandError*;

    /// @return Dropped records of all sources plus segments dropped by the topology join.
    [[nodiscard]] auto total_skipped() const noexcept -> std::size_t;
};

using RawOutputs = std::map<cmd::Command, cmd::CommandResult>;

/// @brief Runs every inventory command concurrently.
auto collect(const cmd::CommandGateway& gateway) noexcept -> RawOutputs;

/// @brief Parses the raw outputs and joins them into a snapshot.
/// A missing or failed source contributes no records.
auto build_snapshot(const RawOutputs& outputs) noexcept -> Snapshot;

/// Holds the latest published snapshot. Readers keep the snapshot they
/// loaded alive while a newer one is swapped in.
class SnapshotStore final {
 public:
    [[nodiscard]] auto load() const noexcept -> std::shared_ptr<const Snapshot>;
    void publish(Snapshot&& snapshot) noexcept;

 private:
    mutable std::mutex m_mutex{};
    std::shared_ptr<const Snapshot> m_current{};
};

}  // namespace lvmview::inventory

#endif  // INVENTORY_HPP
