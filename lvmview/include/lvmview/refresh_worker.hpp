#ifndef REFRESH_WORKER_HPP
#define REFRESH_WORKER_HPP

#include "lvmview/inventory.hpp"

#include <atomic>              // for atomic
#include <chrono>              // for milliseconds
#include <condition_variable>  // for condition_variable
#include <cstdint>             // for uint64_t
#include <functional>          // for function
#include <mutex>               // for mutex
#include <thread>              // for thread

namespace lvmview::inventory {

/// Background refresh loop: collect, build, publish, notify.
/// The first cycle starts right away, later ones once the interval
/// elapsed or trigger() was called.
class RefreshWorker final {
 public:
    using collect_fn_t = std::function<RawOutputs()>;
    using notify_fn_t  = std::function<void()>;

    RefreshWorker(SnapshotStore& store, collect_fn_t collect_fn, std::chrono::milliseconds interval, notify_fn_t on_published) noexcept;
    ~RefreshWorker();

    RefreshWorker(const RefreshWorker&)     = delete;
    auto operator=(const RefreshWorker&) = delete;

    /// @return false if the worker thread could not be started.
    auto start() noexcept -> bool;

    /// @brief Request a refresh without waiting for the interval.
    void trigger() noexcept;

    /// @brief Stop the loop and join the thread. A running cycle finishes first.
    void stop() noexcept;

    /// Number of snapshots published so far.
    [[nodiscard]] auto cycles() const noexcept -> std::uint64_t { return m_cycles.load(); }

 private:
    void run() noexcept;

    SnapshotStore& m_store;
    collect_fn_t m_collect_fn;
    std::chrono::milliseconds m_interval;
    notify_fn_t m_on_published;

    std::mutex m_mutex{};
    std::condition_variable m_cv{};
    bool m_stop_requested{};
    bool m_triggered{};
    std::atomic<std::uint64_t> m_cycles{};
    std::thread m_thread{};
};

}  // namespace lvmview::inventory

#endif  // REFRESH_WORKER_HPP
