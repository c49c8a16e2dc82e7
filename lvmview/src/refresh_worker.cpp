#include "lvmview/refresh_worker.hpp"

#include <system_error>  // for system_error
#include <utility>       // for move

#include <spdlog/spdlog.h>

namespace lvmview::inventory {

RefreshWorker::RefreshWorker(SnapshotStore& store, collect_fn_t collect_fn, std::chrono::milliseconds interval, notify_fn_t on_published) noexcept
  : m_store(store), m_collect_fn(std::move(collect_fn)), m_interval(interval), m_on_published(std::move(on_published)) { }

RefreshWorker::~RefreshWorker() {
    stop();
}

auto RefreshWorker::start() noexcept -> bool {
    if (m_thread.joinable()) {
        return true;
    }
    try {
        m_thread = std::thread([this] { run(); });
    } catch (const std::system_error& err) {
        spdlog::error("[refresh] failed to start worker: {}", err.what());
        return false;
    }
    return true;
}

void RefreshWorker::trigger() noexcept {
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_triggered = true;
    }
    m_cv.notify_one();
}

void RefreshWorker::stop() noexcept {
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_stop_requested = true;
    }
    m_cv.notify_one();
    if (m_thread.joinable()) {
        m_thread.join();
    }
}

void RefreshWorker::run() noexcept {
    while (true) {
        spdlog::debug("[refresh] collecting inventory");
        try {
            m_store.publish(build_snapshot(m_collect_fn()));
            ++m_cycles;
        } catch (const std::exception& e) {
            // a failed cycle keeps the previous snapshot on screen
            spdlog::error("[refresh] cycle failed: {}", e.what());
        }
        if (m_on_published) {
            m_on_published();
        }

        std::unique_lock<std::mutex> lock(m_mutex);
        m_cv.wait_for(lock, m_interval, [this] { return m_stop_requested || m_triggered; });
        if (m_stop_requested) {
            break;
        }
        m_triggered = false;
    }
    spdlog::debug("[refresh] worker stopped");
}

}  // namespace lvmview::inventory
