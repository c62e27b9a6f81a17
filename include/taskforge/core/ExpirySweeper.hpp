#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <functional>
#include <mutex>
#include <thread>
#include <vector>

#include "taskforge/data/Task.hpp"

namespace taskforge {
namespace data {
class TaskStore;
}

namespace core {

/*
  Background thread that removes tasks whose deadline has passed.

  Sweeps once when started, then once per interval. A sweep holds the store
  lock and reports the removed tasks to the listener. stop() interrupts the
  idle wait and joins after any sweep in flight.
*/
class ExpirySweeper
{
public:
    enum class State
    {
        Idle,
        Scanning,
        Stopped,
    };

    using Listener = std::function<void(const std::vector<data::TaskItem> &)>;

    ExpirySweeper(data::TaskStore &store, std::chrono::milliseconds interval);
    ~ExpirySweeper();

    ExpirySweeper(const ExpirySweeper &) = delete;
    ExpirySweeper &operator=(const ExpirySweeper &) = delete;

    void setListener(Listener listener);

    void start();
    void stop();
    bool isRunning() const;

    State state() const;
    std::chrono::milliseconds interval() const;
    std::size_t sweepCount() const;

    // Runs one sweep on the calling thread; returns the number of removed
    // tasks.
    std::size_t sweepNow();

private:
    void run();

    data::TaskStore &m_store;
    const std::chrono::milliseconds m_interval;

    mutable std::mutex m_mutex;
    std::condition_variable m_wakeup;
    bool m_stopRequested = false;
    std::thread m_thread;
    Listener m_listener;

    std::atomic<int> m_activeSweeps{0};
    std::atomic<bool> m_stopped{false};
    std::atomic<std::size_t> m_sweepCount{0};
};

} // namespace core
} // namespace taskforge
