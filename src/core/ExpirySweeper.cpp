#include "taskforge/core/ExpirySweeper.hpp"

#include "taskforge/core/Logging.hpp"
#include "taskforge/data/TaskStore.hpp"

namespace taskforge {
namespace core {

ExpirySweeper::ExpirySweeper(data::TaskStore &store, std::chrono::milliseconds interval)
    : m_store(store)
    , m_interval(interval)
{
}

ExpirySweeper::~ExpirySweeper()
{
    stop();
}

void ExpirySweeper::setListener(Listener listener)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    m_listener = std::move(listener);
}

void ExpirySweeper::start()
{
    std::lock_guard<std::mutex> lock(m_mutex);
    if (m_thread.joinable()) {
        return;
    }
    m_stopRequested = false;
    m_stopped = false;
    m_thread = std::thread(&ExpirySweeper::run, this);
    qCInfo(lcSweeper) << "expiry sweeper started, interval" << m_interval.count() << "ms";
}

void ExpirySweeper::stop()
{
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (!m_thread.joinable()) {
            return;
        }
        m_stopRequested = true;
    }
    m_wakeup.notify_all();
    m_thread.join();
    m_stopped = true;
    qCInfo(lcSweeper) << "expiry sweeper stopped after" << static_cast<qulonglong>(m_sweepCount.load()) << "sweeps";
}

bool ExpirySweeper::isRunning() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_thread.joinable();
}

ExpirySweeper::State ExpirySweeper::state() const
{
    if (m_activeSweeps.load() > 0) {
        return State::Scanning;
    }
    return m_stopped.load() ? State::Stopped : State::Idle;
}

std::chrono::milliseconds ExpirySweeper::interval() const
{
    return m_interval;
}

std::size_t ExpirySweeper::sweepCount() const
{
    return m_sweepCount.load();
}

std::size_t ExpirySweeper::sweepNow()
{
    ++m_activeSweeps;
    const data::SweepOutcome outcome = m_store.sweepExpired();
    ++m_sweepCount;
    --m_activeSweeps;

    if (outcome.removed.empty()) {
        return 0;
    }
    for (const data::TaskItem &task : outcome.removed) {
        qCInfo(lcSweeper) << "removed overdue task" << task.shortId() << task.title << "deadline"
                          << task.deadline.toString(Qt::ISODate);
    }
    if (!outcome.saveStatus.ok()) {
        qCWarning(lcSweeper) << "could not persist sweep, state goes out with the next save:"
                             << outcome.saveStatus.message();
    }

    Listener listener;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        listener = m_listener;
    }
    if (listener) {
        listener(outcome.removed);
    }
    return outcome.removed.size();
}

void ExpirySweeper::run()
{
    std::unique_lock<std::mutex> lock(m_mutex);
    while (!m_stopRequested) {
        lock.unlock();
        sweepNow();
        lock.lock();
        if (m_wakeup.wait_for(lock, m_interval, [this]() { return m_stopRequested; })) {
            break;
        }
    }
}

} // namespace core
} // namespace taskforge
