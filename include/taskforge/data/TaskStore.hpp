#pragma once

#include <QHash>
#include <QUuid>
#include <cstddef>
#include <mutex>
#include <optional>
#include <vector>

#include "taskforge/core/OperationStatus.hpp"
#include "taskforge/data/Task.hpp"

namespace taskforge {
namespace core {
class Clock;
}

namespace data {

class TaskStorage;
struct StoreSnapshot;

struct SweepOutcome
{
    std::vector<TaskItem> removed;
    core::OperationStatus saveStatus;
};

// Authoritative task collection. Every call holds one lock for its whole
// read/mutate/save sequence; mutations are written through to the storage
// before the call returns. When that write fails the change stays in memory
// and the call reports IOError.
class TaskStore
{
public:
    TaskStore(TaskStorage &storage, const core::Clock &clock);
    ~TaskStore();

    TaskStore(const TaskStore &) = delete;
    TaskStore &operator=(const TaskStore &) = delete;

    // Replaces the in-memory state with the storage contents.
    core::OperationStatus load();

    core::OperationResult<QUuid> createTask(const TaskDraft &draft);
    core::OperationStatus editTask(const QUuid &id, const TaskUpdate &update);
    core::OperationStatus deleteTask(const QUuid &id);
    core::OperationStatus completeTask(const QUuid &id);
    core::OperationStatus reopenTask(const QUuid &id);

    core::OperationStatus startTimer(const QUuid &id);
    core::OperationResult<qint64> stopTimer(const QUuid &id);
    core::OperationResult<qint64> elapsedNow(const QUuid &id) const;

    std::optional<TaskItem> findById(const QUuid &id) const;
    std::vector<TaskSummary> findByIdPrefix(const QString &prefix) const;
    std::vector<TaskSummary> findByTitle(const QString &needle, Qt::CaseSensitivity sensitivity) const;
    std::vector<TaskSummary> search(const QString &query) const;
    std::vector<TaskSummary> listPending() const;
    std::vector<TaskSummary> listCompleted() const;
    std::size_t count() const;

    // Removes every task whose deadline is at or before the clock's now.
    SweepOutcome sweepExpired();

private:
    core::OperationStatus persistLocked() const;
    StoreSnapshot snapshotLocked() const;
    std::vector<const TaskItem *> inCreationOrderLocked() const;
    std::vector<TaskSummary> listByStatus(TaskStatus status) const;

    TaskStorage &m_storage;
    const core::Clock &m_clock;
    mutable std::mutex m_mutex;
    QHash<QUuid, TaskItem> m_tasks;
    quint64 m_nextSequence = 1;
};

} // namespace data
} // namespace taskforge
