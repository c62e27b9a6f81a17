#include "taskforge/data/TaskStore.hpp"

#include "taskforge/core/Clock.hpp"
#include "taskforge/core/Logging.hpp"
#include "taskforge/data/TaskStorage.hpp"
#include "taskforge/data/TaskTimer.hpp"

#include <algorithm>

namespace taskforge {
namespace data {

using core::ErrorCode;
using core::OperationResult;
using core::OperationStatus;

namespace {
OperationStatus notFound(const QUuid &id)
{
    return OperationStatus::failure(ErrorCode::NotFound, QStringLiteral("no task with id %1").arg(taskIdText(id)));
}

// Pending/completed listings: earliest deadline first, tasks without a
// deadline last, creation order among equals.
bool deadlineOrder(const TaskItem *lhs, const TaskItem *rhs)
{
    if (lhs->hasDeadline() != rhs->hasDeadline()) {
        return lhs->hasDeadline();
    }
    if (lhs->hasDeadline() && lhs->deadline != rhs->deadline) {
        return lhs->deadline < rhs->deadline;
    }
    return lhs->sequence < rhs->sequence;
}
} // namespace

TaskStore::TaskStore(TaskStorage &storage, const core::Clock &clock)
    : m_storage(storage)
    , m_clock(clock)
{
}

TaskStore::~TaskStore() = default;

OperationStatus TaskStore::load()
{
    auto loaded = m_storage.load();
    if (!loaded.ok()) {
        return loaded.status();
    }

    std::lock_guard<std::mutex> lock(m_mutex);
    m_tasks.clear();
    const StoreSnapshot &snapshot = loaded.value();
    quint64 highestSequence = 0;
    for (const TaskItem &task : snapshot.tasks) {
        m_tasks.insert(task.id, task);
        highestSequence = std::max(highestSequence, task.sequence);
        if (task.isRunning()) {
            qCInfo(lcStore) << "resuming timer of" << task.shortId() << "started at"
                            << task.runStartedAt.toString(Qt::ISODate);
        }
    }
    m_nextSequence = std::max(snapshot.nextSequence, highestSequence + 1);
    qCInfo(lcStore) << "loaded" << m_tasks.size() << "tasks from" << m_storage.location();
    return OperationStatus::success();
}

OperationResult<QUuid> TaskStore::createTask(const TaskDraft &draft)
{
    const auto valid = validateDraft(draft);
    if (!valid.ok()) {
        return valid;
    }

    std::lock_guard<std::mutex> lock(m_mutex);
    TaskItem task;
    // Only live ids are checked; a deleted id coming back would need a v4 collision.
    do {
        task.id = QUuid::createUuid();
    } while (m_tasks.contains(task.id));
    task.title = draft.title.trimmed();
    task.category = draft.category.trimmed();
    task.description = draft.description.trimmed();
    task.quantity = draft.quantity;
    task.deadline = draft.deadline.value_or(QDateTime());
    task.createdAt = m_clock.now();
    task.sequence = m_nextSequence++;
    m_tasks.insert(task.id, task);
    qCDebug(lcStore) << "created" << task.shortId() << task.title;

    return OperationResult<QUuid>(persistLocked(), task.id);
}

OperationStatus TaskStore::editTask(const QUuid &id, const TaskUpdate &update)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    auto it = m_tasks.find(id);
    if (it == m_tasks.end()) {
        return notFound(id);
    }
    const auto valid = validateUpdate(update);
    if (!valid.ok()) {
        return valid;
    }
    if (update.isEmpty()) {
        return OperationStatus::success();
    }

    TaskItem &task = it.value();
    if (update.title) {
        task.title = update.title->trimmed();
    }
    if (update.category) {
        task.category = update.category->trimmed();
    }
    if (update.description) {
        task.description = update.description->trimmed();
    }
    if (update.quantity) {
        task.quantity = update.quantity;
    } else if (update.clearQuantity) {
        task.quantity.reset();
    }
    if (update.deadline) {
        task.deadline = *update.deadline;
    } else if (update.clearDeadline) {
        task.deadline = QDateTime();
    }
    if (update.status) {
        task.status = *update.status;
    }
    qCDebug(lcStore) << "edited" << task.shortId();
    return persistLocked();
}

OperationStatus TaskStore::deleteTask(const QUuid &id)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    if (m_tasks.remove(id) == 0) {
        return notFound(id);
    }
    qCDebug(lcStore) << "deleted" << shortTaskId(id);
    return persistLocked();
}

OperationStatus TaskStore::completeTask(const QUuid &id)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    auto it = m_tasks.find(id);
    if (it == m_tasks.end()) {
        return notFound(id);
    }
    if (it->status == TaskStatus::Completed) {
        return OperationStatus::success();
    }
    it->status = TaskStatus::Completed;
    return persistLocked();
}

OperationStatus TaskStore::reopenTask(const QUuid &id)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    auto it = m_tasks.find(id);
    if (it == m_tasks.end()) {
        return notFound(id);
    }
    if (it->status == TaskStatus::Pending) {
        return OperationStatus::success();
    }
    it->status = TaskStatus::Pending;
    return persistLocked();
}

OperationStatus TaskStore::startTimer(const QUuid &id)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    auto it = m_tasks.find(id);
    if (it == m_tasks.end()) {
        return notFound(id);
    }
    const auto started = data::startTimer(it.value(), m_clock.now());
    if (!started.ok()) {
        return started;
    }
    return persistLocked();
}

OperationResult<qint64> TaskStore::stopTimer(const QUuid &id)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    auto it = m_tasks.find(id);
    if (it == m_tasks.end()) {
        return notFound(id);
    }
    auto stopped = data::stopTimer(it.value(), m_clock.now());
    if (!stopped.ok()) {
        return stopped;
    }
    return OperationResult<qint64>(persistLocked(), stopped.value());
}

OperationResult<qint64> TaskStore::elapsedNow(const QUuid &id) const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    auto it = m_tasks.constFind(id);
    if (it == m_tasks.constEnd()) {
        return notFound(id);
    }
    return data::elapsedNow(it.value(), m_clock.now());
}

std::optional<TaskItem> TaskStore::findById(const QUuid &id) const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    if (m_tasks.contains(id)) {
        return m_tasks.value(id);
    }
    return std::nullopt;
}

std::vector<TaskSummary> TaskStore::findByIdPrefix(const QString &prefix) const
{
    const QString needle = prefix.trimmed().toLower();
    std::vector<TaskSummary> result;
    if (needle.isEmpty()) {
        return result;
    }

    std::lock_guard<std::mutex> lock(m_mutex);
    const QDateTime now = m_clock.now();
    for (const TaskItem *task : inCreationOrderLocked()) {
        if (taskIdText(task->id).startsWith(needle)) {
            result.push_back(summarize(*task, now));
        }
    }
    return result;
}

std::vector<TaskSummary> TaskStore::findByTitle(const QString &needle, Qt::CaseSensitivity sensitivity) const
{
    std::vector<TaskSummary> result;
    if (needle.isEmpty()) {
        return result;
    }

    std::lock_guard<std::mutex> lock(m_mutex);
    const QDateTime now = m_clock.now();
    for (const TaskItem *task : inCreationOrderLocked()) {
        if (task->title.contains(needle, sensitivity)) {
            result.push_back(summarize(*task, now));
        }
    }
    return result;
}

std::vector<TaskSummary> TaskStore::search(const QString &query) const
{
    const QString needle = query.trimmed();
    std::vector<TaskSummary> result;
    if (needle.isEmpty()) {
        return result;
    }
    const QString lowered = needle.toLower();

    std::lock_guard<std::mutex> lock(m_mutex);
    const QDateTime now = m_clock.now();
    for (const TaskItem *task : inCreationOrderLocked()) {
        if (taskIdText(task->id).startsWith(lowered) || task->title.contains(needle, Qt::CaseInsensitive)) {
            result.push_back(summarize(*task, now));
        }
    }
    return result;
}

std::vector<TaskSummary> TaskStore::listPending() const
{
    return listByStatus(TaskStatus::Pending);
}

std::vector<TaskSummary> TaskStore::listCompleted() const
{
    return listByStatus(TaskStatus::Completed);
}

std::size_t TaskStore::count() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return static_cast<std::size_t>(m_tasks.size());
}

SweepOutcome TaskStore::sweepExpired()
{
    SweepOutcome outcome;

    std::lock_guard<std::mutex> lock(m_mutex);
    const QDateTime now = m_clock.now();
    for (const TaskItem *task : inCreationOrderLocked()) {
        if (task->isExpired(now)) {
            outcome.removed.push_back(*task);
        }
    }
    if (outcome.removed.empty()) {
        return outcome;
    }
    for (const TaskItem &task : outcome.removed) {
        m_tasks.remove(task.id);
    }
    outcome.saveStatus = persistLocked();
    return outcome;
}

OperationStatus TaskStore::persistLocked() const
{
    const auto status = m_storage.save(snapshotLocked());
    if (!status.ok()) {
        qCWarning(lcStore) << "write-through failed, keeping in-memory state:" << status.message();
    }
    return status;
}

StoreSnapshot TaskStore::snapshotLocked() const
{
    StoreSnapshot snapshot;
    snapshot.nextSequence = m_nextSequence;
    snapshot.tasks.reserve(static_cast<size_t>(m_tasks.size()));
    for (const TaskItem *task : inCreationOrderLocked()) {
        snapshot.tasks.push_back(*task);
    }
    return snapshot;
}

std::vector<const TaskItem *> TaskStore::inCreationOrderLocked() const
{
    std::vector<const TaskItem *> ordered;
    ordered.reserve(static_cast<size_t>(m_tasks.size()));
    for (auto it = m_tasks.constBegin(); it != m_tasks.constEnd(); ++it) {
        ordered.push_back(&it.value());
    }
    std::sort(ordered.begin(), ordered.end(), [](const TaskItem *lhs, const TaskItem *rhs) {
        return lhs->sequence < rhs->sequence;
    });
    return ordered;
}

std::vector<TaskSummary> TaskStore::listByStatus(TaskStatus status) const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    std::vector<const TaskItem *> matching;
    for (const TaskItem *task : inCreationOrderLocked()) {
        if (task->status == status) {
            matching.push_back(task);
        }
    }
    std::stable_sort(matching.begin(), matching.end(), deadlineOrder);

    const QDateTime now = m_clock.now();
    std::vector<TaskSummary> result;
    result.reserve(matching.size());
    for (const TaskItem *task : matching) {
        result.push_back(summarize(*task, now));
    }
    return result;
}

} // namespace data
} // namespace taskforge
