#include "taskforge/data/TaskTimer.hpp"

#include <algorithm>

namespace taskforge {
namespace data {

using core::ErrorCode;
using core::OperationResult;
using core::OperationStatus;

namespace {
qint64 runningPortion(const TaskItem &task, const QDateTime &now)
{
    if (!task.isRunning() || !task.runStartedAt.isValid()) {
        return 0;
    }
    // A clock that stepped backwards must not shrink totalElapsedMs.
    return std::max<qint64>(0, task.runStartedAt.msecsTo(now));
}
} // namespace

OperationStatus startTimer(TaskItem &task, const QDateTime &now)
{
    if (task.isRunning()) {
        return OperationStatus::failure(
            ErrorCode::InvalidState,
            QStringLiteral("timer of task %1 is already running since %2")
                .arg(task.shortId(), task.runStartedAt.toString(Qt::ISODate)));
    }
    task.timerState = TimerState::Running;
    task.runStartedAt = now;
    return OperationStatus::success();
}

OperationResult<qint64> stopTimer(TaskItem &task, const QDateTime &now)
{
    if (!task.isRunning()) {
        return OperationStatus::failure(ErrorCode::InvalidState,
                                        QStringLiteral("timer of task %1 is not running").arg(task.shortId()));
    }
    const qint64 elapsed = runningPortion(task, now);
    task.lastElapsedMs = elapsed;
    task.totalElapsedMs += elapsed;
    task.timerState = TimerState::Stopped;
    task.runStartedAt = QDateTime();
    return elapsed;
}

qint64 elapsedNow(const TaskItem &task, const QDateTime &now)
{
    return task.totalElapsedMs + runningPortion(task, now);
}

} // namespace data
} // namespace taskforge
