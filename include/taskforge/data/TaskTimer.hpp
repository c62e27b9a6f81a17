#pragma once

#include <QDateTime>

#include "taskforge/core/OperationStatus.hpp"
#include "taskforge/data/Task.hpp"

namespace taskforge {
namespace data {

// Starts a run. Fails with InvalidState if the task already has one.
core::OperationStatus startTimer(TaskItem &task, const QDateTime &now);

// Ends the running run, folds it into lastElapsedMs/totalElapsedMs and
// returns its length in milliseconds. Fails with InvalidState if stopped.
core::OperationResult<qint64> stopTimer(TaskItem &task, const QDateTime &now);

// totalElapsedMs plus the running portion, without touching the task.
qint64 elapsedNow(const TaskItem &task, const QDateTime &now);

} // namespace data
} // namespace taskforge
