#include "taskforge/data/Task.hpp"

#include "taskforge/data/TaskTimer.hpp"

namespace taskforge {
namespace data {

using core::ErrorCode;
using core::OperationStatus;

bool TaskItem::isExpired(const QDateTime &now) const
{
    return deadline.isValid() && deadline <= now;
}

QString TaskItem::shortId() const
{
    return shortTaskId(id);
}

bool TaskUpdate::isEmpty() const
{
    return !title && !category && !description && !quantity && !clearQuantity && !deadline
        && !clearDeadline && !status;
}

QString taskIdText(const QUuid &id)
{
    return id.toString(QUuid::WithoutBraces);
}

QString shortTaskId(const QUuid &id)
{
    return taskIdText(id).left(ShortIdLength);
}

QString taskStatusToString(TaskStatus status)
{
    switch (status) {
    case TaskStatus::Completed:
        return QStringLiteral("completed");
    case TaskStatus::Pending:
    default:
        return QStringLiteral("pending");
    }
}

std::optional<TaskStatus> taskStatusFromString(const QString &value)
{
    const QString normalized = value.trimmed().toLower();
    if (normalized == QLatin1String("pending")) {
        return TaskStatus::Pending;
    }
    if (normalized == QLatin1String("completed")) {
        return TaskStatus::Completed;
    }
    return std::nullopt;
}

QString timerStateToString(TimerState state)
{
    switch (state) {
    case TimerState::Running:
        return QStringLiteral("running");
    case TimerState::Stopped:
    default:
        return QStringLiteral("stopped");
    }
}

std::optional<TimerState> timerStateFromString(const QString &value)
{
    const QString normalized = value.trimmed().toLower();
    if (normalized == QLatin1String("stopped")) {
        return TimerState::Stopped;
    }
    if (normalized == QLatin1String("running")) {
        return TimerState::Running;
    }
    return std::nullopt;
}

QDateTime parseDeadline(const QString &text)
{
    const QString trimmed = text.trimmed();
    if (trimmed.isEmpty()) {
        return {};
    }
    QDateTime dt = QDateTime::fromString(trimmed, QLatin1String(DeadlineInputFormat));
    if (!dt.isValid()) {
        dt = QDateTime::fromString(trimmed, Qt::ISODateWithMs);
    }
    if (!dt.isValid()) {
        dt = QDateTime::fromString(trimmed, Qt::ISODate);
    }
    return dt;
}

QString formatDeadline(const QDateTime &deadline)
{
    if (!deadline.isValid()) {
        return {};
    }
    return deadline.toLocalTime().toString(QLatin1String(DeadlineInputFormat));
}

OperationStatus validateTitle(const QString &title)
{
    if (title.trimmed().isEmpty()) {
        return OperationStatus::failure(ErrorCode::Validation, QStringLiteral("title must not be empty"));
    }
    return OperationStatus::success();
}

OperationStatus validateQuantity(const std::optional<int> &quantity)
{
    if (quantity && *quantity < 0) {
        return OperationStatus::failure(ErrorCode::Validation,
                                        QStringLiteral("quantity must not be negative (got %1)").arg(*quantity));
    }
    return OperationStatus::success();
}

OperationStatus validateDeadline(const QDateTime &deadline)
{
    if (!deadline.isValid()) {
        return OperationStatus::failure(ErrorCode::Validation, QStringLiteral("deadline is not a valid point in time"));
    }
    return OperationStatus::success();
}

OperationStatus validateDraft(const TaskDraft &draft)
{
    auto status = validateTitle(draft.title);
    if (!status.ok()) {
        return status;
    }
    status = validateQuantity(draft.quantity);
    if (!status.ok()) {
        return status;
    }
    if (draft.deadline) {
        return validateDeadline(*draft.deadline);
    }
    return OperationStatus::success();
}

OperationStatus validateUpdate(const TaskUpdate &update)
{
    if (update.title) {
        const auto status = validateTitle(*update.title);
        if (!status.ok()) {
            return status;
        }
    }
    if (update.quantity) {
        const auto status = validateQuantity(update.quantity);
        if (!status.ok()) {
            return status;
        }
    }
    if (update.deadline) {
        const auto status = validateDeadline(*update.deadline);
        if (!status.ok()) {
            return status;
        }
    }
    if ((update.quantity && update.clearQuantity) || (update.deadline && update.clearDeadline)) {
        return OperationStatus::failure(ErrorCode::Validation,
                                        QStringLiteral("a field cannot be set and cleared at once"));
    }
    return OperationStatus::success();
}

TaskSummary summarize(const TaskItem &task, const QDateTime &now)
{
    TaskSummary summary;
    summary.id = task.id;
    summary.shortId = task.shortId();
    summary.title = task.title;
    summary.category = task.category;
    summary.description = task.description;
    summary.quantity = task.quantity;
    summary.deadline = task.deadline;
    summary.status = task.status;
    summary.lastElapsedMs = task.lastElapsedMs;
    summary.elapsedMs = elapsedNow(task, now);
    summary.running = task.isRunning();
    return summary;
}

} // namespace data
} // namespace taskforge
