#pragma once

#include <QDateTime>
#include <QString>
#include <QUuid>
#include <optional>

#include "taskforge/core/OperationStatus.hpp"

namespace taskforge {
namespace data {

enum class TaskStatus
{
    Pending,
    Completed,
};

enum class TimerState
{
    Stopped,
    Running,
};

struct TaskItem
{
    QUuid id; // random v4, never reused only as far as v4 collisions are ruled out
    QString title;
    QString category;
    QString description;
    std::optional<int> quantity;
    QDateTime deadline; // invalid means no deadline
    TaskStatus status = TaskStatus::Pending;
    QDateTime createdAt;
    quint64 sequence = 0;
    qint64 lastElapsedMs = 0;
    qint64 totalElapsedMs = 0;
    TimerState timerState = TimerState::Stopped;
    QDateTime runStartedAt;

    bool hasDeadline() const { return deadline.isValid(); }
    bool isRunning() const { return timerState == TimerState::Running; }
    bool isExpired(const QDateTime &now) const;
    QString shortId() const;
};

inline bool operator==(const TaskItem &lhs, const TaskItem &rhs)
{
    return lhs.id == rhs.id;
}

inline bool operator!=(const TaskItem &lhs, const TaskItem &rhs)
{
    return !(lhs == rhs);
}

struct TaskDraft
{
    QString title;
    QString category;
    QString description;
    std::optional<int> quantity;
    std::optional<QDateTime> deadline;
};

// Unset members keep the current value.
struct TaskUpdate
{
    std::optional<QString> title;
    std::optional<QString> category;
    std::optional<QString> description;
    std::optional<int> quantity;
    bool clearQuantity = false;
    std::optional<QDateTime> deadline;
    bool clearDeadline = false;
    std::optional<TaskStatus> status;

    bool isEmpty() const;
};

struct TaskSummary
{
    QUuid id;
    QString shortId;
    QString title;
    QString category;
    QString description;
    std::optional<int> quantity;
    QDateTime deadline;
    TaskStatus status = TaskStatus::Pending;
    qint64 lastElapsedMs = 0;
    qint64 elapsedMs = 0;
    bool running = false;
};

constexpr int ShortIdLength = 8;
constexpr auto DeadlineInputFormat = "yyyy-MM-dd HH:mm";

QString taskIdText(const QUuid &id);
QString shortTaskId(const QUuid &id);

QString taskStatusToString(TaskStatus status);
std::optional<TaskStatus> taskStatusFromString(const QString &value);
QString timerStateToString(TimerState state);
std::optional<TimerState> timerStateFromString(const QString &value);

QDateTime parseDeadline(const QString &text);
QString formatDeadline(const QDateTime &deadline);

core::OperationStatus validateTitle(const QString &title);
core::OperationStatus validateQuantity(const std::optional<int> &quantity);
core::OperationStatus validateDeadline(const QDateTime &deadline);
core::OperationStatus validateDraft(const TaskDraft &draft);
core::OperationStatus validateUpdate(const TaskUpdate &update);

TaskSummary summarize(const TaskItem &task, const QDateTime &now);

} // namespace data
} // namespace taskforge
