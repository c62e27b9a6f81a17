#include "taskforge/cli/TaskShell.hpp"

#include "taskforge/core/ExpirySweeper.hpp"
#include "taskforge/data/TaskStore.hpp"

#include <QObject>
#include <QTextStream>

namespace taskforge {
namespace cli {

using data::TaskStatus;
using data::TaskSummary;

namespace {
const QString NoValue = QStringLiteral("-");

bool isYes(const QString &answer)
{
    const QString normalized = answer.trimmed().toLower();
    return normalized == QLatin1String("y") || normalized == QLatin1String("yes");
}

bool isNo(const QString &answer)
{
    const QString normalized = answer.trimmed().toLower();
    return normalized == QLatin1String("n") || normalized == QLatin1String("no");
}

// Empty input is "no quantity"; anything else must be a whole number.
std::optional<int> parseQuantity(const QString &text, bool &ok)
{
    ok = true;
    if (text.isEmpty()) {
        return std::nullopt;
    }
    const int value = text.toInt(&ok);
    if (!ok || value < 0) {
        ok = false;
        return std::nullopt;
    }
    return value;
}
} // namespace

TaskShell::TaskShell(data::TaskStore &store, core::ExpirySweeper &sweeper, QTextStream &input, QTextStream &output)
    : m_store(store)
    , m_sweeper(sweeper)
    , m_input(input)
    , m_output(output)
{
}

int TaskShell::run()
{
    print(QObject::tr("\n\t=== TASKFORGE ===\n"));
    print(QObject::tr("Deadline format: %1").arg(QLatin1String(data::DeadlineInputFormat)));

    while (!m_inputClosed) {
        const auto choice = ask(QObject::tr(
            "\n[A]dd [L]ist [C]time [E]dit [M]ark done/undone [D]elete [S]earch [Q]uit: "));
        if (!choice) {
            break;
        }
        const QString command = choice->trimmed().toLower();
        if (command == QLatin1String("q")) {
            break;
        }
        dispatch(command);
    }
    return 0;
}

void TaskShell::notifyExpired(const std::vector<data::TaskItem> &removed)
{
    for (const auto &task : removed) {
        print(QObject::tr("[AUTO] Removed overdue task: [%1] %2").arg(task.shortId(), task.title));
    }
}

QString TaskShell::formatDuration(qint64 ms)
{
    const qint64 totalSeconds = ms / 1000;
    const qint64 hours = totalSeconds / 3600;
    const qint64 minutes = (totalSeconds % 3600) / 60;
    const qint64 seconds = totalSeconds % 60;
    if (hours > 0) {
        return QStringLiteral("%1h%2m%3s").arg(hours).arg(minutes).arg(seconds);
    }
    return QStringLiteral("%1m%2s").arg(minutes).arg(seconds);
}

void TaskShell::dispatch(const QString &command)
{
    if (command == QLatin1String("a")) {
        createTask();
    } else if (command == QLatin1String("l")) {
        listTasks();
    } else if (command == QLatin1String("c")) {
        timeTask();
    } else if (command == QLatin1String("e")) {
        editTask();
    } else if (command == QLatin1String("m")) {
        toggleTask();
    } else if (command == QLatin1String("d")) {
        deleteTask();
    } else if (command == QLatin1String("s")) {
        searchTasks();
    } else {
        print(QObject::tr("Invalid option."));
    }
}

void TaskShell::createTask()
{
    data::TaskDraft draft;

    const auto title = ask(QObject::tr("Title: "));
    if (!title) {
        return;
    }
    draft.title = *title;

    const auto category = ask(QObject::tr("Category (optional): "));
    if (!category) {
        return;
    }
    draft.category = *category;

    const auto description = ask(QObject::tr("Description (optional): "));
    if (!description) {
        return;
    }
    draft.description = *description;

    const auto quantity = ask(QObject::tr("Quantity (optional): "));
    if (!quantity) {
        return;
    }
    bool quantityOk = false;
    draft.quantity = parseQuantity(quantity->trimmed(), quantityOk);
    if (!quantityOk) {
        print(QObject::tr("Invalid quantity."));
        return;
    }

    const auto deadline = ask(QObject::tr("Deadline (%1) or Enter for none: ").arg(QLatin1String(data::DeadlineInputFormat)));
    if (!deadline) {
        return;
    }
    if (!deadline->trimmed().isEmpty()) {
        draft.deadline = data::parseDeadline(*deadline);
    }

    const auto created = m_store.createTask(draft);
    if (created.hasValue()) {
        print(QObject::tr("Task created: %1").arg(data::shortTaskId(created.value())));
    }
    if (!created.ok()) {
        reportFailure(created.status());
    }
}

void TaskShell::listTasks()
{
    m_sweeper.sweepNow();

    const auto pending = m_store.listPending();
    const auto completed = m_store.listCompleted();
    if (pending.empty() && completed.empty()) {
        print(QObject::tr("No tasks recorded."));
        return;
    }

    print(QObject::tr("\n--- Pending (%1) ---").arg(pending.size()));
    for (const auto &task : pending) {
        printSummary(task);
    }
    print(QObject::tr("\n--- Completed (%1) ---").arg(completed.size()));
    for (const auto &task : completed) {
        printSummary(task);
    }
}

void TaskShell::timeTask()
{
    const auto task = selectTask(QObject::tr("Task to time: "));
    if (!task) {
        return;
    }

    if (task->running) {
        print(QObject::tr("Timer already running (%1 so far).").arg(formatDuration(task->elapsedMs)));
    } else {
        const auto start = ask(QObject::tr("Enter starts | Enter stops | q cancels: "));
        if (!start || start->trimmed().toLower() == QLatin1String("q")) {
            return;
        }
        const auto started = m_store.startTimer(task->id);
        if (!started.ok()) {
            reportFailure(started);
            if (started.code() != core::ErrorCode::Io) {
                return;
            }
        }
    }

    const auto stop = ask(QObject::tr("Timer running. Enter stops | q leaves it running: "));
    if (!stop || stop->trimmed().toLower() == QLatin1String("q")) {
        print(QObject::tr("Timer keeps running."));
        return;
    }
    const auto stopped = m_store.stopTimer(task->id);
    if (stopped.hasValue()) {
        print(QObject::tr("Timer saved: %1").arg(formatDuration(stopped.value())));
    }
    if (!stopped.ok()) {
        reportFailure(stopped.status());
    }
}

void TaskShell::editTask()
{
    const auto task = selectTask(QObject::tr("ID or part of the title: "));
    if (!task) {
        return;
    }

    print(QObject::tr("Leave blank to keep, '%1' clears an optional field.").arg(NoValue));
    data::TaskUpdate update;

    const auto title = ask(QObject::tr("Title [%1]: ").arg(task->title));
    if (!title) {
        return;
    }
    if (!title->trimmed().isEmpty()) {
        update.title = *title;
    }

    const auto category = ask(QObject::tr("Category [%1]: ").arg(task->category));
    if (!category) {
        return;
    }
    if (category->trimmed() == NoValue) {
        update.category = QString();
    } else if (!category->trimmed().isEmpty()) {
        update.category = *category;
    }

    const auto description = ask(QObject::tr("Description [%1]: ").arg(task->description));
    if (!description) {
        return;
    }
    if (description->trimmed() == NoValue) {
        update.description = QString();
    } else if (!description->trimmed().isEmpty()) {
        update.description = *description;
    }

    const QString currentQuantity = task->quantity ? QString::number(*task->quantity) : QString();
    const auto quantity = ask(QObject::tr("Quantity [%1]: ").arg(currentQuantity));
    if (!quantity) {
        return;
    }
    if (quantity->trimmed() == NoValue) {
        update.clearQuantity = true;
    } else if (!quantity->trimmed().isEmpty()) {
        bool quantityOk = false;
        update.quantity = parseQuantity(quantity->trimmed(), quantityOk);
        if (!quantityOk) {
            print(QObject::tr("Invalid quantity."));
            return;
        }
    }

    const auto deadline = ask(QObject::tr("Deadline [%1]: ").arg(data::formatDeadline(task->deadline)));
    if (!deadline) {
        return;
    }
    if (deadline->trimmed() == NoValue) {
        update.clearDeadline = true;
    } else if (!deadline->trimmed().isEmpty()) {
        update.deadline = data::parseDeadline(*deadline);
    }

    const bool completed = task->status == TaskStatus::Completed;
    const auto done = ask(QObject::tr("Completed? (y/n) [%1]: ").arg(completed ? QStringLiteral("y") : QStringLiteral("n")));
    if (!done) {
        return;
    }
    if (isYes(*done)) {
        update.status = TaskStatus::Completed;
    } else if (isNo(*done)) {
        update.status = TaskStatus::Pending;
    }

    const auto status = m_store.editTask(task->id, update);
    if (status.ok()) {
        print(QObject::tr("Task updated."));
    } else {
        reportFailure(status);
    }
}

void TaskShell::toggleTask()
{
    const auto task = selectTask(QObject::tr("ID or part of the title: "));
    if (!task) {
        return;
    }
    const bool completed = task->status == TaskStatus::Completed;
    const auto status = completed ? m_store.reopenTask(task->id) : m_store.completeTask(task->id);
    if (!status.ok()) {
        reportFailure(status);
        return;
    }
    print(completed ? QObject::tr("Task reopened.") : QObject::tr("Task completed."));
}

void TaskShell::deleteTask()
{
    const auto task = selectTask(QObject::tr("ID or part of the title: "));
    if (!task) {
        return;
    }
    if (!confirm(QObject::tr("Delete [%1]? (y/N): ").arg(task->title))) {
        return;
    }
    const auto status = m_store.deleteTask(task->id);
    if (status.ok()) {
        print(QObject::tr("Task deleted."));
    } else {
        reportFailure(status);
    }
}

void TaskShell::searchTasks()
{
    const auto query = ask(QObject::tr("ID prefix or part of the title: "));
    if (!query) {
        return;
    }
    const auto matches = m_store.search(*query);
    print(QObject::tr("%1 match(es).").arg(matches.size()));
    for (const auto &task : matches) {
        printSummary(task);
    }
}

std::optional<TaskSummary> TaskShell::selectTask(const QString &label)
{
    const auto query = ask(label);
    if (!query || query->trimmed().isEmpty()) {
        return std::nullopt;
    }

    const auto matches = m_store.search(*query);
    if (matches.empty()) {
        print(QObject::tr("No task found."));
        return std::nullopt;
    }
    if (matches.size() == 1) {
        return matches.front();
    }

    for (std::size_t i = 0; i < matches.size(); ++i) {
        print(QStringLiteral("%1 [%2] %3").arg(i + 1).arg(matches[i].shortId, matches[i].title));
    }
    const auto choice = ask(QObject::tr("Choose: "));
    if (!choice) {
        return std::nullopt;
    }
    bool ok = false;
    const int index = choice->trimmed().toInt(&ok);
    if (!ok || index < 1 || static_cast<std::size_t>(index) > matches.size()) {
        return std::nullopt;
    }
    return matches[static_cast<std::size_t>(index - 1)];
}

std::optional<QString> TaskShell::ask(const QString &label)
{
    {
        std::lock_guard<std::mutex> lock(m_outputMutex);
        m_output << label;
        m_output.flush();
    }
    const QString line = m_input.readLine();
    if (line.isNull()) {
        m_inputClosed = true;
        return std::nullopt;
    }
    return line;
}

bool TaskShell::confirm(const QString &label)
{
    const auto answer = ask(label);
    return answer && isYes(*answer);
}

void TaskShell::print(const QString &line)
{
    std::lock_guard<std::mutex> lock(m_outputMutex);
    m_output << line << '\n';
    m_output.flush();
}

void TaskShell::printSummary(const TaskSummary &task)
{
    const QString quantity = task.quantity ? QString::number(*task.quantity) : QStringLiteral("—");
    const QString deadline = task.deadline.isValid() ? data::formatDeadline(task.deadline) : QStringLiteral("—");
    QString line = QStringLiteral("[%1] %2").arg(task.shortId, task.title);
    if (!task.category.isEmpty()) {
        line += QStringLiteral(" | cat:%1").arg(task.category);
    }
    line += QStringLiteral(" | qty:%1 | due:%2").arg(quantity, deadline);
    print(line);

    if (!task.description.isEmpty()) {
        print(QStringLiteral("   desc: %1").arg(task.description));
    }
    if (task.elapsedMs > 0 || task.running) {
        QString timing = QObject::tr("   last: %1 | total: %2")
                             .arg(formatDuration(task.lastElapsedMs), formatDuration(task.elapsedMs));
        if (task.running) {
            timing += QObject::tr(" (running)");
        }
        print(timing);
    }
}

void TaskShell::reportFailure(const core::OperationStatus &status)
{
    switch (status.code()) {
    case core::ErrorCode::NotFound:
        print(QObject::tr("Task not found: %1").arg(status.message()));
        break;
    case core::ErrorCode::Io:
        print(QObject::tr("Could not save (%1). The change is kept in memory and goes out with the next save.")
                  .arg(status.message()));
        break;
    default:
        print(QObject::tr("Error: %1").arg(status.message()));
        break;
    }
}

} // namespace cli
} // namespace taskforge
