#pragma once

#include <QString>
#include <mutex>
#include <optional>
#include <vector>

#include "taskforge/core/OperationStatus.hpp"
#include "taskforge/data/Task.hpp"

class QTextStream;

namespace taskforge {
namespace core {
class ExpirySweeper;
}
namespace data {
class TaskStore;
}

namespace cli {

// Line-oriented menu on top of the task store. Store calls never span a
// prompt, so the sweeper is only blocked for the duration of a single call.
class TaskShell
{
public:
    TaskShell(data::TaskStore &store, core::ExpirySweeper &sweeper, QTextStream &input, QTextStream &output);

    // Runs until the user quits or input ends.
    int run();

    // Sweeper listener; may be called from the sweeper thread.
    void notifyExpired(const std::vector<data::TaskItem> &removed);

    static QString formatDuration(qint64 ms);

private:
    void dispatch(const QString &command);
    void createTask();
    void listTasks();
    void timeTask();
    void editTask();
    void toggleTask();
    void deleteTask();
    void searchTasks();

    std::optional<data::TaskSummary> selectTask(const QString &label);
    std::optional<QString> ask(const QString &label);
    bool confirm(const QString &label);
    void print(const QString &line);
    void printSummary(const data::TaskSummary &task);
    void reportFailure(const core::OperationStatus &status);

    data::TaskStore &m_store;
    core::ExpirySweeper &m_sweeper;
    QTextStream &m_input;
    QTextStream &m_output;
    std::mutex m_outputMutex;
    bool m_inputClosed = false;
};

} // namespace cli
} // namespace taskforge
