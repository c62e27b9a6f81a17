#include <QtTest/QtTest>

#include <QTextStream>

#include "support/ManualClock.hpp"
#include "taskforge/cli/TaskShell.hpp"
#include "taskforge/core/ExpirySweeper.hpp"
#include "taskforge/data/InMemoryTaskStorage.hpp"
#include "taskforge/data/TaskStore.hpp"

using namespace taskforge;

namespace {
struct ShellFixture
{
    data::InMemoryTaskStorage storage;
    test::ManualClock clock;
    data::TaskStore store{storage, clock};
    core::ExpirySweeper sweeper{store, std::chrono::hours(1)};

    QString run(QString input)
    {
        QString output;
        QTextStream in(&input, QIODevice::ReadOnly);
        QTextStream out(&output, QIODevice::WriteOnly);
        cli::TaskShell shell(store, sweeper, in, out);
        sweeper.setListener([&shell](const std::vector<data::TaskItem> &removed) { shell.notifyExpired(removed); });
        shell.run();
        sweeper.setListener(nullptr);
        out.flush();
        return output;
    }

    QUuid add(const QString &title, const QDateTime &deadline = QDateTime())
    {
        data::TaskDraft draft;
        draft.title = title;
        if (deadline.isValid()) {
            draft.deadline = deadline;
        }
        return store.createTask(draft).value();
    }
};
} // namespace

class TaskShellTest : public QObject
{
    Q_OBJECT

private slots:
    void createAndList();
    void invalidDeadlineIsReported();
    void timingRecordsElapsedTime();
    void toggleAndDelete();
    void ambiguousSelectionAsksForChoice();
    void editKeepsBlankFields();
    void listReportsExpiredTasks();
    void endOfInputEndsSession();
    void formatsDurations();
};

void TaskShellTest::createAndList()
{
    ShellFixture fixture;
    const QString output = fixture.run(QStringLiteral("a\nWrite report\nWork\nQ3 numbers\n3\n2026-10-20 17:00\nl\nq\n"));

    QCOMPARE(fixture.store.count(), std::size_t(1));
    const auto task = fixture.store.listPending().front();
    QCOMPARE(task.title, QStringLiteral("Write report"));
    QCOMPARE(task.category, QStringLiteral("Work"));
    QVERIFY(task.quantity == 3);
    QCOMPARE(task.deadline, QDateTime(QDate(2026, 10, 20), QTime(17, 0)));

    QVERIFY(output.contains(QStringLiteral("Task created: %1").arg(task.shortId)));
    QVERIFY(output.contains(QStringLiteral("--- Pending (1) ---")));
    QVERIFY(output.contains(
        QStringLiteral("[%1] Write report | cat:Work | qty:3 | due:2026-10-20 17:00").arg(task.shortId)));
    QVERIFY(output.contains(QStringLiteral("   desc: Q3 numbers")));
}

void TaskShellTest::invalidDeadlineIsReported()
{
    ShellFixture fixture;
    const QString output = fixture.run(QStringLiteral("a\nPay rent\n\n\n\nsoonish\nq\n"));

    QVERIFY(output.contains(QStringLiteral("Error: deadline is not a valid point in time")));
    QCOMPARE(fixture.store.count(), std::size_t(0));
}

void TaskShellTest::timingRecordsElapsedTime()
{
    ShellFixture fixture;
    const QUuid id = fixture.add(QStringLiteral("Deep work"));
    // Start, stop, then time again but leave it running.
    const QString output = fixture.run(QStringLiteral("c\ndeep\n\n\nc\ndeep\n\nq\nq\n"));

    QVERIFY(output.contains(QStringLiteral("Timer saved: 0m0s")));
    QVERIFY(output.contains(QStringLiteral("Timer keeps running.")));
    QVERIFY(fixture.store.findById(id)->isRunning());
}

void TaskShellTest::toggleAndDelete()
{
    ShellFixture fixture;
    const QUuid id = fixture.add(QStringLiteral("Laundry"));

    QString output = fixture.run(QStringLiteral("m\nlaundry\nq\n"));
    QVERIFY(output.contains(QStringLiteral("Task completed.")));
    QCOMPARE(fixture.store.findById(id)->status, data::TaskStatus::Completed);

    output = fixture.run(QStringLiteral("m\nlaundry\nd\nlaundry\nn\nd\nlaundry\ny\nq\n"));
    QVERIFY(output.contains(QStringLiteral("Task reopened.")));
    QVERIFY(output.contains(QStringLiteral("Task deleted.")));
    QCOMPARE(fixture.store.count(), std::size_t(0));
}

void TaskShellTest::ambiguousSelectionAsksForChoice()
{
    ShellFixture fixture;
    fixture.add(QStringLiteral("Report A"));
    fixture.add(QStringLiteral("Report B"));

    const QString output = fixture.run(QStringLiteral("d\nreport\n2\ny\nq\n"));
    QVERIFY(output.contains(QStringLiteral("Choose: ")));
    QCOMPARE(fixture.store.count(), std::size_t(1));
    QCOMPARE(fixture.store.listPending().front().title, QStringLiteral("Report A"));
}

void TaskShellTest::editKeepsBlankFields()
{
    ShellFixture fixture;
    data::TaskDraft draft;
    draft.title = QStringLiteral("Read");
    draft.category = QStringLiteral("Study");
    draft.quantity = 20;
    const QUuid id = fixture.store.createTask(draft).value();

    const QString output = fixture.run(QStringLiteral("e\nread\nRead book\n\n-\n-\n2026-12-01 08:00\ny\nq\n"));
    QVERIFY(output.contains(QStringLiteral("Task updated.")));

    const auto task = fixture.store.findById(id);
    QCOMPARE(task->title, QStringLiteral("Read book"));
    QCOMPARE(task->category, QStringLiteral("Study"));
    QVERIFY(task->description.isEmpty());
    QVERIFY(!task->quantity.has_value());
    QCOMPARE(task->deadline, QDateTime(QDate(2026, 12, 1), QTime(8, 0)));
    QCOMPARE(task->status, data::TaskStatus::Completed);
}

void TaskShellTest::listReportsExpiredTasks()
{
    ShellFixture fixture;
    const QUuid id = fixture.add(QStringLiteral("Missed call"), fixture.clock.now().addSecs(-1));

    const QString output = fixture.run(QStringLiteral("l\nq\n"));
    QVERIFY(output.contains(QStringLiteral("[AUTO] Removed overdue task: [%1] Missed call").arg(data::shortTaskId(id))));
    QVERIFY(output.contains(QStringLiteral("No tasks recorded.")));
}

void TaskShellTest::endOfInputEndsSession()
{
    ShellFixture fixture;
    const QString output = fixture.run(QStringLiteral("a\nHalf typed"));
    QVERIFY(output.contains(QStringLiteral("=== TASKFORGE ===")));
    QCOMPARE(fixture.store.count(), std::size_t(0));
}

void TaskShellTest::formatsDurations()
{
    QCOMPARE(cli::TaskShell::formatDuration(0), QStringLiteral("0m0s"));
    QCOMPARE(cli::TaskShell::formatDuration(2000), QStringLiteral("0m2s"));
    QCOMPARE(cli::TaskShell::formatDuration(125999), QStringLiteral("2m5s"));
    QCOMPARE(cli::TaskShell::formatDuration(3723000), QStringLiteral("1h2m3s"));
}

QTEST_GUILESS_MAIN(TaskShellTest)
#include "TaskShellTest.moc"
