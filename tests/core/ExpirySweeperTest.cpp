#include <QtTest/QtTest>

#include <QElapsedTimer>

#include <atomic>

#include "support/ManualClock.hpp"
#include "taskforge/core/ExpirySweeper.hpp"
#include "taskforge/data/InMemoryTaskStorage.hpp"
#include "taskforge/data/TaskStore.hpp"

using namespace taskforge;
using namespace std::chrono_literals;

namespace {
QUuid addTask(data::TaskStore &store, const QString &title, const QDateTime &deadline)
{
    data::TaskDraft draft;
    draft.title = title;
    if (deadline.isValid()) {
        draft.deadline = deadline;
    }
    const auto created = store.createTask(draft);
    return created.hasValue() ? created.value() : QUuid();
}
} // namespace

class ExpirySweeperTest : public QObject
{
    Q_OBJECT

private slots:
    void sweepNowRemovesOverdueTasks();
    void listenerReceivesRemovedTasks();
    void failedSaveIsSkipped();
    void backgroundThreadSweepsOnInterval();
    void sweepInterleavesWithForegroundMutations();
    void stopIsIdempotent();
};

void ExpirySweeperTest::sweepNowRemovesOverdueTasks()
{
    data::InMemoryTaskStorage storage;
    test::ManualClock clock;
    data::TaskStore store(storage, clock);
    core::ExpirySweeper sweeper(store, 1h);

    const QUuid late = addTask(store, QStringLiteral("late"), clock.now().addSecs(-1));
    addTask(store, QStringLiteral("later"), clock.now().addSecs(60));
    addTask(store, QStringLiteral("never"), QDateTime());

    QCOMPARE(sweeper.sweepNow(), std::size_t(1));
    QVERIFY(!store.findById(late).has_value());
    QVERIFY(store.search(data::taskIdText(late)).empty());
    QCOMPARE(store.count(), std::size_t(2));
    QCOMPARE(sweeper.state(), core::ExpirySweeper::State::Idle);

    clock.advance(61 * 1000);
    QCOMPARE(sweeper.sweepNow(), std::size_t(1));
    QCOMPARE(store.listPending().size(), std::size_t(1));
    QCOMPARE(sweeper.sweepCount(), std::size_t(2));
}

void ExpirySweeperTest::listenerReceivesRemovedTasks()
{
    data::InMemoryTaskStorage storage;
    test::ManualClock clock;
    data::TaskStore store(storage, clock);
    core::ExpirySweeper sweeper(store, 1h);

    std::vector<data::TaskItem> reported;
    sweeper.setListener([&reported](const std::vector<data::TaskItem> &removed) {
        reported.insert(reported.end(), removed.begin(), removed.end());
    });

    addTask(store, QStringLiteral("first"), clock.now().addSecs(-10));
    addTask(store, QStringLiteral("second"), clock.now().addSecs(-5));
    QCOMPARE(sweeper.sweepNow(), std::size_t(2));
    QCOMPARE(reported.size(), std::size_t(2));
    QCOMPARE(reported[0].title, QStringLiteral("first"));
    QCOMPARE(reported[1].title, QStringLiteral("second"));

    reported.clear();
    QCOMPARE(sweeper.sweepNow(), std::size_t(0));
    QVERIFY(reported.empty());
}

void ExpirySweeperTest::failedSaveIsSkipped()
{
    data::InMemoryTaskStorage storage;
    test::ManualClock clock;
    data::TaskStore store(storage, clock);
    core::ExpirySweeper sweeper(store, 1h);

    addTask(store, QStringLiteral("late"), clock.now().addSecs(-1));
    storage.setFailSaves(true);

    QCOMPARE(sweeper.sweepNow(), std::size_t(1));
    QCOMPARE(store.count(), std::size_t(0));
    QCOMPARE(storage.snapshot().tasks.size(), std::size_t(1));

    storage.setFailSaves(false);
    addTask(store, QStringLiteral("next"), QDateTime());
    QCOMPARE(storage.snapshot().tasks.size(), std::size_t(1));
    QCOMPARE(storage.snapshot().tasks.front().title, QStringLiteral("next"));
}

void ExpirySweeperTest::backgroundThreadSweepsOnInterval()
{
    data::InMemoryTaskStorage storage;
    test::ManualClock clock;
    data::TaskStore store(storage, clock);
    core::ExpirySweeper sweeper(store, 20ms);

    std::atomic<int> notified{0};
    sweeper.setListener([&notified](const std::vector<data::TaskItem> &removed) {
        notified += static_cast<int>(removed.size());
    });

    const QUuid soon = addTask(store, QStringLiteral("soon"), clock.now().addSecs(1));
    sweeper.start();
    QVERIFY(sweeper.isRunning());

    QTRY_VERIFY(sweeper.sweepCount() >= 3);
    QVERIFY(store.findById(soon).has_value());

    clock.advance(2000);
    QTRY_COMPARE(store.count(), std::size_t(0));
    QTRY_COMPARE(notified.load(), 1);

    sweeper.stop();
    QVERIFY(!sweeper.isRunning());
    QCOMPARE(sweeper.state(), core::ExpirySweeper::State::Stopped);

    const std::size_t sweeps = sweeper.sweepCount();
    QTest::qWait(60);
    QCOMPARE(sweeper.sweepCount(), sweeps);
}

void ExpirySweeperTest::sweepInterleavesWithForegroundMutations()
{
    data::InMemoryTaskStorage storage;
    test::ManualClock clock;
    data::TaskStore store(storage, clock);
    core::ExpirySweeper sweeper(store, 1ms);

    std::atomic<int> swept{0};
    sweeper.setListener([&swept](const std::vector<data::TaskItem> &removed) {
        swept += static_cast<int>(removed.size());
    });
    sweeper.start();

    std::vector<QString> unexpected;
    auto check = [&unexpected](const char *call, const core::OperationStatus &status) {
        if (!status.ok() && status.code() != core::ErrorCode::NotFound) {
            unexpected.push_back(QStringLiteral("%1: %2").arg(QLatin1String(call), status.toString()));
        }
    };

    std::vector<QUuid> ids;
    for (int i = 0; i < 400; ++i) {
        // Every third task is due a few ticks from now and gets swept mid-loop.
        const QDateTime deadline = i % 3 == 0 ? clock.now().addMSecs(5) : clock.now().addSecs(3600);
        data::TaskDraft draft;
        draft.title = QStringLiteral("task %1").arg(i);
        draft.deadline = deadline;
        const auto created = store.createTask(draft);
        check("create", created.status());
        if (!created.hasValue()) {
            continue;
        }
        ids.push_back(created.value());
        check("start", store.startTimer(created.value()));

        if (ids.size() > 1) {
            const QUuid previous = ids[ids.size() - 2];
            data::TaskUpdate update;
            update.description = QStringLiteral("edited in round %1").arg(i);
            check("edit", store.editTask(previous, update));
            check("stop", store.stopTimer(previous).status());
        }
        if (i % 5 == 4) {
            check("delete", store.deleteTask(ids[ids.size() - 3]));
        }
        clock.advance(2);
        if (i % 50 == 0) {
            QTest::qWait(2);
        }
    }

    // Let at least one full sweep run after the last mutation.
    const std::size_t sweeps = sweeper.sweepCount();
    QTRY_VERIFY(sweeper.sweepCount() >= sweeps + 2);
    sweeper.stop();

    for (const QString &failure : unexpected) {
        qWarning() << failure;
    }
    QVERIFY(unexpected.empty());
    QVERIFY(swept.load() > 0);

    const QDateTime now = clock.now();
    std::vector<data::TaskSummary> surviving = store.listPending();
    const auto completed = store.listCompleted();
    surviving.insert(surviving.end(), completed.begin(), completed.end());
    QCOMPARE(surviving.size(), store.count());
    for (const auto &task : surviving) {
        QVERIFY2(!task.deadline.isValid() || task.deadline > now, qPrintable(task.title));
    }

    const data::StoreSnapshot persisted = storage.snapshot();
    QCOMPARE(persisted.tasks.size(), store.count());
    for (const data::TaskItem &saved : persisted.tasks) {
        const auto live = store.findById(saved.id);
        QVERIFY2(live.has_value(), qPrintable(saved.title));
        QCOMPARE(saved.title, live->title);
        QCOMPARE(saved.description, live->description);
        QCOMPARE(saved.lastElapsedMs, live->lastElapsedMs);
        QCOMPARE(saved.totalElapsedMs, live->totalElapsedMs);
        QCOMPARE(saved.timerState, live->timerState);
    }
}

void ExpirySweeperTest::stopIsIdempotent()
{
    data::InMemoryTaskStorage storage;
    test::ManualClock clock;
    data::TaskStore store(storage, clock);
    core::ExpirySweeper sweeper(store, 1h);

    sweeper.stop();
    QCOMPARE(sweeper.state(), core::ExpirySweeper::State::Idle);

    sweeper.start();
    sweeper.start();
    // The long interval is interrupted rather than waited out.
    QElapsedTimer timer;
    timer.start();
    sweeper.stop();
    sweeper.stop();
    QVERIFY(timer.elapsed() < 5000);
    QCOMPARE(sweeper.state(), core::ExpirySweeper::State::Stopped);
}

QTEST_GUILESS_MAIN(ExpirySweeperTest)
#include "ExpirySweeperTest.moc"
