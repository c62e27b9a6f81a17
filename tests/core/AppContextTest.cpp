#include <QtTest/QtTest>

#include <QFile>
#include <QTemporaryDir>

#include "support/ManualClock.hpp"
#include "taskforge/core/AppContext.hpp"
#include "taskforge/core/ExpirySweeper.hpp"
#include "taskforge/data/TaskStore.hpp"

using namespace taskforge;
using core::AppConfig;
using core::AppContext;
using core::ErrorCode;

namespace {
AppConfig configFor(const QTemporaryDir &dir)
{
    AppConfig config;
    config.storePath = dir.filePath(QStringLiteral("tasks.json"));
    config.sweepInterval = std::chrono::hours(1);
    return config;
}

std::unique_ptr<core::Clock> clockAt(const QDateTime &now)
{
    return std::make_unique<test::ManualClock>(now);
}

const QDateTime Now(QDate(2026, 10, 19), QTime(9, 0));
} // namespace

class AppContextTest : public QObject
{
    Q_OBJECT

private slots:
    void freshDirectoryStartsEmptyAndPersists();
    void corruptStoreFailsStartup();
    void discardCorruptStartsEmpty();
    void runningTimerSurvivesRestart();
    void startupSweepDropsExpiredTasks();
};

void AppContextTest::freshDirectoryStartsEmptyAndPersists()
{
    QTemporaryDir dir;
    QVERIFY(dir.isValid());
    QUuid id;
    {
        AppContext context(configFor(dir), clockAt(Now));
        QVERIFY(context.initialize().ok());
        QVERIFY(context.sweeper().isRunning());
        QCOMPARE(context.taskStore().count(), std::size_t(0));

        data::TaskDraft draft;
        draft.title = QStringLiteral("Persist me");
        draft.category = QStringLiteral("Home");
        const auto created = context.taskStore().createTask(draft);
        QVERIFY(created.ok());
        id = created.value();
        QVERIFY(QFile::exists(context.config().storePath));

        context.shutdown();
        QCOMPARE(context.sweeper().state(), core::ExpirySweeper::State::Stopped);
    }

    AppContext reopened(configFor(dir), clockAt(Now));
    QVERIFY(reopened.initialize().ok());
    const auto task = reopened.taskStore().findById(id);
    QVERIFY(task.has_value());
    QCOMPARE(task->category, QStringLiteral("Home"));
}

void AppContextTest::corruptStoreFailsStartup()
{
    QTemporaryDir dir;
    QVERIFY(dir.isValid());
    const AppConfig config = configFor(dir);
    {
        QFile file(config.storePath);
        QVERIFY(file.open(QIODevice::WriteOnly));
        file.write("not json at all");
    }

    AppContext context(config, clockAt(Now));
    const auto status = context.initialize();
    QCOMPARE(status.code(), ErrorCode::CorruptState);
    QVERIFY(!context.sweeper().isRunning());
    QVERIFY(QFile::exists(config.storePath));
    QVERIFY(!QFile::exists(config.storePath + QStringLiteral(".corrupt")));
}

void AppContextTest::discardCorruptStartsEmpty()
{
    QTemporaryDir dir;
    QVERIFY(dir.isValid());
    AppConfig config = configFor(dir);
    config.discardCorrupt = true;
    {
        QFile file(config.storePath);
        QVERIFY(file.open(QIODevice::WriteOnly));
        file.write("{\"tasks\": 7}");
    }

    AppContext context(config, clockAt(Now));
    QVERIFY(context.initialize().ok());
    QCOMPARE(context.taskStore().count(), std::size_t(0));
    QVERIFY(QFile::exists(config.storePath + QStringLiteral(".corrupt")));
}

void AppContextTest::runningTimerSurvivesRestart()
{
    QTemporaryDir dir;
    QVERIFY(dir.isValid());
    QUuid id;
    {
        AppContext context(configFor(dir), clockAt(Now));
        QVERIFY(context.initialize().ok());
        data::TaskDraft draft;
        draft.title = QStringLiteral("Long job");
        id = context.taskStore().createTask(draft).value();
        QVERIFY(context.taskStore().startTimer(id).ok());
        // No stop: the process "crashes" with the timer running.
    }

    AppContext restarted(configFor(dir), clockAt(Now.addSecs(90)));
    QVERIFY(restarted.initialize().ok());
    const auto task = restarted.taskStore().findById(id);
    QVERIFY(task.has_value());
    QVERIFY(task->isRunning());
    QCOMPARE(task->runStartedAt, Now);

    const auto stopped = restarted.taskStore().stopTimer(id);
    QVERIFY(stopped.ok());
    QCOMPARE(stopped.value(), qint64(90000));
}

void AppContextTest::startupSweepDropsExpiredTasks()
{
    QTemporaryDir dir;
    QVERIFY(dir.isValid());
    QUuid id;
    {
        AppContext context(configFor(dir), clockAt(Now));
        QVERIFY(context.initialize().ok());
        data::TaskDraft draft;
        draft.title = QStringLiteral("Due at ten");
        draft.deadline = Now.addSecs(3600);
        id = context.taskStore().createTask(draft).value();
    }

    AppContext later(configFor(dir), clockAt(Now.addSecs(2 * 3600)));
    QVERIFY(later.initialize().ok());
    QTRY_VERIFY(later.sweeper().sweepCount() >= 1);
    QVERIFY(!later.taskStore().findById(id).has_value());
}

QTEST_GUILESS_MAIN(AppContextTest)
#include "AppContextTest.moc"
