#include <QCommandLineParser>
#include <QCoreApplication>
#include <QLoggingCategory>
#include <QSettings>
#include <QString>
#include <QTextStream>

#include <cstdio>

#include "version.h"

#include "taskforge/cli/TaskShell.hpp"
#include "taskforge/core/AppConfig.hpp"
#include "taskforge/core/AppContext.hpp"
#include "taskforge/core/ExpirySweeper.hpp"
#include "taskforge/core/Logging.hpp"

int main(int argc, char *argv[])
{
    QCoreApplication::setOrganizationName(QStringLiteral("TaskForge"));
    QCoreApplication::setApplicationName(QStringLiteral("taskforge"));
    QCoreApplication::setApplicationVersion(QString::fromLatin1(kTaskForgeVersion));

    QCoreApplication app(argc, argv);

    QCommandLineParser parser;
    parser.setApplicationDescription(QObject::tr("Personal task tracker with timers and deadline expiry."));
    parser.addHelpOption();
    parser.addVersionOption();
    taskforge::core::AppConfig::addOptions(parser);
    parser.process(app);

    QTextStream err(stderr);
    QSettings settings;
    auto config = taskforge::core::AppConfig::fromSettings(settings);
    const auto arguments = config.applyArguments(parser);
    if (!arguments.ok()) {
        err << arguments.message() << '\n';
        return 2;
    }
    if (config.verbose) {
        QLoggingCategory::setFilterRules(QStringLiteral("taskforge.*.debug=true"));
    }

    taskforge::core::AppContext context(config);
    QTextStream in(stdin);
    QTextStream out(stdout);
    taskforge::cli::TaskShell shell(context.taskStore(), context.sweeper(), in, out);
    context.sweeper().setListener([&shell](const std::vector<taskforge::data::TaskItem> &removed) {
        shell.notifyExpired(removed);
    });

    const auto started = context.initialize();
    if (!started.ok()) {
        qCCritical(taskforge::lcApp) << "cannot open task store:" << started.toString();
        if (started.code() == taskforge::core::ErrorCode::CorruptState) {
            err << QObject::tr("Start again with --discard-corrupt to move the file aside and begin empty.") << '\n';
        }
        return 1;
    }

    const int exitCode = shell.run();
    context.shutdown();
    return exitCode;
}
