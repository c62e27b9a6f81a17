#include "taskforge/core/AppConfig.hpp"

#include "taskforge/core/Logging.hpp"

#include <QCommandLineOption>
#include <QCommandLineParser>
#include <QObject>
#include <QSettings>

namespace taskforge {
namespace core {

namespace {
const QString SettingsStorePath = QStringLiteral("store/path");
const QString SettingsSweepInterval = QStringLiteral("sweeper/intervalSeconds");

const QString OptionStore = QStringLiteral("store");
const QString OptionInterval = QStringLiteral("interval");
const QString OptionDiscardCorrupt = QStringLiteral("discard-corrupt");
const QString OptionVerbose = QStringLiteral("verbose");

bool parseInterval(const QString &text, std::chrono::seconds &interval)
{
    bool ok = false;
    const qlonglong seconds = text.trimmed().toLongLong(&ok);
    if (!ok || seconds < 1) {
        return false;
    }
    interval = std::chrono::seconds(seconds);
    return true;
}
} // namespace

QString AppConfig::defaultStorePath()
{
    return QStringLiteral("tasks.json");
}

std::chrono::seconds AppConfig::defaultSweepInterval()
{
    return std::chrono::seconds(60);
}

void AppConfig::addOptions(QCommandLineParser &parser)
{
    parser.addOption(QCommandLineOption(OptionStore,
                                        QObject::tr("Task store file (default: %1).").arg(defaultStorePath()),
                                        QObject::tr("file")));
    parser.addOption(QCommandLineOption(OptionInterval,
                                        QObject::tr("Seconds between expiry sweeps (default: %1).")
                                            .arg(defaultSweepInterval().count()),
                                        QObject::tr("seconds")));
    parser.addOption(QCommandLineOption(OptionDiscardCorrupt,
                                        QObject::tr("Move an unreadable store aside and start empty.")));
    parser.addOption(QCommandLineOption(OptionVerbose, QObject::tr("Enable debug logging.")));
}

AppConfig AppConfig::fromSettings(const QSettings &settings)
{
    AppConfig config;
    const QString storePath = settings.value(SettingsStorePath).toString().trimmed();
    if (!storePath.isEmpty()) {
        config.storePath = storePath;
    }
    if (settings.contains(SettingsSweepInterval)) {
        const QString raw = settings.value(SettingsSweepInterval).toString();
        if (!parseInterval(raw, config.sweepInterval)) {
            qCWarning(lcApp) << "ignoring invalid" << SettingsSweepInterval << raw;
        }
    }
    return config;
}

OperationStatus AppConfig::applyArguments(const QCommandLineParser &parser)
{
    if (parser.isSet(OptionStore)) {
        const QString path = parser.value(OptionStore).trimmed();
        if (path.isEmpty()) {
            return OperationStatus::failure(ErrorCode::Validation, QStringLiteral("--store needs a file name"));
        }
        storePath = path;
    }
    if (parser.isSet(OptionInterval)) {
        const QString raw = parser.value(OptionInterval);
        if (!parseInterval(raw, sweepInterval)) {
            return OperationStatus::failure(
                ErrorCode::Validation, QStringLiteral("--interval expects a whole number of seconds >= 1, got \"%1\"").arg(raw));
        }
    }
    if (parser.isSet(OptionDiscardCorrupt)) {
        discardCorrupt = true;
    }
    if (parser.isSet(OptionVerbose)) {
        verbose = true;
    }
    return OperationStatus::success();
}

} // namespace core
} // namespace taskforge
