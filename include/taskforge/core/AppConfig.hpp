#pragma once

#include <QString>
#include <chrono>

#include "taskforge/core/OperationStatus.hpp"

class QCommandLineParser;
class QSettings;

namespace taskforge {
namespace core {

struct AppConfig
{
    QString storePath = defaultStorePath();
    std::chrono::seconds sweepInterval = defaultSweepInterval();
    bool discardCorrupt = false;
    bool verbose = false;

    static QString defaultStorePath();
    static std::chrono::seconds defaultSweepInterval();

    static void addOptions(QCommandLineParser &parser);
    static AppConfig fromSettings(const QSettings &settings);

    // Command-line values win over settings. Invalid values leave the
    // current ones untouched and are reported as a validation error.
    OperationStatus applyArguments(const QCommandLineParser &parser);
};

} // namespace core
} // namespace taskforge
