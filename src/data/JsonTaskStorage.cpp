#include "taskforge/data/JsonTaskStorage.hpp"

#include "taskforge/core/Logging.hpp"

#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QHash>
#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonParseError>
#include <QSaveFile>
#include <algorithm>
#include <cmath>
#include <limits>

namespace taskforge {
namespace data {

using core::ErrorCode;
using core::OperationResult;
using core::OperationStatus;

namespace {
constexpr int FormatVersion = 1;

const QString KeyVersion = QStringLiteral("version");
const QString KeyNextSequence = QStringLiteral("nextSequence");
const QString KeyTasks = QStringLiteral("tasks");
const QString KeyId = QStringLiteral("id");
const QString KeyTitle = QStringLiteral("title");
const QString KeyCategory = QStringLiteral("category");
const QString KeyDescription = QStringLiteral("description");
const QString KeyQuantity = QStringLiteral("quantity");
const QString KeyDeadline = QStringLiteral("deadline");
const QString KeyStatus = QStringLiteral("status");
const QString KeyCreatedAt = QStringLiteral("createdAt");
const QString KeySequence = QStringLiteral("sequence");
const QString KeyLastElapsed = QStringLiteral("lastElapsedSeconds");
const QString KeyTotalElapsed = QStringLiteral("totalElapsedSeconds");
const QString KeyTimerState = QStringLiteral("timerState");
const QString KeyRunStartedAt = QStringLiteral("runStartedAt");

OperationStatus corrupt(const QString &message)
{
    return OperationStatus::failure(ErrorCode::CorruptState, message);
}

QString recordError(int index, const QString &detail)
{
    return QStringLiteral("task #%1: %2").arg(QString::number(index), detail);
}

QUuid parseUid(const QString &value)
{
    if (value.isEmpty()) {
        return {};
    }
    const QString withBraces = value.startsWith('{') ? value : QStringLiteral("{%1}").arg(value);
    return QUuid(withBraces);
}

QJsonValue secondsValue(qint64 ms)
{
    return QJsonValue(static_cast<double>(ms) / 1000.0);
}

// Whole numbers in [0, limit). Anything else, including values a cast to
// the target integer type could not represent, is rejected.
bool readWholeNumber(const QJsonValue &value, double limit, double &number)
{
    if (!value.isDouble()) {
        return false;
    }
    const double raw = value.toDouble();
    if (!std::isfinite(raw) || raw < 0 || raw >= limit || std::floor(raw) != raw) {
        return false;
    }
    number = raw;
    return true;
}

const double SequenceLimit = static_cast<double>(std::numeric_limits<quint64>::max());
const double QuantityLimit = static_cast<double>(std::numeric_limits<int>::max()) + 1.0;
const double SecondsLimit = static_cast<double>(std::numeric_limits<qint64>::max()) / 1000.0;

bool readSeconds(const QJsonValue &value, qint64 &ms)
{
    if (value.isUndefined()) {
        ms = 0;
        return true;
    }
    if (!value.isDouble()) {
        return false;
    }
    const double seconds = value.toDouble();
    if (!std::isfinite(seconds) || seconds < 0 || seconds >= SecondsLimit) {
        return false;
    }
    ms = qRound64(seconds * 1000.0);
    return true;
}

bool readOptionalText(const QJsonValue &value, QString &text)
{
    if (value.isUndefined() || value.isNull()) {
        text.clear();
        return true;
    }
    if (!value.isString()) {
        return false;
    }
    text = value.toString();
    return true;
}
} // namespace

JsonTaskStorage::JsonTaskStorage(QString filePath)
    : m_filePath(std::move(filePath))
{
}

QString JsonTaskStorage::location() const
{
    return m_filePath;
}

OperationResult<StoreSnapshot> JsonTaskStorage::load()
{
    QFile file(m_filePath);
    if (!file.exists()) {
        qCInfo(lcStorage) << "no store at" << m_filePath << "- starting empty";
        return StoreSnapshot{};
    }
    if (!file.open(QIODevice::ReadOnly)) {
        return OperationStatus::failure(ErrorCode::Io,
                                        QStringLiteral("cannot read %1: %2").arg(m_filePath, file.errorString()));
    }
    const QByteArray payload = file.readAll();
    auto result = deserialize(payload);
    if (!result.ok()) {
        qCWarning(lcStorage) << "store" << m_filePath << "is unreadable:" << result.status().message();
        return OperationStatus::failure(ErrorCode::CorruptState,
                                        QStringLiteral("%1: %2").arg(m_filePath, result.status().message()));
    }
    qCDebug(lcStorage) << "loaded" << result.value().tasks.size() << "tasks from" << m_filePath;
    return result;
}

OperationStatus JsonTaskStorage::save(const StoreSnapshot &snapshot)
{
    if (m_filePath.isEmpty()) {
        return OperationStatus::failure(ErrorCode::Io, QStringLiteral("no store path configured"));
    }

    QFileInfo info(m_filePath);
    QDir dir = info.dir();
    if (!dir.exists() && !dir.mkpath(QStringLiteral("."))) {
        return OperationStatus::failure(ErrorCode::Io,
                                        QStringLiteral("cannot create directory %1").arg(dir.absolutePath()));
    }

    // QSaveFile writes to a temporary file and renames it over the target on
    // commit, so a crash never leaves a half-written store behind.
    QSaveFile file(m_filePath);
    if (!file.open(QIODevice::WriteOnly)) {
        return OperationStatus::failure(ErrorCode::Io,
                                        QStringLiteral("cannot write %1: %2").arg(m_filePath, file.errorString()));
    }
    const QByteArray payload = serialize(snapshot);
    if (file.write(payload) != payload.size()) {
        const QString reason = file.errorString();
        file.cancelWriting();
        return OperationStatus::failure(ErrorCode::Io, QStringLiteral("cannot write %1: %2").arg(m_filePath, reason));
    }
    if (!file.commit()) {
        return OperationStatus::failure(ErrorCode::Io,
                                        QStringLiteral("cannot replace %1: %2").arg(m_filePath, file.errorString()));
    }
    qCDebug(lcStorage) << "saved" << snapshot.tasks.size() << "tasks to" << m_filePath;
    return OperationStatus::success();
}

OperationStatus JsonTaskStorage::discardCorruptFile()
{
    const QString backupPath = m_filePath + QStringLiteral(".corrupt");
    if (!QFile::exists(m_filePath)) {
        return OperationStatus::success();
    }
    if (QFile::exists(backupPath) && !QFile::remove(backupPath)) {
        return OperationStatus::failure(ErrorCode::Io, QStringLiteral("cannot remove %1").arg(backupPath));
    }
    if (!QFile::rename(m_filePath, backupPath)) {
        return OperationStatus::failure(ErrorCode::Io,
                                        QStringLiteral("cannot move %1 to %2").arg(m_filePath, backupPath));
    }
    qCWarning(lcStorage) << "moved unreadable store to" << backupPath;
    return OperationStatus::success();
}

QByteArray JsonTaskStorage::serialize(const StoreSnapshot &snapshot)
{
    auto tasks = snapshot.tasks;
    std::sort(tasks.begin(), tasks.end(), [](const TaskItem &lhs, const TaskItem &rhs) {
        return lhs.sequence < rhs.sequence;
    });

    QJsonArray array;
    for (const TaskItem &task : tasks) {
        array.append(taskToJson(task));
    }

    QJsonObject root;
    root.insert(KeyVersion, FormatVersion);
    root.insert(KeyNextSequence, static_cast<double>(snapshot.nextSequence));
    root.insert(KeyTasks, array);
    return QJsonDocument(root).toJson(QJsonDocument::Indented);
}

OperationResult<StoreSnapshot> JsonTaskStorage::deserialize(const QByteArray &payload)
{
    QJsonParseError error;
    const QJsonDocument document = QJsonDocument::fromJson(payload, &error);
    if (error.error != QJsonParseError::NoError) {
        return corrupt(QStringLiteral("invalid JSON at offset %1: %2").arg(QString::number(error.offset), error.errorString()));
    }
    if (!document.isObject()) {
        return corrupt(QStringLiteral("top-level value is not an object"));
    }

    const QJsonObject root = document.object();
    const QJsonValue version = root.value(KeyVersion);
    double versionNumber = FormatVersion;
    if (!version.isUndefined()
        && (!readWholeNumber(version, FormatVersion + 1.0, versionNumber) || versionNumber < 1)) {
        return corrupt(QStringLiteral("unsupported format version"));
    }
    const QJsonValue tasksValue = root.value(KeyTasks);
    if (!tasksValue.isArray()) {
        return corrupt(QStringLiteral("missing \"tasks\" array"));
    }

    StoreSnapshot snapshot;
    QHash<QUuid, int> seen;
    quint64 highestSequence = 0;
    const QJsonArray array = tasksValue.toArray();
    snapshot.tasks.reserve(static_cast<size_t>(array.size()));
    for (int i = 0; i < array.size(); ++i) {
        if (!array.at(i).isObject()) {
            return corrupt(recordError(i, QStringLiteral("not an object")));
        }
        auto parsed = taskFromJson(array.at(i).toObject(), i);
        if (!parsed.ok()) {
            return parsed.status();
        }
        const TaskItem &task = parsed.value();
        if (seen.contains(task.id)) {
            return corrupt(recordError(i, QStringLiteral("duplicate id %1").arg(taskIdText(task.id))));
        }
        seen.insert(task.id, i);
        highestSequence = std::max(highestSequence, task.sequence);
        snapshot.tasks.push_back(task);
    }

    // Records written without a sequence keep their file order after the
    // numbered ones.
    for (TaskItem &task : snapshot.tasks) {
        if (task.sequence == 0) {
            task.sequence = ++highestSequence;
        }
    }

    quint64 nextSequence = 1;
    const QJsonValue next = root.value(KeyNextSequence);
    if (!next.isUndefined()) {
        double number = 0;
        if (!readWholeNumber(next, SequenceLimit, number)) {
            return corrupt(QStringLiteral("invalid nextSequence"));
        }
        nextSequence = std::max<quint64>(1, static_cast<quint64>(number));
    }
    snapshot.nextSequence = std::max(nextSequence, highestSequence + 1);
    return snapshot;
}

QJsonObject JsonTaskStorage::taskToJson(const TaskItem &task)
{
    QJsonObject object;
    object.insert(KeyId, taskIdText(task.id));
    object.insert(KeyTitle, task.title);
    object.insert(KeyCategory, task.category);
    object.insert(KeyDescription, task.description.isEmpty() ? QJsonValue() : QJsonValue(task.description));
    object.insert(KeyQuantity, task.quantity ? QJsonValue(*task.quantity) : QJsonValue());
    object.insert(KeyDeadline, formatTimestamp(task.deadline));
    object.insert(KeyStatus, taskStatusToString(task.status));
    object.insert(KeyCreatedAt, formatTimestamp(task.createdAt));
    object.insert(KeySequence, static_cast<double>(task.sequence));
    object.insert(KeyLastElapsed, secondsValue(task.lastElapsedMs));
    object.insert(KeyTotalElapsed, secondsValue(task.totalElapsedMs));
    object.insert(KeyTimerState, timerStateToString(task.timerState));
    object.insert(KeyRunStartedAt, task.isRunning() ? formatTimestamp(task.runStartedAt) : QJsonValue());
    return object;
}

OperationResult<TaskItem> JsonTaskStorage::taskFromJson(const QJsonObject &object, int index)
{
    TaskItem task;

    task.id = parseUid(object.value(KeyId).toString());
    if (task.id.isNull()) {
        return corrupt(recordError(index, QStringLiteral("missing or invalid id")));
    }

    const QJsonValue title = object.value(KeyTitle);
    if (!title.isString() || title.toString().trimmed().isEmpty()) {
        return corrupt(recordError(index, QStringLiteral("missing title")));
    }
    task.title = title.toString();

    if (!readOptionalText(object.value(KeyCategory), task.category)) {
        return corrupt(recordError(index, QStringLiteral("category is not text")));
    }
    if (!readOptionalText(object.value(KeyDescription), task.description)) {
        return corrupt(recordError(index, QStringLiteral("description is not text")));
    }

    const QJsonValue quantity = object.value(KeyQuantity);
    if (quantity.isDouble()) {
        double number = 0;
        if (!readWholeNumber(quantity, QuantityLimit, number)) {
            return corrupt(recordError(index, QStringLiteral("quantity is not a non-negative integer")));
        }
        task.quantity = static_cast<int>(number);
    } else if (!quantity.isNull() && !quantity.isUndefined()) {
        return corrupt(recordError(index, QStringLiteral("quantity is not a number")));
    }

    const QJsonValue deadline = object.value(KeyDeadline);
    if (deadline.isString()) {
        task.deadline = parseTimestamp(deadline.toString());
        if (!task.deadline.isValid()) {
            return corrupt(recordError(index, QStringLiteral("unparseable deadline \"%1\"").arg(deadline.toString())));
        }
    } else if (!deadline.isNull() && !deadline.isUndefined()) {
        return corrupt(recordError(index, QStringLiteral("deadline is not a timestamp")));
    }

    const auto status = taskStatusFromString(object.value(KeyStatus).toString());
    if (!status) {
        return corrupt(recordError(index, QStringLiteral("unknown status")));
    }
    task.status = *status;

    const QJsonValue createdAt = object.value(KeyCreatedAt);
    if (createdAt.isString()) {
        task.createdAt = parseTimestamp(createdAt.toString());
        if (!task.createdAt.isValid()) {
            return corrupt(recordError(index, QStringLiteral("unparseable createdAt")));
        }
    }

    const QJsonValue sequence = object.value(KeySequence);
    if (!sequence.isUndefined()) {
        double number = 0;
        if (!readWholeNumber(sequence, SequenceLimit, number)) {
            return corrupt(recordError(index, QStringLiteral("invalid sequence")));
        }
        task.sequence = static_cast<quint64>(number);
    }

    if (!readSeconds(object.value(KeyLastElapsed), task.lastElapsedMs)
        || !readSeconds(object.value(KeyTotalElapsed), task.totalElapsedMs)) {
        return corrupt(recordError(index, QStringLiteral("invalid elapsed time")));
    }

    const QJsonValue timerState = object.value(KeyTimerState);
    if (!timerState.isUndefined()) {
        const auto state = timerStateFromString(timerState.toString());
        if (!state) {
            return corrupt(recordError(index, QStringLiteral("unknown timerState")));
        }
        task.timerState = *state;
    }

    if (task.isRunning()) {
        // A run interrupted by a crash resumes with its original start.
        task.runStartedAt = parseTimestamp(object.value(KeyRunStartedAt).toString());
        if (!task.runStartedAt.isValid()) {
            return corrupt(recordError(index, QStringLiteral("running timer without runStartedAt")));
        }
    }

    return task;
}

QJsonValue JsonTaskStorage::formatTimestamp(const QDateTime &dt)
{
    if (!dt.isValid()) {
        return QJsonValue(QJsonValue::Null);
    }
    return dt.toUTC().toString(Qt::ISODateWithMs);
}

QDateTime JsonTaskStorage::parseTimestamp(const QString &value)
{
    if (value.isEmpty()) {
        return {};
    }
    QDateTime dt = QDateTime::fromString(value, Qt::ISODateWithMs);
    if (!dt.isValid()) {
        return {};
    }
    return dt.toLocalTime();
}

} // namespace data
} // namespace taskforge
