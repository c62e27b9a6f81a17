#pragma once

#include <QJsonObject>
#include <QString>

#include "taskforge/data/TaskStorage.hpp"

namespace taskforge {
namespace data {

class JsonTaskStorage : public TaskStorage
{
public:
    explicit JsonTaskStorage(QString filePath);
    ~JsonTaskStorage() override = default;

    core::OperationResult<StoreSnapshot> load() override;
    core::OperationStatus save(const StoreSnapshot &snapshot) override;
    QString location() const override;

    // Moves an unreadable store aside to "<file>.corrupt" so the next load
    // starts empty.
    core::OperationStatus discardCorruptFile();

    static QByteArray serialize(const StoreSnapshot &snapshot);
    static core::OperationResult<StoreSnapshot> deserialize(const QByteArray &payload);

private:
    static QJsonObject taskToJson(const TaskItem &task);
    static core::OperationResult<TaskItem> taskFromJson(const QJsonObject &object, int index);
    static QJsonValue formatTimestamp(const QDateTime &dt);
    static QDateTime parseTimestamp(const QString &value);

    QString m_filePath;
};

} // namespace data
} // namespace taskforge
