#include "taskforge/data/InMemoryTaskStorage.hpp"

namespace taskforge {
namespace data {

InMemoryTaskStorage::InMemoryTaskStorage() = default;

InMemoryTaskStorage::InMemoryTaskStorage(StoreSnapshot initial)
    : m_snapshot(std::move(initial))
{
}

InMemoryTaskStorage::~InMemoryTaskStorage() = default;

core::OperationResult<StoreSnapshot> InMemoryTaskStorage::load()
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_snapshot;
}

core::OperationStatus InMemoryTaskStorage::save(const StoreSnapshot &snapshot)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    if (m_failSaves) {
        return core::OperationStatus::failure(core::ErrorCode::Io, QStringLiteral("in-memory storage rejects writes"));
    }
    m_snapshot = snapshot;
    ++m_saveCount;
    return core::OperationStatus::success();
}

QString InMemoryTaskStorage::location() const
{
    return QStringLiteral(":memory:");
}

StoreSnapshot InMemoryTaskStorage::snapshot() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_snapshot;
}

int InMemoryTaskStorage::saveCount() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_saveCount;
}

void InMemoryTaskStorage::setFailSaves(bool fail)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    m_failSaves = fail;
}

} // namespace data
} // namespace taskforge
