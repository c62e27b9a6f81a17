#pragma once

#include <mutex>

#include "taskforge/data/TaskStorage.hpp"

namespace taskforge {
namespace data {

class InMemoryTaskStorage : public TaskStorage
{
public:
    InMemoryTaskStorage();
    explicit InMemoryTaskStorage(StoreSnapshot initial);
    ~InMemoryTaskStorage() override;

    core::OperationResult<StoreSnapshot> load() override;
    core::OperationStatus save(const StoreSnapshot &snapshot) override;
    QString location() const override;

    StoreSnapshot snapshot() const;
    int saveCount() const;
    void setFailSaves(bool fail);

private:
    mutable std::mutex m_mutex;
    StoreSnapshot m_snapshot;
    int m_saveCount = 0;
    bool m_failSaves = false;
};

} // namespace data
} // namespace taskforge
