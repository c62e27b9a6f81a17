#pragma once

#include <QString>
#include <vector>

#include "taskforge/core/OperationStatus.hpp"
#include "taskforge/data/Task.hpp"

namespace taskforge {
namespace data {

struct StoreSnapshot
{
    std::vector<TaskItem> tasks;
    quint64 nextSequence = 1;
};

class TaskStorage
{
public:
    virtual ~TaskStorage() = default;

    // A missing backing store yields an empty snapshot, not an error.
    virtual core::OperationResult<StoreSnapshot> load() = 0;
    virtual core::OperationStatus save(const StoreSnapshot &snapshot) = 0;
    virtual QString location() const = 0;
};

} // namespace data
} // namespace taskforge
