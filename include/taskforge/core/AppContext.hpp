#pragma once

#include <memory>

#include "taskforge/core/AppConfig.hpp"
#include "taskforge/core/OperationStatus.hpp"

namespace taskforge {
namespace data {
class JsonTaskStorage;
class TaskStore;
}

namespace core {

class Clock;
class ExpirySweeper;

class AppContext
{
public:
    explicit AppContext(AppConfig config);
    AppContext(AppConfig config, std::unique_ptr<Clock> clock);
    ~AppContext();

    // Loads the store and starts the sweeper. A corrupt store fails startup
    // unless the configuration asks to discard it.
    OperationStatus initialize();

    // Stops the sweeper and waits for an in-flight sweep.
    void shutdown();

    const AppConfig &config() const;
    data::TaskStore &taskStore();
    ExpirySweeper &sweeper();

private:
    AppConfig m_config;
    std::unique_ptr<Clock> m_clock;
    std::unique_ptr<data::JsonTaskStorage> m_storage;
    std::unique_ptr<data::TaskStore> m_store;
    std::unique_ptr<ExpirySweeper> m_sweeper;
};

} // namespace core
} // namespace taskforge
