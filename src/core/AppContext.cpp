#include "taskforge/core/AppContext.hpp"

#include "taskforge/core/Clock.hpp"
#include "taskforge/core/ExpirySweeper.hpp"
#include "taskforge/core/Logging.hpp"
#include "taskforge/data/JsonTaskStorage.hpp"
#include "taskforge/data/TaskStore.hpp"

namespace taskforge {
namespace core {

AppContext::AppContext(AppConfig config)
    : AppContext(std::move(config), std::make_unique<SystemClock>())
{
}

AppContext::AppContext(AppConfig config, std::unique_ptr<Clock> clock)
    : m_config(std::move(config))
    , m_clock(std::move(clock))
    , m_storage(std::make_unique<data::JsonTaskStorage>(m_config.storePath))
    , m_store(std::make_unique<data::TaskStore>(*m_storage, *m_clock))
    , m_sweeper(std::make_unique<ExpirySweeper>(*m_store, m_config.sweepInterval))
{
}

AppContext::~AppContext()
{
    shutdown();
}

OperationStatus AppContext::initialize()
{
    auto status = m_store->load();
    if (status.code() == ErrorCode::CorruptState && m_config.discardCorrupt) {
        qCWarning(lcApp) << "discarding unreadable store:" << status.message();
        const auto discarded = m_storage->discardCorruptFile();
        if (!discarded.ok()) {
            return discarded;
        }
        status = m_store->load();
    }
    if (!status.ok()) {
        return status;
    }
    m_sweeper->start();
    return OperationStatus::success();
}

void AppContext::shutdown()
{
    if (m_sweeper) {
        m_sweeper->stop();
    }
}

const AppConfig &AppContext::config() const
{
    return m_config;
}

data::TaskStore &AppContext::taskStore()
{
    return *m_store;
}

ExpirySweeper &AppContext::sweeper()
{
    return *m_sweeper;
}

} // namespace core
} // namespace taskforge
