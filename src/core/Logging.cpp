#include "taskforge/core/Logging.hpp"

namespace taskforge {

Q_LOGGING_CATEGORY(lcStore, "taskforge.store", QtInfoMsg)
Q_LOGGING_CATEGORY(lcStorage, "taskforge.storage", QtInfoMsg)
Q_LOGGING_CATEGORY(lcSweeper, "taskforge.sweeper", QtInfoMsg)
Q_LOGGING_CATEGORY(lcApp, "taskforge.app", QtInfoMsg)

} // namespace taskforge
