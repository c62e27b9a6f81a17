#pragma once

#include <QLoggingCategory>

namespace taskforge {

Q_DECLARE_LOGGING_CATEGORY(lcStore)
Q_DECLARE_LOGGING_CATEGORY(lcStorage)
Q_DECLARE_LOGGING_CATEGORY(lcSweeper)
Q_DECLARE_LOGGING_CATEGORY(lcApp)

} // namespace taskforge
