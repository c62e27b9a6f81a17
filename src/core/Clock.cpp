#include "taskforge/core/Clock.hpp"

namespace taskforge {
namespace core {

QDateTime SystemClock::now() const
{
    return QDateTime::currentDateTime();
}

} // namespace core
} // namespace taskforge
