#include "taskforge/core/OperationStatus.hpp"

namespace taskforge {
namespace core {

QString errorCodeName(ErrorCode code)
{
    switch (code) {
    case ErrorCode::Validation:
        return QStringLiteral("ValidationError");
    case ErrorCode::NotFound:
        return QStringLiteral("NotFound");
    case ErrorCode::InvalidState:
        return QStringLiteral("InvalidState");
    case ErrorCode::Io:
        return QStringLiteral("IOError");
    case ErrorCode::CorruptState:
        return QStringLiteral("CorruptState");
    case ErrorCode::None:
    default:
        return QStringLiteral("Ok");
    }
}

OperationStatus::OperationStatus(ErrorCode code, QString message)
    : m_code(code)
    , m_message(std::move(message))
{
}

OperationStatus OperationStatus::success()
{
    return OperationStatus();
}

OperationStatus OperationStatus::failure(ErrorCode code, QString message)
{
    return OperationStatus(code, std::move(message));
}

QString OperationStatus::toString() const
{
    if (m_message.isEmpty()) {
        return errorCodeName(m_code);
    }
    return QStringLiteral("%1: %2").arg(errorCodeName(m_code), m_message);
}

} // namespace core
} // namespace taskforge
