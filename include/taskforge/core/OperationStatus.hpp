#pragma once

#include <QString>
#include <optional>
#include <utility>

namespace taskforge {
namespace core {

enum class ErrorCode
{
    None,
    Validation,
    NotFound,
    InvalidState,
    Io,
    CorruptState,
};

QString errorCodeName(ErrorCode code);

class OperationStatus
{
public:
    OperationStatus() = default;

    static OperationStatus success();
    static OperationStatus failure(ErrorCode code, QString message);

    bool ok() const { return m_code == ErrorCode::None; }
    ErrorCode code() const { return m_code; }
    const QString &message() const { return m_message; }

    QString toString() const;

private:
    OperationStatus(ErrorCode code, QString message);

    ErrorCode m_code = ErrorCode::None;
    QString m_message;
};

// A value together with the status of the call that produced it. A failed
// write-through still carries the value (e.g. the id of a created task),
// because the in-memory change is kept.
template <typename T>
class OperationResult
{
public:
    OperationResult(T value)
        : m_value(std::move(value))
    {
    }

    OperationResult(OperationStatus status)
        : m_status(std::move(status))
    {
    }

    OperationResult(OperationStatus status, T value)
        : m_status(std::move(status))
        , m_value(std::move(value))
    {
    }

    bool ok() const { return m_status.ok(); }
    bool hasValue() const { return m_value.has_value(); }
    const OperationStatus &status() const { return m_status; }
    const T &value() const { return *m_value; }
    T valueOr(T fallback) const { return m_value.value_or(std::move(fallback)); }

private:
    OperationStatus m_status;
    std::optional<T> m_value;
};

} // namespace core
} // namespace taskforge
