#pragma once

#include <QString>
#include <cstdint>

namespace lc {

// IPC error codes. NotFound is the "justification does not exist" class,
// InternalError the "system malfunctioned" class.
enum class IpcErrorCode : int {
    InvalidParams      = 1,
    Timeout            = 2,
    NotFound           = 4,
    InternalError      = 6,
    ServiceUnavailable = 9,
};

inline QString ipcErrorCodeToString(IpcErrorCode code)
{
    switch (code) {
    case IpcErrorCode::InvalidParams:      return QStringLiteral("INVALID_PARAMS");
    case IpcErrorCode::Timeout:            return QStringLiteral("TIMEOUT");
    case IpcErrorCode::NotFound:           return QStringLiteral("NOT_FOUND");
    case IpcErrorCode::InternalError:      return QStringLiteral("INTERNAL_ERROR");
    case IpcErrorCode::ServiceUnavailable: return QStringLiteral("SERVICE_UNAVAILABLE");
    }
    return QStringLiteral("UNKNOWN");
}

} // namespace lc
