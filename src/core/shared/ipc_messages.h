#pragma once

#include <QString>

namespace hr {

// Error codes carried in {"type":"error","error":{"code",...}} replies.
enum class IpcErrorCode : int {
    InvalidParams      = 1,
    Timeout            = 2,
    NotFound           = 4,
    InternalError      = 6,
    Unsupported        = 7,
    ServiceUnavailable = 9,
};

inline QString ipcErrorCodeToString(IpcErrorCode code)
{
    switch (code) {
    case IpcErrorCode::InvalidParams:      return QStringLiteral("INVALID_PARAMS");
    case IpcErrorCode::Timeout:            return QStringLiteral("TIMEOUT");
    case IpcErrorCode::NotFound:           return QStringLiteral("NOT_FOUND");
    case IpcErrorCode::InternalError:      return QStringLiteral("INTERNAL_ERROR");
    case IpcErrorCode::Unsupported:        return QStringLiteral("UNSUPPORTED");
    case IpcErrorCode::ServiceUnavailable: return QStringLiteral("SERVICE_UNAVAILABLE");
    }
    return QStringLiteral("UNKNOWN");
}

} // namespace hr
