#pragma once

#include "core/shared/ipc_messages.h"
#include <QByteArray>
#include <QJsonObject>
#include <cstdint>

namespace hr {

// Wire framing: 4-byte big-endian payload length followed by a compact
// UTF-8 JSON object.
class IpcMessage {
public:
    // Empty result when the payload exceeds kMaxMessageSize.
    static QByteArray encode(const QJsonObject& json);

    struct DecodeResult {
        enum class Status {
            Complete,   // json is valid, bytesConsumed > 0
            Incomplete, // wait for more bytes
            Malformed,  // frame is unusable; bytesConsumed says how much to drop
        };
        Status status = Status::Incomplete;
        QJsonObject json;
        int bytesConsumed = 0;
    };
    static DecodeResult decode(const QByteArray& buffer);

    static QJsonObject makeRequest(uint64_t id, const QString& method, const QJsonObject& params = {});
    static QJsonObject makeResponse(uint64_t id, const QJsonObject& result);
    static QJsonObject makeError(uint64_t id, IpcErrorCode code, const QString& message);
    static QJsonObject makeNotification(const QString& method, const QJsonObject& params = {});

    static uint64_t requestId(const QJsonObject& message);

    static constexpr int kHeaderSize = 4;
    static constexpr int kMaxMessageSize = 16 * 1024 * 1024;
};

} // namespace hr
