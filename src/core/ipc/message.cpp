#include "core/ipc/message.h"
#include "core/shared/logging.h"
#include <QJsonDocument>
#include <QtEndian>

#include <cstring>

namespace hr {

QByteArray IpcMessage::encode(const QJsonObject& json)
{
    const QByteArray payload = QJsonDocument(json).toJson(QJsonDocument::Compact);
    if (payload.size() > kMaxMessageSize) {
        LOG_WARN(hrIpc, "Refusing to encode %d byte message (max %d)",
                 static_cast<int>(payload.size()), kMaxMessageSize);
        return {};
    }

    QByteArray frame;
    frame.reserve(kHeaderSize + payload.size());
    const quint32 len = qToBigEndian(static_cast<quint32>(payload.size()));
    frame.append(reinterpret_cast<const char*>(&len), kHeaderSize);
    frame.append(payload);
    return frame;
}

IpcMessage::DecodeResult IpcMessage::decode(const QByteArray& buffer)
{
    DecodeResult result;
    if (buffer.size() < kHeaderSize) {
        return result;
    }

    quint32 rawLen = 0;
    std::memcpy(&rawLen, buffer.constData(), kHeaderSize);
    const quint32 payloadLen = qFromBigEndian(rawLen);

    if (payloadLen > static_cast<quint32>(kMaxMessageSize)) {
        // The length can't be trusted, so nothing after it can be either.
        LOG_WARN(hrIpc, "Frame length %u exceeds max %d", payloadLen, kMaxMessageSize);
        result.status = DecodeResult::Status::Malformed;
        result.bytesConsumed = static_cast<int>(buffer.size());
        return result;
    }

    const int frameLen = kHeaderSize + static_cast<int>(payloadLen);
    if (buffer.size() < frameLen) {
        return result;
    }

    result.bytesConsumed = frameLen;

    QJsonParseError parseError;
    const QJsonDocument doc = QJsonDocument::fromJson(
        buffer.mid(kHeaderSize, static_cast<int>(payloadLen)), &parseError);
    if (parseError.error != QJsonParseError::NoError) {
        LOG_WARN(hrIpc, "Dropping frame with invalid JSON: %s",
                 qUtf8Printable(parseError.errorString()));
        result.status = DecodeResult::Status::Malformed;
        return result;
    }
    if (!doc.isObject()) {
        LOG_WARN(hrIpc, "Dropping frame whose JSON root is not an object");
        result.status = DecodeResult::Status::Malformed;
        return result;
    }

    result.status = DecodeResult::Status::Complete;
    result.json = doc.object();
    return result;
}

QJsonObject IpcMessage::makeRequest(uint64_t id, const QString& method, const QJsonObject& params)
{
    QJsonObject json;
    json[QStringLiteral("type")] = QStringLiteral("request");
    json[QStringLiteral("id")] = static_cast<qint64>(id);
    json[QStringLiteral("method")] = method;
    if (!params.isEmpty()) {
        json[QStringLiteral("params")] = params;
    }
    return json;
}

QJsonObject IpcMessage::makeResponse(uint64_t id, const QJsonObject& result)
{
    QJsonObject json;
    json[QStringLiteral("type")] = QStringLiteral("response");
    json[QStringLiteral("id")] = static_cast<qint64>(id);
    json[QStringLiteral("result")] = result;
    return json;
}

QJsonObject IpcMessage::makeError(uint64_t id, IpcErrorCode code, const QString& message)
{
    QJsonObject error;
    error[QStringLiteral("code")] = static_cast<int>(code);
    error[QStringLiteral("codeString")] = ipcErrorCodeToString(code);
    error[QStringLiteral("message")] = message;

    QJsonObject json;
    json[QStringLiteral("type")] = QStringLiteral("error");
    json[QStringLiteral("id")] = static_cast<qint64>(id);
    json[QStringLiteral("error")] = error;
    return json;
}

QJsonObject IpcMessage::makeNotification(const QString& method, const QJsonObject& params)
{
    QJsonObject json;
    json[QStringLiteral("type")] = QStringLiteral("notification");
    json[QStringLiteral("method")] = method;
    if (!params.isEmpty()) {
        json[QStringLiteral("params")] = params;
    }
    return json;
}

uint64_t IpcMessage::requestId(const QJsonObject& message)
{
    return static_cast<uint64_t>(message.value(QStringLiteral("id")).toInteger());
}

} // namespace hr
