#include "ipc_test_utils.h"

#include "core/ipc/message.h"

namespace hr::test {

QJsonObject makeRequest(const QString& method, const QJsonObject& params, uint64_t id)
{
    return IpcMessage::makeRequest(id, method, params);
}

bool isResponse(const QJsonObject& message)
{
    return message.value(QStringLiteral("type")).toString() == QLatin1String("response");
}

bool isError(const QJsonObject& message)
{
    return message.value(QStringLiteral("type")).toString() == QLatin1String("error");
}

QJsonObject resultPayload(const QJsonObject& message)
{
    return message.value(QStringLiteral("result")).toObject();
}

QJsonObject errorPayload(const QJsonObject& message)
{
    return message.value(QStringLiteral("error")).toObject();
}

int errorCode(const QJsonObject& message)
{
    return errorPayload(message).value(QStringLiteral("code")).toInt();
}

} // namespace hr::test
