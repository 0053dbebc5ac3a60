#include "core/ipc/service_base.h"
#include "core/shared/logging.h"
#include <QCoreApplication>
#include <QDateTime>
#include <QDir>
#include <QFileInfo>

#include <unistd.h>

#include <cstdio>

namespace hr {

ServiceBase::ServiceBase(const QString& serviceName, QObject* parent)
    : QObject(parent)
    , m_serviceName(serviceName)
    , m_server(std::make_unique<SocketServer>(this))
{
    m_server->setRequestHandler([this](const QJsonObject& request) {
        return handleRequest(request);
    });
}

ServiceBase::~ServiceBase() = default;

int ServiceBase::run(const QString& socketPathOverride)
{
    const QString path = socketPathOverride.isEmpty()
        ? socketPath(m_serviceName)
        : QDir::cleanPath(socketPathOverride);

    const QDir dir = QFileInfo(path).dir();
    if (!dir.exists() && !QDir().mkpath(dir.path())) {
        LOG_ERROR(hrIpc, "Failed to create socket directory: %s", qUtf8Printable(dir.path()));
        return 1;
    }

    if (!m_server->listen(path)) {
        LOG_ERROR(hrIpc, "Service '%s' failed to start", qUtf8Printable(m_serviceName));
        return 1;
    }

    LOG_INFO(hrIpc, "Service '%s' started on %s",
             qUtf8Printable(m_serviceName), qUtf8Printable(path));

    std::fprintf(stdout, "ready\n");
    std::fflush(stdout);

    return QCoreApplication::exec();
}

QString ServiceBase::runtimeDirectory()
{
    const QString fromEnv = qEnvironmentVariable("HYBRIDRAG_RUNTIME_DIR").trimmed();
    if (!fromEnv.isEmpty()) {
        return QDir::cleanPath(fromEnv);
    }
    return QStringLiteral("/tmp/hybridrag-%1").arg(getuid());
}

QString ServiceBase::socketPath(const QString& serviceName)
{
    return QDir::cleanPath(runtimeDirectory() + QLatin1Char('/')
                           + serviceName + QStringLiteral(".sock"));
}

QJsonObject ServiceBase::handleRequest(const QJsonObject& request)
{
    const QString method = request.value(QStringLiteral("method")).toString();

    if (method == QLatin1String("ping")) {
        return handlePing(request);
    }
    if (method == QLatin1String("shutdown")) {
        return handleShutdown(request);
    }

    LOG_WARN(hrIpc, "Unknown method '%s' in service '%s'",
             qUtf8Printable(method), qUtf8Printable(m_serviceName));
    return IpcMessage::makeError(IpcMessage::requestId(request), IpcErrorCode::NotFound,
                                 QStringLiteral("Unknown method: %1").arg(method));
}

QJsonObject ServiceBase::handlePing(const QJsonObject& request)
{
    QJsonObject result;
    result[QStringLiteral("pong")] = true;
    result[QStringLiteral("timestamp")] = QDateTime::currentMSecsSinceEpoch();
    result[QStringLiteral("service")] = m_serviceName;
    return IpcMessage::makeResponse(IpcMessage::requestId(request), result);
}

QJsonObject ServiceBase::handleShutdown(const QJsonObject& request)
{
    LOG_INFO(hrIpc, "Shutdown requested for service '%s'", qUtf8Printable(m_serviceName));

    QJsonObject result;
    result[QStringLiteral("shutting_down")] = true;

    // Quit after the reply has been written.
    if (QCoreApplication::instance()) {
        QMetaObject::invokeMethod(QCoreApplication::instance(), &QCoreApplication::quit,
                                  Qt::QueuedConnection);
    }

    return IpcMessage::makeResponse(IpcMessage::requestId(request), result);
}

void ServiceBase::sendNotification(const QString& method, const QJsonObject& params)
{
    m_server->broadcast(IpcMessage::makeNotification(method, params));
}

} // namespace hr
