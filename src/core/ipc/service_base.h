#pragma once

#include "core/ipc/socket_server.h"
#include <QJsonObject>
#include <QString>
#include <memory>

namespace hr {

// A QObject service bound to one local socket. Subclasses extend
// handleRequest() and fall back to the base for ping/shutdown/unknown.
class ServiceBase : public QObject {
    Q_OBJECT
public:
    explicit ServiceBase(const QString& serviceName, QObject* parent = nullptr);
    ~ServiceBase() override;

    // Listens on socketPath(serviceName) unless an explicit path is given,
    // prints "ready" on stdout, then enters the event loop.
    int run(const QString& socketPathOverride = {});

    // $HYBRIDRAG_RUNTIME_DIR or /tmp/hybridrag-<uid>
    static QString runtimeDirectory();
    static QString socketPath(const QString& serviceName);

    const QString& serviceName() const { return m_serviceName; }

protected:
    virtual QJsonObject handleRequest(const QJsonObject& request);

    QJsonObject handlePing(const QJsonObject& request);
    QJsonObject handleShutdown(const QJsonObject& request);

    void sendNotification(const QString& method, const QJsonObject& params = {});

    QString m_serviceName;
    std::unique_ptr<SocketServer> m_server;
};

} // namespace hr
