#pragma once

#include "core/ipc/message.h"
#include <QHash>
#include <QList>
#include <QLocalServer>
#include <QLocalSocket>
#include <QObject>
#include <functional>
#include <memory>

namespace hr {

// Local-socket server speaking IpcMessage frames. Every request frame is
// handed to the registered handler on the event loop thread and its reply
// written back to the same client.
class SocketServer : public QObject {
    Q_OBJECT
public:
    explicit SocketServer(QObject* parent = nullptr);
    ~SocketServer() override;

    using RequestHandler = std::function<QJsonObject(const QJsonObject& request)>;

    bool listen(const QString& socketPath);
    void close();
    bool isListening() const;
    int clientCount() const { return static_cast<int>(m_clients.size()); }

    void setRequestHandler(RequestHandler handler);

    void broadcast(const QJsonObject& notification);

    static constexpr int kMaxReadBufferSize = IpcMessage::kMaxMessageSize + IpcMessage::kHeaderSize;

signals:
    void clientConnected();
    void clientDisconnected();
    void errorOccurred(const QString& error);

private slots:
    void onNewConnection();
    void onClientReadyRead();
    void onClientDisconnected();

private:
    void processBuffer(QLocalSocket* client);
    void dispatch(QLocalSocket* client, const QJsonObject& message);
    bool detachClient(QLocalSocket* client);
    void dropClient(QLocalSocket* client);

    std::unique_ptr<QLocalServer> m_server;
    QList<QLocalSocket*> m_clients;
    QHash<QLocalSocket*, QByteArray> m_readBuffers;
    RequestHandler m_handler;
    bool m_closing = false;
};

} // namespace hr
