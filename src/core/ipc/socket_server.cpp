#include "core/ipc/socket_server.h"
#include "core/shared/logging.h"

namespace hr {

namespace {

bool socketHasActivePeer(const QString& socketPath)
{
    QLocalSocket probe;
    probe.connectToServer(socketPath);
    const bool connected = probe.waitForConnected(150);
    if (connected) {
        probe.disconnectFromServer();
        probe.waitForDisconnected(50);
    }
    return connected;
}

} // namespace

SocketServer::SocketServer(QObject* parent)
    : QObject(parent)
    , m_server(std::make_unique<QLocalServer>(this))
{
    connect(m_server.get(), &QLocalServer::newConnection,
            this, &SocketServer::onNewConnection);
}

SocketServer::~SocketServer()
{
    close();
}

bool SocketServer::listen(const QString& socketPath)
{
    m_server->setSocketOptions(QLocalServer::UserAccessOption);
    if (m_server->listen(socketPath)) {
        LOG_INFO(hrIpc, "Listening on %s", qUtf8Printable(socketPath));
        return true;
    }

    if (m_server->serverError() != QAbstractSocket::AddressInUseError) {
        const QString err = m_server->errorString();
        LOG_ERROR(hrIpc, "Failed to listen on %s: %s",
                  qUtf8Printable(socketPath), qUtf8Printable(err));
        emit errorOccurred(err);
        return false;
    }

    if (socketHasActivePeer(socketPath)) {
        const QString err = QStringLiteral("Socket already served by a running instance: %1")
                                .arg(socketPath);
        LOG_ERROR(hrIpc, "%s", qUtf8Printable(err));
        emit errorOccurred(err);
        return false;
    }

    LOG_WARN(hrIpc, "Removing stale socket %s", qUtf8Printable(socketPath));
    QLocalServer::removeServer(socketPath);
    if (!m_server->listen(socketPath)) {
        const QString err = m_server->errorString();
        LOG_ERROR(hrIpc, "Failed to listen on %s after stale cleanup: %s",
                  qUtf8Printable(socketPath), qUtf8Printable(err));
        emit errorOccurred(err);
        return false;
    }

    LOG_INFO(hrIpc, "Listening on %s", qUtf8Printable(socketPath));
    return true;
}

void SocketServer::close()
{
    if (m_closing) {
        return;
    }
    m_closing = true;

    const QList<QLocalSocket*> clients = m_clients;
    m_clients.clear();
    m_readBuffers.clear();

    for (QLocalSocket* client : clients) {
        client->disconnect(this);
        if (client->state() != QLocalSocket::UnconnectedState) {
            client->disconnectFromServer();
        }
        client->deleteLater();
    }

    if (m_server->isListening()) {
        const QString path = m_server->fullServerName();
        m_server->close();
        LOG_INFO(hrIpc, "Server closed: %s", qUtf8Printable(path));
    }

    m_closing = false;
}

bool SocketServer::isListening() const
{
    return m_server->isListening();
}

void SocketServer::setRequestHandler(RequestHandler handler)
{
    m_handler = std::move(handler);
}

void SocketServer::broadcast(const QJsonObject& notification)
{
    const QByteArray encoded = IpcMessage::encode(notification);
    if (encoded.isEmpty()) {
        LOG_WARN(hrIpc, "Failed to encode broadcast notification");
        return;
    }

    for (QLocalSocket* client : m_clients) {
        client->write(encoded);
        client->flush();
    }
    LOG_DEBUG(hrIpc, "Broadcast to %d client(s)", clientCount());
}

// ── Connection handling ─────────────────────────────────

void SocketServer::onNewConnection()
{
    while (QLocalSocket* client = m_server->nextPendingConnection()) {
        m_clients.append(client);
        m_readBuffers.insert(client, QByteArray());

        connect(client, &QLocalSocket::readyRead,
                this, &SocketServer::onClientReadyRead);
        connect(client, &QLocalSocket::disconnected,
                this, &SocketServer::onClientDisconnected);

        LOG_DEBUG(hrIpc, "Client connected (%d active)", clientCount());
        emit clientConnected();
    }
}

void SocketServer::onClientReadyRead()
{
    auto* client = qobject_cast<QLocalSocket*>(sender());
    if (!client || !m_readBuffers.contains(client)) {
        return;
    }

    QByteArray& buffer = m_readBuffers[client];
    buffer.append(client->readAll());
    if (buffer.size() > kMaxReadBufferSize) {
        LOG_ERROR(hrIpc, "Client read buffer exceeded %d bytes, disconnecting",
                  kMaxReadBufferSize);
        dropClient(client);
        return;
    }

    processBuffer(client);
}

void SocketServer::onClientDisconnected()
{
    auto* client = qobject_cast<QLocalSocket*>(sender());
    if (!client) {
        return;
    }
    if (detachClient(client)) {
        LOG_DEBUG(hrIpc, "Client disconnected (%d active)", clientCount());
        client->deleteLater();
        emit clientDisconnected();
    }
}

bool SocketServer::detachClient(QLocalSocket* client)
{
    const bool removedClient = m_clients.removeOne(client);
    const bool removedBuffer = m_readBuffers.remove(client) > 0;
    return removedClient || removedBuffer;
}

void SocketServer::dropClient(QLocalSocket* client)
{
    const bool wasTracked = detachClient(client);
    client->disconnect(this);
    client->disconnectFromServer();
    if (wasTracked) {
        client->deleteLater();
        emit clientDisconnected();
    }
}

// ── Frame processing ────────────────────────────────────

void SocketServer::processBuffer(QLocalSocket* client)
{
    while (m_readBuffers.contains(client)) {
        QByteArray& buffer = m_readBuffers[client];
        const IpcMessage::DecodeResult decoded = IpcMessage::decode(buffer);

        if (decoded.status == IpcMessage::DecodeResult::Status::Incomplete) {
            return;
        }
        buffer.remove(0, decoded.bytesConsumed);

        if (decoded.status == IpcMessage::DecodeResult::Status::Malformed) {
            const QByteArray reply = IpcMessage::encode(IpcMessage::makeError(
                0, IpcErrorCode::InvalidParams, QStringLiteral("Malformed message frame")));
            client->write(reply);
            client->flush();
            continue;
        }

        dispatch(client, decoded.json);
    }
}

void SocketServer::dispatch(QLocalSocket* client, const QJsonObject& message)
{
    const QString type = message.value(QStringLiteral("type")).toString();
    const QString method = message.value(QStringLiteral("method")).toString();

    if (type == QLatin1String("notification")) {
        LOG_DEBUG(hrIpc, "Notification: method=%s", qUtf8Printable(method));
        if (m_handler) {
            m_handler(message);
        }
        return;
    }

    if (type != QLatin1String("request")) {
        LOG_WARN(hrIpc, "Ignoring message of unknown type '%s'", qUtf8Printable(type));
        return;
    }

    const uint64_t id = IpcMessage::requestId(message);
    LOG_DEBUG(hrIpc, "Request: method=%s id=%llu",
              qUtf8Printable(method), static_cast<unsigned long long>(id));

    const QJsonObject response = m_handler
        ? m_handler(message)
        : IpcMessage::makeError(id, IpcErrorCode::InternalError,
                                QStringLiteral("No request handler registered"));

    const QByteArray encoded = IpcMessage::encode(response);
    if (encoded.isEmpty()) {
        const QByteArray fallback = IpcMessage::encode(IpcMessage::makeError(
            id, IpcErrorCode::InternalError, QStringLiteral("Response too large")));
        client->write(fallback);
    } else {
        client->write(encoded);
    }
    client->flush();
}

} // namespace hr
