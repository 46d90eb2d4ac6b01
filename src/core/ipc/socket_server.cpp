#include "core/ipc/socket_server.h"
#include "core/shared/logging.h"

#include <QPointer>

namespace lc {

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
    , m_server(std::make_unique<QLocalServer>())
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
        LOG_INFO(lcIpc, "Listening on %s", qPrintable(socketPath));
        return true;
    }

    if (m_server->serverError() != QAbstractSocket::AddressInUseError) {
        const QString err = m_server->errorString();
        LOG_ERROR(lcIpc, "Failed to listen on %s: %s", qPrintable(socketPath), qPrintable(err));
        emit errorOccurred(err);
        return false;
    }

    if (socketHasActivePeer(socketPath)) {
        const QString err = QStringLiteral("Socket already served by a running instance: %1")
                                .arg(socketPath);
        LOG_ERROR(lcIpc, "%s", qPrintable(err));
        emit errorOccurred(err);
        return false;
    }

    LOG_WARN(lcIpc, "Removing stale socket %s", qPrintable(socketPath));
    QLocalServer::removeServer(socketPath);
    if (!m_server->listen(socketPath)) {
        const QString err = m_server->errorString();
        LOG_ERROR(lcIpc, "Failed to listen on %s after stale cleanup: %s",
                  qPrintable(socketPath), qPrintable(err));
        emit errorOccurred(err);
        return false;
    }

    LOG_INFO(lcIpc, "Listening on %s", qPrintable(socketPath));
    return true;
}

void SocketServer::close()
{
    if (m_closing) {
        return;
    }
    m_closing = true;

    // Drop bookkeeping before disconnecting so disconnect callbacks find nothing.
    const QList<QLocalSocket*> clients = m_clients;
    m_clients.clear();
    m_readBuffers.clear();
    m_busyClients.clear();

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
        LOG_INFO(lcIpc, "Server closed: %s", qPrintable(path));
    }

    m_closing = false;
}

bool SocketServer::isListening() const
{
    return m_server->isListening();
}

QString SocketServer::serverPath() const
{
    return m_server->fullServerName();
}

void SocketServer::setRequestHandler(RequestHandler handler)
{
    m_handler = std::move(handler);
}

void SocketServer::onNewConnection()
{
    while (QLocalSocket* client = m_server->nextPendingConnection()) {
        client->setParent(this);
        m_clients.append(client);
        m_readBuffers.insert(client, QByteArray());

        connect(client, &QLocalSocket::readyRead,
                this, &SocketServer::onClientReadyRead);
        connect(client, &QLocalSocket::disconnected,
                this, &SocketServer::onClientDisconnected);

        LOG_DEBUG(lcIpc, "Client connected (%d total)", static_cast<int>(m_clients.size()));
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
        LOG_ERROR(lcIpc, "Client read buffer exceeded %d bytes, disconnecting client",
                  kMaxReadBufferSize);
        if (detachClient(client)) {
            client->disconnectFromServer();
            client->deleteLater();
            emit clientDisconnected();
        }
        return;
    }

    // A handler for this client is still running; it drains the buffer when it returns.
    if (m_busyClients.contains(client)) {
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
        LOG_DEBUG(lcIpc, "Client disconnected");
        client->deleteLater();
        emit clientDisconnected();
    }
}

bool SocketServer::detachClient(QLocalSocket* client)
{
    m_busyClients.remove(client);
    const bool removedClient = m_clients.removeOne(client);
    const bool removedBuffer = m_readBuffers.remove(client) > 0;
    return removedClient || removedBuffer;
}

void SocketServer::processBuffer(QLocalSocket* client)
{
    QPointer<QLocalSocket> guard(client);
    m_busyClients.insert(client);

    while (guard && m_readBuffers.contains(client)) {
        const auto decoded = IpcMessage::decode(m_readBuffers.value(client));
        if (!decoded) {
            break;
        }
        m_readBuffers[client].remove(0, decoded->bytesConsumed);

        const QJsonObject response = dispatch(decoded->json);

        // The peer may have gone away while the handler ran.
        if (!guard || !m_readBuffers.contains(client)) {
            LOG_DEBUG(lcIpc, "Client left before its response was ready");
            break;
        }
        if (response.isEmpty()) {
            continue;
        }
        const QByteArray encoded = IpcMessage::encode(response);
        if (!encoded.isEmpty()) {
            client->write(encoded);
            client->flush();
        }
    }

    if (guard) {
        m_busyClients.remove(client);
    }
}

QJsonObject SocketServer::dispatch(const QJsonObject& incoming)
{
    const QString type = incoming.value(QStringLiteral("type")).toString();
    if (type != QLatin1String("request")) {
        LOG_WARN(lcIpc, "Ignoring message of type '%s'", qPrintable(type));
        return {};
    }

    const uint64_t id = IpcMessage::requestId(incoming);
    LOG_DEBUG(lcIpc, "Request id=%llu method=%s", static_cast<unsigned long long>(id),
              qPrintable(incoming.value(QStringLiteral("method")).toString()));

    if (!m_handler) {
        return IpcMessage::makeError(id, IpcErrorCode::InternalError,
                                     QStringLiteral("No request handler registered"));
    }
    return m_handler(incoming);
}

} // namespace lc
