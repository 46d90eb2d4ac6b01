#pragma once

#include "core/ipc/message.h"

#include <QHash>
#include <QList>
#include <QLocalServer>
#include <QLocalSocket>
#include <QObject>
#include <QSet>

#include <functional>
#include <memory>

namespace lc {

// Request/response server over a local socket. Requests from one client are
// answered in arrival order; a handler may spin a nested event loop.
class SocketServer : public QObject {
    Q_OBJECT
public:
    explicit SocketServer(QObject* parent = nullptr);
    ~SocketServer() override;

    using RequestHandler = std::function<QJsonObject(const QJsonObject& request)>;

    bool listen(const QString& socketPath);
    void close();
    bool isListening() const;
    QString serverPath() const;

    void setRequestHandler(RequestHandler handler);

    static constexpr int kMaxReadBufferSize = 64 * 1024 * 1024;

signals:
    void clientConnected();
    void clientDisconnected();
    void errorOccurred(const QString& error);

private slots:
    void onNewConnection();
    void onClientReadyRead();
    void onClientDisconnected();

private:
    bool detachClient(QLocalSocket* client);
    void processBuffer(QLocalSocket* client);
    QJsonObject dispatch(const QJsonObject& incoming);

    std::unique_ptr<QLocalServer> m_server;
    QList<QLocalSocket*> m_clients;
    QHash<QLocalSocket*, QByteArray> m_readBuffers;
    QSet<QLocalSocket*> m_busyClients;
    RequestHandler m_handler;
    bool m_closing = false;
};

} // namespace lc
