#pragma once

#include "core/ipc/socket_server.h"

#include <QJsonObject>
#include <QString>

#include <memory>

namespace lc {

class ServiceBase : public QObject {
    Q_OBJECT
public:
    explicit ServiceBase(const QString& serviceName, QObject* parent = nullptr);
    ~ServiceBase() override;

    // Listen on socketPath(serviceName) and enter the event loop.
    int run();

    // Listen without entering the event loop (tests drive their own loop).
    bool start(const QString& socketPath);
    void stop();

    const QString& serviceName() const { return m_serviceName; }

    // $LEXCITE_SOCKET_DIR, else $LEXCITE_RUNTIME_DIR, else /tmp/lexcite-<uid>
    static QString socketPath(const QString& serviceName);
    static QString runtimeDirectory();
    static QString socketDirectory();

    virtual QJsonObject handleRequest(const QJsonObject& request);

protected:
    QJsonObject handlePing(const QJsonObject& request);
    QJsonObject handleShutdown(const QJsonObject& request);

    QString m_serviceName;
    std::unique_ptr<SocketServer> m_server;
};

} // namespace lc
