#pragma once

#include <QByteArray>
#include <QJsonObject>
#include <QList>
#include <QPair>
#include <QString>
#include <QUrl>

#include <optional>

namespace lc {

struct HttpResponse {
    int status = 0;
    QByteArray body;
    QString error;
    bool timedOut = false;

    bool ok() const { return error.isEmpty() && status >= 200 && status < 300; }
};

using HttpHeaders = QList<QPair<QByteArray, QByteArray>>;

// Blocking JSON POST used by the provider clients. Runs a private event
// loop, so it may be called from any thread that has no loop of its own
// running (including std::async workers).
class HttpJsonClient {
public:
    static HttpResponse postJson(const QUrl& url, const QJsonObject& payload,
                                 const HttpHeaders& headers, int timeoutMs);

    static std::optional<QJsonObject> parseObject(const QByteArray& body, QString* error);

    static HttpHeaders bearerHeaders(const QString& apiKey);
};

} // namespace lc
