#include "core/net/http_json_client.h"
#include "core/shared/logging.h"

#include <QEventLoop>
#include <QJsonDocument>
#include <QJsonParseError>
#include <QNetworkAccessManager>
#include <QNetworkReply>
#include <QNetworkRequest>

#include <memory>

namespace lc {

HttpResponse HttpJsonClient::postJson(const QUrl& url, const QJsonObject& payload,
                                      const HttpHeaders& headers, int timeoutMs)
{
    HttpResponse response;
    if (!url.isValid()) {
        response.error = QStringLiteral("invalid url: %1").arg(url.toString());
        return response;
    }

    QNetworkAccessManager manager;
    QNetworkRequest request(url);
    request.setHeader(QNetworkRequest::ContentTypeHeader, QStringLiteral("application/json"));
    for (const auto& header : headers) {
        request.setRawHeader(header.first, header.second);
    }
    if (timeoutMs > 0) {
        request.setTransferTimeout(timeoutMs);
    }

    const QByteArray body = QJsonDocument(payload).toJson(QJsonDocument::Compact);
    std::unique_ptr<QNetworkReply> reply(manager.post(request, body));

    if (!reply->isFinished()) {
        QEventLoop loop;
        QObject::connect(reply.get(), &QNetworkReply::finished, &loop, &QEventLoop::quit);
        loop.exec();
    }

    response.status = reply->attribute(QNetworkRequest::HttpStatusCodeAttribute).toInt();
    response.body = reply->readAll();

    const QNetworkReply::NetworkError networkError = reply->error();
    if (networkError == QNetworkReply::OperationCanceledError
        || networkError == QNetworkReply::TimeoutError) {
        response.timedOut = true;
        response.error = QStringLiteral("request timed out after %1 ms").arg(timeoutMs);
    } else if (networkError != QNetworkReply::NoError && response.status == 0) {
        response.error = reply->errorString();
    } else if (response.status < 200 || response.status >= 300) {
        response.error = QStringLiteral("HTTP %1").arg(response.status);
    }

    if (!response.error.isEmpty()) {
        LOG_WARN(lcCore, "POST %s failed: %s", qUtf8Printable(url.toString()),
                 qUtf8Printable(response.error));
    }
    return response;
}

std::optional<QJsonObject> HttpJsonClient::parseObject(const QByteArray& body, QString* error)
{
    QJsonParseError parseError;
    const QJsonDocument doc = QJsonDocument::fromJson(body, &parseError);
    if (parseError.error != QJsonParseError::NoError) {
        if (error) {
            *error = parseError.errorString();
        }
        return std::nullopt;
    }
    if (!doc.isObject()) {
        if (error) {
            *error = QStringLiteral("response is not a JSON object");
        }
        return std::nullopt;
    }
    return doc.object();
}

HttpHeaders HttpJsonClient::bearerHeaders(const QString& apiKey)
{
    HttpHeaders headers;
    if (!apiKey.isEmpty()) {
        headers.append(qMakePair(QByteArrayLiteral("Authorization"),
                                 QByteArrayLiteral("Bearer ") + apiKey.toUtf8()));
    }
    return headers;
}

} // namespace lc
