#include "core/ipc/message.h"
#include "core/shared/logging.h"

#include <QJsonDocument>
#include <QtEndian>

#include <cstring>

namespace lc {

QByteArray IpcMessage::encode(const QJsonObject& json)
{
    const QByteArray payload = QJsonDocument(json).toJson(QJsonDocument::Compact);
    if (payload.size() > kMaxMessageSize) {
        LOG_WARN(lcIpc, "Refusing to encode %d byte message (max %d)",
                 static_cast<int>(payload.size()), kMaxMessageSize);
        return {};
    }

    QByteArray frame;
    frame.reserve(4 + payload.size());
    const quint32 length = qToBigEndian(static_cast<quint32>(payload.size()));
    frame.append(reinterpret_cast<const char*>(&length), 4);
    frame.append(payload);
    return frame;
}

std::optional<IpcMessage::DecodeResult> IpcMessage::decode(const QByteArray& buffer)
{
    if (buffer.size() < 4) {
        return std::nullopt;
    }

    quint32 rawLength = 0;
    std::memcpy(&rawLength, buffer.constData(), 4);
    const quint32 payloadLength = qFromBigEndian(rawLength);
    if (payloadLength > static_cast<quint32>(kMaxMessageSize)) {
        LOG_WARN(lcIpc, "Frame length %u exceeds max %d", payloadLength, kMaxMessageSize);
        return std::nullopt;
    }

    const int frameLength = 4 + static_cast<int>(payloadLength);
    if (buffer.size() < frameLength) {
        return std::nullopt;
    }

    QJsonParseError parseError;
    const QJsonDocument doc = QJsonDocument::fromJson(
        buffer.mid(4, static_cast<int>(payloadLength)), &parseError);
    if (parseError.error != QJsonParseError::NoError || !doc.isObject()) {
        LOG_WARN(lcIpc, "Dropping frame that is not a JSON object: %s",
                 qPrintable(parseError.errorString()));
        return std::nullopt;
    }

    DecodeResult result;
    result.json = doc.object();
    result.bytesConsumed = frameLength;
    return result;
}

QJsonObject IpcMessage::makeRequest(uint64_t id, const QString& method, const QJsonObject& params)
{
    QJsonObject json;
    json[QStringLiteral("type")] = QStringLiteral("request");
    json[QStringLiteral("id")] = static_cast<qint64>(id);
    json[QStringLiteral("method")] = method;
    if (!params.isEmpty()) {
        json[QStringLiteral("params")] = params;
    }
    return json;
}

QJsonObject IpcMessage::makeResponse(uint64_t id, const QJsonObject& result)
{
    QJsonObject json;
    json[QStringLiteral("type")] = QStringLiteral("response");
    json[QStringLiteral("id")] = static_cast<qint64>(id);
    json[QStringLiteral("result")] = result;
    return json;
}

QJsonObject IpcMessage::makeError(uint64_t id, IpcErrorCode code, const QString& message)
{
    QJsonObject error;
    error[QStringLiteral("code")] = static_cast<int>(code);
    error[QStringLiteral("codeString")] = ipcErrorCodeToString(code);
    error[QStringLiteral("message")] = message;

    QJsonObject json;
    json[QStringLiteral("type")] = QStringLiteral("error");
    json[QStringLiteral("id")] = static_cast<qint64>(id);
    json[QStringLiteral("error")] = error;
    return json;
}

uint64_t IpcMessage::requestId(const QJsonObject& request)
{
    return static_cast<uint64_t>(request.value(QStringLiteral("id")).toInteger());
}

} // namespace lc
