#pragma once

#include "core/shared/ipc_messages.h"

#include <QByteArray>
#include <QJsonObject>

#include <cstdint>
#include <optional>

namespace lc {

// Wire frame: 4-byte big-endian payload length followed by compact UTF-8 JSON.
class IpcMessage {
public:
    static QByteArray encode(const QJsonObject& json);

    struct DecodeResult {
        QJsonObject json;
        int bytesConsumed = 0;
    };
    // nullopt while the buffer holds less than one complete frame.
    static std::optional<DecodeResult> decode(const QByteArray& buffer);

    static QJsonObject makeRequest(uint64_t id, const QString& method, const QJsonObject& params = {});
    static QJsonObject makeResponse(uint64_t id, const QJsonObject& result);
    static QJsonObject makeError(uint64_t id, IpcErrorCode code, const QString& message);

    static uint64_t requestId(const QJsonObject& request);

    static constexpr int kMaxMessageSize = 16 * 1024 * 1024;
};

} // namespace lc
