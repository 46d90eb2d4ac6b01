#include "core/ipc/service_base.h"
#include "core/shared/logging.h"

#include <QCoreApplication>
#include <QDateTime>
#include <QDir>
#include <QFileInfo>

#include <sys/types.h>
#include <unistd.h>

#include <cstdio>

namespace lc {

namespace {

QString normalizedEnvPath(const char* envName)
{
    const QString value = qEnvironmentVariable(envName).trimmed();
    if (value.isEmpty()) {
        return {};
    }
    return QDir::cleanPath(value);
}

} // namespace

ServiceBase::ServiceBase(const QString& serviceName, QObject* parent)
    : QObject(parent)
    , m_serviceName(serviceName)
    , m_server(std::make_unique<SocketServer>())
{
    m_server->setRequestHandler([this](const QJsonObject& request) {
        return handleRequest(request);
    });
}

ServiceBase::~ServiceBase() = default;

bool ServiceBase::start(const QString& path)
{
    const QDir dir = QFileInfo(path).dir();
    if (!dir.exists() && !QDir().mkpath(dir.path())) {
        LOG_ERROR(lcIpc, "Failed to create socket directory: %s", qPrintable(dir.path()));
        return false;
    }

    if (!m_server->listen(path)) {
        LOG_ERROR(lcIpc, "Service '%s' failed to start", qPrintable(m_serviceName));
        return false;
    }
    LOG_INFO(lcIpc, "Service '%s' started on %s", qPrintable(m_serviceName), qPrintable(path));
    return true;
}

void ServiceBase::stop()
{
    m_server->close();
}

int ServiceBase::run()
{
    if (!start(socketPath(m_serviceName))) {
        return 1;
    }

    // Readiness line for whatever launched us.
    std::fprintf(stdout, "ready\n");
    std::fflush(stdout);

    const int code = QCoreApplication::exec();
    stop();
    return code;
}

QString ServiceBase::socketPath(const QString& serviceName)
{
    return QDir::cleanPath(socketDirectory() + QLatin1Char('/')
                           + serviceName + QStringLiteral(".sock"));
}

QString ServiceBase::runtimeDirectory()
{
    const QString runtimeDir = normalizedEnvPath("LEXCITE_RUNTIME_DIR");
    if (!runtimeDir.isEmpty()) {
        return runtimeDir;
    }
    return QStringLiteral("/tmp/lexcite-%1").arg(getuid());
}

QString ServiceBase::socketDirectory()
{
    const QString socketDir = normalizedEnvPath("LEXCITE_SOCKET_DIR");
    if (!socketDir.isEmpty()) {
        return socketDir;
    }
    return runtimeDirectory();
}

QJsonObject ServiceBase::handleRequest(const QJsonObject& request)
{
    const QString method = request.value(QStringLiteral("method")).toString();

    if (method == QLatin1String("ping")) {
        return handlePing(request);
    }
    if (method == QLatin1String("shutdown")) {
        return handleShutdown(request);
    }

    LOG_WARN(lcIpc, "Unknown method '%s' in service '%s'",
             qPrintable(method), qPrintable(m_serviceName));
    return IpcMessage::makeError(IpcMessage::requestId(request), IpcErrorCode::NotFound,
                                 QStringLiteral("Unknown method: %1").arg(method));
}

QJsonObject ServiceBase::handlePing(const QJsonObject& request)
{
    QJsonObject result;
    result[QStringLiteral("pong")] = true;
    result[QStringLiteral("timestamp")] = QDateTime::currentMSecsSinceEpoch();
    result[QStringLiteral("service")] = m_serviceName;
    return IpcMessage::makeResponse(IpcMessage::requestId(request), result);
}

QJsonObject ServiceBase::handleShutdown(const QJsonObject& request)
{
    LOG_INFO(lcIpc, "Shutdown requested for service '%s'", qPrintable(m_serviceName));

    QJsonObject result;
    result[QStringLiteral("shutting_down")] = true;

    // Quit after the response has been written.
    if (QCoreApplication::instance()) {
        QMetaObject::invokeMethod(QCoreApplication::instance(), &QCoreApplication::quit,
                                  Qt::QueuedConnection);
    }
    return IpcMessage::makeResponse(IpcMessage::requestId(request), result);
}

} // namespace lc
