#pragma once

#include <QLoggingCategory>

Q_DECLARE_LOGGING_CATEGORY(lcCore)
Q_DECLARE_LOGGING_CATEGORY(lcStore)
Q_DECLARE_LOGGING_CATEGORY(lcIndex)
Q_DECLARE_LOGGING_CATEGORY(lcVector)
Q_DECLARE_LOGGING_CATEGORY(lcRetrieval)
Q_DECLARE_LOGGING_CATEGORY(lcAgent)
Q_DECLARE_LOGGING_CATEGORY(lcIngest)
Q_DECLARE_LOGGING_CATEGORY(lcIpc)

#define LOG_DEBUG(cat, ...) qCDebug(cat, __VA_ARGS__)
#define LOG_INFO(cat, ...)  qCInfo(cat, __VA_ARGS__)
#define LOG_WARN(cat, ...)  qCWarning(cat, __VA_ARGS__)
#define LOG_ERROR(cat, ...) qCCritical(cat, __VA_ARGS__)
