#pragma once

#include <QLoggingCategory>

Q_DECLARE_LOGGING_CATEGORY(hrCore)
Q_DECLARE_LOGGING_CATEGORY(hrIngest)
Q_DECLARE_LOGGING_CATEGORY(hrEmbedding)
Q_DECLARE_LOGGING_CATEGORY(hrIndex)
Q_DECLARE_LOGGING_CATEGORY(hrRetrieval)
Q_DECLARE_LOGGING_CATEGORY(hrIpc)

#define LOG_DEBUG(cat, ...) qCDebug(cat, __VA_ARGS__)
#define LOG_INFO(cat, ...)  qCInfo(cat, __VA_ARGS__)
#define LOG_WARN(cat, ...)  qCWarning(cat, __VA_ARGS__)
#define LOG_ERROR(cat, ...) qCCritical(cat, __VA_ARGS__)
