#pragma once

#include <QLoggingCategory>

Q_DECLARE_LOGGING_CATEGORY(frCore)
Q_DECLARE_LOGGING_CATEGORY(frText)
Q_DECLARE_LOGGING_CATEGORY(frRanking)
Q_DECLARE_LOGGING_CATEGORY(frRetrieval)

#define LOG_DEBUG(cat, ...) qCDebug(cat, __VA_ARGS__)
#define LOG_INFO(cat, ...)  qCInfo(cat, __VA_ARGS__)
#define LOG_WARN(cat, ...)  qCWarning(cat, __VA_ARGS__)
#define LOG_ERROR(cat, ...) qCCritical(cat, __VA_ARGS__)
