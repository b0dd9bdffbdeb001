#pragma once

#include <QLoggingCategory>

Q_DECLARE_LOGGING_CATEGORY(kiokuStoreLog)
Q_DECLARE_LOGGING_CATEGORY(kiokuCacheLog)
Q_DECLARE_LOGGING_CATEGORY(kiokuSyncLog)
