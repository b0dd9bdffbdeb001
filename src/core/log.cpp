#include "core/log.hpp"

Q_LOGGING_CATEGORY(kiokuStoreLog, "kioku.store")
Q_LOGGING_CATEGORY(kiokuCacheLog, "kioku.cache")
Q_LOGGING_CATEGORY(kiokuSyncLog, "kioku.sync", QtInfoMsg)
