#pragma once

#include "app/logging.hpp"
#include "client/cache_config.hpp"
#include <QString>

namespace kioku::app {

/**
 * Build the cache settings from the environment.
 *
 *   KIOKU_DB_PATH             store file (default <AppDataLocation>/local-cache.db)
 *   KIOKU_ERROR_LOG_CAPACITY  error log ring size, positive integers only
 *   KIOKU_DEBUG_SYNC          any value enables sync debug logging
 */
[[nodiscard]] client::CacheConfig load_config();

// KIOKU_LOG_FILE overrides the log file; KIOKU_LOG_QUIET stops stderr echo.
[[nodiscard]] LogOptions load_log_options();

// Resolves the store path and creates its directory if needed.
[[nodiscard]] QString resolve_database_path();

} // namespace kioku::app
