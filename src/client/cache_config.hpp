#pragma once

#include "storage/error_log_repository.hpp"
#include <string>

namespace kioku::client {

/**
 * Settings for opening a LocalCache.
 */
struct CacheConfig {
    std::string database_path;
    int error_log_capacity = storage::kDefaultErrorLogCapacity;
    bool debug_sync = false;
};

} // namespace kioku::client
