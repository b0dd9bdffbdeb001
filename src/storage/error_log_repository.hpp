#pragma once

#include "storage/database.hpp"
#include "core/result.hpp"
#include <optional>
#include <string>
#include <vector>

namespace kioku::storage {

inline constexpr int kDefaultErrorLogCapacity = 100;

/**
 * ErrorLogEntry - diagnostics for one failed remote request.
 *
 * Only description is always present; request/response context exists for
 * failures that came back from the remote service.
 */
struct ErrorLogEntry {
    std::string date;  // SQLite CURRENT_TIMESTAMP, set on insert
    std::optional<int> code;
    std::string description;
    std::string request_url;
    std::string response_url;
    std::string request_data;
    std::string request_headers;
    std::string response_headers;
    std::string response_data;
};

/**
 * ErrorLogRepository - capped ring of the most recent failures.
 */
class ErrorLogRepository {
public:
    explicit ErrorLogRepository(Database& db) : db_(db) {}

    /**
     * Insert an entry, first pruning so at most `capacity` rows remain.
     * Call inside a transaction so both happen atomically.
     */
    [[nodiscard]] Result<void, Error> append(const ErrorLogEntry& entry,
                                             int capacity = kDefaultErrorLogCapacity);

    /**
     * All entries, newest first.
     */
    [[nodiscard]] Result<std::vector<ErrorLogEntry>, Error> get_all();

    [[nodiscard]] Result<int64_t, Error> count();

private:
    Database& db_;
};

} // namespace kioku::storage
