#pragma once

#include "storage/database.hpp"
#include "core/result.hpp"
#include <string>

namespace kioku::storage {

/**
 * Incremental fetch watermark kinds held in the singleton sync row.
 */
enum class SyncCursor {
    Assignments,
    StudyMaterials
};

/**
 * SyncStateRepository - the "updated after" cursors. An empty cursor means
 * "fetch everything".
 */
class SyncStateRepository {
public:
    explicit SyncStateRepository(Database& db) : db_(db) {}

    [[nodiscard]] Result<std::string, Error> get(SyncCursor cursor);

    [[nodiscard]] Result<void, Error> set(SyncCursor cursor, const std::string& value);

    [[nodiscard]] Result<void, Error> reset_all();

private:
    Database& db_;
};

} // namespace kioku::storage
