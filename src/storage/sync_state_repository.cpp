#include "storage/sync_state_repository.hpp"

namespace kioku::storage {

namespace {

const char* select_sql(SyncCursor cursor) {
    switch (cursor) {
        case SyncCursor::Assignments:
            return "SELECT assignments_updated_after FROM sync LIMIT 1;";
        case SyncCursor::StudyMaterials:
            return "SELECT study_materials_updated_after FROM sync LIMIT 1;";
    }
    return "";
}

const char* update_sql(SyncCursor cursor) {
    switch (cursor) {
        case SyncCursor::Assignments:
            return "UPDATE sync SET assignments_updated_after = ?;";
        case SyncCursor::StudyMaterials:
            return "UPDATE sync SET study_materials_updated_after = ?;";
    }
    return "";
}

} // namespace

Result<std::string, Error> SyncStateRepository::get(SyncCursor cursor) {
    std::string value;

    auto result = db_.query(select_sql(cursor), [](Statement&) {},
        [&](Statement& stmt) -> Result<void, Error> {
            value = stmt.column_text(0);
            return Result<void, Error>::ok();
        });

    if (result.is_err()) {
        return Result<std::string, Error>::err(result.unwrap_err());
    }
    return Result<std::string, Error>::ok(std::move(value));
}

Result<void, Error> SyncStateRepository::set(SyncCursor cursor, const std::string& value) {
    return db_.update(update_sql(cursor),
        [&](Statement& stmt) { stmt.bind_text(1, value); });
}

Result<void, Error> SyncStateRepository::reset_all() {
    return db_.execute(R"SQL(
        UPDATE sync SET
            assignments_updated_after = '',
            study_materials_updated_after = '';
    )SQL");
}

} // namespace kioku::storage
