#include "storage/store.hpp"
#include "storage/assignment_repository.hpp"
#include "storage/migrations.hpp"
#include "storage/sync_state_repository.hpp"
#include "core/log.hpp"

namespace kioku::storage {

Result<std::unique_ptr<Store>, Error> Store::open(const std::string& path) {
    auto db = Database::open(path);
    if (db.is_err()) {
        return Result<std::unique_ptr<Store>, Error>::err(db.unwrap_err());
    }
    return prepare(std::move(db).unwrap());
}

Result<std::unique_ptr<Store>, Error> Store::open_memory() {
    auto db = Database::open_memory();
    if (db.is_err()) {
        return Result<std::unique_ptr<Store>, Error>::err(db.unwrap_err());
    }
    return prepare(std::move(db).unwrap());
}

Result<std::unique_ptr<Store>, Error> Store::prepare(Database db) {
    auto migrated = initialize_database(db);
    if (migrated.is_err()) {
        qCCritical(kiokuStoreLog) << "Store migration failed:"
                                  << migrated.unwrap_err().message.c_str();
        return Result<std::unique_ptr<Store>, Error>::err(migrated.unwrap_err());
    }
    return Result<std::unique_ptr<Store>, Error>::ok(
        std::unique_ptr<Store>(new Store(std::move(db))));
}

Result<void, Error> Store::purge_subjects(const std::vector<SubjectId>& subject_ids) {
    if (subject_ids.empty()) {
        return Result<void, Error>::ok();
    }

    return write([&](Database& db) -> Result<void, Error> {
        AssignmentRepository assignments(db);
        SubjectProgressRepository progress(db);
        for (SubjectId id : subject_ids) {
            auto removed = assignments.remove_by_subject(id);
            if (removed.is_err()) {
                return removed;
            }
            removed = progress.remove(id);
            if (removed.is_err()) {
                return removed;
            }
        }
        return Result<void, Error>::ok();
    });
}

Result<void, Error> Store::clear_all() {
    auto result = write([](Database& db) -> Result<void, Error> {
        auto reset = SyncStateRepository(db).reset_all();
        if (reset.is_err()) {
            return reset;
        }
        return db.execute(R"SQL(
            DELETE FROM assignments;
            DELETE FROM pending_progress;
            DELETE FROM study_materials;
            DELETE FROM user;
            DELETE FROM pending_study_materials;
            DELETE FROM subject_progress;
            DELETE FROM error_log;
            DELETE FROM level_progressions;
        )SQL");
    });

    if (result.is_ok()) {
        qCInfo(kiokuStoreLog) << "Local cache cleared";
    }
    return result;
}

} // namespace kioku::storage
