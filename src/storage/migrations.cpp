#include "storage/migrations.hpp"
#include "storage/assignment_repository.hpp"
#include "storage/pending_repository.hpp"
#include "core/log.hpp"

namespace kioku::storage {

Result<int, Error> MigrationRunner::current_version() {
    return db_.user_version();
}

Result<void, Error> MigrationRunner::run_migration(const Migration& m) {
    auto exec_result = db_.execute(m.up_sql);
    if (exec_result.is_err()) {
        return Result<void, Error>::err(Error{
            "Migration " + std::to_string(m.version) + " (" + m.name + ") failed: " +
            exec_result.unwrap_err().message
        });
    }
    return Result<void, Error>::ok();
}

Result<void, Error> MigrationRunner::backfill_subject_progress() {
    SubjectProgressRepository progress_repo(db_);

    auto assignments = AssignmentRepository(db_).get_all();
    if (assignments.is_err()) {
        return Result<void, Error>::err(assignments.unwrap_err());
    }
    for (const auto& assignment : assignments.unwrap()) {
        auto saved = progress_repo.save(subject_progress_of(assignment));
        if (saved.is_err()) {
            return saved;
        }
    }

    // Pending rows are written last so they win over the committed copy.
    auto pending = PendingProgressRepository(db_).get_all();
    if (pending.is_err()) {
        return Result<void, Error>::err(pending.unwrap_err());
    }
    for (const auto& progress : pending.unwrap()) {
        auto saved = progress_repo.save(subject_progress_of(progress.assignment));
        if (saved.is_err()) {
            return saved;
        }
    }

    return Result<void, Error>::ok();
}

Result<void, Error> MigrationRunner::migrate() {
    return migrate_to(latest_version());
}

Result<void, Error> MigrationRunner::migrate_to(int target_version) {
    auto current_result = current_version();
    if (current_result.is_err()) {
        return Result<void, Error>::err(current_result.unwrap_err());
    }

    int current = current_result.unwrap();

    if (current >= target_version) {
        qCDebug(kiokuStoreLog) << "Store up to date at schema version" << current;
        return Result<void, Error>::ok();
    }

    auto result = db_.transaction([&]() -> Result<void, Error> {
        bool backfill = false;
        for (const auto& m : ALL_MIGRATIONS) {
            if (m.version > current && m.version <= target_version) {
                auto step = run_migration(m);
                if (step.is_err()) {
                    return step;
                }
                backfill = backfill || m.backfills_subject_progress;
            }
        }

        if (backfill) {
            auto filled = backfill_subject_progress();
            if (filled.is_err()) {
                return filled;
            }
        }

        return db_.set_user_version(target_version);
    });

    if (result.is_ok()) {
        qCInfo(kiokuStoreLog) << "Store updated to schema version" << target_version;
    }
    return result;
}

} // namespace kioku::storage
