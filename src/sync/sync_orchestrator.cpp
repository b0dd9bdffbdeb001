#include "sync/sync_orchestrator.hpp"
#include "storage/account_repository.hpp"
#include "storage/assignment_repository.hpp"
#include "storage/pending_repository.hpp"
#include "storage/study_material_repository.hpp"
#include "storage/sync_state_repository.hpp"
#include "core/log.hpp"

#include <exception>
#include <future>
#include <initializer_list>

namespace kioku::sync {

using storage::Database;
using storage::SyncCursor;

namespace {

SyncResult<std::string> read_cursor(storage::Store& store, SyncCursor cursor) {
    auto value = store.read([&](Database& db) {
        return storage::SyncStateRepository(db).get(cursor);
    });
    if (value.is_err()) {
        return SyncResult<std::string>::err(SyncError::from_storage(value.unwrap_err()));
    }
    return SyncResult<std::string>::ok(std::move(value).unwrap());
}

SyncResult<void> storage_result(const Result<void, Error>& result) {
    if (result.is_err()) {
        return SyncResult<void>::err(SyncError::from_storage(result.unwrap_err()));
    }
    return SyncResult<void>::ok();
}

// Marks the orchestrator idle and completes the sink however the pass ends.
class PassGuard {
public:
    PassGuard(std::atomic<bool>& running, SyncProgress& progress)
        : running_(running), progress_(progress) {}
    ~PassGuard() {
        running_.store(false);
        progress_.complete();
    }

    PassGuard(const PassGuard&) = delete;
    PassGuard& operator=(const PassGuard&) = delete;

private:
    std::atomic<bool>& running_;
    SyncProgress& progress_;
};

} // namespace

void SyncOrchestrator::sync(bool quick, SyncProgress& progress) {
    if (running_.exchange(true)) {
        qCDebug(kiokuSyncLog) << "Sync already running";
        return;
    }
    PassGuard guard(running_, progress);

    bool succeeded = false;
    try {
        succeeded = run_pass(quick, progress);
    } catch (const std::exception& e) {
        reporter_.report(SyncError::of(SyncErrorKind::Other, e.what()));
    }

    if (succeeded) {
        cache_.invalidate_available_subjects();
        cache_.invalidate_srs_categories();
        if (notifier_) {
            notifier_->post(cache::Notification::UserInfoChanged);
        }
    }

    qCInfo(kiokuSyncLog) << (quick ? "Quick" : "Full") << "sync finished"
                         << (succeeded ? "" : "with errors");
}

bool SyncOrchestrator::run_pass(bool quick, SyncProgress& progress) {
    progress.reset();
    progress.set_total(SyncWeights::kTotal);
    auto& flush_progress_node = progress.make_child(SyncWeights::kFlushProgress);
    auto& flush_materials_node = progress.make_child(SyncWeights::kFlushStudyMaterials);
    auto& assignments_node = progress.make_child(SyncWeights::kAssignments);
    auto& materials_node = progress.make_child(SyncWeights::kStudyMaterials);
    auto& user_node = progress.make_child(SyncWeights::kUser);
    auto& levels_node = progress.make_child(SyncWeights::kLevelProgressions);

    if (!quick) {
        auto reset = store_.write([](Database& db) {
            return storage::SyncStateRepository(db).set(SyncCursor::Assignments, "");
        });
        if (reset.is_err()) {
            reporter_.report(SyncError::from_storage(reset.unwrap_err()));
            return false;
        }
    }

    auto flush_progress = std::async(std::launch::async, [&]() {
        return queue_.flush_progress(flush_progress_node);
    });
    auto flush_materials = std::async(std::launch::async, [&]() {
        return queue_.flush_study_materials(flush_materials_node);
    });
    auto progress_result = flush_progress.get();
    auto materials_result = flush_materials.get();
    bool flushed = report_first_error({&progress_result, &materials_result});

    // Fetching goes ahead even when a flush failed; each fetch stands alone.
    auto assignments = std::async(std::launch::async, [&]() {
        return fetch_assignments(assignments_node);
    });
    auto materials = std::async(std::launch::async, [&]() {
        return fetch_study_materials(materials_node);
    });
    auto user = std::async(std::launch::async, [&]() {
        return fetch_user(user_node);
    });
    auto levels = std::async(std::launch::async, [&]() {
        return fetch_level_progressions(levels_node);
    });
    auto assignments_result = assignments.get();
    auto fetched_materials_result = materials.get();
    auto user_result = user.get();
    auto levels_result = levels.get();
    bool fetched = report_first_error(
        {&assignments_result, &fetched_materials_result, &user_result, &levels_result});

    return flushed && fetched;
}

bool SyncOrchestrator::report_first_error(
    std::initializer_list<const SyncResult<void>*> results) {
    for (const auto* result : results) {
        if (result->is_err()) {
            reporter_.report(result->unwrap_err());
            return false;
        }
    }
    return true;
}

SyncResult<void> SyncOrchestrator::fetch_assignments(SyncProgress& progress) {
    auto cursor = read_cursor(store_, SyncCursor::Assignments);
    if (cursor.is_err()) {
        return SyncResult<void>::err(cursor.unwrap_err());
    }

    auto page = gateway_.fetch_assignments(cursor.unwrap(), progress);
    if (page.is_err()) {
        return SyncResult<void>::err(page.unwrap_err());
    }
    const auto& fetched = page.unwrap();

    auto written = store_.write([&](Database& db) -> Result<void, Error> {
        storage::AssignmentRepository assignments(db);
        storage::SubjectProgressRepository subject_progress(db);
        storage::PendingProgressRepository pending(db);

        for (const auto& assignment : fetched.items) {
            // Unacknowledged local progress stays authoritative for its subject.
            auto queued = pending.get(assignment.subject_id);
            if (queued.is_err()) {
                return Result<void, Error>::err(queued.unwrap_err());
            }
            if (queued.unwrap()) {
                continue;
            }

            auto step = assignments.save(assignment);
            if (step.is_err()) return step;
            step = subject_progress.save(subject_progress_of(assignment));
            if (step.is_err()) return step;
        }
        return storage::SyncStateRepository(db).set(SyncCursor::Assignments, fetched.cursor);
    });
    if (written.is_err()) {
        return storage_result(written);
    }
    cache_.invalidate_available_subjects();
    cache_.invalidate_srs_categories();
    cache_.invalidate_guru_kanji();

    qCInfo(kiokuSyncLog) << "Updated" << fetched.items.size() << "assignments at"
                         << fetched.cursor.c_str();
    return SyncResult<void>::ok();
}

SyncResult<void> SyncOrchestrator::fetch_study_materials(SyncProgress& progress) {
    auto cursor = read_cursor(store_, SyncCursor::StudyMaterials);
    if (cursor.is_err()) {
        return SyncResult<void>::err(cursor.unwrap_err());
    }

    auto page = gateway_.fetch_study_materials(cursor.unwrap(), progress);
    if (page.is_err()) {
        return SyncResult<void>::err(page.unwrap_err());
    }
    const auto& fetched = page.unwrap();

    auto written = store_.write([&](Database& db) -> Result<void, Error> {
        storage::StudyMaterialRepository materials(db);
        storage::PendingStudyMaterialRepository pending(db);

        for (const auto& item : fetched.items) {
            auto marked = pending.is_marked(item.subject_id);
            if (marked.is_err()) {
                return Result<void, Error>::err(marked.unwrap_err());
            }
            if (marked.unwrap()) {
                continue;
            }
            auto step = materials.save(item);
            if (step.is_err()) return step;
        }
        return storage::SyncStateRepository(db).set(SyncCursor::StudyMaterials, fetched.cursor);
    });
    if (written.is_err()) {
        return storage_result(written);
    }

    qCInfo(kiokuSyncLog) << "Updated" << fetched.items.size() << "study materials at"
                         << fetched.cursor.c_str();
    return SyncResult<void>::ok();
}

SyncResult<void> SyncOrchestrator::fetch_user(SyncProgress& progress) {
    auto user = gateway_.fetch_user(progress);
    if (user.is_err()) {
        return SyncResult<void>::err(user.unwrap_err());
    }

    auto written = store_.write([&](Database& db) {
        return storage::AccountRepository(db).save_user(user.unwrap());
    });
    if (written.is_ok()) {
        cache_.invalidate_available_subjects();
        qCInfo(kiokuSyncLog) << "Updated user" << user.unwrap().username.c_str();
    }
    return storage_result(written);
}

SyncResult<void> SyncOrchestrator::fetch_level_progressions(SyncProgress& progress) {
    auto levels = gateway_.fetch_level_progressions(progress);
    if (levels.is_err()) {
        return SyncResult<void>::err(levels.unwrap_err());
    }

    auto written = store_.write([&](Database& db) -> Result<void, Error> {
        storage::AccountRepository account(db);
        for (const auto& level : levels.unwrap()) {
            auto step = account.save_level(level);
            if (step.is_err()) return step;
        }
        return Result<void, Error>::ok();
    });
    if (written.is_ok()) {
        qCInfo(kiokuSyncLog) << "Updated" << levels.unwrap().size() << "level progressions";
    }
    return storage_result(written);
}

} // namespace kioku::sync
