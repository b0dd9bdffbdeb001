#include "sync/pending_queue.hpp"
#include "storage/assignment_repository.hpp"
#include "storage/pending_repository.hpp"
#include "storage/study_material_repository.hpp"
#include "core/log.hpp"

namespace kioku::sync {

using storage::Database;

Result<void, Error> PendingQueue::record_progress(const std::vector<Progress>& items) {
    if (items.empty()) {
        return Result<void, Error>::ok();
    }

    auto result = store_.write([&](Database& db) -> Result<void, Error> {
        storage::AssignmentRepository assignments(db);
        storage::PendingProgressRepository pending(db);
        storage::SubjectProgressRepository subject_progress(db);

        for (const auto& item : items) {
            const SubjectId subject = item.assignment.subject_id;

            auto step = assignments.remove_by_subject(subject);
            if (step.is_err()) return step;

            step = pending.save(item);
            if (step.is_err()) return step;

            SubjectProgress derived = subject_progress_of(item.assignment);
            derived.srs_stage = next_srs_stage(item);
            step = subject_progress.save(derived);
            if (step.is_err()) return step;
        }
        return Result<void, Error>::ok();
    });

    if (result.is_ok()) {
        cache_.invalidate_progress_views();
    }
    return result;
}

Result<void, Error> PendingQueue::record_study_material(const StudyMaterials& materials) {
    auto result = store_.write([&](Database& db) -> Result<void, Error> {
        auto saved = storage::StudyMaterialRepository(db).save(materials);
        if (saved.is_err()) {
            return saved;
        }
        return storage::PendingStudyMaterialRepository(db).mark(materials.subject_id);
    });

    if (result.is_ok()) {
        cache_.invalidate_pending_study_materials();
    }
    return result;
}

SyncResult<void> PendingQueue::flush_progress(SyncProgress& progress) {
    auto items = store_.read([](Database& db) {
        return storage::PendingProgressRepository(db).get_all();
    });
    if (items.is_err()) {
        return SyncResult<void>::err(SyncError::from_storage(items.unwrap_err()));
    }
    return send_progress(items.unwrap(), progress);
}

SyncResult<void> PendingQueue::flush_study_materials(SyncProgress& progress) {
    auto materials = store_.read([](Database& db) {
        return storage::PendingStudyMaterialRepository(db).get_all();
    });
    if (materials.is_err()) {
        return SyncResult<void>::err(SyncError::from_storage(materials.unwrap_err()));
    }
    return send_study_materials(materials.unwrap(), progress);
}

SyncResult<void> PendingQueue::send_progress(const std::vector<Progress>& items,
                                             SyncProgress& progress) {
    if (items.empty()) {
        progress.set_total(1);
        progress.add_completed(1);
        return SyncResult<void>::ok();
    }

    progress.set_total(static_cast<int64_t>(items.size()));

    for (const auto& item : items) {
        auto pushed = gateway_.push_progress(item, progress);
        progress.add_completed(1);

        if (pushed.is_err()) {
            const auto& error = pushed.unwrap_err();
            if (error.kind != SyncErrorKind::Unprocessable) {
                return pushed;
            }
            // The remote service will never accept this report, typically
            // because the same review already arrived from another client.
            qCInfo(kiokuSyncLog) << "Dropping unprocessable progress for subject"
                                 << item.assignment.subject_id;
        }

        auto cleared = clear_progress(item);
        if (cleared.is_err()) {
            return cleared;
        }
    }
    return SyncResult<void>::ok();
}

SyncResult<void> PendingQueue::send_study_materials(const std::vector<StudyMaterials>& materials,
                                                    SyncProgress& progress) {
    if (materials.empty()) {
        progress.set_total(1);
        progress.add_completed(1);
        return SyncResult<void>::ok();
    }

    progress.set_total(static_cast<int64_t>(materials.size()));

    for (const auto& item : materials) {
        auto pushed = gateway_.push_study_material(item, progress);
        progress.add_completed(1);
        if (pushed.is_err()) {
            return pushed;
        }

        auto cleared = clear_study_material(item);
        if (cleared.is_err()) {
            return cleared;
        }
    }
    return SyncResult<void>::ok();
}

SyncResult<void> PendingQueue::clear_progress(const Progress& item) {
    // A newer report recorded while this one was in flight stays queued.
    auto removed = store_.write([&](Database& db) -> Result<void, Error> {
        storage::PendingProgressRepository pending(db);
        auto queued = pending.get(item.assignment.subject_id);
        if (queued.is_err()) {
            return Result<void, Error>::err(queued.unwrap_err());
        }
        if (!queued.unwrap() || *queued.unwrap() != item) {
            return Result<void, Error>::ok();
        }
        return pending.remove(item.assignment.subject_id);
    });
    if (removed.is_err()) {
        return SyncResult<void>::err(SyncError::from_storage(removed.unwrap_err()));
    }
    cache_.invalidate_pending_progress();
    return SyncResult<void>::ok();
}

SyncResult<void> PendingQueue::clear_study_material(const StudyMaterials& materials) {
    // Keep the marker when the stored materials were edited after this push began.
    auto removed = store_.write([&](Database& db) -> Result<void, Error> {
        auto stored = storage::StudyMaterialRepository(db).get(materials.subject_id);
        if (stored.is_err()) {
            return Result<void, Error>::err(stored.unwrap_err());
        }
        if (stored.unwrap() && *stored.unwrap() != materials) {
            return Result<void, Error>::ok();
        }
        return storage::PendingStudyMaterialRepository(db).unmark(materials.subject_id);
    });
    if (removed.is_err()) {
        return SyncResult<void>::err(SyncError::from_storage(removed.unwrap_err()));
    }
    cache_.invalidate_pending_study_materials();
    return SyncResult<void>::ok();
}

} // namespace kioku::sync
