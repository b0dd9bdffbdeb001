#include "client/local_cache.hpp"
#include "storage/account_repository.hpp"
#include "storage/assignment_repository.hpp"
#include "storage/pending_repository.hpp"
#include "storage/study_material_repository.hpp"
#include "core/log.hpp"

#include <set>

namespace kioku::client {

using storage::Database;

namespace {

void add_locked_placeholders(std::vector<Assignment>& out,
                             const std::vector<SubjectId>& subject_ids,
                             SubjectType type,
                             int level,
                             const std::set<SubjectId>& present) {
    for (SubjectId id : subject_ids) {
        if (present.count(id)) continue;
        out.push_back(locked_assignment(id, type, level));
    }
}

} // namespace

Result<std::unique_ptr<LocalCache>, Error> LocalCache::open(
    const CacheConfig& config,
    sync::RemoteGateway& gateway,
    const SubjectCatalogue& catalogue,
    cache::ChangeNotifier* notifier,
    cache::AggregateCache::Clock clock) {
    auto store = storage::Store::open(config.database_path);
    if (store.is_err()) {
        return Result<std::unique_ptr<LocalCache>, Error>::err(store.unwrap_err());
    }
    auto opened = std::move(store).unwrap();

    auto purged = opened->purge_subjects(catalogue.deleted_subject_ids());
    if (purged.is_err()) {
        return Result<std::unique_ptr<LocalCache>, Error>::err(purged.unwrap_err());
    }

    qCInfo(kiokuCacheLog) << "Opened local cache at" << config.database_path.c_str();
    return Result<std::unique_ptr<LocalCache>, Error>::ok(std::unique_ptr<LocalCache>(
        new LocalCache(std::move(opened), config, gateway, catalogue, notifier,
                       std::move(clock))));
}

LocalCache::LocalCache(std::unique_ptr<storage::Store> store,
                       const CacheConfig& config,
                       sync::RemoteGateway& gateway,
                       const SubjectCatalogue& catalogue,
                       cache::ChangeNotifier* notifier,
                       cache::AggregateCache::Clock clock)
    : store_(std::move(store))
    , catalogue_(catalogue)
    , notifier_(notifier)
    , aggregates_(*store_, catalogue, notifier, std::move(clock))
    , queue_(*store_, gateway, aggregates_)
    , reporter_(*store_, notifier, config.error_log_capacity)
    , orchestrator_(*store_, gateway, queue_, aggregates_, reporter_, notifier) {
}

// ============================================================================
// Records
// ============================================================================

Result<std::vector<Assignment>, Error> LocalCache::all_assignments() {
    return store_->read([](Database& db) {
        return storage::AssignmentRepository(db).get_all();
    });
}

Result<std::vector<Assignment>, Error> LocalCache::assignments_at_level(int level) {
    auto rows = store_->read([&](Database& db) {
        return storage::SubjectProgressRepository(db).get_at_level(level);
    });
    if (rows.is_err()) {
        return Result<std::vector<Assignment>, Error>::err(rows.unwrap_err());
    }

    std::vector<Assignment> result;
    std::set<SubjectId> present;
    for (const auto& row : rows.unwrap()) {
        const auto& progress = row.progress;
        Assignment assignment = row.assignment
            ? *row.assignment
            : locked_assignment(progress.subject_id, progress.subject_type, progress.level);
        assignment.srs_stage = progress.srs_stage;
        present.insert(assignment.subject_id);
        result.push_back(std::move(assignment));
    }

    const LevelSubjects subjects = catalogue_.subjects_at_level(level);
    add_locked_placeholders(result, subjects.radicals, SubjectType::Radical, level, present);
    add_locked_placeholders(result, subjects.kanji, SubjectType::Kanji, level, present);
    add_locked_placeholders(result, subjects.vocabulary, SubjectType::Vocabulary, level, present);

    return Result<std::vector<Assignment>, Error>::ok(std::move(result));
}

Result<std::vector<Assignment>, Error> LocalCache::assignments_at_current_level() {
    auto current = user();
    if (current.is_err()) {
        return Result<std::vector<Assignment>, Error>::err(current.unwrap_err());
    }
    const auto& stored = current.unwrap();
    if (!stored || !stored->level) {
        return Result<std::vector<Assignment>, Error>::ok({});
    }
    return assignments_at_level(*stored->level);
}

Result<std::optional<Assignment>, Error> LocalCache::assignment(SubjectId subject_id) {
    return store_->read([&](Database& db) -> Result<std::optional<Assignment>, Error> {
        auto pending = storage::PendingProgressRepository(db).get(subject_id);
        if (pending.is_err()) {
            return Result<std::optional<Assignment>, Error>::err(pending.unwrap_err());
        }
        if (pending.unwrap()) {
            return Result<std::optional<Assignment>, Error>::ok(pending.unwrap()->assignment);
        }
        return storage::AssignmentRepository(db).get_by_subject(subject_id);
    });
}

Result<std::optional<StudyMaterials>, Error> LocalCache::study_material(SubjectId subject_id) {
    return store_->read([&](Database& db) {
        return storage::StudyMaterialRepository(db).get(subject_id);
    });
}

Result<std::vector<Level>, Error> LocalCache::level_progressions() {
    return store_->read([](Database& db) {
        return storage::AccountRepository(db).get_levels();
    });
}

Result<std::optional<User>, Error> LocalCache::user() {
    return store_->read([](Database& db) {
        return storage::AccountRepository(db).get_user();
    });
}

Result<std::vector<Progress>, Error> LocalCache::pending_progress() {
    return store_->read([](Database& db) {
        return storage::PendingProgressRepository(db).get_all();
    });
}

Result<std::vector<storage::ErrorLogEntry>, Error> LocalCache::error_log() {
    return store_->read([](Database& db) {
        return storage::ErrorLogRepository(db).get_all();
    });
}

// ============================================================================
// Aggregates
// ============================================================================

Result<int64_t, Error> LocalCache::pending_progress_count() {
    return aggregates_.pending_progress_count();
}

Result<int64_t, Error> LocalCache::pending_study_materials_count() {
    return aggregates_.pending_study_materials_count();
}

Result<cache::AvailableSubjects, Error> LocalCache::available_subjects() {
    return aggregates_.available_subjects();
}

Result<int, Error> LocalCache::available_lesson_count() {
    return aggregates_.available_subjects().map(
        [](const cache::AvailableSubjects& a) { return a.lesson_count; });
}

Result<int, Error> LocalCache::available_review_count() {
    return aggregates_.available_subjects().map(
        [](const cache::AvailableSubjects& a) { return a.review_count; });
}

Result<std::array<int, cache::kUpcomingReviewHours>, Error> LocalCache::upcoming_reviews() {
    return aggregates_.available_subjects().map(
        [](const cache::AvailableSubjects& a) { return a.upcoming_reviews; });
}

Result<int64_t, Error> LocalCache::guru_kanji_count() {
    return aggregates_.guru_kanji_count();
}

Result<SrsCategoryCounts, Error> LocalCache::srs_category_counts() {
    return aggregates_.srs_category_counts();
}

// ============================================================================
// Mutations
// ============================================================================

Result<void, Error> LocalCache::record_progress(const std::vector<Progress>& items) {
    auto recorded = queue_.record_progress(items);
    if (recorded.is_err()) {
        qCWarning(kiokuCacheLog) << "Failed to record progress:"
                                 << recorded.unwrap_err().message.c_str();
        return recorded;
    }

    sync::SyncProgress sink;
    auto sent = queue_.send_progress(items, sink);
    if (sent.is_err()) {
        reporter_.report(sent.unwrap_err());
    }
    return Result<void, Error>::ok();
}

Result<void, Error> LocalCache::update_study_material(const StudyMaterials& materials) {
    auto recorded = queue_.record_study_material(materials);
    if (recorded.is_err()) {
        qCWarning(kiokuCacheLog) << "Failed to save study material:"
                                 << recorded.unwrap_err().message.c_str();
        return recorded;
    }

    sync::SyncProgress sink;
    auto sent = queue_.send_study_materials({materials}, sink);
    if (sent.is_err()) {
        reporter_.report(sent.unwrap_err());
    }
    return Result<void, Error>::ok();
}

// ============================================================================
// Sync
// ============================================================================

void LocalCache::sync(bool quick, sync::SyncProgress& progress) {
    orchestrator_.sync(quick, progress);
}

void LocalCache::sync(bool quick) {
    sync::SyncProgress progress;
    orchestrator_.sync(quick, progress);
}

std::future<void> LocalCache::sync_async(bool quick,
                                         std::shared_ptr<sync::SyncProgress> progress) {
    if (!progress) {
        progress = std::make_shared<sync::SyncProgress>();
    }
    return std::async(std::launch::async, [this, quick, progress]() {
        orchestrator_.sync(quick, *progress);
    });
}

Result<void, Error> LocalCache::clear_all_data() {
    auto cleared = store_->clear_all();
    if (cleared.is_err()) {
        return cleared;
    }
    aggregates_.invalidate_all();
    if (notifier_) {
        notifier_->post(cache::Notification::UserInfoChanged);
    }
    return cleared;
}

} // namespace kioku::client
