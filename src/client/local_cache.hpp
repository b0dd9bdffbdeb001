#pragma once

#include "client/cache_config.hpp"
#include "cache/aggregate_cache.hpp"
#include "cache/notifier.hpp"
#include "core/catalogue.hpp"
#include "core/records.hpp"
#include "storage/error_log_repository.hpp"
#include "storage/store.hpp"
#include "sync/error_reporter.hpp"
#include "sync/pending_queue.hpp"
#include "sync/progress.hpp"
#include "sync/remote_gateway.hpp"
#include "sync/sync_orchestrator.hpp"
#include <future>
#include <memory>
#include <optional>
#include <vector>

namespace kioku::client {

/**
 * LocalCache - offline-first replica of the user's study data.
 *
 * Reads are served from the local store. Local changes are committed first
 * and then pushed straight away; anything that cannot be pushed stays queued
 * until the next sync. The gateway, catalogue and notifier must outlive the
 * cache, and so must any future returned by sync_async().
 */
class LocalCache {
public:
    [[nodiscard]] static Result<std::unique_ptr<LocalCache>, Error> open(
        const CacheConfig& config,
        sync::RemoteGateway& gateway,
        const SubjectCatalogue& catalogue,
        cache::ChangeNotifier* notifier,
        cache::AggregateCache::Clock clock = &Timestamp::now);

    LocalCache(const LocalCache&) = delete;
    LocalCache& operator=(const LocalCache&) = delete;

    // Records
    [[nodiscard]] Result<std::vector<Assignment>, Error> all_assignments();

    /**
     * One entry per curriculum subject at the level. Subjects the user has
     * not unlocked yet appear as locked placeholders; the stage always
     * reflects locally recorded progress.
     */
    [[nodiscard]] Result<std::vector<Assignment>, Error> assignments_at_level(int level);

    /**
     * assignments_at_level() for the stored user's level; empty without a user.
     */
    [[nodiscard]] Result<std::vector<Assignment>, Error> assignments_at_current_level();

    /**
     * The assignment for a subject. Queued progress wins over the committed row.
     */
    [[nodiscard]] Result<std::optional<Assignment>, Error> assignment(SubjectId subject_id);

    [[nodiscard]] Result<std::optional<StudyMaterials>, Error> study_material(SubjectId subject_id);
    [[nodiscard]] Result<std::vector<Level>, Error> level_progressions();
    [[nodiscard]] Result<std::optional<User>, Error> user();
    [[nodiscard]] Result<std::vector<Progress>, Error> pending_progress();

    /**
     * Logged sync failures, newest first.
     */
    [[nodiscard]] Result<std::vector<storage::ErrorLogEntry>, Error> error_log();

    // Aggregates
    [[nodiscard]] Result<int64_t, Error> pending_progress_count();
    [[nodiscard]] Result<int64_t, Error> pending_study_materials_count();
    [[nodiscard]] Result<cache::AvailableSubjects, Error> available_subjects();
    [[nodiscard]] Result<int, Error> available_lesson_count();
    [[nodiscard]] Result<int, Error> available_review_count();
    [[nodiscard]] Result<std::array<int, cache::kUpcomingReviewHours>, Error> upcoming_reviews();
    [[nodiscard]] Result<int64_t, Error> guru_kanji_count();
    [[nodiscard]] Result<SrsCategoryCounts, Error> srs_category_counts();

    // Mutations

    /**
     * Queue completed lessons or reviews and try to push them once. Only a
     * local store failure is returned; push failures are reported and the
     * items stay queued.
     */
    [[nodiscard]] Result<void, Error> record_progress(const std::vector<Progress>& items);

    [[nodiscard]] Result<void, Error> update_study_material(const StudyMaterials& materials);

    // Sync
    void sync(bool quick, sync::SyncProgress& progress);
    void sync(bool quick);

    /**
     * Run sync() on a worker thread. The future becomes ready when the pass
     * ends, or at once if a pass is already running.
     */
    [[nodiscard]] std::future<void> sync_async(
        bool quick, std::shared_ptr<sync::SyncProgress> progress = nullptr);

    [[nodiscard]] bool is_syncing() const { return orchestrator_.is_running(); }

    /**
     * Empty every local table, the error log included. Remote data is untouched.
     */
    [[nodiscard]] Result<void, Error> clear_all_data();

private:
    LocalCache(std::unique_ptr<storage::Store> store,
               const CacheConfig& config,
               sync::RemoteGateway& gateway,
               const SubjectCatalogue& catalogue,
               cache::ChangeNotifier* notifier,
               cache::AggregateCache::Clock clock);

    std::unique_ptr<storage::Store> store_;
    const SubjectCatalogue& catalogue_;
    cache::ChangeNotifier* notifier_;
    cache::AggregateCache aggregates_;
    sync::PendingQueue queue_;
    sync::ErrorReporter reporter_;
    sync::SyncOrchestrator orchestrator_;
};

} // namespace kioku::client
