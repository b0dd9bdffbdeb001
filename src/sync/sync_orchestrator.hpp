#pragma once

#include "sync/error_reporter.hpp"
#include "sync/pending_queue.hpp"
#include "sync/progress.hpp"
#include "sync/remote_gateway.hpp"
#include "cache/aggregate_cache.hpp"
#include "cache/notifier.hpp"
#include "storage/store.hpp"
#include <atomic>
#include <initializer_list>

namespace kioku::sync {

/**
 * Units of the whole pass given to each step.
 */
struct SyncWeights {
    static constexpr int64_t kFlushProgress = 1;
    static constexpr int64_t kFlushStudyMaterials = 1;
    static constexpr int64_t kAssignments = 8;
    static constexpr int64_t kStudyMaterials = 1;
    static constexpr int64_t kUser = 1;
    static constexpr int64_t kLevelProgressions = 1;
    static constexpr int64_t kTotal = kFlushProgress + kFlushStudyMaterials + kAssignments +
                                      kStudyMaterials + kUser + kLevelProgressions;
};

/**
 * SyncOrchestrator - runs one synchronization pass at a time.
 *
 * A pass flushes both pending queues in parallel, then fetches assignments,
 * study materials, the user and level progressions in parallel. Each fetch
 * commits its rows together with its new cursor. Failures are handed to the
 * ErrorReporter; sync() itself always returns normally.
 */
class SyncOrchestrator {
public:
    SyncOrchestrator(storage::Store& store,
                     RemoteGateway& gateway,
                     PendingQueue& queue,
                     cache::AggregateCache& cache,
                     ErrorReporter& reporter,
                     cache::ChangeNotifier* notifier)
        : store_(store)
        , gateway_(gateway)
        , queue_(queue)
        , cache_(cache)
        , reporter_(reporter)
        , notifier_(notifier) {}

    /**
     * Run a pass and block until it ends. When a pass is already running
     * this returns at once without touching anything. A full (non-quick)
     * pass first resets the assignments cursor so every assignment is
     * downloaded again.
     */
    void sync(bool quick, SyncProgress& progress);

    [[nodiscard]] bool is_running() const { return running_.load(); }

    // Individual fetch steps; each commits its own transaction.
    [[nodiscard]] SyncResult<void> fetch_assignments(SyncProgress& progress);
    [[nodiscard]] SyncResult<void> fetch_study_materials(SyncProgress& progress);
    [[nodiscard]] SyncResult<void> fetch_user(SyncProgress& progress);
    [[nodiscard]] SyncResult<void> fetch_level_progressions(SyncProgress& progress);

private:
    [[nodiscard]] bool run_pass(bool quick, SyncProgress& progress);
    [[nodiscard]] bool report_first_error(std::initializer_list<const SyncResult<void>*> results);

    storage::Store& store_;
    RemoteGateway& gateway_;
    PendingQueue& queue_;
    cache::AggregateCache& cache_;
    ErrorReporter& reporter_;
    cache::ChangeNotifier* notifier_;

    std::atomic<bool> running_{false};
};

} // namespace kioku::sync
