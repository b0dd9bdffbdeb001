#pragma once

#include "sync/progress.hpp"
#include "sync/remote_gateway.hpp"
#include "sync/sync_error.hpp"
#include "cache/aggregate_cache.hpp"
#include "storage/store.hpp"
#include "core/records.hpp"
#include <vector>

namespace kioku::sync {

/**
 * PendingQueue - local writes waiting to reach the remote service.
 *
 * Recording commits to the store immediately. Sending walks the items one
 * request at a time; each acknowledged item leaves the queue as soon as its
 * request succeeds. The first failure stops the walk and leaves the rest
 * queued for the next sync.
 */
class PendingQueue {
public:
    PendingQueue(storage::Store& store, RemoteGateway& gateway, cache::AggregateCache& cache)
        : store_(store), gateway_(gateway), cache_(cache) {}

    /**
     * Queue completed lessons or reviews in one transaction. For each item
     * the committed assignment is dropped and the subject's derived stage
     * moves to next_srs_stage().
     */
    [[nodiscard]] Result<void, Error> record_progress(const std::vector<Progress>& items);

    /**
     * Save the materials locally and mark them for pushing.
     */
    [[nodiscard]] Result<void, Error> record_study_material(const StudyMaterials& materials);

    /**
     * Push every queued progress item.
     */
    [[nodiscard]] SyncResult<void> flush_progress(SyncProgress& progress);

    /**
     * Push every study material with a pending marker.
     */
    [[nodiscard]] SyncResult<void> flush_study_materials(SyncProgress& progress);

    /**
     * Push the given progress items in order. An item the remote service
     * refuses as unprocessable is dropped as if it had been accepted.
     */
    [[nodiscard]] SyncResult<void> send_progress(const std::vector<Progress>& items,
                                                 SyncProgress& progress);

    [[nodiscard]] SyncResult<void> send_study_materials(
        const std::vector<StudyMaterials>& materials, SyncProgress& progress);

private:
    [[nodiscard]] SyncResult<void> clear_progress(const Progress& item);
    [[nodiscard]] SyncResult<void> clear_study_material(const StudyMaterials& materials);

    storage::Store& store_;
    RemoteGateway& gateway_;
    cache::AggregateCache& cache_;
};

} // namespace kioku::sync
