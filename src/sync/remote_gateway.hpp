#pragma once

#include "sync/progress.hpp"
#include "sync/sync_error.hpp"
#include "core/records.hpp"
#include <string>
#include <vector>

namespace kioku::sync {

/**
 * One incremental fetch: the changed records and the cursor to pass next time.
 */
template<typename T>
struct FetchPage {
    std::vector<T> items;
    std::string cursor;
};

/**
 * RemoteGateway - the remote service as seen by the sync engine.
 *
 * Calls block until the request finishes. Several calls may run at the same
 * time from different threads. Each call updates the progress node it is
 * given as data arrives.
 */
class RemoteGateway {
public:
    virtual ~RemoteGateway() = default;

    /**
     * Assignments changed after `updated_after` (everything when empty).
     */
    [[nodiscard]] virtual SyncResult<FetchPage<Assignment>> fetch_assignments(
        const std::string& updated_after, SyncProgress& progress) = 0;

    [[nodiscard]] virtual SyncResult<FetchPage<StudyMaterials>> fetch_study_materials(
        const std::string& updated_after, SyncProgress& progress) = 0;

    [[nodiscard]] virtual SyncResult<User> fetch_user(SyncProgress& progress) = 0;

    [[nodiscard]] virtual SyncResult<std::vector<Level>> fetch_level_progressions(
        SyncProgress& progress) = 0;

    /**
     * Report one progress item. A refusal of the item itself comes back as
     * SyncErrorKind::Unprocessable.
     */
    [[nodiscard]] virtual SyncResult<void> push_progress(const Progress& progress,
                                                         SyncProgress& sink) = 0;

    [[nodiscard]] virtual SyncResult<void> push_study_material(const StudyMaterials& materials,
                                                               SyncProgress& sink) = 0;
};

/**
 * OfflineGateway - a gateway with no network; every call fails with
 * SyncErrorKind::Connectivity.
 */
class OfflineGateway : public RemoteGateway {
public:
    SyncResult<FetchPage<Assignment>> fetch_assignments(
        const std::string& updated_after, SyncProgress& progress) override;
    SyncResult<FetchPage<StudyMaterials>> fetch_study_materials(
        const std::string& updated_after, SyncProgress& progress) override;
    SyncResult<User> fetch_user(SyncProgress& progress) override;
    SyncResult<std::vector<Level>> fetch_level_progressions(SyncProgress& progress) override;
    SyncResult<void> push_progress(const Progress& progress, SyncProgress& sink) override;
    SyncResult<void> push_study_material(const StudyMaterials& materials,
                                         SyncProgress& sink) override;
};

} // namespace kioku::sync
