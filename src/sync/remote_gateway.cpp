#include "sync/remote_gateway.hpp"

namespace kioku::sync {

namespace {

SyncError offline() {
    return SyncError::of(SyncErrorKind::Connectivity, "No network connection");
}

} // namespace

SyncResult<FetchPage<Assignment>> OfflineGateway::fetch_assignments(
    const std::string&, SyncProgress&) {
    return SyncResult<FetchPage<Assignment>>::err(offline());
}

SyncResult<FetchPage<StudyMaterials>> OfflineGateway::fetch_study_materials(
    const std::string&, SyncProgress&) {
    return SyncResult<FetchPage<StudyMaterials>>::err(offline());
}

SyncResult<User> OfflineGateway::fetch_user(SyncProgress&) {
    return SyncResult<User>::err(offline());
}

SyncResult<std::vector<Level>> OfflineGateway::fetch_level_progressions(SyncProgress&) {
    return SyncResult<std::vector<Level>>::err(offline());
}

SyncResult<void> OfflineGateway::push_progress(const Progress&, SyncProgress&) {
    return SyncResult<void>::err(offline());
}

SyncResult<void> OfflineGateway::push_study_material(const StudyMaterials&, SyncProgress&) {
    return SyncResult<void>::err(offline());
}

} // namespace kioku::sync
