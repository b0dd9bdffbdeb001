#include "cache/aggregate_cache.hpp"
#include "storage/account_repository.hpp"
#include "storage/assignment_repository.hpp"
#include "storage/pending_repository.hpp"

namespace kioku::cache {

using storage::Database;

AggregateCache::AggregateCache(storage::Store& store,
                               const SubjectCatalogue& catalogue,
                               ChangeNotifier* notifier,
                               Clock clock)
    : store_(store)
    , catalogue_(catalogue)
    , clock_(std::move(clock))
    , pending_progress_count_([this]() {
          return store_.read([](Database& db) {
              return storage::PendingProgressRepository(db).count();
          });
      }, notifier, Notification::PendingItemsChanged)
    , pending_study_materials_count_([this]() {
          return store_.read([](Database& db) {
              return storage::PendingStudyMaterialRepository(db).count();
          });
      }, notifier, Notification::PendingItemsChanged)
    , available_subjects_([this]() { return compute_available(); },
                          notifier, Notification::AvailableItemsChanged)
    , guru_kanji_count_([this]() {
          return store_.read([](Database& db) {
              return storage::SubjectProgressRepository(db)
                  .count_at_or_above(SubjectType::Kanji, kGuruStage);
          });
      })
    , srs_category_counts_([this]() {
          return store_.read([](Database& db) {
              return storage::SubjectProgressRepository(db).category_counts();
          });
      }, notifier, Notification::SrsCategoryCountsChanged) {
}

Result<AvailableSubjects, Error> AggregateCache::compute_available() {
    using Inputs = std::pair<std::vector<Assignment>, std::optional<User>>;

    auto inputs = store_.read([](Database& db) -> Result<Inputs, Error> {
        auto user = storage::AccountRepository(db).get_user();
        if (user.is_err()) {
            return Result<Inputs, Error>::err(user.unwrap_err());
        }
        auto assignments = storage::AssignmentRepository(db).get_all();
        if (assignments.is_err()) {
            return Result<Inputs, Error>::err(assignments.unwrap_err());
        }
        return Result<Inputs, Error>::ok(
            Inputs{std::move(assignments).unwrap(), std::move(user).unwrap()});
    });
    if (inputs.is_err()) {
        return Result<AvailableSubjects, Error>::err(inputs.unwrap_err());
    }

    const auto& [assignments, user] = inputs.unwrap();
    return Result<AvailableSubjects, Error>::ok(
        compute_available_subjects(assignments, user, catalogue_, clock_()));
}

Result<int64_t, Error> AggregateCache::pending_progress_count() {
    return pending_progress_count_.get();
}

Result<int64_t, Error> AggregateCache::pending_study_materials_count() {
    return pending_study_materials_count_.get();
}

Result<AvailableSubjects, Error> AggregateCache::available_subjects() {
    return available_subjects_.get();
}

Result<int64_t, Error> AggregateCache::guru_kanji_count() {
    return guru_kanji_count_.get();
}

Result<SrsCategoryCounts, Error> AggregateCache::srs_category_counts() {
    return srs_category_counts_.get();
}

void AggregateCache::invalidate_progress_views() {
    pending_progress_count_.invalidate();
    available_subjects_.invalidate();
    srs_category_counts_.invalidate();
    guru_kanji_count_.invalidate();
}

void AggregateCache::invalidate_all() {
    invalidate_progress_views();
    pending_study_materials_count_.invalidate();
}

} // namespace kioku::cache
