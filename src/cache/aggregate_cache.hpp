#pragma once

#include "cache/aggregates.hpp"
#include "cache/cached.hpp"
#include "cache/notifier.hpp"
#include "core/catalogue.hpp"
#include "storage/store.hpp"
#include <functional>

namespace kioku::cache {

/**
 * AggregateCache - the memoized values read by the application.
 *
 * Each value is computed from the store on first read after an
 * invalidation. Writers call the matching invalidate_*() once their
 * transaction has committed.
 */
class AggregateCache {
public:
    using Clock = std::function<Timestamp()>;

    AggregateCache(storage::Store& store,
                   const SubjectCatalogue& catalogue,
                   ChangeNotifier* notifier,
                   Clock clock = &Timestamp::now);

    [[nodiscard]] Result<int64_t, Error> pending_progress_count();
    [[nodiscard]] Result<int64_t, Error> pending_study_materials_count();
    [[nodiscard]] Result<AvailableSubjects, Error> available_subjects();
    [[nodiscard]] Result<int64_t, Error> guru_kanji_count();
    [[nodiscard]] Result<SrsCategoryCounts, Error> srs_category_counts();

    void invalidate_pending_progress() { pending_progress_count_.invalidate(); }
    void invalidate_pending_study_materials() { pending_study_materials_count_.invalidate(); }
    void invalidate_available_subjects() { available_subjects_.invalidate(); }
    void invalidate_guru_kanji() { guru_kanji_count_.invalidate(); }
    void invalidate_srs_categories() { srs_category_counts_.invalidate(); }

    /**
     * Everything that depends on assignment or subject progress rows.
     */
    void invalidate_progress_views();

    void invalidate_all();

private:
    [[nodiscard]] Result<AvailableSubjects, Error> compute_available();

    storage::Store& store_;
    const SubjectCatalogue& catalogue_;
    Clock clock_;

    Cached<int64_t> pending_progress_count_;
    Cached<int64_t> pending_study_materials_count_;
    Cached<AvailableSubjects> available_subjects_;
    Cached<int64_t> guru_kanji_count_;
    Cached<SrsCategoryCounts> srs_category_counts_;
};

} // namespace kioku::cache
