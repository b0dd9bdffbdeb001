#pragma once

#include "client/local_cache.hpp"
#include "core/catalogue.hpp"
#include "core/records.hpp"
#include "storage/error_log_repository.hpp"
#include <QString>
#include <vector>

namespace kioku::app {

/**
 * Snapshot of the cache counters printed by `kioku status`.
 */
struct CacheStatus {
    int64_t pending_progress = 0;
    int64_t pending_study_materials = 0;
    int lessons = 0;
    int reviews = 0;
    int64_t guru_kanji = 0;
    SrsCategoryCounts srs_counts{};
};

[[nodiscard]] Result<CacheStatus, Error> collect_status(client::LocalCache& cache);

[[nodiscard]] QString format_status(const CacheStatus& status);

// {"pendingProgress", "pendingStudyMaterials", "lessons", "reviews",
//  "guruKanji", "srs": {"apprentice", ...}}
[[nodiscard]] QString format_status_json(const CacheStatus& status);

/**
 * Parse the argument of `kioku level <n>`. The level must be at least 1 and,
 * when the catalogue knows any subjects, no higher than its maximum level.
 */
[[nodiscard]] Result<int, Error> parse_level(const QString& text,
                                             const SubjectCatalogue& catalogue);

// One line per assignment: "<subject id> <type> stage <n>".
[[nodiscard]] QString format_level(const std::vector<Assignment>& assignments);

[[nodiscard]] QString format_level_json(const std::vector<Assignment>& assignments);

// Support export: array of entries, newest first.
[[nodiscard]] QString format_error_log_json(const std::vector<storage::ErrorLogEntry>& entries);

} // namespace kioku::app
