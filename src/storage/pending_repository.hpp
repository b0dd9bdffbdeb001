#pragma once

#include "storage/database.hpp"
#include "core/records.hpp"
#include "core/result.hpp"
#include <optional>
#include <vector>

namespace kioku::storage {

/**
 * PendingProgressRepository - progress recorded locally, keyed by subject,
 * not yet acknowledged by the remote service.
 */
class PendingProgressRepository {
public:
    explicit PendingProgressRepository(Database& db) : db_(db) {}

    [[nodiscard]] Result<void, Error> save(const Progress& progress);

    [[nodiscard]] Result<std::vector<Progress>, Error> get_all();

    [[nodiscard]] Result<std::optional<Progress>, Error> get(SubjectId subject_id);

    [[nodiscard]] Result<void, Error> remove(SubjectId subject_id);

    [[nodiscard]] Result<int64_t, Error> count();

private:
    Database& db_;
};

/**
 * PendingStudyMaterialRepository - markers for study materials awaiting a push.
 */
class PendingStudyMaterialRepository {
public:
    explicit PendingStudyMaterialRepository(Database& db) : db_(db) {}

    [[nodiscard]] Result<void, Error> mark(SubjectId subject_id);

    [[nodiscard]] Result<void, Error> unmark(SubjectId subject_id);

    [[nodiscard]] Result<bool, Error> is_marked(SubjectId subject_id);

    /**
     * Study materials that have a pending marker.
     */
    [[nodiscard]] Result<std::vector<StudyMaterials>, Error> get_all();

    [[nodiscard]] Result<int64_t, Error> count();

private:
    Database& db_;
};

} // namespace kioku::storage
