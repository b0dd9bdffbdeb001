#pragma once

#include "storage/database.hpp"
#include "core/records.hpp"
#include "core/result.hpp"
#include <optional>
#include <vector>

namespace kioku::storage {

/**
 * AssignmentRepository - committed assignments, one row per subject.
 */
class AssignmentRepository {
public:
    explicit AssignmentRepository(Database& db) : db_(db) {}

    [[nodiscard]] Result<std::vector<Assignment>, Error> get_all();

    [[nodiscard]] Result<std::optional<Assignment>, Error> get_by_subject(SubjectId subject_id);

    /**
     * Insert or replace. Any other row for the same subject is dropped so the
     * table stays unique per subject.
     */
    [[nodiscard]] Result<void, Error> save(const Assignment& assignment);

    [[nodiscard]] Result<void, Error> remove_by_subject(SubjectId subject_id);

    [[nodiscard]] Result<int64_t, Error> count();

private:
    Database& db_;
};

/**
 * Row of the level view: the derived progress, joined with the committed
 * assignment if one exists.
 */
struct LevelProgressRow {
    SubjectProgress progress;
    std::optional<Assignment> assignment;
};

/**
 * SubjectProgressRepository - the derived index used for aggregate counts.
 */
class SubjectProgressRepository {
public:
    explicit SubjectProgressRepository(Database& db) : db_(db) {}

    [[nodiscard]] Result<void, Error> save(const SubjectProgress& progress);

    [[nodiscard]] Result<std::optional<SubjectProgress>, Error> get(SubjectId subject_id);

    [[nodiscard]] Result<void, Error> remove(SubjectId subject_id);

    [[nodiscard]] Result<std::vector<LevelProgressRow>, Error> get_at_level(int level);

    /**
     * Rows of the given type whose stage is at least min_stage.
     */
    [[nodiscard]] Result<int64_t, Error> count_at_or_above(SubjectType type, int min_stage);

    /**
     * Histogram of stages >= 1 grouped into SRS categories.
     */
    [[nodiscard]] Result<SrsCategoryCounts, Error> category_counts();

    [[nodiscard]] Result<int64_t, Error> count();

private:
    Database& db_;
};

} // namespace kioku::storage
