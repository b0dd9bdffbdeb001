#include "storage/assignment_repository.hpp"
#include "storage/record_codec.hpp"

namespace kioku::storage {

namespace {
auto no_params = [](Statement&) {};
} // namespace

// ============================================================================
// AssignmentRepository
// ============================================================================

Result<std::vector<Assignment>, Error> AssignmentRepository::get_all() {
    std::vector<Assignment> assignments;

    auto result = db_.query("SELECT pb FROM assignments;", no_params,
        [&](Statement& stmt) -> Result<void, Error> {
            auto decoded = decode_assignment(stmt.column_blob(0));
            if (decoded.is_err()) {
                return Result<void, Error>::err(decoded.unwrap_err());
            }
            assignments.push_back(std::move(decoded).unwrap());
            return Result<void, Error>::ok();
        });

    if (result.is_err()) {
        return Result<std::vector<Assignment>, Error>::err(result.unwrap_err());
    }
    return Result<std::vector<Assignment>, Error>::ok(std::move(assignments));
}

Result<std::optional<Assignment>, Error> AssignmentRepository::get_by_subject(SubjectId subject_id) {
    std::optional<Assignment> found;

    auto result = db_.query("SELECT pb FROM assignments WHERE subject_id = ? LIMIT 1;",
        [&](Statement& stmt) { stmt.bind_int64(1, subject_id); },
        [&](Statement& stmt) -> Result<void, Error> {
            auto decoded = decode_assignment(stmt.column_blob(0));
            if (decoded.is_err()) {
                return Result<void, Error>::err(decoded.unwrap_err());
            }
            found = std::move(decoded).unwrap();
            return Result<void, Error>::ok();
        });

    if (result.is_err()) {
        return Result<std::optional<Assignment>, Error>::err(result.unwrap_err());
    }
    return Result<std::optional<Assignment>, Error>::ok(std::move(found));
}

Result<void, Error> AssignmentRepository::save(const Assignment& assignment) {
    auto dedupe = db_.update("DELETE FROM assignments WHERE subject_id = ? AND id != ?;",
        [&](Statement& stmt) {
            stmt.bind_int64(1, assignment.subject_id).bind_int64(2, assignment.id);
        });
    if (dedupe.is_err()) {
        return dedupe;
    }

    return db_.update("REPLACE INTO assignments (id, pb, subject_id) VALUES (?, ?, ?);",
        [&](Statement& stmt) {
            stmt.bind_int64(1, assignment.id)
                .bind_blob(2, encode_assignment(assignment))
                .bind_int64(3, assignment.subject_id);
        });
}

Result<void, Error> AssignmentRepository::remove_by_subject(SubjectId subject_id) {
    return db_.update("DELETE FROM assignments WHERE subject_id = ?;",
        [&](Statement& stmt) { stmt.bind_int64(1, subject_id); });
}

Result<int64_t, Error> AssignmentRepository::count() {
    return db_.query_int("SELECT COUNT(*) FROM assignments;");
}

// ============================================================================
// SubjectProgressRepository
// ============================================================================

Result<void, Error> SubjectProgressRepository::save(const SubjectProgress& progress) {
    return db_.update(R"SQL(
        REPLACE INTO subject_progress (id, level, srs_stage, subject_type)
        VALUES (?, ?, ?, ?);
    )SQL", [&](Statement& stmt) {
        stmt.bind_int64(1, progress.subject_id)
            .bind_int(2, progress.level)
            .bind_int(3, progress.srs_stage)
            .bind_int(4, static_cast<int>(progress.subject_type));
    });
}

Result<std::optional<SubjectProgress>, Error> SubjectProgressRepository::get(SubjectId subject_id) {
    std::optional<SubjectProgress> found;

    auto result = db_.query(
        "SELECT id, level, srs_stage, subject_type FROM subject_progress WHERE id = ?;",
        [&](Statement& stmt) { stmt.bind_int64(1, subject_id); },
        [&](Statement& stmt) -> Result<void, Error> {
            found = SubjectProgress{
                .subject_id = stmt.column_int64(0),
                .level = stmt.column_int(1),
                .srs_stage = stmt.column_int(2),
                .subject_type = subject_type_from_int(stmt.column_int(3))
            };
            return Result<void, Error>::ok();
        });

    if (result.is_err()) {
        return Result<std::optional<SubjectProgress>, Error>::err(result.unwrap_err());
    }
    return Result<std::optional<SubjectProgress>, Error>::ok(found);
}

Result<void, Error> SubjectProgressRepository::remove(SubjectId subject_id) {
    return db_.update("DELETE FROM subject_progress WHERE id = ?;",
        [&](Statement& stmt) { stmt.bind_int64(1, subject_id); });
}

Result<std::vector<LevelProgressRow>, Error> SubjectProgressRepository::get_at_level(int level) {
    std::vector<LevelProgressRow> rows;

    auto result = db_.query(R"SQL(
        SELECT p.id, p.level, p.srs_stage, p.subject_type, a.pb
        FROM subject_progress AS p
        LEFT JOIN assignments AS a ON p.id = a.subject_id
        WHERE p.level = ?
        ORDER BY p.id;
    )SQL",
        [&](Statement& stmt) { stmt.bind_int(1, level); },
        [&](Statement& stmt) -> Result<void, Error> {
            LevelProgressRow row;
            row.progress = SubjectProgress{
                .subject_id = stmt.column_int64(0),
                .level = stmt.column_int(1),
                .srs_stage = stmt.column_int(2),
                .subject_type = subject_type_from_int(stmt.column_int(3))
            };
            if (!stmt.column_is_null(4)) {
                auto decoded = decode_assignment(stmt.column_blob(4));
                if (decoded.is_err()) {
                    return Result<void, Error>::err(decoded.unwrap_err());
                }
                row.assignment = std::move(decoded).unwrap();
            }
            rows.push_back(std::move(row));
            return Result<void, Error>::ok();
        });

    if (result.is_err()) {
        return Result<std::vector<LevelProgressRow>, Error>::err(result.unwrap_err());
    }
    return Result<std::vector<LevelProgressRow>, Error>::ok(std::move(rows));
}

Result<int64_t, Error> SubjectProgressRepository::count_at_or_above(SubjectType type, int min_stage) {
    int64_t count = 0;

    auto result = db_.query(
        "SELECT COUNT(*) FROM subject_progress WHERE srs_stage >= ? AND subject_type = ?;",
        [&](Statement& stmt) {
            stmt.bind_int(1, min_stage).bind_int(2, static_cast<int>(type));
        },
        [&](Statement& stmt) -> Result<void, Error> {
            count = stmt.column_int64(0);
            return Result<void, Error>::ok();
        });

    if (result.is_err()) {
        return Result<int64_t, Error>::err(result.unwrap_err());
    }
    return Result<int64_t, Error>::ok(count);
}

Result<SrsCategoryCounts, Error> SubjectProgressRepository::category_counts() {
    SrsCategoryCounts counts{};

    auto result = db_.query(R"SQL(
        SELECT srs_stage, COUNT(*) FROM subject_progress
        WHERE srs_stage >= 1 GROUP BY srs_stage;
    )SQL", no_params,
        [&](Statement& stmt) -> Result<void, Error> {
            const auto category = srs_category_for_stage(stmt.column_int(0));
            counts[static_cast<size_t>(category)] += stmt.column_int(1);
            return Result<void, Error>::ok();
        });

    if (result.is_err()) {
        return Result<SrsCategoryCounts, Error>::err(result.unwrap_err());
    }
    return Result<SrsCategoryCounts, Error>::ok(counts);
}

Result<int64_t, Error> SubjectProgressRepository::count() {
    return db_.query_int("SELECT COUNT(*) FROM subject_progress;");
}

} // namespace kioku::storage
