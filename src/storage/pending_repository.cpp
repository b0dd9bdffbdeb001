#include "storage/pending_repository.hpp"
#include "storage/record_codec.hpp"

namespace kioku::storage {

// ============================================================================
// PendingProgressRepository
// ============================================================================

Result<void, Error> PendingProgressRepository::save(const Progress& progress) {
    return db_.update("REPLACE INTO pending_progress (id, pb) VALUES (?, ?);",
        [&](Statement& stmt) {
            stmt.bind_int64(1, progress.assignment.subject_id)
                .bind_blob(2, encode_progress(progress));
        });
}

Result<std::vector<Progress>, Error> PendingProgressRepository::get_all() {
    std::vector<Progress> items;

    auto result = db_.query("SELECT pb FROM pending_progress ORDER BY id;",
        [](Statement&) {},
        [&](Statement& stmt) -> Result<void, Error> {
            auto decoded = decode_progress(stmt.column_blob(0));
            if (decoded.is_err()) {
                return Result<void, Error>::err(decoded.unwrap_err());
            }
            items.push_back(std::move(decoded).unwrap());
            return Result<void, Error>::ok();
        });

    if (result.is_err()) {
        return Result<std::vector<Progress>, Error>::err(result.unwrap_err());
    }
    return Result<std::vector<Progress>, Error>::ok(std::move(items));
}

Result<std::optional<Progress>, Error> PendingProgressRepository::get(SubjectId subject_id) {
    std::optional<Progress> found;

    auto result = db_.query("SELECT pb FROM pending_progress WHERE id = ?;",
        [&](Statement& stmt) { stmt.bind_int64(1, subject_id); },
        [&](Statement& stmt) -> Result<void, Error> {
            auto decoded = decode_progress(stmt.column_blob(0));
            if (decoded.is_err()) {
                return Result<void, Error>::err(decoded.unwrap_err());
            }
            found = std::move(decoded).unwrap();
            return Result<void, Error>::ok();
        });

    if (result.is_err()) {
        return Result<std::optional<Progress>, Error>::err(result.unwrap_err());
    }
    return Result<std::optional<Progress>, Error>::ok(std::move(found));
}

Result<void, Error> PendingProgressRepository::remove(SubjectId subject_id) {
    return db_.update("DELETE FROM pending_progress WHERE id = ?;",
        [&](Statement& stmt) { stmt.bind_int64(1, subject_id); });
}

Result<int64_t, Error> PendingProgressRepository::count() {
    return db_.query_int("SELECT COUNT(*) FROM pending_progress;");
}

// ============================================================================
// PendingStudyMaterialRepository
// ============================================================================

Result<void, Error> PendingStudyMaterialRepository::mark(SubjectId subject_id) {
    return db_.update("REPLACE INTO pending_study_materials (id) VALUES (?);",
        [&](Statement& stmt) { stmt.bind_int64(1, subject_id); });
}

Result<void, Error> PendingStudyMaterialRepository::unmark(SubjectId subject_id) {
    return db_.update("DELETE FROM pending_study_materials WHERE id = ?;",
        [&](Statement& stmt) { stmt.bind_int64(1, subject_id); });
}

Result<bool, Error> PendingStudyMaterialRepository::is_marked(SubjectId subject_id) {
    bool marked = false;
    auto result = db_.query("SELECT 1 FROM pending_study_materials WHERE id = ?;",
        [&](Statement& stmt) { stmt.bind_int64(1, subject_id); },
        [&](Statement&) -> Result<void, Error> {
            marked = true;
            return Result<void, Error>::ok();
        });

    if (result.is_err()) {
        return Result<bool, Error>::err(result.unwrap_err());
    }
    return Result<bool, Error>::ok(marked);
}

Result<std::vector<StudyMaterials>, Error> PendingStudyMaterialRepository::get_all() {
    std::vector<StudyMaterials> items;

    auto result = db_.query(R"SQL(
        SELECT s.pb FROM study_materials AS s
        JOIN pending_study_materials AS p ON s.id = p.id
        ORDER BY s.id;
    )SQL",
        [](Statement&) {},
        [&](Statement& stmt) -> Result<void, Error> {
            auto decoded = decode_study_materials(stmt.column_blob(0));
            if (decoded.is_err()) {
                return Result<void, Error>::err(decoded.unwrap_err());
            }
            items.push_back(std::move(decoded).unwrap());
            return Result<void, Error>::ok();
        });

    if (result.is_err()) {
        return Result<std::vector<StudyMaterials>, Error>::err(result.unwrap_err());
    }
    return Result<std::vector<StudyMaterials>, Error>::ok(std::move(items));
}

Result<int64_t, Error> PendingStudyMaterialRepository::count() {
    return db_.query_int("SELECT COUNT(*) FROM pending_study_materials;");
}

} // namespace kioku::storage
