#include "storage/study_material_repository.hpp"
#include "storage/record_codec.hpp"

namespace kioku::storage {

Result<std::optional<StudyMaterials>, Error> StudyMaterialRepository::get(SubjectId subject_id) {
    std::optional<StudyMaterials> found;

    auto result = db_.query("SELECT pb FROM study_materials WHERE id = ?;",
        [&](Statement& stmt) { stmt.bind_int64(1, subject_id); },
        [&](Statement& stmt) -> Result<void, Error> {
            auto decoded = decode_study_materials(stmt.column_blob(0));
            if (decoded.is_err()) {
                return Result<void, Error>::err(decoded.unwrap_err());
            }
            found = std::move(decoded).unwrap();
            return Result<void, Error>::ok();
        });

    if (result.is_err()) {
        return Result<std::optional<StudyMaterials>, Error>::err(result.unwrap_err());
    }
    return Result<std::optional<StudyMaterials>, Error>::ok(std::move(found));
}

Result<void, Error> StudyMaterialRepository::save(const StudyMaterials& materials) {
    return db_.update("REPLACE INTO study_materials (id, pb) VALUES (?, ?);",
        [&](Statement& stmt) {
            stmt.bind_int64(1, materials.subject_id)
                .bind_blob(2, encode_study_materials(materials));
        });
}

Result<int64_t, Error> StudyMaterialRepository::count() {
    return db_.query_int("SELECT COUNT(*) FROM study_materials;");
}

} // namespace kioku::storage
