#pragma once

#include "storage/database.hpp"
#include "core/records.hpp"
#include "core/result.hpp"
#include <optional>

namespace kioku::storage {

/**
 * StudyMaterialRepository - user annotations, one row per subject.
 */
class StudyMaterialRepository {
public:
    explicit StudyMaterialRepository(Database& db) : db_(db) {}

    [[nodiscard]] Result<std::optional<StudyMaterials>, Error> get(SubjectId subject_id);

    [[nodiscard]] Result<void, Error> save(const StudyMaterials& materials);

    [[nodiscard]] Result<int64_t, Error> count();

private:
    Database& db_;
};

} // namespace kioku::storage
