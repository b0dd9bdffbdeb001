#pragma once

#include "core/records.hpp"
#include "core/result.hpp"
#include <cstdint>
#include <vector>

namespace kioku::storage {

// Records are persisted as compact JSON blobs next to the scalar columns
// used for querying. Decoding ignores unknown keys so older builds can read
// rows written by newer ones.

using Blob = std::vector<uint8_t>;

[[nodiscard]] Blob encode_assignment(const Assignment& assignment);
[[nodiscard]] Result<Assignment, Error> decode_assignment(const Blob& blob);

[[nodiscard]] Blob encode_progress(const Progress& progress);
[[nodiscard]] Result<Progress, Error> decode_progress(const Blob& blob);

[[nodiscard]] Blob encode_study_materials(const StudyMaterials& materials);
[[nodiscard]] Result<StudyMaterials, Error> decode_study_materials(const Blob& blob);

[[nodiscard]] Blob encode_user(const User& user);
[[nodiscard]] Result<User, Error> decode_user(const Blob& blob);

[[nodiscard]] Blob encode_level(const Level& level);
[[nodiscard]] Result<Level, Error> decode_level(const Blob& blob);

} // namespace kioku::storage
