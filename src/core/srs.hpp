#pragma once

#include <array>
#include <cstdint>
#include <optional>
#include <string_view>

namespace kioku {

/**
 * SubjectType - the closed set of curriculum subject kinds.
 *
 * Values are persisted in subject_progress.subject_type; never renumber.
 */
enum class SubjectType : int {
    Unknown = 0,
    Radical = 1,
    Kanji = 2,
    Vocabulary = 3
};

[[nodiscard]] constexpr std::string_view subject_type_name(SubjectType type) noexcept {
    switch (type) {
        case SubjectType::Radical: return "radical";
        case SubjectType::Kanji: return "kanji";
        case SubjectType::Vocabulary: return "vocabulary";
        case SubjectType::Unknown: break;
    }
    return "unknown";
}

[[nodiscard]] constexpr SubjectType subject_type_from_int(int value) noexcept {
    switch (value) {
        case 1: return SubjectType::Radical;
        case 2: return SubjectType::Kanji;
        case 3: return SubjectType::Vocabulary;
        default: return SubjectType::Unknown;
    }
}

/**
 * SrsCategory - grouping of SRS stages, also the bucket index in the
 * category histogram.
 */
enum class SrsCategory : int {
    Lesson = 0,
    Apprentice = 1,
    Guru = 2,
    Master = 3,
    Enlightened = 4,
    Burned = 5
};

inline constexpr int kMaxSrsStage = 9;
inline constexpr int kGuruStage = 5;
inline constexpr size_t kSrsCategoryCount = 6;

using SrsCategoryCounts = std::array<int, kSrsCategoryCount>;

[[nodiscard]] constexpr SrsCategory srs_category_for_stage(int stage) noexcept {
    if (stage <= 0) return SrsCategory::Lesson;
    if (stage <= 4) return SrsCategory::Apprentice;
    if (stage <= 6) return SrsCategory::Guru;
    if (stage == 7) return SrsCategory::Master;
    if (stage == 8) return SrsCategory::Enlightened;
    return SrsCategory::Burned;
}

static_assert(srs_category_for_stage(kGuruStage) == SrsCategory::Guru);
static_assert(static_cast<size_t>(SrsCategory::Burned) + 1 == kSrsCategoryCount);

} // namespace kioku
