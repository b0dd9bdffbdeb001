#pragma once

#include "core/catalogue.hpp"
#include "core/records.hpp"
#include "storage/store.hpp"

#include <chrono>
#include <memory>

namespace kioku::testing {

// Fixed "now" shared by tests that depend on the clock.
inline const Timestamp kNow{1'760'000'000'000};

inline Timestamp hours_from_now(double hours) {
    return kNow + std::chrono::milliseconds(static_cast<int64_t>(hours * 3'600'000.0));
}

inline Assignment review_assignment(SubjectId subject, int level, int stage,
                                    Timestamp available_at,
                                    SubjectType type = SubjectType::Kanji) {
    return Assignment{
        .id = subject + 100000,
        .subject_id = subject,
        .subject_type = type,
        .level = level,
        .srs_stage = stage,
        .unlocked_at = kNow - std::chrono::hours(24 * 30),
        .started_at = kNow - std::chrono::hours(24 * 29),
        .available_at = available_at
    };
}

inline Assignment lesson_assignment(SubjectId subject, int level,
                                    SubjectType type = SubjectType::Radical) {
    return Assignment{
        .id = subject + 100000,
        .subject_id = subject,
        .subject_type = type,
        .level = level,
        .srs_stage = 0,
        .unlocked_at = kNow - std::chrono::hours(1)
    };
}

inline Progress lesson_progress(const Assignment& assignment) {
    return Progress{
        .assignment = assignment,
        .is_lesson = true,
        .created_at = kNow
    };
}

inline Progress review_progress(const Assignment& assignment,
                                bool meaning_wrong = false,
                                bool reading_wrong = false) {
    return Progress{
        .assignment = assignment,
        .is_lesson = false,
        .meaning_wrong = meaning_wrong,
        .reading_wrong = reading_wrong,
        .meaning_wrong_count = meaning_wrong ? 1 : 0,
        .reading_wrong_count = reading_wrong ? 1 : 0,
        .created_at = kNow
    };
}

inline User user_at_level(int level) {
    return User{.username = "tester", .level = level, .max_level_granted_by_subscription = 60,
                .subscribed = true, .started_at = kNow - std::chrono::hours(24 * 365)};
}

inline std::unique_ptr<storage::Store> memory_store() {
    return storage::Store::open_memory().unwrap();
}

// Catalogue with subjects 1..30: ids 1-10 radicals, 11-20 kanji,
// 21-30 vocabulary, level = (id - 1) % 3 + 1.
inline InMemoryCatalogue sample_catalogue() {
    InMemoryCatalogue catalogue;
    for (SubjectId id = 1; id <= 30; ++id) {
        SubjectType type = id <= 10 ? SubjectType::Radical
                         : id <= 20 ? SubjectType::Kanji
                                    : SubjectType::Vocabulary;
        catalogue.add_subject({.id = id, .type = type, .level = static_cast<int>((id - 1) % 3 + 1)});
    }
    return catalogue;
}

} // namespace kioku::testing
