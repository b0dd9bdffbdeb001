#pragma once

#include "core/types.hpp"
#include "core/srs.hpp"
#include <algorithm>
#include <optional>
#include <string>
#include <vector>

namespace kioku {

/**
 * Assignment - the user's scheduling state for one subject.
 *
 * Replaced wholesale whenever a fresher copy arrives from the remote
 * service. Locally unique per subject_id.
 */
struct Assignment {
    int64_t id = 0;
    SubjectId subject_id = 0;
    SubjectType subject_type = SubjectType::Unknown;
    int level = 0;
    int srs_stage = 0;
    std::optional<Timestamp> unlocked_at;
    std::optional<Timestamp> started_at;
    std::optional<Timestamp> available_at;

    bool operator==(const Assignment&) const = default;
};

/**
 * Progress - one completed lesson or review, not yet acknowledged remotely.
 */
struct Progress {
    Assignment assignment;
    bool is_lesson = false;
    bool meaning_wrong = false;
    bool reading_wrong = false;
    int meaning_wrong_count = 0;
    int reading_wrong_count = 0;
    Timestamp created_at;

    bool operator==(const Progress&) const = default;
};

/**
 * StudyMaterials - user-authored notes and synonyms for a subject.
 */
struct StudyMaterials {
    int64_t id = 0;
    SubjectId subject_id = 0;
    std::string meaning_note;
    std::string reading_note;
    std::vector<std::string> meaning_synonyms;

    bool operator==(const StudyMaterials&) const = default;
};

/**
 * User - the singleton account record.
 */
struct User {
    std::string username;
    std::optional<int> level;
    int max_level_granted_by_subscription = 0;
    bool subscribed = false;
    std::optional<Timestamp> started_at;

    bool operator==(const User&) const = default;
};

/**
 * Level - one entry of the level progression history.
 */
struct Level {
    int64_t id = 0;
    int level = 0;
    std::optional<Timestamp> unlocked_at;
    std::optional<Timestamp> started_at;
    std::optional<Timestamp> passed_at;
    std::optional<Timestamp> completed_at;
    std::optional<Timestamp> abandoned_at;

    bool operator==(const Level&) const = default;
};

/**
 * SubjectProgress - derived index row queried for aggregate counts.
 */
struct SubjectProgress {
    SubjectId subject_id = 0;
    int level = 0;
    int srs_stage = 0;
    SubjectType subject_type = SubjectType::Unknown;

    bool operator==(const SubjectProgress&) const = default;
};

// ============================================================================
// Pure functions
// ============================================================================

/**
 * Unlocked but not yet started.
 */
[[nodiscard]] inline bool is_lesson_stage(const Assignment& a) {
    return a.unlocked_at.has_value() && !a.started_at.has_value() && a.srs_stage == 0;
}

/**
 * Started and scheduled for a future (or past-due) review.
 */
[[nodiscard]] inline bool is_review_stage(const Assignment& a) {
    return a.started_at.has_value() && a.available_at.has_value() &&
           a.srs_stage >= 1 && a.srs_stage < kMaxSrsStage;
}

[[nodiscard]] inline bool any_answer_wrong(const Progress& p) {
    return p.meaning_wrong || p.reading_wrong;
}

/**
 * Stage the subject moves to once this progress is applied locally.
 */
[[nodiscard]] inline int next_srs_stage(const Progress& p) {
    const int stage = p.assignment.srs_stage;
    if (p.is_lesson || !any_answer_wrong(p)) {
        return stage + 1;
    }
    return std::max(0, stage - 1);
}

[[nodiscard]] inline SubjectProgress subject_progress_of(const Assignment& a) {
    return SubjectProgress{
        .subject_id = a.subject_id,
        .level = a.level,
        .srs_stage = a.srs_stage,
        .subject_type = a.subject_type
    };
}

/**
 * Placeholder for a curriculum subject the user has not unlocked yet.
 */
[[nodiscard]] inline Assignment locked_assignment(SubjectId subject_id,
                                                  SubjectType type,
                                                  int level) {
    return Assignment{
        .id = 0,
        .subject_id = subject_id,
        .subject_type = type,
        .level = level,
        .srs_stage = 0
    };
}

} // namespace kioku
