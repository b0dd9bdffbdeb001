#include "cache/aggregates.hpp"

#include <chrono>

namespace kioku::cache {

AvailableSubjects compute_available_subjects(
    const std::vector<Assignment>& assignments,
    const std::optional<User>& user,
    const SubjectCatalogue& catalogue,
    Timestamp now) {
    AvailableSubjects result;
    if (!user) {
        return result;
    }

    for (const auto& assignment : assignments) {
        if (!catalogue.is_valid_subject(assignment.subject_id)) {
            continue;
        }
        if (user->level && *user->level < assignment.level) {
            continue;
        }

        if (is_lesson_stage(assignment)) {
            ++result.lesson_count;
        } else if (is_review_stage(assignment)) {
            auto until = *assignment.available_at - now;
            if (until.count() <= 0) {
                ++result.review_count;
                continue;
            }
            auto hours = std::chrono::duration_cast<std::chrono::hours>(until).count();
            if (hours < kUpcomingReviewHours) {
                ++result.upcoming_reviews[static_cast<size_t>(hours)];
            }
        }
    }

    return result;
}

} // namespace kioku::cache
