#pragma once

#include "core/catalogue.hpp"
#include "core/records.hpp"
#include <array>
#include <optional>
#include <vector>

namespace kioku::cache {

inline constexpr int kUpcomingReviewHours = 48;

/**
 * Lessons and reviews the user can do now, plus an hourly forecast of
 * reviews becoming due over the next two days.
 */
struct AvailableSubjects {
    int lesson_count = 0;
    int review_count = 0;
    std::array<int, kUpcomingReviewHours> upcoming_reviews{};

    bool operator==(const AvailableSubjects&) const = default;
};

/**
 * Count lessons and due reviews among the assignments.
 *
 * Assignments for subjects the catalogue does not consider valid are
 * skipped, as are assignments above the user's current level: the remote
 * service rejects progress for those, so they would otherwise come back as
 * reviews forever. Reviews due later are bucketed by whole hours from now;
 * anything 48 hours or more away is left out. Without a user nothing is
 * available.
 */
[[nodiscard]] AvailableSubjects compute_available_subjects(
    const std::vector<Assignment>& assignments,
    const std::optional<User>& user,
    const SubjectCatalogue& catalogue,
    Timestamp now);

} // namespace kioku::cache
