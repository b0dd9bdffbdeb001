#include <catch2/catch_test_macros.hpp>
#include "core/records.hpp"
#include "support/fixtures.hpp"

using namespace kioku;
using namespace kioku::testing;

TEST_CASE("Lesson and review stages", "[records]") {
    SECTION("Unlocked but not started is a lesson") {
        auto a = lesson_assignment(1, 1);
        REQUIRE(is_lesson_stage(a));
        REQUIRE_FALSE(is_review_stage(a));
    }

    SECTION("Started with an availability time is a review") {
        auto a = review_assignment(2, 1, 3, hours_from_now(1));
        REQUIRE(is_review_stage(a));
        REQUIRE_FALSE(is_lesson_stage(a));
    }

    SECTION("Burned items are neither") {
        auto a = review_assignment(3, 1, kMaxSrsStage, hours_from_now(1));
        REQUIRE_FALSE(is_review_stage(a));
        REQUIRE_FALSE(is_lesson_stage(a));
    }

    SECTION("Locked placeholders are neither") {
        auto a = locked_assignment(4, SubjectType::Vocabulary, 2);
        REQUIRE(a.subject_id == 4);
        REQUIRE(a.level == 2);
        REQUIRE(a.srs_stage == 0);
        REQUIRE_FALSE(is_lesson_stage(a));
        REQUIRE_FALSE(is_review_stage(a));
    }
}

TEST_CASE("next_srs_stage follows the answer", "[records][srs]") {
    auto a = review_assignment(10, 1, 4, kNow);

    REQUIRE(next_srs_stage(lesson_progress(lesson_assignment(10, 1))) == 1);
    REQUIRE(next_srs_stage(review_progress(a)) == 5);
    REQUIRE(next_srs_stage(review_progress(a, true, false)) == 3);
    REQUIRE(next_srs_stage(review_progress(a, false, true)) == 3);

    auto bottom = review_assignment(11, 1, 0, kNow);
    REQUIRE(next_srs_stage(review_progress(bottom, true, true)) == 0);
}

TEST_CASE("SRS categories group stages", "[records][srs]") {
    REQUIRE(srs_category_for_stage(0) == SrsCategory::Lesson);
    REQUIRE(srs_category_for_stage(1) == SrsCategory::Apprentice);
    REQUIRE(srs_category_for_stage(4) == SrsCategory::Apprentice);
    REQUIRE(srs_category_for_stage(5) == SrsCategory::Guru);
    REQUIRE(srs_category_for_stage(6) == SrsCategory::Guru);
    REQUIRE(srs_category_for_stage(7) == SrsCategory::Master);
    REQUIRE(srs_category_for_stage(8) == SrsCategory::Enlightened);
    REQUIRE(srs_category_for_stage(9) == SrsCategory::Burned);
}

TEST_CASE("subject_progress_of copies the indexed fields", "[records]") {
    auto a = review_assignment(42, 3, 6, kNow, SubjectType::Vocabulary);
    auto p = subject_progress_of(a);

    REQUIRE(p.subject_id == 42);
    REQUIRE(p.level == 3);
    REQUIRE(p.srs_stage == 6);
    REQUIRE(p.subject_type == SubjectType::Vocabulary);
}
