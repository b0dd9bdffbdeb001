#include <catch2/catch_test_macros.hpp>
#include "cache/aggregate_cache.hpp"
#include "cache/aggregates.hpp"
#include "storage/account_repository.hpp"
#include "storage/assignment_repository.hpp"
#include "storage/pending_repository.hpp"
#include "support/fixtures.hpp"

#include <QCoreApplication>
#include <QSignalSpy>

#include <numeric>

using namespace kioku;
using namespace kioku::cache;
using namespace kioku::testing;
using storage::Database;

TEST_CASE("compute_available_subjects", "[cache][aggregates]") {
    auto catalogue = sample_catalogue();
    const auto user = std::optional<User>(user_at_level(3));

    SECTION("Nothing is available without a user") {
        std::vector<Assignment> assignments{lesson_assignment(1, 1)};
        auto result = compute_available_subjects(assignments, std::nullopt, catalogue, kNow);
        REQUIRE(result == AvailableSubjects{});
    }

    SECTION("Lessons and due reviews are counted") {
        std::vector<Assignment> assignments{
            lesson_assignment(1, 1),
            lesson_assignment(2, 2),
            review_assignment(11, 2, 3, hours_from_now(-2)),
            review_assignment(12, 3, 1, kNow),
        };
        auto result = compute_available_subjects(assignments, user, catalogue, kNow);
        REQUIRE(result.lesson_count == 2);
        REQUIRE(result.review_count == 2);
        REQUIRE(std::accumulate(result.upcoming_reviews.begin(),
                                result.upcoming_reviews.end(), 0) == 0);
    }

    SECTION("Upcoming reviews are bucketed by whole hours") {
        std::vector<Assignment> assignments{
            review_assignment(11, 2, 3, hours_from_now(0.5)),
            review_assignment(12, 3, 2, hours_from_now(25)),
            review_assignment(13, 1, 4, hours_from_now(25.9)),
            review_assignment(14, 2, 4, hours_from_now(47.99)),
            review_assignment(15, 3, 4, hours_from_now(48)),
            review_assignment(16, 1, 4, hours_from_now(100)),
        };
        auto result = compute_available_subjects(assignments, user, catalogue, kNow);
        REQUIRE(result.review_count == 0);
        REQUIRE(result.upcoming_reviews[0] == 1);
        REQUIRE(result.upcoming_reviews[25] == 2);
        REQUIRE(result.upcoming_reviews[47] == 1);
        REQUIRE(std::accumulate(result.upcoming_reviews.begin(),
                                result.upcoming_reviews.end(), 0) == 4);
    }

    SECTION("Invalid subjects are ignored") {
        std::vector<Assignment> assignments{
            review_assignment(999, 1, 3, hours_from_now(-1)),
            lesson_assignment(998, 1),
        };
        auto result = compute_available_subjects(assignments, user, catalogue, kNow);
        REQUIRE(result == AvailableSubjects{});
    }

    SECTION("Subjects above the user's level are ignored") {
        std::vector<Assignment> assignments{
            review_assignment(11, 2, 3, hours_from_now(-1)),
            review_assignment(12, 3, 3, hours_from_now(-1)),
        };
        auto low_user = std::optional<User>(user_at_level(2));
        auto result = compute_available_subjects(assignments, low_user, catalogue, kNow);
        REQUIRE(result.review_count == 1);
    }

    SECTION("A user without a level sees every level") {
        User unknown_level = user_at_level(1);
        unknown_level.level.reset();
        std::vector<Assignment> assignments{review_assignment(12, 3, 3, hours_from_now(-1))};
        auto result = compute_available_subjects(assignments, unknown_level, catalogue, kNow);
        REQUIRE(result.review_count == 1);
    }

    SECTION("Burned and locked assignments are neither lessons nor reviews") {
        std::vector<Assignment> assignments{
            review_assignment(11, 1, kMaxSrsStage, hours_from_now(-1)),
            locked_assignment(12, SubjectType::Kanji, 1),
        };
        auto result = compute_available_subjects(assignments, user, catalogue, kNow);
        REQUIRE(result == AvailableSubjects{});
    }
}

TEST_CASE("AggregateCache reads through the store", "[cache][aggregates]") {
    auto store = memory_store();
    auto catalogue = sample_catalogue();
    ChangeNotifier notifier;
    AggregateCache cache(*store, catalogue, &notifier, []() { return kNow; });

    REQUIRE(store->write([](Database& db) -> Result<void, Error> {
        auto saved = storage::AccountRepository(db).save_user(user_at_level(3));
        if (saved.is_err()) return saved;
        storage::AssignmentRepository assignments(db);
        storage::SubjectProgressRepository progress(db);
        for (const auto& a : {review_assignment(11, 1, 5, hours_from_now(-1)),
                              review_assignment(12, 2, 8, hours_from_now(3)),
                              review_assignment(21, 1, 6, hours_from_now(-1),
                                                SubjectType::Vocabulary),
                              lesson_assignment(1, 1)}) {
            saved = assignments.save(a);
            if (saved.is_err()) return saved;
            saved = progress.save(subject_progress_of(a));
            if (saved.is_err()) return saved;
        }
        return Result<void, Error>::ok();
    }).is_ok());

    SECTION("Values are computed from the stored rows") {
        auto available = cache.available_subjects().unwrap();
        REQUIRE(available.lesson_count == 1);
        REQUIRE(available.review_count == 2);
        REQUIRE(available.upcoming_reviews[3] == 1);

        REQUIRE(cache.guru_kanji_count().unwrap() == 2);

        auto counts = cache.srs_category_counts().unwrap();
        REQUIRE(counts[static_cast<size_t>(SrsCategory::Guru)] == 2);
        REQUIRE(counts[static_cast<size_t>(SrsCategory::Enlightened)] == 1);
        REQUIRE(std::accumulate(counts.begin(), counts.end(), 0) == 3);

        REQUIRE(cache.pending_progress_count().unwrap() == 0);
        REQUIRE(cache.pending_study_materials_count().unwrap() == 0);
    }

    SECTION("Stale until invalidated") {
        REQUIRE(cache.pending_progress_count().unwrap() == 0);

        REQUIRE(store->write([](Database& db) {
            return storage::PendingProgressRepository(db).save(
                review_progress(review_assignment(11, 1, 5, kNow)));
        }).is_ok());
        REQUIRE(cache.pending_progress_count().unwrap() == 0);

        cache.invalidate_pending_progress();
        REQUIRE(cache.pending_progress_count().unwrap() == 1);
    }

    SECTION("Invalidation posts the matching notifications") {
        QSignalSpy pending(&notifier, &ChangeNotifier::pendingItemsChanged);
        QSignalSpy available(&notifier, &ChangeNotifier::availableItemsChanged);
        QSignalSpy srs(&notifier, &ChangeNotifier::srsCategoryCountsChanged);

        cache.invalidate_progress_views();
        cache.invalidate_guru_kanji();

        // Delivery is queued, never inline.
        REQUIRE(pending.count() == 0);
        QCoreApplication::processEvents();

        REQUIRE(pending.count() == 1);
        REQUIRE(available.count() == 1);
        REQUIRE(srs.count() == 1);

        cache.invalidate_pending_study_materials();
        QCoreApplication::processEvents();
        REQUIRE(pending.count() == 2);
        REQUIRE(available.count() == 1);
    }
}
