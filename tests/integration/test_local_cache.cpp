#include <catch2/catch_test_macros.hpp>
#include "client/local_cache.hpp"
#include "support/fake_gateway.hpp"
#include "support/fixtures.hpp"

#include <QCoreApplication>
#include <QSignalSpy>
#include <QTemporaryDir>

#include <algorithm>
#include <chrono>

using namespace kioku;
using namespace kioku::testing;
using client::CacheConfig;
using client::LocalCache;

namespace {

std::unique_ptr<LocalCache> open_cache(FakeGateway& gateway,
                                       const SubjectCatalogue& catalogue,
                                       cache::ChangeNotifier* notifier = nullptr) {
    auto opened = LocalCache::open(CacheConfig{.database_path = ":memory:"},
                                   gateway, catalogue, notifier, []() { return kNow; });
    REQUIRE(opened.is_ok());
    return std::move(opened).unwrap();
}

void populate(FakeGateway& gateway, LocalCache& cache) {
    gateway.user = sync::SyncResult<User>::ok(user_at_level(2));
    gateway.assignments = sync::SyncResult<sync::FetchPage<Assignment>>::ok({
        {review_assignment(11, 2, 3, hours_from_now(-1)),
         review_assignment(12, 2, 5, hours_from_now(5)),
         lesson_assignment(2, 2),
         review_assignment(13, 1, 8, hours_from_now(30))},
        "2026-10-01T00:00:00Z"});
    gateway.study_materials = sync::SyncResult<sync::FetchPage<StudyMaterials>>::ok({
        {StudyMaterials{.id = 1, .subject_id = 11, .meaning_note = "tree"}},
        "2026-10-01T00:00:00Z"});
    gateway.levels = sync::SyncResult<std::vector<Level>>::ok({
        Level{.id = 1, .level = 1, .unlocked_at = kNow, .passed_at = kNow},
        Level{.id = 2, .level = 2, .unlocked_at = kNow}});
    cache.sync(false);
}

} // namespace

TEST_CASE("Recording a lesson for an unknown subject", "[integration][cache]") {
    FakeGateway gateway;
    gateway.progress_outcomes.push_back(sync::SyncResult<void>::err(
        sync::SyncError::of(sync::SyncErrorKind::Connectivity, "No network connection")));
    auto catalogue = sample_catalogue();
    auto cache = open_cache(gateway, catalogue);

    auto lesson = lesson_progress(lesson_assignment(42, 1, SubjectType::Kanji));
    REQUIRE(cache->record_progress({lesson}).is_ok());

    REQUIRE(gateway.pushed_progress().size() == 1);
    REQUIRE(cache->all_assignments().unwrap().empty());

    auto pending = cache->pending_progress().unwrap();
    REQUIRE(pending.size() == 1);
    REQUIRE(pending[0].assignment.subject_id == 42);
    REQUIRE(cache->pending_progress_count().unwrap() == 1);

    // The queued copy answers lookups for the subject.
    auto current = cache->assignment(42).unwrap();
    REQUIRE(current.has_value());
    REQUIRE(current->subject_id == 42);

    auto at_level = cache->assignments_at_level(1).unwrap();
    auto it = std::find_if(at_level.begin(), at_level.end(),
                           [](const Assignment& a) { return a.subject_id == 42; });
    REQUIRE(it != at_level.end());
    REQUIRE(it->srs_stage == 1);
}

TEST_CASE("Recording pushes straight away", "[integration][cache]") {
    FakeGateway gateway;
    auto catalogue = sample_catalogue();
    auto cache = open_cache(gateway, catalogue);
    populate(gateway, *cache);

    SECTION("An accepted push leaves nothing queued") {
        auto assignment = cache->assignment(11).unwrap();
        REQUIRE(cache->record_progress({review_progress(*assignment)}).is_ok());
        REQUIRE(gateway.pushed_progress().size() == 1);
        REQUIRE(cache->pending_progress_count().unwrap() == 0);
    }

    SECTION("A rejected push is logged and the item stays queued") {
        gateway.progress_outcomes.push_back(sync::SyncResult<void>::err(http_error(500, "boom")));
        auto assignment = cache->assignment(11).unwrap();

        REQUIRE(cache->record_progress({review_progress(*assignment)}).is_ok());

        REQUIRE(cache->pending_progress_count().unwrap() == 1);
        auto log = cache->error_log().unwrap();
        REQUIRE(log.size() == 1);
        REQUIRE(log[0].code == 500);
    }

    SECTION("Study material edits are saved and pushed") {
        StudyMaterials edited{.id = 1, .subject_id = 11, .meaning_note = "grove",
                              .meaning_synonyms = {"woods"}};
        REQUIRE(cache->update_study_material(edited).is_ok());
        REQUIRE(gateway.pushed_study_materials().size() == 1);
        REQUIRE(cache->study_material(11).unwrap() == edited);
        REQUIRE(cache->pending_study_materials_count().unwrap() == 0);
    }
}

TEST_CASE("Read accessors after a sync", "[integration][cache]") {
    FakeGateway gateway;
    auto catalogue = sample_catalogue();
    auto cache = open_cache(gateway, catalogue);
    populate(gateway, *cache);

    SECTION("Records") {
        REQUIRE(cache->all_assignments().unwrap().size() == 4);
        REQUIRE(cache->user().unwrap()->level == 2);
        REQUIRE(cache->level_progressions().unwrap().size() == 2);
        REQUIRE(cache->study_material(11).unwrap()->meaning_note == "tree");
        REQUIRE_FALSE(cache->study_material(12).unwrap().has_value());
        REQUIRE_FALSE(cache->assignment(29).unwrap().has_value());
    }

    SECTION("Aggregates") {
        REQUIRE(cache->available_lesson_count().unwrap() == 1);
        REQUIRE(cache->available_review_count().unwrap() == 1);
        auto upcoming = cache->upcoming_reviews().unwrap();
        REQUIRE(upcoming[5] == 1);
        REQUIRE(upcoming[30] == 1);
        REQUIRE(cache->guru_kanji_count().unwrap() == 2);
    }

    SECTION("Level view lists the whole curriculum level") {
        // Catalogue level 2: radicals 2, 5, 8; kanji 11, 14, 17, 20;
        // vocabulary 23, 26, 29.
        auto level = cache->assignments_at_current_level().unwrap();
        REQUIRE(level.size() == 3 + 4 + 3 + 1);

        // Rows with progress come first, ordered by subject id.
        REQUIRE(level[0].subject_id == 2);
        REQUIRE(level[1].subject_id == 11);
        REQUIRE(level[1].srs_stage == 3);
        REQUIRE(level[2].subject_id == 12);
        REQUIRE(level[2].unlocked_at.has_value());

        // Then locked placeholders, radicals before kanji before vocabulary.
        REQUIRE(level[3].subject_id == 5);
        REQUIRE_FALSE(level[3].unlocked_at.has_value());
        REQUIRE(level[3].subject_type == SubjectType::Radical);
        REQUIRE(level.back().subject_id == 29);
        REQUIRE(level.back().subject_type == SubjectType::Vocabulary);
    }

    SECTION("Local progress shows in the level view") {
        auto assignment = cache->assignment(11).unwrap();
        REQUIRE(cache->record_progress({review_progress(*assignment, true, true)}).is_ok());

        auto level = cache->assignments_at_level(2).unwrap();
        REQUIRE(level[1].subject_id == 11);
        REQUIRE(level[1].srs_stage == 2);
    }
}

TEST_CASE("Clearing all data", "[integration][cache]") {
    FakeGateway gateway;
    auto catalogue = sample_catalogue();
    cache::ChangeNotifier notifier;
    auto cache = open_cache(gateway, catalogue, &notifier);
    populate(gateway, *cache);

    gateway.progress_outcomes.push_back(sync::SyncResult<void>::err(http_error(500, "boom")));
    REQUIRE(cache->record_progress({lesson_progress(lesson_assignment(2, 2))}).is_ok());
    REQUIRE(cache->pending_progress_count().unwrap() == 1);
    REQUIRE(cache->available_review_count().unwrap() == 1);

    QCoreApplication::processEvents();
    QSignalSpy user_changed(&notifier, &cache::ChangeNotifier::userInfoChanged);

    REQUIRE(cache->clear_all_data().is_ok());

    REQUIRE(cache->all_assignments().unwrap().empty());
    REQUIRE(cache->pending_progress().unwrap().empty());
    REQUIRE_FALSE(cache->user().unwrap().has_value());
    REQUIRE(cache->level_progressions().unwrap().empty());
    REQUIRE_FALSE(cache->study_material(11).unwrap().has_value());
    REQUIRE(cache->error_log().unwrap().empty());
    REQUIRE(cache->assignments_at_current_level().unwrap().empty());

    REQUIRE(cache->pending_progress_count().unwrap() == 0);
    REQUIRE(cache->available_review_count().unwrap() == 0);
    REQUIRE(cache->guru_kanji_count().unwrap() == 0);

    QCoreApplication::processEvents();
    REQUIRE(user_changed.count() == 1);

    // Cursors are back to empty, so the next pass downloads everything.
    cache->sync(true);
    auto cursors = gateway.assignment_cursors();
    REQUIRE(cursors.back().empty());
}

TEST_CASE("Opening purges deleted subjects", "[integration][cache]") {
    QTemporaryDir dir;
    REQUIRE(dir.isValid());
    const CacheConfig config{.database_path = dir.filePath("local-cache.db").toStdString()};

    FakeGateway gateway;
    auto catalogue = sample_catalogue();
    {
        auto cache = LocalCache::open(config, gateway, catalogue, nullptr,
                                      []() { return kNow; }).unwrap();
        populate(gateway, *cache);
        REQUIRE(cache->all_assignments().unwrap().size() == 4);
    }

    catalogue.mark_deleted(12);
    auto reopened = LocalCache::open(config, gateway, catalogue, nullptr,
                                     []() { return kNow; }).unwrap();

    REQUIRE(reopened->all_assignments().unwrap().size() == 3);
    REQUIRE_FALSE(reopened->assignment(12).unwrap().has_value());
    REQUIRE(reopened->guru_kanji_count().unwrap() == 1);
}

TEST_CASE("Asynchronous sync", "[integration][cache]") {
    FakeGateway gateway;
    auto catalogue = sample_catalogue();
    auto cache = open_cache(gateway, catalogue);

    SECTION("The future completes when the pass ends") {
        auto progress = std::make_shared<sync::SyncProgress>();
        auto done = cache->sync_async(true, progress);
        done.get();

        REQUIRE(progress->fraction() == 1.0);
        REQUIRE(cache->user().unwrap()->username == "tester");
    }

    SECTION("A second request during a pass is a no-op") {
        gateway.hold_user_fetch();
        auto first = cache->sync_async(false);
        REQUIRE(gateway.wait_until_held());
        REQUIRE(cache->is_syncing());

        auto second_progress = std::make_shared<sync::SyncProgress>();
        auto second = cache->sync_async(false, second_progress);
        REQUIRE(second.wait_for(std::chrono::seconds(5)) == std::future_status::ready);
        second.get();
        REQUIRE(second_progress->fraction() == 0.0);

        gateway.release();
        first.get();
        REQUIRE_FALSE(cache->is_syncing());
        REQUIRE(gateway.user_fetches() == 1);
    }
}
