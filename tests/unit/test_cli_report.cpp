#include <catch2/catch_test_macros.hpp>
#include "app/cli/report.hpp"
#include "support/fake_gateway.hpp"
#include "support/fixtures.hpp"

#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonObject>

using namespace kioku;
using namespace kioku::app;
using namespace kioku::testing;

TEST_CASE("Status report formats", "[app][cli]") {
    CacheStatus status;
    status.pending_progress = 2;
    status.pending_study_materials = 1;
    status.lessons = 5;
    status.reviews = 12;
    status.guru_kanji = 30;
    status.srs_counts = {0, 10, 20, 3, 4, 7};

    SECTION("Text") {
        REQUIRE(format_status(status) ==
                QStringLiteral("Pending progress: 2\n"
                               "Pending study materials: 1\n"
                               "Lessons: 5\n"
                               "Reviews: 12\n"
                               "Guru kanji: 30\n"
                               "SRS: apprentice 10, guru 20, master 3, enlightened 4, burned 7\n"));
    }

    SECTION("JSON") {
        const auto doc = QJsonDocument::fromJson(format_status_json(status).toUtf8());
        REQUIRE(doc.isObject());
        const auto root = doc.object();
        REQUIRE(root.value("pendingProgress").toInt() == 2);
        REQUIRE(root.value("pendingStudyMaterials").toInt() == 1);
        REQUIRE(root.value("lessons").toInt() == 5);
        REQUIRE(root.value("reviews").toInt() == 12);
        REQUIRE(root.value("guruKanji").toInt() == 30);
        REQUIRE(root.value("srs").toObject().value("burned").toInt() == 7);
        REQUIRE_FALSE(root.value("srs").toObject().contains("lesson"));
    }
}

TEST_CASE("Level report formats", "[app][cli]") {
    std::vector<Assignment> assignments{
        review_assignment(440, 1, 5, kNow),
        locked_assignment(2467, SubjectType::Vocabulary, 1),
    };

    REQUIRE(format_level(assignments) ==
            QStringLiteral("440 kanji stage 5\n2467 vocabulary stage 0\n"));

    const auto items = QJsonDocument::fromJson(format_level_json(assignments).toUtf8()).array();
    REQUIRE(items.size() == 2);
    REQUIRE(items[0].toObject().value("subjectId").toInt() == 440);
    REQUIRE(items[0].toObject().value("locked").toBool() == false);
    REQUIRE(items[1].toObject().value("type").toString() == QStringLiteral("vocabulary"));
    REQUIRE(items[1].toObject().value("locked").toBool() == true);
}

TEST_CASE("Error log export", "[app][cli]") {
    std::vector<storage::ErrorLogEntry> entries{
        {.date = "2026-10-01 10:00:00", .code = 500, .description = "Internal Server Error",
         .request_url = "https://api.example.test/v2/reviews"},
        {.date = "2026-09-30 08:00:00", .description = "offline cache write failed"},
    };

    const auto items = QJsonDocument::fromJson(format_error_log_json(entries).toUtf8()).array();
    REQUIRE(items.size() == 2);

    const auto first = items[0].toObject();
    REQUIRE(first.value("code").toInt() == 500);
    REQUIRE(first.value("requestUrl").toString() == QStringLiteral("https://api.example.test/v2/reviews"));
    REQUIRE(first.value("responseData").isNull());

    const auto second = items[1].toObject();
    REQUIRE(second.value("code").isNull());
    REQUIRE(second.value("description").toString() == QStringLiteral("offline cache write failed"));
}

TEST_CASE("collect_status reads the cache", "[app][cli]") {
    FakeGateway gateway;
    auto catalogue = sample_catalogue();
    client::CacheConfig config{.database_path = ":memory:"};
    auto cache = client::LocalCache::open(config, gateway, catalogue, nullptr,
                                          []() { return kNow; }).unwrap();

    gateway.user = sync::SyncResult<User>::ok(user_at_level(3));
    gateway.assignments = sync::SyncResult<sync::FetchPage<Assignment>>::ok({
        {review_assignment(11, 1, 6, hours_from_now(-1)), lesson_assignment(1, 1)},
        "2026-10-01T00:00:00Z"});
    cache->sync(false);

    auto status = collect_status(*cache);
    REQUIRE(status.is_ok());
    REQUIRE(status.unwrap().lessons == 1);
    REQUIRE(status.unwrap().reviews == 1);
    REQUIRE(status.unwrap().guru_kanji == 1);
    REQUIRE(status.unwrap().pending_progress == 0);
    REQUIRE(status.unwrap().srs_counts[static_cast<size_t>(SrsCategory::Guru)] == 1);
}

TEST_CASE("Level argument is bounded by the catalogue", "[app][cli]") {
    auto catalogue = sample_catalogue();

    REQUIRE(parse_level(QStringLiteral("2"), catalogue).unwrap() == 2);
    REQUIRE(parse_level(QStringLiteral("3"), catalogue).unwrap() == 3);
    REQUIRE(parse_level(QStringLiteral("0"), catalogue).is_err());
    REQUIRE(parse_level(QStringLiteral("two"), catalogue).is_err());

    auto beyond = parse_level(QStringLiteral("4"), catalogue);
    REQUIRE(beyond.is_err());
    REQUIRE(beyond.unwrap_err().message == "level 4 is beyond the catalogue (1-3)");

    SECTION("Without a catalogue only the lower bound applies") {
        InMemoryCatalogue empty;
        REQUIRE(parse_level(QStringLiteral("60"), empty).unwrap() == 60);
    }
}
