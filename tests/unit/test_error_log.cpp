#include <catch2/catch_test_macros.hpp>
#include "storage/error_log_repository.hpp"
#include "storage/migrations.hpp"

#include <string>

using namespace kioku;
using namespace kioku::storage;

namespace {

ErrorLogEntry numbered_entry(int n) {
    return ErrorLogEntry{
        .code = 500,
        .description = "failure " + std::to_string(n),
        .request_url = "https://api.example.test/v2/user"
    };
}

} // namespace

TEST_CASE("Error log keeps the newest entries", "[storage][error_log]") {
    auto db = Database::open_memory().unwrap();
    REQUIRE(initialize_database(db).is_ok());
    ErrorLogRepository log(db);

    SECTION("Empty by default") {
        REQUIRE(log.count().unwrap() == 0);
        REQUIRE(log.get_all().unwrap().empty());
    }

    SECTION("Entries come back newest first with their fields") {
        REQUIRE(log.append(numbered_entry(1)).is_ok());
        REQUIRE(log.append(ErrorLogEntry{.description = "plain"}).is_ok());

        auto entries = log.get_all().unwrap();
        REQUIRE(entries.size() == 2);
        REQUIRE(entries[0].description == "plain");
        REQUIRE_FALSE(entries[0].code.has_value());
        REQUIRE(entries[0].request_url.empty());
        REQUIRE_FALSE(entries[0].date.empty());

        REQUIRE(entries[1].description == "failure 1");
        REQUIRE(entries[1].code == 500);
        REQUIRE(entries[1].request_url == "https://api.example.test/v2/user");
    }

    SECTION("Appending to a full log evicts the oldest") {
        for (int i = 1; i <= 150; ++i) {
            REQUIRE(db.transaction([&]() { return log.append(numbered_entry(i)); }).is_ok());
        }
        REQUIRE(log.count().unwrap() == 100);

        REQUIRE(log.append(numbered_entry(151)).is_ok());
        auto entries = log.get_all().unwrap();
        REQUIRE(entries.size() == 100);
        REQUIRE(entries.front().description == "failure 151");
        REQUIRE(entries.back().description == "failure 52");
    }

    SECTION("Custom capacity") {
        for (int i = 1; i <= 5; ++i) {
            REQUIRE(log.append(numbered_entry(i), 3).is_ok());
        }
        auto entries = log.get_all().unwrap();
        REQUIRE(entries.size() == 3);
        REQUIRE(entries.front().description == "failure 5");
        REQUIRE(entries.back().description == "failure 3");
    }
}
