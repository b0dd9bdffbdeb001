#include <catch2/catch_test_macros.hpp>
#include "cache/cached.hpp"

#include <QCoreApplication>
#include <QSignalSpy>

using namespace kioku;
using namespace kioku::cache;

TEST_CASE("Cached computes once until invalidated", "[cache]") {
    int calls = 0;
    Cached<int> value([&]() {
        ++calls;
        return Result<int, Error>::ok(calls * 10);
    });

    REQUIRE(value.is_stale());
    REQUIRE(value.get().unwrap() == 10);
    REQUIRE(value.get().unwrap() == 10);
    REQUIRE(calls == 1);
    REQUIRE_FALSE(value.is_stale());

    value.invalidate();
    REQUIRE(value.is_stale());
    REQUIRE(value.get().unwrap() == 20);
    REQUIRE(calls == 2);
}

TEST_CASE("Cached retries after a failed computation", "[cache]") {
    bool fail = true;
    Cached<int> value([&]() {
        if (fail) {
            return Result<int, Error>::err(Error{"database is locked", 5});
        }
        return Result<int, Error>::ok(3);
    });

    auto first = value.get();
    REQUIRE(first.is_err());
    REQUIRE(first.unwrap_err().code == 5);
    REQUIRE(value.is_stale());

    fail = false;
    REQUIRE(value.get().unwrap() == 3);
}

TEST_CASE("Cached posts its notification on invalidate", "[cache]") {
    ChangeNotifier notifier;
    QSignalSpy spy(&notifier, &ChangeNotifier::availableItemsChanged);

    Cached<int> value([]() { return Result<int, Error>::ok(1); },
                      &notifier, Notification::AvailableItemsChanged);
    Cached<int> silent([]() { return Result<int, Error>::ok(2); });

    value.invalidate();
    silent.invalidate();
    REQUIRE(spy.count() == 0);

    QCoreApplication::processEvents();
    REQUIRE(spy.count() == 1);
}
