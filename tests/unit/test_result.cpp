#include <catch2/catch_test_macros.hpp>
#include "core/result.hpp"
#include <string>

using namespace kioku;

TEST_CASE("Result::ok holds the value", "[result]") {
    auto result = Result<int>::ok(42);

    REQUIRE(result.is_ok());
    REQUIRE_FALSE(result.is_err());
    REQUIRE(result.unwrap() == 42);
}

TEST_CASE("Result::err holds message and code", "[result]") {
    auto result = Result<int>::err(Error{"disk I/O error", 10});

    REQUIRE(result.is_err());
    REQUIRE(result.unwrap_err().message == "disk I/O error");
    REQUIRE(result.unwrap_err().code == 10);
    REQUIRE_THROWS_AS(result.unwrap(), std::runtime_error);
}

TEST_CASE("Result::value_or falls back on error", "[result]") {
    REQUIRE(Result<int>::ok(7).value_or(0) == 7);
    REQUIRE(Result<int>::err(Error{"no row"}).value_or(0) == 0);
}

TEST_CASE("Result::map and and_then compose", "[result]") {
    auto halve = [](int x) -> Result<int> {
        if (x % 2 != 0) return Result<int>::err(Error{"odd"});
        return Result<int>::ok(x / 2);
    };

    auto good = Result<int>::ok(8).and_then(halve).map([](int x) { return std::to_string(x); });
    REQUIRE(good.is_ok());
    REQUIRE(good.unwrap() == "4");

    auto bad = Result<int>::ok(3).and_then(halve).map([](int x) { return x + 1; });
    REQUIRE(bad.is_err());
    REQUIRE(bad.unwrap_err().message == "odd");
}

TEST_CASE("Result::map_err changes the error type", "[result]") {
    auto result = Result<int>::err(Error{"locked", 5})
        .map_err([](Error e) { return e.code; });

    REQUIRE(result.is_err());
    REQUIRE(result.unwrap_err() == 5);
}

TEST_CASE("Result with identical value and error types", "[result]") {
    auto ok = Result<Error, Error>::ok(Error{"value"});
    auto err = Result<Error, Error>::err(Error{"failure"});

    REQUIRE(ok.is_ok());
    REQUIRE(ok.unwrap().message == "value");
    REQUIRE(err.is_err());
    REQUIRE(err.unwrap_err().message == "failure");
}

TEST_CASE("Result<void> reports success and failure", "[result]") {
    auto ok_result = Result<void>::ok();
    auto err_result = Result<void>::err(Error{"constraint failed"});

    REQUIRE(ok_result.is_ok());
    REQUIRE(err_result.is_err());
    REQUIRE_NOTHROW(ok_result.unwrap());
    REQUIRE_THROWS(err_result.unwrap());

    auto chained = ok_result.and_then([]() { return Result<int>::ok(1); });
    REQUIRE(chained.unwrap() == 1);
}
