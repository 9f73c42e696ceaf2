#include <catch2/catch_test_macros.hpp>

#include "daicgate/core/error.hpp"

TEST_CASE("Error creation and accessors", "[error]") {
    SECTION("basic error") {
        daicgate::Error err(daicgate::ErrorCode::NotFound, "state file missing");
        CHECK(err.code() == daicgate::ErrorCode::NotFound);
        CHECK(err.message() == "state file missing");
        CHECK(err.detail() == "");
        CHECK(err.what() == "state file missing");
    }

    SECTION("error with detail") {
        daicgate::Error err(daicgate::ErrorCode::CorruptedState,
                            "Failed to parse state", "unexpected end of input");
        CHECK(err.code() == daicgate::ErrorCode::CorruptedState);
        CHECK(err.message() == "Failed to parse state");
        CHECK(err.detail() == "unexpected end of input");
        CHECK(err.what() == "Failed to parse state: unexpected end of input");
    }
}

TEST_CASE("make_error helpers", "[error]") {
    SECTION("two-argument form") {
        auto err = daicgate::make_error(daicgate::ErrorCode::InvalidArgument, "missing tool_name");
        CHECK(err.code() == daicgate::ErrorCode::InvalidArgument);
        CHECK(err.message() == "missing tool_name");
        CHECK(err.detail() == "");
    }

    SECTION("three-argument form") {
        auto err = daicgate::make_error(daicgate::ErrorCode::Timeout,
                                        "git timed out", "after 2000ms");
        CHECK(err.code() == daicgate::ErrorCode::Timeout);
        CHECK(err.what() == "git timed out: after 2000ms");
    }
}

TEST_CASE("Result type success case", "[error]") {
    daicgate::Result<int> result = 42;

    REQUIRE(result.has_value());
    CHECK(*result == 42);
}

TEST_CASE("Result type error case", "[error]") {
    daicgate::Result<int> result = std::unexpected(
        daicgate::make_error(daicgate::ErrorCode::InvalidConfig, "bad value"));

    REQUIRE_FALSE(result.has_value());
    CHECK(result.error().code() == daicgate::ErrorCode::InvalidConfig);
    CHECK(result.error().message() == "bad value");
}

TEST_CASE("VoidResult success and error", "[error]") {
    SECTION("success") {
        daicgate::VoidResult result{};
        REQUIRE(result.has_value());
    }

    SECTION("error") {
        daicgate::VoidResult result = std::unexpected(
            daicgate::make_error(daicgate::ErrorCode::IoError, "disk full"));
        REQUIRE_FALSE(result.has_value());
        CHECK(result.error().code() == daicgate::ErrorCode::IoError);
    }
}

TEST_CASE("error_code_to_string names every code", "[error]") {
    CHECK(daicgate::error_code_to_string(daicgate::ErrorCode::Unknown) == "UNKNOWN");
    CHECK(daicgate::error_code_to_string(daicgate::ErrorCode::InvalidConfig) == "INVALID_CONFIG");
    CHECK(daicgate::error_code_to_string(daicgate::ErrorCode::CorruptedState) ==
          "CORRUPTED_STATE");
    CHECK(daicgate::error_code_to_string(daicgate::ErrorCode::Timeout) == "TIMEOUT");
    CHECK(daicgate::error_code_to_string(daicgate::ErrorCode::ProcessFailed) ==
          "PROCESS_FAILED");
}
