#include <catch2/catch_test_macros.hpp>

#include "warden/core/error.hpp"

TEST_CASE("Error creation and accessors", "[error]") {
    SECTION("basic error") {
        warden::Error err(warden::ErrorCode::NotFound, "resource not found");
        CHECK(err.code() == warden::ErrorCode::NotFound);
        CHECK(err.message() == "resource not found");
        CHECK(err.detail() == "");
        CHECK(err.what() == "resource not found");
    }

    SECTION("error with detail") {
        warden::Error err(warden::ErrorCode::IoError, "open failed", "permission denied");
        CHECK(err.code() == warden::ErrorCode::IoError);
        CHECK(err.detail() == "permission denied");
        CHECK(err.what() == "open failed: permission denied");
    }
}

TEST_CASE("Security error factories", "[error]") {
    SECTION("path traversal carries attempted path and base") {
        auto err = warden::path_traversal_error("../etc/passwd", "/srv/app");
        CHECK(err.code() == warden::ErrorCode::PathTraversal);
        CHECK(err.detail().find("attempted=../etc/passwd") != std::string_view::npos);
        CHECK(err.detail().find("base=/srv/app") != std::string_view::npos);
    }

    SECTION("command not allowed names the command") {
        auto err = warden::command_not_allowed_error("rm", "Command not in whitelist");
        CHECK(err.code() == warden::ErrorCode::CommandNotAllowed);
        CHECK(err.message() == "Command not allowed: rm");
    }

    SECTION("command injection names the pattern") {
        auto err = warden::command_injection_error("[REDACTED]", ";");
        CHECK(err.code() == warden::ErrorCode::CommandInjection);
        CHECK(err.detail().find("pattern=;") != std::string_view::npos);
    }

    SECTION("validation error keeps the joined messages") {
        auto err = warden::validation_error("a; b");
        CHECK(err.code() == warden::ErrorCode::ValidationFailed);
        CHECK(err.detail() == "a; b");
    }
}

TEST_CASE("error_code_to_string", "[error]") {
    CHECK(warden::error_code_to_string(warden::ErrorCode::PathTraversal) == "PATH_TRAVERSAL");
    CHECK(warden::error_code_to_string(warden::ErrorCode::CommandNotAllowed) == "COMMAND_NOT_ALLOWED");
    CHECK(warden::error_code_to_string(warden::ErrorCode::CommandInjection) == "COMMAND_INJECTION");
    CHECK(warden::error_code_to_string(warden::ErrorCode::Cancelled) == "CANCELLED");
}

TEST_CASE("Result type", "[error]") {
    SECTION("success") {
        warden::Result<int> result = 42;
        REQUIRE(result.has_value());
        CHECK(*result == 42);
    }

    SECTION("failure") {
        warden::Result<int> result = std::unexpected(
            warden::make_error(warden::ErrorCode::Timeout, "timed out"));
        REQUIRE_FALSE(result.has_value());
        CHECK(result.error().code() == warden::ErrorCode::Timeout);
    }

    SECTION("void result") {
        warden::VoidResult ok = warden::ok_result();
        CHECK(ok.has_value());
    }
}
