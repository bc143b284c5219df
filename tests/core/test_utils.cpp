#include <catch2/catch_test_macros.hpp>

#include <set>

#include "warden/core/utils.hpp"

using namespace warden::utils;

TEST_CASE("generate_uuid produces distinct v4 strings", "[utils]") {
    std::set<std::string> ids;
    for (int i = 0; i < 50; ++i) {
        auto id = generate_uuid();
        CHECK(id.size() == 36);
        CHECK(id[14] == '4');
        ids.insert(id);
    }
    CHECK(ids.size() == 50);
}

TEST_CASE("timestamp formats", "[utils]") {
    SECTION("iso has millisecond precision and Z suffix") {
        auto ts = timestamp_iso();
        REQUIRE(ts.size() == 24);
        CHECK(ts[10] == 'T');
        CHECK(ts[19] == '.');
        CHECK(ts.back() == 'Z');
    }

    SECTION("file safe variant has no colons or dots") {
        auto ts = timestamp_file_safe();
        CHECK(ts.find(':') == std::string::npos);
        CHECK(ts.find('.') == std::string::npos);
    }

    SECTION("timestamp_ms is after 2020") {
        CHECK(timestamp_ms() > 1577836800000LL);
    }
}

TEST_CASE("string helpers", "[utils]") {
    CHECK(trim("  a b \t\n") == "a b");
    CHECK(trim("   ").empty());

    auto parts = split("a:b::c", ':');
    REQUIRE(parts.size() == 4);
    CHECK(parts[2].empty());

    CHECK(join({"git", "status", "-s"}, " ") == "git status -s");
    CHECK(join({}, ",").empty());

    CHECK(to_lower("ReSoLvE") == "resolve");
    CHECK(to_upper("lpt1") == "LPT1");
}

TEST_CASE("sanitize_for_log replaces control characters and truncates", "[utils]") {
    std::string raw = std::string("a\nb\0c", 5) + "\x1b[31m";
    auto clean = sanitize_for_log(raw);
    CHECK(clean == "a?b?c?[31m");

    std::string long_input(500, 'x');
    CHECK(sanitize_for_log(long_input).size() == 200);
    CHECK(sanitize_for_log(long_input, 10).size() == 10);
}
