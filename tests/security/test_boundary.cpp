#include <catch2/catch_test_macros.hpp>

#include <filesystem>

#include "warden/security/boundary.hpp"
#include "../support/test_helpers.hpp"

using namespace warden::security;

TEST_CASE("normalize_lexical", "[security][boundary]") {
    CHECK(normalize_lexical("a//b/./c/") == "a/b/c");
    CHECK(normalize_lexical("a/b/../c") == "a/c");
    CHECK(normalize_lexical("/../etc") == "/etc");
    CHECK(normalize_lexical("../x") == "../x");
    CHECK(normalize_lexical("/") == "/");
    CHECK(normalize_lexical("") == ".");
    CHECK(normalize_lexical("./") == ".");
}

TEST_CASE("resolve_lexical", "[security][boundary]") {
    CHECK(resolve_lexical("/srv/app", "src/index.ts") == "/srv/app/src/index.ts");
    CHECK(resolve_lexical("/srv/app", "/etc/passwd") == "/etc/passwd");
    CHECK(resolve_lexical("/srv/app", ".") == "/srv/app");
    CHECK(resolve_lexical("/srv/app", "../app2") == "/srv/app2");
}

TEST_CASE("is_path_within", "[security][boundary]") {
    CHECK(is_path_within("/srv/app", "/srv/app", false));
    CHECK(is_path_within("/srv/app/a/b", "/srv/app", false));
    CHECK_FALSE(is_path_within("/srv/app-evil/a", "/srv/app", false));
    CHECK_FALSE(is_path_within("/srv", "/srv/app", false));
    CHECK_FALSE(is_path_within("/srv/app/../other", "/srv/app", false));

    SECTION("case sensitivity follows the flag") {
        CHECK_FALSE(is_path_within("/SRV/App/x", "/srv/app", false));
        CHECK(is_path_within("/SRV/App/x", "/srv/app", true));
    }
}

TEST_CASE("SecurityBoundary::contains checks base and allowed dirs", "[security][boundary]") {
    SecurityBoundary boundary{
        .base_dir = "/srv/app",
        .allowed_dirs = {"/srv/shared", "/opt/tools"},
        .case_insensitive = false,
    };
    CHECK(boundary.contains("/srv/app/src"));
    CHECK(boundary.contains("/srv/shared"));
    CHECK(boundary.contains("/opt/tools/bin/x"));
    CHECK_FALSE(boundary.contains("/opt"));
    CHECK_FALSE(boundary.contains("/etc/passwd"));
}

TEST_CASE("make_boundary canonicalizes directories", "[security][boundary]") {
    warden::test::TmpDir tmp("boundary");
    std::filesystem::create_directories(tmp.path / "real");
    std::filesystem::create_symlink(tmp.path / "real", tmp.path / "alias");

    warden::BoundaryConfig cfg;
    cfg.base_dir = (tmp.path / "alias").string();
    cfg.allowed_dirs = {(tmp.path / "shared" / ".." / "other").string()};

    auto boundary = make_boundary(cfg);
    REQUIRE(boundary.has_value());
    CHECK(boundary->base_dir == (tmp.path / "real").string());
    REQUIRE(boundary->allowed_dirs.size() == 1);
    CHECK(boundary->allowed_dirs[0] == (tmp.path / "other").string());
    CHECK(boundary->max_path_length == warden::kDefaultMaxPathLength);

    SECTION("empty base means the current directory") {
        auto cwd_boundary = make_boundary(warden::BoundaryConfig{});
        REQUIRE(cwd_boundary.has_value());
        CHECK(cwd_boundary->base_dir ==
              std::filesystem::canonical(std::filesystem::current_path()).string());
    }

    SECTION("explicit case sensitivity wins over the platform default") {
        cfg.case_insensitive = true;
        auto ci = make_boundary(cfg);
        REQUIRE(ci.has_value());
        CHECK(ci->case_insensitive);
    }
}
