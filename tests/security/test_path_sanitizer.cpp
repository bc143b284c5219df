#include <catch2/catch_test_macros.hpp>

#include <memory>
#include <string>

#include "warden/security/path_sanitizer.hpp"
#include "../support/test_helpers.hpp"

using namespace warden::security;
using warden::test::RecordingSink;
using warden::test::ThrowingSink;

namespace {

auto make_sanitizer(std::shared_ptr<warden::audit::AuditSink> sink = nullptr,
                    std::vector<std::string> allowed = {}) -> PathSanitizer {
    SecurityBoundary boundary{
        .base_dir = "/srv/app",
        .allowed_dirs = std::move(allowed),
        .case_insensitive = false,
        .max_path_length = 128,
    };
    return PathSanitizer(std::move(boundary), PathSanitizerOptions{.audit = std::move(sink), .actor = "tester"});
}

auto reason_of(const SanitizationResult& r) -> PathRejectionReason {
    REQUIRE_FALSE(r.has_value());
    return r.error().reason;
}

} // namespace

// ---------------------------------------------------------------------------
// Accepted paths
// ---------------------------------------------------------------------------

TEST_CASE("Relative path resolves under the base directory", "[security][path]") {
    auto sanitizer = make_sanitizer();
    auto result = sanitizer.sanitize("src/index.ts");
    REQUIRE(result.has_value());
    CHECK(*result == "/srv/app/src/index.ts");
}

TEST_CASE("Redundant separators and dot components are normalized", "[security][path]") {
    auto sanitizer = make_sanitizer();
    auto result = sanitizer.sanitize("./src//lib/./util.ts");
    REQUIRE(result.has_value());
    CHECK(*result == "/srv/app/src/lib/util.ts");
}

TEST_CASE("Sanitizing is idempotent", "[security][path]") {
    auto sanitizer = make_sanitizer();
    for (const char* input : {"src/index.ts", "a/b/c", "/srv/app", "/srv/app/docs/readme.md"}) {
        auto once = sanitizer.sanitize(input);
        REQUIRE(once.has_value());
        auto twice = sanitizer.sanitize(*once);
        REQUIRE(twice.has_value());
        CHECK(*twice == *once);
    }
}

TEST_CASE("Absolute path inside an allowed directory is accepted", "[security][path]") {
    auto sanitizer = make_sanitizer(nullptr, {"/srv/shared"});
    auto result = sanitizer.sanitize("/srv/shared/data.json");
    REQUIRE(result.has_value());
    CHECK(*result == "/srv/shared/data.json");
}

TEST_CASE("Sanitizing stays idempotent when the base directory has unusual names",
          "[security][path]") {
    for (const char* base : {"/srv/aux/repo", "/srv/a:b/repo", "/srv/v1../repo", "/srv/con"}) {
        INFO(base);
        PathSanitizer sanitizer(SecurityBoundary{.base_dir = base, .case_insensitive = false});
        auto once = sanitizer.sanitize("src/index.ts");
        REQUIRE(once.has_value());
        CHECK(*once == std::string(base) + "/src/index.ts");
        auto twice = sanitizer.sanitize(*once);
        REQUIRE(twice.has_value());
        CHECK(*twice == *once);
        CHECK(sanitizer.is_valid(*once));
    }
}

TEST_CASE("Input below an unusual base directory is still checked", "[security][path]") {
    PathSanitizer sanitizer(SecurityBoundary{
        .base_dir = "/srv/aux/repo",
        .allowed_dirs = {"/srv/aux/repo/vendor:x"},
        .case_insensitive = false,
    });
    CHECK(reason_of(sanitizer.sanitize("/srv/aux/repo/../repo2/x")) == PathRejectionReason::TraversalAttempt);
    CHECK(reason_of(sanitizer.sanitize("/srv/aux/repo/docs/aux")) == PathRejectionReason::InvalidComponent);
    CHECK(reason_of(sanitizer.sanitize("/srv/aux/repo/a<b")) == PathRejectionReason::InvalidCharacters);
    CHECK(reason_of(sanitizer.sanitize("/srv/aux/repository/x")) == PathRejectionReason::InvalidComponent);
    CHECK(sanitizer.sanitize("/srv/aux/repo/vendor:x/lib.js").has_value());
}

TEST_CASE("Dot-only inputs are rejected", "[security][path]") {
    auto sanitizer = make_sanitizer();
    CHECK(reason_of(sanitizer.sanitize(".")) == PathRejectionReason::InvalidComponent);
    CHECK(reason_of(sanitizer.sanitize("./.")) == PathRejectionReason::InvalidComponent);
}

TEST_CASE("Names containing two dots are not traversal", "[security][path]") {
    auto sanitizer = make_sanitizer();
    CHECK(sanitizer.sanitize("foo..bar").has_value());
    CHECK(sanitizer.sanitize("v1..2/notes.txt").has_value());
}

// ---------------------------------------------------------------------------
// Rejected paths
// ---------------------------------------------------------------------------

TEST_CASE("Empty and whitespace paths are rejected", "[security][path]") {
    auto sanitizer = make_sanitizer();
    CHECK(reason_of(sanitizer.sanitize("")) == PathRejectionReason::EmptyPath);
    CHECK(reason_of(sanitizer.sanitize("   ")) == PathRejectionReason::EmptyPath);
}

TEST_CASE("Any path with a NUL byte is rejected", "[security][path]") {
    auto sanitizer = make_sanitizer();
    std::string input("src/index.ts\0.png", 17);
    CHECK(PathSanitizer::contains_null_byte(input));
    CHECK(reason_of(sanitizer.sanitize(input)) == PathRejectionReason::NullByte);
    CHECK_FALSE(sanitizer.is_valid(input));
}

TEST_CASE("Overlong paths are rejected", "[security][path]") {
    auto sanitizer = make_sanitizer();
    std::string input(129, 'a');
    CHECK(reason_of(sanitizer.sanitize(input)) == PathRejectionReason::PathTooLong);
}

TEST_CASE("Control and reserved characters are rejected", "[security][path]") {
    auto sanitizer = make_sanitizer();
    for (const char* input : {"a<b", "a>b", "c:d", "q\"x", "p|q", "what?", "star*", "tab\there"}) {
        CHECK(reason_of(sanitizer.sanitize(input)) == PathRejectionReason::InvalidCharacters);
    }
}

TEST_CASE("Traversal sequences are rejected", "[security][path]") {
    auto sanitizer = make_sanitizer();
    for (const char* input : {"../etc/passwd", "a/../../b", "src/..", "..", "..\\windows", "a/b/../c"}) {
        CHECK(reason_of(sanitizer.sanitize(input)) == PathRejectionReason::TraversalAttempt);
    }
    CHECK_FALSE(sanitizer.is_valid("../x"));
}

TEST_CASE("Invalid components are rejected", "[security][path]") {
    auto sanitizer = make_sanitizer();
    CHECK(reason_of(sanitizer.sanitize("...")) == PathRejectionReason::InvalidComponent);
    CHECK(reason_of(sanitizer.sanitize("docs/CON")) == PathRejectionReason::InvalidComponent);
    CHECK(reason_of(sanitizer.sanitize("lpt9")) == PathRejectionReason::InvalidComponent);
    CHECK(sanitizer.sanitize("console").has_value());
}

TEST_CASE("Paths outside every boundary directory are rejected", "[security][path]") {
    auto sanitizer = make_sanitizer(nullptr, {"/srv/shared"});
    CHECK(reason_of(sanitizer.sanitize("/etc/passwd")) == PathRejectionReason::OutsideBoundary);
    CHECK(reason_of(sanitizer.sanitize("/srv/app-evil/x")) == PathRejectionReason::OutsideBoundary);
    CHECK(reason_of(sanitizer.sanitize("/srv")) == PathRejectionReason::OutsideBoundary);
}

TEST_CASE("sanitize_or_error maps rejections to PathTraversal", "[security][path]") {
    auto sanitizer = make_sanitizer();
    auto result = sanitizer.sanitize_or_error("../../etc/shadow");
    REQUIRE_FALSE(result.has_value());
    CHECK(result.error().code() == warden::ErrorCode::PathTraversal);
    CHECK(result.error().detail().find("base=/srv/app") != std::string_view::npos);
}

TEST_CASE("sanitize_many keeps input order", "[security][path]") {
    auto sanitizer = make_sanitizer();
    auto results = sanitizer.sanitize_many({"a.txt", "../b", "c/d"});
    REQUIRE(results.size() == 3);
    CHECK(results[0].has_value());
    CHECK_FALSE(results[1].has_value());
    CHECK(results[2].has_value());
}

TEST_CASE("Case-insensitive boundaries compare lowercased", "[security][path]") {
    PathSanitizer sanitizer(SecurityBoundary{.base_dir = "/Srv/App", .case_insensitive = true});
    CHECK(sanitizer.sanitize("/srv/app/x.txt").has_value());
    CHECK(sanitizer.case_insensitive());
}

TEST_CASE("The first failing check decides the reason", "[security][path]") {
    auto sanitizer = make_sanitizer();

    std::string long_with_nul(5000, 'a');
    long_with_nul += '\0';
    CHECK(reason_of(sanitizer.sanitize(long_with_nul)) == PathRejectionReason::NullByte);
    CHECK(reason_of(sanitizer.sanitize(std::string("../\0", 4))) == PathRejectionReason::NullByte);

    std::string long_with_bracket(200, 'a');
    long_with_bracket[10] = '<';
    CHECK(reason_of(sanitizer.sanitize(long_with_bracket)) == PathRejectionReason::PathTooLong);

    CHECK(reason_of(sanitizer.sanitize("a<b/../c")) == PathRejectionReason::InvalidCharacters);
    CHECK(reason_of(sanitizer.sanitize("../con")) == PathRejectionReason::TraversalAttempt);
    CHECK(reason_of(sanitizer.sanitize("/etc/con")) == PathRejectionReason::InvalidComponent);
}

TEST_CASE("Traversal helpers", "[security][path]") {
    CHECK(has_traversal_pattern("../x"));
    CHECK(has_traversal_pattern("x/.."));
    CHECK(has_traversal_pattern("x\\..\\y"));
    CHECK_FALSE(has_traversal_pattern("x..y"));
    CHECK_FALSE(has_traversal_pattern(".hidden"));

    CHECK(is_invalid_component("."));
    CHECK(is_invalid_component("nul"));
    CHECK(is_invalid_component("COM3"));
    CHECK(is_invalid_component(std::string(256, 'n')));
    CHECK_FALSE(is_invalid_component("COM0"));
    CHECK_FALSE(is_invalid_component(".env"));

    CHECK(path_rejection_reason_to_string(PathRejectionReason::OutsideBoundary) == "OUTSIDE_BOUNDARY");
}

// ---------------------------------------------------------------------------
// Audit
// ---------------------------------------------------------------------------

TEST_CASE("Rejections are reported to the audit sink", "[security][path][audit]") {
    auto sink = std::make_shared<RecordingSink>();
    auto sanitizer = make_sanitizer(sink);

    CHECK_FALSE(sanitizer.sanitize("../etc/passwd").has_value());
    CHECK(sanitizer.sanitize("ok.txt").has_value());

    auto events = sink->events();
    REQUIRE(events.size() == 1);
    const auto& event = events.front();
    CHECK(event.type == warden::audit::AuditEventType::SecurityViolation);
    CHECK(event.resource == "path_traversal_attempt");
    CHECK(event.action == "attempt");
    CHECK(event.actor == "tester");
    CHECK(event.result == warden::audit::AuditResult::Blocked);
    CHECK(event.details["reasonCode"] == "TRAVERSAL_ATTEMPT");
    CHECK(event.details["baseDir"] == "/srv/app");
}

TEST_CASE("Audited input is truncated and stripped of control characters",
          "[security][path][audit]") {
    auto sink = std::make_shared<RecordingSink>();
    PathSanitizer sanitizer(SecurityBoundary{.base_dir = "/srv/app", .case_insensitive = false},
                            PathSanitizerOptions{.audit = sink});

    std::string input = "line\nbreak/" + std::string(300, 'x');
    auto result = sanitizer.sanitize(input);
    REQUIRE_FALSE(result.has_value());
    CHECK(result.error().reason == PathRejectionReason::InvalidCharacters);

    auto events = sink->events();
    REQUIRE(events.size() == 1);
    auto logged = events.front().details["inputPath"].get<std::string>();
    CHECK(logged.size() == 200);
    CHECK(logged.starts_with("line?break/xxx"));
    CHECK(logged.find('\n') == std::string::npos);
}

TEST_CASE("is_valid does not audit", "[security][path][audit]") {
    auto sink = std::make_shared<RecordingSink>();
    auto sanitizer = make_sanitizer(sink);
    CHECK_FALSE(sanitizer.is_valid("../x"));
    CHECK(sink->events().empty());
}

TEST_CASE("A failing audit sink does not change the decision", "[security][path][audit]") {
    auto sanitizer = make_sanitizer(std::make_shared<ThrowingSink>());
    auto result = sanitizer.sanitize("../etc/passwd");
    REQUIRE_FALSE(result.has_value());
    CHECK(result.error().reason == PathRejectionReason::TraversalAttempt);
    CHECK(sanitizer.sanitize("fine.txt").has_value());
}
