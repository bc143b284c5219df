#include <catch2/catch_test_macros.hpp>

#include <filesystem>
#include <fstream>

#include <sys/stat.h>

#include "warden/audit/audit_logger.hpp"
#include "../support/test_helpers.hpp"

namespace fs = std::filesystem;
using namespace warden::audit;
using warden::test::TmpDir;

namespace {

auto audit_files(const fs::path& dir) -> std::size_t {
    std::size_t n = 0;
    for (const auto& entry : fs::directory_iterator(dir)) {
        if (entry.path().extension() == ".jsonl") ++n;
    }
    return n;
}

auto event(std::string resource) -> AuditEvent {
    return AuditEvent{
        .type = AuditEventType::SecurityViolation,
        .actor = "tester",
        .resource = std::move(resource),
        .action = "attempt",
        .result = AuditResult::Blocked,
    };
}

} // namespace

TEST_CASE("AuditEntry JSON shape", "[audit]") {
    AuditEntry entry{
        .timestamp = "2026-01-01T00:00:00.000Z",
        .correlation_id = "c-1",
        .session_id = "s-1",
        .event = event("path_traversal_attempt"),
    };
    json j = entry;
    CHECK(j["correlationId"] == "c-1");
    CHECK(j["sessionId"] == "s-1");
    CHECK(j["type"] == "security_violation");
    CHECK(j["result"] == "blocked");
    CHECK_FALSE(j.contains("details"));

    entry.event.details = {{"inputPath", "../x"}};
    json with_details = entry;
    auto back = with_details.get<AuditEntry>();
    CHECK(back.event.resource == "path_traversal_attempt");
    CHECK(back.event.details["inputPath"] == "../x");
    CHECK(back.correlation_id == "c-1");
}

TEST_CASE("AuditSink helpers build the expected events", "[audit]") {
    warden::test::RecordingSink sink;
    sink.log_security_violation("symlink_escape", "agent", {{"baseDir", "/srv"}});
    sink.log_command_execution("agent", "git", "status", AuditResult::Success);
    sink.log_command_execution("agent", "rm", "validate", AuditResult::Blocked);
    sink.log_file_created("/srv/a", "agent");
    sink.log_file_modified("/srv/a", "agent");
    sink.log_file_deleted("/srv/a", "agent");
    sink.log_validation_failed("whitelist", "agent");

    auto events = sink.events();
    REQUIRE(events.size() == 7);
    CHECK(events[0].type == AuditEventType::SecurityViolation);
    CHECK(events[0].resource == "symlink_escape");
    CHECK(events[0].action == "attempt");
    CHECK(events[1].type == AuditEventType::CommandExecuted);
    CHECK(events[1].resource == "git");
    CHECK(events[2].type == AuditEventType::CommandBlocked);
    CHECK(events[3].type == AuditEventType::FileCreated);
    CHECK(events[3].resource == "/srv/a");
    CHECK(events[4].type == AuditEventType::FileModified);
    CHECK(events[5].type == AuditEventType::FileDeleted);
    CHECK(events[6].type == AuditEventType::ValidationFailed);

    CHECK(event_type_to_string(AuditEventType::CommandBlocked) == "command_blocked");
    CHECK(audit_result_to_string(AuditResult::Failure) == "failure");
}

TEST_CASE("AuditLogger writes private JSONL files", "[audit]") {
    TmpDir tmp("audit");
    auto dir = tmp.path / "logs";
    AuditLogger logger(AuditLoggerOptions{.log_dir = dir});

    logger.set_correlation_id("req-42");
    logger.log(event("first"));
    logger.log(event("second"));

    auto file = logger.current_log_file();
    REQUIRE(file.has_value());
    REQUIRE(fs::exists(*file));
    CHECK(file->filename().string().starts_with("audit-"));

    struct stat st{};
    REQUIRE(::stat(file->c_str(), &st) == 0);
    CHECK((st.st_mode & 0777) == 0600);
    REQUIRE(::stat(dir.c_str(), &st) == 0);
    CHECK((st.st_mode & 0777) == 0700);

    std::ifstream in(*file);
    std::string line;
    std::size_t lines = 0;
    while (std::getline(in, line)) {
        auto j = json::parse(line);
        CHECK(j["correlationId"] == "req-42");
        CHECK(j["sessionId"] == logger.session_id());
        ++lines;
    }
    CHECK(lines == 2);
}

TEST_CASE("recent_entries returns newest first", "[audit]") {
    TmpDir tmp("audit");
    AuditLogger logger(AuditLoggerOptions{.log_dir = tmp.path});
    for (int i = 0; i < 5; ++i) {
        logger.log(event("e" + std::to_string(i)));
    }

    auto entries = logger.recent_entries(3);
    REQUIRE(entries.size() == 3);
    CHECK(entries[0].event.resource == "e4");
    CHECK(entries[2].event.resource == "e2");

    SECTION("malformed lines are skipped") {
        std::ofstream(*logger.current_log_file(), std::ios::app) << "not json\n";
        logger.log(event("e5"));
        auto all = logger.recent_entries();
        REQUIRE(all.size() == 6);
        CHECK(all[0].event.resource == "e5");
    }
}

TEST_CASE("Correlation ids", "[audit]") {
    TmpDir tmp("audit");
    AuditLogger logger(AuditLoggerOptions{.log_dir = tmp.path});
    auto first = logger.correlation_id();
    auto next = logger.new_correlation_id();
    CHECK(first != next);
    CHECK(logger.correlation_id() == next);

    logger.set_session_id("session-a");
    CHECK(logger.session_id() == "session-a");
}

TEST_CASE("Files rotate by size and old files are pruned", "[audit]") {
    TmpDir tmp("audit");
    AuditLogger logger(AuditLoggerOptions{
        .log_dir = tmp.path,
        .max_file_size = 300,
        .max_files = 3,
    });

    for (int i = 0; i < 40; ++i) {
        logger.log(event("rotating-" + std::to_string(i)));
    }

    CHECK(audit_files(tmp.path) <= 3);
    auto newest = logger.recent_entries(1);
    REQUIRE(newest.size() == 1);
    CHECK(newest.front().event.resource == "rotating-39");

    auto across = read_audit_entries(tmp.path, 5);
    REQUIRE(across.size() == 5);
    CHECK(across[0].event.resource == "rotating-39");
    CHECK(across[4].event.resource == "rotating-35");
}

TEST_CASE("An unusable log directory never throws", "[audit]") {
    TmpDir tmp("audit");
    auto blocker = tmp.path / "file";
    std::ofstream(blocker) << "x";

    AuditLogger logger(AuditLoggerOptions{.log_dir = blocker / "logs"});
    CHECK_NOTHROW(logger.log(event("lost")));
    CHECK(logger.recent_entries().empty());
}
