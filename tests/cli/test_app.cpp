#include <catch2/catch_test_macros.hpp>

#include <filesystem>
#include <fstream>
#include <string>
#include <vector>

#include "warden/cli/app.hpp"
#include "../support/test_helpers.hpp"

using namespace warden::cli;
using warden::test::TmpDir;

namespace {

/// Runs a fresh App with the given arguments.
auto run_app(std::vector<std::string> args) -> int {
    args.insert(args.begin(), "wardenctl");
    std::vector<char*> argv;
    for (auto& a : args) argv.push_back(a.data());
    App app;
    return app.run(static_cast<int>(argv.size()), argv.data());
}

} // namespace

TEST_CASE("wardenctl exit codes", "[cli]") {
    TmpDir tmp("cli");
    auto base = tmp.str();

    SECTION("missing subcommand is a usage error") {
        CHECK(run_app({}) == kExitUsage);
    }

    SECTION("unknown policy is a usage error") {
        CHECK(run_app({"--symlink-policy", "sometimes", "version"}) == kExitUsage);
    }

    SECTION("version") {
        CHECK(run_app({"version"}) == kExitOk);
    }

    SECTION("sanitize accepts and rejects") {
        CHECK(run_app({"--no-audit", "--base-dir", base, "sanitize", "src/index.ts"}) == kExitOk);
        CHECK(run_app({"--no-audit", "--base-dir", base, "sanitize", "ok.txt", "../etc/passwd"}) ==
              kExitRejected);
    }

    SECTION("resolve applies the symlink policy") {
        std::filesystem::create_directories(tmp.path / "dir");
        std::filesystem::create_directory_symlink(tmp.path / "dir", tmp.path / "link");
        CHECK(run_app({"--no-audit", "--base-dir", base, "resolve", "link"}) == kExitOk);
        CHECK(run_app({"--no-audit", "--base-dir", base, "--symlink-policy", "deny",
                       "resolve", "link"}) == kExitRejected);
    }

    SECTION("check-command") {
        CHECK(run_app({"--no-audit", "--base-dir", base, "check-command", "git", "status", "--short"}) ==
              kExitOk);
        CHECK(run_app({"--no-audit", "--base-dir", base, "check-command", "rm", "-rf", "/"}) ==
              kExitRejected);
    }

    SECTION("exec checks --cwd with the path sanitizer and the resolver") {
        std::filesystem::create_directories(tmp.path / "a<b");
        CHECK(run_app({"--no-audit", "--base-dir", base, "exec", "--cwd", "a<b", "git", "status"}) ==
              kExitRejected);
        CHECK(run_app({"--no-audit", "--base-dir", base, "exec", "--cwd", "../", "git", "status"}) ==
              kExitRejected);
    }

    SECTION("config validation") {
        auto file = tmp.path / "cfg.json";
        std::ofstream(file) << R"({"exec": {"timeout_ms": 0}})";
        CHECK(run_app({"--config", file.string(), "config", "--validate"}) == kExitRejected);
        CHECK(run_app({"config", "--validate"}) == kExitOk);
    }

    SECTION("audit-tail reads what earlier commands recorded") {
        auto audit_dir = (tmp.path / "audit").string();
        CHECK(run_app({"--audit-dir", audit_dir, "--base-dir", base, "sanitize", "../x"}) == kExitRejected);
        CHECK(run_app({"--audit-dir", audit_dir, "audit-tail", "-n", "5"}) == kExitOk);
        CHECK_FALSE(warden::audit::read_audit_entries(audit_dir, 5).empty());
    }
}
