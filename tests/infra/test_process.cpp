#include <catch2/catch_test_macros.hpp>

#include <chrono>
#include <csignal>
#include <stop_token>
#include <thread>

#include "warden/infra/process.hpp"
#include "warden/infra/offload.hpp"
#include "../support/test_helpers.hpp"

using namespace warden::infra;
using namespace std::chrono_literals;

TEST_CASE("run_process captures output and exit status", "[infra][process]") {
    ProcessSpec spec{.program = "printf", .args = {"%s|%s", "out", "two words"}};
    auto outcome = run_process(spec);
    REQUIRE(outcome.has_value());
    CHECK(outcome->stdout_text == "out|two words");
    CHECK(outcome->exit_code == 0);
    CHECK_FALSE(outcome->term_signal.has_value());
    CHECK_FALSE(outcome->timed_out);
}

TEST_CASE("run_process never involves a shell", "[infra][process]") {
    ProcessSpec spec{.program = "echo", .args = {"$(id)", ";", "|", "&&", "*"}};
    auto outcome = run_process(spec);
    REQUIRE(outcome.has_value());
    CHECK(outcome->stdout_text == "$(id) ; | && *\n");
}

TEST_CASE("run_process reports non-zero exits", "[infra][process]") {
    auto outcome = run_process(ProcessSpec{.program = "false"});
    REQUIRE(outcome.has_value());
    CHECK(outcome->exit_code == 1);
}

TEST_CASE("run_process fails for missing programs", "[infra][process]") {
    auto outcome = run_process(ProcessSpec{.program = "warden-no-such-program"});
    REQUIRE_FALSE(outcome.has_value());
    CHECK(outcome.error().code() == warden::ErrorCode::ProcessError);
}

TEST_CASE("run_process stdin is empty", "[infra][process]") {
    auto outcome = run_process(ProcessSpec{.program = "cat", .timeout = 5s});
    REQUIRE(outcome.has_value());
    CHECK(outcome->exit_code == 0);
    CHECK(outcome->stdout_text.empty());
}

TEST_CASE("run_process enforces the timeout", "[infra][process]") {
    ProcessSpec spec{.program = "sleep", .args = {"10"}, .timeout = 150ms, .kill_grace = 500ms};
    auto start = std::chrono::steady_clock::now();
    auto outcome = run_process(spec);
    REQUIRE(outcome.has_value());
    CHECK(outcome->timed_out);
    CHECK_FALSE(outcome->exit_code.has_value());
    CHECK(outcome->term_signal == SIGTERM);
    CHECK(std::chrono::steady_clock::now() - start < 5s);
}

TEST_CASE("run_process stops when asked", "[infra][process]") {
    std::stop_source stop;
    std::jthread canceller([&stop] {
        std::this_thread::sleep_for(100ms);
        stop.request_stop();
    });
    auto outcome = run_process(ProcessSpec{.program = "sleep", .args = {"10"}}, stop.get_token());
    REQUIRE(outcome.has_value());
    CHECK(outcome->cancelled);
    CHECK_FALSE(outcome->timed_out);
}

TEST_CASE("run_process truncates large output", "[infra][process]") {
    ProcessSpec spec{.program = "head", .args = {"-c", "100000", "/dev/zero"}, .max_output_bytes = 1000};
    auto outcome = run_process(spec);
    REQUIRE(outcome.has_value());
    CHECK(outcome->output_truncated);
    CHECK(outcome->stdout_text.size() == 1000);
}

TEST_CASE("run_process applies the working directory", "[infra][process]") {
    warden::test::TmpDir tmp("process");
    auto outcome = run_process(ProcessSpec{.program = "pwd", .cwd = tmp.str()});
    REQUIRE(outcome.has_value());
    CHECK(outcome->stdout_text == tmp.str() + "\n");
}

TEST_CASE("offload runs work on another executor", "[infra][offload]") {
    boost::asio::thread_pool pool(1);
    auto caller = std::this_thread::get_id();
    auto worker = warden::test::run_sync(
        offload(pool.get_executor(), [] { return std::this_thread::get_id(); }));
    CHECK(worker != caller);
    pool.join();
}
