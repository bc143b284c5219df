#pragma once

#include <chrono>
#include <cstddef>
#include <optional>
#include <stop_token>
#include <string>
#include <vector>

#include "warden/core/error.hpp"

namespace warden::infra {

struct ProcessSpec {
    std::string program;                 // looked up on PATH when it has no '/'
    std::vector<std::string> args;       // argv[1..]
    std::optional<std::string> cwd;
    std::chrono::milliseconds timeout{300000};
    std::size_t max_output_bytes = 10 * 1024 * 1024;
    /// Time between SIGTERM and SIGKILL once the child must stop.
    std::chrono::milliseconds kill_grace{2000};
};

struct ProcessOutcome {
    std::string stdout_text;
    std::string stderr_text;
    std::optional<int> exit_code;        // unset when killed by a signal
    std::optional<int> term_signal;
    bool timed_out = false;
    bool cancelled = false;
    bool output_truncated = false;
};

/// Spawns `spec.program` with an explicit argument vector via posix_spawnp.
/// No shell is involved at any point, so arguments are never re-tokenized.
///
/// The child runs in its own process group with stdin on /dev/null. On
/// timeout or when `stop` is requested, the group gets SIGTERM and then
/// SIGKILL after `kill_grace`; the child is always reaped before returning.
///
/// Returns ProcessError if the process cannot be spawned (including a
/// missing executable).
auto run_process(const ProcessSpec& spec, std::stop_token stop = {}) -> Result<ProcessOutcome>;

} // namespace warden::infra
