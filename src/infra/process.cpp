#include "warden/infra/process.hpp"

#include <array>
#include <cerrno>
#include <csignal>
#include <cstring>
#include <thread>

#include <fcntl.h>
#include <poll.h>
#include <spawn.h>
#include <sys/wait.h>
#include <unistd.h>

#include "warden/core/logger.hpp"

extern char** environ;

namespace warden::infra {

namespace {

using Clock = std::chrono::steady_clock;

/// Owns both ends of a pipe.
struct Pipe {
    int fds[2] = {-1, -1};

    Pipe() = default;
    Pipe(const Pipe&) = delete;
    Pipe& operator=(const Pipe&) = delete;
    ~Pipe() {
        close_read();
        close_write();
    }

    auto open() -> bool { return ::pipe2(fds, O_CLOEXEC) == 0; }
    void close_read() { if (fds[0] >= 0) { ::close(fds[0]); fds[0] = -1; } }
    void close_write() { if (fds[1] >= 0) { ::close(fds[1]); fds[1] = -1; } }
};

/// Reads what is available on `fd` into `out`, keeping at most `limit` bytes.
/// Returns false on EOF or error.
auto drain(int fd, std::string& out, std::size_t limit, bool& truncated) -> bool {
    std::array<char, 8192> buf{};
    auto n = ::read(fd, buf.data(), buf.size());
    if (n < 0) {
        return errno == EINTR || errno == EAGAIN;
    }
    if (n == 0) return false;

    auto take = static_cast<std::size_t>(n);
    if (out.size() + take > limit) {
        take = limit > out.size() ? limit - out.size() : 0;
        truncated = true;
    }
    out.append(buf.data(), take);
    return true;
}

void signal_group(pid_t pid, int sig) {
    if (::kill(-pid, sig) != 0 && errno == ESRCH) {
        ::kill(pid, sig);
    }
}

auto try_reap(pid_t pid, int& status) -> bool {
    for (;;) {
        auto r = ::waitpid(pid, &status, WNOHANG);
        if (r == pid) return true;
        if (r == 0) return false;
        if (errno != EINTR) return true;  // ECHILD: nothing left to wait for
    }
}

} // anonymous namespace

auto run_process(const ProcessSpec& spec, std::stop_token stop) -> Result<ProcessOutcome> {
    if (spec.program.empty()) {
        return std::unexpected(make_error(ErrorCode::InvalidArgument, "Empty program name"));
    }

    Pipe out_pipe;
    Pipe err_pipe;
    if (!out_pipe.open() || !err_pipe.open()) {
        return std::unexpected(make_error(ErrorCode::ProcessError,
            "pipe failed", std::strerror(errno)));
    }

    posix_spawn_file_actions_t actions;
    posix_spawnattr_t attr;
    if (posix_spawn_file_actions_init(&actions) != 0) {
        return std::unexpected(make_error(ErrorCode::ProcessError, "posix_spawn_file_actions_init failed"));
    }
    if (posix_spawnattr_init(&attr) != 0) {
        posix_spawn_file_actions_destroy(&actions);
        return std::unexpected(make_error(ErrorCode::ProcessError, "posix_spawnattr_init failed"));
    }

    posix_spawn_file_actions_addopen(&actions, STDIN_FILENO, "/dev/null", O_RDONLY, 0);
    posix_spawn_file_actions_adddup2(&actions, out_pipe.fds[1], STDOUT_FILENO);
    posix_spawn_file_actions_adddup2(&actions, err_pipe.fds[1], STDERR_FILENO);
    if (spec.cwd) {
        posix_spawn_file_actions_addchdir_np(&actions, spec.cwd->c_str());
    }

    // Own process group so a timeout can take down grandchildren too.
    posix_spawnattr_setpgroup(&attr, 0);
    sigset_t default_signals;
    sigemptyset(&default_signals);
    sigaddset(&default_signals, SIGPIPE);
    posix_spawnattr_setsigdefault(&attr, &default_signals);
    posix_spawnattr_setflags(&attr, POSIX_SPAWN_SETPGROUP | POSIX_SPAWN_SETSIGDEF);

    std::vector<char*> argv;
    argv.reserve(spec.args.size() + 2);
    argv.push_back(const_cast<char*>(spec.program.c_str()));
    for (const auto& arg : spec.args) {
        argv.push_back(const_cast<char*>(arg.c_str()));
    }
    argv.push_back(nullptr);

    pid_t pid = -1;
    int rc = posix_spawnp(&pid, spec.program.c_str(), &actions, &attr, argv.data(), environ);
    posix_spawn_file_actions_destroy(&actions);
    posix_spawnattr_destroy(&attr);

    if (rc != 0) {
        return std::unexpected(make_error(ErrorCode::ProcessError,
            "Failed to spawn process", spec.program + ": " + std::strerror(rc)));
    }

    out_pipe.close_write();
    err_pipe.close_write();

    LOG_DEBUG("Spawned {} (pid {}) with {} args", spec.program, pid, spec.args.size());

    ProcessOutcome outcome;
    auto deadline = Clock::now() + spec.timeout;
    std::optional<Clock::time_point> kill_at;
    std::optional<Clock::time_point> exited_at;
    bool out_open = true;
    bool err_open = true;
    int status = 0;

    for (;;) {
        if (!exited_at) {
            if (!kill_at) {
                if (stop.stop_requested()) {
                    outcome.cancelled = true;
                } else if (Clock::now() >= deadline) {
                    outcome.timed_out = true;
                }
                if (outcome.cancelled || outcome.timed_out) {
                    LOG_WARN("Stopping {} (pid {}): {}", spec.program, pid,
                             outcome.timed_out ? "timeout" : "cancelled");
                    signal_group(pid, SIGTERM);
                    kill_at = Clock::now() + spec.kill_grace;
                }
            } else if (Clock::now() >= *kill_at) {
                signal_group(pid, SIGKILL);
                kill_at = Clock::time_point::max();
            }
        }

        if (out_open || err_open) {
            std::array<pollfd, 2> fds{{
                {out_open ? out_pipe.fds[0] : -1, POLLIN, 0},
                {err_open ? err_pipe.fds[0] : -1, POLLIN, 0},
            }};
            int pr = ::poll(fds.data(), fds.size(), 50);
            if (pr < 0 && errno != EINTR) {
                LOG_ERROR("poll failed while running {}: {}", spec.program, std::strerror(errno));
                out_open = err_open = false;
            } else if (pr > 0) {
                if (out_open && (fds[0].revents & (POLLIN | POLLHUP | POLLERR))) {
                    out_open = drain(out_pipe.fds[0], outcome.stdout_text,
                                     spec.max_output_bytes, outcome.output_truncated);
                }
                if (err_open && (fds[1].revents & (POLLIN | POLLHUP | POLLERR))) {
                    err_open = drain(err_pipe.fds[0], outcome.stderr_text,
                                     spec.max_output_bytes, outcome.output_truncated);
                }
            }
        } else if (!exited_at) {
            std::this_thread::sleep_for(std::chrono::milliseconds(10));
        }

        if (!exited_at && try_reap(pid, status)) {
            exited_at = Clock::now();
        }
        // A grandchild may keep the pipes open after the child exits; give
        // the remaining output a short window and stop reading.
        if (exited_at && ((!out_open && !err_open) ||
                          Clock::now() - *exited_at >= std::chrono::milliseconds(200))) {
            break;
        }
    }

    if (WIFEXITED(status)) {
        outcome.exit_code = WEXITSTATUS(status);
    } else if (WIFSIGNALED(status)) {
        outcome.term_signal = WTERMSIG(status);
    }

    // Grandchildren may still hold the pipes; make sure nothing of the group survives.
    if (outcome.timed_out || outcome.cancelled) {
        ::kill(-pid, SIGKILL);
    }

    return outcome;
}

} // namespace warden::infra
