#include "warden/cli/commands.hpp"
#include "warden/cli/app.hpp"
#include "warden/core/logger.hpp"
#include "warden/security/context.hpp"

#include <filesystem>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#ifndef WARDEN_VERSION_STRING
#define WARDEN_VERSION_STRING "0.1.0-dev"
#endif

namespace warden::cli {

using json = nlohmann::json;

namespace {

auto make_context(const Config& config) -> Result<std::unique_ptr<security::SecurityContext>> {
    auto ctx = security::SecurityContext::from_config(config);
    if (!ctx) {
        LOG_ERROR("Cannot build security context: {}", ctx.error().what());
    }
    return ctx;
}

auto error_json(const Error& e) -> json {
    json j = {
        {"code", std::string(error_code_to_string(e.code()))},
        {"message", std::string(e.message())},
    };
    if (!e.detail().empty()) {
        j["detail"] = std::string(e.detail());
    }
    return j;
}

void print(const json& j) {
    std::cout << j.dump(2) << "\n";
}

/// Splits CLI11's remaining arguments into command and arguments.
auto take_command(std::vector<std::string> rest, std::string& command,
                  std::vector<std::string>& args) -> bool {
    if (!rest.empty() && rest.front() == "--") {
        rest.erase(rest.begin());
    }
    if (rest.empty()) return false;
    command = rest.front();
    args.assign(rest.begin() + 1, rest.end());
    return true;
}

} // anonymous namespace

// ---------------------------------------------------------------------------
// sanitize command
// ---------------------------------------------------------------------------

void register_sanitize_command(CLI::App& app, CommandHandler& handler) {
    auto* sub = app.add_subcommand("sanitize", "Validate paths against the security boundary");
    auto paths = std::make_shared<std::vector<std::string>>();
    sub->add_option("paths", *paths, "Paths to check")->required();

    sub->callback([&handler, paths]() {
        handler = [paths](const Config& config) -> int {
            auto ctx = make_context(config);
            if (!ctx) return kExitUsage;

            int code = kExitOk;
            json out = json::array();
            for (const auto& path : *paths) {
                auto result = (*ctx)->paths().sanitize(path);
                if (result) {
                    out.push_back({{"input", path}, {"valid", true}, {"sanitizedPath", *result}});
                } else {
                    out.push_back({
                        {"input", path},
                        {"valid", false},
                        {"reason", std::string(security::path_rejection_reason_to_string(result.error().reason))},
                        {"error", result.error().message},
                    });
                    code = kExitRejected;
                }
            }
            print(out);
            return code;
        };
    });
}

// ---------------------------------------------------------------------------
// resolve command
// ---------------------------------------------------------------------------

void register_resolve_command(CLI::App& app, CommandHandler& handler) {
    auto* sub = app.add_subcommand("resolve", "Resolve a path and apply the symlink policy");
    auto path = std::make_shared<std::string>();
    sub->add_option("path", *path, "Path to resolve")->required();

    sub->callback([&handler, path]() {
        handler = [path](const Config& config) -> int {
            auto ctx = make_context(config);
            if (!ctx) return kExitUsage;

            const auto& resolver = (*ctx)->symlinks();
            auto info = resolver.resolve(*path);
            auto validated = resolver.validate_path(*path);

            json out = {
                {"input", info.input_path},
                {"normalizedPath", info.normalized_path},
                {"realPath", info.real_path ? json(*info.real_path) : json(nullptr)},
                {"isSymlink", info.is_symlink},
                {"isWithinBoundary", info.is_within_boundary},
                {"policy", std::string(symlink_policy_to_string(resolver.symlink_policy()))},
            };
            if (info.symlink_target) {
                out["symlinkTarget"] = *info.symlink_target;
            }
            if (validated) {
                out["valid"] = true;
                out["validatedPath"] = *validated;
            } else {
                out["valid"] = false;
                out["error"] = error_json(validated.error());
            }
            print(out);
            return validated ? kExitOk : kExitRejected;
        };
    });
}

// ---------------------------------------------------------------------------
// check-command command
// ---------------------------------------------------------------------------

void register_check_command(CLI::App& app, CommandHandler& handler) {
    auto* sub = app.add_subcommand("check-command",
                                   "Validate a command against the whitelist without running it");
    sub->prefix_command();

    sub->callback([&handler, sub]() {
        std::string command;
        std::vector<std::string> args;
        if (!take_command(sub->remaining(), command, args)) {
            throw CLI::ValidationError("check-command", "a command is required");
        }
        handler = [command, args](const Config& config) -> int {
            auto ctx = make_context(config);
            if (!ctx) return kExitUsage;

            auto result = (*ctx)->commands().validate_command(command, args);
            if (!result) {
                print({{"allowed", false}, {"error", error_json(result.error())}});
                return kExitRejected;
            }
            print({
                {"allowed", true},
                {"baseCommand", result->base_command},
                {"subCommand", result->sub_command ? json(*result->sub_command) : json(nullptr)},
                {"args", result->args},
                {"command", security::mask_command_for_logging(result->raw_command)},
            });
            return kExitOk;
        };
    });
}

// ---------------------------------------------------------------------------
// exec command
// ---------------------------------------------------------------------------

namespace {

struct ExecCommandOptions {
    std::int64_t timeout_ms = 0;
    std::string cwd;
};

} // anonymous namespace

void register_exec_command(CLI::App& app, CommandHandler& handler) {
    auto* sub = app.add_subcommand("exec", "Validate and run a whitelisted command without a shell");
    auto opts = std::make_shared<ExecCommandOptions>();
    sub->add_option("--timeout-ms", opts->timeout_ms, "Kill the command after this many milliseconds")
        ->check(CLI::PositiveNumber);
    sub->add_option("--cwd", opts->cwd, "Working directory (must be inside the boundary)");
    sub->prefix_command();

    sub->callback([&handler, sub, opts]() {
        std::string command;
        std::vector<std::string> args;
        if (!take_command(sub->remaining(), command, args)) {
            throw CLI::ValidationError("exec", "a command is required");
        }
        handler = [command, args, opts](const Config& config) -> int {
            auto ctx = make_context(config);
            if (!ctx) return kExitUsage;

            security::ExecOptions exec_options;
            if (opts->timeout_ms > 0) {
                exec_options.timeout = std::chrono::milliseconds(opts->timeout_ms);
            }
            if (!opts->cwd.empty()) {
                auto cwd = (*ctx)->inputs().validate_file_path(opts->cwd);
                if (!cwd) {
                    print({{"executed", false}, {"error", error_json(cwd.error())}});
                    return kExitRejected;
                }
                exec_options.cwd = *cwd;
            }

            auto result = (*ctx)->commands().execute_command(command, args, exec_options);
            if (!result) {
                print({{"executed", false}, {"error", error_json(result.error())}});
                return kExitRejected;
            }

            std::cout << result->stdout_text;
            std::cerr << result->stderr_text;
            std::cout.flush();
            if (result->timed_out) {
                LOG_WARN("Command timed out after {}ms: {}", result->duration_ms, result->command);
            }
            if (!result->success) {
                LOG_WARN("{} exited with {}", result->command, result->exit_code.value_or(-1));
                return kExitRejected;
            }
            return kExitOk;
        };
    });
}

// ---------------------------------------------------------------------------
// config command
// ---------------------------------------------------------------------------

void register_config_command(CLI::App& app, CommandHandler& handler) {
    auto* sub = app.add_subcommand("config", "Show or validate the effective configuration");
    auto validate_only = std::make_shared<bool>(false);
    sub->add_flag("--validate", *validate_only, "Only validate; print nothing on success");

    sub->callback([&handler, validate_only]() {
        handler = [validate_only](const Config& config) -> int {
            auto valid = validate_config(config);
            if (!valid) {
                print({{"valid", false}, {"error", error_json(valid.error())}});
                return kExitRejected;
            }
            if (*validate_only) return kExitOk;

            json j = config;
            print(j);
            return kExitOk;
        };
    });
}

// ---------------------------------------------------------------------------
// audit-tail command
// ---------------------------------------------------------------------------

void register_audit_command(CLI::App& app, CommandHandler& handler) {
    auto* sub = app.add_subcommand("audit-tail", "Print the most recent audit entries");
    auto limit = std::make_shared<std::size_t>(20);
    sub->add_option("-n,--limit", *limit, "Number of entries")
        ->check(CLI::PositiveNumber);

    sub->callback([&handler, limit]() {
        handler = [limit](const Config& config) -> int {
            auto dir = config.audit.log_dir.empty()
                ? default_data_dir() / "audit"
                : std::filesystem::path(config.audit.log_dir);
            json out = json::array();
            for (const auto& entry : audit::read_audit_entries(dir, *limit)) {
                out.push_back(entry);
            }
            print(out);
            return kExitOk;
        };
    });
}

// ---------------------------------------------------------------------------
// version command
// ---------------------------------------------------------------------------

void register_version_command(CLI::App& app, CommandHandler& handler) {
    auto* sub = app.add_subcommand("version", "Print version information");

    sub->callback([&handler]() {
        handler = [](const Config&) -> int {
            std::cout << "warden " << WARDEN_VERSION_STRING << "\n";
            std::cout << "C++ standard: " << __cplusplus << "\n";
#if defined(__clang__)
            std::cout << "Compiler: clang " << __clang_major__ << "."
                      << __clang_minor__ << "." << __clang_patchlevel__ << "\n";
#elif defined(__GNUC__)
            std::cout << "Compiler: gcc " << __GNUC__ << "."
                      << __GNUC_MINOR__ << "." << __GNUC_PATCHLEVEL__ << "\n";
#else
            std::cout << "Compiler: unknown\n";
#endif
            return kExitOk;
        };
    });
}

} // namespace warden::cli
