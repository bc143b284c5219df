#pragma once

#include <functional>

#include <CLI/CLI.hpp>

#include "warden/core/config.hpp"

namespace warden::cli {

/// Runs a parsed subcommand against the effective configuration and
/// returns the process exit code. Subcommand callbacks only select the
/// handler; App::run invokes it once the configuration is known.
using CommandHandler = std::function<int(const Config&)>;

/// `sanitize <path>...`: string-level check of each path.
void register_sanitize_command(CLI::App& app, CommandHandler& handler);

/// `resolve <path>`: filesystem-aware resolution with the symlink policy.
void register_resolve_command(CLI::App& app, CommandHandler& handler);

/// `check-command <cmd> [args...]`: whitelist and argument validation only.
void register_check_command(CLI::App& app, CommandHandler& handler);

/// `exec [--timeout-ms N] [--cwd DIR] <cmd> [args...]`: validate and run
/// without a shell, forwarding the child's output.
void register_exec_command(CLI::App& app, CommandHandler& handler);

/// `config`: print the effective configuration or just validate it.
void register_config_command(CLI::App& app, CommandHandler& handler);

/// `audit-tail [-n N]`: most recent audit entries, newest first.
void register_audit_command(CLI::App& app, CommandHandler& handler);

/// `version`: build information.
void register_version_command(CLI::App& app, CommandHandler& handler);

} // namespace warden::cli
