#include "warden/cli/app.hpp"
#include "warden/core/logger.hpp"
#include "warden/core/utils.hpp"

#include <filesystem>
#include <iostream>

#ifndef WARDEN_VERSION_STRING
#define WARDEN_VERSION_STRING "0.1.0-dev"
#endif

namespace warden::cli {

App::App()
    : cli_("wardenctl", "Path, symlink and command validation for privileged operations")
{
    cli_.set_version_flag("--version", WARDEN_VERSION_STRING,
                          "Display version information");

    cli_.add_option("-c,--config", options_.config_path,
                    "Path to configuration file (JSON)")
        ->envname("WARDEN_CONFIG")
        ->check(CLI::ExistingFile);

    cli_.add_option("-b,--base-dir", options_.base_dir,
                    "Base directory of the security boundary");

    cli_.add_option("-a,--allow-dir", options_.allow_dirs,
                    "Additional allowed directory (repeatable)");

    cli_.add_option("--symlink-policy", options_.symlink_policy,
                    "Symlink policy: allow, deny or resolve")
        ->check(CLI::IsMember({"allow", "deny", "resolve"}, CLI::ignore_case));

    cli_.add_option("--log-level", options_.log_level,
                    "Log level (trace, debug, info, warn, error, critical, off)");

    cli_.add_option("--actor", options_.actor,
                    "Actor label attached to audit events");

    cli_.add_option("--audit-dir", options_.audit_dir,
                    "Directory for audit log files");

    cli_.add_flag("--no-audit", options_.no_audit,
                  "Do not write audit log files");

    cli_.require_subcommand(1);

    setup_commands();
}

App::~App() = default;

auto App::build_config() const -> Config {
    Config config = options_.config_path.empty()
        ? load_config_from_env()
        : load_config(std::filesystem::path(options_.config_path));

    if (!options_.base_dir.empty()) {
        config.boundary.base_dir = options_.base_dir;
    }
    for (const auto& dir : options_.allow_dirs) {
        config.boundary.allowed_dirs.push_back(dir);
    }
    if (!options_.symlink_policy.empty()) {
        auto policy = utils::to_lower(options_.symlink_policy);
        config.symlink_policy = policy == "allow" ? SymlinkPolicy::Allow
                              : policy == "deny" ? SymlinkPolicy::Deny
                              : SymlinkPolicy::Resolve;
    }
    if (!options_.log_level.empty()) {
        config.log_level = options_.log_level;
    }
    if (!options_.actor.empty()) {
        config.actor = options_.actor;
    }
    if (!options_.audit_dir.empty()) {
        config.audit.log_dir = options_.audit_dir;
    }
    if (options_.no_audit) {
        config.audit.enabled = false;
    }
    return config;
}

auto App::run(int argc, char** argv) -> int {
    try {
        cli_.parse(argc, argv);
    } catch (const CLI::ParseError& e) {
        int code = cli_.exit(e);
        return code == 0 ? kExitOk : kExitUsage;
    }

    // Logger first so that configuration loading can report problems.
    Logger::init("warden", options_.log_level.empty() ? "warn" : options_.log_level);

    config_ = build_config();
    if (!Logger::set_level(config_.log_level)) {
        LOG_WARN("Unknown log level '{}', using info", config_.log_level);
    }

    if (!handler_) {
        LOG_ERROR("No subcommand selected");
        return kExitUsage;
    }

    int code = handler_(config_);
    Logger::flush();
    return code;
}

auto App::cli() -> CLI::App& {
    return cli_;
}

auto App::config() const -> const Config& {
    return config_;
}

void App::setup_commands() {
    register_sanitize_command(cli_, handler_);
    register_resolve_command(cli_, handler_);
    register_check_command(cli_, handler_);
    register_exec_command(cli_, handler_);
    register_config_command(cli_, handler_);
    register_audit_command(cli_, handler_);
    register_version_command(cli_, handler_);
}

} // namespace warden::cli
