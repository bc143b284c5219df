#pragma once

#include <memory>
#include <string>
#include <vector>

#include <CLI/CLI.hpp>

#include "warden/cli/commands.hpp"
#include "warden/core/config.hpp"

namespace warden::cli {

/// Process exit codes of wardenctl.
inline constexpr int kExitOk = 0;
inline constexpr int kExitRejected = 1;
inline constexpr int kExitUsage = 2;

/// Global options that override the configuration file.
struct GlobalOptions {
    std::string config_path;
    std::string base_dir;
    std::vector<std::string> allow_dirs;
    std::string symlink_policy;
    std::string log_level;
    std::string actor;
    std::string audit_dir;
    bool no_audit = false;
};

/// Top-level CLI application.
///
/// Parses arguments with CLI11, then builds the effective configuration
/// (file or environment, then command-line overrides) and runs the selected
/// subcommand against it.
class App {
public:
    App();
    ~App();

    // Non-copyable, non-movable.
    App(const App&) = delete;
    App& operator=(const App&) = delete;

    /// Parse arguments and execute the selected subcommand.
    /// @returns Process exit code.
    auto run(int argc, char** argv) -> int;

    /// Access the underlying CLI11 app (for testing or extension).
    [[nodiscard]] auto cli() -> CLI::App&;

    /// The configuration the last run() used.
    [[nodiscard]] auto config() const -> const Config&;

private:
    void setup_commands();
    auto build_config() const -> Config;

    CLI::App cli_;
    GlobalOptions options_;
    Config config_;
    CommandHandler handler_;
};

} // namespace warden::cli
