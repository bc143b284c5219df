#pragma once

#include <chrono>
#include <cstdint>
#include <memory>
#include <optional>
#include <stop_token>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include <boost/asio/any_io_executor.hpp>
#include <boost/asio/awaitable.hpp>

#include "warden/audit/audit_logger.hpp"
#include "warden/core/config.hpp"
#include "warden/core/error.hpp"
#include "warden/security/command_whitelist.hpp"

namespace warden::security {

using boost::asio::awaitable;

/// A command that passed validation. `raw_command` is for logging only and
/// is never parsed or executed.
struct SanitizedCommand {
    std::string base_command;
    std::optional<std::string> sub_command;
    std::vector<std::string> args;
    std::string raw_command;
};

struct ExecOptions {
    std::optional<std::string> cwd;
    std::optional<std::chrono::milliseconds> timeout;
    std::optional<std::size_t> max_output_bytes;
};

struct CommandExecResult {
    bool success = false;
    std::string stdout_text;
    std::string stderr_text;
    std::string command;                 // masked raw command
    std::optional<int> exit_code;
    std::int64_t duration_ms = 0;
    bool timed_out = false;
};

/// Result of parsing a command line from configuration.
struct ParsedCommand {
    std::string command;
    std::vector<std::string> args;
};

struct CommandSanitizerOptions {
    CommandWhitelist whitelist = default_command_whitelist();
    bool strict_mode = true;
    std::shared_ptr<audit::AuditSink> audit;
    std::string actor = "system";
    std::chrono::milliseconds default_timeout{kDefaultExecTimeoutMs};
    std::size_t max_output_bytes = kDefaultMaxOutputBytes;
    /// Where execute_command_async runs the child. Unset means the awaiting
    /// coroutine's own executor.
    std::optional<boost::asio::any_io_executor> blocking_executor;
};

/// Whitelist-based command validation and shell-free execution.
///
/// The whitelist is fixed at construction. To apply a new whitelist build a
/// new CommandSanitizer and swap it in; instances in use are never mutated.
class CommandSanitizer {
public:
    explicit CommandSanitizer(CommandSanitizerOptions options = {});

    /// CommandNotAllowed if `base` is not whitelisted or args[0] is not an
    /// allowed subcommand; CommandInjection for too many or unsafe arguments.
    [[nodiscard]] auto validate_command(std::string_view base,
                                        const std::vector<std::string>& args) const
        -> Result<SanitizedCommand>;

    /// Rejects NUL, CR/LF and, in strict mode, any shell metacharacter.
    [[nodiscard]] auto sanitize_argument(std::string_view arg,
                                         std::string_view context_command = {}) const
        -> Result<std::string>;

    /// Checks `value` against a named argument pattern of `command`'s rule.
    [[nodiscard]] auto validate_argument_shape(std::string_view command,
                                               std::string_view pattern_name,
                                               std::string_view value) const -> Result<std::string>;

    /// Validates, then runs the command with no shell. Validation failures
    /// come back as errors; a command that runs and fails is a successful
    /// Result with success == false.
    [[nodiscard]] auto execute_command(std::string_view base,
                                       const std::vector<std::string>& args,
                                       const ExecOptions& options = {},
                                       std::stop_token stop = {}) const
        -> Result<CommandExecResult>;

    /// Runs an already validated command.
    [[nodiscard]] auto execute(const SanitizedCommand& command,
                               const ExecOptions& options = {},
                               std::stop_token stop = {}) const -> CommandExecResult;

    /// Same as execute_command on the blocking executor. A stop request
    /// kills the child before Cancelled is returned.
    auto execute_command_async(std::string base,
                               std::vector<std::string> args,
                               ExecOptions options = {},
                               std::stop_token stop = {}) const
        -> awaitable<Result<CommandExecResult>>;

    /// execute_command for the tools the default whitelist is built around.
    [[nodiscard]] auto exec_git(const std::vector<std::string>& args,
                                const ExecOptions& options = {},
                                std::stop_token stop = {}) const -> Result<CommandExecResult>;
    [[nodiscard]] auto exec_gh(const std::vector<std::string>& args,
                               const ExecOptions& options = {},
                               std::stop_token stop = {}) const -> Result<CommandExecResult>;
    [[nodiscard]] auto exec_npm(const std::vector<std::string>& args,
                                const ExecOptions& options = {},
                                std::stop_token stop = {}) const -> Result<CommandExecResult>;

    /// Parses a whole command line and runs it. Commands missing from the
    /// whitelist are refused after validate_config_command has been consulted.
    [[nodiscard]] auto execute_from_string(std::string_view command_line,
                                           const ExecOptions& options = {},
                                           std::stop_token stop = {}) const
        -> Result<CommandExecResult>;

    /// Quote-aware tokenizer for command lines from configuration files.
    /// Drops "2>&1", "2>/dev/null", ">/dev/null" and "2> file" redirections.
    [[nodiscard]] static auto parse_command_string(std::string_view command_line) -> ParsedCommand;

    /// Screens a configuration command line for obvious injection. Returns
    /// the parsed command or ValidationFailed with the reason.
    [[nodiscard]] static auto validate_config_command(std::string_view command_line)
        -> Result<ParsedCommand>;

    /// Escapes backslashes and double quotes for use inside "..." given to
    /// parse_command_string.
    [[nodiscard]] static auto escape_for_parser(std::string_view content) -> std::string;

    [[nodiscard]] auto is_allowed(std::string_view command) const -> bool;
    [[nodiscard]] auto whitelist() const -> const CommandWhitelist& { return options_.whitelist; }
    [[nodiscard]] auto strict_mode() const -> bool { return options_.strict_mode; }

private:
    [[nodiscard]] auto check_argument(std::string_view arg, std::string_view context_command) const
        -> Result<std::string>;
    void audit_blocked(std::string_view base, std::string_view action,
                       const Error& error) const;
    void audit_execution(const SanitizedCommand& command, const CommandExecResult& result,
                         std::optional<std::string> error) const;
    auto blocking_executor() const -> awaitable<boost::asio::any_io_executor>;

    CommandSanitizerOptions options_;
};

/// "[REDACTED]" for 8 characters or fewer, else the first and last three.
auto mask_sensitive_arg(std::string_view arg) -> std::string;

/// Redacts the values of --token/--password/--key/--secret and *TOKEN/*KEY
/// assignments.
auto mask_command_for_logging(std::string_view raw_command) -> std::string;

} // namespace warden::security
