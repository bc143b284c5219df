#include "warden/security/command_sanitizer.hpp"

#include <algorithm>
#include <array>
#include <regex>

#include <boost/asio/this_coro.hpp>

#include "warden/core/logger.hpp"
#include "warden/core/utils.hpp"
#include "warden/infra/offload.hpp"
#include "warden/infra/process.hpp"

namespace warden::security {

namespace {

using Clock = std::chrono::steady_clock;

constexpr int kSpawnFailureExitCode = 127;
constexpr std::size_t kMaxLoggedArgLength = 64;

auto first_metacharacter(std::string_view arg) -> std::optional<char> {
    auto pos = arg.find_first_of(kShellMetacharacters);
    if (pos == std::string_view::npos) return std::nullopt;
    return arg[pos];
}

} // anonymous namespace

auto mask_sensitive_arg(std::string_view arg) -> std::string {
    if (arg.size() <= 8) {
        return "[REDACTED]";
    }
    return utils::sanitize_for_log(arg.substr(0, 3)) + "..." +
           utils::sanitize_for_log(arg.substr(arg.size() - 3));
}

auto mask_command_for_logging(std::string_view raw_command) -> std::string {
    static const std::array<std::regex, 6> patterns = {
        std::regex(R"((--token[=\s]+)\S+)", std::regex::icase),
        std::regex(R"((--password[=\s]+)\S+)", std::regex::icase),
        std::regex(R"((--key[=\s]+)\S+)", std::regex::icase),
        std::regex(R"((--secret[=\s]+)\S+)", std::regex::icase),
        std::regex(R"(([A-Za-z_]*TOKEN[=\s]+)\S+)", std::regex::icase),
        std::regex(R"(([A-Za-z_]*KEY[=\s]+)\S+)", std::regex::icase),
    };

    std::string masked(raw_command);
    for (const auto& pattern : patterns) {
        masked = std::regex_replace(masked, pattern, "$1[REDACTED]");
    }
    return masked;
}

CommandSanitizer::CommandSanitizer(CommandSanitizerOptions options)
    : options_(std::move(options)) {
    LOG_DEBUG("CommandSanitizer: {} whitelisted commands, strict_mode={}",
              options_.whitelist.size(), options_.strict_mode);
}

auto CommandSanitizer::is_allowed(std::string_view command) const -> bool {
    return options_.whitelist.is_allowed(command);
}

auto CommandSanitizer::validate_command(std::string_view base,
                                        const std::vector<std::string>& args) const
    -> Result<SanitizedCommand> {
    if (!options_.whitelist.is_allowed(base)) {
        auto err = command_not_allowed_error(utils::sanitize_for_log(base, kMaxLoggedArgLength),
                                             "Command not in whitelist");
        audit_blocked(base, "validate", err);
        return std::unexpected(std::move(err));
    }

    const auto* rule = options_.whitelist.rule(base);

    if (!args.empty() && rule->subcommands &&
        !options_.whitelist.is_subcommand_allowed(base, args.front())) {
        auto sub = utils::sanitize_for_log(args.front(), kMaxLoggedArgLength);
        auto err = command_not_allowed_error(
            std::string(base) + " " + sub,
            "Subcommand '" + sub + "' not allowed for '" + std::string(base) + "'");
        audit_blocked(base, sub, err);
        return std::unexpected(std::move(err));
    }

    if (rule->max_args && args.size() > *rule->max_args) {
        auto err = make_error(ErrorCode::CommandInjection, "Too many arguments",
            std::to_string(args.size()) + " (max: " + std::to_string(*rule->max_args) + ")");
        audit_blocked(base, "validate", err);
        return std::unexpected(std::move(err));
    }

    SanitizedCommand command;
    command.base_command = std::string(base);
    command.args.reserve(args.size());
    for (const auto& arg : args) {
        auto sanitized = check_argument(arg, base);
        if (!sanitized) {
            audit_blocked(base, "validate", sanitized.error());
            return std::unexpected(sanitized.error());
        }
        command.args.push_back(std::move(*sanitized));
    }

    if (rule->subcommands && !command.args.empty()) {
        command.sub_command = command.args.front();
    }
    command.raw_command = command.base_command;
    if (!command.args.empty()) {
        command.raw_command += " " + utils::join(command.args, " ");
    }
    return command;
}

auto CommandSanitizer::check_argument(std::string_view arg, std::string_view context_command) const
    -> Result<std::string> {
    if (arg.find('\0') != std::string_view::npos) {
        return std::unexpected(command_injection_error(mask_sensitive_arg(arg), "null byte"));
    }
    if (arg.find_first_of("\r\n") != std::string_view::npos) {
        return std::unexpected(command_injection_error(mask_sensitive_arg(arg), "newline"));
    }
    if (options_.strict_mode) {
        if (auto c = first_metacharacter(arg)) {
            return std::unexpected(command_injection_error(mask_sensitive_arg(arg), std::string(1, *c)));
        }
        return std::string(arg);
    }

    // Non-strict: "--flag=value" values are still screened unless the command
    // takes arbitrary arguments.
    const auto* rule = context_command.empty() ? nullptr : options_.whitelist.rule(context_command);
    if (rule != nullptr && !rule->allow_arbitrary_args &&
        arg.starts_with("--") && arg.find('=') != std::string_view::npos) {
        auto value = arg.substr(arg.find('=') + 1);
        if (auto c = first_metacharacter(value)) {
            return std::unexpected(command_injection_error(mask_sensitive_arg(value), std::string(1, *c)));
        }
    }
    return std::string(arg);
}

auto CommandSanitizer::sanitize_argument(std::string_view arg,
                                         std::string_view context_command) const
    -> Result<std::string> {
    auto result = check_argument(arg, context_command);
    if (!result) {
        audit_blocked(context_command.empty() ? std::string_view("argument") : context_command,
                      "sanitize_argument", result.error());
    }
    return result;
}

auto CommandSanitizer::validate_argument_shape(std::string_view command,
                                               std::string_view pattern_name,
                                               std::string_view value) const -> Result<std::string> {
    auto matched = options_.whitelist.matches_pattern(command, pattern_name, value);
    if (!matched) return std::unexpected(matched.error());
    if (!*matched) {
        auto err = validation_error("argument '" + std::string(pattern_name) + "' for '" +
                                    std::string(command) + "' does not match the allowed shape: " +
                                    mask_sensitive_arg(value));
        audit_blocked(command, pattern_name, err);
        return std::unexpected(std::move(err));
    }
    return std::string(value);
}

auto CommandSanitizer::execute(const SanitizedCommand& command,
                               const ExecOptions& options,
                               std::stop_token stop) const -> CommandExecResult {
    infra::ProcessSpec spec;
    spec.program = command.base_command;
    spec.args = command.args;
    spec.cwd = options.cwd;
    spec.timeout = options.timeout.value_or(options_.default_timeout);
    spec.max_output_bytes = options.max_output_bytes.value_or(options_.max_output_bytes);

    CommandExecResult result;
    result.command = mask_command_for_logging(command.raw_command);
    LOG_DEBUG("Executing: {}", result.command);

    auto start = Clock::now();
    auto outcome = infra::run_process(spec, stop);
    result.duration_ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        Clock::now() - start).count();

    std::optional<std::string> error;
    if (!outcome) {
        error = outcome.error().what();
        result.exit_code = kSpawnFailureExitCode;
        result.stderr_text = *error;
    } else {
        result.stdout_text = std::move(outcome->stdout_text);
        result.stderr_text = std::move(outcome->stderr_text);
        result.exit_code = outcome->exit_code;
        result.timed_out = outcome->timed_out;

        if (outcome->timed_out) {
            error = "Command timed out after " + std::to_string(spec.timeout.count()) + "ms";
        } else if (outcome->cancelled) {
            error = "Command cancelled";
        } else if (outcome->term_signal) {
            error = "Command terminated by signal " + std::to_string(*outcome->term_signal);
        } else if (outcome->exit_code.value_or(-1) != 0) {
            error = "Command failed with exit code " + std::to_string(outcome->exit_code.value_or(-1));
        }
        if (outcome->output_truncated) {
            LOG_WARN("Output of {} truncated at {} bytes", command.base_command, spec.max_output_bytes);
        }
    }
    result.success = !error.has_value();

    if (result.success) {
        LOG_DEBUG("Completed {} in {}ms", command.base_command, result.duration_ms);
    } else {
        LOG_WARN("{} failed after {}ms: {}", command.base_command, result.duration_ms, *error);
    }

    audit_execution(command, result, std::move(error));
    return result;
}

auto CommandSanitizer::execute_command(std::string_view base,
                                       const std::vector<std::string>& args,
                                       const ExecOptions& options,
                                       std::stop_token stop) const
    -> Result<CommandExecResult> {
    auto command = validate_command(base, args);
    if (!command) return std::unexpected(command.error());
    return execute(*command, options, std::move(stop));
}

auto CommandSanitizer::exec_git(const std::vector<std::string>& args, const ExecOptions& options,
                                std::stop_token stop) const -> Result<CommandExecResult> {
    return execute_command("git", args, options, std::move(stop));
}

auto CommandSanitizer::exec_gh(const std::vector<std::string>& args, const ExecOptions& options,
                               std::stop_token stop) const -> Result<CommandExecResult> {
    return execute_command("gh", args, options, std::move(stop));
}

auto CommandSanitizer::exec_npm(const std::vector<std::string>& args, const ExecOptions& options,
                                std::stop_token stop) const -> Result<CommandExecResult> {
    return execute_command("npm", args, options, std::move(stop));
}

auto CommandSanitizer::blocking_executor() const -> awaitable<boost::asio::any_io_executor> {
    if (options_.blocking_executor) {
        co_return *options_.blocking_executor;
    }
    co_return co_await boost::asio::this_coro::executor;
}

auto CommandSanitizer::execute_command_async(std::string base,
                                             std::vector<std::string> args,
                                             ExecOptions options,
                                             std::stop_token stop) const
    -> awaitable<Result<CommandExecResult>> {
    auto command = validate_command(base, args);
    if (!command) {
        co_return make_fail(command.error());
    }
    if (stop.stop_requested()) {
        co_return make_fail(make_error(ErrorCode::Cancelled, "Command cancelled", base));
    }

    auto executor = co_await blocking_executor();
    auto result = co_await infra::offload(executor,
        [this, cmd = std::move(*command), options = std::move(options), stop]() {
            return execute(cmd, options, stop);
        });

    // run_process has already killed and reaped the child by the time it returns.
    if (stop.stop_requested()) {
        co_return make_fail(make_error(ErrorCode::Cancelled, "Command cancelled", base));
    }
    co_return Result<CommandExecResult>(std::move(result));
}

auto CommandSanitizer::execute_from_string(std::string_view command_line,
                                           const ExecOptions& options,
                                           std::stop_token stop) const
    -> Result<CommandExecResult> {
    auto parsed = parse_command_string(command_line);
    if (parsed.command.empty()) {
        return std::unexpected(validation_error("empty command line"));
    }

    if (!is_allowed(parsed.command)) {
        auto screened = validate_config_command(command_line);
        auto reason = screened ? std::string("Command not in whitelist")
                               : std::string(screened.error().detail());
        auto err = command_not_allowed_error(
            utils::sanitize_for_log(parsed.command, kMaxLoggedArgLength), reason);
        audit_blocked(parsed.command, "execute_from_string", err);
        return std::unexpected(std::move(err));
    }

    return execute_command(parsed.command, parsed.args, options, std::move(stop));
}

auto CommandSanitizer::parse_command_string(std::string_view command_line) -> ParsedCommand {
    static const std::array<std::regex, 4> redirections = {
        std::regex(R"(\s+2>&1\s*)"),
        std::regex(R"(\s+2>/dev/null\s*)"),
        std::regex(R"(\s+>/dev/null\s*)"),
        std::regex(R"(\s+2>\s*\S+)"),
    };

    std::string cleaned(command_line);
    for (const auto& re : redirections) {
        cleaned = std::regex_replace(cleaned, re, " ");
    }
    cleaned = utils::trim(cleaned);

    std::vector<std::string> tokens;
    std::string current;
    bool in_single = false;
    bool in_double = false;

    for (std::size_t i = 0; i < cleaned.size(); ++i) {
        char c = cleaned[i];
        if (c == '\\' && i + 1 < cleaned.size() && !in_single) {
            current += cleaned[++i];
        } else if (c == '\'' && !in_double) {
            in_single = !in_single;
        } else if (c == '"' && !in_single) {
            in_double = !in_double;
        } else if (c == ' ' && !in_single && !in_double) {
            if (!current.empty()) {
                tokens.push_back(std::move(current));
                current.clear();
            }
        } else {
            current += c;
        }
    }
    if (!current.empty()) {
        tokens.push_back(std::move(current));
    }

    ParsedCommand parsed;
    if (!tokens.empty()) {
        parsed.command = tokens.front();
        parsed.args.assign(tokens.begin() + 1, tokens.end());
    }
    return parsed;
}

auto CommandSanitizer::validate_config_command(std::string_view command_line) -> Result<ParsedCommand> {
    static const std::array<std::regex, 7> dangerous = {
        std::regex(R"(;\s*rm\s)", std::regex::icase),
        std::regex(R"(\|\s*bash)", std::regex::icase),
        std::regex(R"(\$\()", std::regex::icase),
        std::regex(R"(`[^`]+`)", std::regex::icase),
        std::regex(R"(>\s*/etc)", std::regex::icase),
        std::regex(R"(curl\s+.+\|\s*(sh|bash))", std::regex::icase),
        std::regex(R"(wget\s+.+-O\s*-\s*\|)", std::regex::icase),
    };

    std::string line(command_line);
    for (const auto& re : dangerous) {
        if (std::regex_search(line, re)) {
            return std::unexpected(validation_error("Dangerous command pattern detected"));
        }
    }
    if (line.find_first_of("`$") != std::string::npos) {
        return std::unexpected(validation_error("Command substitution characters not allowed"));
    }
    return parse_command_string(command_line);
}

auto CommandSanitizer::escape_for_parser(std::string_view content) -> std::string {
    std::string escaped;
    escaped.reserve(content.size());
    for (char c : content) {
        if (c == '\\' || c == '"') escaped += '\\';
        escaped += c;
    }
    return escaped;
}

void CommandSanitizer::audit_blocked(std::string_view base, std::string_view action,
                                     const Error& error) const {
    LOG_WARN("Command blocked ({}): {}", error_code_to_string(error.code()), error.what());
    if (!options_.audit) return;
    try {
        options_.audit->log_command_execution(
            options_.actor,
            utils::sanitize_for_log(base, kMaxLoggedArgLength),
            utils::sanitize_for_log(action, kMaxLoggedArgLength),
            audit::AuditResult::Blocked,
            {
                {"code", std::string(error_code_to_string(error.code()))},
                {"error", error.what()},
            });
    } catch (const std::exception& e) {
        LOG_ERROR("Audit sink failed while recording blocked command: {}", e.what());
    }
}

void CommandSanitizer::audit_execution(const SanitizedCommand& command,
                                       const CommandExecResult& result,
                                       std::optional<std::string> error) const {
    if (!options_.audit) return;

    std::string action = command.sub_command.value_or(
        command.args.empty() ? std::string("execute") : command.args.front());

    try {
        json details = {
            {"rawCommand", result.command},
            {"durationMs", result.duration_ms},
        };
        if (result.exit_code) details["exitCode"] = *result.exit_code;
        if (error) details["error"] = *error;

        options_.audit->log_command_execution(
            options_.actor, command.base_command, mask_command_for_logging(action),
            result.success ? audit::AuditResult::Success : audit::AuditResult::Failure,
            std::move(details));
    } catch (const std::exception& e) {
        LOG_ERROR("Audit sink failed while recording command execution: {}", e.what());
    }
}

} // namespace warden::security
