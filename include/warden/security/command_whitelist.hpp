#pragma once

#include <cstddef>
#include <filesystem>
#include <map>
#include <optional>
#include <regex>
#include <string>
#include <string_view>
#include <vector>

#include <nlohmann/json.hpp>

#include "warden/core/error.hpp"

namespace warden::security {

using json = nlohmann::json;

/// Characters with special meaning to a POSIX shell.
inline constexpr std::string_view kShellMetacharacters = ";&|`$\"'<>(){}[]!#*?\\";

// Named argument shapes used by the built-in whitelist.
inline constexpr std::string_view kBranchNamePattern = R"(^[a-zA-Z0-9_\-./]+$)";
inline constexpr std::string_view kSafePathPattern = R"(^[a-zA-Z0-9_\-./\s]+$)";
inline constexpr std::string_view kPackageNamePattern =
    R"(^(@[a-zA-Z0-9_-]+/)?[a-zA-Z0-9_-]+(@[a-zA-Z0-9_.\-^~>=<]+)?$)";

struct CommandRule {
    bool allowed = true;
    /// Unset: any first argument is accepted.
    std::optional<std::vector<std::string>> subcommands;
    /// Named argument shapes (ECMAScript regex), e.g. "branch" -> kBranchNamePattern.
    std::map<std::string, std::string> arg_patterns;
    std::optional<std::size_t> max_args;
    /// Skips the "--flag=value" metacharacter check in non-strict mode.
    bool allow_arbitrary_args = false;
};

void to_json(json& j, const CommandRule& r);

/// Immutable allow-list of base commands. Anything not listed is denied.
class CommandWhitelist {
public:
    /// Empty whitelist: denies every command.
    CommandWhitelist() = default;

    /// Compiles every argument pattern. Returns ValidationFailed listing all
    /// invalid entries.
    static auto create(std::map<std::string, CommandRule> rules) -> Result<CommandWhitelist>;

    [[nodiscard]] auto is_allowed(std::string_view command) const -> bool;
    [[nodiscard]] auto is_subcommand_allowed(std::string_view command, std::string_view subcommand) const -> bool;

    /// nullptr when the command is not listed.
    [[nodiscard]] auto rule(std::string_view command) const -> const CommandRule*;

    /// NotFound if the command or pattern name is unknown.
    [[nodiscard]] auto matches_pattern(std::string_view command, std::string_view pattern_name,
                                       std::string_view value) const -> Result<bool>;

    [[nodiscard]] auto commands() const -> std::vector<std::string>;
    [[nodiscard]] auto size() const -> std::size_t { return rules_.size(); }
    [[nodiscard]] auto rules() const -> const std::map<std::string, CommandRule, std::less<>>& { return rules_; }

private:
    std::map<std::string, CommandRule, std::less<>> rules_;
    std::map<std::string, std::map<std::string, std::regex, std::less<>>, std::less<>> compiled_;
};

/// git, gh, node, npm, npx, tsc, eslint, prettier, vitest and jest.
auto default_command_whitelist() -> CommandWhitelist;

/// Parses {"<command>": {"allowed": bool, "subcommands": [...],
/// "arg_patterns": {...}, "max_args": n, "allow_arbitrary_args": bool}}.
/// Every structural problem is collected into one ValidationFailed error.
auto whitelist_from_json(const json& j) -> Result<CommandWhitelist>;

auto whitelist_to_json(const CommandWhitelist& whitelist) -> json;

auto load_whitelist_file(const std::filesystem::path& path) -> Result<CommandWhitelist>;

[[nodiscard]] auto contains_shell_metacharacters(std::string_view arg) -> bool;

} // namespace warden::security
