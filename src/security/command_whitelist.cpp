#include "warden/security/command_whitelist.hpp"

#include <algorithm>
#include <fstream>

#include "warden/core/logger.hpp"
#include "warden/core/utils.hpp"

namespace warden::security {

namespace {

auto rule_with(std::optional<std::vector<std::string>> subcommands,
               std::map<std::string, std::string> patterns,
               std::size_t max_args,
               bool arbitrary) -> CommandRule {
    return CommandRule{
        .allowed = true,
        .subcommands = std::move(subcommands),
        .arg_patterns = std::move(patterns),
        .max_args = max_args,
        .allow_arbitrary_args = arbitrary,
    };
}

auto path_tool_rule() -> CommandRule {
    return rule_with(std::nullopt, {{"path", std::string(kSafePathPattern)}}, 30, true);
}

} // anonymous namespace

void to_json(json& j, const CommandRule& r) {
    j = json{{"allowed", r.allowed}};
    if (r.subcommands) j["subcommands"] = *r.subcommands;
    if (!r.arg_patterns.empty()) j["arg_patterns"] = r.arg_patterns;
    if (r.max_args) j["max_args"] = *r.max_args;
    if (r.allow_arbitrary_args) j["allow_arbitrary_args"] = true;
}

auto CommandWhitelist::create(std::map<std::string, CommandRule> rules) -> Result<CommandWhitelist> {
    CommandWhitelist whitelist;
    std::vector<std::string> errors;

    for (auto& [command, rule] : rules) {
        if (utils::trim(command).empty()) {
            errors.emplace_back("command names must be non-empty");
            continue;
        }
        auto& compiled = whitelist.compiled_[command];
        for (const auto& [name, pattern] : rule.arg_patterns) {
            try {
                compiled.emplace(name, std::regex(pattern, std::regex::ECMAScript));
            } catch (const std::regex_error& e) {
                errors.push_back("invalid pattern '" + name + "' for '" + command + "': " + e.what());
            }
        }
        whitelist.rules_.emplace(command, std::move(rule));
    }

    if (!errors.empty()) {
        return std::unexpected(validation_error(utils::join(errors, "; ")));
    }
    return whitelist;
}

auto CommandWhitelist::is_allowed(std::string_view command) const -> bool {
    auto* r = rule(command);
    return r != nullptr && r->allowed;
}

auto CommandWhitelist::is_subcommand_allowed(std::string_view command,
                                             std::string_view subcommand) const -> bool {
    auto* r = rule(command);
    if (r == nullptr || !r->allowed) return false;
    if (!r->subcommands) return true;
    return std::ranges::find(*r->subcommands, subcommand) != r->subcommands->end();
}

auto CommandWhitelist::rule(std::string_view command) const -> const CommandRule* {
    auto it = rules_.find(command);
    if (it == rules_.end()) return nullptr;
    return &it->second;
}

auto CommandWhitelist::matches_pattern(std::string_view command, std::string_view pattern_name,
                                       std::string_view value) const -> Result<bool> {
    auto cit = compiled_.find(command);
    if (cit == compiled_.end()) {
        return std::unexpected(make_error(ErrorCode::NotFound,
            "Command not in whitelist", std::string(command)));
    }
    auto pit = cit->second.find(pattern_name);
    if (pit == cit->second.end()) {
        return std::unexpected(make_error(ErrorCode::NotFound,
            "No argument pattern for command",
            std::string(command) + ":" + std::string(pattern_name)));
    }
    return std::regex_match(value.begin(), value.end(), pit->second);
}

auto CommandWhitelist::commands() const -> std::vector<std::string> {
    std::vector<std::string> names;
    names.reserve(rules_.size());
    for (const auto& [name, _] : rules_) {
        names.push_back(name);
    }
    return names;
}

auto default_command_whitelist() -> CommandWhitelist {
    const std::string branch(kBranchNamePattern);
    const std::string safe_path(kSafePathPattern);
    const std::string package(kPackageNamePattern);

    std::map<std::string, CommandRule> rules;
    rules["git"] = rule_with(
        std::vector<std::string>{
            "status", "add", "commit", "push", "pull", "checkout", "branch",
            "log", "diff", "fetch", "merge", "rebase", "stash", "tag", "remote",
            "config", "init", "clone", "reset", "show", "rev-parse", "ls-files",
            "symbolic-ref", "describe", "clean", "restore", "switch"},
        {{"branch", branch}, {"path", safe_path}, {"ref", branch}},
        20, false);
    rules["gh"] = rule_with(
        std::vector<std::string>{"pr", "issue", "repo", "auth", "api", "run", "workflow"},
        {{"branch", branch}, {"number", R"(^\d+$)"}},
        30, false);
    rules["node"] = rule_with(std::nullopt, {{"script", safe_path}}, 20, true);
    rules["npm"] = rule_with(
        std::vector<std::string>{
            "install", "ci", "run", "test", "build", "audit", "outdated", "ls",
            "list", "pack", "publish", "version", "init", "cache", "prune"},
        {{"package", package}, {"script", R"(^[a-zA-Z0-9_:-]+$)"}},
        20, false);
    rules["npx"] = rule_with(std::nullopt, {{"package", package}}, 20, true);
    rules["tsc"] = path_tool_rule();
    rules["eslint"] = path_tool_rule();
    rules["prettier"] = path_tool_rule();
    rules["vitest"] = path_tool_rule();
    rules["jest"] = path_tool_rule();

    auto whitelist = CommandWhitelist::create(std::move(rules));
    if (!whitelist) {
        // Only reachable if a built-in pattern fails to compile.
        LOG_FATAL("Built-in command whitelist is invalid: {}", whitelist.error().what());
        return CommandWhitelist{};
    }
    return std::move(*whitelist);
}

auto whitelist_from_json(const json& j) -> Result<CommandWhitelist> {
    if (!j.is_object()) {
        return std::unexpected(validation_error("whitelist must be an object"));
    }

    std::vector<std::string> errors;
    std::map<std::string, CommandRule> rules;

    for (const auto& [command, entry] : j.items()) {
        if (command.empty()) {
            errors.emplace_back("command names must be non-empty strings");
            continue;
        }
        if (!entry.is_object()) {
            errors.push_back("configuration for '" + command + "' must be an object");
            continue;
        }

        CommandRule rule;
        if (!entry.contains("allowed") || !entry["allowed"].is_boolean()) {
            errors.push_back("'allowed' field for '" + command + "' must be a boolean");
        } else {
            rule.allowed = entry["allowed"].get<bool>();
        }

        if (entry.contains("subcommands")) {
            const auto& subs = entry["subcommands"];
            if (!subs.is_array()) {
                errors.push_back("'subcommands' field for '" + command + "' must be an array");
            } else {
                std::vector<std::string> list;
                for (const auto& sub : subs) {
                    if (!sub.is_string()) {
                        errors.push_back("subcommands for '" + command + "' must be strings");
                        break;
                    }
                    list.push_back(sub.get<std::string>());
                }
                rule.subcommands = std::move(list);
            }
        }

        if (entry.contains("arg_patterns")) {
            const auto& patterns = entry["arg_patterns"];
            if (!patterns.is_object()) {
                errors.push_back("'arg_patterns' field for '" + command + "' must be an object");
            } else {
                for (const auto& [name, pattern] : patterns.items()) {
                    if (!pattern.is_string()) {
                        errors.push_back("pattern '" + name + "' for '" + command + "' must be a string");
                        continue;
                    }
                    rule.arg_patterns[name] = pattern.get<std::string>();
                }
            }
        }

        if (entry.contains("max_args")) {
            const auto& max = entry["max_args"];
            if (!max.is_number_unsigned()) {
                errors.push_back("'max_args' field for '" + command + "' must be a non-negative number");
            } else {
                rule.max_args = max.get<std::size_t>();
            }
        }

        if (entry.contains("allow_arbitrary_args")) {
            if (!entry["allow_arbitrary_args"].is_boolean()) {
                errors.push_back("'allow_arbitrary_args' field for '" + command + "' must be a boolean");
            } else {
                rule.allow_arbitrary_args = entry["allow_arbitrary_args"].get<bool>();
            }
        }

        rules.emplace(command, std::move(rule));
    }

    if (!errors.empty()) {
        return std::unexpected(validation_error(utils::join(errors, "; ")));
    }
    return CommandWhitelist::create(std::move(rules));
}

auto whitelist_to_json(const CommandWhitelist& whitelist) -> json {
    json j = json::object();
    for (const auto& [command, rule] : whitelist.rules()) {
        j[command] = rule;
    }
    return j;
}

auto load_whitelist_file(const std::filesystem::path& path) -> Result<CommandWhitelist> {
    std::ifstream file(path);
    if (!file.is_open()) {
        return std::unexpected(make_error(ErrorCode::NotFound,
            "Cannot open whitelist file", path.string()));
    }

    try {
        auto whitelist = whitelist_from_json(json::parse(file));
        if (whitelist) {
            LOG_INFO("Loaded command whitelist from {} ({} commands)",
                     path.string(), whitelist->size());
        }
        return whitelist;
    } catch (const json::exception& e) {
        return std::unexpected(make_error(ErrorCode::InvalidConfig,
            "Failed to parse whitelist file", path.string() + ": " + e.what()));
    }
}

auto contains_shell_metacharacters(std::string_view arg) -> bool {
    return arg.find_first_of(kShellMetacharacters) != std::string_view::npos;
}

} // namespace warden::security
