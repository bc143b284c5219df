#include "warden/core/config.hpp"
#include "warden/core/logger.hpp"
#include "warden/core/utils.hpp"

#include <cstdlib>
#include <fstream>

namespace warden {

namespace {

void expand_paths(Config& config) {
    config.boundary.base_dir = resolve_env_refs(config.boundary.base_dir);
    for (auto& dir : config.boundary.allowed_dirs) {
        dir = resolve_env_refs(dir);
    }
    config.audit.log_dir = resolve_env_refs(config.audit.log_dir);
    if (config.whitelist_file) {
        config.whitelist_file = resolve_env_refs(*config.whitelist_file);
    }
}

auto parse_policy(std::string_view value) -> std::optional<SymlinkPolicy> {
    auto lower = utils::to_lower(value);
    if (lower == "allow") return SymlinkPolicy::Allow;
    if (lower == "deny") return SymlinkPolicy::Deny;
    if (lower == "resolve") return SymlinkPolicy::Resolve;
    return std::nullopt;
}

} // anonymous namespace

auto load_config(const std::filesystem::path& path) -> Config {
    if (!std::filesystem::exists(path)) {
        LOG_WARN("Config file not found: {}, using defaults", path.string());
        return default_config();
    }

    std::ifstream file(path);
    if (!file.is_open()) {
        LOG_WARN("Cannot open config file: {}, using defaults", path.string());
        return default_config();
    }

    try {
        json j = json::parse(file);

        // symlinkPolicy values are matched case-insensitively
        if (j.contains("symlink_policy") && j["symlink_policy"].is_string()) {
            auto raw = j["symlink_policy"].get<std::string>();
            if (auto policy = parse_policy(raw)) {
                j["symlink_policy"] = *policy;
            } else {
                LOG_WARN("Config: unknown symlink_policy '{}', using 'resolve'", raw);
                j.erase("symlink_policy");
            }
        }

        auto config = j.get<Config>();
        expand_paths(config);
        return config;
    } catch (const json::exception& e) {
        LOG_ERROR("Failed to parse config: {}", e.what());
        return default_config();
    }
}

auto load_config_from_env() -> Config {
    Config config;

    if (auto* val = std::getenv("WARDEN_BASE_DIR")) {
        config.boundary.base_dir = val;
    }
    if (auto* val = std::getenv("WARDEN_ALLOWED_DIRS")) {
        for (auto& dir : utils::split(val, ':')) {
            if (!dir.empty()) config.boundary.allowed_dirs.push_back(std::move(dir));
        }
    }
    if (auto* val = std::getenv("WARDEN_SYMLINK_POLICY")) {
        if (auto policy = parse_policy(val)) {
            config.symlink_policy = *policy;
        } else {
            LOG_WARN("WARDEN_SYMLINK_POLICY: unknown value '{}', using 'resolve'", val);
        }
    }
    if (auto* val = std::getenv("WARDEN_LOG_LEVEL")) {
        config.log_level = val;
    }
    if (auto* val = std::getenv("WARDEN_ACTOR")) {
        config.actor = val;
    }
    if (auto* val = std::getenv("WARDEN_AUDIT_DIR")) {
        config.audit.log_dir = val;
    }
    if (auto* val = std::getenv("WARDEN_WHITELIST_FILE")) {
        config.whitelist_file = val;
    }

    expand_paths(config);
    return config;
}

auto default_config() -> Config {
    return Config{};
}

auto default_data_dir() -> std::filesystem::path {
    if (auto* val = std::getenv("WARDEN_DATA_DIR")) {
        return val;
    }
    auto home = std::filesystem::path(std::getenv("HOME") ? std::getenv("HOME") : "/tmp");
    return home / ".warden";
}

auto validate_config(const Config& config) -> VoidResult {
    std::vector<std::string> problems;

    if (config.boundary.max_path_length == 0) {
        problems.emplace_back("boundary.max_path_length must be positive");
    }
    if (config.exec.timeout_ms <= 0) {
        problems.emplace_back("exec.timeout_ms must be positive");
    }
    if (config.exec.max_output_bytes == 0) {
        problems.emplace_back("exec.max_output_bytes must be positive");
    }
    if (config.audit.max_files == 0) {
        problems.emplace_back("audit.max_files must be at least 1");
    }
    if (config.audit.max_file_size == 0) {
        problems.emplace_back("audit.max_file_size must be positive");
    }
    if (config.actor.empty()) {
        problems.emplace_back("actor must not be empty");
    }
    if (config.whitelist && !config.whitelist->is_object()) {
        problems.emplace_back("whitelist must be an object keyed by command name");
    }

    if (!problems.empty()) {
        return std::unexpected(make_error(ErrorCode::InvalidConfig,
            "Invalid configuration", utils::join(problems, "; ")));
    }
    return {};
}

auto resolve_env_refs(std::string_view input) -> std::string {
    std::string result;
    result.reserve(input.size());

    size_t i = 0;
    while (i < input.size()) {
        // $${VAR} -> literal ${VAR}
        if (i + 1 < input.size() && input[i] == '$' && input[i + 1] == '$') {
            result += '$';
            i += 2;
            continue;
        }

        if (i + 2 < input.size() && input[i] == '$' && input[i + 1] == '{') {
            auto close = input.find('}', i + 2);
            if (close != std::string_view::npos) {
                std::string var_name(input.substr(i + 2, close - i - 2));
                if (auto* val = std::getenv(var_name.c_str())) {
                    result += val;
                } else {
                    // Preserve unresolved refs
                    result += input.substr(i, close - i + 1);
                    LOG_DEBUG("Config: unresolved env ref ${{{}}}", var_name);
                }
                i = close + 1;
                continue;
            }
        }

        result += input[i];
        ++i;
    }

    return result;
}

} // namespace warden
