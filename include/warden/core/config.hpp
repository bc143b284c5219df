#pragma once

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <nlohmann/json.hpp>

#include "warden/core/error.hpp"
#include "warden/core/types.hpp"

// std::optional serializer for nlohmann/json, so the NLOHMANN_DEFINE macros
// work with optional fields.
namespace nlohmann {
template <typename T>
struct adl_serializer<std::optional<T>> {
    static void to_json(json& j, const std::optional<T>& opt) {
        if (opt.has_value()) {
            j = *opt;
        } else {
            j = nullptr;
        }
    }

    static void from_json(const json& j, std::optional<T>& opt) {
        if (j.is_null()) {
            opt = std::nullopt;
        } else {
            opt = j.get<T>();
        }
    }
};
} // namespace nlohmann

namespace warden {

inline constexpr std::size_t kDefaultMaxPathLength = 4096;
inline constexpr std::int64_t kDefaultExecTimeoutMs = 5 * 60 * 1000;
inline constexpr std::size_t kDefaultMaxOutputBytes = 10 * 1024 * 1024;
inline constexpr std::uint64_t kDefaultAuditMaxFileSize = 10 * 1024 * 1024;
inline constexpr std::size_t kDefaultAuditMaxFiles = 5;

struct BoundaryConfig {
    std::string base_dir;                   // empty = current working directory
    std::vector<std::string> allowed_dirs;
    std::optional<bool> case_insensitive;   // unset = platform default
    std::size_t max_path_length = kDefaultMaxPathLength;
};
NLOHMANN_DEFINE_TYPE_NON_INTRUSIVE_WITH_DEFAULT(BoundaryConfig, base_dir, allowed_dirs, case_insensitive, max_path_length)

struct ExecConfig {
    std::int64_t timeout_ms = kDefaultExecTimeoutMs;
    std::size_t max_output_bytes = kDefaultMaxOutputBytes;
};
NLOHMANN_DEFINE_TYPE_NON_INTRUSIVE_WITH_DEFAULT(ExecConfig, timeout_ms, max_output_bytes)

struct AuditConfig {
    bool enabled = true;
    std::string log_dir;                    // empty = <data dir>/audit
    std::uint64_t max_file_size = kDefaultAuditMaxFileSize;
    std::size_t max_files = kDefaultAuditMaxFiles;
    bool console_output = false;
};
NLOHMANN_DEFINE_TYPE_NON_INTRUSIVE_WITH_DEFAULT(AuditConfig, enabled, log_dir, max_file_size, max_files, console_output)

struct Config {
    BoundaryConfig boundary;
    SymlinkPolicy symlink_policy = SymlinkPolicy::Resolve;
    bool strict_mode = true;
    std::string actor = "system";
    ExecConfig exec;
    AuditConfig audit;
    /// Inline whitelist; replaces the built-in one when present.
    std::optional<json> whitelist;
    /// JSON file holding a whitelist; used when `whitelist` is absent.
    std::optional<std::string> whitelist_file;
    std::string log_level = "info";
};
NLOHMANN_DEFINE_TYPE_NON_INTRUSIVE_WITH_DEFAULT(Config, boundary, symlink_policy, strict_mode, actor, exec, audit, whitelist, whitelist_file, log_level)

auto load_config(const std::filesystem::path& path) -> Config;
auto load_config_from_env() -> Config;
auto default_config() -> Config;
auto default_data_dir() -> std::filesystem::path;

/// Checks numeric limits and enum-like strings. Returns InvalidConfig with
/// every problem found, separated by "; ".
auto validate_config(const Config& config) -> VoidResult;

/// Resolves `${VAR}` environment variable references in a string.
/// Supports `$${VAR}` escape (literal `${VAR}`).
auto resolve_env_refs(std::string_view input) -> std::string;

} // namespace warden
