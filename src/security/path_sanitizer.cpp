#include "warden/security/path_sanitizer.hpp"

#include <algorithm>
#include <array>

#include "warden/core/logger.hpp"
#include "warden/core/utils.hpp"

namespace warden::security {

namespace {

constexpr std::size_t kMaxComponentLength = 255;
constexpr std::size_t kMaxLoggedInputLength = 200;

auto is_separator(char c) -> bool {
    return c == '/' || c == '\\';
}

auto has_invalid_characters(std::string_view input) -> bool {
    static constexpr std::string_view kForbidden = "<>:\"|?*";
    return std::ranges::any_of(input, [](char c) {
        auto uc = static_cast<unsigned char>(c);
        return uc < 0x20 || kForbidden.find(c) != std::string_view::npos;
    });
}

auto is_reserved_device_name(std::string_view component) -> bool {
    static constexpr std::array<std::string_view, 4> kNames = {"CON", "PRN", "AUX", "NUL"};
    auto upper = utils::to_upper(component);
    if (std::ranges::find(kNames, upper) != kNames.end()) return true;
    if (upper.size() == 4 && (upper.starts_with("COM") || upper.starts_with("LPT"))) {
        return upper[3] >= '1' && upper[3] <= '9';
    }
    return false;
}

} // anonymous namespace

auto path_rejection_reason_to_string(PathRejectionReason reason) -> std::string_view {
    switch (reason) {
        case PathRejectionReason::EmptyPath: return "EMPTY_PATH";
        case PathRejectionReason::NullByte: return "NULL_BYTE";
        case PathRejectionReason::PathTooLong: return "PATH_TOO_LONG";
        case PathRejectionReason::InvalidCharacters: return "INVALID_CHARACTERS";
        case PathRejectionReason::TraversalAttempt: return "TRAVERSAL_ATTEMPT";
        case PathRejectionReason::InvalidComponent: return "INVALID_COMPONENT";
        case PathRejectionReason::OutsideBoundary: return "OUTSIDE_BOUNDARY";
    }
    return "INVALID_COMPONENT";
}

auto has_traversal_pattern(std::string_view input) -> bool {
    for (std::size_t pos = input.find(".."); pos != std::string_view::npos;
         pos = input.find("..", pos + 1)) {
        bool at_start = pos == 0 || is_separator(input[pos - 1]);
        bool next_is_sep = pos + 2 < input.size() && is_separator(input[pos + 2]);
        bool at_end = pos + 2 == input.size();
        // "..<sep>" anywhere, or ".." as a whole component
        if (next_is_sep || (at_start && at_end)) return true;
    }
    return false;
}

auto is_invalid_component(std::string_view component) -> bool {
    if (component.size() > kMaxComponentLength) return true;
    if (!component.empty() &&
        std::ranges::all_of(component, [](char c) { return c == '.'; })) {
        return true;
    }
    return is_reserved_device_name(component);
}

PathSanitizer::PathSanitizer(SecurityBoundary boundary, PathSanitizerOptions options)
    : boundary_(std::move(boundary))
    , options_(std::move(options)) {
    boundary_.base_dir = normalize_lexical(boundary_.base_dir);
    for (auto& dir : boundary_.allowed_dirs) {
        dir = normalize_lexical(dir);
    }
}

auto PathSanitizer::check_structure(std::string_view input) const -> SanitizationResult {
    if (utils::trim(input).empty()) {
        return reject(input, PathRejectionReason::EmptyPath, "Path is empty");
    }
    if (contains_null_byte(input)) {
        return reject(input, PathRejectionReason::NullByte, "Path contains null byte");
    }
    if (input.size() > boundary_.max_path_length) {
        return reject(input, PathRejectionReason::PathTooLong,
            "Path exceeds maximum length of " + std::to_string(boundary_.max_path_length));
    }

    // The boundary directory itself is configuration, not input.
    auto below = below_boundary(input);
    if (has_invalid_characters(below)) {
        return reject(input, PathRejectionReason::InvalidCharacters, "Path contains invalid characters");
    }
    // Checked on the raw input: normalization would fold "a/../../b" into "../b"
    // and hide where the traversal started.
    if (has_traversal_pattern(below)) {
        return reject(input, PathRejectionReason::TraversalAttempt, "Path traversal pattern detected");
    }

    if (!below.empty()) {
        auto components = utils::split(normalize_lexical(below), '/');
        for (const auto& component : components) {
            if (component == "..") {
                return reject(input, PathRejectionReason::TraversalAttempt,
                              "Path traversal detected after normalization");
            }
        }
        for (const auto& component : components) {
            if (component.empty()) continue;
            if (is_invalid_component(component)) {
                auto shown = component.size() > 20 ? component.substr(0, 20) + "..." : component;
                return reject(input, PathRejectionReason::InvalidComponent,
                              "Invalid path component: " + shown);
            }
        }
    }

    return normalize_lexical(input);
}

auto PathSanitizer::below_boundary(std::string_view input) const -> std::string_view {
    if (input.empty() || input.front() != '/') return input;

    std::size_t longest = 0;
    auto consider = [&](const std::string& dir) {
        if (dir.size() <= longest || input.size() < dir.size()) return;
        auto prefix = input.substr(0, dir.size());
        bool same = boundary_.case_insensitive ? utils::to_lower(prefix) == utils::to_lower(dir)
                                               : prefix == dir;
        if (!same) return;
        if (dir != "/" && input.size() > dir.size() && input[dir.size()] != '/') return;
        longest = dir.size();
    };
    consider(boundary_.base_dir);
    for (const auto& dir : boundary_.allowed_dirs) {
        consider(dir);
    }
    return input.substr(longest);
}

auto PathSanitizer::sanitize(std::string_view input) const -> SanitizationResult {
    auto normalized = check_structure(input);
    if (!normalized) return normalized;

    auto resolved = resolve_lexical(boundary_.base_dir, *normalized);
    if (!boundary_.contains(resolved)) {
        return reject(input, PathRejectionReason::OutsideBoundary, "Path is outside allowed directory");
    }

    LOG_TRACE("Path accepted: {}", resolved);
    return resolved;
}

auto PathSanitizer::sanitize_or_error(std::string_view input) const -> Result<std::string> {
    auto result = sanitize(input);
    if (!result) {
        return std::unexpected(path_traversal_error(
            utils::sanitize_for_log(input, kMaxLoggedInputLength), boundary_.base_dir));
    }
    return std::move(*result);
}

auto PathSanitizer::sanitize_many(const std::vector<std::string>& inputs) const
    -> std::vector<SanitizationResult> {
    std::vector<SanitizationResult> results;
    results.reserve(inputs.size());
    for (const auto& input : inputs) {
        results.push_back(sanitize(input));
    }
    return results;
}

auto PathSanitizer::is_valid(std::string_view input) const -> bool {
    if (utils::trim(input).empty()) return false;
    if (contains_null_byte(input)) return false;
    if (input.size() > boundary_.max_path_length) return false;
    auto below = below_boundary(input);
    if (has_invalid_characters(below)) return false;
    return !has_traversal_pattern(below);
}

auto PathSanitizer::contains_null_byte(std::string_view input) -> bool {
    return input.find('\0') != std::string_view::npos;
}

auto PathSanitizer::reject(std::string_view input, PathRejectionReason reason,
                           std::string message) const -> SanitizationResult {
    auto logged_input = utils::sanitize_for_log(input, kMaxLoggedInputLength);
    LOG_WARN("Path rejected ({}): {}", path_rejection_reason_to_string(reason), logged_input);

    if (options_.audit) {
        try {
            options_.audit->log_security_violation("path_traversal_attempt", options_.actor, {
                {"inputPath", logged_input},
                {"reasonCode", std::string(path_rejection_reason_to_string(reason))},
                {"error", message},
                {"baseDir", boundary_.base_dir},
            });
        } catch (const std::exception& e) {
            LOG_ERROR("Audit sink failed while recording path rejection: {}", e.what());
        }
    }

    return std::unexpected(PathRejection{reason, std::move(message)});
}

} // namespace warden::security
