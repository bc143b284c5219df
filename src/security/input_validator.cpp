#include "warden/security/input_validator.hpp"

#include <algorithm>
#include <array>
#include <regex>

#include "warden/core/logger.hpp"
#include "warden/core/utils.hpp"
#include "warden/security/command_whitelist.hpp"

namespace warden::security {

namespace {

constexpr std::size_t kMaxBranchNameLength = 255;

auto repo_error(std::string reason) -> Error {
    return make_error(ErrorCode::ValidationFailed, "Invalid repository reference", std::move(reason));
}

} // anonymous namespace

InputValidator::InputValidator(std::shared_ptr<const PathSanitizer> sanitizer,
                               std::shared_ptr<const SymlinkResolver> resolver,
                               InputValidatorOptions options)
    : sanitizer_(std::move(sanitizer))
    , resolver_(std::move(resolver))
    , options_(std::move(options)) {}

auto InputValidator::validate_file_path(std::string_view input) const -> Result<std::string> {
    auto sanitized = sanitizer_->sanitize(input);
    if (!sanitized) {
        audit_rejection(input, path_rejection_reason_to_string(sanitized.error().reason), nullptr);
        return std::unexpected(path_traversal_error(utils::sanitize_for_log(input), base_dir()));
    }

    auto resolution = resolver_->resolve(*sanitized);
    if (!resolution.is_within_boundary) {
        audit_rejection(input, "OUTSIDE_BOUNDARY", &resolution);
        return std::unexpected(path_traversal_error(utils::sanitize_for_log(input), base_dir()));
    }
    return resolution.real_path.value_or(*sanitized);
}

auto InputValidator::validate_file_path_async(std::string input, std::stop_token stop) const
    -> awaitable<Result<std::string>> {
    auto sanitized = sanitizer_->sanitize(input);
    if (!sanitized) {
        audit_rejection(input, path_rejection_reason_to_string(sanitized.error().reason), nullptr);
        co_return make_fail(path_traversal_error(utils::sanitize_for_log(input), base_dir()));
    }

    auto resolution = co_await resolver_->resolve_async(*sanitized, stop);
    if (!resolution) {
        co_return make_fail(resolution.error());
    }
    if (!resolution->is_within_boundary) {
        audit_rejection(input, "OUTSIDE_BOUNDARY", &*resolution);
        co_return make_fail(path_traversal_error(utils::sanitize_for_log(input), base_dir()));
    }
    co_return resolution->real_path.value_or(*sanitized);
}

auto InputValidator::validate_file_path_extended(std::string_view input) const
    -> PathValidationDetails {
    PathValidationDetails details;

    auto sanitized = sanitizer_->sanitize(input);
    if (!sanitized) {
        details.error = sanitized.error().message;
        details.rejection_reason = sanitized.error().reason;
        return details;
    }

    auto resolution = resolver_->resolve(*sanitized);
    details.is_symlink = resolution.is_symlink;
    details.real_path = resolution.real_path;
    if (!resolution.is_within_boundary) {
        details.error = "Path escapes allowed directory";
        details.rejection_reason = PathRejectionReason::OutsideBoundary;
        return details;
    }

    details.valid = true;
    details.value = resolution.real_path.value_or(*sanitized);
    return details;
}

auto InputValidator::is_valid_path(std::string_view input) const -> bool {
    return sanitizer_->is_valid(input);
}

void InputValidator::audit_rejection(std::string_view input, std::string_view reason,
                                     const SymlinkResolutionResult* resolution) const {
    if (!options_.audit) return;
    try {
        json details = {
            {"inputPath", utils::sanitize_for_log(input)},
            {"reason", std::string(reason)},
        };
        if (resolution) {
            details["isSymlink"] = resolution->is_symlink;
            if (resolution->symlink_target) details["symlinkTarget"] = *resolution->symlink_target;
        }
        options_.audit->log_security_violation("path_validation_failed", options_.actor,
                                               std::move(details));
    } catch (const std::exception& e) {
        LOG_ERROR("Audit sink failed while recording path validation: {}", e.what());
    }
}

// ---------------------------------------------------------------------------
// Reference names
// ---------------------------------------------------------------------------

auto is_valid_branch_name(std::string_view name) -> bool {
    if (name.empty() || name.size() > kMaxBranchNameLength) return false;
    if (name.front() == '-' || name.front() == '.') return false;
    if (name.ends_with(".lock") || name.back() == '/') return false;

    static constexpr std::array<std::string_view, 3> kForbiddenSequences = {"..", "//", "@{"};
    for (auto seq : kForbiddenSequences) {
        if (name.find(seq) != std::string_view::npos) return false;
    }
    static constexpr std::string_view kForbiddenChars = " ~^:?*[]\\";
    bool bad_char = std::ranges::any_of(name, [](char c) {
        auto uc = static_cast<unsigned char>(c);
        return uc < 0x20 || uc == 0x7f || kForbiddenChars.find(c) != std::string_view::npos;
    });
    if (bad_char) return false;

    static const std::regex branch_pattern{std::string(kBranchNamePattern)};
    return std::regex_match(name.begin(), name.end(), branch_pattern);
}

auto validate_github_repo(std::string_view repo_ref) -> Result<std::string> {
    static const std::regex owner_repo(R"(^[a-zA-Z0-9_.-]+/[a-zA-Z0-9_.-]+$)");
    static const std::regex url(R"(^[a-zA-Z][a-zA-Z0-9+.-]*://([^/?#@:]+)(?::\d+)?(/[^?#]*)?(?:[?#].*)?$)");
    static const std::regex repo_path(R"(^/([a-zA-Z0-9_.-]+)/([a-zA-Z0-9_.-]+))");

    std::string ref(repo_ref);
    if (std::regex_match(ref, owner_repo)) {
        return ref;
    }

    std::smatch m;
    if (!std::regex_match(ref, m, url)) {
        return std::unexpected(repo_error("must be owner/repo format or GitHub URL"));
    }
    if (utils::to_lower(m[1].str()) != "github.com") {
        return std::unexpected(repo_error("must be a github.com URL"));
    }

    auto path = m[2].str();
    std::smatch parts;
    if (!std::regex_search(path, parts, repo_path)) {
        return std::unexpected(repo_error("invalid GitHub repository path"));
    }
    return parts[1].str() + "/" + parts[2].str();
}

auto is_valid_semver(std::string_view version) -> bool {
    static const std::regex semver(
        R"(^v?(0|[1-9]\d*)\.(0|[1-9]\d*)\.(0|[1-9]\d*))"
        R"((?:-((?:0|[1-9]\d*|\d*[a-zA-Z-][0-9a-zA-Z-]*)(?:\.(?:0|[1-9]\d*|\d*[a-zA-Z-][0-9a-zA-Z-]*))*))?)"
        R"((?:\+([0-9a-zA-Z-]+(?:\.[0-9a-zA-Z-]+)*))?$)");
    return std::regex_match(version.begin(), version.end(), semver);
}

} // namespace warden::security
