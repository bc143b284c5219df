#pragma once

#include <memory>
#include <optional>
#include <stop_token>
#include <string>
#include <string_view>
#include <utility>

#include <boost/asio/awaitable.hpp>

#include "warden/audit/audit_logger.hpp"
#include "warden/core/error.hpp"
#include "warden/security/path_sanitizer.hpp"
#include "warden/security/symlink_resolver.hpp"

namespace warden::security {

using boost::asio::awaitable;

/// Outcome of InputValidator::validate_file_path_extended. Never audited.
struct PathValidationDetails {
    bool valid = false;
    /// The validated path when `valid`.
    std::string value;
    std::string error;
    std::optional<PathRejectionReason> rejection_reason;
    bool is_symlink = false;
    std::optional<std::string> real_path;
};

struct InputValidatorOptions {
    std::shared_ptr<audit::AuditSink> audit;
    std::string actor = "system";
};

/// One entry point for user-supplied paths: PathSanitizer as the cheap
/// pre-filter, then SymlinkResolver on the sanitized path for the decision.
class InputValidator {
public:
    InputValidator(std::shared_ptr<const PathSanitizer> sanitizer,
                   std::shared_ptr<const SymlinkResolver> resolver,
                   InputValidatorOptions options = {});

    /// The canonical path (the sanitized one for entries that do not exist
    /// yet), or PathTraversal. Rejections are audited as path_validation_failed.
    [[nodiscard]] auto validate_file_path(std::string_view input) const -> Result<std::string>;

    /// Resolution runs on the resolver's blocking executor. Cancelled if
    /// `stop` is requested.
    auto validate_file_path_async(std::string input, std::stop_token stop = {}) const
        -> awaitable<Result<std::string>>;

    [[nodiscard]] auto validate_file_path_extended(std::string_view input) const
        -> PathValidationDetails;

    /// PathSanitizer::is_valid: no resolution, no audit.
    [[nodiscard]] auto is_valid_path(std::string_view input) const -> bool;

    [[nodiscard]] auto base_dir() const -> const std::string& { return sanitizer_->base_dir(); }
    [[nodiscard]] auto paths() const -> const PathSanitizer& { return *sanitizer_; }
    [[nodiscard]] auto symlinks() const -> const SymlinkResolver& { return *resolver_; }

private:
    void audit_rejection(std::string_view input, std::string_view reason,
                         const SymlinkResolutionResult* resolution) const;

    std::shared_ptr<const PathSanitizer> sanitizer_;
    std::shared_ptr<const SymlinkResolver> resolver_;
    InputValidatorOptions options_;
};

/// git ref-name rules (no "..", "//", "@{", control characters, space or
/// ~^:?*[]\, no leading '-' or '.', no trailing ".lock" or '/', at most 255
/// bytes) plus kBranchNamePattern, so an accepted name also passes the
/// whitelist's "branch" argument shape.
auto is_valid_branch_name(std::string_view name) -> bool;

/// Accepts "owner/repo" or a github.com URL and returns "owner/repo";
/// ValidationFailed otherwise.
auto validate_github_repo(std::string_view repo_ref) -> Result<std::string>;

/// Semantic version 2.0.0, with an optional leading 'v'.
auto is_valid_semver(std::string_view version) -> bool;

} // namespace warden::security
