#pragma once

#include <expected>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

#include "warden/audit/audit_logger.hpp"
#include "warden/core/error.hpp"
#include "warden/security/boundary.hpp"

namespace warden::security {

/// Why PathSanitizer refused a path. Checks run in a fixed order and the
/// first failing check decides the reason.
enum class PathRejectionReason {
    EmptyPath,
    NullByte,
    PathTooLong,
    InvalidCharacters,
    TraversalAttempt,
    InvalidComponent,
    OutsideBoundary,
};

/// "EMPTY_PATH", "NULL_BYTE", ...
auto path_rejection_reason_to_string(PathRejectionReason reason) -> std::string_view;

struct PathRejection {
    PathRejectionReason reason;
    std::string message;
};

/// Either the absolute sanitized path or the reason it was refused.
using SanitizationResult = std::expected<std::string, PathRejection>;

struct PathSanitizerOptions {
    std::shared_ptr<audit::AuditSink> audit;
    std::string actor = "system";
};

/// String-level path validation against a SecurityBoundary. Never touches
/// the filesystem, so a result says nothing about symlinks; pair it with
/// SymlinkResolver before any disk access.
///
/// All member functions are const and safe to call concurrently.
class PathSanitizer {
public:
    explicit PathSanitizer(SecurityBoundary boundary, PathSanitizerOptions options = {});

    /// Runs every check and returns the path resolved against base_dir.
    /// Rejections are reported to the audit sink before returning.
    [[nodiscard]] auto sanitize(std::string_view input) const -> SanitizationResult;

    /// sanitize() with the rejection turned into a PathTraversal error.
    [[nodiscard]] auto sanitize_or_error(std::string_view input) const -> Result<std::string>;

    /// Results are in input order.
    [[nodiscard]] auto sanitize_many(const std::vector<std::string>& inputs) const
        -> std::vector<SanitizationResult>;

    /// Cheap pre-check: the structural checks only, no boundary resolution
    /// and no audit event.
    [[nodiscard]] auto is_valid(std::string_view input) const -> bool;

    [[nodiscard]] static auto contains_null_byte(std::string_view input) -> bool;

    [[nodiscard]] auto base_dir() const -> const std::string& { return boundary_.base_dir; }
    [[nodiscard]] auto allowed_dirs() const -> const std::vector<std::string>& { return boundary_.allowed_dirs; }
    [[nodiscard]] auto case_insensitive() const -> bool { return boundary_.case_insensitive; }
    [[nodiscard]] auto max_path_length() const -> std::size_t { return boundary_.max_path_length; }

private:
    /// Every check except boundary containment; returns the normalized path.
    [[nodiscard]] auto check_structure(std::string_view input) const -> SanitizationResult;
    /// For an absolute input, the part after the longest boundary directory
    /// it starts with; otherwise the whole input.
    [[nodiscard]] auto below_boundary(std::string_view input) const -> std::string_view;
    [[nodiscard]] auto reject(std::string_view input, PathRejectionReason reason,
                              std::string message) const -> SanitizationResult;

    SecurityBoundary boundary_;
    PathSanitizerOptions options_;
};

/// True if `input` has ".." at a path-boundary position in its raw form
/// ("../x", "a/../b", "a/..", "..\\x").
auto has_traversal_pattern(std::string_view input) -> bool;

/// True for ".", "..", "...", reserved device names (CON, PRN, AUX, NUL,
/// COM1-9, LPT1-9, any case) and components longer than 255 bytes.
auto is_invalid_component(std::string_view component) -> bool;

} // namespace warden::security
