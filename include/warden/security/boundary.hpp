#pragma once

#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

#include "warden/core/config.hpp"
#include "warden/core/error.hpp"

namespace warden::security {

/// True on platforms whose default filesystems compare names case-insensitively.
constexpr auto default_case_insensitive() noexcept -> bool {
#if defined(_WIN32) || defined(__APPLE__)
    return true;
#else
    return false;
#endif
}

/// The set of directories an operation may resolve into.
///
/// All directories are absolute and canonical. Validators copy the boundary
/// at construction and never modify it afterwards.
struct SecurityBoundary {
    std::string base_dir;
    std::vector<std::string> allowed_dirs;
    bool case_insensitive = default_case_insensitive();
    std::size_t max_path_length = kDefaultMaxPathLength;

    /// `absolute_path` must already be lexically normalized.
    [[nodiscard]] auto contains(std::string_view absolute_path) const -> bool;
};

/// Builds a boundary from configuration. base_dir defaults to the current
/// directory; every directory is made absolute and canonicalized (symlinks in
/// existing prefixes resolved). Returns InvalidConfig if that fails.
auto make_boundary(const BoundaryConfig& config) -> Result<SecurityBoundary>;

/// POSIX-style lexical normalization: collapses repeated separators, removes
/// "." components and folds "name/.." pairs. A leading ".." of a relative path
/// is kept; ".." directly under the root is dropped. The trailing separator
/// is removed (except for "/"). An empty input yields ".".
auto normalize_lexical(std::string_view path) -> std::string;

/// Lexically resolves `path` against `base` (which must be absolute).
/// Absolute inputs ignore `base`.
auto resolve_lexical(std::string_view base, std::string_view path) -> std::string;

/// True if `target` equals `base` or is a descendant of it. Both are
/// normalized first; with `case_insensitive` both are lowercased.
auto is_path_within(std::string_view target, std::string_view base, bool case_insensitive) -> bool;

} // namespace warden::security
