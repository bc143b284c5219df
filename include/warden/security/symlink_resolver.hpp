#pragma once

#include <functional>
#include <memory>
#include <optional>
#include <stop_token>
#include <string>
#include <string_view>
#include <utility>

#include <fcntl.h>
#include <sys/types.h>

#include <boost/asio/any_io_executor.hpp>
#include <boost/asio/awaitable.hpp>

#include "warden/audit/audit_logger.hpp"
#include "warden/core/error.hpp"
#include "warden/core/types.hpp"
#include "warden/security/boundary.hpp"

namespace warden::security {

using boost::asio::awaitable;

struct SymlinkResolutionResult {
    std::string input_path;
    std::string normalized_path;
    std::optional<std::string> real_path;
    bool is_symlink = false;
    bool is_within_boundary = false;
    /// Raw readlink() value of the final component, when it is a link.
    std::optional<std::string> symlink_target;
};

/// Owning handle to a descriptor opened by SymlinkResolver::open_safe.
/// The descriptor refers to the same inode that passed validation.
class SafeFileHandle {
public:
    SafeFileHandle() = default;
    SafeFileHandle(int fd, std::string path) : fd_(fd), path_(std::move(path)) {}
    ~SafeFileHandle();

    SafeFileHandle(const SafeFileHandle&) = delete;
    SafeFileHandle& operator=(const SafeFileHandle&) = delete;
    SafeFileHandle(SafeFileHandle&& other) noexcept;
    SafeFileHandle& operator=(SafeFileHandle&& other) noexcept;

    [[nodiscard]] auto fd() const noexcept -> int { return fd_; }
    [[nodiscard]] auto path() const noexcept -> const std::string& { return path_; }
    [[nodiscard]] auto is_open() const noexcept -> bool { return fd_ >= 0; }

    /// Idempotent.
    void close() noexcept;

    /// Gives up ownership; the caller must close the returned descriptor.
    [[nodiscard]] auto release() noexcept -> int;

private:
    int fd_ = -1;
    std::string path_;
};

struct SymlinkResolverOptions {
    SymlinkPolicy policy = SymlinkPolicy::Resolve;
    std::shared_ptr<audit::AuditSink> audit;
    std::string actor = "system";
    /// Where the *_async forms run their blocking calls. Unset means the
    /// awaiting coroutine's own executor.
    std::optional<boost::asio::any_io_executor> blocking_executor;
    /// Called with the validated path right before open_safe opens it.
    std::function<void(const std::string&)> before_open;
};

/// Filesystem-aware path validation.
///
/// resolve() inspects the path with lstat/realpath and applies the symlink
/// policy to the final component and to any symlinked ancestor directory.
/// open_safe() narrows the validate/open race by comparing device and inode
/// of the opened descriptor with the path before and after the open.
class SymlinkResolver {
public:
    explicit SymlinkResolver(SecurityBoundary boundary, SymlinkResolverOptions options = {});

    [[nodiscard]] auto resolve(std::string_view input) const -> SymlinkResolutionResult;
    /// resolve() on the blocking executor. Returns Cancelled if `stop` is
    /// requested before or after the lookup.
    auto resolve_async(std::string input, std::stop_token stop = {}) const
        -> awaitable<Result<SymlinkResolutionResult>>;

    /// Canonical path (or the normalized path for entries that do not exist
    /// yet), or PathTraversal.
    [[nodiscard]] auto validate_path(std::string_view input) const -> Result<std::string>;

    /// `flags` are open(2) flags; O_NOFOLLOW and O_CLOEXEC are always added.
    [[nodiscard]] auto open_safe(std::string_view input, int flags = O_RDONLY,
                                 mode_t mode = 0600) const -> Result<SafeFileHandle>;

    /// Returns Cancelled if `stop` is requested; a descriptor opened by then
    /// is closed first.
    auto open_safe_async(std::string input, int flags = O_RDONLY, mode_t mode = 0600,
                         std::stop_token stop = {}) const -> awaitable<Result<SafeFileHandle>>;

    [[nodiscard]] auto base_dir() const -> const std::string& { return boundary_.base_dir; }
    [[nodiscard]] auto boundary() const -> const SecurityBoundary& { return boundary_; }
    [[nodiscard]] auto symlink_policy() const -> SymlinkPolicy { return options_.policy; }
    [[nodiscard]] auto case_insensitive() const -> bool { return boundary_.case_insensitive; }

private:
    auto blocking_executor() const -> awaitable<boost::asio::any_io_executor>;
    void audit_violation(std::string_view type, const SymlinkResolutionResult& result,
                         std::string_view reason) const;
    [[nodiscard]] auto same_path(std::string_view a, std::string_view b) const -> bool;

    SecurityBoundary boundary_;
    SymlinkResolverOptions options_;
};

} // namespace warden::security
