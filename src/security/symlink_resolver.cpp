#include "warden/security/symlink_resolver.hpp"

#include <cerrno>
#include <climits>
#include <cstdlib>
#include <cstring>
#include <filesystem>

#include <sys/stat.h>
#include <unistd.h>

#include <boost/asio/this_coro.hpp>

#include "warden/core/logger.hpp"
#include "warden/core/utils.hpp"
#include "warden/infra/offload.hpp"

namespace warden::security {

namespace fs = std::filesystem;

namespace {

struct FileIdentity {
    dev_t device;
    ino_t inode;

    auto operator==(const FileIdentity&) const -> bool = default;
};

auto lstat_identity(const std::string& path) -> std::optional<FileIdentity> {
    struct stat st{};
    if (::lstat(path.c_str(), &st) != 0) return std::nullopt;
    return FileIdentity{st.st_dev, st.st_ino};
}

auto fstat_identity(int fd) -> std::optional<FileIdentity> {
    struct stat st{};
    if (::fstat(fd, &st) != 0) return std::nullopt;
    return FileIdentity{st.st_dev, st.st_ino};
}

auto read_link(const std::string& path) -> std::optional<std::string> {
    std::error_code ec;
    auto target = fs::read_symlink(path, ec);
    if (ec) return std::nullopt;
    return target.string();
}

auto real_path(const std::string& path) -> std::optional<std::string> {
    char buf[PATH_MAX];
    if (::realpath(path.c_str(), buf) == nullptr) return std::nullopt;
    return std::string(buf);
}

} // anonymous namespace

// ---------------------------------------------------------------------------
// SafeFileHandle
// ---------------------------------------------------------------------------

SafeFileHandle::~SafeFileHandle() {
    close();
}

SafeFileHandle::SafeFileHandle(SafeFileHandle&& other) noexcept
    : fd_(std::exchange(other.fd_, -1))
    , path_(std::move(other.path_)) {}

SafeFileHandle& SafeFileHandle::operator=(SafeFileHandle&& other) noexcept {
    if (this != &other) {
        close();
        fd_ = std::exchange(other.fd_, -1);
        path_ = std::move(other.path_);
    }
    return *this;
}

void SafeFileHandle::close() noexcept {
    if (fd_ >= 0) {
        ::close(fd_);
        fd_ = -1;
    }
}

auto SafeFileHandle::release() noexcept -> int {
    return std::exchange(fd_, -1);
}

// ---------------------------------------------------------------------------
// SymlinkResolver
// ---------------------------------------------------------------------------

SymlinkResolver::SymlinkResolver(SecurityBoundary boundary, SymlinkResolverOptions options)
    : boundary_(std::move(boundary))
    , options_(std::move(options)) {
    boundary_.base_dir = normalize_lexical(boundary_.base_dir);
    for (auto& dir : boundary_.allowed_dirs) {
        dir = normalize_lexical(dir);
    }
}

auto SymlinkResolver::same_path(std::string_view a, std::string_view b) const -> bool {
    if (boundary_.case_insensitive) {
        return utils::to_lower(a) == utils::to_lower(b);
    }
    return a == b;
}

auto SymlinkResolver::resolve(std::string_view input) const -> SymlinkResolutionResult {
    SymlinkResolutionResult result;
    result.input_path = std::string(input);
    result.normalized_path = resolve_lexical(boundary_.base_dir, normalize_lexical(input));

    // Lexically outside: no filesystem call needed.
    if (input.find('\0') != std::string_view::npos || !boundary_.contains(result.normalized_path)) {
        result.is_within_boundary = false;
        audit_violation("path_outside_boundary", result, "normalized path outside boundary");
        return result;
    }

    struct stat st{};
    if (::lstat(result.normalized_path.c_str(), &st) != 0) {
        // Not there yet. Judge the location it would be created at, including
        // any symlinked ancestor directory.
        std::error_code ec;
        auto weak = fs::weakly_canonical(result.normalized_path, ec);
        if (ec) {
            result.is_within_boundary = false;
            audit_violation("path_unresolvable", result, "cannot canonicalize path: " + ec.message());
            return result;
        }
        auto canonical = normalize_lexical(weak.string());
        if (same_path(canonical, result.normalized_path)) {
            result.is_within_boundary = true;
            return result;
        }
        result.is_symlink = true;
        if (options_.policy == SymlinkPolicy::Deny) {
            result.is_within_boundary = false;
            audit_violation("symlink_denied", result, "path traverses a symlinked directory");
            return result;
        }
        result.is_within_boundary = boundary_.contains(canonical);
        if (!result.is_within_boundary) {
            audit_violation("symlink_escape", result, "symlinked ancestor resolves outside boundary");
        }
        return result;
    }

    if (!S_ISLNK(st.st_mode)) {
        auto canonical = real_path(result.normalized_path);
        if (!canonical) {
            result.is_within_boundary = false;
            audit_violation("path_unresolvable", result, "realpath failed on an existing entry");
            return result;
        }
        if (same_path(*canonical, result.normalized_path)) {
            result.real_path = result.normalized_path;
            result.is_within_boundary = true;
            return result;
        }

        // The entry itself is not a link but an ancestor directory is.
        result.is_symlink = true;
        if (options_.policy == SymlinkPolicy::Deny) {
            result.is_within_boundary = false;
            audit_violation("symlink_denied", result, "path traverses a symlinked directory");
            return result;
        }
        result.real_path = *canonical;
        result.is_within_boundary = boundary_.contains(*canonical);
        if (!result.is_within_boundary) {
            audit_violation("symlink_escape", result, "symlinked ancestor resolves outside boundary");
        }
        return result;
    }

    result.is_symlink = true;
    result.symlink_target = read_link(result.normalized_path);

    if (options_.policy == SymlinkPolicy::Deny) {
        result.is_within_boundary = false;
        audit_violation("symlink_denied", result, "symlinks are not permitted");
        return result;
    }

    auto canonical = real_path(result.normalized_path);
    if (!canonical) {
        result.is_within_boundary = false;
        audit_violation("symlink_broken", result, "symlink target cannot be resolved");
        return result;
    }

    result.real_path = *canonical;
    result.is_within_boundary = boundary_.contains(*canonical);
    if (!result.is_within_boundary) {
        audit_violation("symlink_escape", result, "symlink target outside boundary");
    } else {
        LOG_DEBUG("Symlink {} -> {} accepted", result.normalized_path, *canonical);
    }
    return result;
}

auto SymlinkResolver::validate_path(std::string_view input) const -> Result<std::string> {
    auto result = resolve(input);
    if (!result.is_within_boundary) {
        return std::unexpected(path_traversal_error(
            utils::sanitize_for_log(input), boundary_.base_dir));
    }
    return result.real_path.value_or(result.normalized_path);
}

auto SymlinkResolver::open_safe(std::string_view input, int flags, mode_t mode) const
    -> Result<SafeFileHandle> {
    auto validated = validate_path(input);
    if (!validated) return std::unexpected(validated.error());

    // Identity as seen at validation time; absent when the file is created by this call.
    auto checked = lstat_identity(*validated);

    if (options_.before_open) {
        options_.before_open(*validated);
    }

    int fd = ::open(validated->c_str(), flags | O_NOFOLLOW | O_CLOEXEC, mode);
    if (fd < 0) {
        int err = errno;
        if (err == ELOOP) {
            // A symlink appeared at the validated location.
            SymlinkResolutionResult r{std::string(input), *validated};
            audit_violation("toctou_race_detected", r, "symlink swapped in before open");
            return std::unexpected(make_error(ErrorCode::PathTraversal,
                "File replaced by a symlink between validation and open", *validated));
        }
        return std::unexpected(make_error(ErrorCode::IoError,
            "open failed", *validated + ": " + std::strerror(err)));
    }
    SafeFileHandle handle(fd, *validated);

    auto opened = fstat_identity(handle.fd());
    auto current = lstat_identity(*validated);
    bool swapped = !opened || !current || *opened != *current ||
                   (checked && *checked != *opened);
    if (swapped) {
        handle.close();
        SymlinkResolutionResult r{std::string(input), *validated};
        audit_violation("toctou_race_detected", r, "file identity changed between validation and open");
        return std::unexpected(make_error(ErrorCode::PathTraversal,
            "File identity changed between validation and open",
            "attempted=" + utils::sanitize_for_log(input) + " base=" + boundary_.base_dir));
    }

    LOG_DEBUG("open_safe: {} fd={}", handle.path(), handle.fd());
    return handle;
}

auto SymlinkResolver::blocking_executor() const -> awaitable<boost::asio::any_io_executor> {
    if (options_.blocking_executor) {
        co_return *options_.blocking_executor;
    }
    co_return co_await boost::asio::this_coro::executor;
}

auto SymlinkResolver::resolve_async(std::string input, std::stop_token stop) const
    -> awaitable<Result<SymlinkResolutionResult>> {
    if (stop.stop_requested()) {
        co_return make_fail(make_error(ErrorCode::Cancelled, "resolve cancelled", input));
    }

    auto executor = co_await blocking_executor();
    auto result = co_await infra::offload(executor, [this, input]() {
        return resolve(input);
    });

    if (stop.stop_requested()) {
        LOG_DEBUG("resolve cancelled: {}", utils::sanitize_for_log(input));
        co_return make_fail(make_error(ErrorCode::Cancelled, "resolve cancelled", input));
    }
    co_return std::move(result);
}

auto SymlinkResolver::open_safe_async(std::string input, int flags, mode_t mode,
                                      std::stop_token stop) const
    -> awaitable<Result<SafeFileHandle>> {
    if (stop.stop_requested()) {
        co_return make_fail(make_error(ErrorCode::Cancelled, "open_safe cancelled", input));
    }

    auto executor = co_await blocking_executor();
    auto result = co_await infra::offload(executor, [this, input, flags, mode]() {
        return open_safe(input, flags, mode);
    });

    if (stop.stop_requested()) {
        if (result) result->close();
        LOG_DEBUG("open_safe cancelled after open: {}", utils::sanitize_for_log(input));
        co_return make_fail(make_error(ErrorCode::Cancelled, "open_safe cancelled", input));
    }
    co_return std::move(result);
}

void SymlinkResolver::audit_violation(std::string_view type,
                                      const SymlinkResolutionResult& result,
                                      std::string_view reason) const {
    auto logged_input = utils::sanitize_for_log(result.input_path);
    LOG_WARN("Symlink check rejected {} ({}): {}", logged_input, type, reason);

    if (!options_.audit) return;
    try {
        json details = {
            {"inputPath", logged_input},
            {"normalizedPath", result.normalized_path},
            {"reason", std::string(reason)},
            {"policy", std::string(symlink_policy_to_string(options_.policy))},
            {"baseDir", boundary_.base_dir},
        };
        if (result.real_path) details["realPath"] = *result.real_path;
        if (result.symlink_target) details["symlinkTarget"] = *result.symlink_target;
        options_.audit->log_security_violation(type, options_.actor, std::move(details));
    } catch (const std::exception& e) {
        LOG_ERROR("Audit sink failed while recording symlink rejection: {}", e.what());
    }
}

} // namespace warden::security
