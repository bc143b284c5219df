#pragma once

#include <memory>
#include <mutex>
#include <set>
#include <string>
#include <string_view>
#include <vector>

#include <sys/types.h>

#include "warden/audit/audit_logger.hpp"
#include "warden/core/error.hpp"
#include "warden/security/path_sanitizer.hpp"
#include "warden/security/symlink_resolver.hpp"

namespace warden::security {

struct SecureFileOpsOptions {
    std::shared_ptr<audit::AuditSink> audit;
    std::string actor = "system";
    mode_t file_mode = 0600;
    mode_t dir_mode = 0700;
    /// Parent of create_temp_dir() directories. Empty means the system temp
    /// directory; temp paths need not lie inside the boundary.
    std::string temp_root;
    std::string temp_prefix = "warden-";
    /// Remove every tracked temp path when the SecureFileOps is destroyed.
    bool auto_cleanup = true;
};

/// File operations confined to a security boundary.
///
/// Every path goes through PathSanitizer first (cheap string checks) and
/// then SymlinkResolver, whose filesystem-aware answer is the one that
/// decides. Reads and writes go through SymlinkResolver::open_safe.
class SecureFileOps {
public:
    SecureFileOps(std::shared_ptr<const PathSanitizer> sanitizer,
                  std::shared_ptr<const SymlinkResolver> resolver,
                  SecureFileOpsOptions options = {});
    ~SecureFileOps();

    SecureFileOps(const SecureFileOps&) = delete;
    SecureFileOps& operator=(const SecureFileOps&) = delete;

    /// Absolute, validated path for `path`, or PathTraversal.
    [[nodiscard]] auto resolve(std::string_view path) const -> Result<std::string>;

    [[nodiscard]] auto read_file(std::string_view path) const -> Result<std::string>;
    /// Creates missing parent directories. Audited as created or modified.
    [[nodiscard]] auto write_file(std::string_view path, std::string_view content) const -> VoidResult;
    [[nodiscard]] auto append_file(std::string_view path, std::string_view content) const -> VoidResult;
    [[nodiscard]] auto make_directory(std::string_view path) const -> VoidResult;
    /// Directories need `recursive`. Refuses to remove a boundary root.
    [[nodiscard]] auto remove(std::string_view path, bool recursive = false) const -> VoidResult;
    [[nodiscard]] auto rename(std::string_view from, std::string_view to) const -> VoidResult;
    /// Sorted entry names.
    [[nodiscard]] auto list_directory(std::string_view path) const -> Result<std::vector<std::string>>;
    /// False for missing and for rejected paths.
    [[nodiscard]] auto exists(std::string_view path) const -> bool;

    // -- Temporary files --------------------------------------------------

    /// A fresh dir_mode directory under temp_root, tracked for cleanup.
    [[nodiscard]] auto create_temp_dir() const -> Result<std::string>;
    /// Writes `content` to a new file_mode file in a fresh temp directory
    /// and returns the file path. The directory is what gets tracked.
    [[nodiscard]] auto create_temp_file(std::string_view content,
                                        std::string_view extension = ".txt") const
        -> Result<std::string>;

    void track(const std::string& path) const;
    /// Stops tracking without deleting.
    void untrack(const std::string& path) const;
    [[nodiscard]] auto is_tracked(const std::string& path) const -> bool;
    [[nodiscard]] auto tracked_count() const -> std::size_t;
    /// Removes every tracked path; failures are logged and skipped.
    /// Returns the number of paths removed.
    auto cleanup_all() const -> std::size_t;

private:
    auto write_with_flags(std::string_view path, std::string_view content, int flags) const -> VoidResult;
    auto create_directories(const std::string& dir) const -> VoidResult;
    void record(void (audit::AuditSink::*fn)(std::string_view, std::string_view),
               const std::string& path) const;

    std::shared_ptr<const PathSanitizer> sanitizer_;
    std::shared_ptr<const SymlinkResolver> resolver_;
    SecureFileOpsOptions options_;

    mutable std::mutex temp_mutex_;
    mutable std::set<std::string> tracked_;
};

} // namespace warden::security
