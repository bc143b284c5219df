#pragma once

#include <memory>

#include <boost/asio/thread_pool.hpp>

#include "warden/audit/audit_logger.hpp"
#include "warden/core/config.hpp"
#include "warden/core/error.hpp"
#include "warden/security/command_sanitizer.hpp"
#include "warden/security/input_validator.hpp"
#include "warden/security/path_sanitizer.hpp"
#include "warden/security/secure_file_ops.hpp"
#include "warden/security/symlink_resolver.hpp"

namespace warden::security {

/// Every validator built from one Config, sharing one audit sink and one
/// worker pool for the asynchronous operations.
///
/// The context owns these objects; destroying it joins the worker pool.
/// Validators are immutable, so a new configuration means a new context.
class SecurityContext {
    struct PrivateTag {
        explicit PrivateTag() = default;
    };

public:
    /// Use from_config; the tag keeps construction inside this class.
    explicit SecurityContext(PrivateTag) {}

    /// `audit_override` replaces the sink that config.audit would create
    /// (tests pass a recording sink; nullptr keeps the configured one).
    static auto from_config(const Config& config,
                            std::shared_ptr<audit::AuditSink> audit_override = nullptr)
        -> Result<std::unique_ptr<SecurityContext>>;

    ~SecurityContext();

    SecurityContext(const SecurityContext&) = delete;
    SecurityContext& operator=(const SecurityContext&) = delete;

    [[nodiscard]] auto paths() const -> const PathSanitizer& { return *path_sanitizer_; }
    [[nodiscard]] auto symlinks() const -> const SymlinkResolver& { return *symlink_resolver_; }
    [[nodiscard]] auto inputs() const -> const InputValidator& { return *input_validator_; }
    [[nodiscard]] auto commands() const -> const CommandSanitizer& { return *command_sanitizer_; }
    [[nodiscard]] auto files() const -> const SecureFileOps& { return *file_ops_; }
    [[nodiscard]] auto audit() const -> const std::shared_ptr<audit::AuditSink>& { return audit_; }
    [[nodiscard]] auto boundary() const -> const SecurityBoundary& { return boundary_; }

private:
    std::unique_ptr<boost::asio::thread_pool> pool_;
    SecurityBoundary boundary_;
    std::shared_ptr<audit::AuditSink> audit_;
    std::shared_ptr<const PathSanitizer> path_sanitizer_;
    std::shared_ptr<const SymlinkResolver> symlink_resolver_;
    std::shared_ptr<const InputValidator> input_validator_;
    std::shared_ptr<const CommandSanitizer> command_sanitizer_;
    std::shared_ptr<const SecureFileOps> file_ops_;
};

} // namespace warden::security
