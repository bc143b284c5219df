#include "warden/security/context.hpp"

#include "warden/core/logger.hpp"

namespace warden::security {

namespace {

constexpr std::size_t kWorkerThreads = 2;

auto select_whitelist(const Config& config) -> Result<CommandWhitelist> {
    if (config.whitelist) {
        return whitelist_from_json(*config.whitelist);
    }
    if (config.whitelist_file) {
        return load_whitelist_file(*config.whitelist_file);
    }
    return default_command_whitelist();
}

} // anonymous namespace

SecurityContext::~SecurityContext() {
    if (pool_) {
        pool_->join();
    }
}

auto SecurityContext::from_config(const Config& config,
                                  std::shared_ptr<audit::AuditSink> audit_override)
    -> Result<std::unique_ptr<SecurityContext>> {
    if (auto valid = validate_config(config); !valid) {
        return std::unexpected(valid.error());
    }

    auto boundary = make_boundary(config.boundary);
    if (!boundary) return std::unexpected(boundary.error());

    auto whitelist = select_whitelist(config);
    if (!whitelist) return std::unexpected(whitelist.error());

    auto ctx = std::make_unique<SecurityContext>(PrivateTag{});
    ctx->pool_ = std::make_unique<boost::asio::thread_pool>(kWorkerThreads);
    ctx->boundary_ = std::move(*boundary);

    if (audit_override) {
        ctx->audit_ = std::move(audit_override);
    } else if (config.audit.enabled) {
        ctx->audit_ = std::make_shared<audit::AuditLogger>(audit::AuditLoggerOptions{
            .log_dir = config.audit.log_dir,
            .max_file_size = config.audit.max_file_size,
            .max_files = config.audit.max_files,
            .console_output = config.audit.console_output,
        });
    }

    boost::asio::any_io_executor executor = ctx->pool_->get_executor();

    ctx->path_sanitizer_ = std::make_shared<PathSanitizer>(ctx->boundary_, PathSanitizerOptions{
        .audit = ctx->audit_,
        .actor = config.actor,
    });

    ctx->symlink_resolver_ = std::make_shared<SymlinkResolver>(ctx->boundary_, SymlinkResolverOptions{
        .policy = config.symlink_policy,
        .audit = ctx->audit_,
        .actor = config.actor,
        .blocking_executor = executor,
        .before_open = {},
    });

    ctx->input_validator_ = std::make_shared<InputValidator>(ctx->path_sanitizer_, ctx->symlink_resolver_,
        InputValidatorOptions{
            .audit = ctx->audit_,
            .actor = config.actor,
        });

    ctx->command_sanitizer_ = std::make_shared<CommandSanitizer>(CommandSanitizerOptions{
        .whitelist = std::move(*whitelist),
        .strict_mode = config.strict_mode,
        .audit = ctx->audit_,
        .actor = config.actor,
        .default_timeout = std::chrono::milliseconds(config.exec.timeout_ms),
        .max_output_bytes = config.exec.max_output_bytes,
        .blocking_executor = executor,
    });

    ctx->file_ops_ = std::make_shared<SecureFileOps>(ctx->path_sanitizer_, ctx->symlink_resolver_,
        SecureFileOpsOptions{
            .audit = ctx->audit_,
            .actor = config.actor,
        });

    LOG_INFO("Security context ready: base={} allowed_dirs={} policy={} strict={} commands={}",
             ctx->boundary_.base_dir, ctx->boundary_.allowed_dirs.size(),
             symlink_policy_to_string(config.symlink_policy), config.strict_mode,
             ctx->command_sanitizer_->whitelist().size());
    return ctx;
}

} // namespace warden::security
