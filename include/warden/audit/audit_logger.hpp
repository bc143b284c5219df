#pragma once

#include <cstdint>
#include <filesystem>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <nlohmann/json.hpp>

#include "warden/core/config.hpp"

namespace warden::audit {

using json = nlohmann::json;

enum class AuditEventType {
    ApiKeyUsed,
    FileCreated,
    FileDeleted,
    FileModified,
    SecretAccessed,
    ValidationFailed,
    SecurityViolation,
    CommandExecuted,
    CommandBlocked,
};

NLOHMANN_JSON_SERIALIZE_ENUM(AuditEventType, {
    {AuditEventType::ApiKeyUsed, "api_key_used"},
    {AuditEventType::FileCreated, "file_created"},
    {AuditEventType::FileDeleted, "file_deleted"},
    {AuditEventType::FileModified, "file_modified"},
    {AuditEventType::SecretAccessed, "secret_accessed"},
    {AuditEventType::ValidationFailed, "validation_failed"},
    {AuditEventType::SecurityViolation, "security_violation"},
    {AuditEventType::CommandExecuted, "command_executed"},
    {AuditEventType::CommandBlocked, "command_blocked"},
})

enum class AuditResult {
    Success,
    Failure,
    Blocked,
};

NLOHMANN_JSON_SERIALIZE_ENUM(AuditResult, {
    {AuditResult::Success, "success"},
    {AuditResult::Failure, "failure"},
    {AuditResult::Blocked, "blocked"},
})

auto event_type_to_string(AuditEventType type) -> std::string_view;
auto audit_result_to_string(AuditResult result) -> std::string_view;

/// What a caller reports; the sink stamps time and correlation ids.
struct AuditEvent {
    AuditEventType type = AuditEventType::SecurityViolation;
    std::string actor;
    std::string resource;
    std::string action;
    AuditResult result = AuditResult::Blocked;
    json details = json::object();
};

/// A persisted audit record.
struct AuditEntry {
    std::string timestamp;
    std::string correlation_id;
    std::string session_id;
    AuditEvent event;
};

void to_json(json& j, const AuditEntry& e);
void from_json(const json& j, AuditEntry& e);

/// Destination for audit events. Validators hold a shared_ptr to one and
/// report every rejection through it before returning.
///
/// Implementations may fail; callers in this library catch and log those
/// failures so that an unavailable sink never changes a security decision.
class AuditSink {
public:
    virtual ~AuditSink() = default;

    virtual void log(AuditEvent event) = 0;

    /// security_violation / resource=violation_type / action=attempt / blocked
    void log_security_violation(std::string_view violation_type,
                                std::string_view actor,
                                json details = json::object());

    /// command_executed for Success/Failure, command_blocked for Blocked.
    void log_command_execution(std::string_view actor,
                               std::string_view base_command,
                               std::string_view action,
                               AuditResult result,
                               json details = json::object());

    void log_file_created(std::string_view path, std::string_view actor);
    void log_file_modified(std::string_view path, std::string_view actor);
    void log_file_deleted(std::string_view path, std::string_view actor);
    void log_validation_failed(std::string_view field,
                               std::string_view actor,
                               json details = json::object());
};

struct AuditLoggerOptions {
    std::filesystem::path log_dir;
    std::uint64_t max_file_size = kDefaultAuditMaxFileSize;
    std::size_t max_files = kDefaultAuditMaxFiles;
    bool console_output = false;
};

/// Append-only JSONL audit trail.
///
/// Files are named audit-<timestamp>.jsonl and created with mode 0600 in a
/// 0700 directory. A new file is started once the current one reaches
/// max_file_size; only the newest max_files files are kept. Write failures
/// are reported through the process logger and never propagate.
class AuditLogger : public AuditSink {
public:
    explicit AuditLogger(AuditLoggerOptions options);

    void log(AuditEvent event) override;

    void set_correlation_id(std::string id);
    auto new_correlation_id() -> std::string;
    [[nodiscard]] auto correlation_id() const -> std::string;

    void set_session_id(std::string id);
    [[nodiscard]] auto session_id() const -> std::string;

    [[nodiscard]] auto log_dir() const -> const std::filesystem::path& { return options_.log_dir; }
    [[nodiscard]] auto current_log_file() const -> std::optional<std::filesystem::path>;

    /// Most recent entries of the current file, newest first. Malformed
    /// lines are skipped.
    [[nodiscard]] auto recent_entries(std::size_t limit = 100) const -> std::vector<AuditEntry>;

private:
    void ensure_log_directory();
    void start_new_file();
    void prune_old_files();
    void write_line(const std::string& line);
    void log_to_console(const AuditEntry& entry) const;

    AuditLoggerOptions options_;
    mutable std::mutex mutex_;
    std::string session_id_;
    std::string correlation_id_;
    std::optional<std::filesystem::path> current_file_;
    std::uint64_t current_size_ = 0;
    unsigned file_seq_ = 0;
};

/// Reads up to `limit` entries from every audit file in `log_dir`, newest
/// file first and newest entry first within a file. Does not write.
auto read_audit_entries(const std::filesystem::path& log_dir, std::size_t limit = 100)
    -> std::vector<AuditEntry>;

} // namespace warden::audit
