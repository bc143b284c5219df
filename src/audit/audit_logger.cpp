#include "warden/audit/audit_logger.hpp"

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <fstream>

#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

#include "warden/core/logger.hpp"
#include "warden/core/utils.hpp"

namespace warden::audit {

namespace fs = std::filesystem;

namespace {

/// Appends entries of `file` to `out`, newest first, until `out` holds
/// `limit` entries. Malformed lines are skipped.
void read_entries_newest_first(const fs::path& file, std::size_t limit,
                               std::vector<AuditEntry>& out) {
    std::ifstream in(file);
    if (!in.is_open()) return;

    std::vector<std::string> lines;
    std::string line;
    while (std::getline(in, line)) {
        if (!utils::trim(line).empty()) lines.push_back(std::move(line));
    }

    for (auto it = lines.rbegin(); it != lines.rend() && out.size() < limit; ++it) {
        try {
            out.push_back(json::parse(*it).get<AuditEntry>());
        } catch (const json::exception&) {
            // skip malformed
        }
    }
}

} // anonymous namespace

auto event_type_to_string(AuditEventType type) -> std::string_view {
    switch (type) {
        case AuditEventType::ApiKeyUsed: return "api_key_used";
        case AuditEventType::FileCreated: return "file_created";
        case AuditEventType::FileDeleted: return "file_deleted";
        case AuditEventType::FileModified: return "file_modified";
        case AuditEventType::SecretAccessed: return "secret_accessed";
        case AuditEventType::ValidationFailed: return "validation_failed";
        case AuditEventType::SecurityViolation: return "security_violation";
        case AuditEventType::CommandExecuted: return "command_executed";
        case AuditEventType::CommandBlocked: return "command_blocked";
    }
    return "security_violation";
}

auto audit_result_to_string(AuditResult result) -> std::string_view {
    switch (result) {
        case AuditResult::Success: return "success";
        case AuditResult::Failure: return "failure";
        case AuditResult::Blocked: return "blocked";
    }
    return "blocked";
}

void to_json(json& j, const AuditEntry& e) {
    j = json{
        {"timestamp", e.timestamp},
        {"correlationId", e.correlation_id},
        {"sessionId", e.session_id},
        {"type", e.event.type},
        {"actor", e.event.actor},
        {"resource", e.event.resource},
        {"action", e.event.action},
        {"result", e.event.result},
    };
    if (!e.event.details.is_null() && !e.event.details.empty()) {
        j["details"] = e.event.details;
    }
}

void from_json(const json& j, AuditEntry& e) {
    e.timestamp = j.value("timestamp", "");
    e.correlation_id = j.value("correlationId", "");
    e.session_id = j.value("sessionId", "");
    e.event.type = j.value("type", AuditEventType::SecurityViolation);
    e.event.actor = j.value("actor", "");
    e.event.resource = j.value("resource", "");
    e.event.action = j.value("action", "");
    e.event.result = j.value("result", AuditResult::Blocked);
    e.event.details = j.value("details", json::object());
}

// ---------------------------------------------------------------------------
// AuditSink convenience wrappers
// ---------------------------------------------------------------------------

void AuditSink::log_security_violation(std::string_view violation_type,
                                       std::string_view actor,
                                       json details) {
    log(AuditEvent{
        .type = AuditEventType::SecurityViolation,
        .actor = std::string(actor),
        .resource = std::string(violation_type),
        .action = "attempt",
        .result = AuditResult::Blocked,
        .details = std::move(details),
    });
}

void AuditSink::log_command_execution(std::string_view actor,
                                      std::string_view base_command,
                                      std::string_view action,
                                      AuditResult result,
                                      json details) {
    log(AuditEvent{
        .type = result == AuditResult::Blocked ? AuditEventType::CommandBlocked
                                               : AuditEventType::CommandExecuted,
        .actor = std::string(actor),
        .resource = std::string(base_command),
        .action = std::string(action),
        .result = result,
        .details = std::move(details),
    });
}

void AuditSink::log_file_created(std::string_view path, std::string_view actor) {
    log(AuditEvent{AuditEventType::FileCreated, std::string(actor), std::string(path),
                   "create", AuditResult::Success, json::object()});
}

void AuditSink::log_file_modified(std::string_view path, std::string_view actor) {
    log(AuditEvent{AuditEventType::FileModified, std::string(actor), std::string(path),
                   "modify", AuditResult::Success, json::object()});
}

void AuditSink::log_file_deleted(std::string_view path, std::string_view actor) {
    log(AuditEvent{AuditEventType::FileDeleted, std::string(actor), std::string(path),
                   "delete", AuditResult::Success, json::object()});
}

void AuditSink::log_validation_failed(std::string_view field,
                                      std::string_view actor,
                                      json details) {
    log(AuditEvent{AuditEventType::ValidationFailed, std::string(actor), std::string(field),
                   "validate", AuditResult::Failure, std::move(details)});
}

// ---------------------------------------------------------------------------
// AuditLogger
// ---------------------------------------------------------------------------

AuditLogger::AuditLogger(AuditLoggerOptions options)
    : options_(std::move(options))
    , session_id_(utils::generate_uuid())
    , correlation_id_(utils::generate_uuid()) {
    if (options_.log_dir.empty()) {
        options_.log_dir = default_data_dir() / "audit";
    }
    if (options_.max_files == 0) options_.max_files = 1;
    ensure_log_directory();
    start_new_file();
}

void AuditLogger::ensure_log_directory() {
    std::error_code ec;
    if (fs::exists(options_.log_dir, ec)) return;

    fs::create_directories(options_.log_dir, ec);
    if (ec) {
        LOG_ERROR("Audit: cannot create log directory {}: {}",
                  options_.log_dir.string(), ec.message());
        return;
    }
    fs::permissions(options_.log_dir, fs::perms::owner_all, fs::perm_options::replace, ec);
    if (ec) {
        LOG_WARN("Audit: cannot restrict permissions on {}: {}",
                 options_.log_dir.string(), ec.message());
    }
}

void AuditLogger::start_new_file() {
    // The sequence suffix keeps names unique when rotating within one millisecond.
    auto seq = std::to_string(file_seq_++);
    if (seq.size() < 4) seq.insert(0, 4 - seq.size(), '0');
    auto name = "audit-" + utils::timestamp_file_safe() + "-" + seq + ".jsonl";
    current_file_ = options_.log_dir / name;
    current_size_ = 0;
    prune_old_files();
}

void AuditLogger::prune_old_files() {
    struct LogFile {
        fs::path path;
        fs::file_time_type mtime;
    };

    std::error_code ec;
    std::vector<LogFile> files;
    for (fs::directory_iterator it(options_.log_dir, ec), end; !ec && it != end; it.increment(ec)) {
        auto name = it->path().filename().string();
        if (!name.starts_with("audit-") || !name.ends_with(".jsonl")) continue;
        std::error_code tec;
        auto mtime = fs::last_write_time(it->path(), tec);
        if (tec) continue;
        files.push_back({it->path(), mtime});
    }
    if (ec) {
        LOG_DEBUG("Audit: rotation scan of {} failed: {}", options_.log_dir.string(), ec.message());
        return;
    }

    std::ranges::sort(files, [](const LogFile& a, const LogFile& b) {
        if (a.mtime != b.mtime) return a.mtime > b.mtime;
        return a.path.filename().string() > b.path.filename().string();
    });

    // The file about to be written counts against the limit.
    std::size_t keep = options_.max_files > 0 ? options_.max_files - 1 : 0;
    for (std::size_t i = keep; i < files.size(); ++i) {
        std::error_code rec;
        fs::remove(files[i].path, rec);
        if (rec) {
            LOG_DEBUG("Audit: failed to remove {}: {}", files[i].path.string(), rec.message());
        }
    }
}

void AuditLogger::write_line(const std::string& line) {
    if (current_size_ >= options_.max_file_size) {
        start_new_file();
    }
    if (!current_file_) return;

    int fd = ::open(current_file_->c_str(), O_WRONLY | O_CREAT | O_APPEND | O_CLOEXEC, 0600);
    if (fd < 0) {
        LOG_ERROR("Audit log write failed ({}): {}", current_file_->string(), std::strerror(errno));
        LOG_ERROR("Audit entry: {}", line);
        return;
    }

    std::size_t written = 0;
    while (written < line.size()) {
        auto n = ::write(fd, line.data() + written, line.size() - written);
        if (n < 0) {
            if (errno == EINTR) continue;
            LOG_ERROR("Audit log write failed ({}): {}", current_file_->string(), std::strerror(errno));
            break;
        }
        written += static_cast<std::size_t>(n);
    }
    ::close(fd);
    current_size_ += written;
}

void AuditLogger::log_to_console(const AuditEntry& entry) const {
    const auto& e = entry.event;
    if (e.result == AuditResult::Success) {
        LOG_INFO("audit {}: {} {} {} ({})", event_type_to_string(e.type), e.actor,
                 e.action, e.resource, audit_result_to_string(e.result));
    } else {
        LOG_WARN("audit {}: {} {} {} ({})", event_type_to_string(e.type), e.actor,
                 e.action, e.resource, audit_result_to_string(e.result));
    }
}

void AuditLogger::log(AuditEvent event) {
    std::lock_guard lock(mutex_);

    AuditEntry entry{
        .timestamp = utils::timestamp_iso(),
        .correlation_id = correlation_id_,
        .session_id = session_id_,
        .event = std::move(event),
    };

    std::string line;
    try {
        line = json(entry).dump(-1, ' ', false, json::error_handler_t::replace) + "\n";
    } catch (const json::exception& ex) {
        LOG_ERROR("Audit: failed to serialize entry: {}", ex.what());
        return;
    }

    write_line(line);

    if (options_.console_output) {
        log_to_console(entry);
    }
}

void AuditLogger::set_correlation_id(std::string id) {
    std::lock_guard lock(mutex_);
    correlation_id_ = std::move(id);
}

auto AuditLogger::new_correlation_id() -> std::string {
    std::lock_guard lock(mutex_);
    correlation_id_ = utils::generate_uuid();
    return correlation_id_;
}

auto AuditLogger::correlation_id() const -> std::string {
    std::lock_guard lock(mutex_);
    return correlation_id_;
}

void AuditLogger::set_session_id(std::string id) {
    std::lock_guard lock(mutex_);
    session_id_ = std::move(id);
}

auto AuditLogger::session_id() const -> std::string {
    std::lock_guard lock(mutex_);
    return session_id_;
}

auto AuditLogger::current_log_file() const -> std::optional<fs::path> {
    std::lock_guard lock(mutex_);
    return current_file_;
}

auto AuditLogger::recent_entries(std::size_t limit) const -> std::vector<AuditEntry> {
    std::optional<fs::path> file;
    {
        std::lock_guard lock(mutex_);
        file = current_file_;
    }
    std::vector<AuditEntry> entries;
    if (file) read_entries_newest_first(*file, limit, entries);
    return entries;
}

auto read_audit_entries(const std::filesystem::path& log_dir, std::size_t limit)
    -> std::vector<AuditEntry> {
    std::error_code ec;
    std::vector<fs::path> files;
    for (fs::directory_iterator it(log_dir, ec), end; !ec && it != end; it.increment(ec)) {
        auto name = it->path().filename().string();
        if (name.starts_with("audit-") && name.ends_with(".jsonl")) {
            files.push_back(it->path());
        }
    }
    if (ec) {
        LOG_DEBUG("Audit: cannot list {}: {}", log_dir.string(), ec.message());
    }

    // Names embed a sortable timestamp and sequence number.
    std::ranges::sort(files, [](const fs::path& a, const fs::path& b) {
        return a.filename().string() > b.filename().string();
    });

    std::vector<AuditEntry> entries;
    for (const auto& file : files) {
        if (entries.size() >= limit) break;
        read_entries_newest_first(file, limit, entries);
    }
    return entries;
}

} // namespace warden::audit
