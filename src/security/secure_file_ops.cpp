#include "warden/security/secure_file_ops.hpp"

#include <algorithm>
#include <array>
#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <filesystem>

#include <fcntl.h>
#include <unistd.h>

#include "warden/core/logger.hpp"
#include "warden/core/utils.hpp"

namespace warden::security {

namespace fs = std::filesystem;

namespace {

auto io_error(std::string message, const std::string& path, std::string_view reason) -> Error {
    return make_error(ErrorCode::IoError, std::move(message), path + ": " + std::string(reason));
}

} // anonymous namespace

SecureFileOps::SecureFileOps(std::shared_ptr<const PathSanitizer> sanitizer,
                             std::shared_ptr<const SymlinkResolver> resolver,
                             SecureFileOpsOptions options)
    : sanitizer_(std::move(sanitizer))
    , resolver_(std::move(resolver))
    , options_(std::move(options)) {}

SecureFileOps::~SecureFileOps() {
    if (options_.auto_cleanup) {
        cleanup_all();
    }
}

auto SecureFileOps::resolve(std::string_view path) const -> Result<std::string> {
    auto sanitized = sanitizer_->sanitize_or_error(path);
    if (!sanitized) return std::unexpected(sanitized.error());
    return resolver_->validate_path(*sanitized);
}

void SecureFileOps::record(void (audit::AuditSink::*fn)(std::string_view, std::string_view),
                          const std::string& path) const {
    if (!options_.audit) return;
    try {
        ((*options_.audit).*fn)(path, options_.actor);
    } catch (const std::exception& e) {
        LOG_ERROR("Audit sink failed for {}: {}", path, e.what());
    }
}

auto SecureFileOps::create_directories(const std::string& dir) const -> VoidResult {
    // Collect the ancestors that do not exist yet so only those get dir_mode.
    std::vector<fs::path> missing;
    std::error_code ec;
    for (fs::path p(dir); !p.empty() && !fs::exists(p, ec); p = p.parent_path()) {
        missing.push_back(p);
        if (p == p.parent_path()) break;
    }

    fs::create_directories(dir, ec);
    if (ec) return std::unexpected(io_error("Cannot create directory", dir, ec.message()));

    for (const auto& p : missing) {
        fs::permissions(p, static_cast<fs::perms>(options_.dir_mode), fs::perm_options::replace, ec);
        if (ec) {
            LOG_WARN("Cannot set permissions on {}: {}", p.string(), ec.message());
        }
    }
    return {};
}

auto SecureFileOps::read_file(std::string_view path) const -> Result<std::string> {
    auto validated = resolve(path);
    if (!validated) return std::unexpected(validated.error());

    auto handle = resolver_->open_safe(*validated, O_RDONLY);
    if (!handle) return std::unexpected(handle.error());

    std::string content;
    std::array<char, 8192> buf{};
    for (;;) {
        auto n = ::read(handle->fd(), buf.data(), buf.size());
        if (n < 0) {
            if (errno == EINTR) continue;
            return std::unexpected(io_error("Read failed", *validated, std::strerror(errno)));
        }
        if (n == 0) break;
        content.append(buf.data(), static_cast<std::size_t>(n));
    }
    return content;
}

auto SecureFileOps::write_with_flags(std::string_view path, std::string_view content, int flags) const
    -> VoidResult {
    auto validated = resolve(path);
    if (!validated) return std::unexpected(validated.error());

    auto parent = fs::path(*validated).parent_path().string();
    if (auto made = create_directories(parent); !made) {
        return std::unexpected(made.error());
    }

    std::error_code ec;
    bool existed = fs::exists(*validated, ec);

    auto handle = resolver_->open_safe(*validated, O_WRONLY | O_CREAT | flags, options_.file_mode);
    if (!handle) return std::unexpected(handle.error());

    std::size_t written = 0;
    while (written < content.size()) {
        auto n = ::write(handle->fd(), content.data() + written, content.size() - written);
        if (n < 0) {
            if (errno == EINTR) continue;
            return std::unexpected(io_error("Write failed", *validated, std::strerror(errno)));
        }
        written += static_cast<std::size_t>(n);
    }
    handle->close();

    record(existed ? &audit::AuditSink::log_file_modified : &audit::AuditSink::log_file_created,
          *validated);
    return {};
}

auto SecureFileOps::write_file(std::string_view path, std::string_view content) const -> VoidResult {
    return write_with_flags(path, content, O_TRUNC);
}

auto SecureFileOps::append_file(std::string_view path, std::string_view content) const -> VoidResult {
    return write_with_flags(path, content, O_APPEND);
}

auto SecureFileOps::make_directory(std::string_view path) const -> VoidResult {
    auto validated = resolve(path);
    if (!validated) return std::unexpected(validated.error());
    return create_directories(*validated);
}

auto SecureFileOps::remove(std::string_view path, bool recursive) const -> VoidResult {
    auto validated = resolve(path);
    if (!validated) return std::unexpected(validated.error());

    const auto& boundary = resolver_->boundary();
    auto is_root = [&](const std::string& dir) {
        return is_path_within(dir, *validated, boundary.case_insensitive);
    };
    if (is_root(boundary.base_dir) || std::ranges::any_of(boundary.allowed_dirs, is_root)) {
        return std::unexpected(make_error(ErrorCode::InvalidArgument,
            "Refusing to remove a boundary root", *validated));
    }

    std::error_code ec;
    if (!fs::exists(fs::symlink_status(*validated, ec))) {
        return std::unexpected(make_error(ErrorCode::NotFound, "No such file or directory", *validated));
    }

    if (recursive) {
        fs::remove_all(*validated, ec);
    } else {
        fs::remove(*validated, ec);
    }
    if (ec) return std::unexpected(io_error("Remove failed", *validated, ec.message()));

    untrack(*validated);
    record(&audit::AuditSink::log_file_deleted, *validated);
    return {};
}

auto SecureFileOps::rename(std::string_view from, std::string_view to) const -> VoidResult {
    auto source = resolve(from);
    if (!source) return std::unexpected(source.error());
    auto target = resolve(to);
    if (!target) return std::unexpected(target.error());

    std::error_code ec;
    fs::rename(*source, *target, ec);
    if (ec) return std::unexpected(io_error("Rename failed", *source, ec.message()));

    record(&audit::AuditSink::log_file_deleted, *source);
    record(&audit::AuditSink::log_file_created, *target);
    return {};
}

auto SecureFileOps::list_directory(std::string_view path) const -> Result<std::vector<std::string>> {
    auto validated = resolve(path);
    if (!validated) return std::unexpected(validated.error());

    std::vector<std::string> names;
    std::error_code ec;
    for (fs::directory_iterator it(*validated, ec), end; !ec && it != end; it.increment(ec)) {
        names.push_back(it->path().filename().string());
    }
    if (ec) return std::unexpected(io_error("Cannot list directory", *validated, ec.message()));

    std::ranges::sort(names);
    return names;
}

auto SecureFileOps::exists(std::string_view path) const -> bool {
    if (!sanitizer_->is_valid(path)) return false;
    auto validated = resolve(path);
    if (!validated) return false;
    std::error_code ec;
    return fs::exists(*validated, ec);
}

// ---------------------------------------------------------------------------
// Temporary files
// ---------------------------------------------------------------------------

auto SecureFileOps::create_temp_dir() const -> Result<std::string> {
    std::error_code ec;
    fs::path root = options_.temp_root.empty() ? fs::temp_directory_path(ec)
                                                : fs::path(options_.temp_root);
    if (ec) return std::unexpected(io_error("No temp directory", options_.temp_root, ec.message()));

    std::string pattern = (root / (options_.temp_prefix + "XXXXXX")).string();
    if (::mkdtemp(pattern.data()) == nullptr) {
        return std::unexpected(io_error("Cannot create temp directory", pattern, std::strerror(errno)));
    }
    fs::permissions(pattern, static_cast<fs::perms>(options_.dir_mode), fs::perm_options::replace, ec);
    if (ec) {
        LOG_WARN("Cannot set permissions on {}: {}", pattern, ec.message());
    }

    track(pattern);
    LOG_DEBUG("Created temp directory {}", pattern);
    return pattern;
}

auto SecureFileOps::create_temp_file(std::string_view content, std::string_view extension) const
    -> Result<std::string> {
    auto dir = create_temp_dir();
    if (!dir) return std::unexpected(dir.error());

    auto file = (fs::path(*dir) / (utils::generate_uuid() + std::string(extension))).string();
    int fd = ::open(file.c_str(), O_WRONLY | O_CREAT | O_EXCL | O_NOFOLLOW | O_CLOEXEC,
                    options_.file_mode);
    if (fd < 0) {
        return std::unexpected(io_error("Cannot create temp file", file, std::strerror(errno)));
    }
    SafeFileHandle handle(fd, file);

    std::size_t written = 0;
    while (written < content.size()) {
        auto n = ::write(handle.fd(), content.data() + written, content.size() - written);
        if (n < 0) {
            if (errno == EINTR) continue;
            return std::unexpected(io_error("Write failed", file, std::strerror(errno)));
        }
        written += static_cast<std::size_t>(n);
    }
    return file;
}

void SecureFileOps::track(const std::string& path) const {
    std::lock_guard lock(temp_mutex_);
    tracked_.insert(path);
}

void SecureFileOps::untrack(const std::string& path) const {
    std::lock_guard lock(temp_mutex_);
    tracked_.erase(path);
}

auto SecureFileOps::is_tracked(const std::string& path) const -> bool {
    std::lock_guard lock(temp_mutex_);
    return tracked_.contains(path);
}

auto SecureFileOps::tracked_count() const -> std::size_t {
    std::lock_guard lock(temp_mutex_);
    return tracked_.size();
}

auto SecureFileOps::cleanup_all() const -> std::size_t {
    std::set<std::string> paths;
    {
        std::lock_guard lock(temp_mutex_);
        paths.swap(tracked_);
    }

    std::size_t removed = 0;
    for (const auto& path : paths) {
        std::error_code ec;
        if (fs::remove_all(path, ec) > 0) {
            ++removed;
        }
        if (ec) {
            LOG_WARN("Temp cleanup failed for {}: {}", path, ec.message());
        }
    }
    if (removed > 0) {
        LOG_DEBUG("Removed {} temp path(s)", removed);
    }
    return removed;
}

} // namespace warden::security
