#pragma once

#include <filesystem>
#include <mutex>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

#include <unistd.h>

#include <boost/asio.hpp>

#include "warden/audit/audit_logger.hpp"

namespace warden::test {

/// Scratch directory under the system temp dir, removed on destruction.
/// `path` is canonical so it can serve directly as a boundary base.
struct TmpDir {
    std::filesystem::path path;

    explicit TmpDir(std::string_view tag) {
        static int counter = 0;
        auto raw = std::filesystem::temp_directory_path() /
            ("warden_" + std::string(tag) + "_" + std::to_string(::getpid()) + "_" +
             std::to_string(counter++));
        std::filesystem::create_directories(raw);
        path = std::filesystem::canonical(raw);
    }
    ~TmpDir() {
        std::error_code ec;
        std::filesystem::remove_all(path, ec);
    }

    [[nodiscard]] auto str() const -> std::string { return path.string(); }
};

/// Keeps every event in memory.
class RecordingSink : public audit::AuditSink {
public:
    void log(audit::AuditEvent event) override {
        std::lock_guard lock(mutex_);
        events_.push_back(std::move(event));
    }

    [[nodiscard]] auto events() const -> std::vector<audit::AuditEvent> {
        std::lock_guard lock(mutex_);
        return events_;
    }

    [[nodiscard]] auto count(std::string_view resource) const -> std::size_t {
        std::lock_guard lock(mutex_);
        std::size_t n = 0;
        for (const auto& e : events_) {
            if (e.resource == resource) ++n;
        }
        return n;
    }

private:
    mutable std::mutex mutex_;
    std::vector<audit::AuditEvent> events_;
};

/// A sink that is always unavailable.
class ThrowingSink : public audit::AuditSink {
public:
    void log(audit::AuditEvent) override {
        throw std::runtime_error("audit backend unavailable");
    }
};

/// Helper to run a coroutine synchronously in tests.
template <typename T>
T run_sync(boost::asio::awaitable<T> coro) {
    boost::asio::io_context ioc;
    T result;
    boost::asio::co_spawn(ioc,
        [&]() -> boost::asio::awaitable<void> {
            result = co_await std::move(coro);
        },
        boost::asio::detached);
    ioc.run();
    return result;
}

} // namespace warden::test
