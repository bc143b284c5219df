#pragma once

#include <memory>
#include <string>
#include <string_view>

#include <spdlog/spdlog.h>

namespace warden {

/// Process-wide diagnostic logger (spdlog, colored, on stderr).
///
/// Diagnostics never go to stdout, which is reserved for command output.
/// Audit records are not written here; see audit::AuditLogger.
class Logger {
public:
    /// (Re)creates the named logger. Calling it again replaces the previous one.
    static void init(std::string_view name = "warden", std::string_view level = "info");

    /// Lazily initializes with the defaults on first use.
    static auto get() -> std::shared_ptr<spdlog::logger>&;

    /// Accepts trace, debug, info, warn, error, critical and off. Anything
    /// else selects info and returns false.
    static auto set_level(std::string_view level) -> bool;

    static void flush();
};

} // namespace warden

#define LOG_TRACE(...) SPDLOG_LOGGER_TRACE(::warden::Logger::get(), __VA_ARGS__)
#define LOG_DEBUG(...) SPDLOG_LOGGER_DEBUG(::warden::Logger::get(), __VA_ARGS__)
#define LOG_INFO(...)  SPDLOG_LOGGER_INFO(::warden::Logger::get(), __VA_ARGS__)
#define LOG_WARN(...)  SPDLOG_LOGGER_WARN(::warden::Logger::get(), __VA_ARGS__)
#define LOG_ERROR(...) SPDLOG_LOGGER_ERROR(::warden::Logger::get(), __VA_ARGS__)
#define LOG_FATAL(...) SPDLOG_LOGGER_CRITICAL(::warden::Logger::get(), __VA_ARGS__)
