#include "warden/core/logger.hpp"

#include <array>
#include <utility>

#include <spdlog/sinks/stdout_color_sinks.h>

namespace warden {

namespace {

std::shared_ptr<spdlog::logger> g_logger;

constexpr std::array<std::pair<std::string_view, spdlog::level::level_enum>, 7> kLevels = {{
    {"trace", spdlog::level::trace},
    {"debug", spdlog::level::debug},
    {"info", spdlog::level::info},
    {"warn", spdlog::level::warn},
    {"error", spdlog::level::err},
    {"critical", spdlog::level::critical},
    {"off", spdlog::level::off},
}};

} // anonymous namespace

void Logger::init(std::string_view name, std::string_view level) {
    spdlog::drop(std::string(name));
    g_logger = spdlog::stderr_color_mt(std::string(name));
    g_logger->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] [%s:%#] %v");
    set_level(level);
}

auto Logger::get() -> std::shared_ptr<spdlog::logger>& {
    if (!g_logger) {
        init();
    }
    return g_logger;
}

auto Logger::set_level(std::string_view level) -> bool {
    auto& logger = get();
    for (const auto& [name, value] : kLevels) {
        if (name == level) {
            logger->set_level(value);
            return true;
        }
    }
    logger->set_level(spdlog::level::info);
    return false;
}

void Logger::flush() {
    if (g_logger) g_logger->flush();
}

} // namespace warden
