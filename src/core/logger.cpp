#include "flowgate/core/logger.hpp"

#include <array>
#include <mutex>
#include <string>
#include <utility>

#include <spdlog/sinks/stdout_color_sinks.h>

namespace flowgate {

namespace {

std::shared_ptr<spdlog::logger> g_logger;
std::mutex g_init_mutex;

constexpr std::array<std::pair<std::string_view, spdlog::level::level_enum>, 7> kLevels{{
    {"trace", spdlog::level::trace},
    {"debug", spdlog::level::debug},
    {"info", spdlog::level::info},
    {"warn", spdlog::level::warn},
    {"error", spdlog::level::err},
    {"critical", spdlog::level::critical},
    {"off", spdlog::level::off},
}};

void create_locked(std::string_view name, spdlog::level::level_enum level) {
    spdlog::drop(std::string(name));
    auto logger = spdlog::stderr_color_mt(std::string(name));
    logger->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] [%s:%#] %v");
    logger->set_level(level);
    g_logger = std::move(logger);
}

} // anonymous namespace

auto parse_log_level(std::string_view name) -> std::optional<spdlog::level::level_enum> {
    for (const auto& [text, level] : kLevels) {
        if (text == name) return level;
    }
    return std::nullopt;
}

void Logger::init(std::string_view name, std::string_view level) {
    std::lock_guard lock(g_init_mutex);
    create_locked(name, parse_log_level(level).value_or(spdlog::level::info));
}

auto Logger::get() -> std::shared_ptr<spdlog::logger> {
    std::lock_guard lock(g_init_mutex);
    if (!g_logger) create_locked("flowgate", spdlog::level::info);
    return g_logger;
}

auto Logger::set_level(std::string_view level) -> bool {
    auto parsed = parse_log_level(level);
    if (!parsed) return false;
    get()->set_level(*parsed);
    return true;
}

void Logger::flush() {
    std::shared_ptr<spdlog::logger> logger;
    {
        std::lock_guard lock(g_init_mutex);
        logger = g_logger;
    }
    if (logger) logger->flush();
}

} // namespace flowgate
