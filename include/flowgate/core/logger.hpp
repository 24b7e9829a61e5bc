#pragma once

#include <memory>
#include <optional>
#include <string_view>

#include <spdlog/spdlog.h>

namespace flowgate {

/// Level names accepted by --log-level, FLOWGATE_LOG_LEVEL and the config
/// file: trace, debug, info, warn, error, critical, off.
[[nodiscard]] auto parse_log_level(std::string_view name) -> std::optional<spdlog::level::level_enum>;

/// Process-wide diagnostics logger. Writes to stderr so that decision and
/// audit output on stdout stays machine-readable.
class Logger {
public:
    /// (Re)creates the logger. An unknown level name falls back to info.
    static void init(std::string_view name = "flowgate", std::string_view level = "info");

    /// Returns the current logger, creating a default one on first use.
    /// The copy stays usable if init() replaces the logger meanwhile.
    static auto get() -> std::shared_ptr<spdlog::logger>;

    /// Returns false and leaves the level unchanged for an unknown name.
    static auto set_level(std::string_view level) -> bool;
    static void flush();
};

} // namespace flowgate

#define LOG_TRACE(...) SPDLOG_LOGGER_TRACE(::flowgate::Logger::get(), __VA_ARGS__)
#define LOG_DEBUG(...) SPDLOG_LOGGER_DEBUG(::flowgate::Logger::get(), __VA_ARGS__)
#define LOG_INFO(...)  SPDLOG_LOGGER_INFO(::flowgate::Logger::get(), __VA_ARGS__)
#define LOG_WARN(...)  SPDLOG_LOGGER_WARN(::flowgate::Logger::get(), __VA_ARGS__)
#define LOG_ERROR(...) SPDLOG_LOGGER_ERROR(::flowgate::Logger::get(), __VA_ARGS__)
#define LOG_FATAL(...) SPDLOG_LOGGER_CRITICAL(::flowgate::Logger::get(), __VA_ARGS__)
