//===----------------------------------------------------------------------===//
//                         GateWire
//
// logging/logger.hpp
//
// Process-wide logging based on spdlog
//===----------------------------------------------------------------------===//

#pragma once

#include <memory>
#include <string>
#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/rotating_file_sink.h>

namespace gatewire {

enum class LogLevel {
    TRACE = 0,
    DEBUG = 1,
    INFO = 2,
    WARN = 3,
    ERROR = 4,
    FATAL = 5
};

// Where console output goes. Tools that print results on stdout log to stderr.
enum class LogConsole {
    STDOUT,
    STDERR
};

class Logger {
public:
    // Initialize logging system. Calling it again before Shutdown() is a no-op.
    static void Initialize(const std::string& log_file = "",
                           const std::string& log_level = "info",
                           LogConsole console = LogConsole::STDOUT);

    static void Shutdown();

    // Auto-initializes with defaults on first use
    static std::shared_ptr<spdlog::logger>& Get();

    static bool IsInitialized() { return initialized_; }

    static void SetLevel(LogLevel level);
    static void SetLevel(const std::string& level);

    // Re-initialize with a new file output, keeping level and console target
    static void SetOutput(const std::string& file);

    static void Flush();

    static spdlog::level::level_enum ToSpdlogLevel(LogLevel level);
    static spdlog::level::level_enum ToSpdlogLevel(const std::string& level);

private:
    static std::shared_ptr<spdlog::logger> logger_;
    static LogConsole console_;
    static bool initialized_;
};

} // namespace gatewire

// Component-tagged logging with fmt formatting:
//   GW_LOG_DEBUG("bind", "column {} resolved to position {}", name, i);
// Arguments are not evaluated when the level is disabled.

#define GW_LOG_AT(level, component, fmt, ...) \
    do { \
        auto& gw_logger_ = gatewire::Logger::Get(); \
        if (gw_logger_->should_log(level)) \
            gw_logger_->log(level, "[{}] " fmt, component, ##__VA_ARGS__); \
    } while (0)

#define GW_LOG_TRACE(component, fmt, ...) \
    GW_LOG_AT(spdlog::level::trace, component, fmt, ##__VA_ARGS__)
#define GW_LOG_DEBUG(component, fmt, ...) \
    GW_LOG_AT(spdlog::level::debug, component, fmt, ##__VA_ARGS__)
#define GW_LOG_INFO(component, fmt, ...) \
    GW_LOG_AT(spdlog::level::info, component, fmt, ##__VA_ARGS__)
#define GW_LOG_WARN(component, fmt, ...) \
    GW_LOG_AT(spdlog::level::warn, component, fmt, ##__VA_ARGS__)
#define GW_LOG_ERROR(component, fmt, ...) \
    GW_LOG_AT(spdlog::level::err, component, fmt, ##__VA_ARGS__)
#define GW_LOG_FATAL(component, fmt, ...) \
    GW_LOG_AT(spdlog::level::critical, component, fmt, ##__VA_ARGS__)
