#pragma once

#include "pipeviz/common/ILoggerBackend.h"

#include <spdlog/fmt/fmt.h>

#include <memory>
#include <source_location>
#include <string>
#include <vector>

namespace pipeviz {

/**
 * @brief Centralized logging facade with dependency injection support
 *
 * Supports three usage patterns:
 * 1. Default mode: spdlog backend, console only
 * 2. Custom mode: the host injects its own ILoggerBackend implementation
 * 3. Capture mode: log lines are also kept in memory for programmatic retrieval
 *
 * Thread-safe: the snapshot fetcher logs from its worker thread.
 *
 * Example:
 * @code
 * pipeviz::Logger::initialize();
 * pipeviz::Logger::enableCapture(true);
 * LOG_INFO("Layout completed in {} sweeps", passes);
 * auto logs = pipeviz::Logger::getCapturedLogs("Layout");
 * @endcode
 */
class Logger {
public:
    /**
     * @brief Inject custom logger backend
     * @param backend Host logger backend (ownership transferred)
     */
    static void setBackend(std::unique_ptr<ILoggerBackend> backend);

    /**
     * @brief Initialize default logger (stdout only)
     */
    static void initialize();

    /**
     * @brief Initialize default logger with file output
     * @param logDir Directory for log files
     * @param logToFile Enable file logging
     */
    static void initialize(const std::string& logDir, bool logToFile = true);

    /**
     * @brief Set minimum log level
     */
    static void setLevel(LogLevel level);

    static void trace(const std::string& message,
                      const std::source_location& loc = std::source_location::current());
    static void debug(const std::string& message,
                      const std::source_location& loc = std::source_location::current());
    static void info(const std::string& message,
                     const std::source_location& loc = std::source_location::current());
    static void warn(const std::string& message,
                     const std::source_location& loc = std::source_location::current());
    static void error(const std::string& message,
                      const std::source_location& loc = std::source_location::current());

    /**
     * @brief Flush log buffers
     */
    static void flush();

    // ===== Log Capture API =====

    /**
     * @brief Enable or disable log capture
     *
     * When enabled, every message is stored in memory in addition to being
     * sent to the backend.
     */
    static void enableCapture(bool enable);

    static bool isCaptureEnabled();

    /**
     * @brief Get captured logs with optional filtering
     * @param pattern Optional substring filter (empty = all logs)
     * @param maxLines Maximum number of lines to return (0 = unlimited)
     * @return Most recent log lines matching the filter
     */
    static std::vector<std::string> getCapturedLogs(
        const std::string& pattern = "",
        size_t maxLines = 0);

    static void clearCapturedLogs();

private:
    static void write(LogLevel level, const char* tag, const std::string& message,
                      const std::source_location& loc);
    static ILoggerBackend& backend();
    static std::string extractFunctionName(const std::source_location& loc);
    static void captureLog(const std::string& message);
};

}  // namespace pipeviz

// Logging macros with fmt-style formatting
#define LOG_TRACE(...) pipeviz::Logger::trace(fmt::format(__VA_ARGS__), std::source_location::current())
#define LOG_DEBUG(...) pipeviz::Logger::debug(fmt::format(__VA_ARGS__), std::source_location::current())
#define LOG_INFO(...)  pipeviz::Logger::info(fmt::format(__VA_ARGS__), std::source_location::current())
#define LOG_WARN(...)  pipeviz::Logger::warn(fmt::format(__VA_ARGS__), std::source_location::current())
#define LOG_ERROR(...) pipeviz::Logger::error(fmt::format(__VA_ARGS__), std::source_location::current())
