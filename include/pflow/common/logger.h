// =============================================================================
// pipeflow - Logging
// =============================================================================
// Process-wide Quill logger shared by every stage task and pool worker.
//
// Stages report lifecycle events (start, early stop, failure) through the
// PFLOW_LOG_* macros. Until the application calls init() there is no logger
// and the macros compile to a null check, so embedding pipeflow in a program
// that never configures logging costs nothing.
//
//   pflow::log::init("pipeline.log", pflow::log::Level::kDebug);
//   PFLOW_LOG_INFO("Started {} workers", 4);
//   pflow::log::shutdown();
// =============================================================================

#ifndef PFLOW_COMMON_LOGGER_H
#define PFLOW_COMMON_LOGGER_H

#include <string>
#include <string_view>

#include <quill/Backend.h>
#include <quill/Frontend.h>
#include <quill/LogMacros.h>
#include <quill/Logger.h>
#include <quill/sinks/ConsoleSink.h>
#include <quill/sinks/FileSink.h>

namespace pflow::log {

/// @brief Severity threshold, one value per Quill level used by pipeflow.
enum class Level {
    kTrace = 0,
    kDebug,
    kInfo,
    kWarning,
    kError,
    kCritical
};

/// @brief Where stage events go and how verbose they are.
struct Config {
    /// @brief File receiving the log; empty keeps output on the console only.
    std::string logFile;

    Level level = Level::kInfo;

    /// @brief Also write to stderr. Ignored when logFile is empty.
    bool enableConsole = true;

    /// @brief Quill logger name.
    std::string name = "pflow";
};

/// @brief Create the shared logger. A second call before shutdown() is a no-op.
void init(const Config& config);

/// @brief Shorthand for init(Config) with console output enabled.
void init(std::string_view logFile = "", Level level = Level::kInfo);

/// @brief The shared logger, or nullptr while logging is off.
[[nodiscard]] quill::Logger* logger() noexcept;

[[nodiscard]] bool isInitialized() noexcept;

/// @brief Block until queued messages reach their sinks.
void flush();

/// @brief Flush, detach the shared logger and stop the Quill backend thread.
void shutdown();

[[nodiscard]] quill::LogLevel toQuillLevel(Level level) noexcept;

/// @brief Parse a level name ("warn" and "fatal" are accepted as aliases).
/// @return kInfo for names it does not know.
[[nodiscard]] Level levelFromString(std::string_view name) noexcept;

[[nodiscard]] std::string_view levelToString(Level level) noexcept;

}  // namespace pflow::log

// Every macro checks for the shared logger first, so library code may log
// whether or not the application initialized logging.
#define PFLOW_LOG_IMPL(MACRO, fmt, ...)                                  \
    do {                                                                 \
        if (quill::Logger* pflowLogger_ = pflow::log::logger()) {        \
            MACRO(pflowLogger_, fmt __VA_OPT__(, ) __VA_ARGS__);         \
        }                                                                \
    } while (false)

#define PFLOW_LOG_TRACE(fmt, ...) PFLOW_LOG_IMPL(LOG_TRACE_L1, fmt __VA_OPT__(, ) __VA_ARGS__)
#define PFLOW_LOG_DEBUG(fmt, ...) PFLOW_LOG_IMPL(LOG_DEBUG, fmt __VA_OPT__(, ) __VA_ARGS__)
#define PFLOW_LOG_INFO(fmt, ...) PFLOW_LOG_IMPL(LOG_INFO, fmt __VA_OPT__(, ) __VA_ARGS__)
#define PFLOW_LOG_WARNING(fmt, ...) PFLOW_LOG_IMPL(LOG_WARNING, fmt __VA_OPT__(, ) __VA_ARGS__)
#define PFLOW_LOG_ERROR(fmt, ...) PFLOW_LOG_IMPL(LOG_ERROR, fmt __VA_OPT__(, ) __VA_ARGS__)
#define PFLOW_LOG_CRITICAL(fmt, ...) PFLOW_LOG_IMPL(LOG_CRITICAL, fmt __VA_OPT__(, ) __VA_ARGS__)

#endif  // PFLOW_COMMON_LOGGER_H
