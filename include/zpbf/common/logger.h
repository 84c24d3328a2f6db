// =============================================================================
// zstd-pbf - Logger Module
// =============================================================================
// Asynchronous diagnostics through the Quill library.
//
// The tool logs to the console and, on request, to a log file. Verbosity is
// chosen on the command line (-v, -vv, -q) and mapped with levelForVerbosity().
//
// Usage:
//   zpbf::log::init({.logFile = "", .level = zpbf::log::levelForVerbosity(1, false)});
//   ZPBF_LOG_INFO("Transcoded {} frames", count);
//   zpbf::log::shutdown();
// =============================================================================

#ifndef ZPBF_COMMON_LOGGER_H
#define ZPBF_COMMON_LOGGER_H

#include <string>

#include <quill/LogMacros.h>
#include <quill/Logger.h>

namespace zpbf::log {

/// @brief Severity threshold, mapped onto quill::LogLevel by toQuillLevel().
enum class Level {
    kTrace = 0,
    kDebug,
    kInfo,
    kWarning,
    kError,
    kCritical
};

/// @brief Logger settings for one run.
struct Config {
    /// @brief Log file path, truncated on open. Empty logs to the console only.
    std::string logFile;

    Level level = Level::kInfo;
};

/// @brief Start the Quill backend and create the "zpbf" logger.
/// @note Later calls are ignored until shutdown().
void init(const Config& config);

/// @brief The active logger, nullptr before init() and after shutdown().
[[nodiscard]] quill::Logger* logger() noexcept;

/// @brief Flush pending messages and stop the backend thread.
void shutdown();

[[nodiscard]] quill::LogLevel toQuillLevel(Level level) noexcept;

/// @brief Map the command-line verbosity to a level.
/// @param verbosity Number of -v flags: 0 info, 1 debug, 2 or more trace.
/// @param quiet -q given; only errors are logged.
[[nodiscard]] Level levelForVerbosity(int verbosity, bool quiet) noexcept;

}  // namespace zpbf::log

// =============================================================================
// Convenience Macros
// =============================================================================
// Statements are dropped while the logger is not initialized, so library code
// can log unconditionally.

#define ZPBF_LOG_IMPL(quillMacro, fmt, ...)                                      \
    do {                                                                          \
        if (quill::Logger* zpbfLogger = zpbf::log::logger(); zpbfLogger != nullptr) { \
            quillMacro(zpbfLogger, fmt __VA_OPT__(, ) __VA_ARGS__);               \
        }                                                                         \
    } while (false)

/// @brief Log a trace message.
#define ZPBF_LOG_TRACE(fmt, ...) ZPBF_LOG_IMPL(LOG_TRACE_L1, fmt __VA_OPT__(, ) __VA_ARGS__)

/// @brief Log a debug message.
#define ZPBF_LOG_DEBUG(fmt, ...) ZPBF_LOG_IMPL(LOG_DEBUG, fmt __VA_OPT__(, ) __VA_ARGS__)

/// @brief Log an info message.
#define ZPBF_LOG_INFO(fmt, ...) ZPBF_LOG_IMPL(LOG_INFO, fmt __VA_OPT__(, ) __VA_ARGS__)

/// @brief Log a warning message.
#define ZPBF_LOG_WARNING(fmt, ...) ZPBF_LOG_IMPL(LOG_WARNING, fmt __VA_OPT__(, ) __VA_ARGS__)

/// @brief Log an error message.
#define ZPBF_LOG_ERROR(fmt, ...) ZPBF_LOG_IMPL(LOG_ERROR, fmt __VA_OPT__(, ) __VA_ARGS__)

/// @brief Log a critical message.
#define ZPBF_LOG_CRITICAL(fmt, ...) ZPBF_LOG_IMPL(LOG_CRITICAL, fmt __VA_OPT__(, ) __VA_ARGS__)

#endif  // ZPBF_COMMON_LOGGER_H
