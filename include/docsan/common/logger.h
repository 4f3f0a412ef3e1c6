// =============================================================================
// docsan - Logger Module
// =============================================================================
// Asynchronous logging through Quill, shared by the library and the CLI.
//
// The DOCSAN_LOG_* macros are no-ops until init() has installed a logger, so
// the library can be embedded (and unit tested) without any logging setup.
// The CLI turns the console sink off when a document is written to stdout.
//
// Sensitive values must never be logged above debug level; warnings and
// errors name placeholders, types and offsets only.
// =============================================================================

#ifndef DOCSAN_COMMON_LOGGER_H
#define DOCSAN_COMMON_LOGGER_H

#include <cstdint>
#include <string>

#include <quill/Backend.h>
#include <quill/Frontend.h>
#include <quill/LogMacros.h>
#include <quill/Logger.h>
#include <quill/sinks/ConsoleSink.h>
#include <quill/sinks/FileSink.h>

namespace docsan::log {

enum class Level : std::uint8_t {
    kTrace = 0,
    kDebug,
    kInfo,
    kWarning,
    kError,
    kCritical
};

struct Config {
    /// @brief Additional log file (truncated on open). Empty disables it.
    std::string logFile;

    Level level = Level::kInfo;

    /// @brief Write to the console. Off when stdout carries document text.
    bool enableConsole = true;

    std::string loggerName = "docsan";
};

// =============================================================================
// Logger Initialization and Access
// =============================================================================

/// @brief Start the Quill backend and install the docsan logger.
/// @note Later calls are ignored until shutdown(). With no sink enabled the
///       macros stay no-ops.
void init(const Config& config);

/// @brief The installed logger, or nullptr.
[[nodiscard]] quill::Logger* logger() noexcept;

/// @brief Block until queued messages are written.
void flush();

/// @brief Flush and stop the backend thread.
void shutdown();

[[nodiscard]] quill::LogLevel toQuillLevel(Level level) noexcept;

}  // namespace docsan::log

// =============================================================================
// Convenience Macros
// =============================================================================

#define DOCSAN_LOG_IMPL_(quillMacro, fmt, ...)                                  \
    do {                                                                        \
        if (quill::Logger* docsanLogger_ = docsan::log::logger()) {             \
            quillMacro(docsanLogger_, fmt __VA_OPT__(, ) __VA_ARGS__);          \
        }                                                                       \
    } while (false)

/// @brief Log a trace message.
#define DOCSAN_LOG_TRACE(fmt, ...) DOCSAN_LOG_IMPL_(LOG_TRACE_L1, fmt __VA_OPT__(, ) __VA_ARGS__)

/// @brief Log a debug message.
#define DOCSAN_LOG_DEBUG(fmt, ...) DOCSAN_LOG_IMPL_(LOG_DEBUG, fmt __VA_OPT__(, ) __VA_ARGS__)

/// @brief Log an info message.
#define DOCSAN_LOG_INFO(fmt, ...) DOCSAN_LOG_IMPL_(LOG_INFO, fmt __VA_OPT__(, ) __VA_ARGS__)

/// @brief Log a warning message.
#define DOCSAN_LOG_WARNING(fmt, ...) DOCSAN_LOG_IMPL_(LOG_WARNING, fmt __VA_OPT__(, ) __VA_ARGS__)

/// @brief Log an error message.
#define DOCSAN_LOG_ERROR(fmt, ...) DOCSAN_LOG_IMPL_(LOG_ERROR, fmt __VA_OPT__(, ) __VA_ARGS__)

/// @brief Log a critical message.
#define DOCSAN_LOG_CRITICAL(fmt, ...) \
    DOCSAN_LOG_IMPL_(LOG_CRITICAL, fmt __VA_OPT__(, ) __VA_ARGS__)

#endif  // DOCSAN_COMMON_LOGGER_H
