/**
 * @file logging.hpp
 * @brief Optional logging façade shared by every replayhub component.
 *
 * Unless the build defines `REPLAYHUB_USE_QUILL` the log‑macros expand to
 * no‑ops, keeping the entire logging path out of the binary.  Components
 * never reach for a global logger: each one receives a
 * @ref replayhub::logging::Logger through its options struct and only falls
 * back to @ref replayhub::logging::create_logger when none was supplied.
 */

#pragma once

#include <string>

#ifdef REPLAYHUB_USE_QUILL
#include <quill/Backend.h>
#include <quill/Frontend.h>
#include <quill/LogMacros.h>
#include <quill/Logger.h>
#include <quill/sinks/ConsoleSink.h>

#define REPLAYHUB_LOG_INFO(...) LOG_INFO(__VA_ARGS__)
#define REPLAYHUB_LOG_DEBUG(...) LOG_DEBUG(__VA_ARGS__)
#define REPLAYHUB_LOG_WARNING(...) LOG_WARNING(__VA_ARGS__)
#define REPLAYHUB_LOG_ERROR(...) LOG_ERROR(__VA_ARGS__)
#define REPLAYHUB_LOG_CRITICAL(...) LOG_CRITICAL(__VA_ARGS__)

namespace replayhub::logging {
using level = quill::LogLevel; ///< Logging level alias.
using Logger = quill::Logger*; ///< Loggers are owned by the quill frontend.

/**
 * @brief Create (or fetch) a console backed logger.
 * @param name Unique name; logger instances are cached by the backend.
 */
inline Logger create_logger(const std::string& name) {
    return quill::Frontend::create_or_get_logger(
        name, quill::Frontend::create_or_get_sink<quill::ConsoleSink>(
                  "replayhub_console"));
}

/// Start the dedicated Quill backend thread. Call once per process.
inline void start_backend() { quill::Backend::start(); }

/// Set a runtime log level on a logger returned by @ref create_logger.
inline void set_log_level(Logger logger, level log_level) {
    logger->set_log_level(log_level);
}
} // namespace replayhub::logging
#else
#define REPLAYHUB_LOG_INFO(...)
#define REPLAYHUB_LOG_DEBUG(...)
#define REPLAYHUB_LOG_WARNING(...)
#define REPLAYHUB_LOG_ERROR(...)
#define REPLAYHUB_LOG_CRITICAL(...)

namespace replayhub::logging {
/// Log levels used in the code base; present so callers need no `#ifdef`.
enum class level { Debug, Info, Warning, Error, Critical };
using Logger = void*; ///< Never dereferenced.
inline Logger create_logger(const std::string&) { return nullptr; }
inline void start_backend() {}
inline void set_log_level(Logger, level) {}
} // namespace replayhub::logging
#endif // REPLAYHUB_USE_QUILL
