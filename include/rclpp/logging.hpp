/**
 * @file logging.hpp
 * @brief Logging facade shared by every rclpp component.
 *
 * Unless the build defines `RCLPP_USE_QUILL` the log‑macros expand to
 * no‑ops, keeping the entire logging path out of the binary.
 */

#pragma once

#include <string>

#ifdef RCLPP_USE_QUILL
#include <quill/Backend.h>
#include <quill/Frontend.h>
#include <quill/LogMacros.h>
#include <quill/Logger.h>
#include <quill/sinks/ConsoleSink.h>

#define RCLPP_LOG_INFO(...) LOG_INFO(__VA_ARGS__)
#define RCLPP_LOG_DEBUG(...) LOG_DEBUG(__VA_ARGS__)
#define RCLPP_LOG_WARNING(...) LOG_WARNING(__VA_ARGS__)
#define RCLPP_LOG_ERROR(...) LOG_ERROR(__VA_ARGS__)
#define RCLPP_LOG_CRITICAL(...) LOG_CRITICAL(__VA_ARGS__)

namespace rclpp::logging {
using level = quill::LogLevel; ///< Logging level alias.
using Logger = quill::Logger*; ///< Thin pointer alias used throughout.

/**
 * @brief Create (or fetch) a console backed logger.
 * @param name Unique name – logger instances are cached by the backend.
 */
inline Logger create_logger(const std::string& name) {
    return quill::Frontend::create_or_get_logger(
        name, quill::Frontend::create_or_get_sink<quill::ConsoleSink>(
                  "rclpp_sink"));
}

/// Start the dedicated Quill backend thread.
inline void start_backend() { quill::Backend::start(); }

/// Set a runtime log level on a logger returned by @ref create_logger.
inline void set_log_level(Logger logger, level log_level) {
    logger->set_log_level(log_level);
}
} // namespace rclpp::logging
#else
#define RCLPP_LOG_INFO(...)
#define RCLPP_LOG_DEBUG(...)
#define RCLPP_LOG_WARNING(...)
#define RCLPP_LOG_ERROR(...)
#define RCLPP_LOG_CRITICAL(...)

namespace rclpp::logging {
/// Log levels used in the code base when quill is compiled out.
enum class level { Debug, Info, Warning, Error, Critical };
using Logger = void*; ///< Never dereferenced.
inline Logger create_logger(const std::string&) { return nullptr; }
inline void start_backend() {}
inline void set_log_level(Logger, level) {}
} // namespace rclpp::logging
#endif // RCLPP_USE_QUILL

namespace rclpp::logging {
/// Logger for faults that have no caller left to report to.
inline Logger diagnostics_logger() {
    static Logger logger = create_logger("rclpp-diagnostics");
    return logger;
}
} // namespace rclpp::logging
