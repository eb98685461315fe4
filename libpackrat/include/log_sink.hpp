//
// Created by the packrat authors on 18/10/26.
//

/**
 * @file log_sink.hpp
 * @brief Severity levels and the sink interface used by Logger.
 */

#ifndef PACKRAT_LOG_SINK_HPP
#define PACKRAT_LOG_SINK_HPP

#include <string_view>

namespace packrat {

/**
 * @brief Severity levels for log messages.
 */
enum class LogLevel {
    Debug,   ///< Per-entry tracing
    Info,    ///< Start/end of a pack or unpack request
    Warning, ///< Something unusual that does not abort the request
    Error    ///< Failures, logged right before the exception is thrown
};

/**
 * @brief Abstract sink interface for logging.
 *
 * Implementations decide where messages go (console, file, ...).
 * Logger fans every message out to all registered sinks.
 */
struct ILogSink {
    virtual ~ILogSink() = default;

    /**
     * @brief Log a message.
     * @param level Severity level of the message.
     * @param message The message text.
     * @param tag Component that produced the message.
     */
    virtual void log(LogLevel level,
                     std::string_view message,
                     std::string_view tag) = 0;
};

} // namespace packrat

#endif // PACKRAT_LOG_SINK_HPP
