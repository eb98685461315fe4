//
// Created by the packrat authors on 18/10/26.
//

/**
 * @file logger.hpp
 * @brief Static, thread-safe logging facade.
 *
 * The library never prints anything by itself: messages go to the
 * registered ILogSink implementations, and with no sink installed
 * logging is a no-op.
 */

#ifndef PACKRAT_LOGGER_HPP
#define PACKRAT_LOGGER_HPP

#include "log_sink.hpp"
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace packrat {

class Logger {
public:
    /**
     * @brief Add a new log sink. The Logger takes ownership of it.
     * @param sink Unique pointer to a sink implementation.
     */
    static void add_sink(std::unique_ptr<ILogSink> sink);

    /**
     * @brief Remove all configured sinks.
     */
    static void clear_sinks();

    /**
     * @brief Log a message to all registered sinks.
     * @param level Severity level.
     * @param msg Message text.
     * @param tag Optional tag (default: "packrat").
     */
    static void log(LogLevel level,
                    std::string_view msg,
                    std::string_view tag = "packrat");

    static const char* level_to_string(const LogLevel level) {
        switch (level) {
            case LogLevel::Debug:   return "DEBUG";
            case LogLevel::Info:    return "INFO";
            case LogLevel::Warning: return "WARN";
            case LogLevel::Error:   return "ERROR";
        }
        return "";
    }

    /**
     * @brief Parses a level name as accepted by the CLI.
     * Case-insensitive. "NONE" and unknown names yield std::nullopt.
     */
    static std::optional<LogLevel> string_to_level(std::string level);

private:
    ///< List of all registered sink implementations.
    static std::vector<std::unique_ptr<ILogSink>> sinks_;
    ///< Protects access to the sinks_ vector.
    static std::mutex mtx_;
};

} // namespace packrat

#endif // PACKRAT_LOGGER_HPP
