//
// Created by the packrat authors on 18/10/26.
//

#ifndef PACKRAT_CONSOLE_LOG_SINK_HPP
#define PACKRAT_CONSOLE_LOG_SINK_HPP

#include "../../../libpackrat/include/log_sink.hpp"
#include "../../../libpackrat/include/logger.hpp"
#include <iostream>

// prints messages at or above log_level; Debug/Info to stdout, the rest to stderr
class ConsoleLogSink final : public packrat::ILogSink {
public:
    packrat::LogLevel log_level = packrat::LogLevel::Error;

    void log(const packrat::LogLevel level,
             const std::string_view message,
             const std::string_view tag) override {
        if (level < log_level) return;

        std::ostream& out = level >= packrat::LogLevel::Warning ? std::cerr : std::cout;
        out << "\n[" << packrat::Logger::level_to_string(level) << "][" << tag << "] " << message << std::endl;
    }
};

#endif // PACKRAT_CONSOLE_LOG_SINK_HPP
