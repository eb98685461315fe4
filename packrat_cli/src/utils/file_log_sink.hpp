//
// Created by the packrat authors on 18/10/26.
//

#ifndef PACKRAT_FILE_LOG_SINK_HPP
#define PACKRAT_FILE_LOG_SINK_HPP

#include "../../../libpackrat/include/log_sink.hpp"
#include "../../../libpackrat/include/logger.hpp"
#include <filesystem>
#include <fstream>
#include <mutex>
#include <string>

class FileLogSink final : public packrat::ILogSink {
public:
    explicit FileLogSink(const std::filesystem::path& filename, const bool append = true)
        : out_(filename, append ? std::ios::app : std::ios::trunc) {}

    [[nodiscard]] bool is_open() const { return out_.is_open(); }

    void log(const packrat::LogLevel level,
             const std::string_view message,
             const std::string_view tag) override {
        if (!out_.is_open()) return;

        std::lock_guard lock(mtx_);
        out_ << "[" << packrat::Logger::level_to_string(level) << "]";
        if (!tag.empty()) out_ << "[" << tag << "]";
        out_ << " " << message << "\n";
        out_.flush();
    }

private:
    std::ofstream out_;
    std::mutex mtx_;
};

#endif // PACKRAT_FILE_LOG_SINK_HPP
