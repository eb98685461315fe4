//
// Created by the packrat authors on 18/10/26.
//

#include <chrono>
#include <clocale>
#include <iostream>
#include <memory>
#include <string>
#include <CLI/CLI.hpp>
#include "cli/cli_parser.hpp"
#include "utils/console_log_sink.hpp"
#include "utils/file_log_sink.hpp"
#include "utils/progress_bar.hpp"
#include "../../libpackrat/include/logger.hpp"
#include "../../libpackrat/include/packrat.hpp"

using namespace packrat;

inline void init_utf8_locale() {
    std::setlocale(LC_ALL, "");

    const char *cur = std::setlocale(LC_CTYPE, nullptr);
    if (cur && std::string(cur).find("UTF-8") != std::string::npos) {
        Logger::log(LogLevel::Debug, std::string("Current locale: ") + cur, "LocaleInit");
        return;
    }

    constexpr const char *fallbacks[] = {"C.UTF-8", "en_US.UTF-8", ".UTF-8" /* Windows */};
    for (const auto fb: fallbacks) {
        if (std::setlocale(LC_ALL, fb)) {
            Logger::log(LogLevel::Info, std::string("Locale set to ") + fb, "LocaleInit");
            return;
        }
    }

    Logger::log(LogLevel::Warning, "UTF-8 locale not available; non-ASCII file names may be problematic.",
                "LocaleInit");
}

static void install_log_sinks(const Settings& settings) {
    Logger::clear_sinks();

    if (!settings.log_file.empty()) {
        auto fileSink = std::make_unique<FileLogSink>(settings.log_file, false);
        if (!fileSink->is_open()) {
            std::cerr << "Warning: can't open log file " << settings.log_file.string() << std::endl;
        } else {
            Logger::add_sink(std::move(fileSink));
        }
    }

    // "NONE" maps to no console sink at all
    if (const auto level = Logger::string_to_level(settings.log_level)) {
        auto consoleSink = std::make_unique<ConsoleLogSink>();
        consoleSink->log_level = *level;
        Logger::add_sink(std::move(consoleSink));
    }
}

int main(int argc, char* argv[]) {

    CLI::App app{"packrat: pack files and folders into ZIP archives, and back."};
    Settings settings;
    setup_cli_parser(app, settings);

    try {
        app.parse(argc, argv);
    }
    catch (const CLI::ParseError &e) {
        return app.exit(e);
    }

    install_log_sinks(settings);
    init_utf8_locale();

    const auto start = std::chrono::steady_clock::now();

    Options options;
    options.bufferSize(settings.buffer_size)
           .overwriteExisting(settings.force);

    if (!settings.quiet) {
        options.progressObserver([start](const double percent, const std::string& label) {
            const double elapsed = std::chrono::duration<double>(
                std::chrono::steady_clock::now() - start).count();
            print_progress_bar(percent, label, elapsed);
        });
    }

    try {
        switch (settings.command) {
            case Command::Pack:
                options.includeBaseFolderName(!settings.no_base_folder)
                       .compression(settings.store ? Compression::Store : Compression::Deflate);
                pack(settings.output_path, options, settings.inputs);
                break;
            case Command::Unpack:
                unpack(settings.archive_path, settings.destination, options);
                break;
            case Command::None:
                std::cerr << app.help() << std::endl;
                return 1;
        }
    } catch (const Error& e) {
        if (!settings.quiet) std::cerr << std::endl;
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    } catch (const std::exception& e) {
        Logger::log(LogLevel::Error, std::string("Unexpected failure: ") + e.what(), "main");
        std::cerr << "Unexpected error: " << e.what() << std::endl;
        return 1;
    }

    if (!settings.quiet) {
        std::cerr << std::endl;
    }
    return 0;
}
