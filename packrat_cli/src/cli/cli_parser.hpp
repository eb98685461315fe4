//
// Created by the packrat authors on 18/10/26.
//

#ifndef PACKRAT_CLI_PARSER_HPP
#define PACKRAT_CLI_PARSER_HPP

#include <cstddef>
#include <filesystem>
#include <string>
#include <vector>

// forward declaration
namespace CLI { class App; }

enum class Command {
    None,
    Pack,
    Unpack
};

struct Settings {
    Command command = Command::None;

    // shared
    bool quiet = false;
    bool force = false;
    std::size_t buffer_size = 4096;
    std::string log_level = "ERROR";
    std::filesystem::path log_file;

    // pack
    std::filesystem::path output_path;
    std::vector<std::filesystem::path> inputs;
    bool no_base_folder = false;
    bool store = false;

    // unpack
    std::filesystem::path archive_path;
    std::filesystem::path destination = ".";
};

/**
 * @brief Configures the CLI11 parser with the pack/unpack subcommands.
 * @param app The CLI::App instance to configure.
 * @param settings The Settings struct to map the options to.
 */
void setup_cli_parser(CLI::App& app, Settings& settings);

#endif //PACKRAT_CLI_PARSER_HPP
