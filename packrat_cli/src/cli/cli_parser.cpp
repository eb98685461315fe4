//
// Created by the packrat authors on 18/10/26.
//

#include "cli_parser.hpp"
#include <CLI/CLI.hpp>

void setup_cli_parser(CLI::App& app, Settings& settings) {
    app.set_help_flag("-h,--help", "Show this help message and exit.");
    app.set_version_flag("--version", "0.1");
    app.require_subcommand(1);

    // --- Global options ---
    app.add_flag("-q,--quiet", settings.quiet,
                 "Suppress non-error console output (progress bar).");

    app.add_option("--log-level", settings.log_level,
                   "Log level: ERROR, WARNING, INFO, DEBUG, NONE.")
                   ->default_val("ERROR")
                   ->check(CLI::IsMember({"ERROR", "WARNING", "INFO", "DEBUG", "NONE"}, CLI::ignore_case));

    app.add_option("--log-file", settings.log_file,
                   "Write logs to a specific file (default: no file logging).");

    // --- pack ---
    CLI::App* pack = app.add_subcommand("pack", "Pack files and folders into a ZIP archive.");

    pack->add_option("-o,--output", settings.output_path, "Archive to create.")
        ->required();

    pack->add_flag("--no-base-folder", settings.no_base_folder,
                   "With a single folder input, store its content without the folder name.");

    pack->add_flag("--store", settings.store,
                   "Store files without compression.");

    pack->add_flag("-f,--force", settings.force,
                   "Overwrite the archive if it already exists.");

    pack->add_option("--buffer-size", settings.buffer_size,
                     "Copy buffer size in bytes.")
        ->default_val(settings.buffer_size)
        ->check(CLI::PositiveNumber);

    pack->add_option("inputs", settings.inputs, "One or more files or directories.")
        ->required()
        ->check(CLI::ExistingPath);

    pack->callback([&settings]() {
        settings.command = Command::Pack;
        if (settings.no_base_folder && settings.inputs.size() > 1) {
            throw CLI::ValidationError("--no-base-folder only applies to a single input.");
        }
    });

    // --- unpack ---
    CLI::App* unpack = app.add_subcommand("unpack", "Extract a ZIP archive.");

    unpack->add_option("archive", settings.archive_path, "Archive to extract.")
        ->required()
        ->check(CLI::ExistingFile);

    unpack->add_option("-d,--dest", settings.destination,
                       "Destination folder (created if missing).")
        ->default_val(".");

    unpack->add_flag("-f,--force", settings.force,
                     "Overwrite files that already exist in the destination.");

    unpack->add_option("--buffer-size", settings.buffer_size,
                       "Copy buffer size in bytes.")
        ->default_val(settings.buffer_size)
        ->check(CLI::PositiveNumber);

    unpack->callback([&settings]() { settings.command = Command::Unpack; });
}
