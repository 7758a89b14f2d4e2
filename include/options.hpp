#ifndef OPTIONS_HPP
#define OPTIONS_HPP
#include <filesystem>
#include <optional>
#include <string>
#include <vector>
#include "logger.hpp"

enum class Command { None, Create, Review, List, Info, Delete, Path, Branches, Config, Init };

enum class ListFormat { Table, Json, NameOnly, PathOnly };

struct LoggingOptions {
    std::optional<std::filesystem::path> log_file;
    std::optional<LogLevel> log_level;
    bool verbose = false;
};

/**
 * @brief Parsed command line of a single wtenv invocation.
 *
 * Positional arguments after the command name are kept in @ref args; their
 * meaning depends on @ref command.
 */
struct Options {
    Command command = Command::None;
    std::string command_name;
    std::vector<std::string> args;
    std::optional<std::filesystem::path> config_file;
    LoggingOptions logging;
    bool show_help = false;
    bool print_version = false;

    // create / review
    std::vector<std::string> repos;
    std::string env_name;
    bool no_fetch = false;
    bool no_templates = false;

    // list / info / config
    ListFormat list_format = ListFormat::Table;
    bool json = false;
    bool show_path = false;

    // delete / init
    bool force = false;
    bool assume_yes = false;
};

/**
 * @brief Parse command line arguments into an Options structure.
 *
 * @throws wtenv::Error (InvalidInput) for unknown flags, unknown commands,
 *         missing arguments or invalid values.
 */
Options parse_options(int argc, char* argv[]);

/** @brief Map a command name such as `create` to its enum value. */
Command command_from_name(const std::string& name);

#endif // OPTIONS_HPP
