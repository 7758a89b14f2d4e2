#include <map>
#include <set>
#include <string>
#include <vector>
#include "arg_parser.hpp"
#include "errors.hpp"
#include "options.hpp"

namespace {

wtenv::Error usage_error(const std::string& message) {
    wtenv::ErrorContext ctx;
    ctx.step = "parse-arguments";
    return wtenv::Error(wtenv::ErrorKind::InvalidInput, message, ctx);
}

void require_args(const Options& opts, size_t min, const char* what) {
    if (opts.args.size() < min)
        throw usage_error(opts.command_name + " requires " + what);
}

void require_at_most(const Options& opts, size_t max) {
    if (opts.args.size() > max)
        throw usage_error("unexpected argument for " + opts.command_name + ": " + opts.args[max]);
}

void parse_list_format(Options& opts, const ArgParser& parser) {
    int chosen = 0;
    if (parser.has_flag("--json")) {
        opts.list_format = ListFormat::Json;
        ++chosen;
    }
    if (parser.has_flag("--name-only")) {
        opts.list_format = ListFormat::NameOnly;
        ++chosen;
    }
    if (parser.has_flag("--path-only")) {
        opts.list_format = ListFormat::PathOnly;
        ++chosen;
    }
    if (chosen > 1)
        throw usage_error("--json, --name-only and --path-only are mutually exclusive");
}

} // namespace

Command command_from_name(const std::string& name) {
    static const std::map<std::string, Command> commands{
        {"create", Command::Create}, {"review", Command::Review},     {"list", Command::List},
        {"ls", Command::List},       {"info", Command::Info},         {"delete", Command::Delete},
        {"rm", Command::Delete},     {"path", Command::Path},         {"branches", Command::Branches},
        {"config", Command::Config}, {"init", Command::Init}};
    auto it = commands.find(name);
    return it == commands.end() ? Command::None : it->second;
}

Options parse_options(int argc, char* argv[]) {
    const std::set<std::string> known{"--config",    "--log-file",  "--log-level", "--verbose",
                                      "--help",      "--version",   "--repo",      "--name",
                                      "--no-fetch",  "--no-templates", "--json",   "--name-only",
                                      "--path-only", "--path",      "--force",     "--yes"};
    const std::set<std::string> switches{"--verbose",   "--help",      "--version",
                                         "--no-fetch",  "--no-templates", "--json",
                                         "--name-only", "--path-only", "--path",
                                         "--force",     "--yes"};
    const std::map<char, std::string> short_map{{'c', "--config"}, {'r', "--repo"},
                                                {'n', "--name"},   {'f', "--force"},
                                                {'y', "--yes"},    {'v', "--verbose"},
                                                {'h', "--help"},   {'V', "--version"}};
    ArgParser parser(argc, argv, known, short_map, switches);

    if (!parser.unknown_flags().empty())
        throw usage_error("Unknown option: " + parser.unknown_flags().front());

    Options opts;
    opts.show_help = parser.has_flag("--help");
    opts.print_version = parser.has_flag("--version");

    if (parser.has_flag("--config")) {
        if (!parser.has_value("--config") || parser.get_option("--config").empty())
            throw usage_error("--config requires a file path");
        opts.config_file = parser.get_option("--config");
    }
    if (parser.has_flag("--log-file")) {
        if (!parser.has_value("--log-file") || parser.get_option("--log-file").empty())
            throw usage_error("--log-file requires a path");
        opts.logging.log_file = parser.get_option("--log-file");
    }
    if (parser.has_flag("--log-level")) {
        std::string val = parser.get_option("--log-level");
        if (val.empty())
            throw usage_error("--log-level requires a value");
        LogLevel level;
        if (!parse_log_level(val, level))
            throw usage_error("Invalid log level: " + val);
        opts.logging.log_level = level;
    }
    opts.logging.verbose = parser.has_flag("--verbose");

    const auto& pos = parser.positional();
    if (pos.empty())
        return opts;
    opts.command_name = pos.front();
    opts.command = command_from_name(opts.command_name);
    if (opts.command == Command::None) {
        // `wtenv help create` behaves like `wtenv --help`
        if (opts.command_name == "help") {
            opts.show_help = true;
            return opts;
        }
        throw usage_error("Unknown command: " + opts.command_name);
    }
    opts.args.assign(pos.begin() + 1, pos.end());

    if (parser.has_flag("--repo") && !parser.has_value("--repo"))
        throw usage_error("--repo requires a repo:branch value");
    opts.repos = parser.get_all_options("--repo");
    if (parser.has_flag("--name")) {
        opts.env_name = parser.get_option("--name");
        if (opts.env_name.empty())
            throw usage_error("--name requires a value");
    }
    opts.no_fetch = parser.has_flag("--no-fetch");
    opts.no_templates = parser.has_flag("--no-templates");
    opts.json = parser.has_flag("--json");
    opts.show_path = parser.has_flag("--path");
    opts.force = parser.has_flag("--force");
    opts.assume_yes = parser.has_flag("--yes");

    if (opts.show_help)
        return opts;

    switch (opts.command) {
    case Command::Create:
        require_args(opts, 1, "an environment name");
        // `create demo backend:main` is accepted as well as `-r backend:main`
        for (size_t i = 1; i < opts.args.size(); ++i)
            opts.repos.push_back(opts.args[i]);
        opts.args.resize(1);
        if (opts.repos.empty())
            throw usage_error("create requires at least one --repo repo:branch");
        break;
    case Command::Review:
        require_args(opts, 1, "a pull request URL or repo#number");
        require_at_most(opts, 1);
        break;
    case Command::List:
        require_at_most(opts, 0);
        parse_list_format(opts, parser);
        break;
    case Command::Info:
    case Command::Path:
        require_args(opts, 1, "an environment name");
        require_at_most(opts, 1);
        break;
    case Command::Delete:
        require_args(opts, 1, "at least one environment name");
        break;
    case Command::Branches:
        break;
    case Command::Config:
        require_at_most(opts, 0);
        if (opts.json && opts.show_path)
            throw usage_error("--json and --path are mutually exclusive");
        break;
    case Command::Init:
        require_at_most(opts, 1);
        break;
    case Command::None:
        break;
    }
    return opts;
}
