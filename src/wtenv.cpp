/**
 * @file wtenv.cpp
 * @brief CLI entry point for managing multi-repository worktree environments.
 *
 * Parses the command line, loads the configuration and hands the command to
 * the dispatcher in cli_commands.cpp. libgit2 is initialized for the whole
 * process lifetime.
 */

#include <iostream>

#include "cli_commands.hpp"
#include "errors.hpp"
#include "git_utils.hpp"
#include "help_text.hpp"
#include "logger.hpp"
#include "options.hpp"
#include "version.hpp"

/**
 * @brief Application entry point.
 *
 * @return Zero on success or when printing help/version; the error kind's
 *         exit code on failure; 1 on unexpected errors.
 */
#ifndef WTENV_NO_MAIN
int main(int argc, char* argv[]) {
    git::GitInitGuard git_guard;
    int rc = 1;
    try {
        Options opts = parse_options(argc, argv);
        if (opts.show_help) {
            print_help(argv[0]);
            return 0;
        }
        if (opts.print_version) {
            std::cout << WTENV_VERSION_STR << "\n";
            return 0;
        }
        if (opts.command == Command::None) {
            print_help(argv[0]);
            return 2;
        }
        rc = cli::run_command(opts, std::cout, std::cerr, std::cin);
    } catch (const wtenv::Error& e) {
        std::cerr << cli::format_error(e);
        rc = wtenv::exit_code_for(e.kind());
    } catch (const std::exception& e) {
        log_error(std::string("unexpected error: ") + e.what());
        std::cerr << "wtenv: " << e.what() << "\n";
        rc = 1;
    }
    shutdown_logger();
    return rc;
}
#endif // WTENV_NO_MAIN
