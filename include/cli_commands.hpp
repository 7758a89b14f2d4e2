#pragma once

#include <filesystem>
#include <iosfwd>
#include <string>
#include <vector>

#include "config_utils.hpp"
#include "environment.hpp"
#include "errors.hpp"
#include "options.hpp"
#include "orchestrator.hpp"

namespace cli {

/**
 * @brief Locate and load the configuration for this invocation.
 *
 * Uses `--config`, then `./.wtenv.yaml`, then the XDG location. When no file
 * exists the built-in defaults are returned.
 */
wtenv::Config load_effective_config(const Options& opts, const std::filesystem::path& cwd);

/**
 * @brief Start the file logger according to the configuration and flags.
 *
 * Command line flags override the `logging:` section of the configuration.
 */
void configure_logging(const Options& opts, const wtenv::Config& cfg);

/**
 * @brief Convert `repo:branch` arguments into requests.
 *
 * @throws wtenv::Error (InvalidInput) naming the offending argument.
 */
std::vector<wtenv::RepoRequest> parse_repo_args(const std::vector<std::string>& args);

/** @brief Multi-line, user facing description of @p e. */
std::string format_error(const wtenv::Error& e);

/** @brief One line per repository, e.g. `backend  main  ahead 2`. */
std::string format_repo_status(const wtenv::RepoStatus& st);

int handle_create(const Options& opts, wtenv::EnvironmentOrchestrator& orch, std::ostream& out,
                  std::ostream& err);
int handle_review(const Options& opts, wtenv::EnvironmentOrchestrator& orch, std::ostream& out,
                  std::ostream& err);
int handle_list(const Options& opts, const wtenv::EnvironmentOrchestrator& orch, std::ostream& out);
int handle_info(const Options& opts, const wtenv::EnvironmentOrchestrator& orch, std::ostream& out);

/**
 * @brief Delete each named environment.
 *
 * Unless `--yes` is given, each deletion is confirmed by reading a line from
 * @p in. Every name is attempted; the exit code of the first failure is
 * returned.
 */
int handle_delete(const Options& opts, wtenv::EnvironmentOrchestrator& orch, std::ostream& out,
                  std::ostream& err, std::istream& in);
int handle_path(const Options& opts, const wtenv::EnvironmentOrchestrator& orch, std::ostream& out);

/**
 * @brief Print remote branches of catalog repositories.
 *
 * Installs a SIGINT handler for the duration of the call so that Ctrl-C
 * terminates outstanding `git fetch` processes.
 */
int handle_branches(const Options& opts, const wtenv::EnvironmentOrchestrator& orch,
                    std::ostream& out, std::ostream& err);
int handle_config(const Options& opts, const wtenv::Config& cfg, std::ostream& out);
int handle_init(const Options& opts, std::ostream& out);

/**
 * @brief Dispatch @p opts to its handler.
 *
 * Errors raised by the core are rendered to @p err and mapped to their exit
 * code.
 */
int run_command(const Options& opts, std::ostream& out, std::ostream& err, std::istream& in);

} // namespace cli
