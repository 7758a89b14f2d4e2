#ifndef CONFIG_UTILS_HPP
#define CONFIG_UTILS_HPP
#include <cstddef>
#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "logger.hpp"

namespace wtenv {
namespace fs = std::filesystem;

struct RepoConfig {
    std::string url;
};

/** @brief Template to render into new environments. */
struct TemplateRule {
    fs::path source;         ///< Absolute after loading.
    std::string destination; ///< Relative to the environment root.
    std::optional<std::vector<std::string>> when;
};

/** @brief Static file copied verbatim into new environments. */
struct CopyRule {
    fs::path source;
    std::string destination;
    std::optional<std::vector<std::string>> when;
};

/** @brief Link between repositories; only created when all of `when` are present. */
struct SymlinkRule {
    std::string source; ///< Relative to the environment root.
    std::string target; ///< Relative to the environment root.
    std::vector<std::string> when;
};

struct LoggingConfig {
    fs::path file;
    LogLevel level = LogLevel::INFO;
    std::size_t max_size = 1024 * 1024;
    std::size_t max_files = 3;
    bool json = false;
    bool compress = false;
};

/**
 * @brief Validated wtenv configuration.
 *
 * All paths are absolute once loaded: `~` is expanded and relative paths are
 * resolved against the directory of the configuration file.
 */
struct Config {
    fs::path base_repos_dir;
    fs::path environments_dir;
    fs::path registry_path;
    std::string git_executable = "git";
    LoggingConfig logging;
    std::map<std::string, RepoConfig> repositories;
    std::vector<TemplateRule> templates;
    std::vector<CopyRule> copy_files;
    std::vector<SymlinkRule> symlinks;
    fs::path source_path; ///< File the configuration was read from, if any.

    /** @brief Throw wtenv::Error(Config) describing the first invalid entry. */
    void validate() const;

    /** @brief Non-fatal findings, e.g. a `when` naming an unknown repository. */
    std::vector<std::string> warnings() const;

    fs::path base_repo_path(const std::string& repo) const { return base_repos_dir / repo; }
    fs::path environment_path(const std::string& name) const { return environments_dir / name; }
};

/** @brief Configuration with every default applied and no repositories. */
Config default_config();

/** @brief Expand a leading `~` to `$HOME`. */
fs::path expand_user(const std::string& path);

/**
 * @brief Repository names follow `[A-Za-z0-9_][A-Za-z0-9_.-]*`.
 */
bool is_valid_repo_name(const std::string& name);

/**
 * @brief Read a YAML file into a JSON document.
 *
 * Scalars are kept as strings; typed conversion happens in
 * config_from_json.
 *
 * @return `false` with @p error set when the file cannot be read or parsed.
 */
bool load_yaml_config(const std::string& path, nlohmann::json& out, std::string& error);

/** @brief Read a JSON file. */
bool load_json_config(const std::string& path, nlohmann::json& out, std::string& error);

/**
 * @brief Build and validate a Config from a parsed document.
 *
 * @param doc        Parsed YAML or JSON root; null is treated as empty.
 * @param config_dir Directory relative paths are resolved against.
 * @throws wtenv::Error with kind Config.
 */
Config config_from_json(const nlohmann::json& doc, const fs::path& config_dir);

/**
 * @brief Load the configuration at @p path (YAML, or JSON for `.json`).
 * @throws wtenv::Error with kind Config.
 */
Config load_config(const fs::path& path);

/** @brief `$XDG_CONFIG_HOME/wtenv/config.yaml` or `~/.config/wtenv/config.yaml`. */
fs::path default_config_path();

/**
 * @brief Locate the configuration file.
 *
 * @p explicit_path wins when given (and must exist), then `.wtenv.yaml` in
 * @p cwd, then default_config_path().
 */
std::optional<fs::path> find_config_file(const std::optional<fs::path>& explicit_path,
                                         const fs::path& cwd);

/** @brief Commented starter configuration written by `wtenv init`. */
std::string default_config_text();

/**
 * @brief Write default_config_text() to @p path and create a `templates/`
 *        directory beside it.
 * @throws wtenv::Error Conflict if the file exists and @p force is false.
 */
void init_config(const fs::path& path, bool force);

nlohmann::ordered_json config_to_json(const Config& cfg);

} // namespace wtenv

#endif // CONFIG_UTILS_HPP
