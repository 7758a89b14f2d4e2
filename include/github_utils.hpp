#ifndef GITHUB_UTILS_HPP
#define GITHUB_UTILS_HPP
#include <map>
#include <optional>
#include <string>
#include "config_utils.hpp"
#include "environment.hpp"

namespace wtenv {

/** @brief A pull request reference resolved to owner/repo and number. */
struct ParsedPr {
    std::string owner;
    std::string repo;
    int number = 0;

    std::string full_name() const { return owner + "/" + repo; }
};

/**
 * @brief Extract `owner/repo` from a GitHub remote URL.
 *
 * Accepts `git@github.com:owner/repo(.git)` and
 * `http(s)://github.com/owner/repo(.git)(/)`.
 */
std::optional<std::string> parse_github_repo(const std::string& url);

/** @brief Parse `https://github.com/<owner>/<repo>/pull/<n>[/...]`. */
std::optional<ParsedPr> parse_pr_url(const std::string& url);

/** @brief Parse `<repo>#<n>` using the catalog URL of `<repo>`. */
std::optional<ParsedPr> parse_pr_shorthand(const std::string& shorthand,
                                           const std::map<std::string, RepoConfig>& repos);

/** @brief URL first, then shorthand. */
std::optional<ParsedPr> parse_pr_reference(const std::string& reference,
                                           const std::map<std::string, RepoConfig>& repos);

/** @brief Catalog name whose URL points at the PR's repository (case-insensitive). */
std::optional<std::string> find_config_repo_name(const ParsedPr& pr,
                                                 const std::map<std::string, RepoConfig>& repos);

/**
 * @brief Query PR metadata through `gh pr view`.
 *
 * The returned PrInfo has no repo_name; the caller fills it in.
 * @throws wtenv::Error ToolUnavailable when gh cannot be started,
 *         ToolFailure when it fails or prints unexpected output.
 */
PrInfo fetch_pr_metadata(const ParsedPr& pr, const std::string& gh_executable = "gh");

} // namespace wtenv

#endif // GITHUB_UTILS_HPP
