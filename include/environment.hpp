#ifndef ENVIRONMENT_HPP
#define ENVIRONMENT_HPP
#include <cstddef>
#include <filesystem>
#include <optional>
#include <set>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace wtenv {
namespace fs = std::filesystem;

/** @brief One repository checked out inside an environment. */
struct RepoInstance {
    std::string name;   ///< Key into the repository catalog.
    std::string branch; ///< Branch checked out in the worktree.
    fs::path worktree_path;
};

/** @brief A realized symlink, both ends relative to the environment root. */
struct SymlinkEntry {
    std::string source;
    std::string target;
};

/** @brief Pull request an environment was created to review. */
struct PrInfo {
    int number = 0;
    std::string url;
    std::string title;
    std::string author;
    std::string head_ref;
    std::string repo_name;
};

/**
 * @brief Persisted description of one environment.
 *
 * Created once by a successful create and only ever removed as a whole.
 */
struct Environment {
    std::string name;
    fs::path path;
    std::string created_at; ///< ISO-8601 with offset.
    std::vector<RepoInstance> repos;
    std::vector<std::string> generated_files;
    std::vector<SymlinkEntry> symlinks;
    std::optional<PrInfo> pr_info;

    const RepoInstance* find_repo(const std::string& repo) const;
    std::set<std::string> repo_names() const;
};

/** @brief One `repo:branch` pair of a create request. */
struct RepoRequest {
    std::string repo;
    std::string branch;
};

/** @brief Live synchronization state of one worktree. Never cached. */
struct RepoStatus {
    std::string name;
    std::string branch;
    std::size_t uncommitted = 0;
    std::size_t ahead = 0;
    std::size_t behind = 0;
    std::optional<std::string> error;
};

enum class SyncState { Clean, Ahead, Uncommitted, Error };

/** @brief Precedence: error, uncommitted, ahead, clean. */
SyncState classify(const RepoStatus& status);
const char* to_string(SyncState state);

/**
 * @brief Check an environment name.
 *
 * Names start with `[A-Za-z0-9_]` and continue with `[A-Za-z0-9_-]`, which
 * rules out separators, dot names and leading hyphens.
 */
bool is_valid_environment_name(const std::string& name);

/** @brief Parse `repo:branch`. Only the first colon separates. */
std::optional<RepoRequest> parse_repo_branch(const std::string& spec, std::string* error = nullptr);

nlohmann::ordered_json to_json(const Environment& env);

/** @throws nlohmann::json::exception on a malformed record. */
Environment environment_from_json(const nlohmann::ordered_json& j);

} // namespace wtenv

#endif // ENVIRONMENT_HPP
