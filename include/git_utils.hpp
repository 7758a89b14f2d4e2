#ifndef GIT_UTILS_HPP
#define GIT_UTILS_HPP

#include <git2.h>
#include <cstddef>
#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace git {
namespace fs = std::filesystem;

/**
 * @brief RAII helper managing global libgit2 initialization.
 *
 * libgit2 reference counts init/shutdown, so every component that reads
 * repositories may hold its own guard.
 */
struct GitInitGuard {
    GitInitGuard();  ///< Calls `git_libgit2_init()`
    ~GitInitGuard(); ///< Calls `git_libgit2_shutdown()`
    GitInitGuard(const GitInitGuard&) : GitInitGuard() {}
    GitInitGuard& operator=(const GitInitGuard&) { return *this; }
};

// RAII wrappers for libgit2 resources
template <typename T, void (*Free)(T*)> struct GitHandle {
    T* h;
    explicit GitHandle(T* h_ = nullptr) : h(h_) {}
    ~GitHandle() {
        if (h)
            Free(h);
    }
    GitHandle(const GitHandle&) = delete;
    GitHandle& operator=(const GitHandle&) = delete;
    T* get() const { return h; }
};

using repo_ptr = GitHandle<git_repository, git_repository_free>;
using reference_ptr = GitHandle<git_reference, git_reference_free>;
using status_list_ptr = GitHandle<git_status_list, git_status_list_free>;
using branch_iter_ptr = GitHandle<git_branch_iterator, git_branch_iterator_free>;
using revwalk_ptr = GitHandle<git_revwalk, git_revwalk_free>;
using worktree_ptr = GitHandle<git_worktree, git_worktree_free>;

// The utility functions below assume libgit2 is already initialized.

/**
 * @brief Determine whether the given path is the root of a working tree.
 *
 * @return `true` if @a p contains a `.git` directory or, for a linked
 *         worktree, a `.git` file.
 */
bool is_git_repo(const fs::path& p);

/**
 * @brief Number of paths that differ from HEAD or are untracked.
 *
 * Follows `git status --porcelain`: staged, modified and untracked paths each
 * count once, an untracked directory counts as a single entry and ignored
 * files are not counted.
 */
std::optional<std::size_t> count_uncommitted(const fs::path& repo, std::string* error = nullptr);

/**
 * @brief Commits ahead of and behind the upstream of the current branch.
 *
 * A detached or unborn HEAD and a branch without upstream yield `{0, 0}`.
 */
std::optional<std::pair<std::size_t, std::size_t>> ahead_behind(const fs::path& repo,
                                                                std::string* error = nullptr);

/** @brief Names of the configured remotes, in configuration order. */
std::optional<std::vector<std::string>> list_remotes(const fs::path& repo,
                                                     std::string* error = nullptr);

/**
 * @brief Shorthand names of all remote-tracking branches (`origin/main`).
 *
 * Symbolic entries such as `origin/HEAD` are included; callers filter them.
 */
std::optional<std::vector<std::string>> list_remote_branches(const fs::path& repo,
                                                             std::string* error = nullptr);

/** @brief Map of every direct `refs/remotes/` reference to its target id. */
std::optional<std::map<std::string, std::string>> remote_ref_snapshot(const fs::path& repo,
                                                                      std::string* error = nullptr);

/**
 * @brief Count commits reachable from @p tips but not from @p hidden.
 *
 * Ids that no longer resolve are ignored.
 */
std::optional<std::size_t> count_commits_between(const fs::path& repo,
                                                 const std::vector<std::string>& tips,
                                                 const std::vector<std::string>& hidden,
                                                 std::string* error = nullptr);

/** @brief Whether `refs/heads/<branch>` exists. */
bool local_branch_exists(const fs::path& repo, const std::string& branch);

/**
 * @brief First remote (in configuration order) that carries @p branch.
 *
 * @return Remote name, or `std::nullopt` when no remote-tracking ref exists.
 */
std::optional<std::string> remote_for_branch(const fs::path& repo, const std::string& branch);

/**
 * @brief Whether @p branch is checked out in the main or any linked worktree
 *        of @p repo.
 */
std::optional<bool> branch_checked_out(const fs::path& repo, const std::string& branch,
                                       std::string* error = nullptr);

/** @brief Where a new branch should start and what it is called there. */
struct DefaultBranch {
    std::string name;        ///< Branch name without remote prefix.
    std::string start_point; ///< Revision to pass to git, e.g. `origin/main`.
};

/**
 * @brief Resolve the default branch of @p repo.
 *
 * Order: the target of `refs/remotes/origin/HEAD`; the symbolic HEAD of any
 * other remote; `origin/main`; `origin/master`; local `main`; local `master`.
 */
std::optional<DefaultBranch> default_branch(const fs::path& repo, std::string* error = nullptr);

/** @brief Absolute paths of all linked worktrees registered in @p repo. */
std::optional<std::vector<fs::path>> linked_worktrees(const fs::path& repo,
                                                      std::string* error = nullptr);

} // namespace git

#endif // GIT_UTILS_HPP
