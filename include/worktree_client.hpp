#ifndef WORKTREE_CLIENT_HPP
#define WORKTREE_CLIENT_HPP
#include <cstddef>
#include <filesystem>
#include <string>
#include <vector>
#include "git_utils.hpp"
#include "system_utils.hpp"

namespace wtenv {
namespace fs = std::filesystem;

/** @brief How add_worktree obtained the branch it checked out. */
enum class BranchOrigin { Local, Remote, Created };

const char* to_string(BranchOrigin origin);

/** @brief Remote-tracking ref changes caused by one fetch. */
struct FetchSummary {
    std::size_t new_branches = 0;
    std::size_t updated_branches = 0;
    std::size_t new_commits = 0;
};

struct WorktreeStatus {
    std::size_t uncommitted = 0;
    std::size_t ahead = 0;
    std::size_t behind = 0;
};

/**
 * @brief Version-control operations against a repository path.
 *
 * Mutating operations run one `git` subprocess each; inspection reads the
 * repository through libgit2. Failures are thrown as wtenv::Error:
 * ToolUnavailable when git cannot be launched, ToolFailure (with the step and
 * captured stderr) when it exits non-zero.
 *
 * The methods are virtual so tests can inject failures at a chosen step.
 */
class WorktreeClient {
  public:
    explicit WorktreeClient(std::string git_executable = "git");
    virtual ~WorktreeClient() = default;

    /**
     * @brief Clone @p url into @p dest unless a repository is already there.
     *
     * The new clone has its HEAD detached so the base checkout never holds a
     * branch that a worktree may want.
     *
     * @return `true` if a clone was performed.
     */
    virtual bool ensure_clone(const std::string& url, const fs::path& dest) const;

    /** @brief `git fetch --all --prune` and report what changed. */
    virtual FetchSummary fetch(const fs::path& repo) const;

    /**
     * @brief Create a worktree for @p branch at @p dest.
     *
     * Uses the local branch if present, otherwise tracks `<remote>/<branch>`,
     * otherwise creates the branch from the default-branch tip without an
     * upstream. Throws Conflict/BranchCheckedOut if any worktree of @p base
     * already has the branch checked out.
     */
    virtual BranchOrigin add_worktree(const fs::path& base, const std::string& branch,
                                      const fs::path& dest) const;

    /** @brief Remove a registered worktree. NotFound if @p path is not one. */
    virtual void remove_worktree(const fs::path& base, const fs::path& path, bool force) const;

    virtual void prune_worktrees(const fs::path& base) const;

    /**
     * @brief Fetch then list remote branch names, sorted and deduplicated.
     *
     * A failed fetch is logged and the cached remote-tracking refs are
     * listed. Safe to call concurrently for different repositories.
     */
    virtual std::vector<std::string> fetch_branches(const fs::path& repo,
                                                    const procutil::CancelToken* cancel = nullptr) const;

    /** @brief Uncommitted path count and ahead/behind of the current branch. */
    virtual WorktreeStatus get_status(const fs::path& repo) const;

    virtual git::DefaultBranch default_branch(const fs::path& base) const;

    virtual bool is_branch_checked_out(const fs::path& base, const std::string& branch) const;

    const std::string& git_executable() const { return git_; }

  protected:
    /**
     * @brief Run `git <args>` in @p cwd, throwing on launch failure,
     *        cancellation or a non-zero exit.
     */
    procutil::ProcessResult run_git(const fs::path& cwd, const std::vector<std::string>& args,
                                    const std::string& step,
                                    const procutil::CancelToken* cancel = nullptr) const;

  private:
    std::string git_;
    git::GitInitGuard git_init_;
};

/**
 * @brief Turn remote-tracking shorthands into plain branch names.
 *
 * Strips the `<remote>/` prefix, drops symbolic `HEAD` entries, then
 * deduplicates and sorts lexicographically.
 */
std::vector<std::string> normalize_remote_branches(const std::vector<std::string>& refs,
                                                   const std::vector<std::string>& remotes);

} // namespace wtenv

#endif // WORKTREE_CLIENT_HPP
