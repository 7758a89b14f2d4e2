#ifndef BRANCH_LOCKS_HPP
#define BRANCH_LOCKS_HPP
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <utility>
#include <vector>

namespace wtenv {

using LockSet = std::vector<std::unique_lock<std::mutex>>;

/**
 * @brief Process-wide table of named mutexes.
 *
 * Serializes worktree creation per (base repository, branch) and clone
 * provisioning per base repository. Mutexes are created on first use and
 * live for the rest of the process.
 */
class BranchLockTable {
  public:
    static BranchLockTable& instance();

    /**
     * @brief Lock every (base path, branch) pair.
     *
     * Keys are deduplicated and locked in sorted order so two callers with
     * overlapping sets cannot deadlock.
     */
    LockSet lock_branches(const std::vector<std::pair<std::string, std::string>>& pairs);

    /** @brief Lock clone provisioning for one base repository path. */
    std::unique_lock<std::mutex> lock_base(const std::string& base_path);

  private:
    std::mutex& mutex_for(const std::string& key);

    std::mutex table_mtx_;
    std::map<std::string, std::unique_ptr<std::mutex>> table_;
};

} // namespace wtenv

#endif // BRANCH_LOCKS_HPP
