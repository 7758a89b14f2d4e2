#ifndef STATUS_INSPECTOR_HPP
#define STATUS_INSPECTOR_HPP
#include <vector>
#include "environment.hpp"
#include "worktree_client.hpp"

namespace wtenv {

/**
 * @brief Aggregates live status for every repository of an environment.
 *
 * One repository's failure becomes that entry's error; report() itself
 * never throws for a per-repository problem.
 */
class StatusInspector {
  public:
    explicit StatusInspector(const WorktreeClient& client) : client_(client) {}

    /** @brief Status of each repository, in the environment's order. */
    std::vector<RepoStatus> report(const Environment& env) const;

    /** @brief Status of a single recorded repository. */
    RepoStatus inspect(const RepoInstance& repo) const;

  private:
    const WorktreeClient& client_;
};

} // namespace wtenv

#endif // STATUS_INSPECTOR_HPP
