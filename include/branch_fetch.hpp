#ifndef BRANCH_FETCH_HPP
#define BRANCH_FETCH_HPP
#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <vector>
#include "system_utils.hpp"
#include "worktree_client.hpp"

namespace wtenv {

/** @brief Where to find (or clone) a repository whose branches are listed. */
struct BranchSource {
    std::string url;     ///< Cloned into `base` first when non-empty and missing.
    std::filesystem::path base;
};

/** @brief Result slot of one repository. */
struct BranchListing {
    std::vector<std::string> branches;
    std::optional<std::string> error;
    bool cancelled = false;
};

/**
 * @brief List remote branches of several repositories concurrently.
 *
 * One thread per repository; each writes only its own slot and all threads
 * are joined before returning. Cancelling @p cancel terminates running git
 * children and marks the affected slots cancelled.
 */
std::map<std::string, BranchListing>
fetch_branch_lists(const WorktreeClient& client, const std::map<std::string, BranchSource>& sources,
                   const procutil::CancelToken* cancel = nullptr);

} // namespace wtenv

#endif // BRANCH_FETCH_HPP
