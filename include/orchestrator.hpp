#ifndef ORCHESTRATOR_HPP
#define ORCHESTRATOR_HPP
#include <filesystem>
#include <functional>
#include <map>
#include <optional>
#include <string>
#include <vector>
#include "branch_fetch.hpp"
#include "config_utils.hpp"
#include "environment.hpp"
#include "registry.hpp"
#include "system_utils.hpp"
#include "template_renderer.hpp"
#include "worktree_client.hpp"

namespace wtenv {

struct CreateOptions {
    bool fetch = true;
    bool render_templates = true;
    std::optional<PrInfo> pr_info;
    /// Called with a short description before each step.
    std::function<void(const std::string&)> progress;
};

struct DeleteOptions {
    bool force = false;
};

/** @brief Registry record plus live repository state. */
struct EnvironmentStatus {
    Environment env;
    bool exists_on_disk = false;
    std::vector<RepoStatus> repos;
};

/**
 * @brief Drives environment transactions and the read paths.
 *
 * create() is all-or-nothing from the registry's point of view: once the
 * environment directory exists every further step is paired with a
 * compensating action, and any failure rolls them back newest first before
 * the error propagates. Rollback failures are attached to the error as
 * secondary failures.
 */
class EnvironmentOrchestrator {
  public:
    EnvironmentOrchestrator(Config config, EnvironmentRegistry& registry,
                            const WorktreeClient& client);

    /**
     * @brief Create and register environment @p name.
     *
     * @throws wtenv::Error InvalidInput, Conflict, NotFound, ToolFailure,
     *         ToolUnavailable, TemplateFailure or Io.
     */
    Environment create(const std::string& name, const std::vector<RepoRequest>& repos,
                       const CreateOptions& opts = {});

    /**
     * @brief Remove an environment's worktrees, directory and record.
     *
     * Without `force`, uncommitted or unpushed work in any repository aborts
     * with Conflict/OutstandingWork before anything is touched. Later
     * failures do not stop the remaining steps; they are reported together
     * as one Partial error.
     */
    void remove(const std::string& name, const DeleteOptions& opts = {});

    std::vector<Environment> list() const;
    Environment info(const std::string& name) const;
    EnvironmentStatus status(const std::string& name) const;
    fs::path path(const std::string& name) const;

    /**
     * @brief Remote branches of catalog repositories, fetched concurrently.
     *
     * Base repositories that are not cloned yet are cloned first.
     * @throws wtenv::Error NotFound for a name missing from the catalog.
     */
    std::map<std::string, BranchListing> list_branches(const std::vector<std::string>& repos,
                                                       const procutil::CancelToken* cancel = nullptr) const;

    const Config& config() const { return config_; }

  private:
    void validate_request(const std::string& name, const std::vector<RepoRequest>& repos) const;

    Config config_;
    EnvironmentRegistry& registry_;
    const WorktreeClient& client_;
    TemplateRenderer renderer_;
};

} // namespace wtenv

#endif // ORCHESTRATOR_HPP
