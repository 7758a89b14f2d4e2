#include "branch_fetch.hpp"
#include "errors.hpp"
#include "logger.hpp"
#include "thread_utils.hpp"

namespace wtenv {

std::map<std::string, BranchListing>
fetch_branch_lists(const WorktreeClient& client, const std::map<std::string, BranchSource>& sources,
                   const procutil::CancelToken* cancel) {
    std::map<std::string, BranchListing> results;
    // Slots are created up front; threads only touch their own element.
    for (const auto& [name, src] : sources)
        results[name];
    {
        ThreadGroup group;
        for (const auto& [name, src] : sources) {
            BranchListing* slot = &results[name];
            const std::string repo = name;
            const BranchSource source = src;
            group.spawn([&client, slot, repo, source, cancel]() {
                try {
                    if (cancel && cancel->cancelled()) {
                        slot->cancelled = true;
                        slot->error = "cancelled";
                        return;
                    }
                    if (!source.url.empty())
                        client.ensure_clone(source.url, source.base);
                    slot->branches = client.fetch_branches(source.base, cancel);
                } catch (const Error& e) {
                    if (cancel && cancel->cancelled()) {
                        slot->cancelled = true;
                        slot->error = "cancelled";
                        return;
                    }
                    std::string msg = e.what();
                    if (!e.context().detail.empty())
                        msg += ": " + e.context().detail;
                    slot->error = msg;
                    log_warning("branch listing failed", {{"repo", repo}, {"error", msg}});
                } catch (const std::exception& e) {
                    slot->error = e.what();
                    log_warning("branch listing failed", {{"repo", repo}, {"error", e.what()}});
                }
            });
        }
        group.join_all();
    }
    return results;
}

} // namespace wtenv
