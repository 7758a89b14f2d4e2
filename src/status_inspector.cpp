#include "status_inspector.hpp"
#include <system_error>
#include "errors.hpp"
#include "logger.hpp"

namespace wtenv {

RepoStatus StatusInspector::inspect(const RepoInstance& repo) const {
    RepoStatus st;
    st.name = repo.name;
    st.branch = repo.branch;
    std::error_code ec;
    if (!fs::exists(repo.worktree_path, ec)) {
        st.error = "worktree not found";
        return st;
    }
    try {
        WorktreeStatus ws = client_.get_status(repo.worktree_path);
        st.uncommitted = ws.uncommitted;
        st.ahead = ws.ahead;
        st.behind = ws.behind;
    } catch (const Error& e) {
        st.error = e.context().detail.empty() ? std::string(e.what()) : e.context().detail;
        log_warning("status failed", {{"repo", repo.name}, {"error", *st.error}});
    }
    return st;
}

std::vector<RepoStatus> StatusInspector::report(const Environment& env) const {
    std::vector<RepoStatus> out;
    out.reserve(env.repos.size());
    for (const auto& repo : env.repos)
        out.push_back(inspect(repo));
    return out;
}

} // namespace wtenv
