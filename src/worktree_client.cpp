#include "worktree_client.hpp"
#include <algorithm>
#include <set>
#include <system_error>
#include <utility>
#include "errors.hpp"
#include "logger.hpp"

namespace wtenv {

namespace {

std::string trim(const std::string& s) {
    auto b = s.find_first_not_of(" \t\r\n");
    if (b == std::string::npos)
        return "";
    auto e = s.find_last_not_of(" \t\r\n");
    return s.substr(b, e - b + 1);
}

fs::path canonical_or_self(const fs::path& p) {
    std::error_code ec;
    fs::path c = fs::weakly_canonical(p, ec);
    if (ec)
        return p.lexically_normal();
    return c;
}

} // namespace

const char* to_string(BranchOrigin origin) {
    switch (origin) {
    case BranchOrigin::Local:
        return "local";
    case BranchOrigin::Remote:
        return "remote";
    case BranchOrigin::Created:
        return "created";
    }
    return "local";
}

WorktreeClient::WorktreeClient(std::string git_executable) : git_(std::move(git_executable)) {}

procutil::ProcessResult WorktreeClient::run_git(const fs::path& cwd,
                                                const std::vector<std::string>& args,
                                                const std::string& step,
                                                const procutil::CancelToken* cancel) const {
    std::vector<std::string> argv;
    argv.reserve(args.size() + 1);
    argv.push_back(git_);
    argv.insert(argv.end(), args.begin(), args.end());
    std::string cmdline = git_;
    for (const auto& a : args)
        cmdline += " " + a;
    log_debug("running " + cmdline, {{"cwd", cwd.string()}, {"step", step}});

    // never block on a credential prompt
    auto res = procutil::run_process(argv, cwd, cancel, {{"GIT_TERMINAL_PROMPT", "0"}});
    ErrorContext ctx;
    ctx.step = step;
    ctx.path = cwd.string();
    if (!res.launched) {
        ctx.detail = res.launch_error;
        log_error("could not launch " + git_, {{"step", step}, {"error", res.launch_error}});
        throw Error(ErrorKind::ToolUnavailable, "cannot run " + git_ + ": " + res.launch_error,
                    ctx);
    }
    if (res.cancelled) {
        ctx.detail = "cancelled";
        throw Error(ErrorKind::ToolFailure, "cancelled: " + cmdline, ctx);
    }
    if (res.exit_code != 0) {
        ctx.detail = trim(res.err);
        log_error(cmdline + " failed",
                  {{"step", step}, {"exit", std::to_string(res.exit_code)}, {"stderr", ctx.detail}});
        throw Error(ErrorKind::ToolFailure,
                    cmdline + " exited with " + std::to_string(res.exit_code), ctx);
    }
    return res;
}

bool WorktreeClient::ensure_clone(const std::string& url, const fs::path& dest) const {
    if (git::is_git_repo(dest))
        return false;
    std::error_code ec;
    fs::create_directories(dest.parent_path(), ec);
    if (ec) {
        ErrorContext ctx;
        ctx.step = "clone";
        ctx.path = dest.parent_path().string();
        ctx.detail = ec.message();
        throw Error(ErrorKind::Io, "cannot create " + dest.parent_path().string(), ctx);
    }
    log_info("cloning " + url, {{"dest", dest.string()}});
    run_git(dest.parent_path(), {"clone", url, dest.string()}, "clone");
    run_git(dest, {"checkout", "--detach"}, "clone");
    return true;
}

FetchSummary WorktreeClient::fetch(const fs::path& repo) const {
    std::string err;
    auto before = git::remote_ref_snapshot(repo, &err);
    run_git(repo, {"fetch", "--all", "--prune"}, "fetch");
    FetchSummary summary;
    auto after = git::remote_ref_snapshot(repo, &err);
    if (!before || !after) {
        log_debug("fetch summary unavailable", {{"repo", repo.string()}, {"error", err}});
        return summary;
    }
    std::vector<std::string> tips;
    std::vector<std::string> hidden;
    for (const auto& [name, oid] : *before)
        hidden.push_back(oid);
    for (const auto& [name, oid] : *after) {
        auto it = before->find(name);
        if (it == before->end()) {
            ++summary.new_branches;
            tips.push_back(oid);
        } else if (it->second != oid) {
            ++summary.updated_branches;
            tips.push_back(oid);
        }
    }
    if (auto n = git::count_commits_between(repo, tips, hidden, &err))
        summary.new_commits = *n;
    else
        log_debug("new commit count unavailable", {{"repo", repo.string()}, {"error", err}});
    return summary;
}

BranchOrigin WorktreeClient::add_worktree(const fs::path& base, const std::string& branch,
                                          const fs::path& dest) const {
    if (is_branch_checked_out(base, branch)) {
        ErrorContext ctx;
        ctx.step = "worktree-add";
        ctx.path = dest.string();
        throw Error(ErrorKind::Conflict, "branch '" + branch + "' is already checked out", ctx)
            .with_conflict(ConflictKind::BranchCheckedOut);
    }
    if (git::local_branch_exists(base, branch)) {
        run_git(base, {"worktree", "add", dest.string(), branch}, "worktree-add");
        return BranchOrigin::Local;
    }
    if (auto remote = git::remote_for_branch(base, branch)) {
        run_git(base, {"worktree", "add", "--track", "-b", branch, dest.string(), *remote + "/" + branch},
                "worktree-add");
        return BranchOrigin::Remote;
    }
    git::DefaultBranch def = default_branch(base);
    log_info("creating branch " + branch + " from " + def.start_point, {{"base", base.string()}});
    run_git(base, {"worktree", "add", "--no-track", "-b", branch, dest.string(), def.start_point},
            "worktree-add");
    return BranchOrigin::Created;
}

void WorktreeClient::remove_worktree(const fs::path& base, const fs::path& path, bool force) const {
    std::string err;
    auto worktrees = git::linked_worktrees(base, &err);
    ErrorContext ctx;
    ctx.step = "worktree-remove";
    ctx.path = path.string();
    if (!worktrees) {
        ctx.detail = err;
        throw Error(ErrorKind::ToolFailure, "cannot list worktrees of " + base.string(), ctx);
    }
    const fs::path wanted = canonical_or_self(path);
    bool registered = std::any_of(worktrees->begin(), worktrees->end(), [&](const fs::path& p) {
        return canonical_or_self(p) == wanted;
    });
    if (!registered)
        throw Error(ErrorKind::NotFound, path.string() + " is not a worktree of " + base.string(),
                    ctx);
    std::vector<std::string> args{"worktree", "remove"};
    if (force)
        args.push_back("--force");
    args.push_back(path.string());
    run_git(base, args, "worktree-remove");
}

void WorktreeClient::prune_worktrees(const fs::path& base) const {
    run_git(base, {"worktree", "prune"}, "worktree-prune");
}

std::vector<std::string> WorktreeClient::fetch_branches(const fs::path& repo,
                                                        const procutil::CancelToken* cancel) const {
    try {
        run_git(repo, {"fetch", "--all", "--prune"}, "fetch", cancel);
    } catch (const Error& e) {
        if (e.kind() == ErrorKind::ToolUnavailable || e.context().detail == "cancelled")
            throw;
        log_warning("fetch failed, listing cached branches",
                    {{"repo", repo.string()}, {"error", e.context().detail}});
    }
    std::string err;
    auto refs = git::list_remote_branches(repo, &err);
    auto remotes = git::list_remotes(repo, &err);
    if (!refs || !remotes) {
        ErrorContext ctx;
        ctx.step = "list-branches";
        ctx.path = repo.string();
        ctx.detail = err;
        throw Error(ErrorKind::ToolFailure, "cannot list branches of " + repo.string(), ctx);
    }
    return normalize_remote_branches(*refs, *remotes);
}

WorktreeStatus WorktreeClient::get_status(const fs::path& repo) const {
    ErrorContext ctx;
    ctx.step = "status";
    ctx.path = repo.string();
    std::error_code ec;
    if (!fs::exists(repo, ec))
        throw Error(ErrorKind::NotFound, "worktree not found", ctx);
    std::string err;
    auto dirty = git::count_uncommitted(repo, &err);
    if (!dirty) {
        ctx.detail = err;
        throw Error(ErrorKind::ToolFailure, "status failed: " + err, ctx);
    }
    auto ab = git::ahead_behind(repo, &err);
    if (!ab) {
        ctx.detail = err;
        throw Error(ErrorKind::ToolFailure, "ahead/behind failed: " + err, ctx);
    }
    return WorktreeStatus{*dirty, ab->first, ab->second};
}

git::DefaultBranch WorktreeClient::default_branch(const fs::path& base) const {
    std::string err;
    auto def = git::default_branch(base, &err);
    if (!def) {
        ErrorContext ctx;
        ctx.step = "default-branch";
        ctx.path = base.string();
        ctx.detail = err;
        throw Error(ErrorKind::NotFound, "no default branch in " + base.string(), ctx);
    }
    return *def;
}

bool WorktreeClient::is_branch_checked_out(const fs::path& base, const std::string& branch) const {
    std::string err;
    auto out = git::branch_checked_out(base, branch, &err);
    if (!out) {
        ErrorContext ctx;
        ctx.step = "branch-check";
        ctx.path = base.string();
        ctx.detail = err;
        throw Error(ErrorKind::ToolFailure, "cannot inspect branch " + branch, ctx);
    }
    return *out;
}

std::vector<std::string> normalize_remote_branches(const std::vector<std::string>& refs,
                                                   const std::vector<std::string>& remotes) {
    std::set<std::string> names;
    for (const auto& ref : refs) {
        std::string name = ref;
        bool symbolic_head = false;
        size_t best = 0;
        for (const auto& remote : remotes) {
            if (ref == remote) {
                symbolic_head = true; // `git branch -r` shortens origin/HEAD to origin
                break;
            }
            const std::string prefix = remote + "/";
            if (ref.size() > prefix.size() && ref.compare(0, prefix.size(), prefix) == 0 &&
                prefix.size() > best) {
                best = prefix.size();
                name = ref.substr(prefix.size());
            }
        }
        if (symbolic_head || name.empty() || name == "HEAD")
            continue;
        names.insert(name);
    }
    return std::vector<std::string>(names.begin(), names.end());
}

} // namespace wtenv
