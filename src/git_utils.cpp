#include "git_utils.hpp"
#include <algorithm>
#include <system_error>

using namespace std;

namespace git {

namespace {

using ref_iter_ptr = GitHandle<git_reference_iterator, git_reference_iterator_free>;

struct StrArray {
    git_strarray arr{nullptr, 0};
    ~StrArray() { git_strarray_dispose(&arr); }
};

/**
 * @brief Populate an error string with the last libgit2 error message.
 */
void set_error(std::string* error) {
    if (!error)
        return;
    const git_error* e = git_error_last();
    if (e && e->message)
        *error = e->message;
    else
        *error = "Unknown libgit2 error";
}

bool open_repo(const fs::path& repo, repo_ptr& out, std::string* error) {
    git_repository* raw = nullptr;
    if (git_repository_open(&raw, repo.string().c_str()) != 0) {
        set_error(error);
        return false;
    }
    out.h = raw;
    return true;
}

string oid_to_hex(const git_oid& oid) {
    char buf[GIT_OID_HEXSZ + 1];
    git_oid_tostr(buf, sizeof(buf), &oid);
    return string(buf);
}

bool ref_exists(git_repository* r, const string& name) {
    git_reference* raw = nullptr;
    if (git_reference_lookup(&raw, r, name.c_str()) != 0)
        return false;
    reference_ptr ref(raw);
    git_reference* resolved = nullptr;
    if (git_reference_resolve(&resolved, ref.get()) != 0)
        return false;
    reference_ptr keep(resolved);
    return true;
}

// Resolves refs/remotes/<remote>/HEAD to "<remote>/<branch>" if it is a
// symbolic ref whose target exists.
optional<string> remote_head_target(git_repository* r, const string& remote) {
    git_reference* raw = nullptr;
    string name = "refs/remotes/" + remote + "/HEAD";
    if (git_reference_lookup(&raw, r, name.c_str()) != 0)
        return nullopt;
    reference_ptr ref(raw);
    if (git_reference_type(ref.get()) != GIT_REFERENCE_SYMBOLIC)
        return nullopt;
    const char* target = git_reference_symbolic_target(ref.get());
    if (!target)
        return nullopt;
    string t = target;
    const string prefix = "refs/remotes/";
    if (t.rfind(prefix, 0) != 0 || !ref_exists(r, t))
        return nullopt;
    return t.substr(prefix.size());
}

} // namespace

GitInitGuard::GitInitGuard() { git_libgit2_init(); }

GitInitGuard::~GitInitGuard() { git_libgit2_shutdown(); }

bool is_git_repo(const fs::path& p) {
    std::error_code ec;
    return fs::exists(p / ".git", ec);
}

optional<size_t> count_uncommitted(const fs::path& repo, string* error) {
    repo_ptr r;
    if (!open_repo(repo, r, error))
        return nullopt;
    git_status_options opts = GIT_STATUS_OPTIONS_INIT;
    opts.show = GIT_STATUS_SHOW_INDEX_AND_WORKDIR;
    opts.flags = GIT_STATUS_OPT_INCLUDE_UNTRACKED | GIT_STATUS_OPT_RENAMES_HEAD_TO_INDEX;
    git_status_list* raw = nullptr;
    if (git_status_list_new(&raw, r.get(), &opts) != 0) {
        set_error(error);
        return nullopt;
    }
    status_list_ptr list(raw);
    return git_status_list_entrycount(list.get());
}

optional<pair<size_t, size_t>> ahead_behind(const fs::path& repo, string* error) {
    repo_ptr r;
    if (!open_repo(repo, r, error))
        return nullopt;
    if (git_repository_head_detached(r.get()) == 1 || git_repository_head_unborn(r.get()) == 1)
        return pair<size_t, size_t>{0, 0};
    git_reference* head_raw = nullptr;
    if (git_repository_head(&head_raw, r.get()) != 0) {
        set_error(error);
        return nullopt;
    }
    reference_ptr head(head_raw);
    git_reference* up_raw = nullptr;
    int rc = git_branch_upstream(&up_raw, head.get());
    if (rc == GIT_ENOTFOUND)
        return pair<size_t, size_t>{0, 0};
    if (rc != 0) {
        set_error(error);
        return nullopt;
    }
    reference_ptr upstream(up_raw);
    const git_oid* local = git_reference_target(head.get());
    const git_oid* remote = git_reference_target(upstream.get());
    if (!local || !remote)
        return pair<size_t, size_t>{0, 0};
    size_t ahead = 0;
    size_t behind = 0;
    if (git_graph_ahead_behind(&ahead, &behind, r.get(), local, remote) != 0) {
        set_error(error);
        return nullopt;
    }
    return make_pair(ahead, behind);
}

optional<vector<string>> list_remotes(const fs::path& repo, string* error) {
    repo_ptr r;
    if (!open_repo(repo, r, error))
        return nullopt;
    StrArray names;
    if (git_remote_list(&names.arr, r.get()) != 0) {
        set_error(error);
        return nullopt;
    }
    vector<string> out;
    for (size_t i = 0; i < names.arr.count; ++i)
        out.emplace_back(names.arr.strings[i]);
    return out;
}

optional<vector<string>> list_remote_branches(const fs::path& repo, string* error) {
    repo_ptr r;
    if (!open_repo(repo, r, error))
        return nullopt;
    git_branch_iterator* raw = nullptr;
    if (git_branch_iterator_new(&raw, r.get(), GIT_BRANCH_REMOTE) != 0) {
        set_error(error);
        return nullopt;
    }
    branch_iter_ptr it(raw);
    vector<string> out;
    git_reference* ref_raw = nullptr;
    git_branch_t type;
    int rc;
    while ((rc = git_branch_next(&ref_raw, &type, it.get())) == 0) {
        reference_ptr ref(ref_raw);
        const char* name = git_reference_shorthand(ref.get());
        if (name)
            out.emplace_back(name);
    }
    if (rc != GIT_ITEROVER) {
        set_error(error);
        return nullopt;
    }
    return out;
}

optional<map<string, string>> remote_ref_snapshot(const fs::path& repo, string* error) {
    repo_ptr r;
    if (!open_repo(repo, r, error))
        return nullopt;
    git_reference_iterator* raw = nullptr;
    if (git_reference_iterator_glob_new(&raw, r.get(), "refs/remotes/*") != 0) {
        set_error(error);
        return nullopt;
    }
    ref_iter_ptr it(raw);
    map<string, string> out;
    git_reference* ref_raw = nullptr;
    int rc;
    while ((rc = git_reference_next(&ref_raw, it.get())) == 0) {
        reference_ptr ref(ref_raw);
        if (git_reference_type(ref.get()) != GIT_REFERENCE_DIRECT)
            continue;
        const git_oid* oid = git_reference_target(ref.get());
        if (oid)
            out[git_reference_name(ref.get())] = oid_to_hex(*oid);
    }
    if (rc != GIT_ITEROVER) {
        set_error(error);
        return nullopt;
    }
    return out;
}

optional<size_t> count_commits_between(const fs::path& repo, const vector<string>& tips,
                                       const vector<string>& hidden, string* error) {
    repo_ptr r;
    if (!open_repo(repo, r, error))
        return nullopt;
    git_revwalk* raw = nullptr;
    if (git_revwalk_new(&raw, r.get()) != 0) {
        set_error(error);
        return nullopt;
    }
    revwalk_ptr walk(raw);
    bool pushed = false;
    for (const auto& hex : tips) {
        git_oid oid;
        if (git_oid_fromstr(&oid, hex.c_str()) == 0 && git_revwalk_push(walk.get(), &oid) == 0)
            pushed = true;
    }
    if (!pushed)
        return 0;
    for (const auto& hex : hidden) {
        git_oid oid;
        if (git_oid_fromstr(&oid, hex.c_str()) != 0)
            continue;
        if (git_revwalk_hide(walk.get(), &oid) != 0)
            git_error_clear();
    }
    size_t count = 0;
    git_oid oid;
    int rc;
    while ((rc = git_revwalk_next(&oid, walk.get())) == 0)
        ++count;
    if (rc != GIT_ITEROVER) {
        set_error(error);
        return nullopt;
    }
    return count;
}

bool local_branch_exists(const fs::path& repo, const string& branch) {
    repo_ptr r;
    if (!open_repo(repo, r, nullptr))
        return false;
    git_reference* raw = nullptr;
    if (git_branch_lookup(&raw, r.get(), branch.c_str(), GIT_BRANCH_LOCAL) != 0)
        return false;
    reference_ptr ref(raw);
    return true;
}

optional<string> remote_for_branch(const fs::path& repo, const string& branch) {
    auto remotes = list_remotes(repo);
    if (!remotes)
        return nullopt;
    repo_ptr r;
    if (!open_repo(repo, r, nullptr))
        return nullopt;
    for (const auto& remote : *remotes) {
        if (ref_exists(r.get(), "refs/remotes/" + remote + "/" + branch))
            return remote;
    }
    return nullopt;
}

optional<bool> branch_checked_out(const fs::path& repo, const string& branch, string* error) {
    repo_ptr r;
    if (!open_repo(repo, r, error))
        return nullopt;
    git_reference* raw = nullptr;
    int rc = git_branch_lookup(&raw, r.get(), branch.c_str(), GIT_BRANCH_LOCAL);
    if (rc == GIT_ENOTFOUND)
        return false;
    if (rc != 0) {
        set_error(error);
        return nullopt;
    }
    reference_ptr ref(raw);
    rc = git_branch_is_checked_out(ref.get());
    if (rc < 0) {
        set_error(error);
        return nullopt;
    }
    return rc == 1;
}

optional<DefaultBranch> default_branch(const fs::path& repo, string* error) {
    repo_ptr r;
    if (!open_repo(repo, r, error))
        return nullopt;
    auto from_start = [](const string& start, const string& remote) {
        return DefaultBranch{start.substr(remote.size() + 1), start};
    };
    if (auto t = remote_head_target(r.get(), "origin"))
        return from_start(*t, "origin");
    auto remotes = list_remotes(repo, error);
    if (remotes) {
        for (const auto& remote : *remotes) {
            if (remote == "origin")
                continue;
            if (auto t = remote_head_target(r.get(), remote))
                return from_start(*t, remote);
        }
    }
    for (const char* name : {"main", "master"}) {
        if (ref_exists(r.get(), string("refs/remotes/origin/") + name))
            return DefaultBranch{name, string("origin/") + name};
    }
    for (const char* name : {"main", "master"}) {
        if (ref_exists(r.get(), string("refs/heads/") + name))
            return DefaultBranch{name, name};
    }
    if (error)
        *error = "could not determine the default branch of " + repo.string();
    return nullopt;
}

optional<vector<fs::path>> linked_worktrees(const fs::path& repo, string* error) {
    repo_ptr r;
    if (!open_repo(repo, r, error))
        return nullopt;
    StrArray names;
    if (git_worktree_list(&names.arr, r.get()) != 0) {
        set_error(error);
        return nullopt;
    }
    vector<fs::path> out;
    for (size_t i = 0; i < names.arr.count; ++i) {
        git_worktree* raw = nullptr;
        if (git_worktree_lookup(&raw, r.get(), names.arr.strings[i]) != 0)
            continue;
        worktree_ptr wt(raw);
        const char* p = git_worktree_path(wt.get());
        if (!p)
            continue;
        fs::path path = fs::path(p).lexically_normal();
        if (!path.has_filename())
            path = path.parent_path();
        out.push_back(path);
    }
    return out;
}

} // namespace git
