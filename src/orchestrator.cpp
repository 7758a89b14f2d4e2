#include "orchestrator.hpp"
#include <algorithm>
#include <fstream>
#include <set>
#include <system_error>
#include <utility>
#include "branch_locks.hpp"
#include "errors.hpp"
#include "logger.hpp"
#include "status_inspector.hpp"
#include "time_utils.hpp"
#include "undo_log.hpp"

namespace wtenv {

namespace {

fs::path canonical_key(const fs::path& p) {
    std::error_code ec;
    fs::path c = fs::weakly_canonical(p, ec);
    return ec ? p.lexically_normal() : c;
}

Error make_error(ErrorKind kind, const std::string& msg, const std::string& env,
                 const std::string& step, const std::string& repo = {},
                 const std::string& path = {}) {
    ErrorContext ctx;
    ctx.environment = env;
    ctx.step = step;
    ctx.repository = repo;
    ctx.path = path;
    return Error(kind, msg, ctx);
}

void write_text(const fs::path& dest, const std::string& text) {
    fs::create_directories(dest.parent_path());
    std::ofstream out(dest, std::ios::binary | std::ios::trunc);
    if (!out)
        throw std::filesystem::filesystem_error("cannot open for writing", dest,
                                                std::make_error_code(std::errc::io_error));
    out << text;
    out.close();
    if (!out)
        throw std::filesystem::filesystem_error("write failed", dest,
                                                std::make_error_code(std::errc::io_error));
}

std::string describe(const SubFailure& f) {
    std::string s = f.step;
    if (!f.repository.empty())
        s += " [" + f.repository + "]";
    if (!f.path.empty())
        s += " " + f.path;
    return s + ": " + f.message;
}

} // namespace

EnvironmentOrchestrator::EnvironmentOrchestrator(Config config, EnvironmentRegistry& registry,
                                                 const WorktreeClient& client)
    : config_(std::move(config)), registry_(registry), client_(client) {}

void EnvironmentOrchestrator::validate_request(const std::string& name,
                                               const std::vector<RepoRequest>& repos) const {
    if (!is_valid_environment_name(name))
        throw make_error(ErrorKind::InvalidInput,
                         "invalid environment name '" + name +
                             "': use letters, digits, '_' and '-', not starting with '-'",
                         name, "validate");
    if (repos.empty())
        throw make_error(ErrorKind::InvalidInput, "at least one repository is required", name,
                         "validate");
    std::set<std::string> seen;
    for (const auto& r : repos) {
        if (r.repo.empty() || r.branch.empty())
            throw make_error(ErrorKind::InvalidInput, "repository and branch must be non-empty",
                             name, "validate", r.repo);
        if (!seen.insert(r.repo).second)
            throw make_error(ErrorKind::InvalidInput,
                             "repository '" + r.repo + "' requested more than once", name,
                             "validate", r.repo);
    }
    if (registry_.exists(name))
        throw make_error(ErrorKind::Conflict, "environment '" + name + "' already exists", name,
                         "validate")
            .with_conflict(ConflictKind::NameRegistered);
    const fs::path env_path = config_.environment_path(name);
    std::error_code ec;
    if (fs::exists(env_path, ec))
        throw make_error(ErrorKind::Conflict,
                         "directory exists but not registered: " + env_path.string() +
                             " (remove it manually)",
                         name, "validate", {}, env_path.string())
            .with_conflict(ConflictKind::DirectoryExists);
    for (const auto& r : repos) {
        if (config_.repositories.find(r.repo) == config_.repositories.end())
            throw make_error(ErrorKind::NotFound,
                             "repository '" + r.repo + "' is not in the configuration", name,
                             "validate", r.repo);
    }
}

Environment EnvironmentOrchestrator::create(const std::string& name,
                                            const std::vector<RepoRequest>& repos,
                                            const CreateOptions& opts) {
    auto progress = [&](const std::string& msg) {
        log_info(msg, {{"env", name}});
        if (opts.progress)
            opts.progress(msg);
    };

    validate_request(name, repos);
    const fs::path env_path = fs::absolute(config_.environment_path(name));
    std::set<std::string> present;
    for (const auto& r : repos)
        present.insert(r.repo);

    // Base clones are shared by all environments and are never rolled back.
    progress("Preparing base repositories");
    for (const auto& r : repos) {
        const fs::path base = config_.base_repo_path(r.repo);
        try {
            auto lock = BranchLockTable::instance().lock_base(canonical_key(base).string());
            if (client_.ensure_clone(config_.repositories.at(r.repo).url, base))
                log_info("cloned base repository", {{"repo", r.repo}, {"path", base.string()}});
        } catch (Error& e) {
            e.with_environment(name);
            throw;
        }
    }

    if (opts.fetch) {
        progress("Fetching latest changes");
        for (const auto& r : repos) {
            const fs::path base = config_.base_repo_path(r.repo);
            try {
                FetchSummary s = client_.fetch(base);
                log_info("fetched", {{"repo", r.repo},
                                     {"new_branches", std::to_string(s.new_branches)},
                                     {"updated_branches", std::to_string(s.updated_branches)},
                                     {"new_commits", std::to_string(s.new_commits)}});
            } catch (const Error& e) {
                log_warning("fetch failed, continuing with local refs",
                            {{"repo", r.repo}, {"error", e.context().detail}});
            }
        }
    }

    std::vector<std::pair<std::string, std::string>> pairs;
    for (const auto& r : repos)
        pairs.emplace_back(canonical_key(config_.base_repo_path(r.repo)).string(), r.branch);
    LockSet branch_locks = BranchLockTable::instance().lock_branches(pairs);

    progress("Checking branches");
    for (const auto& r : repos) {
        const fs::path base = config_.base_repo_path(r.repo);
        try {
            if (client_.is_branch_checked_out(base, r.branch))
                throw make_error(ErrorKind::Conflict,
                                 "branch '" + r.branch + "' of " + r.repo +
                                     " is already checked out in another worktree",
                                 name, "branch-check", r.repo)
                    .with_conflict(ConflictKind::BranchCheckedOut);
        } catch (Error& e) {
            e.with_environment(name);
            throw;
        }
    }

    std::error_code ec;
    fs::create_directories(env_path.parent_path(), ec);
    if (ec)
        throw make_error(ErrorKind::Io, "cannot create " + env_path.parent_path().string(), name,
                         "mkdir", {}, env_path.parent_path().string());
    if (!fs::create_directory(env_path, ec)) {
        if (ec)
            throw make_error(ErrorKind::Io, "cannot create " + env_path.string() + ": " + ec.message(),
                             name, "mkdir", {}, env_path.string());
        throw make_error(ErrorKind::Conflict,
                         "directory exists but not registered: " + env_path.string(), name,
                         "mkdir", {}, env_path.string())
            .with_conflict(ConflictKind::DirectoryExists);
    }

    UndoLog undo;
    undo.push({"remove-directory", "", env_path.string(), [env_path]() {
                   std::error_code rec;
                   fs::remove_all(env_path, rec);
                   if (rec)
                       throw std::filesystem::filesystem_error("cannot remove directory", env_path,
                                                               rec);
               }});

    std::string step = "worktree-add";
    try {
        progress("Creating worktrees");
        std::vector<RepoInstance> instances;
        for (const auto& r : repos) {
            const fs::path base = config_.base_repo_path(r.repo);
            const fs::path wt = env_path / r.repo;
            const WorktreeClient& client = client_;
            undo.push({"remove-worktree", r.repo, wt.string(), [&client, base, wt]() {
                           try {
                               client.remove_worktree(base, wt, true);
                           } catch (const Error& e) {
                               if (e.kind() != ErrorKind::NotFound)
                                   throw;
                           }
                           client.prune_worktrees(base);
                       }});
            BranchOrigin origin = client_.add_worktree(base, r.branch, wt);
            log_info("worktree created", {{"repo", r.repo},
                                          {"branch", r.branch},
                                          {"origin", to_string(origin)},
                                          {"path", wt.string()}});
            instances.push_back(RepoInstance{r.repo, r.branch, wt});
        }
        branch_locks.clear();

        step = "symlink";
        std::vector<SymlinkEntry> links;
        if (!config_.symlinks.empty())
            progress("Creating symlinks");
        for (const auto& rule : config_.symlinks) {
            if (!TemplateRenderer::should_render(rule.when, present))
                continue;
            const fs::path source = env_path / rule.source;
            const fs::path target = env_path / rule.target;
            if (!fs::exists(source)) {
                log_warning("symlink source missing, skipped",
                            {{"source", source.string()}, {"target", rule.target}});
                continue;
            }
            fs::create_directories(target.parent_path());
            fs::create_symlink(fs::canonical(source), target);
            links.push_back(SymlinkEntry{rule.source, rule.target});
        }

        // templates see the same timestamp that is recorded
        const std::string created_at = iso8601_now();
        std::vector<std::string> generated;
        step = "template";
        if (opts.render_templates && !config_.templates.empty()) {
            progress("Rendering templates");
            TemplateContext tctx{name, env_path, created_at, instances, links};
            std::vector<SubFailure> failures;
            for (const auto& rule : config_.templates) {
                if (!TemplateRenderer::should_render(rule.when, present))
                    continue;
                try {
                    std::string text = renderer_.render(rule.source, tctx);
                    write_text(env_path / rule.destination, text);
                    generated.push_back(rule.destination);
                } catch (const Error& e) {
                    if (e.kind() != ErrorKind::TemplateFailure)
                        throw;
                    failures.push_back(
                        SubFailure{"", "template", rule.source.string(), e.context().detail});
                    log_error("template failed",
                              {{"template", rule.source.string()}, {"error", e.context().detail}});
                }
            }
            if (!failures.empty()) {
                std::string msg = std::to_string(failures.size()) + " template(s) failed to render";
                throw make_error(ErrorKind::TemplateFailure, msg, name, "template")
                    .with_failures(std::move(failures));
            }
        }

        step = "copy";
        for (const auto& rule : config_.copy_files) {
            if (!TemplateRenderer::should_render(rule.when, present))
                continue;
            if (!fs::exists(rule.source)) {
                log_warning("copy source missing, skipped", {{"source", rule.source.string()}});
                continue;
            }
            const fs::path dest = env_path / rule.destination;
            fs::create_directories(dest.parent_path());
            if (fs::is_directory(rule.source))
                fs::copy(rule.source, dest,
                         fs::copy_options::recursive | fs::copy_options::overwrite_existing);
            else
                fs::copy_file(rule.source, dest, fs::copy_options::overwrite_existing);
            generated.push_back(rule.destination);
        }

        step = "commit";
        progress("Registering environment");
        Environment env;
        env.name = name;
        env.path = env_path;
        env.created_at = created_at;
        env.repos = std::move(instances);
        env.generated_files = std::move(generated);
        env.symlinks = std::move(links);
        env.pr_info = opts.pr_info;
        registry_.add(env);
        undo.commit();
        log_info("environment created", {{"env", name}, {"path", env_path.string()}});
        return env;
    } catch (Error& e) {
        branch_locks.clear();
        log_error("create failed, rolling back", {{"env", name}, {"error", e.what()}});
        e.with_environment(name);
        e.with_secondary(undo.rollback());
        throw;
    } catch (const fs::filesystem_error& fe) {
        branch_locks.clear();
        log_error("create failed, rolling back", {{"env", name}, {"error", fe.what()}});
        Error e = make_error(ErrorKind::Io, fe.what(), name, step, {}, fe.path1().string());
        e.with_secondary(undo.rollback());
        throw e;
    } catch (const std::exception& ex) {
        branch_locks.clear();
        log_error("create failed, rolling back", {{"env", name}, {"error", ex.what()}});
        auto secondary = undo.rollback();
        for (const auto& f : secondary)
            log_error("rollback left " + describe(f));
        throw;
    }
}

void EnvironmentOrchestrator::remove(const std::string& name, const DeleteOptions& opts) {
    Environment env = registry_.get(name);
    std::error_code ec;
    const bool on_disk = fs::exists(env.path, ec);

    if (on_disk) {
        StatusInspector inspector(client_);
        std::vector<PendingWork> pending;
        for (const auto& st : inspector.report(env)) {
            if (st.uncommitted > 0)
                pending.push_back(PendingWork{st.name, "uncommitted", static_cast<int>(st.uncommitted)});
            if (st.ahead > 0)
                pending.push_back(PendingWork{st.name, "unpushed", static_cast<int>(st.ahead)});
        }
        if (!pending.empty() && !opts.force)
            throw make_error(ErrorKind::Conflict,
                             "environment '" + name + "' has uncommitted or unpushed work", name,
                             "delete")
                .with_conflict(ConflictKind::OutstandingWork)
                .with_pending(std::move(pending));
        if (!pending.empty())
            log_warning("deleting environment with outstanding work", {{"env", name}});
    }

    std::vector<SubFailure> failures;
    auto record = [&](const std::string& repo, const std::string& step, const std::string& path,
                      const std::string& msg) {
        log_error("delete step failed", {{"env", name}, {"step", step}, {"error", msg}});
        failures.push_back(SubFailure{repo, step, path, msg});
    };

    std::vector<fs::path> bases;
    for (const auto& repo : env.repos) {
        const fs::path base = config_.base_repo_path(repo.name);
        if (!fs::exists(base, ec)) {
            log_warning("base repository missing", {{"repo", repo.name}, {"path", base.string()}});
            continue;
        }
        if (std::find(bases.begin(), bases.end(), base) == bases.end())
            bases.push_back(base);
        if (!fs::exists(repo.worktree_path, ec))
            continue;
        try {
            client_.remove_worktree(base, repo.worktree_path, opts.force);
        } catch (const Error& e) {
            if (e.kind() == ErrorKind::NotFound) {
                log_debug("worktree not registered", {{"path", repo.worktree_path.string()}});
                continue;
            }
            std::string msg = e.context().detail.empty() ? e.what() : e.context().detail;
            record(repo.name, "worktree-remove", repo.worktree_path.string(), msg);
        }
    }

    fs::remove_all(env.path, ec);
    if (ec)
        record("", "remove-directory", env.path.string(), ec.message());

    for (const auto& base : bases) {
        try {
            client_.prune_worktrees(base);
        } catch (const Error& e) {
            std::string msg = e.context().detail.empty() ? e.what() : e.context().detail;
            record("", "worktree-prune", base.string(), msg);
        }
    }

    if (!fs::exists(env.path, ec)) {
        try {
            registry_.remove(name);
        } catch (const Error& e) {
            record("", "unregister", registry_.path().string(), e.what());
        }
    } else {
        record("", "unregister", env.path.string(), "directory still exists; record kept");
    }

    if (!failures.empty())
        throw make_error(ErrorKind::Partial,
                         "environment '" + name + "' was only partially deleted", name, "delete")
            .with_failures(std::move(failures));
    log_info("environment deleted", {{"env", name}});
}

std::vector<Environment> EnvironmentOrchestrator::list() const { return registry_.list_all(); }

Environment EnvironmentOrchestrator::info(const std::string& name) const {
    return registry_.get(name);
}

EnvironmentStatus EnvironmentOrchestrator::status(const std::string& name) const {
    EnvironmentStatus st;
    st.env = registry_.get(name);
    std::error_code ec;
    st.exists_on_disk = fs::exists(st.env.path, ec);
    st.repos = StatusInspector(client_).report(st.env);
    return st;
}

fs::path EnvironmentOrchestrator::path(const std::string& name) const {
    return registry_.get(name).path;
}

std::map<std::string, BranchListing>
EnvironmentOrchestrator::list_branches(const std::vector<std::string>& repos,
                                       const procutil::CancelToken* cancel) const {
    std::map<std::string, BranchSource> sources;
    for (const auto& repo : repos) {
        auto it = config_.repositories.find(repo);
        if (it == config_.repositories.end()) {
            ErrorContext ctx;
            ctx.repository = repo;
            ctx.step = "branches";
            throw Error(ErrorKind::NotFound, "repository '" + repo + "' is not in the configuration",
                        ctx);
        }
        sources[repo] = BranchSource{it->second.url, config_.base_repo_path(repo)};
    }
    return fetch_branch_lists(client_, sources, cancel);
}

} // namespace wtenv
