#include <algorithm>
#include <csignal>
#include <filesystem>
#include <iostream>
#include <map>
#include <sstream>

#include "cli_commands.hpp"
#include "github_utils.hpp"
#include "logger.hpp"
#include "registry.hpp"
#include "system_utils.hpp"
#include "worktree_client.hpp"

namespace fs = std::filesystem;
using wtenv::Error;
using wtenv::ErrorKind;

namespace cli {

namespace {

procutil::CancelToken* g_cancel_ptr = nullptr;

void handle_signal(int) {
    if (g_cancel_ptr)
        g_cancel_ptr->cancel();
}

/// Restores the previous SIGINT disposition on scope exit.
struct SigintScope {
    explicit SigintScope(procutil::CancelToken& token) {
        g_cancel_ptr = &token;
        previous_ = std::signal(SIGINT, handle_signal);
    }
    ~SigintScope() {
        std::signal(SIGINT, previous_ == SIG_ERR ? SIG_DFL : previous_);
        g_cancel_ptr = nullptr;
    }
    SigintScope(const SigintScope&) = delete;
    SigintScope& operator=(const SigintScope&) = delete;

  private:
    void (*previous_)(int) = SIG_DFL;
};

std::string pad(const std::string& s, size_t width) {
    if (s.size() >= width)
        return s;
    return s + std::string(width - s.size(), ' ');
}

std::string repo_summary(const wtenv::Environment& env) {
    std::string out;
    for (const auto& r : env.repos) {
        if (!out.empty())
            out += ", ";
        out += r.name + ":" + r.branch;
    }
    return out;
}

bool confirm(const std::string& question, std::ostream& out, std::istream& in) {
    out << question << " [y/N] " << std::flush;
    std::string answer;
    if (!std::getline(in, answer))
        return false;
    return answer == "y" || answer == "Y" || answer == "yes" || answer == "YES";
}

nlohmann::ordered_json status_json(const wtenv::RepoStatus& st) {
    nlohmann::ordered_json j;
    j["name"] = st.name;
    j["branch"] = st.branch;
    j["state"] = wtenv::to_string(wtenv::classify(st));
    j["uncommitted"] = st.uncommitted;
    j["ahead"] = st.ahead;
    j["behind"] = st.behind;
    if (st.error)
        j["error"] = *st.error;
    return j;
}

} // namespace

wtenv::Config load_effective_config(const Options& opts, const fs::path& cwd) {
    auto path = wtenv::find_config_file(opts.config_file, cwd);
    if (!path) {
        log_debug("no configuration file found, using defaults");
        return wtenv::default_config();
    }
    log_debug("loading configuration", {{"path", path->string()}});
    return wtenv::load_config(*path);
}

void configure_logging(const Options& opts, const wtenv::Config& cfg) {
    LogLevel level = cfg.logging.level;
    if (opts.logging.verbose)
        level = LogLevel::DEBUG;
    if (opts.logging.log_level)
        level = *opts.logging.log_level;
    set_console_logging(true, opts.logging.verbose ? LogLevel::DEBUG : LogLevel::WARNING);
    set_json_logging(cfg.logging.json);
    set_log_compression(cfg.logging.compress);
    fs::path file = opts.logging.log_file ? wtenv::expand_user(opts.logging.log_file->string())
                                          : cfg.logging.file;
    if (!file.empty())
        init_logger(file.string(), level, cfg.logging.max_size, cfg.logging.max_files);
    else
        set_log_level(level);
}

std::vector<wtenv::RepoRequest> parse_repo_args(const std::vector<std::string>& args) {
    std::vector<wtenv::RepoRequest> out;
    for (const auto& a : args) {
        std::string error;
        auto req = wtenv::parse_repo_branch(a, &error);
        if (!req) {
            wtenv::ErrorContext ctx;
            ctx.step = "parse-arguments";
            ctx.detail = a;
            throw Error(ErrorKind::InvalidInput, error, ctx);
        }
        out.push_back(*req);
    }
    return out;
}

std::string format_error(const Error& e) {
    std::ostringstream os;
    os << "wtenv: error: " << e.what() << "\n";
    const auto& ctx = e.context();
    if (!ctx.environment.empty())
        os << "  environment: " << ctx.environment << "\n";
    if (!ctx.repository.empty())
        os << "  repository:  " << ctx.repository << "\n";
    if (!ctx.step.empty())
        os << "  step:        " << ctx.step << "\n";
    if (!ctx.path.empty())
        os << "  path:        " << ctx.path << "\n";
    if (!ctx.detail.empty()) {
        std::string detail = ctx.detail;
        while (!detail.empty() && (detail.back() == '\n' || detail.back() == '\r'))
            detail.pop_back();
        os << "  detail:      " << detail << "\n";
    }
    for (const auto& p : e.pending_work())
        os << "  " << p.repository << ": " << p.count << " " << p.kind
           << (p.kind == "uncommitted" ? " file(s)" : " commit(s)") << "\n";
    for (const auto& f : e.failures()) {
        os << "  failed: " << (f.repository.empty() ? f.path : f.repository) << " (" << f.step
           << "): " << f.message << "\n";
    }
    if (!e.secondary().empty()) {
        os << "  rollback did not complete:\n";
        for (const auto& f : e.secondary())
            os << "    " << f.step << " " << f.path << ": " << f.message << "\n";
    }
    if (e.kind() == ErrorKind::Conflict && e.conflict() == wtenv::ConflictKind::OutstandingWork)
        os << "  use --force to delete anyway (unsaved work will be lost)\n";
    if (e.kind() == ErrorKind::ToolUnavailable)
        os << "  make sure the tool is installed and on PATH\n";
    return os.str();
}

std::string format_repo_status(const wtenv::RepoStatus& st) {
    std::string state;
    switch (wtenv::classify(st)) {
    case wtenv::SyncState::Error:
        state = "error: " + st.error.value_or("unknown");
        break;
    case wtenv::SyncState::Uncommitted:
        state = std::to_string(st.uncommitted) + " uncommitted";
        if (st.ahead > 0)
            state += ", ahead " + std::to_string(st.ahead);
        break;
    case wtenv::SyncState::Ahead:
        state = "ahead " + std::to_string(st.ahead);
        break;
    case wtenv::SyncState::Clean:
        state = "clean";
        break;
    }
    if (!st.error && st.behind > 0)
        state += ", behind " + std::to_string(st.behind);
    return pad(st.name, 16) + " " + pad(st.branch, 24) + " " + state;
}

int handle_create(const Options& opts, wtenv::EnvironmentOrchestrator& orch, std::ostream& out,
                  std::ostream& err) {
    const std::string& name = opts.args.front();
    auto repos = parse_repo_args(opts.repos);
    wtenv::CreateOptions co;
    co.fetch = !opts.no_fetch;
    co.render_templates = !opts.no_templates;
    co.progress = [&err](const std::string& step) { err << "==> " << step << "\n"; };
    auto env = orch.create(name, repos, co);
    out << "Created environment '" << env.name << "' at " << env.path.string() << "\n";
    for (const auto& r : env.repos)
        out << "  " << pad(r.name, 16) << " " << r.branch << "\n";
    for (const auto& f : env.generated_files)
        out << "  + " << f << "\n";
    return 0;
}

int handle_review(const Options& opts, wtenv::EnvironmentOrchestrator& orch, std::ostream& out,
                  std::ostream& err) {
    const auto& catalog = orch.config().repositories;
    const std::string& reference = opts.args.front();
    auto pr = wtenv::parse_pr_reference(reference, catalog);
    if (!pr) {
        wtenv::ErrorContext ctx;
        ctx.step = "parse-arguments";
        ctx.detail = reference;
        throw Error(ErrorKind::InvalidInput,
                    "expected a GitHub pull request URL or <repo>#<number>", ctx);
    }
    auto repo_name = wtenv::find_config_repo_name(*pr, catalog);
    if (!repo_name) {
        wtenv::ErrorContext ctx;
        ctx.step = "review";
        ctx.repository = pr->full_name();
        throw Error(ErrorKind::NotFound,
                    "repository " + pr->full_name() + " is not in the configuration", ctx);
    }
    err << "==> Fetching pull request " << pr->full_name() << "#" << pr->number << "\n";
    wtenv::PrInfo info = wtenv::fetch_pr_metadata(*pr);
    info.repo_name = *repo_name;
    log_info("pull request resolved", {{"pr", std::to_string(info.number)},
                                       {"repo", info.repo_name},
                                       {"branch", info.head_ref}});

    std::vector<wtenv::RepoRequest> repos{{*repo_name, info.head_ref}};
    for (const auto& extra : parse_repo_args(opts.repos))
        repos.push_back(extra);

    wtenv::CreateOptions co;
    co.fetch = !opts.no_fetch;
    co.render_templates = !opts.no_templates;
    co.pr_info = info;
    co.progress = [&err](const std::string& step) { err << "==> " << step << "\n"; };
    std::string name = opts.env_name.empty() ? "pr-" + std::to_string(info.number) : opts.env_name;
    auto env = orch.create(name, repos, co);
    out << "Created review environment '" << env.name << "' at " << env.path.string() << "\n";
    out << "  PR #" << info.number << ": " << info.title << " (@" << info.author << ")\n";
    out << "  " << info.url << "\n";
    for (const auto& r : env.repos)
        out << "  " << pad(r.name, 16) << " " << r.branch << "\n";
    return 0;
}

int handle_list(const Options& opts, const wtenv::EnvironmentOrchestrator& orch,
                std::ostream& out) {
    auto envs = orch.list();
    switch (opts.list_format) {
    case ListFormat::Json: {
        nlohmann::ordered_json arr = nlohmann::ordered_json::array();
        for (const auto& env : envs)
            arr.push_back(wtenv::to_json(env));
        out << arr.dump(2) << "\n";
        return 0;
    }
    case ListFormat::NameOnly:
        for (const auto& env : envs)
            out << env.name << "\n";
        return 0;
    case ListFormat::PathOnly:
        for (const auto& env : envs)
            out << env.path.string() << "\n";
        return 0;
    case ListFormat::Table:
        break;
    }
    if (envs.empty()) {
        out << "No environments.\n";
        return 0;
    }
    size_t width = 4;
    for (const auto& env : envs)
        width = std::max(width, env.name.size());
    out << pad("NAME", width) << "  " << pad("CREATED", 25) << "  REPOS\n";
    for (const auto& env : envs) {
        out << pad(env.name, width) << "  " << pad(env.created_at, 25) << "  " << repo_summary(env);
        if (env.pr_info)
            out << "  [PR #" << env.pr_info->number << "]";
        out << "\n";
    }
    return 0;
}

int handle_info(const Options& opts, const wtenv::EnvironmentOrchestrator& orch,
                std::ostream& out) {
    auto st = orch.status(opts.args.front());
    if (opts.json) {
        auto j = wtenv::to_json(st.env);
        j["exists_on_disk"] = st.exists_on_disk;
        j["status"] = nlohmann::ordered_json::array();
        for (const auto& rs : st.repos)
            j["status"].push_back(status_json(rs));
        out << j.dump(2) << "\n";
        return 0;
    }
    const auto& env = st.env;
    out << "Environment: " << env.name << "\n";
    out << "Path:        " << env.path.string() << (st.exists_on_disk ? "" : " (missing)") << "\n";
    out << "Created:     " << env.created_at << "\n";
    if (env.pr_info) {
        const auto& pr = *env.pr_info;
        out << "PR:          #" << pr.number << " " << pr.title << " (@" << pr.author << ")\n";
        out << "             " << pr.url << "\n";
    }
    out << "\nRepositories:\n";
    for (const auto& rs : st.repos)
        out << "  " << format_repo_status(rs) << "\n";
    if (!env.generated_files.empty()) {
        out << "\nGenerated files:\n";
        for (const auto& f : env.generated_files)
            out << "  " << f << "\n";
    }
    if (!env.symlinks.empty()) {
        out << "\nSymlinks:\n";
        for (const auto& s : env.symlinks)
            out << "  " << s.target << " -> " << s.source << "\n";
    }
    return 0;
}

int handle_delete(const Options& opts, wtenv::EnvironmentOrchestrator& orch, std::ostream& out,
                  std::ostream& err, std::istream& in) {
    int rc = 0;
    for (const auto& name : opts.args) {
        try {
            auto env = orch.info(name);
            if (!opts.assume_yes &&
                !confirm("Delete environment '" + name + "' at " + env.path.string() + "?", out,
                         in)) {
                out << "Skipped " << name << "\n";
                continue;
            }
            wtenv::DeleteOptions dopts;
            dopts.force = opts.force;
            orch.remove(name, dopts);
            out << "Deleted environment '" << name << "'\n";
        } catch (const Error& e) {
            err << format_error(e);
            if (rc == 0)
                rc = wtenv::exit_code_for(e.kind());
        }
    }
    return rc;
}

int handle_path(const Options& opts, const wtenv::EnvironmentOrchestrator& orch,
                std::ostream& out) {
    out << orch.path(opts.args.front()).string() << "\n";
    return 0;
}

int handle_branches(const Options& opts, const wtenv::EnvironmentOrchestrator& orch,
                    std::ostream& out, std::ostream& err) {
    std::vector<std::string> repos = opts.args;
    if (repos.empty()) {
        for (const auto& [name, repo] : orch.config().repositories)
            repos.push_back(name);
    }
    if (repos.empty()) {
        err << "No repositories configured.\n";
        return 0;
    }
    procutil::CancelToken token;
    std::map<std::string, wtenv::BranchListing> listings;
    {
        SigintScope scope(token);
        listings = orch.list_branches(repos, &token);
    }
    if (token.cancelled()) {
        err << "Cancelled.\n";
        return 130;
    }
    int rc = 0;
    if (opts.json) {
        nlohmann::ordered_json j = nlohmann::ordered_json::object();
        for (const auto& [name, listing] : listings) {
            j[name] = listing.branches;
            if (listing.error) {
                err << "wtenv: " << name << ": " << *listing.error << "\n";
                rc = wtenv::exit_code_for(ErrorKind::ToolFailure);
            }
        }
        out << j.dump(2) << "\n";
        return rc;
    }
    for (const auto& [name, listing] : listings) {
        out << name << ":\n";
        if (listing.error) {
            out << "  (error: " << *listing.error << ")\n";
            rc = wtenv::exit_code_for(ErrorKind::ToolFailure);
            continue;
        }
        for (const auto& b : listing.branches)
            out << "  " << b << "\n";
    }
    return rc;
}

int handle_config(const Options& opts, const wtenv::Config& cfg, std::ostream& out) {
    if (opts.show_path) {
        if (cfg.source_path.empty())
            out << wtenv::default_config_path().string() << " (not created)\n";
        else
            out << cfg.source_path.string() << "\n";
        return 0;
    }
    if (opts.json) {
        out << wtenv::config_to_json(cfg).dump(2) << "\n";
        return 0;
    }
    out << "Config file:      "
        << (cfg.source_path.empty() ? std::string("(defaults)") : cfg.source_path.string()) << "\n";
    out << "Base repos:       " << cfg.base_repos_dir.string() << "\n";
    out << "Environments:     " << cfg.environments_dir.string() << "\n";
    out << "Registry:         " << cfg.registry_path.string() << "\n";
    out << "Log file:         " << cfg.logging.file.string() << "\n";
    out << "\nRepositories:\n";
    if (cfg.repositories.empty())
        out << "  (none)\n";
    for (const auto& [name, repo] : cfg.repositories)
        out << "  " << pad(name, 16) << " " << repo.url << "\n";
    out << "\nTemplates: " << cfg.templates.size() << "  Copy files: " << cfg.copy_files.size()
        << "  Symlinks: " << cfg.symlinks.size() << "\n";
    return 0;
}

int handle_init(const Options& opts, std::ostream& out) {
    fs::path path = opts.args.empty() ? wtenv::default_config_path()
                                      : wtenv::expand_user(opts.args.front());
    wtenv::init_config(path, opts.force);
    log_info("configuration initialized", {{"path", path.string()}});
    out << "Wrote " << path.string() << "\n";
    out << "Add your repositories under 'repositories:' and templates under "
        << (path.parent_path() / "templates").string() << "\n";
    return 0;
}

int run_command(const Options& opts, std::ostream& out, std::ostream& err, std::istream& in) {
    try {
        if (opts.command == Command::Init) {
            configure_logging(opts, wtenv::default_config());
            return handle_init(opts, out);
        }
        set_console_logging(true, opts.logging.verbose ? LogLevel::DEBUG : LogLevel::WARNING);
        wtenv::Config cfg = load_effective_config(opts, fs::current_path());
        configure_logging(opts, cfg);
        log_debug("command", {{"name", opts.command_name}});
        if (opts.command == Command::Config)
            return handle_config(opts, cfg, out);

        wtenv::EnvironmentRegistry registry(cfg.registry_path);
        wtenv::WorktreeClient client(cfg.git_executable);
        wtenv::EnvironmentOrchestrator orch(cfg, registry, client);
        switch (opts.command) {
        case Command::Create:
            return handle_create(opts, orch, out, err);
        case Command::Review:
            return handle_review(opts, orch, out, err);
        case Command::List:
            return handle_list(opts, orch, out);
        case Command::Info:
            return handle_info(opts, orch, out);
        case Command::Delete:
            return handle_delete(opts, orch, out, err, in);
        case Command::Path:
            return handle_path(opts, orch, out);
        case Command::Branches:
            return handle_branches(opts, orch, out, err);
        case Command::Config:
        case Command::Init:
        case Command::None:
            break;
        }
        return 2;
    } catch (const Error& e) {
        log_error(e.what(), {{"kind", wtenv::to_string(e.kind())}});
        err << format_error(e);
        return wtenv::exit_code_for(e.kind());
    } catch (const fs::filesystem_error& e) {
        log_error(e.what());
        err << "wtenv: error: " << e.what() << "\n";
        return wtenv::exit_code_for(ErrorKind::Io);
    }
}

} // namespace cli
