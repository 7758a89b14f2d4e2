#include "test_common.hpp"
#include "orchestrator.hpp"

using namespace wtenv;

namespace {

/// Fails add_worktree for one repository after the others succeeded.
class FailingClient : public WorktreeClient {
  public:
    explicit FailingClient(std::string repo) : fail_repo_(std::move(repo)) {}

    BranchOrigin add_worktree(const fs::path& base, const std::string& branch,
                              const fs::path& dest) const override {
        if (dest.filename() == fail_repo_) {
            ErrorContext ctx;
            ctx.step = "worktree-add";
            ctx.path = dest.string();
            ctx.detail = "fatal: injected failure";
            throw Error(ErrorKind::ToolFailure, "git worktree add failed", ctx);
        }
        return WorktreeClient::add_worktree(base, branch, dest);
    }

  private:
    std::string fail_repo_;
};

/// Worktree creation fails like FailingClient and every removal fails too.
class BrittleClient : public FailingClient {
  public:
    using FailingClient::FailingClient;

    void remove_worktree(const fs::path&, const fs::path& path, bool) const override {
        ErrorContext ctx;
        ctx.step = "worktree-remove";
        ctx.path = path.string();
        ctx.detail = "fatal: worktree is locked";
        throw Error(ErrorKind::ToolFailure, "git worktree remove failed", ctx);
    }
};

/// Fails remove_worktree for one repository; optionally recreates a path on prune.
class StubbornClient : public WorktreeClient {
  public:
    explicit StubbornClient(std::string repo, fs::path reappear = {})
        : stuck_repo_(std::move(repo)), reappear_(std::move(reappear)) {}

    void remove_worktree(const fs::path& base, const fs::path& path, bool force) const override {
        if (path.filename() == stuck_repo_) {
            ErrorContext ctx;
            ctx.step = "worktree-remove";
            ctx.path = path.string();
            ctx.detail = "fatal: cannot remove worktree";
            throw Error(ErrorKind::ToolFailure, "git worktree remove failed", ctx);
        }
        WorktreeClient::remove_worktree(base, path, force);
    }

    void prune_worktrees(const fs::path& base) const override {
        WorktreeClient::prune_worktrees(base);
        if (!reappear_.empty())
            fs::create_directories(reappear_);
    }

  private:
    std::string stuck_repo_;
    fs::path reappear_;
};

/// Two-repository catalog backed by local bare repositories.
struct Fixture {
    TempDir dir;
    Config cfg;

    explicit Fixture(const std::string& name) : dir(name), cfg(make_config(dir.path)) {
        cfg.repositories["api"] = RepoConfig{make_origin(dir.path, "api", {"feature"})};
        cfg.repositories["web"] = RepoConfig{make_origin(dir.path, "web")};
    }

    fs::path env(const std::string& name) const { return cfg.environment_path(name); }
};

CreateOptions quiet() {
    CreateOptions opts;
    opts.fetch = false;
    return opts;
}

} // namespace

TEST_CASE("Requests are validated before anything is touched") {
    TempDir dir("orch_validate");
    Config cfg = make_config(dir.path);
    cfg.repositories["api"] = RepoConfig{"file:///unused"};
    EnvironmentRegistry reg(cfg.registry_path);
    WorktreeClient client;
    EnvironmentOrchestrator orch(cfg, reg, client);

    auto bad_name = thrown_error([&] { orch.create("../escape", {{"api", "main"}}); });
    REQUIRE(bad_name.kind() == ErrorKind::InvalidInput);
    REQUIRE(thrown_error([&] { orch.create("-x", {{"api", "main"}}); }).kind() ==
            ErrorKind::InvalidInput);
    REQUIRE(thrown_error([&] { orch.create("empty", {}); }).kind() == ErrorKind::InvalidInput);
    REQUIRE(thrown_error([&] { orch.create("dup", {{"api", "a"}, {"api", "b"}}); }).kind() ==
            ErrorKind::InvalidInput);

    auto unknown = thrown_error([&] { orch.create("demo", {{"docs", "main"}}); });
    REQUIRE(unknown.kind() == ErrorKind::NotFound);
    REQUIRE(unknown.context().repository == "docs");

    fs::create_directories(cfg.environment_path("stale"));
    auto stale = thrown_error([&] { orch.create("stale", {{"api", "main"}}); });
    REQUIRE(stale.kind() == ErrorKind::Conflict);
    REQUIRE(stale.conflict() == ConflictKind::DirectoryExists);
    REQUIRE(fs::exists(cfg.environment_path("stale")));

    REQUIRE_FALSE(fs::exists(cfg.registry_path));
    REQUIRE_FALSE(fs::exists(cfg.base_repos_dir));
    REQUIRE(orch.list().empty());

    auto missing = thrown_error([&] { orch.list_branches({"api", "docs"}); });
    REQUIRE(missing.kind() == ErrorKind::NotFound);
    REQUIRE(thrown_error([&] { orch.info("nothing"); }).kind() == ErrorKind::NotFound);
    REQUIRE(thrown_error([&] { orch.remove("nothing"); }).kind() == ErrorKind::NotFound);
}

TEST_CASE("create builds worktrees, links, templates and copies") {
    if (!have_git()) {
        WARN("git not available; skipping");
        return;
    }
    Fixture fx("orch_create");
    write_file(fx.dir / "tpl/AGENTS.md.j2",
               "# {{ env_name }}\n"
               "{% for r in repos %}- {{ r.name }} on {{ r.branch }}\n{% endfor %}"
               "{% if has_repo(\"web\") %}web present{% endif %}\n");
    write_file(fx.dir / "tpl/web-only.j2", "only with docs\n");
    write_file(fx.dir / "tpl/stamp.j2", "{{ created_at }}\n");
    write_file(fx.dir / "files/.editorconfig", "root = true\n");
    fx.cfg.templates.push_back({fx.dir / "tpl/AGENTS.md.j2", "AGENTS.md", std::nullopt});
    fx.cfg.templates.push_back({fx.dir / "tpl/stamp.j2", "STAMP", std::nullopt});
    fx.cfg.templates.push_back(
        {fx.dir / "tpl/web-only.j2", "DOCS.md", std::vector<std::string>{"web", "docs"}});
    fx.cfg.copy_files.push_back({fx.dir / "files/.editorconfig", ".editorconfig", std::nullopt});
    fx.cfg.copy_files.push_back({fx.dir / "files/missing", "missing", std::nullopt});
    fx.cfg.symlinks.push_back({"api/README.md", "web/API.md", {"api", "web"}});
    fx.cfg.symlinks.push_back({"api/README.md", "DOCS_LINK.md", {"docs"}});

    EnvironmentRegistry reg(fx.cfg.registry_path);
    WorktreeClient client;
    EnvironmentOrchestrator orch(fx.cfg, reg, client);

    std::vector<std::string> steps;
    CreateOptions opts;
    opts.progress = [&steps](const std::string& s) { steps.push_back(s); };
    Environment env = orch.create("demo", {{"api", "feature"}, {"web", "topic"}}, opts);

    REQUIRE(env.name == "demo");
    REQUIRE(env.path == fx.env("demo"));
    REQUIRE(env.repos.size() == 2);
    REQUIRE(env.repos[0].name == "api");
    REQUIRE(env.repos[1].branch == "topic");
    REQUIRE(fs::exists(env.path / "api/feature.txt"));
    REQUIRE(fs::exists(env.path / "web/README.md"));
    REQUIRE(read_file(env.path / "AGENTS.md") ==
            "# demo\n- api on feature\n- web on topic\nweb present\n");
    REQUIRE_FALSE(fs::exists(env.path / "DOCS.md"));
    REQUIRE(read_file(env.path / ".editorconfig") == "root = true\n");
    REQUIRE(fs::is_symlink(env.path / "web/API.md"));
    REQUIRE(read_file(env.path / "web/API.md") == "# api\n");
    REQUIRE_FALSE(fs::exists(env.path / "DOCS_LINK.md"));
    REQUIRE(env.generated_files ==
            std::vector<std::string>{"AGENTS.md", "STAMP", ".editorconfig"});
    REQUIRE(read_file(env.path / "STAMP") == env.created_at + "\n");
    REQUIRE(env.symlinks.size() == 1);
    REQUIRE_FALSE(steps.empty());
    REQUIRE(steps.front() == "Preparing base repositories");
    REQUIRE(steps.back() == "Registering environment");

    auto records = orch.list();
    REQUIRE(records.size() == 1);
    REQUIRE(records[0].repos.size() == 2);
    REQUIRE(records[0].created_at == env.created_at);
    REQUIRE(orch.path("demo") == env.path);

    auto st = orch.status("demo");
    REQUIRE(st.exists_on_disk);
    REQUIRE(st.repos.size() == 2);
    REQUIRE(classify(st.repos[0]) == SyncState::Clean);
    // the link placed inside the web worktree is an untracked file there
    REQUIRE(st.repos[1].name == "web");
    REQUIRE(st.repos[1].uncommitted == 1);
    REQUIRE(classify(st.repos[1]) == SyncState::Uncommitted);

    auto guarded = thrown_error([&] { orch.remove("demo"); });
    REQUIRE(guarded.kind() == ErrorKind::Conflict);
    REQUIRE(guarded.conflict() == ConflictKind::OutstandingWork);
    REQUIRE(guarded.pending_work().size() == 1);
    REQUIRE(guarded.pending_work()[0].repository == "web");
    REQUIRE(guarded.pending_work()[0].kind == "uncommitted");
    REQUIRE(reg.exists("demo"));
    REQUIRE(fs::is_symlink(env.path / "web/API.md"));

    auto again = thrown_error([&] { orch.create("demo", {{"web", "main"}}, quiet()); });
    REQUIRE(again.kind() == ErrorKind::Conflict);
    REQUIRE(again.conflict() == ConflictKind::NameRegistered);

    auto busy = thrown_error([&] { orch.create("other", {{"api", "feature"}}, quiet()); });
    REQUIRE(busy.kind() == ErrorKind::Conflict);
    REQUIRE(busy.conflict() == ConflictKind::BranchCheckedOut);
    REQUIRE_FALSE(fs::exists(fx.env("other")));

    auto branches = orch.list_branches({"api"});
    REQUIRE(branches["api"].branches == std::vector<std::string>{"feature", "main"});
}

TEST_CASE("A failing worktree step rolls the environment back") {
    if (!have_git()) {
        WARN("git not available; skipping");
        return;
    }
    Fixture fx("orch_rollback");
    EnvironmentRegistry reg(fx.cfg.registry_path);
    FailingClient client("web");
    EnvironmentOrchestrator orch(fx.cfg, reg, client);

    auto e = thrown_error([&] { orch.create("demo", {{"api", "main"}, {"web", "main"}}, quiet()); });
    REQUIRE(e.kind() == ErrorKind::ToolFailure);
    REQUIRE(e.context().environment == "demo");
    REQUIRE(e.secondary().empty());
    REQUIRE_FALSE(fs::exists(fx.env("demo")));
    REQUIRE_FALSE(reg.exists("demo"));
    REQUIRE_FALSE(client.is_branch_checked_out(fx.cfg.base_repo_path("api"), "main"));
    // base clones are shared state and survive the rollback
    REQUIRE(fs::exists(fx.cfg.base_repo_path("web") / ".git"));

    // the same request works once the failure is gone
    WorktreeClient healthy;
    EnvironmentOrchestrator retry(fx.cfg, reg, healthy);
    retry.create("demo", {{"api", "main"}, {"web", "main"}}, quiet());
    REQUIRE(reg.exists("demo"));
}

TEST_CASE("Template failures abort create with every failing template") {
    if (!have_git()) {
        WARN("git not available; skipping");
        return;
    }
    Fixture fx("orch_template");
    write_file(fx.dir / "tpl/bad.j2", "{{ no_such_variable }}\n");
    write_file(fx.dir / "tpl/good.j2", "{{ env_name }}\n");
    fx.cfg.templates.push_back({fx.dir / "tpl/good.j2", "GOOD.md", std::nullopt});
    fx.cfg.templates.push_back({fx.dir / "tpl/bad.j2", "BAD.md", std::nullopt});
    fx.cfg.templates.push_back({fx.dir / "tpl/absent.j2", "ABSENT.md", std::nullopt});
    EnvironmentRegistry reg(fx.cfg.registry_path);
    WorktreeClient client;
    EnvironmentOrchestrator orch(fx.cfg, reg, client);

    auto e = thrown_error([&] { orch.create("demo", {{"api", "main"}}, quiet()); });
    REQUIRE(e.kind() == ErrorKind::TemplateFailure);
    REQUIRE(e.failures().size() == 2);
    REQUIRE(e.failures()[0].path == (fx.dir / "tpl/bad.j2").string());
    REQUIRE_FALSE(fs::exists(fx.env("demo")));
    REQUIRE(reg.list_names().empty());

    CreateOptions skip = quiet();
    skip.render_templates = false;
    Environment env = orch.create("demo", {{"api", "main"}}, skip);
    REQUIRE(env.generated_files.empty());
}

TEST_CASE("Delete refuses outstanding work unless forced") {
    if (!have_git()) {
        WARN("git not available; skipping");
        return;
    }
    Fixture fx("orch_delete");
    EnvironmentRegistry reg(fx.cfg.registry_path);
    WorktreeClient client;
    EnvironmentOrchestrator orch(fx.cfg, reg, client);
    Environment env = orch.create("demo", {{"api", "main"}, {"web", "main"}}, quiet());
    write_file(env.path / "api/wip.txt", "unsaved\n");

    auto e = thrown_error([&] { orch.remove("demo"); });
    REQUIRE(e.kind() == ErrorKind::Conflict);
    REQUIRE(e.conflict() == ConflictKind::OutstandingWork);
    REQUIRE(e.pending_work().size() == 1);
    REQUIRE(e.pending_work()[0].repository == "api");
    REQUIRE(e.pending_work()[0].kind == "uncommitted");
    REQUIRE(e.pending_work()[0].count == 1);
    REQUIRE(fs::exists(env.path / "api/wip.txt"));
    REQUIRE(reg.exists("demo"));

    DeleteOptions force;
    force.force = true;
    orch.remove("demo", force);
    REQUIRE_FALSE(fs::exists(env.path));
    REQUIRE_FALSE(reg.exists("demo"));
    REQUIRE_FALSE(client.is_branch_checked_out(fx.cfg.base_repo_path("api"), "main"));
    REQUIRE(orch.list().empty());
}

TEST_CASE("Delete cleans up an environment whose directory vanished") {
    if (!have_git()) {
        WARN("git not available; skipping");
        return;
    }
    Fixture fx("orch_vanished");
    EnvironmentRegistry reg(fx.cfg.registry_path);
    WorktreeClient client;
    EnvironmentOrchestrator orch(fx.cfg, reg, client);
    Environment env = orch.create("demo", {{"web", "main"}}, quiet());
    FS_REMOVE_ALL(env.path);

    auto st = orch.status("demo");
    REQUIRE_FALSE(st.exists_on_disk);
    REQUIRE(st.repos[0].error);

    orch.remove("demo");
    REQUIRE_FALSE(reg.exists("demo"));
    REQUIRE_FALSE(client.is_branch_checked_out(fx.cfg.base_repo_path("web"), "main"));
}

TEST_CASE("Concurrent creates of the same branch admit exactly one") {
    if (!have_git()) {
        WARN("git not available; skipping");
        return;
    }
    Fixture fx("orch_concurrent");
    EnvironmentRegistry reg(fx.cfg.registry_path);
    WorktreeClient client;
    client.ensure_clone(fx.cfg.repositories.at("api").url, fx.cfg.base_repo_path("api"));

    std::atomic<int> created{0};
    std::atomic<int> conflicts{0};
    std::vector<std::thread> threads;
    for (const std::string name : {"first", "second"}) {
        threads.emplace_back([&, name] {
            EnvironmentOrchestrator orch(fx.cfg, reg, client);
            try {
                orch.create(name, {{"api", "main"}}, quiet());
                created.fetch_add(1);
            } catch (const Error& e) {
                if (e.kind() == ErrorKind::Conflict && e.conflict() == ConflictKind::BranchCheckedOut)
                    conflicts.fetch_add(1);
            }
        });
    }
    for (auto& t : threads)
        t.join();
    REQUIRE(created.load() == 1);
    REQUIRE(conflicts.load() == 1);
    REQUIRE(reg.list_names().size() == 1);
    const std::string loser = reg.exists("first") ? "second" : "first";
    REQUIRE_FALSE(fs::exists(fx.env(loser)));
}

TEST_CASE("A rollback that cannot undo a step reports what it left behind") {
    if (!have_git()) {
        WARN("git not available; skipping");
        return;
    }
    Fixture fx("orch_rollback_fail");
    EnvironmentRegistry reg(fx.cfg.registry_path);
    BrittleClient client("web");
    EnvironmentOrchestrator orch(fx.cfg, reg, client);

    auto e = thrown_error([&] { orch.create("demo", {{"api", "main"}, {"web", "main"}}, quiet()); });
    REQUIRE(e.kind() == ErrorKind::ToolFailure);
    REQUIRE(e.context().step == "worktree-add");
    REQUIRE_FALSE(e.secondary().empty());
    bool api_left = false;
    for (const auto& f : e.secondary()) {
        if (f.repository == "api") {
            api_left = true;
            REQUIRE(f.step == "remove-worktree");
            REQUIRE(f.path == (fx.env("demo") / "api").string());
            REQUIRE(f.message.find("worktree is locked") != std::string::npos);
        }
    }
    REQUIRE(api_left);
    // the directory is still removed after the failed worktree removal
    REQUIRE_FALSE(fs::exists(fx.env("demo")));
    REQUIRE_FALSE(reg.exists("demo"));
}

TEST_CASE("A failing symlink rule rolls the environment back as an I/O error") {
    if (!have_git()) {
        WARN("git not available; skipping");
        return;
    }
    Fixture fx("orch_symlink_fail");
    fx.cfg.symlinks.push_back({"web/README.md", "api/README.md", {}});
    EnvironmentRegistry reg(fx.cfg.registry_path);
    WorktreeClient client;
    EnvironmentOrchestrator orch(fx.cfg, reg, client);

    auto e = thrown_error([&] { orch.create("demo", {{"api", "main"}, {"web", "main"}}, quiet()); });
    REQUIRE(e.kind() == ErrorKind::Io);
    REQUIRE(e.context().step == "symlink");
    REQUIRE(e.context().environment == "demo");
    REQUIRE(e.secondary().empty());
    REQUIRE_FALSE(fs::exists(fx.env("demo")));
    REQUIRE_FALSE(reg.exists("demo"));
    REQUIRE_FALSE(client.is_branch_checked_out(fx.cfg.base_repo_path("api"), "main"));
    REQUIRE_FALSE(client.is_branch_checked_out(fx.cfg.base_repo_path("web"), "main"));
}

TEST_CASE("Delete refuses unpushed commits unless forced") {
    if (!have_git()) {
        WARN("git not available; skipping");
        return;
    }
    Fixture fx("orch_unpushed");
    EnvironmentRegistry reg(fx.cfg.registry_path);
    WorktreeClient client;
    EnvironmentOrchestrator orch(fx.cfg, reg, client);
    Environment env = orch.create("demo", {{"api", "feature"}}, quiet());
    write_file(env.path / "api/local.txt", "local\n");
    REQUIRE(git_ok(env.path / "api", "add -A"));
    REQUIRE(git_ok(env.path / "api", "commit -q -m local"));

    auto e = thrown_error([&] { orch.remove("demo"); });
    REQUIRE(e.kind() == ErrorKind::Conflict);
    REQUIRE(e.conflict() == ConflictKind::OutstandingWork);
    REQUIRE(e.pending_work().size() == 1);
    REQUIRE(e.pending_work()[0].repository == "api");
    REQUIRE(e.pending_work()[0].kind == "unpushed");
    REQUIRE(e.pending_work()[0].count == 1);
    REQUIRE(fs::exists(env.path / "api/local.txt"));

    DeleteOptions force;
    force.force = true;
    orch.remove("demo", force);
    REQUIRE_FALSE(reg.exists("demo"));
    REQUIRE_FALSE(fs::exists(env.path));
}

TEST_CASE("Delete continues past failed steps and reports them together") {
    if (!have_git()) {
        WARN("git not available; skipping");
        return;
    }
    Fixture fx("orch_partial");
    EnvironmentRegistry reg(fx.cfg.registry_path);
    WorktreeClient client;
    EnvironmentOrchestrator setup(fx.cfg, reg, client);

    SECTION("the record goes once the directory is gone") {
        Environment env = setup.create("demo", {{"api", "main"}, {"web", "main"}}, quiet());
        StubbornClient stubborn("api");
        EnvironmentOrchestrator orch(fx.cfg, reg, stubborn);

        auto e = thrown_error([&] { orch.remove("demo"); });
        REQUIRE(e.kind() == ErrorKind::Partial);
        REQUIRE(e.failures().size() == 1);
        REQUIRE(e.failures()[0].repository == "api");
        REQUIRE(e.failures()[0].step == "worktree-remove");
        REQUIRE(e.failures()[0].message == "fatal: cannot remove worktree");
        REQUIRE_FALSE(fs::exists(env.path));
        REQUIRE_FALSE(client.is_branch_checked_out(fx.cfg.base_repo_path("web"), "main"));
        REQUIRE_FALSE(reg.exists("demo"));
    }

    SECTION("the record stays while the directory survives") {
        Environment env = setup.create("demo", {{"api", "main"}, {"web", "main"}}, quiet());
        StubbornClient stubborn("api", env.path);
        EnvironmentOrchestrator orch(fx.cfg, reg, stubborn);

        auto e = thrown_error([&] { orch.remove("demo"); });
        REQUIRE(e.kind() == ErrorKind::Partial);
        REQUIRE(e.failures().size() == 2);
        REQUIRE(e.failures()[0].step == "worktree-remove");
        REQUIRE(e.failures()[1].step == "unregister");
        REQUIRE(fs::exists(env.path));
        REQUIRE(reg.exists("demo"));
        REQUIRE_FALSE(client.is_branch_checked_out(fx.cfg.base_repo_path("web"), "main"));
    }
}
