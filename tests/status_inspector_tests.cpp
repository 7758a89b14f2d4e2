#include "test_common.hpp"
#include "status_inspector.hpp"

using namespace wtenv;

namespace {
/// Reports canned status per worktree directory name.
class CannedClient : public WorktreeClient {
  public:
    WorktreeStatus get_status(const fs::path& repo) const override {
        const std::string leaf = repo.filename().string();
        if (leaf == "broken") {
            ErrorContext ctx;
            ctx.step = "status";
            ctx.detail = "bad object HEAD";
            throw Error(ErrorKind::ToolFailure, "status failed", ctx);
        }
        if (leaf == "dirty")
            return WorktreeStatus{3, 0, 0};
        if (leaf == "ahead")
            return WorktreeStatus{0, 2, 1};
        return WorktreeStatus{};
    }
};
} // namespace

TEST_CASE("StatusInspector reports every repository in order") {
    TempDir dir("status_report");
    for (const char* leaf : {"clean", "dirty", "ahead", "broken"})
        fs::create_directories(dir / leaf);

    Environment env;
    env.name = "demo";
    env.path = dir.path;
    env.repos = {{"a", "main", dir / "clean"},
                 {"b", "dev", dir / "dirty"},
                 {"c", "feat", dir / "ahead"},
                 {"d", "fix", dir / "broken"},
                 {"e", "gone", dir / "missing"}};

    CannedClient client;
    auto report = StatusInspector(client).report(env);
    REQUIRE(report.size() == 5);
    REQUIRE(report[0].name == "a");
    REQUIRE(classify(report[0]) == SyncState::Clean);
    REQUIRE(report[1].uncommitted == 3);
    REQUIRE(classify(report[1]) == SyncState::Uncommitted);
    REQUIRE(report[2].ahead == 2);
    REQUIRE(report[2].behind == 1);
    REQUIRE(classify(report[2]) == SyncState::Ahead);
    REQUIRE(report[3].error == std::string("bad object HEAD"));
    REQUIRE(classify(report[3]) == SyncState::Error);
    REQUIRE(report[4].branch == "gone");
    REQUIRE(report[4].error == std::string("worktree not found"));
}

TEST_CASE("StatusInspector reads a real worktree") {
    if (!have_git()) {
        WARN("git not available; skipping");
        return;
    }
    TempDir dir("status_git");
    auto url = make_origin(dir.path, "api");
    WorktreeClient client;
    client.ensure_clone(url, dir / "repos/api");
    client.add_worktree(dir / "repos/api", "main", dir / "env/api");
    write_file(dir / "env/api/notes.txt", "todo\n");

    RepoStatus st = StatusInspector(client).inspect({"api", "main", dir / "env/api"});
    REQUIRE_FALSE(st.error);
    REQUIRE(st.uncommitted == 1);
    REQUIRE(st.ahead == 0);
}
