#include "test_common.hpp"
#include "lock_utils.hpp"

using namespace wtenv;

namespace {
Environment sample_env(const std::string& name) {
    Environment env;
    env.name = name;
    env.path = "/envs/" + name;
    env.created_at = "2026-01-01T10:00:00+00:00";
    env.repos.push_back({"backend", "main", "/envs/" + name + "/backend"});
    return env;
}
} // namespace

TEST_CASE("Registry starts empty when the file is missing") {
    TempDir dir("registry_empty");
    EnvironmentRegistry reg(dir / "state/registry.json");
    REQUIRE(reg.list_all().empty());
    REQUIRE_FALSE(reg.exists("demo"));
    REQUIRE_FALSE(reg.find("demo"));
    REQUIRE_FALSE(fs::exists(dir / "state/registry.json"));
}

TEST_CASE("Registry add, get, list and remove") {
    TempDir dir("registry_crud");
    const fs::path file = dir / "registry.json";
    EnvironmentRegistry reg(file);
    reg.add(sample_env("zeta"));
    reg.add(sample_env("alpha"));

    REQUIRE(reg.exists("zeta"));
    REQUIRE(reg.get("alpha").repos.front().branch == "main");
    // insertion order, not alphabetical
    REQUIRE(reg.list_names() == std::vector<std::string>{"zeta", "alpha"});

    auto doc = nlohmann::json::parse(read_file(file));
    REQUIRE(doc["version"] == 1);
    REQUIRE(doc["environments"]["zeta"]["path"] == "/envs/zeta");

    // a second instance sees the same data
    EnvironmentRegistry other(file);
    REQUIRE(other.list_all().size() == 2);

    reg.remove("zeta");
    REQUIRE_FALSE(other.exists("zeta"));
    REQUIRE(other.list_names() == std::vector<std::string>{"alpha"});
    REQUIRE_FALSE(fs::exists(file.string() + ".lock"));
}

TEST_CASE("Registry rejects duplicate names and unknown removals") {
    TempDir dir("registry_dupe");
    EnvironmentRegistry reg(dir / "registry.json");
    reg.add(sample_env("demo"));
    try {
        reg.add(sample_env("demo"));
        FAIL("expected Conflict");
    } catch (const Error& e) {
        REQUIRE(e.kind() == ErrorKind::Conflict);
        REQUIRE(e.conflict() == ConflictKind::NameRegistered);
    }
    try {
        reg.remove("ghost");
        FAIL("expected NotFound");
    } catch (const Error& e) {
        REQUIRE(e.kind() == ErrorKind::NotFound);
    }
    try {
        reg.get("ghost");
        FAIL("expected NotFound");
    } catch (const Error& e) {
        REQUIRE(e.kind() == ErrorKind::NotFound);
        REQUIRE(e.context().environment == "ghost");
    }
    REQUIRE(reg.list_names().size() == 1);
}

TEST_CASE("Registry reads unversioned documents as version 1") {
    TempDir dir("registry_legacy");
    const fs::path file = dir / "registry.json";
    write_file(file, R"({"environments": {"old": {"name": "old", "path": "/envs/old",
        "created_at": "2025-05-05T05:05:05+00:00",
        "repos": [{"name": "api", "branch": "dev", "worktree_path": "/envs/old/api"}],
        "generated_files": [], "symlinks": []}}})");
    EnvironmentRegistry reg(file);
    REQUIRE(reg.get("old").repos.front().name == "api");
    reg.add(sample_env("new"));
    auto doc = nlohmann::json::parse(read_file(file));
    REQUIRE(doc["version"] == 1);
    REQUIRE(doc["environments"].size() == 2);
}

TEST_CASE("Registry refuses other versions and corrupt files") {
    TempDir dir("registry_bad");
    const fs::path file = dir / "registry.json";

    write_file(file, R"({"version": 2, "environments": {}})");
    EnvironmentRegistry reg(file);
    try {
        reg.list_all();
        FAIL("expected UnsupportedVersion");
    } catch (const Error& e) {
        REQUIRE(e.kind() == ErrorKind::UnsupportedVersion);
    }

    write_file(file, "{ not json");
    try {
        reg.add(sample_env("x"));
        FAIL("expected Io");
    } catch (const Error& e) {
        REQUIRE(e.kind() == ErrorKind::Io);
    }
    // the corrupt file is left untouched
    REQUIRE(read_file(file) == "{ not json");
}

TEST_CASE("Registry times out on a foreign lock") {
    TempDir dir("registry_locked");
    const fs::path file = dir / "registry.json";
    fs::path lock = file;
    lock += ".lock";
    REQUIRE(procutil::acquire_lock_file(lock));
    EnvironmentRegistry reg(file, std::chrono::milliseconds(100));
    try {
        reg.add(sample_env("demo"));
        FAIL("expected Io");
    } catch (const Error& e) {
        REQUIRE(e.kind() == ErrorKind::Io);
        REQUIRE(std::string(e.what()).find("locked") != std::string::npos);
    }
    procutil::release_lock_file(lock);
    reg.add(sample_env("demo"));
    REQUIRE(reg.exists("demo"));
}

TEST_CASE("Registry concurrent adds keep every record") {
    TempDir dir("registry_concurrent");
    const fs::path file = dir / "registry.json";
    std::vector<std::thread> threads;
    for (int i = 0; i < 8; ++i) {
        threads.emplace_back([&file, i] {
            EnvironmentRegistry reg(file);
            reg.add(sample_env("env" + std::to_string(i)));
        });
    }
    for (auto& t : threads)
        t.join();
    EnvironmentRegistry reg(file);
    REQUIRE(reg.list_names().size() == 8);
}
