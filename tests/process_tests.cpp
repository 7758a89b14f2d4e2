#include "test_common.hpp"
#include "system_utils.hpp"

TEST_CASE("run_process captures stdout, stderr and exit code") {
    auto res = procutil::run_process({"sh", "-c", "echo out; echo err 1>&2; exit 3"});
    REQUIRE(res.launched);
    REQUIRE_FALSE(res.cancelled);
    REQUIRE(res.exit_code == 3);
    REQUIRE(res.out == "out\n");
    REQUIRE(res.err == "err\n");
    REQUIRE_FALSE(res.ok());
}

TEST_CASE("run_process runs in the requested directory") {
    TempDir dir("process_cwd");
    auto res = procutil::run_process({"pwd"}, dir.path);
    REQUIRE(res.ok());
    REQUIRE(fs::equivalent(fs::path(res.out.substr(0, res.out.find('\n'))), dir.path));
}

TEST_CASE("run_process distinguishes a missing executable") {
    auto res = procutil::run_process({"wtenv-definitely-not-a-command"});
    REQUIRE_FALSE(res.launched);
    REQUIRE_FALSE(res.launch_error.empty());
    REQUIRE_FALSE(procutil::find_executable("wtenv-definitely-not-a-command"));
    REQUIRE(procutil::find_executable("sh"));
}

TEST_CASE("run_process reports a missing working directory as a failed run") {
    auto res = procutil::run_process({"true"}, "/nonexistent/wtenv/dir");
    REQUIRE(res.launched);
    REQUIRE(res.exit_code == 127);
    REQUIRE(res.err.find("/nonexistent/wtenv/dir") != std::string::npos);
}

TEST_CASE("run_process handles output larger than a pipe buffer") {
    auto res = procutil::run_process({"sh", "-c", "head -c 200000 /dev/zero | tr '\\0' 'x'"});
    REQUIRE(res.ok());
    REQUIRE(res.out.size() == 200000);
}

TEST_CASE("run_process cancellation terminates the child") {
    procutil::CancelToken token;
    std::thread canceller([&token] {
        std::this_thread::sleep_for(std::chrono::milliseconds(200));
        token.cancel();
    });
    auto start = std::chrono::steady_clock::now();
    auto res = procutil::run_process({"sleep", "30"}, {}, &token);
    auto elapsed = std::chrono::steady_clock::now() - start;
    canceller.join();
    REQUIRE(res.launched);
    REQUIRE(res.cancelled);
    REQUIRE_FALSE(res.ok());
    REQUIRE(elapsed < std::chrono::seconds(5));
}

TEST_CASE("run_process layers environment overrides on the inherited environment") {
    ::setenv("WTENV_PROCESS_KEEP", "kept", 1);
    ::setenv("WTENV_PROCESS_SWAP", "old", 1);
    auto res = procutil::run_process(
        {"sh", "-c", "printf '%s %s %s' \"$WTENV_PROCESS_KEEP\" \"$WTENV_PROCESS_SWAP\" \"$WTENV_PROCESS_NEW\""},
        {}, nullptr, {{"WTENV_PROCESS_SWAP", "new"}, {"WTENV_PROCESS_NEW", "1"}});
    REQUIRE(res.ok());
    REQUIRE(res.out == "kept new 1");
    REQUIRE(std::string(std::getenv("WTENV_PROCESS_SWAP")) == "old");
    ::unsetenv("WTENV_PROCESS_KEEP");
    ::unsetenv("WTENV_PROCESS_SWAP");
}
