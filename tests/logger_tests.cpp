#include <zlib.h>
#include <iostream>
#include <sstream>
#include "test_common.hpp"

namespace {
struct LoggerGuard {
    ~LoggerGuard() { shutdown_logger(); }
};

std::vector<std::string> read_lines(const fs::path& p) {
    std::ifstream ifs(p);
    std::vector<std::string> lines;
    std::string line;
    while (std::getline(ifs, line))
        lines.push_back(line);
    return lines;
}
} // namespace

TEST_CASE("Logger rotates and limits files") {
    TempDir dir("logger_rotate");
    fs::path log = dir / "wtenv.log";
    init_logger(log.string(), LogLevel::INFO, 100, 2);
    LoggerGuard guard;
    REQUIRE(logger_initialized());
    for (int i = 0; i < 200; ++i)
        log_info("entry " + std::to_string(i));
    flush_logger();
    shutdown_logger();
    REQUIRE(fs::exists(log));
    REQUIRE(fs::exists(log.string() + ".1"));
    REQUIRE(fs::exists(log.string() + ".2"));
    REQUIRE_FALSE(fs::exists(log.string() + ".3"));
}

TEST_CASE("Logger compresses rotated files") {
    TempDir dir("logger_compress");
    fs::path log = dir / "wtenv.log";
    set_log_compression(true);
    init_logger(log.string(), LogLevel::INFO, 100, 2);
    LoggerGuard guard;
    for (int i = 0; i < 200; ++i)
        log_info("entry " + std::to_string(i));
    shutdown_logger();
    set_log_compression(false);

    REQUIRE(fs::exists(log));
    fs::path log1 = log.string() + ".1.gz";
    REQUIRE(fs::exists(log1));
    REQUIRE(fs::exists(log.string() + ".2.gz"));
    REQUIRE_FALSE(fs::exists(log.string() + ".1"));

    gzFile zf = gzopen(log1.c_str(), "rb");
    REQUIRE(zf != nullptr);
    char buf[64];
    int n = gzread(zf, buf, sizeof(buf) - 1);
    gzclose(zf);
    REQUIRE(n > 0);
    buf[n] = '\0';
    REQUIRE(std::string(buf).find("[INFO] entry") != std::string::npos);
}

TEST_CASE("Logger switches between JSON and plain") {
    TempDir dir("logger_format");
    fs::path log = dir / "wtenv.log";
    init_logger(log.string());
    LoggerGuard guard;
    set_json_logging(true);
    log_info("json \"entry\"", {{"env", "demo"}});
    flush_logger();
    set_json_logging(false);
    log_warning("plain entry", {{"repo", "backend"}});
    flush_logger();
    shutdown_logger();

    auto lines = read_lines(log);
    REQUIRE(lines.size() == 2);
    REQUIRE(lines[0][0] == '{');
    REQUIRE(lines[0].find("\"env\":\"demo\"") != std::string::npos);
    REQUIRE(lines[0].find("json \\\"entry\\\"") != std::string::npos);
    REQUIRE(lines[1][0] == '[');
    REQUIRE(lines[1].find("[WARNING] plain entry repo=backend") != std::string::npos);
}

TEST_CASE("Logger filters below the minimum level") {
    TempDir dir("logger_level");
    fs::path log = dir / "wtenv.log";
    init_logger(log.string(), LogLevel::WARNING);
    LoggerGuard guard;
    log_debug("hidden debug");
    log_info("hidden info");
    log_error("shown error");
    set_log_level(LogLevel::DEBUG);
    log_debug("shown debug");
    shutdown_logger();
    auto lines = read_lines(log);
    REQUIRE(lines.size() == 2);
    REQUIRE(lines[0].find("shown error") != std::string::npos);
    REQUIRE(lines[1].find("[DEBUG] shown debug") != std::string::npos);
}

TEST_CASE("Logger creates the parent directory") {
    TempDir dir("logger_parent");
    fs::path log = dir / "nested" / "deeper" / "wtenv.log";
    init_logger(log.string());
    LoggerGuard guard;
    log_info("hello");
    shutdown_logger();
    REQUIRE(read_lines(log).size() == 1);
}

TEST_CASE("shutdown_logger drains queued messages") {
    TempDir dir("logger_drain");
    fs::path log = dir / "wtenv.log";
    init_logger(log.string());
    for (int i = 0; i < 50; ++i)
        log_info("queued " + std::to_string(i));
    shutdown_logger();
    REQUIRE(read_lines(log).size() == 50);
}

TEST_CASE("shutdown_logger exits cleanly with no messages") {
    TempDir dir("logger_noop");
    fs::path log = dir / "wtenv.log";
    init_logger(log.string());
    LoggerGuard guard;
    REQUIRE(logger_initialized());
    shutdown_logger();
    REQUIRE_FALSE(logger_initialized());
    REQUIRE(fs::exists(log));
    REQUIRE(fs::file_size(log) == 0);
}

TEST_CASE("init_logger can be called twice") {
    TempDir dir("logger_reinit");
    fs::path log = dir / "wtenv.log";
    init_logger(log.string());
    log_info("first entry");
    init_logger(log.string());
    log_info("second entry");
    shutdown_logger();
    REQUIRE(read_lines(log).size() == 2);
}

TEST_CASE("Console mirroring writes to stderr without a log file") {
    std::ostringstream captured;
    auto* old = std::cerr.rdbuf(captured.rdbuf());
    set_console_logging(true, LogLevel::WARNING);
    log_info("not mirrored");
    log_warning("mirrored", {{"repo", "backend"}});
    set_console_logging(false);
    std::cerr.rdbuf(old);
    REQUIRE(captured.str() == "wtenv: WARNING: mirrored repo=backend\n");
}

TEST_CASE("parse_log_level accepts names case-insensitively") {
    LogLevel level = LogLevel::INFO;
    REQUIRE(parse_log_level("debug", level));
    REQUIRE(level == LogLevel::DEBUG);
    REQUIRE(parse_log_level("Warn", level));
    REQUIRE(level == LogLevel::WARNING);
    REQUIRE(parse_log_level("ERROR", level));
    REQUIRE(level == LogLevel::ERR);
    REQUIRE_FALSE(parse_log_level("loud", level));
    REQUIRE(level == LogLevel::ERR);
}
