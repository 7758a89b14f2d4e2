#include "logger.hpp"
#include <zlib.h>
#include <algorithm>
#include <atomic>
#include <cctype>
#include <condition_variable>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <mutex>
#include <queue>
#include <thread>
#include <vector>
#include "time_utils.hpp"

namespace fs = std::filesystem;

namespace {

struct LogMessage {
    LogLevel level;
    std::string msg;
    std::map<std::string, std::string> fields;
};

std::ofstream g_log_ofs;
std::string g_log_path; // NOLINT(runtime/string)
std::atomic<LogLevel> g_min_level{LogLevel::INFO};
std::atomic<size_t> g_max_size{0};
std::atomic<size_t> g_max_files{1};
std::atomic<bool> g_json_log{false};
std::atomic<bool> g_compress_logs{false};
std::atomic<bool> g_console{false};
std::atomic<LogLevel> g_console_level{LogLevel::WARNING};

std::queue<LogMessage> g_log_queue;
std::mutex g_queue_mtx;
std::condition_variable g_queue_cv;
std::condition_variable g_drained_cv;
bool g_writing = false;
std::atomic<bool> g_running{false};
std::thread g_log_thread;
std::mutex g_init_mtx;
std::mutex g_console_mtx;

const char* level_label(LogLevel level) {
    switch (level) {
    case LogLevel::DEBUG:
        return "DEBUG";
    case LogLevel::INFO:
        return "INFO";
    case LogLevel::WARNING:
        return "WARNING";
    case LogLevel::ERR:
        return "ERROR";
    }
    return "INFO";
}

std::string json_escape(const std::string& in) {
    std::string out;
    out.reserve(in.size());
    for (char c : in) {
        switch (c) {
        case '"':
            out += "\\\"";
            break;
        case '\\':
            out += "\\\\";
            break;
        case '\n':
            out += "\\n";
            break;
        case '\r':
            out += "\\r";
            break;
        case '\t':
            out += "\\t";
            break;
        default:
            out += c;
            break;
        }
    }
    return out;
}

std::string format_line(const LogMessage& m) {
    std::string ts = timestamp();
    std::string line;
    if (g_json_log.load()) {
        line = "{\"timestamp\":\"" + json_escape(ts) + "\",\"level\":\"" + level_label(m.level) +
               "\",\"msg\":\"" + json_escape(m.msg) + "\"";
        for (const auto& [k, v] : m.fields)
            line += ",\"" + json_escape(k) + "\":\"" + json_escape(v) + "\"";
        line += "}";
    } else {
        line = "[" + ts + "] [" + level_label(m.level) + "] " + m.msg;
        for (const auto& [k, v] : m.fields)
            line += " " + k + "=" + v;
    }
    return line;
}

bool gzip_file(const std::string& src, const std::string& dst) {
    std::ifstream in(src, std::ios::binary);
    gzFile out = gzopen(dst.c_str(), "wb");
    if (!in.is_open() || out == nullptr) {
        if (out)
            gzclose(out);
        return false;
    }
    char buf[8192];
    while (in) {
        in.read(buf, sizeof(buf));
        std::streamsize n = in.gcount();
        if (n > 0 && gzwrite(out, buf, static_cast<unsigned int>(n)) == 0) {
            gzclose(out);
            return false;
        }
    }
    return gzclose(out) == Z_OK;
}

std::string rotated_name(size_t index, bool compressed) {
    std::string name = g_log_path + "." + std::to_string(index);
    if (compressed)
        name += ".gz";
    return name;
}

// Shift wtenv.log.N -> N+1, dropping the oldest, then move the active file
// to .1. Runs on the writer thread only.
void rotate_files() {
    std::error_code ec;
    g_log_ofs.close();
    const size_t keep = g_max_files.load();
    const bool gz = g_compress_logs.load();
    if (keep > 0) {
        fs::remove(rotated_name(keep, gz), ec);
        for (size_t i = keep - 1; i > 0; --i)
            fs::rename(rotated_name(i, gz), rotated_name(i + 1, gz), ec);
        fs::path first = rotated_name(1, false);
        fs::rename(g_log_path, first, ec);
        if (gz && !ec && gzip_file(first.string(), rotated_name(1, true)))
            fs::remove(first, ec);
    }
    g_log_ofs.open(g_log_path, std::ios::trunc);
}

void write_log_entry(const LogMessage& m) {
    if (!g_log_ofs.is_open())
        return;
    g_log_ofs << format_line(m) << '\n';
    if (g_max_size.load() == 0)
        return;
    g_log_ofs.flush();
    std::error_code ec;
    auto size = fs::file_size(g_log_path, ec);
    if (!ec && size > g_max_size.load())
        rotate_files();
}

void log_worker() {
    std::vector<LogMessage> batch;
    batch.reserve(16);
    while (true) {
        std::unique_lock<std::mutex> lk(g_queue_mtx);
        g_queue_cv.wait(lk, [] { return !g_log_queue.empty() || !g_running.load(); });
        if (!g_running.load() && g_log_queue.empty())
            break;
        while (!g_log_queue.empty() && batch.size() < 16) {
            batch.push_back(std::move(g_log_queue.front()));
            g_log_queue.pop();
        }
        g_writing = true;
        lk.unlock();
        for (const auto& m : batch)
            write_log_entry(m);
        batch.clear();
        g_log_ofs.flush();
        lk.lock();
        g_writing = false;
        if (g_log_queue.empty())
            g_drained_cv.notify_all();
    }
    g_log_ofs.flush();
    g_drained_cv.notify_all();
}

void stop_log_thread() {
    {
        std::lock_guard<std::mutex> qlk(g_queue_mtx);
        g_running.store(false);
    }
    g_queue_cv.notify_all();
    if (g_log_thread.joinable())
        g_log_thread.join();
}

void log(LogLevel level, const std::string& msg, const std::map<std::string, std::string>& fields) {
    if (g_console.load() && level >= g_console_level.load()) {
        std::lock_guard<std::mutex> lk(g_console_mtx);
        std::cerr << "wtenv: " << level_label(level) << ": " << msg;
        for (const auto& [k, v] : fields)
            std::cerr << " " << k << "=" << v;
        std::cerr << '\n';
    }
    if (level < g_min_level.load() || !g_running.load())
        return;
    {
        std::lock_guard<std::mutex> lk(g_queue_mtx);
        g_log_queue.push(LogMessage{level, msg, fields});
    }
    g_queue_cv.notify_one();
}

} // namespace

void init_logger(const std::string& path, LogLevel level, size_t max_size, size_t max_files) {
    std::lock_guard<std::mutex> lk(g_init_mtx);
    stop_log_thread();
    if (g_log_ofs.is_open())
        g_log_ofs.close();
    g_log_ofs.clear();
    std::error_code ec;
    fs::path parent = fs::path(path).parent_path();
    if (!parent.empty())
        fs::create_directories(parent, ec);
    g_log_ofs.open(path, std::ios::app);
    if (!g_log_ofs.is_open()) {
        std::cerr << "Failed to open log file: " << path << std::endl;
        g_log_path.clear();
        return;
    }
    g_log_path = path;
    g_max_size.store(max_size);
    g_max_files.store(max_files);
    g_min_level.store(level);
    g_running.store(true);
    g_log_thread = std::thread(log_worker);
}

void set_log_level(LogLevel level) { g_min_level.store(level); }

void set_json_logging(bool enable) { g_json_log.store(enable); }

void set_log_compression(bool enable) { g_compress_logs.store(enable); }

void set_console_logging(bool enable, LogLevel level) {
    g_console_level.store(level);
    g_console.store(enable);
}

bool logger_initialized() {
    std::lock_guard<std::mutex> lk(g_init_mtx);
    return g_log_ofs.is_open();
}

void flush_logger() {
    std::unique_lock<std::mutex> lk(g_queue_mtx);
    g_drained_cv.wait(lk, [] { return (g_log_queue.empty() && !g_writing) || !g_running.load(); });
}

bool parse_log_level(const std::string& name, LogLevel& out) {
    std::string v = name;
    std::transform(v.begin(), v.end(), v.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    if (v == "DEBUG")
        out = LogLevel::DEBUG;
    else if (v == "INFO")
        out = LogLevel::INFO;
    else if (v == "WARNING" || v == "WARN")
        out = LogLevel::WARNING;
    else if (v == "ERROR" || v == "ERR")
        out = LogLevel::ERR;
    else
        return false;
    return true;
}

void log_event(LogLevel level, const std::string& message) { log(level, message, {}); }

void log_event(LogLevel level, const std::string& message,
               const std::map<std::string, std::string>& fields) {
    log(level, message, fields);
}

void log_debug(const std::string& msg) { log(LogLevel::DEBUG, msg, {}); }
void log_debug(const std::string& msg, const std::map<std::string, std::string>& fields) {
    log(LogLevel::DEBUG, msg, fields);
}
void log_info(const std::string& msg) { log(LogLevel::INFO, msg, {}); }
void log_info(const std::string& msg, const std::map<std::string, std::string>& fields) {
    log(LogLevel::INFO, msg, fields);
}
void log_warning(const std::string& msg) { log(LogLevel::WARNING, msg, {}); }
void log_warning(const std::string& msg, const std::map<std::string, std::string>& fields) {
    log(LogLevel::WARNING, msg, fields);
}
void log_error(const std::string& msg) { log(LogLevel::ERR, msg, {}); }
void log_error(const std::string& msg, const std::map<std::string, std::string>& fields) {
    log(LogLevel::ERR, msg, fields);
}

void shutdown_logger() {
    std::lock_guard<std::mutex> lk(g_init_mtx);
    stop_log_thread();
    if (g_log_ofs.is_open()) {
        g_log_ofs.flush();
        g_log_ofs.close();
    }
    std::lock_guard<std::mutex> qlk(g_queue_mtx);
    while (!g_log_queue.empty())
        g_log_queue.pop();
}
