#include "lock_utils.hpp"
#include <errno.h>
#include <fcntl.h>
#include <signal.h>
#include <unistd.h>
#include <cstdio>
#include <fstream>
#include <system_error>
#include <thread>
#include "system_utils.hpp"

namespace procutil {

bool acquire_lock_file(const std::filesystem::path& path) {
    UniqueFd fd(open(path.c_str(), O_RDWR | O_CREAT | O_EXCL | O_CLOEXEC, 0644));
    if (!fd)
        return false;
    char buf[32];
    int len = snprintf(buf, sizeof(buf), "%ld\n", static_cast<long>(getpid()));
    if (write(fd.get(), buf, static_cast<size_t>(len)) != len) {
        fd.reset();
        release_lock_file(path);
        return false;
    }
    return true;
}

void release_lock_file(const std::filesystem::path& path) {
    std::error_code ec;
    std::filesystem::remove(path, ec);
}

bool read_lock_pid(const std::filesystem::path& path, unsigned long& pid) {
    std::ifstream f(path);
    if (!f.is_open())
        return false;
    unsigned long value = 0;
    if (!(f >> value) || value == 0)
        return false;
    pid = value;
    return true;
}

bool process_running(unsigned long pid) {
    if (kill(static_cast<pid_t>(pid), 0) == 0)
        return true;
    return errno != ESRCH;
}

bool break_stale_lock(const std::filesystem::path& path) {
    unsigned long pid = 0;
    if (!read_lock_pid(path, pid) || process_running(pid))
        return false;
    std::error_code ec;
    return std::filesystem::remove(path, ec);
}

LockFileGuard::LockFileGuard(const std::filesystem::path& p, std::chrono::milliseconds timeout)
    : path(p) {
    auto deadline = std::chrono::steady_clock::now() + timeout;
    while (true) {
        locked = acquire_lock_file(path);
        if (locked)
            return;
        if (break_stale_lock(path))
            continue;
        if (std::chrono::steady_clock::now() >= deadline)
            break;
        std::this_thread::sleep_for(std::chrono::milliseconds(20));
    }
    if (!read_lock_pid(path, holder))
        holder = 0;
}

LockFileGuard::~LockFileGuard() {
    if (locked)
        release_lock_file(path);
}

} // namespace procutil
