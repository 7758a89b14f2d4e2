#ifndef LOCK_UTILS_HPP
#define LOCK_UTILS_HPP
#include <chrono>
#include <filesystem>
#include <string>

namespace procutil {

/**
 * @brief Attempt to acquire an exclusive lock by creating a lock file.
 *
 * The current process ID is written into the file so other processes can
 * determine who holds the lock.
 *
 * @param path Filesystem location of the lock file.
 * @return true if the lock file was successfully created.
 */
bool acquire_lock_file(const std::filesystem::path& path);

/**
 * @brief Release a previously acquired lock file.
 *
 * The lock is released by deleting the file at @a path.
 */
void release_lock_file(const std::filesystem::path& path);

/**
 * @brief Read the PID stored in a lock file.
 *
 * @param path Path to the lock file.
 * @param pid  Output variable receiving the parsed process ID.
 * @return true if the PID was successfully read.
 */
bool read_lock_pid(const std::filesystem::path& path, unsigned long& pid);

/** @brief Check whether a process with the given PID is currently running. */
bool process_running(unsigned long pid);

/**
 * @brief Remove @p path when the process recorded in it is gone.
 *
 * A lock file without a readable PID is left alone; it may be mid-write by
 * its owner.
 *
 * @return true if a stale lock was removed.
 */
bool break_stale_lock(const std::filesystem::path& path);

/**
 * @brief RAII guard that holds a lock file for its lifetime.
 *
 * The constructor retries acquisition until @p timeout elapses, breaking
 * locks left behind by dead processes. Check `locked` before proceeding.
 */
struct LockFileGuard {
    std::filesystem::path path; ///< Location of the lock file.
    bool locked = false;        ///< Whether the lock was successfully acquired.
    unsigned long holder = 0;   ///< PID of the holder when acquisition timed out.
    explicit LockFileGuard(const std::filesystem::path& p,
                           std::chrono::milliseconds timeout = std::chrono::milliseconds(0));
    ~LockFileGuard();
    LockFileGuard(const LockFileGuard&) = delete;
    LockFileGuard& operator=(const LockFileGuard&) = delete;
};

} // namespace procutil

#endif // LOCK_UTILS_HPP
