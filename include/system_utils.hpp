#ifndef SYSTEM_UTILS_HPP
#define SYSTEM_UTILS_HPP
#include <atomic>
#include <filesystem>
#include <map>
#include <string>
#include <vector>
#include <unistd.h>

namespace procutil {

/**
 * @brief RAII wrapper for POSIX-style file descriptors.
 *
 * Closes the descriptor when the object goes out of scope. Use to manage
 * ownership of file descriptors returned by open, pipe and similar calls.
 */
class UniqueFd {
  public:
    UniqueFd() noexcept : fd(-1) {}
    explicit UniqueFd(int f) noexcept : fd(f) {}
    ~UniqueFd() { reset(); }

    UniqueFd(const UniqueFd&) = delete;
    UniqueFd& operator=(const UniqueFd&) = delete;

    UniqueFd(UniqueFd&& other) noexcept : fd(other.fd) { other.fd = -1; }

    UniqueFd& operator=(UniqueFd&& other) noexcept {
        if (this != &other) {
            reset();
            fd = other.fd;
            other.fd = -1;
        }
        return *this;
    }

    int get() const noexcept { return fd; }
    explicit operator bool() const noexcept { return fd >= 0; }

    int release() noexcept {
        int tmp = fd;
        fd = -1;
        return tmp;
    }

    void reset(int f = -1) noexcept {
        if (fd >= 0)
            close(fd);
        fd = f;
    }

  private:
    int fd;
};

/**
 * @brief Cooperative cancellation flag shared with running children.
 *
 * Once cancelled it stays cancelled. run_process polls it and terminates
 * its child when it flips.
 */
class CancelToken {
  public:
    void cancel() noexcept { flag_.store(true); }
    bool cancelled() const noexcept { return flag_.load(); }

  private:
    std::atomic<bool> flag_{false};
};

/** @brief Outcome of one child process. */
struct ProcessResult {
    int exit_code = -1;
    std::string out;
    std::string err;
    bool launched = false;  ///< false when the executable could not be started
    bool cancelled = false; ///< child was terminated through the CancelToken
    std::string launch_error;

    bool ok() const { return launched && !cancelled && exit_code == 0; }
};

/**
 * @brief Run @p argv[0] with the given arguments and capture its output.
 *
 * The executable is looked up on PATH. stdin is connected to /dev/null.
 * When @p cwd is non-empty the child changes into it before exec.
 * If @p cancel is set while the child runs, it receives SIGTERM (SIGKILL
 * after a grace period) and is reaped before returning.
 * Entries of @p env are set in the child on top of the inherited environment.
 */
ProcessResult run_process(const std::vector<std::string>& argv,
                          const std::filesystem::path& cwd = {},
                          const CancelToken* cancel = nullptr,
                          const std::map<std::string, std::string>& env = {});

/** @brief Check whether @p name resolves to an executable on PATH. */
bool find_executable(const std::string& name);

} // namespace procutil

#endif // SYSTEM_UTILS_HPP
