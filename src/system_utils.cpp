#include "system_utils.hpp"
#include <errno.h>
#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <sys/stat.h>
#include <sys/wait.h>
#include <chrono>
#include <cstdlib>
#include <cstring>
#include <sstream>
#include <thread>

extern char** environ;

namespace procutil {

namespace {

bool make_pipe(UniqueFd& rd, UniqueFd& wr) {
    int fds[2];
    if (pipe2(fds, O_CLOEXEC) != 0)
        return false;
    rd.reset(fds[0]);
    wr.reset(fds[1]);
    return true;
}

// Reads whatever is available on @p fd into @p buf. Returns false on EOF.
bool drain(int fd, std::string& buf) {
    char chunk[4096];
    ssize_t n = read(fd, chunk, sizeof(chunk));
    if (n > 0) {
        buf.append(chunk, static_cast<size_t>(n));
        return true;
    }
    if (n < 0 && (errno == EINTR || errno == EAGAIN))
        return true;
    return false;
}

int decode_status(int status) {
    if (WIFEXITED(status))
        return WEXITSTATUS(status);
    if (WIFSIGNALED(status))
        return 128 + WTERMSIG(status);
    return -1;
}

void terminate_child(pid_t pid) {
    kill(pid, SIGTERM);
    for (int i = 0; i < 50; ++i) {
        int status = 0;
        if (waitpid(pid, &status, WNOHANG) == pid)
            return;
        std::this_thread::sleep_for(std::chrono::milliseconds(20));
    }
    kill(pid, SIGKILL);
    int status = 0;
    while (waitpid(pid, &status, 0) < 0 && errno == EINTR) {
    }
}

} // namespace

ProcessResult run_process(const std::vector<std::string>& argv, const std::filesystem::path& cwd,
                          const CancelToken* cancel, const std::map<std::string, std::string>& env) {
    ProcessResult res;
    if (argv.empty()) {
        res.launch_error = "empty command line";
        return res;
    }
    UniqueFd out_rd, out_wr, err_rd, err_wr, exec_rd, exec_wr;
    if (!make_pipe(out_rd, out_wr) || !make_pipe(err_rd, err_wr) || !make_pipe(exec_rd, exec_wr)) {
        res.launch_error = std::string("pipe: ") + std::strerror(errno);
        return res;
    }
    std::vector<char*> cargv;
    cargv.reserve(argv.size() + 1);
    for (const auto& a : argv)
        cargv.push_back(const_cast<char*>(a.c_str()));
    cargv.push_back(nullptr);
    std::string dir = cwd.string();

    // Built before fork; the child only swaps the pointer.
    std::vector<std::string> env_strings;
    std::vector<char*> envp;
    if (!env.empty()) {
        for (char** e = environ; e && *e; ++e) {
            std::string entry(*e);
            if (env.count(entry.substr(0, entry.find('='))) == 0)
                env_strings.push_back(std::move(entry));
        }
        for (const auto& [key, value] : env)
            env_strings.push_back(key + "=" + value);
        for (auto& entry : env_strings)
            envp.push_back(&entry[0]);
        envp.push_back(nullptr);
    }

    pid_t pid = fork();
    if (pid < 0) {
        res.launch_error = std::string("fork: ") + std::strerror(errno);
        return res;
    }
    if (pid == 0) {
        int devnull = open("/dev/null", O_RDONLY);
        if (devnull >= 0)
            dup2(devnull, STDIN_FILENO);
        dup2(out_wr.get(), STDOUT_FILENO);
        dup2(err_wr.get(), STDERR_FILENO);
        int code = 0;
        if (!dir.empty() && chdir(dir.c_str()) != 0) {
            code = -errno; // negative: the directory, not the executable, failed
        } else {
            if (!envp.empty())
                environ = envp.data();
            execvp(cargv[0], cargv.data());
            code = errno;
        }
        // exec_wr is close-on-exec; reaching here means exec never happened.
        ssize_t w = write(exec_wr.get(), &code, sizeof(code));
        (void)w;
        _exit(127);
    }

    out_wr.reset();
    err_wr.reset();
    exec_wr.reset();

    int exec_errno = 0;
    ssize_t n;
    do {
        n = read(exec_rd.get(), &exec_errno, sizeof(exec_errno));
    } while (n < 0 && errno == EINTR);
    if (n == static_cast<ssize_t>(sizeof(exec_errno))) {
        int status = 0;
        while (waitpid(pid, &status, 0) < 0 && errno == EINTR) {
        }
        if (exec_errno < 0) {
            res.launched = true;
            res.exit_code = 127;
            res.err = "cannot change directory to " + dir + ": " + std::strerror(-exec_errno);
            return res;
        }
        res.launch_error = argv[0] + ": " + std::strerror(exec_errno);
        return res;
    }
    res.launched = true;

    bool out_open = true;
    bool err_open = true;
    while (out_open || err_open) {
        if (cancel && cancel->cancelled()) {
            terminate_child(pid);
            res.cancelled = true;
            res.exit_code = -1;
            return res;
        }
        pollfd fds[2];
        nfds_t count = 0;
        int out_idx = -1;
        int err_idx = -1;
        if (out_open) {
            out_idx = static_cast<int>(count);
            fds[count++] = pollfd{out_rd.get(), POLLIN, 0};
        }
        if (err_open) {
            err_idx = static_cast<int>(count);
            fds[count++] = pollfd{err_rd.get(), POLLIN, 0};
        }
        int rc = poll(fds, count, 100);
        if (rc < 0) {
            if (errno == EINTR)
                continue;
            break;
        }
        if (out_idx >= 0 && fds[out_idx].revents != 0)
            out_open = drain(out_rd.get(), res.out);
        if (err_idx >= 0 && fds[err_idx].revents != 0)
            err_open = drain(err_rd.get(), res.err);
    }

    int status = 0;
    while (true) {
        pid_t r = waitpid(pid, &status, WNOHANG);
        if (r == pid)
            break;
        if (r < 0 && errno != EINTR) {
            status = 0;
            break;
        }
        if (cancel && cancel->cancelled()) {
            terminate_child(pid);
            res.cancelled = true;
            return res;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
    res.exit_code = decode_status(status);
    return res;
}

bool find_executable(const std::string& name) {
    if (name.empty())
        return false;
    if (name.find('/') != std::string::npos)
        return access(name.c_str(), X_OK) == 0;
    const char* path = std::getenv("PATH");
    if (!path)
        return false;
    std::stringstream ss(path);
    std::string dir;
    while (std::getline(ss, dir, ':')) {
        if (dir.empty())
            dir = ".";
        std::string candidate = dir + "/" + name;
        struct stat st{};
        if (stat(candidate.c_str(), &st) == 0 && S_ISREG(st.st_mode) &&
            access(candidate.c_str(), X_OK) == 0)
            return true;
    }
    return false;
}

} // namespace procutil
