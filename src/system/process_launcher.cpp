#include "system/process_launcher.hpp"

#include "util/logger.hpp"

#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <sys/wait.h>
#include <unistd.h>

namespace vfsup {

namespace {

void CloseFd(int& fd) {
    if (fd >= 0) {
        ::close(fd);
        fd = -1;
    }
}

pid_t WaitPid(pid_t pid, int& status) {
    pid_t r;
    do {
        r = ::waitpid(pid, &status, 0);
    } while (r < 0 && errno == EINTR);
    return r;
}

int DecodeStatus(int status) {
    if (WIFEXITED(status)) return WEXITSTATUS(status);
    if (WIFSIGNALED(status)) return 128 + WTERMSIG(status);
    return -1;
}

// Forks and execs path. A failed execv is reported back through a close-on-exec
// pipe, so the parent sees it as a start failure instead of exit code 127.
// When stdout_fd >= 0 the child's stdout is redirected to it.
pid_t Spawn(const std::string& path,
            const std::vector<std::string>& args,
            int stdout_fd,
            std::string& err) {
    std::vector<char*> argv;
    argv.reserve(args.size() + 2);
    argv.push_back(const_cast<char*>(path.c_str()));
    for (const auto& a : args) argv.push_back(const_cast<char*>(a.c_str()));
    argv.push_back(nullptr);

    int exec_err[2];
    if (::pipe2(exec_err, O_CLOEXEC) != 0) {
        err = std::string("pipe2() failed: ") + std::strerror(errno);
        return -1;
    }

    const pid_t pid = ::fork();
    if (pid < 0) {
        err = std::string("fork() failed: ") + std::strerror(errno);
        ::close(exec_err[0]);
        ::close(exec_err[1]);
        return -1;
    }

    if (pid == 0) {
        ::close(exec_err[0]);
        if (stdout_fd >= 0 && ::dup2(stdout_fd, STDOUT_FILENO) < 0) {
            const int e = errno;
            ssize_t n = ::write(exec_err[1], &e, sizeof(e));
            (void)n;
            _exit(127);
        }
        ::execv(path.c_str(), argv.data());
        const int e = errno;
        ssize_t n = ::write(exec_err[1], &e, sizeof(e));
        (void)n;
        _exit(127);
    }

    ::close(exec_err[1]);
    int child_errno = 0;
    ssize_t n;
    do {
        n = ::read(exec_err[0], &child_errno, sizeof(child_errno));
    } while (n < 0 && errno == EINTR);
    ::close(exec_err[0]);

    if (n == static_cast<ssize_t>(sizeof(child_errno))) {
        int status = 0;
        (void)WaitPid(pid, status);
        err = "execv(" + path + ") failed: " + std::strerror(child_errno);
        return -1;
    }
    return pid;
}

} // namespace

PosixProcessLauncher::~PosixProcessLauncher() {
    // Never leave a zombie behind.
    if (pid_ > 0 && !exited_) WaitForExit();
}

bool PosixProcessLauncher::Start(const std::string& path, const std::vector<std::string>& args) {
    if (pid_ > 0 && !exited_) {
        LogError("Start(%s) while previous child %d is still running", path.c_str(), (int)pid_);
        return false;
    }

    pid_ = -1;
    exited_ = false;
    exit_code_ = -1;

    std::string err;
    const pid_t pid = Spawn(path, args, -1, err);
    if (pid < 0) {
        LogError("Cannot start %s: %s", path.c_str(), err.c_str());
        return false;
    }

    pid_ = pid;
    LogDebug("Started %s (pid %d)", path.c_str(), (int)pid_);
    return true;
}

void PosixProcessLauncher::WaitForExit() {
    if (pid_ <= 0 || exited_) return;

    int status = 0;
    const pid_t r = WaitPid(pid_, status);

    exited_ = true;
    if (r < 0) {
        LogError("waitpid(%d) failed: %s", (int)pid_, std::strerror(errno));
        exit_code_ = -1;
        return;
    }

    exit_code_ = DecodeStatus(status);
    LogDebug("pid %d exited with %d", (int)pid_, exit_code_);
}

std::expected<int, std::string> RunToCompletion(IProcessLauncher& launcher,
                                                const std::string& path,
                                                const std::vector<std::string>& args) {
    if (!launcher.Start(path, args)) {
        return std::unexpected("failed to start " + path);
    }
    launcher.WaitForExit();
    if (!launcher.HasExited()) {
        return std::unexpected(path + " did not exit");
    }
    return launcher.ExitCode();
}

std::expected<std::string, std::string> ReadCommandOutput(const std::string& path,
                                                          const std::vector<std::string>& args) {
    int out[2];
    if (::pipe2(out, O_CLOEXEC) != 0) {
        return std::unexpected(std::string("pipe2() failed: ") + std::strerror(errno));
    }

    std::string err;
    const pid_t pid = Spawn(path, args, out[1], err);
    CloseFd(out[1]);
    if (pid < 0) {
        CloseFd(out[0]);
        return std::unexpected("failed to start " + path + ": " + err);
    }

    std::string output;
    char buf[4096];
    for (;;) {
        const ssize_t n = ::read(out[0], buf, sizeof(buf));
        if (n > 0) {
            output.append(buf, static_cast<size_t>(n));
        } else if (n == 0 || errno != EINTR) {
            break;
        }
    }
    CloseFd(out[0]);

    int status = 0;
    if (WaitPid(pid, status) < 0) {
        return std::unexpected("waitpid(" + std::to_string(pid) + ") failed: " + std::strerror(errno));
    }
    const int code = DecodeStatus(status);
    if (code != 0) {
        return std::unexpected(path + " exited with " + std::to_string(code));
    }
    return output;
}

} // namespace vfsup
