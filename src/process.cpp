#include "process.hpp"

#include "exception.hpp"
#include "localization.hpp"
#include "utils.hpp"

#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <sys/wait.h>
#include <unistd.h>

#include <cerrno>
#include <cstdlib>
#include <cstring>

namespace {

// Owns one end of a pipe.
class FileDescriptor {
public:
    FileDescriptor() = default;
    explicit FileDescriptor(int fd) : fd_(fd) {}
    FileDescriptor(const FileDescriptor&) = delete;
    FileDescriptor& operator=(const FileDescriptor&) = delete;
    FileDescriptor(FileDescriptor&& other) noexcept : fd_(other.release()) {}
    FileDescriptor& operator=(FileDescriptor&& other) noexcept {
        if (this != &other) {
            reset(other.release());
        }
        return *this;
    }
    ~FileDescriptor() { reset(); }

    int get() const { return fd_; }
    explicit operator bool() const { return fd_ >= 0; }
    int release() {
        int fd = fd_;
        fd_ = -1;
        return fd;
    }
    void reset(int fd = -1) {
        if (fd_ >= 0) close(fd_);
        fd_ = fd;
    }

private:
    int fd_ = -1;
};

struct Pipe {
    FileDescriptor read_end;
    FileDescriptor write_end;
};

Pipe make_pipe() {
    int fds[2];
    if (pipe2(fds, O_CLOEXEC) != 0) {
        throw BorealisException(string_format("error.pipe_failed", std::string(strerror(errno))));
    }
    return Pipe{FileDescriptor(fds[0]), FileDescriptor(fds[1])};
}

int decode_status(int status) {
    if (WIFEXITED(status)) return WEXITSTATUS(status);
    if (WIFSIGNALED(status)) return 128 + WTERMSIG(status);
    return -1;
}

// Drains the captured pipes until both reach EOF or the deadline passes.
bool drain(FileDescriptor& out_fd, FileDescriptor& err_fd, ProcessResult& result,
           std::optional<std::chrono::steady_clock::time_point> deadline) {
    char buffer[4096];
    while (out_fd || err_fd) {
        std::vector<pollfd> fds;
        std::vector<std::pair<FileDescriptor*, std::string*>> targets;
        if (out_fd) {
            fds.push_back({out_fd.get(), POLLIN, 0});
            targets.emplace_back(&out_fd, &result.out);
        }
        if (err_fd) {
            fds.push_back({err_fd.get(), POLLIN, 0});
            targets.emplace_back(&err_fd, &result.err);
        }

        int wait_ms = -1;
        if (deadline) {
            auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(*deadline - std::chrono::steady_clock::now());
            if (remaining.count() <= 0) return false;
            wait_ms = static_cast<int>(remaining.count());
        }

        int ready = poll(fds.data(), fds.size(), wait_ms);
        if (ready < 0) {
            if (errno == EINTR) continue;
            throw BorealisException(string_format("error.poll_failed", std::string(strerror(errno))));
        }
        if (ready == 0) return false;

        for (size_t i = 0; i < fds.size(); ++i) {
            if (!(fds[i].revents & (POLLIN | POLLHUP | POLLERR))) continue;
            ssize_t n = read(fds[i].fd, buffer, sizeof(buffer));
            if (n > 0) {
                targets[i].second->append(buffer, static_cast<size_t>(n));
            } else if (n == 0 || errno != EINTR) {
                targets[i].first->reset();
            }
        }
    }
    return true;
}

}

ProcessResult SystemCommandRunner::run(const std::vector<std::string>& argv, const ProcessOptions& options) {
    if (argv.empty()) {
        throw BorealisException(get_string("error.empty_command"));
    }

    Pipe out_pipe;
    Pipe err_pipe;
    if (options.capture_stdout) out_pipe = make_pipe();
    if (options.capture_stderr) err_pipe = make_pipe();
    // Closed by exec on success; carries errno when exec fails.
    Pipe exec_pipe = make_pipe();

    std::vector<char*> c_args;
    for (const auto& arg : argv) c_args.push_back(const_cast<char*>(arg.c_str()));
    c_args.push_back(nullptr);

    pid_t pid = fork();
    if (pid == -1) {
        throw BorealisException(string_format("error.fork_failed", argv[0], std::string(strerror(errno))));
    }
    if (pid == 0) {
        if (options.capture_stdout && dup2(out_pipe.write_end.get(), STDOUT_FILENO) == -1) _exit(127);
        if (options.capture_stderr && dup2(err_pipe.write_end.get(), STDERR_FILENO) == -1) _exit(127);
        if (options.cwd && chdir(options.cwd->c_str()) != 0) _exit(127);
        execvp(c_args[0], c_args.data());
        int exec_errno = errno;
        ssize_t written = write(exec_pipe.write_end.get(), &exec_errno, sizeof(exec_errno));
        _exit(written == sizeof(exec_errno) ? 127 : 126);
    }

    out_pipe.write_end.reset();
    err_pipe.write_end.reset();
    exec_pipe.write_end.reset();

    int exec_errno = 0;
    ssize_t n;
    while ((n = read(exec_pipe.read_end.get(), &exec_errno, sizeof(exec_errno))) == -1 && errno == EINTR) {}
    if (n == sizeof(exec_errno)) {
        int status = 0;
        waitpid(pid, &status, 0);
        throw BorealisException(string_format("error.exec_failed", argv[0], std::string(strerror(exec_errno))));
    }

    std::optional<std::chrono::steady_clock::time_point> deadline;
    if (options.timeout) {
        deadline = std::chrono::steady_clock::now() + *options.timeout;
    }

    ProcessResult result;
    if (!drain(out_pipe.read_end, err_pipe.read_end, result, deadline)) {
        kill(pid, SIGKILL);
        result.timed_out = true;
    }

    int status = 0;
    while (waitpid(pid, &status, 0) == -1) {
        if (errno != EINTR) {
            throw BorealisException(string_format("error.wait_failed", argv[0], std::string(strerror(errno))));
        }
    }
    result.exit_code = decode_status(status);
    return result;
}

std::optional<fs::path> find_executable(std::string_view name) {
    if (name.find('/') != std::string_view::npos) {
        fs::path path(name);
        if (access(path.c_str(), X_OK) == 0) return path;
        return std::nullopt;
    }
    const char* path_env = std::getenv("PATH");
    for (const auto& dir : split(path_env ? path_env : "/usr/local/bin:/usr/bin:/bin", ':')) {
        fs::path candidate = fs::path(dir) / name;
        if (access(candidate.c_str(), X_OK) == 0) return candidate;
    }
    return std::nullopt;
}

std::string shell_quote(std::string_view arg) {
    return "'" + replace_all(std::string(arg), "'", "'\\''") + "'";
}

std::vector<std::string> elevate(const std::vector<std::string>& argv) {
    if (geteuid() == 0) {
        return argv;
    }
    if (find_executable("sudo")) {
        std::vector<std::string> out = {"sudo"};
        out.insert(out.end(), argv.begin(), argv.end());
        return out;
    }
    std::vector<std::string> quoted;
    for (const auto& arg : argv) quoted.push_back(shell_quote(arg));
    return {"su", "-c", join(quoted, " ")};
}
