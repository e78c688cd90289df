#include "util/command_runner.hpp"

#include <algorithm>
#include <array>
#include <cerrno>
#include <csignal>
#include <cstring>
#include <stdexcept>
#include <system_error>
#include <thread>

#include <fcntl.h>
#include <poll.h>
#include <sys/wait.h>
#include <unistd.h>

namespace ykmon::util {

namespace {

constexpr int kExecFailedExitCode = 127;

template <typename Call>
int retry_on_eintr(const Call& call) {
    int result = 0;
    do {
        result = call();
    } while (result < 0 && errno == EINTR);
    return result;
}

class Pipe {
public:
    Pipe() {
        if (::pipe2(fds_.data(), O_CLOEXEC) != 0) {
            throw std::system_error(errno, std::generic_category(), "pipe2");
        }
    }

    ~Pipe() {
        close_read();
        close_write();
    }

    Pipe(const Pipe&) = delete;
    Pipe& operator=(const Pipe&) = delete;

    int read_end() const { return fds_[0]; }
    int write_end() const { return fds_[1]; }

    void close_read() { close_fd(fds_[0]); }
    void close_write() { close_fd(fds_[1]); }

private:
    static void close_fd(int& fd) {
        if (fd >= 0) {
            ::close(fd);
            fd = -1;
        }
    }

    std::array<int, 2> fds_{-1, -1};
};

int wait_for_child(pid_t pid) {
    int status = 0;
    retry_on_eintr([&] { return static_cast<int>(::waitpid(pid, &status, 0)); });
    return status;
}

// Reaps the child before the deadline. Returns false once the deadline passed
// with the child still running.
bool wait_for_child_until(pid_t pid, std::chrono::steady_clock::time_point deadline, int& status) {
    constexpr auto kReapInterval = std::chrono::milliseconds(10);
    while (true) {
        const auto reaped = ::waitpid(pid, &status, WNOHANG);
        if (reaped == pid) {
            return true;
        }
        if (reaped < 0 && errno != EINTR) {
            throw std::system_error(errno, std::generic_category(), "waitpid");
        }
        const auto now = std::chrono::steady_clock::now();
        if (now >= deadline) {
            return false;
        }
        std::this_thread::sleep_for(std::min<std::chrono::steady_clock::duration>(kReapInterval, deadline - now));
    }
}

// Returns the errno reported by the child when execvp failed, 0 when exec succeeded.
int read_exec_error(int fd) {
    int child_errno = 0;
    const auto count = retry_on_eintr([&] { return static_cast<int>(::read(fd, &child_errno, sizeof(child_errno))); });
    return count == static_cast<int>(sizeof(child_errno)) ? child_errno : 0;
}

// Runs in the forked child; only async-signal-safe calls from here on.
[[noreturn]] void exec_child(const std::vector<char*>& args, Pipe& out, Pipe& err, Pipe& exec_status) {
    ::dup2(out.write_end(), STDOUT_FILENO);
    ::dup2(err.write_end(), STDERR_FILENO);
    const int devnull = ::open("/dev/null", O_RDONLY);
    if (devnull >= 0) {
        ::dup2(devnull, STDIN_FILENO);
    }

    ::execvp(args[0], args.data());
    const int exec_errno = errno;
    [[maybe_unused]] const auto written = ::write(exec_status.write_end(), &exec_errno, sizeof(exec_errno));
    ::_exit(kExecFailedExitCode);
}

}  // namespace

CommandResult run_command(const std::vector<std::string>& argv, std::chrono::milliseconds timeout) {
    if (argv.empty()) {
        throw std::invalid_argument("run_command requires a program name");
    }

    std::vector<char*> args;
    args.reserve(argv.size() + 1);
    for (const auto& arg : argv) {
        args.push_back(const_cast<char*>(arg.c_str()));
    }
    args.push_back(nullptr);

    Pipe out;
    Pipe err;
    Pipe exec_status;

    const pid_t pid = ::fork();
    if (pid < 0) {
        throw std::system_error(errno, std::generic_category(), "fork");
    }
    if (pid == 0) {
        exec_child(args, out, err, exec_status);
    }

    out.close_write();
    err.close_write();
    exec_status.close_write();

    CommandResult result;
    if (const int exec_errno = read_exec_error(exec_status.read_end()); exec_errno != 0) {
        wait_for_child(pid);
        if (exec_errno == ENOENT) {
            result.status = CommandResult::Status::NotFound;
        } else {
            result.status = CommandResult::Status::Exited;
            result.exit_code = kExecFailedExitCode;
            result.stderr_text = std::string("exec failed: ") + std::strerror(exec_errno);
        }
        return result;
    }

    const auto deadline = std::chrono::steady_clock::now() + timeout;
    std::array<pollfd, 2> fds{{{out.read_end(), POLLIN, 0}, {err.read_end(), POLLIN, 0}}};
    std::array<std::string*, 2> sinks{&result.stdout_text, &result.stderr_text};
    std::array<char, 4096> buffer{};
    int open_streams = 2;

    while (open_streams > 0) {
        const auto remaining =
            std::chrono::duration_cast<std::chrono::milliseconds>(deadline - std::chrono::steady_clock::now());
        if (remaining.count() <= 0) {
            ::kill(pid, SIGKILL);
            wait_for_child(pid);
            result.status = CommandResult::Status::TimedOut;
            return result;
        }

        const int ready = ::poll(fds.data(), fds.size(), static_cast<int>(remaining.count()));
        if (ready < 0) {
            if (errno == EINTR) {
                continue;
            }
            const int poll_errno = errno;
            ::kill(pid, SIGKILL);
            wait_for_child(pid);
            throw std::system_error(poll_errno, std::generic_category(), "poll");
        }

        for (std::size_t i = 0; i < fds.size(); ++i) {
            if (fds[i].fd < 0 || (fds[i].revents & (POLLIN | POLLHUP | POLLERR)) == 0) {
                continue;
            }
            const auto count = ::read(fds[i].fd, buffer.data(), buffer.size());
            if (count > 0) {
                sinks[i]->append(buffer.data(), static_cast<std::size_t>(count));
            } else if (count == 0 || errno != EINTR) {
                fds[i].fd = -1;
                --open_streams;
            }
        }
    }

    // Both streams are closed, but the child may still be running.
    int status = 0;
    if (!wait_for_child_until(pid, deadline, status)) {
        ::kill(pid, SIGKILL);
        wait_for_child(pid);
        result.status = CommandResult::Status::TimedOut;
        return result;
    }
    result.status = CommandResult::Status::Exited;
    if (WIFEXITED(status)) {
        result.exit_code = WEXITSTATUS(status);
    } else if (WIFSIGNALED(status)) {
        result.exit_code = 128 + WTERMSIG(status);
    }
    return result;
}

}  // namespace ykmon::util
