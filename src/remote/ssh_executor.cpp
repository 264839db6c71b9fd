/**
 * @file ssh_executor.cpp
 * @brief SshExecutor: child process plumbing with posix_spawn and poll.
 */

#include "remote/ssh_executor.hpp"

#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <spawn.h>
#include <sys/wait.h>
#include <unistd.h>

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <optional>
#include <utility>

extern char** environ;

namespace fleet_usage {

namespace {

constexpr size_t kStderrKeepBytes = 4096;

/// Owns one file descriptor.
class FileDescriptor {
public:
    FileDescriptor() = default;
    explicit FileDescriptor(int fd) noexcept : fd_(fd) {}
    ~FileDescriptor() { reset(); }

    FileDescriptor(const FileDescriptor&) = delete;
    FileDescriptor& operator=(const FileDescriptor&) = delete;
    FileDescriptor(FileDescriptor&& other) noexcept : fd_(std::exchange(other.fd_, -1)) {}
    FileDescriptor& operator=(FileDescriptor&& other) noexcept {
        if (this != &other) {
            reset();
            fd_ = std::exchange(other.fd_, -1);
        }
        return *this;
    }

    [[nodiscard]] int get() const noexcept { return fd_; }
    [[nodiscard]] bool valid() const noexcept { return fd_ >= 0; }

    void reset() noexcept {
        if (fd_ >= 0) ::close(fd_);
        fd_ = -1;
    }

private:
    int fd_{-1};
};

struct Pipe {
    FileDescriptor read_end;
    FileDescriptor write_end;
};

Result<Pipe> make_pipe() {
    int fds[2] = {-1, -1};
    if (::pipe2(fds, O_CLOEXEC) != 0) {
        return Error{ErrorKind::Connection, std::string{"pipe2 failed: "} + std::strerror(errno)};
    }
    return Pipe{FileDescriptor{fds[0]}, FileDescriptor{fds[1]}};
}

std::string errno_message(std::string_view what, int error) {
    return std::string{what} + ": " + std::strerror(error);
}

std::string trim_copy(const std::string& text) {
    const auto* ws = " \t\r\n";
    auto begin = text.find_first_not_of(ws);
    if (begin == std::string::npos) return {};
    auto end = text.find_last_not_of(ws);
    return text.substr(begin, end - begin + 1);
}

/// Reap the child; retries on EINTR.
int wait_child(pid_t pid) {
    int status = 0;
    while (::waitpid(pid, &status, 0) < 0) {
        if (errno != EINTR) return -1;
    }
    return status;
}

}  // anonymous namespace

std::string shell_quote(const std::string& word) {
    std::string quoted = "'";
    for (char c : word) {
        if (c == '\'') {
            quoted += "'\\''";
        } else {
            quoted += c;
        }
    }
    quoted += '\'';
    return quoted;
}

SshExecutor::SshExecutor(SshConfig config) : config_(std::move(config)) {}

std::vector<std::string> SshExecutor::argv_for(const std::string& host,
                                               const std::string& command) const {
    std::vector<std::string> argv;
    argv.reserve(config_.options.size() + 3);
    argv.push_back(config_.program);
    argv.insert(argv.end(), config_.options.begin(), config_.options.end());
    argv.push_back(host);
    argv.push_back(command);
    return argv;
}

Result<std::string> SshExecutor::run(const std::string& host,
                                     const std::string& command,
                                     std::chrono::milliseconds timeout) {
    auto out_pipe = make_pipe();
    if (!out_pipe) return out_pipe.error();
    auto err_pipe = make_pipe();
    if (!err_pipe) return err_pipe.error();

    // ── Spawn ────────────────────────────────
    posix_spawn_file_actions_t actions;
    if (int rc = ::posix_spawn_file_actions_init(&actions); rc != 0) {
        return Error{ErrorKind::Connection, errno_message("posix_spawn_file_actions_init", rc)};
    }
    int action_rc = ::posix_spawn_file_actions_addopen(&actions, STDIN_FILENO, "/dev/null",
                                                      O_RDONLY, 0);
    if (action_rc == 0) {
        action_rc = ::posix_spawn_file_actions_adddup2(&actions, out_pipe->write_end.get(),
                                                       STDOUT_FILENO);
    }
    if (action_rc == 0) {
        action_rc = ::posix_spawn_file_actions_adddup2(&actions, err_pipe->write_end.get(),
                                                       STDERR_FILENO);
    }
    if (action_rc != 0) {
        ::posix_spawn_file_actions_destroy(&actions);
        return Error{ErrorKind::Connection, errno_message("posix_spawn_file_actions", action_rc)};
    }

    auto args = argv_for(host, command);
    std::vector<char*> argv;
    argv.reserve(args.size() + 1);
    for (auto& arg : args) argv.push_back(arg.data());
    argv.push_back(nullptr);

    pid_t pid = 0;
    int spawn_rc = ::posix_spawnp(&pid, argv[0], &actions, nullptr, argv.data(), environ);
    ::posix_spawn_file_actions_destroy(&actions);
    if (spawn_rc != 0) {
        return Error{ErrorKind::Connection,
                     errno_message("could not start " + config_.program, spawn_rc)};
    }

    // The child holds its own copies now.
    out_pipe->write_end.reset();
    err_pipe->write_end.reset();

    // ── Drain until both pipes close or the deadline passes ──
    const auto deadline = std::chrono::steady_clock::now() + timeout;
    std::string out;
    std::string err;
    bool timed_out = false;
    bool overflow = false;
    std::optional<std::string> io_error;

    pollfd fds[2] = {
        {out_pipe->read_end.get(), POLLIN, 0},
        {err_pipe->read_end.get(), POLLIN, 0},
    };
    char buffer[8192];

    while (fds[0].fd >= 0 || fds[1].fd >= 0) {
        auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
            deadline - std::chrono::steady_clock::now());
        if (remaining.count() <= 0) {
            timed_out = true;
            break;
        }

        int ready = ::poll(fds, 2, static_cast<int>(remaining.count()));
        if (ready < 0) {
            if (errno == EINTR) continue;
            io_error = errno_message("poll failed", errno);
            break;
        }
        if (ready == 0) continue;

        for (int i = 0; i < 2; ++i) {
            if (fds[i].fd < 0 || fds[i].revents == 0) continue;
            auto n = ::read(fds[i].fd, buffer, sizeof(buffer));
            if (n < 0 && errno == EINTR) continue;
            if (n <= 0) {
                fds[i].fd = -1;  // EOF or error; stop polling this pipe
                continue;
            }
            if (i == 0) {
                out.append(buffer, static_cast<size_t>(n));
                if (out.size() > config_.max_output_bytes) overflow = true;
            } else if (err.size() < kStderrKeepBytes) {
                err.append(buffer, std::min(static_cast<size_t>(n), kStderrKeepBytes - err.size()));
            }
        }
        if (overflow) break;
    }

    if (timed_out || overflow || io_error) {
        ::kill(pid, SIGKILL);
    }
    int status = wait_child(pid);

    if (timed_out) {
        return Error{ErrorKind::Connection,
                     "timed out after " + std::to_string(timeout.count()) + " ms"};
    }
    if (overflow) {
        return Error{ErrorKind::Connection,
                     "output exceeded " + std::to_string(config_.max_output_bytes) + " bytes"};
    }
    if (io_error) {
        return Error{ErrorKind::Connection, *io_error};
    }
    if (status < 0) {
        return Error{ErrorKind::Connection, errno_message("waitpid failed", errno)};
    }

    if (WIFSIGNALED(status)) {
        return Error{ErrorKind::Connection,
                     "remote command killed by signal " + std::to_string(WTERMSIG(status))};
    }
    if (WIFEXITED(status) && WEXITSTATUS(status) != 0) {
        auto detail = trim_copy(err);
        std::string message = "exit status " + std::to_string(WEXITSTATUS(status));
        if (!detail.empty()) message += ": " + detail;
        return Error{ErrorKind::Connection, message};
    }
    return out;
}

}  // namespace fleet_usage
