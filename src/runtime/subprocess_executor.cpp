#include "runtime/subprocess_executor.hpp"

#include <cerrno>
#include <chrono>
#include <cstring>
#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <sys/wait.h>
#include <unistd.h>
#include "core/logging/logger.hpp"

namespace mcptools::runtime {

using protocol::CommandResult;

namespace {

enum class SpawnStage : int {
    Chdir = 1,
    Stdin = 2,
    Exec = 3
};

struct SpawnFailure {
    int stage = 0;
    int error_number = 0;
};

// Bytes read from a pipe beyond this grace period after a kill are not waited for.
constexpr std::int64_t kPostKillGraceMs = 1000;

void set_nonblocking(const int fd) {
    const int flags = fcntl(fd, F_GETFL, 0);
    if (flags == -1) {
        return;
    }
    static_cast<void>(fcntl(fd, F_SETFL, flags | O_NONBLOCK));
}

void close_fd(int& fd) {
    if (fd >= 0) {
        static_cast<void>(close(fd));
        fd = -1;
    }
}

// Reads whatever is available. Bytes past `cap` are consumed and dropped so
// the child never blocks on a full pipe.
void drain_pipe(int& fd, std::string& out, const std::size_t cap, bool& truncated) {
    if (fd < 0) {
        return;
    }

    char buffer[4096];
    while (true) {
        const ssize_t n = read(fd, buffer, sizeof(buffer));
        if (n > 0) {
            const auto count = static_cast<std::size_t>(n);
            if (out.size() < cap) {
                const std::size_t room = cap - out.size();
                out.append(buffer, count < room ? count : room);
                if (count > room) {
                    truncated = true;
                }
            } else {
                truncated = true;
            }
            continue;
        }
        if (n == 0) {
            close_fd(fd);
            return;
        }
        if (errno == EINTR) {
            continue;
        }
        if (errno == EAGAIN || errno == EWOULDBLOCK) {
            return;
        }
        close_fd(fd);
        return;
    }
}

std::string describe_spawn_failure(const CommandSpec& spec, const SpawnFailure& failure) {
    const std::string reason = std::strerror(failure.error_number);
    switch (static_cast<SpawnStage>(failure.stage)) {
        case SpawnStage::Chdir:
            return "failed to enter working directory '" +
                   spec.working_directory.string() + "': " + reason;
        case SpawnStage::Stdin:
            return "failed to redirect stdin for '" + spec.program + "': " + reason;
        case SpawnStage::Exec:
        default:
            return "failed to start '" + spec.program + "': " + reason;
    }
}

CommandResult spawn_failure_result(const std::string& message) {
    CommandResult result;
    result.status = SubprocessExecutor::kSpawnFailureStatus;
    result.stderr_text = message;
    return result;
}

}  // namespace

std::string to_display_string(const CommandSpec& spec) {
    std::string text = spec.program;
    for (const auto& arg : spec.args) {
        text += " " + arg;
    }
    return text;
}

SubprocessExecutor::SubprocessExecutor(const std::uint32_t default_timeout_ms,
                                       const std::size_t output_cap_bytes)
    : default_timeout_ms_(default_timeout_ms), output_cap_bytes_(output_cap_bytes) {}

CommandResult SubprocessExecutor::run(const CommandSpec& spec) const {
    if (spec.program.empty()) {
        return spawn_failure_result("no program given");
    }

    const std::uint32_t timeout_ms =
        spec.timeout_ms > 0 ? spec.timeout_ms : default_timeout_ms_;

    // Everything the child touches is prepared before fork.
    std::vector<std::string> argv_storage;
    argv_storage.reserve(spec.args.size() + 1);
    argv_storage.push_back(spec.program);
    for (const auto& arg : spec.args) {
        argv_storage.push_back(arg);
    }
    std::vector<char*> argv;
    argv.reserve(argv_storage.size() + 1);
    for (auto& arg : argv_storage) {
        argv.push_back(arg.data());
    }
    argv.push_back(nullptr);
    const std::string cwd = spec.working_directory.string();

    int stdout_pipe[2] = {-1, -1};
    int stderr_pipe[2] = {-1, -1};
    int status_pipe[2] = {-1, -1};
    if (pipe2(stdout_pipe, O_CLOEXEC) != 0 || pipe2(stderr_pipe, O_CLOEXEC) != 0 ||
        pipe2(status_pipe, O_CLOEXEC) != 0) {
        const std::string reason = std::strerror(errno);
        for (int* fds : {stdout_pipe, stderr_pipe, status_pipe}) {
            close_fd(fds[0]);
            close_fd(fds[1]);
        }
        return spawn_failure_result("failed to create process pipes: " + reason);
    }

    MCPTOOLS_LOG_DEBUG("exec: " + to_display_string(spec) + " (cwd=" + cwd + ")");

    const auto started = std::chrono::steady_clock::now();
    const pid_t pid = fork();
    if (pid < 0) {
        const std::string reason = std::strerror(errno);
        for (int* fds : {stdout_pipe, stderr_pipe, status_pipe}) {
            close_fd(fds[0]);
            close_fd(fds[1]);
        }
        return spawn_failure_result("failed to fork process: " + reason);
    }

    if (pid == 0) {
        static_cast<void>(setpgid(0, 0));
        SpawnFailure failure;

        const int null_fd = open("/dev/null", O_RDONLY);
        if (null_fd < 0 || dup2(null_fd, STDIN_FILENO) < 0) {
            failure = SpawnFailure{static_cast<int>(SpawnStage::Stdin), errno};
            static_cast<void>(write(status_pipe[1], &failure, sizeof(failure)));
            _exit(127);
        }
        if (null_fd > STDERR_FILENO) {
            static_cast<void>(close(null_fd));
        }
        if (!cwd.empty() && chdir(cwd.c_str()) != 0) {
            failure = SpawnFailure{static_cast<int>(SpawnStage::Chdir), errno};
            static_cast<void>(write(status_pipe[1], &failure, sizeof(failure)));
            _exit(126);
        }
        static_cast<void>(dup2(stdout_pipe[1], STDOUT_FILENO));
        static_cast<void>(dup2(stderr_pipe[1], STDERR_FILENO));
        execvp(argv[0], argv.data());
        failure = SpawnFailure{static_cast<int>(SpawnStage::Exec), errno};
        static_cast<void>(write(status_pipe[1], &failure, sizeof(failure)));
        _exit(127);
    }

    static_cast<void>(setpgid(pid, pid));
    close_fd(stdout_pipe[1]);
    close_fd(stderr_pipe[1]);
    close_fd(status_pipe[1]);

    // The status pipe closes on a successful exec, so this read returns 0.
    SpawnFailure failure;
    ssize_t status_bytes = 0;
    do {
        status_bytes = read(status_pipe[0], &failure, sizeof(failure));
    } while (status_bytes < 0 && errno == EINTR);
    close_fd(status_pipe[0]);

    if (status_bytes == static_cast<ssize_t>(sizeof(failure))) {
        int ignored = 0;
        static_cast<void>(waitpid(pid, &ignored, 0));
        close_fd(stdout_pipe[0]);
        close_fd(stderr_pipe[0]);
        MCPTOOLS_LOG_WARN("exec failed: " + describe_spawn_failure(spec, failure));
        return spawn_failure_result(describe_spawn_failure(spec, failure));
    }

    set_nonblocking(stdout_pipe[0]);
    set_nonblocking(stderr_pipe[0]);

    CommandResult capture;
    bool child_exited = false;
    int status = 0;
    std::chrono::steady_clock::time_point killed_at;

    while (stdout_pipe[0] >= 0 || stderr_pipe[0] >= 0 || !child_exited) {
        const auto now = std::chrono::steady_clock::now();
        const auto elapsed =
            std::chrono::duration_cast<std::chrono::milliseconds>(now - started).count();
        // The deadline also applies after the child exits: a background
        // process left in its group can hold the pipes open indefinitely.
        if (!capture.timed_out && timeout_ms > 0 &&
            elapsed > static_cast<std::int64_t>(timeout_ms)) {
            capture.timed_out = true;
            killed_at = now;
            static_cast<void>(kill(-pid, SIGKILL));
            if (!child_exited) {
                static_cast<void>(kill(pid, SIGKILL));
            }
        }

        // A process that escaped the group may still hold the pipes open.
        if (capture.timed_out &&
            std::chrono::duration_cast<std::chrono::milliseconds>(now - killed_at).count() >
                kPostKillGraceMs) {
            close_fd(stdout_pipe[0]);
            close_fd(stderr_pipe[0]);
        }

        pollfd fds[2];
        nfds_t nfds = 0;
        if (stdout_pipe[0] >= 0) {
            fds[nfds].fd = stdout_pipe[0];
            fds[nfds].events = POLLIN;
            ++nfds;
        }
        if (stderr_pipe[0] >= 0) {
            fds[nfds].fd = stderr_pipe[0];
            fds[nfds].events = POLLIN;
            ++nfds;
        }

        if (nfds > 0) {
            static_cast<void>(poll(fds, nfds, 50));
        } else if (!child_exited) {
            static_cast<void>(poll(nullptr, 0, 20));
        }

        drain_pipe(stdout_pipe[0], capture.stdout_text, output_cap_bytes_, capture.truncated);
        drain_pipe(stderr_pipe[0], capture.stderr_text, output_cap_bytes_, capture.truncated);

        if (!child_exited) {
            const pid_t waited = waitpid(pid, &status, WNOHANG);
            if (waited == pid) {
                child_exited = true;
            }
        }
    }

    if (!child_exited) {
        static_cast<void>(waitpid(pid, &status, 0));
    }

    if (capture.timed_out) {
        capture.status = kTimeoutStatus;
        if (!capture.stderr_text.empty() && capture.stderr_text.back() != '\n') {
            capture.stderr_text += "\n";
        }
        capture.stderr_text +=
            "Command timed out after " + std::to_string(timeout_ms) + " ms.";
    } else if (WIFEXITED(status)) {
        capture.status = WEXITSTATUS(status);
    } else if (WIFSIGNALED(status)) {
        capture.status = 128 + WTERMSIG(status);
    } else {
        capture.status = -1;
    }

    const auto ended = std::chrono::steady_clock::now();
    capture.duration_ms =
        std::chrono::duration<double, std::milli>(ended - started).count();
    MCPTOOLS_LOG_DEBUG("exec done: " + spec.program + " status=" +
                       std::to_string(capture.status));
    return capture;
}

bool SubprocessExecutor::is_available(const std::string& program,
                                      const std::filesystem::path& working_directory) const {
    CommandSpec probe;
    probe.program = program;
    probe.args = {"--version"};
    probe.working_directory = working_directory;
    probe.timeout_ms = 5000;
    return run(probe).status == 0;
}

}  // namespace mcptools::runtime
