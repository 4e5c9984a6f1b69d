#include <kunai/process.hpp>
#include <kunai/log.hpp>

#include <cerrno>
#include <chrono>
#include <cstring>

#include <fcntl.h>
#include <signal.h>
#include <sys/wait.h>
#include <unistd.h>

namespace kunai {

std::string command_line(const std::vector<std::string>& args) {
    std::string out;
    for (const auto& a : args) {
        if (!out.empty()) out += ' ';
        out += a;
    }
    return out;
}

static void close_pair(int fds[2]) {
    close(fds[0]);
    close(fds[1]);
}

static void drain(int fd, std::string& out) {
    char buf[4096];
    ssize_t n;
    while ((n = read(fd, buf, sizeof(buf))) > 0) {
        out.append(buf, static_cast<size_t>(n));
    }
}

Result<CommandResult> run_command(const std::vector<std::string>& args,
                                  const std::string& working_dir,
                                  int timeout_seconds) {
    if (args.empty()) {
        return KunaiError{KunaiError::InvalidArg, "run_command: empty args"};
    }

    const std::string full_command = command_line(args);

    // Build argv for execvp
    std::vector<const char*> argv;
    argv.reserve(args.size() + 1);
    for (const auto& a : args) argv.push_back(a.c_str());
    argv.push_back(nullptr);

    int stdout_pipe[2];
    int stderr_pipe[2];
    int exec_pipe[2];

    if (pipe(stdout_pipe) != 0) {
        return KunaiError{KunaiError::Spawn,
            "failed to execute command: " + full_command,
            std::string("pipe() failed: ") + strerror(errno)};
    }
    if (pipe(stderr_pipe) != 0) {
        close_pair(stdout_pipe);
        return KunaiError{KunaiError::Spawn,
            "failed to execute command: " + full_command,
            std::string("pipe() failed: ") + strerror(errno)};
    }
    // Closed automatically by a successful exec; carries errno otherwise
    if (pipe2(exec_pipe, O_CLOEXEC) != 0) {
        close_pair(stdout_pipe);
        close_pair(stderr_pipe);
        return KunaiError{KunaiError::Spawn,
            "failed to execute command: " + full_command,
            std::string("pipe2() failed: ") + strerror(errno)};
    }

    pid_t pid = fork();
    if (pid < 0) {
        int err = errno;
        close_pair(stdout_pipe);
        close_pair(stderr_pipe);
        close_pair(exec_pipe);
        return KunaiError{KunaiError::Spawn,
            "failed to execute command: " + full_command,
            std::string("fork() failed: ") + strerror(err)};
    }

    if (pid == 0) {
        // Child process
        close(stdout_pipe[0]);
        close(stderr_pipe[0]);
        close(exec_pipe[0]);

        dup2(stdout_pipe[1], STDOUT_FILENO);
        dup2(stderr_pipe[1], STDERR_FILENO);
        close(stdout_pipe[1]);
        close(stderr_pipe[1]);

        if (!working_dir.empty() && chdir(working_dir.c_str()) != 0) {
            int err = errno;
            (void)!write(exec_pipe[1], &err, sizeof(err));
            _exit(127);
        }

        execvp(argv[0], const_cast<char* const*>(argv.data()));
        int err = errno;
        (void)!write(exec_pipe[1], &err, sizeof(err));
        _exit(127);
    }

    // Parent process
    close(stdout_pipe[1]);
    close(stderr_pipe[1]);
    close(exec_pipe[1]);

    // Blocks until exec succeeds (EOF) or the child reports its errno
    int child_errno = 0;
    ssize_t got;
    do {
        got = read(exec_pipe[0], &child_errno, sizeof(child_errno));
    } while (got < 0 && errno == EINTR);
    close(exec_pipe[0]);

    if (got == static_cast<ssize_t>(sizeof(child_errno))) {
        waitpid(pid, nullptr, 0);
        close(stdout_pipe[0]);
        close(stderr_pipe[0]);
        return KunaiError{KunaiError::Spawn,
            "failed to execute command: " + full_command,
            strerror(child_errno)};
    }

    // Set non-blocking on read ends
    fcntl(stdout_pipe[0], F_SETFL, O_NONBLOCK);
    fcntl(stderr_pipe[0], F_SETFL, O_NONBLOCK);

    std::string out_buf, err_buf;
    auto start = std::chrono::steady_clock::now();

    while (true) {
        if (timeout_seconds > 0) {
            auto elapsed = std::chrono::steady_clock::now() - start;
            if (std::chrono::duration_cast<std::chrono::seconds>(elapsed).count()
                    >= timeout_seconds) {
                kill(pid, SIGKILL);
                waitpid(pid, nullptr, 0);
                close(stdout_pipe[0]);
                close(stderr_pipe[0]);
                return KunaiError{KunaiError::Timeout,
                    "command timed out after " + std::to_string(timeout_seconds) +
                    "s: " + full_command};
            }
        }

        drain(stdout_pipe[0], out_buf);
        drain(stderr_pipe[0], err_buf);

        int status = 0;
        pid_t w = waitpid(pid, &status, WNOHANG);
        if (w == pid) {
            drain(stdout_pipe[0], out_buf);
            drain(stderr_pipe[0], err_buf);

            close(stdout_pipe[0]);
            close(stderr_pipe[0]);

            int exit_code = WIFEXITED(status) ? WEXITSTATUS(status) : -1;
            log::trace("'%s' exited with %d", full_command.c_str(), exit_code);
            return Result<CommandResult>::ok(
                CommandResult{exit_code, std::move(out_buf), std::move(err_buf)});
        } else if (w < 0 && errno != EINTR) {
            int err = errno;
            close(stdout_pipe[0]);
            close(stderr_pipe[0]);
            return KunaiError{KunaiError::Spawn,
                "lost track of command: " + full_command,
                std::string("waitpid failed: ") + strerror(err)};
        }

        // Brief sleep to avoid busy-wait
        usleep(1000);  // 1ms
    }
}

} // namespace kunai
