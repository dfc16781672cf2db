#include <folio/process.hpp>
#include <folio/log.hpp>

#include <cerrno>
#include <chrono>
#include <cstring>
#include <thread>

#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <sys/wait.h>
#include <unistd.h>

namespace folio {

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
    CommandOptions options;
    options.working_dir = working_dir;
    options.timeout_seconds = timeout_seconds;
    return run_command(args, options);
}

Result<CommandResult> run_command(const std::vector<std::string>& args,
                                  const CommandOptions& options) {
    if (args.empty()) {
        return FolioError{FolioError::InvalidArg, "run_command: empty args"};
    }

    // Build argv for execvp
    std::vector<const char*> argv;
    argv.reserve(args.size() + 1);
    for (const auto& a : args) argv.push_back(a.c_str());
    argv.push_back(nullptr);

    int stdout_pipe[2];
    int stderr_pipe[2];

    if (pipe(stdout_pipe) != 0) {
        return FolioError{FolioError::IO,
            std::string("pipe() failed: ") + strerror(errno)};
    }
    if (pipe(stderr_pipe) != 0) {
        close(stdout_pipe[0]); close(stdout_pipe[1]);
        return FolioError{FolioError::IO,
            std::string("pipe() failed: ") + strerror(errno)};
    }

    pid_t pid = fork();
    if (pid < 0) {
        close(stdout_pipe[0]); close(stdout_pipe[1]);
        close(stderr_pipe[0]); close(stderr_pipe[1]);
        return FolioError{FolioError::IO,
            std::string("fork() failed: ") + strerror(errno)};
    }

    if (pid == 0) {
        // Child: new process group so timeouts can take down grandchildren
        setpgid(0, 0);

        close(stdout_pipe[0]);
        close(stderr_pipe[0]);

        int devnull = open("/dev/null", O_RDONLY);
        if (devnull >= 0) {
            dup2(devnull, STDIN_FILENO);
            close(devnull);
        }
        dup2(stdout_pipe[1], STDOUT_FILENO);
        dup2(stderr_pipe[1], STDERR_FILENO);
        close(stdout_pipe[1]);
        close(stderr_pipe[1]);

        if (!options.working_dir.empty()) {
            if (chdir(options.working_dir.c_str()) != 0) {
                _exit(127);
            }
        }

        execvp(argv[0], const_cast<char* const*>(argv.data()));
        _exit(127);  // execvp failed
    }

    // Parent: also set the group to close the race with the child's setpgid
    setpgid(pid, pid);
    if (options.on_spawn) options.on_spawn(pid);

    close(stdout_pipe[1]);
    close(stderr_pipe[1]);

    fcntl(stdout_pipe[0], F_SETFL, O_NONBLOCK);
    fcntl(stderr_pipe[0], F_SETFL, O_NONBLOCK);

    std::string out_buf, err_buf;
    auto start = std::chrono::steady_clock::now();

    while (true) {
        auto elapsed = std::chrono::steady_clock::now() - start;
        if (options.timeout_seconds > 0 &&
            std::chrono::duration_cast<std::chrono::seconds>(elapsed).count()
                >= options.timeout_seconds) {
            kill(-pid, SIGKILL);
            waitpid(pid, nullptr, 0);
            drain(stdout_pipe[0], out_buf);
            drain(stderr_pipe[0], err_buf);
            close(stdout_pipe[0]);
            close(stderr_pipe[0]);
            log::warn("command '%s' timed out after %ds, process group %d killed",
                      args[0].c_str(), options.timeout_seconds, static_cast<int>(pid));
            if (!options.timeout_is_error) {
                CommandResult result;
                result.exit_code = 128 + SIGKILL;
                result.signaled = true;
                result.timed_out = true;
                result.stdout_str = std::move(out_buf);
                result.stderr_str = std::move(err_buf);
                return Result<CommandResult>::ok(std::move(result));
            }
            return FolioError{FolioError::ExternalTool,
                "command '" + args[0] + "' timed out after " +
                std::to_string(options.timeout_seconds) + "s"};
        }

        struct pollfd fds[2] = {
            {stdout_pipe[0], POLLIN, 0},
            {stderr_pipe[0], POLLIN, 0},
        };
        poll(fds, 2, 20);

        drain(stdout_pipe[0], out_buf);
        drain(stderr_pipe[0], err_buf);

        int status = 0;
        pid_t w = waitpid(pid, &status, WNOHANG);
        if (w == pid) {
            drain(stdout_pipe[0], out_buf);
            drain(stderr_pipe[0], err_buf);
            close(stdout_pipe[0]);
            close(stderr_pipe[0]);

            CommandResult result;
            if (WIFEXITED(status)) {
                result.exit_code = WEXITSTATUS(status);
            } else if (WIFSIGNALED(status)) {
                result.signaled = true;
                result.exit_code = 128 + WTERMSIG(status);
            } else {
                result.exit_code = -1;
            }
            result.stdout_str = std::move(out_buf);
            result.stderr_str = std::move(err_buf);
            return Result<CommandResult>::ok(std::move(result));
        } else if (w < 0 && errno != EINTR) {
            close(stdout_pipe[0]);
            close(stderr_pipe[0]);
            return FolioError{FolioError::IO,
                std::string("waitpid failed: ") + strerror(errno)};
        }
    }
}

bool terminate_process_group(pid_t pgid, int grace_ms) {
    if (pgid <= 0) return false;
    if (kill(-pgid, SIGTERM) != 0) {
        return false;  // group already gone
    }
    log::debug("sent SIGTERM to process group %d", static_cast<int>(pgid));

    auto deadline = std::chrono::steady_clock::now() +
                    std::chrono::milliseconds(grace_ms);
    while (std::chrono::steady_clock::now() < deadline) {
        if (kill(-pgid, 0) != 0) return true;
        std::this_thread::sleep_for(std::chrono::milliseconds(20));
    }
    kill(-pgid, SIGKILL);
    log::warn("process group %d ignored SIGTERM, killed", static_cast<int>(pgid));
    return true;
}

} // namespace folio
