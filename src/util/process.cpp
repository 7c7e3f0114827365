#include <strata/process.hpp>
#include <strata/log.hpp>

#include <chrono>
#include <cerrno>
#include <cstdio>
#include <cstring>
#include <fcntl.h>
#include <signal.h>
#include <sys/wait.h>
#include <unistd.h>

namespace strata {

namespace {

constexpr int kTermGraceMs = 2000;

void drain(int fd, std::string& into, FILE* log) {
    char buf[4096];
    ssize_t n;
    while ((n = read(fd, buf, sizeof(buf))) > 0) {
        into.append(buf, static_cast<size_t>(n));
        if (log) std::fwrite(buf, 1, static_cast<size_t>(n), log);
    }
}

// SIGTERM, then SIGKILL if the child ignores it for too long
void stop_child(pid_t pid) {
    kill(pid, SIGTERM);
    for (int waited = 0; waited < kTermGraceMs; waited += 10) {
        if (waitpid(pid, nullptr, WNOHANG) == pid) return;
        usleep(10000);
    }
    kill(pid, SIGKILL);
    waitpid(pid, nullptr, 0);
}

} // namespace

Result<CommandResult> run_command(const std::vector<std::string>& args,
                                  const CommandOptions& opts) {
    if (args.empty()) {
        return StrataError{StrataError::InvalidArg, "run_command: empty args"};
    }

    std::vector<const char*> argv;
    argv.reserve(args.size() + 1);
    for (const auto& a : args) argv.push_back(a.c_str());
    argv.push_back(nullptr);

    FILE* log_fp = nullptr;
    if (!opts.log_file.empty()) {
        log_fp = std::fopen(opts.log_file.c_str(), "a");
        if (!log_fp) {
            return StrataError{StrataError::IO,
                "cannot open log file " + opts.log_file.string() + ": " + strerror(errno)};
        }
    }
    auto close_log = [&]() {
        if (log_fp) { std::fclose(log_fp); log_fp = nullptr; }
    };

    int stdout_pipe[2];
    int stderr_pipe[2];
    if (pipe(stdout_pipe) != 0) {
        close_log();
        return StrataError{StrataError::IO,
            std::string("pipe() failed: ") + strerror(errno)};
    }
    if (pipe(stderr_pipe) != 0) {
        close(stdout_pipe[0]); close(stdout_pipe[1]);
        close_log();
        return StrataError{StrataError::IO,
            std::string("pipe() failed: ") + strerror(errno)};
    }

    std::fflush(nullptr);
    pid_t pid = fork();
    if (pid < 0) {
        close(stdout_pipe[0]); close(stdout_pipe[1]);
        close(stderr_pipe[0]); close(stderr_pipe[1]);
        close_log();
        return StrataError{StrataError::IO,
            std::string("fork() failed: ") + strerror(errno)};
    }

    if (pid == 0) {
        close(stdout_pipe[0]);
        close(stderr_pipe[0]);
        dup2(stdout_pipe[1], STDOUT_FILENO);
        dup2(stderr_pipe[1], STDERR_FILENO);
        close(stdout_pipe[1]);
        close(stderr_pipe[1]);

        int devnull = open("/dev/null", O_RDONLY);
        if (devnull >= 0) {
            dup2(devnull, STDIN_FILENO);
            close(devnull);
        }

        if (!opts.working_dir.empty() && chdir(opts.working_dir.c_str()) != 0) {
            _exit(127);
        }
        execvp(argv[0], const_cast<char* const*>(argv.data()));
        _exit(127);
    }

    close(stdout_pipe[1]);
    close(stderr_pipe[1]);
    fcntl(stdout_pipe[0], F_SETFL, O_NONBLOCK);
    fcntl(stderr_pipe[0], F_SETFL, O_NONBLOCK);

    auto finish = [&]() {
        close(stdout_pipe[0]);
        close(stderr_pipe[0]);
        close_log();
    };

    CommandResult result;
    auto start = std::chrono::steady_clock::now();

    while (true) {
        if (opts.cancel && opts.cancel->is_cancelled()) {
            log::debug("cancelling '%s' (pid %d)", args[0].c_str(), static_cast<int>(pid));
            stop_child(pid);
            finish();
            return StrataError{StrataError::Cancelled,
                "command '" + args[0] + "' was cancelled"};
        }
        if (opts.timeout_seconds > 0) {
            auto elapsed = std::chrono::steady_clock::now() - start;
            if (std::chrono::duration_cast<std::chrono::seconds>(elapsed).count()
                    >= opts.timeout_seconds) {
                stop_child(pid);
                finish();
                return StrataError{StrataError::IO,
                    "command '" + args[0] + "' timed out after "
                    + std::to_string(opts.timeout_seconds) + "s"};
            }
        }

        drain(stdout_pipe[0], result.stdout_str, log_fp);
        drain(stderr_pipe[0], result.stderr_str, log_fp);

        int status = 0;
        pid_t w = waitpid(pid, &status, WNOHANG);
        if (w == pid) {
            drain(stdout_pipe[0], result.stdout_str, log_fp);
            drain(stderr_pipe[0], result.stderr_str, log_fp);
            finish();
            if (WIFEXITED(status)) {
                result.exit_code = WEXITSTATUS(status);
            } else if (WIFSIGNALED(status)) {
                result.exit_code = 128 + WTERMSIG(status);
            } else {
                result.exit_code = -1;
            }
            return Result<CommandResult>::ok(std::move(result));
        }
        if (w < 0) {
            int err = errno;
            finish();
            return StrataError{StrataError::IO,
                std::string("waitpid failed: ") + strerror(err)};
        }

        usleep(1000);
    }
}

} // namespace strata
