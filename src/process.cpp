#include "process.h"
#include "constants.h"
#include "execution_types.h"
#include <sys/wait.h>
#include <sys/types.h>
#include <sched.h>
#include <signal.h>
#include <unistd.h>
#include <fcntl.h>
#include <poll.h>
#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <chrono>
#include <thread>
#include <mutex>

namespace pyexec {

namespace {

constexpr size_t CLONE_STACK_SIZE = 1024 * 1024;

struct ChildContext {
    const SpawnOptions* options;
    int stdin_pipe[2];
    int stdout_pipe[2];
    int stderr_pipe[2];
    int sync_pipe[2];       // parent -> child: released to exec
    int exec_pipe[2];       // child -> parent: setup/exec failure text
};

[[noreturn]] void child_fail(int fd, const std::string& message) {
    ssize_t ignored = write(fd, message.data(), message.size());
    (void)ignored;
    _exit(127);
}

int child_main(void* arg) {
    auto* ctx = static_cast<ChildContext*>(arg);
    const SpawnOptions& options = *ctx->options;
    int report_fd = ctx->exec_pipe[1];

    close(ctx->sync_pipe[1]);
    char go = 0;
    if (read(ctx->sync_pipe[0], &go, 1) != 1) {
        _exit(127);     // parent abandoned the spawn
    }
    close(ctx->sync_pipe[0]);

    // Redirect stdio to pipes
    if (dup2(ctx->stdin_pipe[0], STDIN_FILENO) < 0 ||
        dup2(ctx->stdout_pipe[1], STDOUT_FILENO) < 0 ||
        dup2(ctx->stderr_pipe[1], STDERR_FILENO) < 0) {
        child_fail(report_fd, std::string("dup2: ") + std::strerror(errno));
    }

    setpgid(0, 0);

    if (!options.working_directory.empty() && chdir(options.working_directory.c_str()) != 0) {
        child_fail(report_fd, "chdir " + options.working_directory + ": " + std::strerror(errno));
    }

    if (options.before_exec) {
        std::string error = options.before_exec();
        if (!error.empty()) {
            child_fail(report_fd, error);
        }
    }

    if (options.clear_environment) {
        clearenv();
    }
    for (const auto& [key, value] : options.env) {
        setenv(key.c_str(), value.c_str(), 1);
    }

    std::vector<char*> argv;
    for (const auto& arg : options.argv) {
        argv.push_back(const_cast<char*>(arg.c_str()));
    }
    argv.push_back(nullptr);

    execvp(argv[0], argv.data());
    child_fail(report_fd, "exec " + options.argv[0] + ": " + std::strerror(errno));
}

void close_fd(int& fd) {
    if (fd >= 0) {
        close(fd);
        fd = -1;
    }
}

void close_pair(int fds[2]) {
    close_fd(fds[0]);
    close_fd(fds[1]);
}

} // namespace

void set_nonblocking(int fd) {
    int flags = fcntl(fd, F_GETFL, 0);
    if (flags >= 0) {
        fcntl(fd, F_SETFL, flags | O_NONBLOCK);
    }
}

std::unique_ptr<ChildProcess> ChildProcess::spawn(const SpawnOptions& options) {
    if (options.argv.empty()) {
        throw ProvisionError("empty command line");
    }

    // A child that dies mid-write must surface as EPIPE, not kill the service
    static std::once_flag sigpipe_once;
    std::call_once(sigpipe_once, [] { signal(SIGPIPE, SIG_IGN); });

    ChildContext ctx;
    ctx.options = &options;
    int* pipes[] = {ctx.stdin_pipe, ctx.stdout_pipe, ctx.stderr_pipe, ctx.sync_pipe, ctx.exec_pipe};
    for (int* p : pipes) {
        p[0] = p[1] = -1;
    }
    for (int* p : pipes) {
        if (pipe2(p, O_CLOEXEC) != 0) {
            std::string err = std::strerror(errno);
            for (int* q : pipes) close_pair(q);
            throw ProvisionError("cannot create pipes: " + err);
        }
    }

    pid_t pid;
    if (options.clone_flags != 0) {
        // Use clone for namespace creation
        char* stack = static_cast<char*>(malloc(CLONE_STACK_SIZE));
        if (!stack) {
            for (int* q : pipes) close_pair(q);
            throw ProvisionError("cannot allocate clone stack");
        }
        pid = clone(child_main, stack + CLONE_STACK_SIZE, options.clone_flags | SIGCHLD, &ctx);
        free(stack);
    } else {
        pid = fork();
        if (pid == 0) {
            _exit(child_main(&ctx));
        }
    }

    if (pid < 0) {
        std::string err = std::strerror(errno);
        for (int* q : pipes) close_pair(q);
        throw ProvisionError("cannot create child process: " + err);
    }

    // Parent keeps only its ends
    close_fd(ctx.stdin_pipe[0]);
    close_fd(ctx.stdout_pipe[1]);
    close_fd(ctx.stderr_pipe[1]);
    close_fd(ctx.sync_pipe[0]);
    close_fd(ctx.exec_pipe[1]);

    std::unique_ptr<ChildProcess> child(new ChildProcess());
    child->pid_ = pid;
    child->stdin_fd_ = ctx.stdin_pipe[1];
    child->stdout_fd_ = ctx.stdout_pipe[0];
    child->stderr_fd_ = ctx.stderr_pipe[0];

    setpgid(pid, pid);

    if (options.before_release) {
        try {
            options.before_release(pid);
        } catch (const std::exception& e) {
            close_fd(ctx.sync_pipe[1]);
            close_fd(ctx.exec_pipe[0]);
            child->kill_and_reap();
            throw ProvisionError(e.what());
        }
    }

    char go = 1;
    ssize_t released = write(ctx.sync_pipe[1], &go, 1);
    close_fd(ctx.sync_pipe[1]);

    // EOF on the exec pipe means exec succeeded (CLOEXEC closed it)
    std::string failure;
    char buffer[PIPE_BUFFER_SIZE];
    ssize_t n;
    while ((n = read(ctx.exec_pipe[0], buffer, sizeof(buffer))) != 0) {
        if (n < 0) {
            if (errno == EINTR) continue;
            break;
        }
        failure.append(buffer, n);
    }
    close_fd(ctx.exec_pipe[0]);

    if (released != 1 || !failure.empty()) {
        child->kill_and_reap();
        throw ProvisionError(failure.empty() ? "child did not start" : failure);
    }

    set_nonblocking(child->stdout_fd_);
    set_nonblocking(child->stderr_fd_);
    return child;
}

ChildProcess::~ChildProcess() {
    kill_and_reap();
}

void ChildProcess::close_stdin() {
    close_fd(stdin_fd_);
}

bool ChildProcess::running() {
    if (pid_ <= 0 || wait_status_) {
        return false;
    }
    int status = 0;
    pid_t r = waitpid(pid_, &status, WNOHANG);
    if (r == pid_) {
        wait_status_ = status;
        return false;
    }
    return r == 0;
}

bool ChildProcess::wait_for_exit(int timeout_ms) {
    auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(timeout_ms);
    while (running()) {
        if (std::chrono::steady_clock::now() >= deadline) {
            return false;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
    return true;
}

void ChildProcess::kill_and_reap() {
    if (pid_ > 0 && !wait_status_) {
        kill(-pid_, SIGKILL);
        kill(pid_, SIGKILL);
        int status = 0;
        while (waitpid(pid_, &status, 0) < 0 && errno == EINTR) {
        }
        wait_status_ = status;
    }
    close_fd(stdin_fd_);
    close_fd(stdout_fd_);
    close_fd(stderr_fd_);
}

CommandResult run_command(const std::vector<std::string>& argv, int timeout_ms) {
    CommandResult result;

    SpawnOptions options;
    options.argv = argv;

    std::unique_ptr<ChildProcess> child;
    try {
        child = ChildProcess::spawn(options);
    } catch (const ProvisionError& e) {
        result.output = e.what();
        return result;
    }
    child->close_stdin();

    auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(timeout_ms);
    bool out_open = true;
    bool err_open = true;
    char buffer[PIPE_BUFFER_SIZE];

    while (out_open || err_open) {
        auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
            deadline - std::chrono::steady_clock::now()).count();
        if (remaining <= 0) {
            result.timed_out = true;
            break;
        }

        struct pollfd fds[2];
        fds[0].fd = out_open ? child->stdout_fd() : -1;
        fds[0].events = POLLIN;
        fds[1].fd = err_open ? child->stderr_fd() : -1;
        fds[1].events = POLLIN;
        poll(fds, 2, static_cast<int>(remaining));

        for (int i = 0; i < 2; i++) {
            bool& open = (i == 0) ? out_open : err_open;
            if (!open || !(fds[i].revents & (POLLIN | POLLHUP | POLLERR))) {
                continue;
            }
            ssize_t n = read(fds[i].fd, buffer, sizeof(buffer));
            if (n > 0) {
                if (result.output.size() < MAX_HTTPS_RESPONSE) {
                    result.output.append(buffer, n);
                }
            } else if (n == 0 || (errno != EAGAIN && errno != EINTR)) {
                open = false;
            }
        }
    }

    if (result.timed_out) {
        child->kill_and_reap();
        return result;
    }

    child->wait_for_exit(timeout_ms);
    child->kill_and_reap();
    auto status = child->wait_status();
    if (status && WIFEXITED(*status)) {
        result.exit_code = WEXITSTATUS(*status);
    }
    return result;
}

} // namespace pyexec
