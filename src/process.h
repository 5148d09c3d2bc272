#pragma once

#include <string>
#include <vector>
#include <map>
#include <memory>
#include <optional>
#include <functional>
#include <sys/types.h>

namespace pyexec {

struct SpawnOptions {
    std::vector<std::string> argv;
    std::map<std::string, std::string> env;         // Added to (or replacing) the environment
    bool clear_environment = false;
    std::string working_directory;                  // Empty: inherit
    int clone_flags = 0;                            // CLONE_NEW* namespaces, 0 for plain fork

    // Runs in the parent after the child exists but before it may exec
    // (uid maps, cgroup attach). Throwing aborts the spawn.
    std::function<void(pid_t)> before_release;

    // Runs in the child after stdio redirection, right before exec. Returns
    // an error message to abort, or empty to continue.
    std::function<std::string()> before_exec;
};

// A child process with piped stdin, stdout and stderr. Destruction kills and
// reaps the whole process group if it is still running.
class ChildProcess {
public:
    // Throws ProvisionError if the child cannot be created or exec fails
    static std::unique_ptr<ChildProcess> spawn(const SpawnOptions& options);

    ~ChildProcess();

    ChildProcess(const ChildProcess&) = delete;
    ChildProcess& operator=(const ChildProcess&) = delete;

    pid_t pid() const { return pid_; }
    int stdin_fd() const { return stdin_fd_; }
    int stdout_fd() const { return stdout_fd_; }
    int stderr_fd() const { return stderr_fd_; }

    void close_stdin();

    // Non-blocking liveness check (reaps on exit)
    bool running();

    // SIGKILL the process group and reap. Safe to call repeatedly.
    void kill_and_reap();

    // Block up to timeout_ms for exit; true if the child has exited
    bool wait_for_exit(int timeout_ms);

    // Raw wait status once reaped
    std::optional<int> wait_status() const { return wait_status_; }

private:
    ChildProcess() = default;

    pid_t pid_ = -1;
    int stdin_fd_ = -1;
    int stdout_fd_ = -1;
    int stderr_fd_ = -1;
    std::optional<int> wait_status_;
};

// Run a command to completion, capturing combined output. Used for short
// control commands (docker kill, docker image inspect).
struct CommandResult {
    int exit_code = -1;
    std::string output;
    bool timed_out = false;
};

CommandResult run_command(const std::vector<std::string>& argv, int timeout_ms);

void set_nonblocking(int fd);

} // namespace pyexec
