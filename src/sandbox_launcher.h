#pragma once

#include "execution_types.h"
#include "process.h"
#include <string>
#include <memory>
#include <vector>
#include <functional>

namespace pyexec {

class WorkspaceHandle;

// Handle to one live isolated execution context. The input stream carries
// guest code in; the output stream carries framed events out.
class SandboxHandle {
public:
    virtual ~SandboxHandle() = default;

    virtual const std::string& id() const = 0;
    virtual int input_fd() const = 0;
    virtual int output_fd() const = 0;

    // Sandbox runtime's own stderr, -1 when there is none
    virtual int diagnostic_fd() const { return -1; }

    virtual void close_input() = 0;
    virtual bool alive() = 0;

    // Forcibly stop and reclaim the context. Idempotent.
    virtual void terminate() = 0;
};

// Creates sandboxes. Backends (container runtime, namespaces) are
// interchangeable behind this interface.
class SandboxLauncher {
public:
    virtual ~SandboxLauncher() = default;

    // Throws ProvisionError when the context cannot be created
    virtual std::unique_ptr<SandboxHandle> launch(const WorkspaceHandle& workspace,
                                                  const ResourceLimits& limits) = 0;

    // Safe on dead or already torn-down handles
    virtual void teardown(SandboxHandle& handle) { handle.terminate(); }

    virtual std::string name() const = 0;
};

// Sandbox backed by a local child process (docker client or namespaced runner)
class ProcessSandbox : public SandboxHandle {
public:
    ProcessSandbox(std::string id, std::unique_ptr<ChildProcess> child);
    ~ProcessSandbox() override;

    const std::string& id() const override { return id_; }
    int input_fd() const override { return child_->stdin_fd(); }
    int output_fd() const override { return child_->stdout_fd(); }
    int diagnostic_fd() const override { return child_->stderr_fd(); }

    void close_input() override { child_->close_stdin(); }
    bool alive() override { return !terminated_ && child_->running(); }
    void terminate() override;

    // Runs before the process group is killed (e.g. docker kill)
    void set_stop_hook(std::function<void()> hook) { stop_hook_ = std::move(hook); }

    // Runs after the process is reaped, in reverse registration order
    void add_cleanup(std::function<void()> cleanup) { cleanups_.push_back(std::move(cleanup)); }

    bool terminated() const { return terminated_; }

private:
    std::string id_;
    std::unique_ptr<ChildProcess> child_;
    std::function<void()> stop_hook_;
    std::vector<std::function<void()>> cleanups_;
    bool terminated_ = false;
};

// Scoped acquisition of a sandbox: teardown runs exactly once when the guard
// leaves scope, on every exit path.
class SandboxGuard {
public:
    explicit SandboxGuard(SandboxLauncher& launcher) : launcher_(launcher) {}
    ~SandboxGuard();

    SandboxGuard(const SandboxGuard&) = delete;
    SandboxGuard& operator=(const SandboxGuard&) = delete;

    void acquire(std::unique_ptr<SandboxHandle> handle) { handle_ = std::move(handle); }

    // Tear down now instead of at scope exit; no-op without a handle
    void release();

    SandboxHandle* get() const { return handle_.get(); }
    explicit operator bool() const { return handle_ != nullptr; }

private:
    SandboxLauncher& launcher_;
    std::unique_ptr<SandboxHandle> handle_;
};

std::string generate_sandbox_id();

} // namespace pyexec
