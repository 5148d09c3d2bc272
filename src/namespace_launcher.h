#pragma once

#include "sandbox_launcher.h"
#include "constants.h"
#include <string>
#include <vector>

namespace pyexec {

struct NamespaceLauncherConfig {
    std::vector<std::string> runner;            // Guest runtime command
    // Host trees visible read-only inside the sandbox; missing ones are skipped
    std::vector<std::string> system_paths = {"/usr", "/bin", "/sbin", "/lib", "/lib64", "/lib32", "/etc"};
    std::string staging_root;                   // Where new roots are assembled, empty: temp dir
    std::string cgroup_root = CGROUP_ROOT;
    bool require_cgroups = true;                // Fail launch when limits cannot be applied
    bool seccomp = true;
    unsigned uid = SANDBOX_UID;
    unsigned gid = SANDBOX_GID;
};

// Entry of the sandbox's root filesystem, mirrored from the host
struct RootEntry {
    enum class Kind { DIRECTORY, FILE, SYMLINK };

    Kind kind;
    std::string source;     // Host path
    std::string target;     // Path inside the sandbox
    std::string link;       // Symlink contents
};

// Runs the guest runtime directly on the host inside fresh PID, mount, UTS,
// IPC and network namespaces, with cgroup v2 limits, rlimits, a seccomp
// filter and an unprivileged identity. The guest's root is a tmpfs holding
// read-only system trees, the runner's files and its own workspace only.
class NamespaceLauncher : public SandboxLauncher {
public:
    explicit NamespaceLauncher(NamespaceLauncherConfig config);

    std::unique_ptr<SandboxHandle> launch(const WorkspaceHandle& workspace,
                                          const ResourceLimits& limits) override;

    std::string name() const override { return "namespace"; }

    // Check whether this host lets us create the namespaces we need
    static bool test_system_capabilities();

    // What the guest's root is built from: system trees, then absolute runner
    // arguments that name files
    std::vector<RootEntry> root_entries() const;

private:
    // Returns false when cgroup v2 is unavailable
    bool setup_cgroup(const std::string& path, const ResourceLimits& limits) const;

    NamespaceLauncherConfig config_;
};

} // namespace pyexec
