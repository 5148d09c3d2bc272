#pragma once

#include "sandbox_launcher.h"
#include <string>
#include <vector>
#include <mutex>

namespace pyexec {

struct DockerLauncherConfig {
    std::string docker_binary = "docker";
    std::string image = "ipython-executor";
    std::string user = "65534:65534";          // Non-privileged identity
    bool check_image = true;                    // docker image inspect before first launch
};

// Runs each sandbox as a throwaway container: no network, capped memory,
// CPU and pids, all capabilities dropped, workspace bind-mounted.
class DockerLauncher : public SandboxLauncher {
public:
    explicit DockerLauncher(DockerLauncherConfig config = DockerLauncherConfig{});

    std::unique_ptr<SandboxHandle> launch(const WorkspaceHandle& workspace,
                                          const ResourceLimits& limits) override;

    std::string name() const override { return "docker"; }

    // Full docker run command line for a container
    std::vector<std::string> build_command(const std::string& container_name,
                                           const std::string& workspace_path,
                                           const ResourceLimits& limits) const;

private:
    void ensure_image_available();

    DockerLauncherConfig config_;
    std::mutex image_mutex_;
    bool image_checked_ = false;
};

} // namespace pyexec
