#include "docker_launcher.h"
#include "session_store.h"
#include "constants.h"
#include <iostream>
#include <sstream>
#include <iomanip>

namespace pyexec {

DockerLauncher::DockerLauncher(DockerLauncherConfig config) : config_(std::move(config)) {}

std::vector<std::string> DockerLauncher::build_command(const std::string& container_name,
                                                       const std::string& workspace_path,
                                                       const ResourceLimits& limits) const {
    std::ostringstream cpus;
    cpus << std::fixed << std::setprecision(2) << limits.cpu_share;
    std::string memory = std::to_string(limits.memory_mb) + "m";

    return {
        config_.docker_binary, "run",
        "--name", container_name,
        "--rm",
        "-i",
        "--memory", memory,
        "--memory-swap", memory,                    // No swap beyond the ceiling
        "--cpus", cpus.str(),
        "--pids-limit", std::to_string(limits.max_pids),
        "--network", "none",                        // Disable network access
        "--user", config_.user,
        "--cap-drop", "ALL",
        "--security-opt", "no-new-privileges",
        "-v", workspace_path + ":" + SESSION_MOUNT_PATH,
        "-w", SESSION_MOUNT_PATH,
        config_.image
    };
}

void DockerLauncher::ensure_image_available() {
    if (!config_.check_image) {
        return;
    }

    std::lock_guard<std::mutex> lock(image_mutex_);
    if (image_checked_) {
        return;
    }

    CommandResult result = run_command(
        {config_.docker_binary, "image", "inspect", "--format", "{{.Id}}", config_.image},
        30 * 1000);
    if (result.exit_code != 0) {
        throw ProvisionError("sandbox image '" + config_.image + "' is unavailable");
    }
    image_checked_ = true;
}

std::unique_ptr<SandboxHandle> DockerLauncher::launch(const WorkspaceHandle& workspace,
                                                      const ResourceLimits& limits) {
    ensure_image_available();

    std::string id = generate_sandbox_id();
    std::string container_name = "pyexec-" + id;

    SpawnOptions options;
    options.argv = build_command(container_name, workspace.path(), limits);

    auto child = ChildProcess::spawn(options);
    auto sandbox = std::make_unique<ProcessSandbox>(id, std::move(child));

    // Killing the client alone can leave the container running
    std::string docker = config_.docker_binary;
    sandbox->set_stop_hook([docker, container_name]() {
        // Non-zero exit means the container already exited and was removed
        CommandResult killed = run_command({docker, "kill", container_name}, TEARDOWN_GRACE_MS);
        if (killed.timed_out) {
            std::cerr << "[Sandbox] docker kill " << container_name << " timed out" << std::endl;
        }
    });

    std::cout << "[Sandbox] Launched container " << container_name
              << " (memory=" << limits.memory_mb << "MB, cpus=" << limits.cpu_share << ")"
              << std::endl;
    return sandbox;
}

} // namespace pyexec
