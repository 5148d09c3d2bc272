#include "namespace_launcher.h"
#include "session_store.h"
#include "constants.h"
#include <sys/wait.h>
#include <sys/resource.h>
#include <sys/mount.h>
#include <sys/stat.h>
#include <sys/prctl.h>
#include <sys/statvfs.h>
#include <sys/syscall.h>
#include <unistd.h>
#include <sched.h>
#include <signal.h>
#include <seccomp.h>
#include <fcntl.h>
#include <grp.h>
#include <cerrno>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <stdexcept>

namespace fs = std::filesystem;

namespace pyexec {

namespace {

std::string errno_message(const std::string& what) {
    return what + ": " + std::strerror(errno);
}

bool write_file(const std::string& path, const std::string& value) {
    std::ofstream out(path);
    if (!out.is_open()) {
        return false;
    }
    out << value;
    out.flush();
    return out.good();
}

// Runs in the child, inside the new namespaces
std::string apply_resource_limits(const ResourceLimits& limits) {
    struct rlimit limit;

    // Memory limit (address space backstop for the cgroup ceiling)
    limit.rlim_cur = limit.rlim_max = limits.memory_mb * 1024 * 1024;
    if (setrlimit(RLIMIT_AS, &limit) != 0) {
        return errno_message("setrlimit(RLIMIT_AS)");
    }

    // File descriptor limit
    limit.rlim_cur = limit.rlim_max = MAX_OPEN_FILES;
    if (setrlimit(RLIMIT_NOFILE, &limit) != 0) {
        return errno_message("setrlimit(RLIMIT_NOFILE)");
    }

    // No core dumps
    limit.rlim_cur = limit.rlim_max = 0;
    setrlimit(RLIMIT_CORE, &limit);
    return "";
}

// mkdir -p, for paths inside the staging root
std::string make_directories(const std::string& path) {
    for (size_t pos = path.find('/', 1); ; pos = path.find('/', pos + 1)) {
        std::string prefix = pos == std::string::npos ? path : path.substr(0, pos);
        if (mkdir(prefix.c_str(), 0755) != 0 && errno != EEXIST) {
            return errno_message("mkdir " + prefix);
        }
        if (pos == std::string::npos) {
            return "";
        }
    }
}

// A read-only bind remount must repeat the flags the source mount is locked
// with, or a user namespace refuses it
std::string remount_read_only(const std::string& target) {
    struct statvfs info;
    if (statvfs(target.c_str(), &info) != 0) {
        return errno_message("statvfs " + target);
    }
    unsigned long flags = MS_REMOUNT | MS_BIND | MS_RDONLY;
    if (info.f_flag & ST_NOSUID) flags |= MS_NOSUID;
    if (info.f_flag & ST_NODEV) flags |= MS_NODEV;
    if (info.f_flag & ST_NOEXEC) flags |= MS_NOEXEC;
    if (info.f_flag & ST_NOATIME) flags |= MS_NOATIME;
    if (info.f_flag & ST_NODIRATIME) flags |= MS_NODIRATIME;
    if (info.f_flag & ST_RELATIME) flags |= MS_RELATIME;
    if (mount(nullptr, target.c_str(), nullptr, flags, nullptr) != 0) {
        return errno_message("remount read-only " + target);
    }
    return "";
}

std::string bind_entry(const std::string& new_root, const RootEntry& entry) {
    std::string target = new_root + entry.target;
    std::string parent = target.substr(0, target.rfind('/'));
    std::string error = make_directories(parent);
    if (!error.empty()) {
        return error;
    }

    switch (entry.kind) {
        case RootEntry::Kind::SYMLINK:
            if (symlink(entry.link.c_str(), target.c_str()) != 0) {
                return errno_message("symlink " + entry.target);
            }
            return "";
        case RootEntry::Kind::DIRECTORY:
            if (mkdir(target.c_str(), 0755) != 0 && errno != EEXIST) {
                return errno_message("mkdir " + entry.target);
            }
            break;
        case RootEntry::Kind::FILE: {
            int fd = open(target.c_str(), O_CREAT | O_WRONLY | O_CLOEXEC, 0644);
            if (fd < 0) {
                return errno_message("create " + entry.target);
            }
            close(fd);
            break;
        }
    }

    if (mount(entry.source.c_str(), target.c_str(), nullptr, MS_BIND | MS_REC, nullptr) != 0) {
        return errno_message("bind " + entry.source);
    }
    return remount_read_only(target);
}

// Runs in the child, inside the new mount namespace. Builds a tmpfs root
// holding the read-only entries, a few device nodes and the workspace, then
// pivots into it. Nothing else of the host stays reachable.
std::string setup_filesystem(const std::string& new_root, const std::vector<RootEntry>& entries,
                             const std::string& workspace) {
    // Keep our mounts out of the host namespace
    if (mount(nullptr, "/", nullptr, MS_REC | MS_PRIVATE, nullptr) != 0) {
        return errno_message("make mounts private");
    }
    if (mount("tmpfs", new_root.c_str(), "tmpfs", MS_NOSUID | MS_NODEV, "size=16m,mode=755") != 0) {
        return errno_message("mount root tmpfs");
    }

    for (const auto& entry : entries) {
        std::string error = bind_entry(new_root, entry);
        if (!error.empty()) {
            return error;
        }
    }

    std::string error = make_directories(new_root + "/dev");
    if (!error.empty()) {
        return error;
    }
    for (std::string device : {"/dev/null", "/dev/zero", "/dev/random", "/dev/urandom"}) {
        std::string target = new_root + device;
        int fd = open(target.c_str(), O_CREAT | O_WRONLY | O_CLOEXEC, 0666);
        if (fd < 0) {
            return errno_message("create " + device);
        }
        close(fd);
        if (mount(device.c_str(), target.c_str(), nullptr, MS_BIND, nullptr) != 0) {
            return errno_message("bind " + device);
        }
    }

    // The workspace is the only writable host directory
    std::string session = new_root + SESSION_MOUNT_PATH;
    error = make_directories(session);
    if (error.empty()) error = make_directories(new_root + "/tmp");
    if (error.empty()) error = make_directories(new_root + "/proc");
    if (!error.empty()) {
        return error;
    }
    if (mount(workspace.c_str(), session.c_str(), nullptr, MS_BIND, nullptr) != 0) {
        return errno_message("bind workspace");
    }

    std::string old_root = new_root + "/.old_root";
    if (mkdir(old_root.c_str(), 0700) != 0) {
        return errno_message("mkdir old root");
    }
    if (syscall(SYS_pivot_root, new_root.c_str(), old_root.c_str()) != 0) {
        return errno_message("pivot_root");
    }
    if (chdir("/") != 0) {
        return errno_message("chdir new root");
    }
    if (umount2("/.old_root", MNT_DETACH) != 0) {
        return errno_message("detach old root");
    }
    rmdir("/.old_root");

    if (mount("tmpfs", "/tmp", "tmpfs", MS_NOSUID | MS_NODEV, "size=100m,mode=1777") != 0) {
        return errno_message("mount /tmp");
    }
    if (chmod("/home/user", 0777) != 0) {
        return errno_message("chmod home");
    }

    // /proc for the new PID namespace; failure only affects guest introspection
    mount("proc", "/proc", "proc", MS_NOSUID | MS_NODEV | MS_NOEXEC, nullptr);

    if (chdir(SESSION_MOUNT_PATH) != 0) {
        return errno_message("chdir session");
    }
    return "";
}

std::string drop_privileges(unsigned uid, unsigned gid) {
    if (setgroups(0, nullptr) != 0) {
        return errno_message("setgroups");
    }
    if (setgid(gid) != 0) {
        return errno_message("setgid");
    }
    if (setuid(uid) != 0) {
        return errno_message("setuid");
    }
    return "";
}

// Syscalls a Python interpreter, its threads and its child processes need.
// Names unknown on this architecture are skipped.
const char* const ALLOWED_SYSCALLS[] = {
    // I/O
    "read", "write", "readv", "writev", "pread64", "pwrite64", "preadv", "pwritev",
    "open", "openat", "close", "close_range", "lseek", "ioctl", "fcntl", "flock",
    "dup", "dup2", "dup3", "pipe", "pipe2", "fsync", "fdatasync", "ftruncate", "truncate",
    "sendfile", "copy_file_range", "splice", "fadvise64", "fallocate", "readahead",
    "poll", "ppoll", "select", "pselect6", "epoll_create", "epoll_create1", "epoll_ctl",
    "epoll_wait", "epoll_pwait", "eventfd", "eventfd2", "timerfd_create",
    "timerfd_settime", "timerfd_gettime", "signalfd", "signalfd4",
    // Files and directories
    "stat", "fstat", "lstat", "newfstatat", "statx", "statfs", "fstatfs",
    "access", "faccessat", "faccessat2", "getdents", "getdents64", "getcwd",
    "chdir", "fchdir", "rename", "renameat", "renameat2", "mkdir", "mkdirat", "rmdir",
    "unlink", "unlinkat", "link", "linkat", "symlink", "symlinkat", "readlink",
    "readlinkat", "chmod", "fchmod", "fchmodat", "umask", "utime", "utimes",
    "utimensat", "futimesat", "memfd_create",
    // Memory
    "brk", "mmap", "munmap", "mprotect", "mremap", "madvise", "mincore", "msync",
    "membarrier", "get_mempolicy",
    // Processes and threads
    "clone", "clone3", "fork", "vfork", "execve", "execveat", "wait4", "waitid",
    "exit", "exit_group", "kill", "tgkill", "tkill", "pidfd_open", "pidfd_send_signal",
    "futex", "set_robust_list", "get_robust_list", "set_tid_address", "rseq",
    "sched_yield", "sched_getaffinity", "sched_getparam", "sched_getscheduler",
    "getpid", "getppid", "gettid", "getuid", "geteuid", "getgid", "getegid",
    "getgroups", "getresuid", "getresgid", "getpgrp", "getpgid", "setpgid",
    "setsid", "getsid", "getrlimit", "prlimit64", "getrusage", "capget",
    "arch_prctl", "prctl", "getcpu",
    // Signals and time
    "rt_sigaction", "rt_sigprocmask", "rt_sigreturn", "rt_sigsuspend",
    "rt_sigtimedwait", "rt_sigqueueinfo", "sigaltstack", "restart_syscall",
    "pause", "alarm", "getitimer", "setitimer", "nanosleep", "clock_nanosleep",
    "clock_gettime", "clock_getres", "gettimeofday", "time", "times",
    // System information
    "uname", "sysinfo", "getrandom",
    // Sockets; the network namespace has nothing but a down loopback
    "socket", "socketpair", "connect", "bind", "listen", "accept", "accept4",
    "sendto", "recvfrom", "sendmsg", "recvmsg", "shutdown", "getsockname",
    "getpeername", "setsockopt", "getsockopt"
};

std::string setup_seccomp_filter() {
    if (prctl(PR_SET_NO_NEW_PRIVS, 1, 0, 0, 0) != 0) {
        return errno_message("PR_SET_NO_NEW_PRIVS");
    }

    scmp_filter_ctx ctx = seccomp_init(SCMP_ACT_ERRNO(EPERM));
    if (!ctx) {
        return "seccomp_init failed";
    }

    // Allow essential syscalls
    for (const char* name : ALLOWED_SYSCALLS) {
        int number = seccomp_syscall_resolve_name(name);
        if (number == __NR_SCMP_ERROR) {
            continue;
        }
        if (seccomp_rule_add(ctx, SCMP_ACT_ALLOW, number, 0) != 0) {
            seccomp_release(ctx);
            return std::string("seccomp_rule_add failed for ") + name;
        }
    }

    // Load and apply the filter
    int rc = seccomp_load(ctx);
    seccomp_release(ctx);
    if (rc != 0) {
        return "seccomp_load failed";
    }
    return "";
}

} // namespace

NamespaceLauncher::NamespaceLauncher(NamespaceLauncherConfig config) : config_(std::move(config)) {
    if (config_.runner.empty()) {
        throw std::invalid_argument("namespace launcher needs a runner command");
    }
}

std::vector<RootEntry> NamespaceLauncher::root_entries() const {
    std::vector<RootEntry> entries;
    std::error_code ec;

    for (const auto& path : config_.system_paths) {
        fs::file_status status = fs::symlink_status(path, ec);
        if (ec || !fs::exists(status)) {
            continue;
        }
        if (fs::is_symlink(status)) {
            // Merged-/usr hosts: /bin -> usr/bin
            entries.push_back({RootEntry::Kind::SYMLINK, path, path,
                               fs::read_symlink(path, ec).string()});
        } else if (fs::is_directory(status)) {
            entries.push_back({RootEntry::Kind::DIRECTORY, path, path, ""});
        }
    }

    // The runner's own script, wherever it lives
    for (size_t i = 1; i < config_.runner.size(); i++) {
        const std::string& arg = config_.runner[i];
        if (arg.empty() || arg[0] != '/' ||
            arg.rfind(std::string(SESSION_MOUNT_PATH) + "/", 0) == 0) {
            continue;
        }
        if (fs::is_regular_file(arg, ec)) {
            entries.push_back({RootEntry::Kind::FILE, arg, arg, ""});
        }
    }
    return entries;
}

bool NamespaceLauncher::setup_cgroup(const std::string& path, const ResourceLimits& limits) const {
    if (!fs::exists("/sys/fs/cgroup/cgroup.controllers")) {
        return false;
    }

    std::error_code ec;
    fs::create_directories(path, ec);
    if (ec) {
        return false;
    }

    // Enable controllers for our subtree
    write_file(config_.cgroup_root + "/cgroup.subtree_control", "+memory +cpu +pids");

    size_t quota = static_cast<size_t>(limits.cpu_share * DEFAULT_CPU_PERIOD_US);
    if (quota < 1000) quota = 1000;

    bool ok = write_file(path + "/memory.max", std::to_string(limits.memory_mb * 1024 * 1024));
    write_file(path + "/memory.swap.max", "0");
    ok = write_file(path + "/cpu.max",
                    std::to_string(quota) + " " + std::to_string(DEFAULT_CPU_PERIOD_US)) && ok;
    ok = write_file(path + "/pids.max", std::to_string(limits.max_pids)) && ok;
    return ok;
}

std::unique_ptr<SandboxHandle> NamespaceLauncher::launch(const WorkspaceHandle& workspace,
                                                         const ResourceLimits& limits) {
    std::string id = generate_sandbox_id();
    std::string cgroup_path = config_.cgroup_root + "/" + id;
    bool privileged = geteuid() == 0;
    uid_t host_uid = geteuid();
    gid_t host_gid = getegid();

    bool cgroup_ready = setup_cgroup(cgroup_path, limits);
    if (!cgroup_ready) {
        std::error_code ec;
        fs::remove(cgroup_path, ec);
        if (config_.require_cgroups) {
            throw ProvisionError("cgroup v2 limits unavailable at " + config_.cgroup_root);
        }
        std::cerr << "[Sandbox] DEGRADED ISOLATION: cgroup limits not applied for " << id
                  << ", relying on rlimits" << std::endl;
    }

    SpawnOptions options;
    options.argv = config_.runner;
    options.clear_environment = true;
    options.env = {
        {"PATH", "/usr/local/bin:/usr/bin:/bin"},
        {"HOME", "/home/user"},
        {"PYTHONDONTWRITEBYTECODE", "1"},
        {"PYTHONUNBUFFERED", "1"},
        {"MPLBACKEND", "Agg"},
        {"PYEXEC_SESSION_DIR", SESSION_MOUNT_PATH}
    };

    options.clone_flags = CLONE_NEWPID | CLONE_NEWNS | CLONE_NEWUTS | CLONE_NEWIPC | CLONE_NEWNET;
    if (!privileged) {
        // Unprivileged hosts get root inside a user namespace mapped to us
        options.clone_flags |= CLONE_NEWUSER;
    }

    options.before_release = [=](pid_t pid) {
        if (!privileged) {
            std::string proc = "/proc/" + std::to_string(pid);
            if (!write_file(proc + "/uid_map", "0 " + std::to_string(host_uid) + " 1") ||
                !write_file(proc + "/setgroups", "deny") ||
                !write_file(proc + "/gid_map", "0 " + std::to_string(host_gid) + " 1")) {
                throw ProvisionError("cannot map user namespace ids");
            }
        }
        if (cgroup_ready && !write_file(cgroup_path + "/cgroup.procs", std::to_string(pid))) {
            throw ProvisionError("cannot attach sandbox to cgroup");
        }
    };

    std::string workspace_path = workspace.path();
    if (privileged && chown(workspace_path.c_str(), config_.uid, config_.gid) != 0) {
        std::error_code ec;
        fs::remove(cgroup_path, ec);
        throw ProvisionError(errno_message("chown " + workspace_path));
    }

    // Empty mount point for the guest's root; the tmpfs on it only exists in
    // the sandbox's mount namespace
    std::string staging = config_.staging_root.empty()
        ? fs::temp_directory_path().string() : config_.staging_root;
    std::string new_root = staging + "/pyexec-root-" + id;
    if (mkdir(new_root.c_str(), 0700) != 0) {
        std::error_code ec;
        fs::remove(cgroup_path, ec);
        throw ProvisionError(errno_message("mkdir " + new_root));
    }

    std::vector<RootEntry> entries = root_entries();
    NamespaceLauncherConfig config = config_;
    options.before_exec = [=]() -> std::string {
        std::string error = setup_filesystem(new_root, entries, workspace_path);
        if (error.empty()) error = apply_resource_limits(limits);
        if (error.empty() && privileged) error = drop_privileges(config.uid, config.gid);
        if (error.empty() && config.seccomp) error = setup_seccomp_filter();
        return error;
    };

    std::unique_ptr<ChildProcess> child;
    try {
        child = ChildProcess::spawn(options);
    } catch (const ProvisionError&) {
        std::error_code ec;
        fs::remove(cgroup_path, ec);
        fs::remove(new_root, ec);
        throw;
    }

    auto sandbox = std::make_unique<ProcessSandbox>(id, std::move(child));
    sandbox->add_cleanup([new_root]() {
        if (rmdir(new_root.c_str()) != 0 && errno != ENOENT) {
            std::cerr << "[Sandbox] Could not remove staging root " << new_root << std::endl;
        }
    });
    if (cgroup_ready) {
        sandbox->set_stop_hook([cgroup_path]() {
            write_file(cgroup_path + "/cgroup.kill", "1");
        });
        sandbox->add_cleanup([cgroup_path]() {
            // rmdir only succeeds once every member has exited
            for (int attempt = 0; attempt < 50; attempt++) {
                if (rmdir(cgroup_path.c_str()) == 0 || errno == ENOENT) {
                    return;
                }
                usleep(10 * 1000);
            }
            std::cerr << "[Sandbox] Could not remove cgroup " << cgroup_path << std::endl;
        });
    }

    std::cout << "[Sandbox] Launched namespace sandbox " << id
              << " (memory=" << limits.memory_mb << "MB, cpus=" << limits.cpu_share << ")"
              << std::endl;
    return sandbox;
}

bool NamespaceLauncher::test_system_capabilities() {
    // Test if we can create namespaces
    pid_t pid = fork();
    if (pid == 0) {
        int flags = CLONE_NEWPID | CLONE_NEWNS | CLONE_NEWNET;
        if (geteuid() != 0) {
            flags |= CLONE_NEWUSER;
        }
        if (unshare(flags) == 0) {
            _exit(0);  // Success
        }
        _exit(1);  // Failure
    } else if (pid > 0) {
        int status;
        waitpid(pid, &status, 0);
        return WIFEXITED(status) && WEXITSTATUS(status) == 0;
    }
    return false;
}

} // namespace pyexec
