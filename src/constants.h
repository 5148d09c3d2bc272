#pragma once

#include <cstddef>  // for size_t

namespace pyexec {

// Resource ceilings (per sandbox)
constexpr size_t DEFAULT_MEMORY_LIMIT_MB = 512;                  // 512MB hard memory ceiling
constexpr double DEFAULT_CPU_SHARE = 0.5;                        // Half a CPU
constexpr size_t DEFAULT_MAX_PIDS = 64;                          // Max threads/processes
constexpr size_t DEFAULT_CPU_PERIOD_US = 100 * 1000;             // cgroup cpu.max period
constexpr int MAX_OPEN_FILES = 256;                              // Max file descriptors

// Time limits
constexpr int DEFAULT_TIMEOUT_SECONDS = 30;                      // Execution deadline
constexpr int PROTOCOL_POLL_SLICE_MS = 50;                       // Read loop poll slice
constexpr int TEARDOWN_GRACE_MS = 2000;                          // Wait for docker kill
constexpr int TOKEN_LEEWAY_SECONDS = 60;                         // exp/nbf clock skew
constexpr int JWKS_REFRESH_SECONDS = 300;                        // Min interval between refetches
constexpr long DEV_TOKEN_LIFETIME_SECONDS = 365L * 24 * 3600;    // Dev token validity

// Output limits
constexpr size_t DEFAULT_MAX_OUTPUT_BYTES = 1024 * 1024;         // 1MB output budget
constexpr size_t MAX_FRAME_BYTES = 16 * 1024 * 1024;             // Longest accepted frame
constexpr size_t RAW_OUTPUT_SLACK_BYTES = 64 * 1024;             // Raw bytes read past budget
constexpr size_t MAX_SESSION_ID_LENGTH = 128;

// Buffer sizes
constexpr size_t PIPE_BUFFER_SIZE = 4096;                        // Read buffer size
constexpr size_t INITIAL_HTTP_BUFFER = 8192;                     // Initial HTTP buffer
constexpr size_t MAX_REQUEST_SIZE = 16 * 1024 * 1024;            // 16MB max request
constexpr size_t MAX_HTTPS_RESPONSE = 1024 * 1024;               // 1MB max JWKS document

// Sandbox layout
constexpr const char* SESSION_MOUNT_PATH = "/home/user/session"; // Workspace inside sandbox
constexpr const char* SCRATCH_DIR_NAME = ".scratch";             // Ephemeral workspaces
constexpr const char* DEFAULT_IMAGE = "ipython-executor";
constexpr const char* DEFAULT_RUNNER = "python3 /opt/pyexec/runner.py";
constexpr const char* CGROUP_ROOT = "/sys/fs/cgroup/pyexec";
constexpr unsigned SANDBOX_UID = 65534;                          // nobody
constexpr unsigned SANDBOX_GID = 65534;                          // nogroup

// Auth
constexpr const char* DEFAULT_AUDIENCE = "mcp-pyexec";
constexpr const char* DEFAULT_ALGORITHM = "RS256";
constexpr const char* EXECUTE_SCOPE = "execute";
constexpr const char* DEV_ISSUER = "pyexec-dev";
constexpr const char* DEV_KEY_ID = "dev";
constexpr int DEV_RSA_BITS = 2048;

// Network
constexpr int DEFAULT_PORT = 8080;                               // Default server port
constexpr int LISTEN_BACKLOG = 64;                               // Socket listen backlog

} // namespace pyexec
