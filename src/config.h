#pragma once

#include "execution_types.h"
#include "constants.h"
#include <string>
#include <vector>
#include <optional>
#include <functional>
#include <stdexcept>

namespace pyexec {

class ConfigError : public std::runtime_error {
public:
    explicit ConfigError(const std::string& message)
        : std::runtime_error("Configuration error: " + message) {}
};

enum class Backend {
    DOCKER,
    NAMESPACE
};

const char* to_string(Backend backend);

// Service settings from PYEXEC_* environment variables, overridable by
// command-line flags
struct ServiceConfig {
    using EnvLookup = std::function<std::optional<std::string>(const std::string& name)>;

    // Auth
    std::optional<std::string> jwks_uri;        // Unset: development mode
    std::optional<std::string> issuer;
    std::string audience = DEFAULT_AUDIENCE;
    std::string algorithm = DEFAULT_ALGORITHM;
    std::optional<std::string> public_key_file; // Unset: <dev_dir>/public.pem
    std::string dev_dir = "dev_credentials";

    // Execution
    std::string session_root = "sessions";
    Backend backend = Backend::DOCKER;
    std::string image = DEFAULT_IMAGE;
    std::vector<std::string> runner;
    int timeout_seconds = DEFAULT_TIMEOUT_SECONDS;
    size_t memory_mb = DEFAULT_MEMORY_LIMIT_MB;
    double cpus = DEFAULT_CPU_SHARE;
    size_t max_output_bytes = DEFAULT_MAX_OUTPUT_BYTES;

    int port = DEFAULT_PORT;

    ServiceConfig();

    // Throws ConfigError on unparsable values
    static ServiceConfig from_environment(const EnvLookup& lookup = nullptr);

    // Apply --flag value pairs on top. Throws ConfigError on unknown flags.
    void apply_args(int argc, const char* const argv[]);

    // Cross-field checks (issuer required with JWKS, supported algorithm)
    void validate() const;

    bool dev_mode() const { return !jwks_uri.has_value(); }

    // Request carrying the configured deadline, ceilings and budget
    ExecutionRequest make_request(std::string code, std::optional<std::string> session_id) const;

    static std::vector<std::string> split_command(const std::string& command);
};

} // namespace pyexec
