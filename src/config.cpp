#include "config.h"
#include "token_validator.h"
#include <cstdlib>
#include <sstream>
#include <map>

namespace pyexec {

namespace {

long long parse_integer(const std::string& name, const std::string& value, long long min_value) {
    size_t consumed = 0;
    long long parsed = 0;
    try {
        parsed = std::stoll(value, &consumed);
    } catch (const std::exception&) {
        throw ConfigError(name + " must be an integer, got '" + value + "'");
    }
    if (consumed != value.size()) {
        throw ConfigError(name + " must be an integer, got '" + value + "'");
    }
    if (parsed < min_value) {
        throw ConfigError(name + " must be at least " + std::to_string(min_value));
    }
    return parsed;
}

double parse_positive_double(const std::string& name, const std::string& value) {
    size_t consumed = 0;
    double parsed = 0;
    try {
        parsed = std::stod(value, &consumed);
    } catch (const std::exception&) {
        throw ConfigError(name + " must be a number, got '" + value + "'");
    }
    if (consumed != value.size() || parsed <= 0) {
        throw ConfigError(name + " must be a positive number, got '" + value + "'");
    }
    return parsed;
}

Backend parse_backend(const std::string& value) {
    if (value == "docker") return Backend::DOCKER;
    if (value == "namespace") return Backend::NAMESPACE;
    throw ConfigError("unknown backend '" + value + "' (expected docker or namespace)");
}

// Setting name, environment variable, command-line flag
struct Option {
    const char* env;
    const char* flag;
};

const std::map<std::string, Option>& options() {
    static const std::map<std::string, Option> table = {
        {"jwks_uri",         {"PYEXEC_JWKS_URI", "--jwks-uri"}},
        {"issuer",           {"PYEXEC_ISSUER", "--issuer"}},
        {"audience",         {"PYEXEC_AUDIENCE", "--audience"}},
        {"algorithm",        {"PYEXEC_ALGORITHM", "--algorithm"}},
        {"public_key_file",  {"PYEXEC_PUBLIC_KEY_FILE", "--public-key"}},
        {"dev_dir",          {"PYEXEC_DEV_DIR", "--dev-dir"}},
        {"session_root",     {"PYEXEC_SESSION_ROOT", "--session-root"}},
        {"backend",          {"PYEXEC_BACKEND", "--backend"}},
        {"image",            {"PYEXEC_IMAGE", "--image"}},
        {"runner",           {"PYEXEC_RUNNER", "--runner"}},
        {"timeout_seconds",  {"PYEXEC_TIMEOUT_SECONDS", "--timeout"}},
        {"memory_mb",        {"PYEXEC_MEMORY_MB", "--memory-mb"}},
        {"cpus",             {"PYEXEC_CPUS", "--cpus"}},
        {"max_output_bytes", {"PYEXEC_MAX_OUTPUT_BYTES", "--max-output"}},
        {"port",             {"PYEXEC_PORT", "--port"}}
    };
    return table;
}

void set_option(ServiceConfig& config, const std::string& key, const std::string& label,
                const std::string& value) {
    if (key == "jwks_uri") {
        config.jwks_uri = value;
    } else if (key == "issuer") {
        config.issuer = value;
    } else if (key == "audience") {
        config.audience = value;
    } else if (key == "algorithm") {
        config.algorithm = value;
    } else if (key == "public_key_file") {
        config.public_key_file = value;
    } else if (key == "dev_dir") {
        config.dev_dir = value;
    } else if (key == "session_root") {
        config.session_root = value;
    } else if (key == "backend") {
        config.backend = parse_backend(value);
    } else if (key == "image") {
        config.image = value;
    } else if (key == "runner") {
        config.runner = ServiceConfig::split_command(value);
        if (config.runner.empty()) {
            throw ConfigError(label + " must not be empty");
        }
    } else if (key == "timeout_seconds") {
        config.timeout_seconds = static_cast<int>(parse_integer(label, value, 1));
    } else if (key == "memory_mb") {
        config.memory_mb = static_cast<size_t>(parse_integer(label, value, 16));
    } else if (key == "cpus") {
        config.cpus = parse_positive_double(label, value);
    } else if (key == "max_output_bytes") {
        config.max_output_bytes = static_cast<size_t>(parse_integer(label, value, 1));
    } else if (key == "port") {
        long long port = parse_integer(label, value, 1);
        if (port > 65535) {
            throw ConfigError(label + " must be a valid port");
        }
        config.port = static_cast<int>(port);
    }
}

} // namespace

const char* to_string(Backend backend) {
    switch (backend) {
        case Backend::DOCKER: return "docker";
        case Backend::NAMESPACE: return "namespace";
    }
    return "unknown";
}

ServiceConfig::ServiceConfig() : runner(split_command(DEFAULT_RUNNER)) {}

std::vector<std::string> ServiceConfig::split_command(const std::string& command) {
    std::vector<std::string> parts;
    std::istringstream stream(command);
    std::string part;
    while (stream >> part) {
        parts.push_back(part);
    }
    return parts;
}

ServiceConfig ServiceConfig::from_environment(const EnvLookup& lookup) {
    EnvLookup get = lookup;
    if (!get) {
        get = [](const std::string& name) -> std::optional<std::string> {
            const char* value = std::getenv(name.c_str());
            if (!value || !*value) {
                return std::nullopt;
            }
            return std::string(value);
        };
    }

    ServiceConfig config;
    for (const auto& [key, option] : options()) {
        if (auto value = get(option.env)) {
            set_option(config, key, option.env, *value);
        }
    }
    return config;
}

void ServiceConfig::apply_args(int argc, const char* const argv[]) {
    for (int i = 1; i < argc; i++) {
        std::string arg = argv[i];
        bool matched = false;
        for (const auto& [key, option] : options()) {
            if (arg != option.flag) {
                continue;
            }
            if (i + 1 >= argc) {
                throw ConfigError(arg + " needs a value");
            }
            set_option(*this, key, arg, argv[++i]);
            matched = true;
            break;
        }
        if (!matched) {
            throw ConfigError("unknown argument '" + arg + "'");
        }
    }
}

void ServiceConfig::validate() const {
    if (jwks_uri && !issuer) {
        throw ConfigError("PYEXEC_ISSUER is required when PYEXEC_JWKS_URI is set");
    }
    if (!TokenValidator::is_supported_algorithm(algorithm)) {
        throw ConfigError("unsupported signing algorithm '" + algorithm + "'");
    }
    if (audience.empty()) {
        throw ConfigError("audience must not be empty");
    }
}

ExecutionRequest ServiceConfig::make_request(std::string code,
                                             std::optional<std::string> session_id) const {
    ExecutionRequest request;
    request.code = std::move(code);
    request.session_id = std::move(session_id);
    request.deadline = std::chrono::seconds(timeout_seconds);
    request.limits.memory_mb = memory_mb;
    request.limits.cpu_share = cpus;
    request.output_budget = max_output_bytes;
    return request;
}

} // namespace pyexec
