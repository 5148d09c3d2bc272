#include <gtest/gtest.h>
#include "config.h"
#include <map>

namespace pyexec {
namespace {

ServiceConfig::EnvLookup env_of(std::map<std::string, std::string> values) {
    return [values](const std::string& name) -> std::optional<std::string> {
        auto it = values.find(name);
        if (it == values.end()) {
            return std::nullopt;
        }
        return it->second;
    };
}

TEST(ConfigTest, DefaultsMatchDocumentedValues) {
    auto config = ServiceConfig::from_environment(env_of({}));

    EXPECT_TRUE(config.dev_mode());
    EXPECT_EQ(config.audience, "mcp-pyexec");
    EXPECT_EQ(config.algorithm, "RS256");
    EXPECT_EQ(config.session_root, "sessions");
    EXPECT_EQ(config.dev_dir, "dev_credentials");
    EXPECT_EQ(config.backend, Backend::DOCKER);
    EXPECT_EQ(config.image, "ipython-executor");
    EXPECT_EQ(config.runner, (std::vector<std::string>{"python3", "/opt/pyexec/runner.py"}));
    EXPECT_EQ(config.timeout_seconds, 30);
    EXPECT_EQ(config.memory_mb, 512u);
    EXPECT_DOUBLE_EQ(config.cpus, 0.5);
    EXPECT_EQ(config.max_output_bytes, 1048576u);
    EXPECT_EQ(config.port, 8080);
    EXPECT_NO_THROW(config.validate());
}

TEST(ConfigTest, ReadsEnvironment) {
    auto config = ServiceConfig::from_environment(env_of({
        {"PYEXEC_JWKS_URI", "https://auth.example.com/.well-known/jwks.json"},
        {"PYEXEC_ISSUER", "https://auth.example.com"},
        {"PYEXEC_BACKEND", "namespace"},
        {"PYEXEC_RUNNER", "python3  -u /srv/runner.py"},
        {"PYEXEC_TIMEOUT_SECONDS", "5"},
        {"PYEXEC_CPUS", "1.5"},
        {"PYEXEC_PORT", "9000"}
    }));

    EXPECT_FALSE(config.dev_mode());
    EXPECT_EQ(*config.issuer, "https://auth.example.com");
    EXPECT_EQ(config.backend, Backend::NAMESPACE);
    EXPECT_EQ(config.runner, (std::vector<std::string>{"python3", "-u", "/srv/runner.py"}));
    EXPECT_EQ(config.timeout_seconds, 5);
    EXPECT_DOUBLE_EQ(config.cpus, 1.5);
    EXPECT_EQ(config.port, 9000);
    EXPECT_NO_THROW(config.validate());
}

TEST(ConfigTest, FlagsOverrideEnvironment) {
    auto config = ServiceConfig::from_environment(env_of({{"PYEXEC_PORT", "9000"}}));
    const char* argv[] = {"pyexec", "--port", "9100", "--memory-mb", "256", "--image", "custom"};

    config.apply_args(7, argv);

    EXPECT_EQ(config.port, 9100);
    EXPECT_EQ(config.memory_mb, 256u);
    EXPECT_EQ(config.image, "custom");
}

TEST(ConfigTest, RejectsBadValues) {
    EXPECT_THROW(ServiceConfig::from_environment(env_of({{"PYEXEC_TIMEOUT_SECONDS", "ten"}})),
                 ConfigError);
    EXPECT_THROW(ServiceConfig::from_environment(env_of({{"PYEXEC_TIMEOUT_SECONDS", "0"}})),
                 ConfigError);
    EXPECT_THROW(ServiceConfig::from_environment(env_of({{"PYEXEC_MEMORY_MB", "12abc"}})),
                 ConfigError);
    EXPECT_THROW(ServiceConfig::from_environment(env_of({{"PYEXEC_CPUS", "-1"}})), ConfigError);
    EXPECT_THROW(ServiceConfig::from_environment(env_of({{"PYEXEC_PORT", "70000"}})), ConfigError);
    EXPECT_THROW(ServiceConfig::from_environment(env_of({{"PYEXEC_BACKEND", "vm"}})), ConfigError);
    EXPECT_THROW(ServiceConfig::from_environment(env_of({{"PYEXEC_RUNNER", "   "}})), ConfigError);
}

TEST(ConfigTest, RejectsUnknownOrIncompleteFlags) {
    ServiceConfig config;
    const char* unknown[] = {"pyexec", "--verbose"};
    const char* incomplete[] = {"pyexec", "--port"};

    EXPECT_THROW(config.apply_args(2, unknown), ConfigError);
    EXPECT_THROW(config.apply_args(2, incomplete), ConfigError);
}

TEST(ConfigTest, JwksRequiresIssuer) {
    auto config = ServiceConfig::from_environment(env_of({
        {"PYEXEC_JWKS_URI", "https://auth.example.com/jwks"}
    }));

    EXPECT_THROW(config.validate(), ConfigError);
}

TEST(ConfigTest, RejectsUnsupportedAlgorithm) {
    ServiceConfig config;
    config.algorithm = "HS256";
    EXPECT_THROW(config.validate(), ConfigError);

    config.algorithm = "RS512";
    EXPECT_NO_THROW(config.validate());
}

TEST(ConfigTest, RequestCarriesLimits) {
    ServiceConfig config;
    config.timeout_seconds = 7;
    config.memory_mb = 128;
    config.cpus = 2.0;
    config.max_output_bytes = 4096;

    auto request = config.make_request("print(1)", std::string("alpha"));

    EXPECT_EQ(request.code, "print(1)");
    EXPECT_EQ(*request.session_id, "alpha");
    EXPECT_EQ(request.deadline, std::chrono::seconds(7));
    EXPECT_EQ(request.limits.memory_mb, 128u);
    EXPECT_DOUBLE_EQ(request.limits.cpu_share, 2.0);
    EXPECT_EQ(request.output_budget, 4096u);
}

} // namespace
} // namespace pyexec
