/*
 * pyexec - Sandboxed Python execution service
 * One isolated sandbox per request, session workspaces on disk
 */

#include "config.h"
#include "dev_credentials.h"
#include "key_source.h"
#include "token_validator.h"
#include "session_store.h"
#include "docker_launcher.h"
#include "namespace_launcher.h"
#include "orchestrator.h"
#include "execute_api.h"
#include "http_server.h"
#include <iostream>
#include <memory>
#include <string>
#include <unistd.h>

using namespace pyexec;

namespace {

void print_usage(const char* program) {
    std::cout << "Usage: " << program << " [options]\n"
              << "\n"
              << "Options (environment variable in brackets):\n"
              << "  --jwks-uri URL        Trusted key discovery endpoint [PYEXEC_JWKS_URI]\n"
              << "  --issuer ISS          Expected token issuer [PYEXEC_ISSUER]\n"
              << "  --audience AUD        Expected token audience [PYEXEC_AUDIENCE]\n"
              << "  --algorithm ALG       RS256, RS384 or RS512 [PYEXEC_ALGORITHM]\n"
              << "  --public-key FILE     Static public key (dev mode) [PYEXEC_PUBLIC_KEY_FILE]\n"
              << "  --dev-dir DIR         Dev keypair and token [PYEXEC_DEV_DIR]\n"
              << "  --session-root DIR    Session workspaces [PYEXEC_SESSION_ROOT]\n"
              << "  --backend NAME        docker or namespace [PYEXEC_BACKEND]\n"
              << "  --image NAME          Sandbox image (docker) [PYEXEC_IMAGE]\n"
              << "  --runner CMD          Guest runner command (namespace) [PYEXEC_RUNNER]\n"
              << "  --timeout SECONDS     Execution deadline [PYEXEC_TIMEOUT_SECONDS]\n"
              << "  --memory-mb MB        Memory ceiling [PYEXEC_MEMORY_MB]\n"
              << "  --cpus N              CPU share [PYEXEC_CPUS]\n"
              << "  --max-output BYTES    Output budget [PYEXEC_MAX_OUTPUT_BYTES]\n"
              << "  --port PORT           Listen port [PYEXEC_PORT]\n";
}

} // namespace

int main(int argc, char* argv[]) {
    for (int i = 1; i < argc; i++) {
        std::string arg = argv[i];
        if (arg == "--help" || arg == "-h") {
            print_usage(argv[0]);
            return 0;
        }
    }

    ServiceConfig config;
    try {
        config = ServiceConfig::from_environment();
        config.apply_args(argc, argv);
        config.validate();
    } catch (const ConfigError& e) {
        std::cerr << e.what() << std::endl;
        std::cerr << "Run with --help for the list of options" << std::endl;
        return 2;
    }

    std::cout << "pyexec - Sandboxed Python Execution" << std::endl;
    std::cout << "------------------------------------------------" << std::endl;

    // Trusted keys: JWKS in production, a local keypair in development
    ValidatorConfig validator_config;
    validator_config.audience = config.audience;
    validator_config.issuer = config.issuer;
    validator_config.algorithm = config.algorithm;
    validator_config.leeway_seconds = TOKEN_LEEWAY_SECONDS;

    std::shared_ptr<KeySource> keys;
    if (config.dev_mode()) {
        if (!validator_config.issuer) {
            validator_config.issuer = DEV_ISSUER;
        }
        auto dev = DevCredentials::bootstrap(config.dev_dir, validator_config);
        if (!dev) {
            std::cerr << "[Auth] Failed to prepare development credentials in "
                      << config.dev_dir << std::endl;
            return 1;
        }

        std::string key_path = config.public_key_file.value_or(dev->public_key_path());
        keys = StaticKeySource::from_pem_file(key_path);
        if (!keys) {
            std::cerr << "[Auth] Failed to load public key from " << key_path << std::endl;
            return 1;
        }

        std::cout << "Auth Mode: DEVELOPMENT (" << keys->describe() << ")" << std::endl;
        std::cout << "Dev token: " << dev->token_path() << std::endl;
    } else {
        keys = std::make_shared<JwksKeySource>(*config.jwks_uri);
        std::cout << "Auth Mode: JWKS (" << keys->describe() << ")" << std::endl;
        std::cout << "Issuer: " << *config.issuer << std::endl;
    }
    std::cout << "Audience: " << config.audience << std::endl;

    TokenValidator validator(validator_config, keys);
    SessionStore sessions(config.session_root);

    std::unique_ptr<SandboxLauncher> launcher;
    if (config.backend == Backend::DOCKER) {
        DockerLauncherConfig docker_config;
        docker_config.image = config.image;
        if (geteuid() != 0) {
            // Workspaces belong to us; the container user must be able to write them
            docker_config.user = std::to_string(geteuid()) + ":" + std::to_string(getegid());
        }
        launcher = std::make_unique<DockerLauncher>(docker_config);
        std::cout << "Sandbox: docker (image " << config.image << ")" << std::endl;
    } else {
        if (!NamespaceLauncher::test_system_capabilities()) {
            std::cerr << "[Sandbox] This host does not allow creating namespaces" << std::endl;
            return 1;
        }
        NamespaceLauncherConfig ns_config;
        ns_config.runner = config.runner;
        launcher = std::make_unique<NamespaceLauncher>(ns_config);
        std::cout << "Sandbox: namespace (runner " << config.runner.front() << ")" << std::endl;
    }

    std::cout << "Sessions: " << sessions.root() << std::endl;
    std::cout << "Limits: " << config.memory_mb << "MB, " << config.cpus << " CPU, "
              << config.timeout_seconds << "s, " << config.max_output_bytes << " bytes output"
              << std::endl;
    std::cout << "------------------------------------------------" << std::endl;

    Orchestrator orchestrator(validator, sessions, *launcher);
    ExecuteApi api(orchestrator, config);

    HttpServer server(config.port);
    api.register_routes(server);

    std::cout << "API endpoints:" << std::endl;
    std::cout << "  POST /execute   - Run code {code, session_id?}" << std::endl;
    std::cout << "  GET  /health    - Service status" << std::endl;
    std::cout << std::endl;

    try {
        server.start();
    } catch (const std::runtime_error& e) {
        std::cerr << "[Server] " << e.what() << std::endl;
        return 1;
    }
    return 0;
}
