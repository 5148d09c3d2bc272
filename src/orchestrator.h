#pragma once

#include "execution_types.h"
#include "token_validator.h"
#include "session_store.h"
#include "sandbox_launcher.h"
#include "constants.h"
#include <string>
#include <optional>
#include <functional>
#include <atomic>

namespace pyexec {

enum class OrchestratorState {
    IDLE,
    VALIDATING,
    PROVISIONING_SESSION,
    LAUNCHING_SANDBOX,
    EXECUTING,
    CLASSIFYING,
    CLEANING_UP,
    COMPLETED,
    FAILED
};

const char* to_string(OrchestratorState state);

// Terminal value of one request
struct ExecutionOutcome {
    OrchestratorState state = OrchestratorState::FAILED;
    std::optional<ExecutionResult> result;      // Present when state is COMPLETED
    ErrorCategory error = ErrorCategory::NONE;
    std::string message;                        // Safe to show the caller
    DenyReason deny_reason = DenyReason::NONE;  // Set for AUTH_ERROR
    std::string request_id;

    bool completed() const { return state == OrchestratorState::COMPLETED; }
};

struct OrchestratorConfig {
    std::string required_scope = EXECUTE_SCOPE;
    bool serialize_sessions = true;             // One execution per session at a time
    size_t raw_output_slack = RAW_OUTPUT_SLACK_BYTES;
};

// Drives one request through
//   validate -> provision session -> launch sandbox -> execute -> classify
//   -> clean up
// Sandbox teardown runs exactly once on every path that launched one.
class Orchestrator {
public:
    using StateObserver = std::function<void(const std::string& request_id, OrchestratorState state)>;

    Orchestrator(TokenValidator& validator, SessionStore& sessions, SandboxLauncher& launcher,
                 OrchestratorConfig config = OrchestratorConfig{});

    ExecutionOutcome execute(const std::string& token, const ExecutionRequest& request);

    // Called on every state transition, from the executing thread
    void set_observer(StateObserver observer) { observer_ = std::move(observer); }

private:
    void transition(const std::string& request_id, OrchestratorState state);
    std::string next_request_id();

    TokenValidator& validator_;
    SessionStore& sessions_;
    SandboxLauncher& launcher_;
    OrchestratorConfig config_;
    StateObserver observer_;
    std::atomic<unsigned long> request_counter_{0};
};

} // namespace pyexec
