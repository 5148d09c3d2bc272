#include "orchestrator.h"
#include "execution_protocol.h"
#include "output_classifier.h"
#include <iostream>
#include <chrono>
#include <algorithm>
#include <cctype>

namespace pyexec {

namespace {

bool is_blank(const std::string& code) {
    return std::all_of(code.begin(), code.end(),
                       [](unsigned char c) { return std::isspace(c) != 0; });
}

bool raised_exception(const ProtocolOutcome& raw) {
    return std::any_of(raw.events.begin(), raw.events.end(),
                       [](const RawEvent& e) { return e.type == EventType::EXCEPTION; });
}

} // namespace

const char* to_string(OrchestratorState state) {
    switch (state) {
        case OrchestratorState::IDLE: return "idle";
        case OrchestratorState::VALIDATING: return "validating";
        case OrchestratorState::PROVISIONING_SESSION: return "provisioning_session";
        case OrchestratorState::LAUNCHING_SANDBOX: return "launching_sandbox";
        case OrchestratorState::EXECUTING: return "executing";
        case OrchestratorState::CLASSIFYING: return "classifying";
        case OrchestratorState::CLEANING_UP: return "cleaning_up";
        case OrchestratorState::COMPLETED: return "completed";
        case OrchestratorState::FAILED: return "failed";
    }
    return "unknown";
}

Orchestrator::Orchestrator(TokenValidator& validator, SessionStore& sessions,
                           SandboxLauncher& launcher, OrchestratorConfig config)
    : validator_(validator), sessions_(sessions), launcher_(launcher),
      config_(std::move(config)) {}

std::string Orchestrator::next_request_id() {
    auto now = std::chrono::system_clock::now().time_since_epoch();
    auto seconds = std::chrono::duration_cast<std::chrono::seconds>(now).count();
    return "req_" + std::to_string(seconds) + "_" + std::to_string(++request_counter_);
}

void Orchestrator::transition(const std::string& request_id, OrchestratorState state) {
    if (observer_) {
        observer_(request_id, state);
    }
}

ExecutionOutcome Orchestrator::execute(const std::string& token, const ExecutionRequest& request) {
    ExecutionOutcome outcome;
    outcome.request_id = next_request_id();
    const std::string& rid = outcome.request_id;
    auto started = std::chrono::steady_clock::now();

    transition(rid, OrchestratorState::IDLE);
    transition(rid, OrchestratorState::VALIDATING);

    AuthDecision decision = validator_.validate(token, config_.required_scope);
    if (!decision.allowed) {
        std::cerr << "[Orchestrator] " << rid << " denied: " << to_string(decision.reason)
                  << std::endl;
        outcome.state = OrchestratorState::FAILED;
        outcome.error = ErrorCategory::AUTH_ERROR;
        outcome.deny_reason = decision.reason;
        outcome.message = decision.message;
        transition(rid, OrchestratorState::FAILED);
        return outcome;
    }

    if (is_blank(request.code)) {
        ExecutionResult result;
        result.records.push_back(OutputRecord::error("Error: No Python code provided"));
        transition(rid, OrchestratorState::CLEANING_UP);
        outcome.state = OrchestratorState::COMPLETED;
        outcome.result = std::move(result);
        transition(rid, OrchestratorState::COMPLETED);
        return outcome;
    }

    std::cout << "[Orchestrator] " << rid << " accepted for " << decision.subject
              << (request.session_id ? " session=" + *request.session_id : std::string(" (scratch)"))
              << std::endl;

    // Destroyed in reverse: sandbox, workspace, session lock
    SessionLock session_lock;
    std::unique_ptr<WorkspaceHandle> workspace;
    SandboxGuard sandbox(launcher_);

    auto clean_up = [&]() {
        transition(rid, OrchestratorState::CLEANING_UP);
        sandbox.release();
        workspace.reset();
        session_lock.unlock();
    };

    try {
        transition(rid, OrchestratorState::PROVISIONING_SESSION);
        if (request.session_id) {
            if (!SessionStore::is_valid_session_id(*request.session_id)) {
                throw ProvisionError("invalid session id");
            }
            if (config_.serialize_sessions) {
                session_lock = sessions_.lock(*request.session_id);
            }
        }
        workspace = sessions_.resolve(request.session_id);

        transition(rid, OrchestratorState::LAUNCHING_SANDBOX);
        sandbox.acquire(launcher_.launch(*workspace, request.limits));

        transition(rid, OrchestratorState::EXECUTING);
        ExecutionProtocol protocol(request.output_budget + config_.raw_output_slack);
        auto deadline = std::chrono::steady_clock::now() + request.deadline;
        ProtocolOutcome raw = protocol.run(*sandbox.get(), request.code, deadline);

        transition(rid, OrchestratorState::CLASSIFYING);
        OutputClassifier classifier(request.output_budget);
        ExecutionResult result = classifier.classify(raw.events);

        switch (raw.status) {
            case ProtocolStatus::COMPLETED:
                result.status = ExecutionStatus::COMPLETED;
                break;
            case ProtocolStatus::OUTPUT_LIMIT:
                result.status = ExecutionStatus::COMPLETED;
                result.truncated = true;
                break;
            case ProtocolStatus::TIMED_OUT:
                result.status = ExecutionStatus::TIMED_OUT;
                break;
            case ProtocolStatus::FAILED:
                result.status = ExecutionStatus::FAILED;
                result.diagnostic = raw.diagnostic;
                break;
        }

        if (result.status == ExecutionStatus::TIMED_OUT) {
            outcome.error = ErrorCategory::TIMEOUT_ERROR;
            outcome.message = "Execution timed out after " +
                std::to_string(request.deadline.count() / 1000) + " seconds";
        } else if (result.status == ExecutionStatus::FAILED) {
            outcome.error = ErrorCategory::PROTOCOL_ERROR;
            outcome.message = "Sandbox produced malformed output";
            std::cerr << "[Protocol] " << rid << " " << raw.diagnostic;
            if (!raw.stderr_tail.empty()) {
                std::cerr << " (runtime stderr: " << raw.stderr_tail << ")";
            }
            std::cerr << std::endl;
        } else if (result.truncated) {
            outcome.error = ErrorCategory::OUTPUT_LIMIT_EXCEEDED;
            outcome.message = "Output truncated at " + std::to_string(request.output_budget) + " bytes";
        } else if (raised_exception(raw)) {
            outcome.error = ErrorCategory::GUEST_EXECUTION_ERROR;
        }

        clean_up();

        result.wall_time = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - started);
        std::cout << "[Orchestrator] " << rid << " finished: " << to_string(result.status)
                  << ", " << result.records.size() << " records"
                  << (result.truncated ? " (truncated)" : "")
                  << " in " << result.wall_time.count() << "ms" << std::endl;

        outcome.state = OrchestratorState::COMPLETED;
        outcome.result = std::move(result);
        transition(rid, OrchestratorState::COMPLETED);
        return outcome;

    } catch (const ProvisionError& e) {
        std::cerr << "[Orchestrator] " << rid << " " << e.what() << std::endl;
        clean_up();
        outcome.state = OrchestratorState::FAILED;
        outcome.error = ErrorCategory::PROVISION_ERROR;
        outcome.message = e.what();
    } catch (const std::exception& e) {
        std::cerr << "[Orchestrator] " << rid << " internal error: " << e.what() << std::endl;
        clean_up();
        outcome.state = OrchestratorState::FAILED;
        outcome.error = ErrorCategory::INTERNAL_ERROR;
        outcome.message = "Internal error while executing code";
    }

    transition(rid, OrchestratorState::FAILED);
    return outcome;
}

} // namespace pyexec
