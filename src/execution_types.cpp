#include "execution_types.h"

namespace pyexec {

const char* to_string(OutputKind kind) {
    switch (kind) {
        case OutputKind::TEXT: return "text";
        case OutputKind::ERROR: return "error";
        case OutputKind::IMAGE: return "image";
    }
    return "text";
}

const char* to_string(ExecutionStatus status) {
    switch (status) {
        case ExecutionStatus::COMPLETED: return "completed";
        case ExecutionStatus::TIMED_OUT: return "timed_out";
        case ExecutionStatus::FAILED: return "failed";
    }
    return "failed";
}

const char* to_string(ErrorCategory category) {
    switch (category) {
        case ErrorCategory::NONE: return "none";
        case ErrorCategory::AUTH_ERROR: return "auth_error";
        case ErrorCategory::PROVISION_ERROR: return "provision_error";
        case ErrorCategory::TIMEOUT_ERROR: return "timeout_error";
        case ErrorCategory::PROTOCOL_ERROR: return "protocol_error";
        case ErrorCategory::GUEST_EXECUTION_ERROR: return "guest_execution_error";
        case ErrorCategory::OUTPUT_LIMIT_EXCEEDED: return "output_limit_exceeded";
        case ErrorCategory::INTERNAL_ERROR: return "internal_error";
    }
    return "internal_error";
}

} // namespace pyexec
