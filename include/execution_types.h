#pragma once

#include <string>
#include <vector>
#include <chrono>
#include <optional>
#include <stdexcept>

namespace pyexec {

// Kind of a single output record
enum class OutputKind {
    TEXT,       // stdout and result values
    ERROR,      // stderr, exceptions and tracebacks
    IMAGE       // rendered plot, base64 PNG
};

// One typed unit of captured output
struct OutputRecord {
    OutputKind kind;
    std::string data;           // UTF-8 for TEXT/ERROR, base64 for IMAGE

    static OutputRecord text(std::string data) { return {OutputKind::TEXT, std::move(data)}; }
    static OutputRecord error(std::string data) { return {OutputKind::ERROR, std::move(data)}; }
    static OutputRecord image(std::string data) { return {OutputKind::IMAGE, std::move(data)}; }

    bool operator==(const OutputRecord& other) const {
        return kind == other.kind && data == other.data;
    }
};

enum class ExecutionStatus {
    COMPLETED,
    TIMED_OUT,
    FAILED
};

struct ExecutionResult {
    std::vector<OutputRecord> records;
    bool truncated = false;
    ExecutionStatus status = ExecutionStatus::COMPLETED;
    std::string diagnostic;                     // Protocol failure detail (FAILED only)
    std::chrono::milliseconds wall_time{0};

    // Sum of payload sizes, the quantity the output budget bounds
    size_t payload_bytes() const {
        size_t total = 0;
        for (const auto& record : records) {
            total += record.data.size();
        }
        return total;
    }
};

// Per-sandbox resource ceiling
struct ResourceLimits {
    size_t memory_mb = 512;
    double cpu_share = 0.5;                     // Fraction of one CPU
    size_t max_pids = 64;
};

struct ExecutionRequest {
    std::string code;
    std::optional<std::string> session_id;
    std::chrono::milliseconds deadline{30 * 1000};
    ResourceLimits limits;
    size_t output_budget = 1024 * 1024;
};

enum class ErrorCategory {
    NONE,
    AUTH_ERROR,
    PROVISION_ERROR,
    TIMEOUT_ERROR,
    PROTOCOL_ERROR,
    GUEST_EXECUTION_ERROR,
    OUTPUT_LIMIT_EXCEEDED,
    INTERNAL_ERROR
};

const char* to_string(OutputKind kind);
const char* to_string(ExecutionStatus status);
const char* to_string(ErrorCategory category);

// Workspace or sandbox could not be provisioned
class ProvisionError : public std::runtime_error {
public:
    explicit ProvisionError(const std::string& message)
        : std::runtime_error("Provisioning failed: " + message) {}
};

// Sandbox emitted malformed or truncated framing
class ProtocolError : public std::runtime_error {
public:
    explicit ProtocolError(const std::string& message)
        : std::runtime_error("Protocol error: " + message) {}
};

} // namespace pyexec
