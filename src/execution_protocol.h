#pragma once

#include "sandbox_launcher.h"
#include "constants.h"
#include <string>
#include <vector>
#include <chrono>
#include <optional>

namespace pyexec {

// Frame types emitted by the guest runner
enum class EventType {
    STDOUT,
    STDERR,
    RESULT,         // Value of the last expression
    EXCEPTION,      // Uncaught exception with traceback
    IMAGE,          // Rendered figure, data holds raw PNG bytes
    END
};

struct RawEvent {
    EventType type;
    std::string data;   // Decoded payload (image base64 is already decoded)

    bool operator==(const RawEvent& other) const {
        return type == other.type && data == other.data;
    }
};

enum class ProtocolStatus {
    COMPLETED,      // end frame observed
    TIMED_OUT,      // deadline elapsed first
    FAILED,         // malformed or truncated framing
    OUTPUT_LIMIT    // collected bytes reached the cap
};

struct ProtocolOutcome {
    ProtocolStatus status = ProtocolStatus::FAILED;
    std::vector<RawEvent> events;   // In emission order, END excluded
    std::string diagnostic;         // Why framing failed
    std::string stderr_tail;        // Last bytes of the runtime's own stderr
};

const char* to_string(EventType type);
const char* to_string(ProtocolStatus status);
std::optional<EventType> parse_event_type(const std::string& name);

/**
 * Request/response framing over a sandbox's streams.
 *
 *   host -> sandbox   guest code on stdin, then EOF
 *   sandbox -> host   {"type": "...", "data": "..."}\n  ...  {"type": "end"}\n
 *
 * Reading stops at the end frame, at EOF, at the deadline or at the raw
 * byte cap, whichever comes first.
 */
class ExecutionProtocol {
public:
    explicit ExecutionProtocol(size_t raw_byte_cap,
                               size_t max_frame_bytes = MAX_FRAME_BYTES);

    ProtocolOutcome run(SandboxHandle& sandbox, const std::string& code,
                        std::chrono::steady_clock::time_point deadline);

    // Parse one frame line. Throws ProtocolError on malformed input.
    static RawEvent parse_frame(const std::string& line);

private:
    bool write_code(SandboxHandle& sandbox, const std::string& code,
                    std::chrono::steady_clock::time_point deadline);

    size_t raw_byte_cap_;
    size_t max_frame_bytes_;
};

} // namespace pyexec
