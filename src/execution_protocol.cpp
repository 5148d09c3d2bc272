#include "execution_protocol.h"
#include "encoding.h"
#include "process.h"
#include "constants.h"
#include <json/json.h>
#include <poll.h>
#include <unistd.h>
#include <cerrno>
#include <cstring>
#include <sstream>
#include <iostream>
#include <algorithm>

namespace pyexec {

namespace {

constexpr size_t STDERR_TAIL_BYTES = 4096;

int remaining_ms(std::chrono::steady_clock::time_point deadline) {
    auto left = std::chrono::duration_cast<std::chrono::milliseconds>(
        deadline - std::chrono::steady_clock::now()).count();
    return left > 0 ? static_cast<int>(std::min<long long>(left, 1 << 30)) : 0;
}

void append_tail(std::string& tail, const char* data, size_t len) {
    tail.append(data, len);
    if (tail.size() > STDERR_TAIL_BYTES) {
        tail.erase(0, tail.size() - STDERR_TAIL_BYTES);
    }
}

} // namespace

const char* to_string(EventType type) {
    switch (type) {
        case EventType::STDOUT: return "stdout";
        case EventType::STDERR: return "stderr";
        case EventType::RESULT: return "result";
        case EventType::EXCEPTION: return "exception";
        case EventType::IMAGE: return "image";
        case EventType::END: return "end";
    }
    return "unknown";
}

const char* to_string(ProtocolStatus status) {
    switch (status) {
        case ProtocolStatus::COMPLETED: return "completed";
        case ProtocolStatus::TIMED_OUT: return "timed_out";
        case ProtocolStatus::FAILED: return "failed";
        case ProtocolStatus::OUTPUT_LIMIT: return "output_limit";
    }
    return "unknown";
}

std::optional<EventType> parse_event_type(const std::string& name) {
    static const std::pair<const char*, EventType> names[] = {
        {"stdout", EventType::STDOUT},
        {"stderr", EventType::STDERR},
        {"result", EventType::RESULT},
        {"exception", EventType::EXCEPTION},
        {"image", EventType::IMAGE},
        {"end", EventType::END}
    };
    for (const auto& [text, type] : names) {
        if (name == text) {
            return type;
        }
    }
    return std::nullopt;
}

ExecutionProtocol::ExecutionProtocol(size_t raw_byte_cap, size_t max_frame_bytes)
    : raw_byte_cap_(raw_byte_cap), max_frame_bytes_(max_frame_bytes) {}

RawEvent ExecutionProtocol::parse_frame(const std::string& line) {
    Json::Value frame;
    Json::CharReaderBuilder builder;
    std::string errors;
    std::istringstream stream(line);

    if (!Json::parseFromStream(builder, stream, &frame, &errors)) {
        throw ProtocolError("frame is not valid JSON");
    }
    if (!frame.isObject() || !frame["type"].isString()) {
        throw ProtocolError("frame has no type");
    }

    auto type = parse_event_type(frame["type"].asString());
    if (!type) {
        throw ProtocolError("unknown frame type '" + frame["type"].asString() + "'");
    }

    RawEvent event{*type, ""};
    if (*type == EventType::END) {
        return event;
    }

    const Json::Value& data = frame["data"];
    if (!data.isString()) {
        throw ProtocolError(std::string(to_string(*type)) + " frame data is not a string");
    }

    if (*type == EventType::IMAGE) {
        std::vector<unsigned char> png;
        if (!Encoding::base64_decode(data.asString(), png)) {
            throw ProtocolError("image frame is not valid base64");
        }
        event.data.assign(png.begin(), png.end());
    } else {
        event.data = data.asString();
    }
    return event;
}

bool ExecutionProtocol::write_code(SandboxHandle& sandbox, const std::string& code,
                                   std::chrono::steady_clock::time_point deadline) {
    int fd = sandbox.input_fd();
    if (fd < 0) {
        return true;
    }
    set_nonblocking(fd);

    size_t written = 0;
    while (written < code.size()) {
        int wait = remaining_ms(deadline);
        if (wait == 0) {
            return false;
        }

        struct pollfd pfd = {fd, POLLOUT, 0};
        int ready = poll(&pfd, 1, std::min(wait, PROTOCOL_POLL_SLICE_MS));
        if (ready < 0) {
            if (errno == EINTR) continue;
            break;
        }
        if (ready == 0) {
            continue;
        }
        if (pfd.revents & (POLLERR | POLLHUP)) {
            // Runner went away; whatever it printed is still read below
            break;
        }

        ssize_t n = write(fd, code.data() + written, code.size() - written);
        if (n < 0) {
            if (errno == EAGAIN || errno == EINTR) continue;
            break;
        }
        written += static_cast<size_t>(n);
    }

    sandbox.close_input();
    return true;
}

ProtocolOutcome ExecutionProtocol::run(SandboxHandle& sandbox, const std::string& code,
                                       std::chrono::steady_clock::time_point deadline) {
    ProtocolOutcome outcome;

    if (!write_code(sandbox, code, deadline)) {
        sandbox.close_input();
        outcome.status = ProtocolStatus::TIMED_OUT;
        return outcome;
    }

    int out_fd = sandbox.output_fd();
    int diag_fd = sandbox.diagnostic_fd();
    if (diag_fd >= 0) {
        set_nonblocking(diag_fd);
    }

    std::string pending;
    size_t collected = 0;
    char buffer[PIPE_BUFFER_SIZE];

    while (true) {
        int wait = remaining_ms(deadline);
        if (wait == 0) {
            outcome.status = ProtocolStatus::TIMED_OUT;
            return outcome;
        }

        struct pollfd fds[2] = {
            {out_fd, POLLIN, 0},
            {diag_fd, POLLIN, 0}    // Negative fds are ignored by poll
        };
        int ready = poll(fds, 2, std::min(wait, PROTOCOL_POLL_SLICE_MS));
        if (ready < 0) {
            if (errno == EINTR) continue;
            outcome.status = ProtocolStatus::FAILED;
            outcome.diagnostic = std::string("poll: ") + std::strerror(errno);
            return outcome;
        }
        if (ready == 0) {
            continue;
        }

        if (diag_fd >= 0 && (fds[1].revents & (POLLIN | POLLHUP | POLLERR))) {
            ssize_t n = read(diag_fd, buffer, sizeof(buffer));
            if (n > 0) {
                append_tail(outcome.stderr_tail, buffer, static_cast<size_t>(n));
            } else if (n == 0 || (errno != EAGAIN && errno != EINTR)) {
                diag_fd = -1;
            }
        }

        if (!(fds[0].revents & (POLLIN | POLLHUP | POLLERR))) {
            continue;
        }

        ssize_t n = read(out_fd, buffer, sizeof(buffer));
        if (n < 0) {
            if (errno == EAGAIN || errno == EINTR) continue;
            outcome.status = ProtocolStatus::FAILED;
            outcome.diagnostic = std::string("read: ") + std::strerror(errno);
            return outcome;
        }
        if (n == 0) {
            outcome.status = ProtocolStatus::FAILED;
            outcome.diagnostic = pending.empty()
                ? "stream ended before end marker"
                : "stream ended inside a frame";
            return outcome;
        }

        pending.append(buffer, static_cast<size_t>(n));

        size_t newline;
        while ((newline = pending.find('\n')) != std::string::npos) {
            std::string line = pending.substr(0, newline);
            pending.erase(0, newline + 1);
            if (line.empty() || line == "\r") {
                continue;
            }

            RawEvent event;
            try {
                event = parse_frame(line);
            } catch (const ProtocolError& e) {
                outcome.status = ProtocolStatus::FAILED;
                outcome.diagnostic = e.what();
                return outcome;
            }

            if (event.type == EventType::END) {
                outcome.status = ProtocolStatus::COMPLETED;
                return outcome;
            }

            collected += event.data.size();
            outcome.events.push_back(std::move(event));
            if (collected >= raw_byte_cap_) {
                outcome.status = ProtocolStatus::OUTPUT_LIMIT;
                return outcome;
            }
        }

        if (pending.size() > max_frame_bytes_) {
            outcome.status = ProtocolStatus::FAILED;
            outcome.diagnostic = "frame exceeds " + std::to_string(max_frame_bytes_) + " bytes";
            return outcome;
        }
    }
}

} // namespace pyexec
