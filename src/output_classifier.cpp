#include "output_classifier.h"
#include "encoding.h"
#include <stdexcept>

namespace pyexec {

OutputClassifier::OutputClassifier(size_t budget_bytes) : budget_bytes_(budget_bytes) {}

OutputKind OutputClassifier::kind_of(EventType type) {
    switch (type) {
        case EventType::STDOUT:
        case EventType::RESULT:
            return OutputKind::TEXT;
        case EventType::STDERR:
        case EventType::EXCEPTION:
            return OutputKind::ERROR;
        case EventType::IMAGE:
            return OutputKind::IMAGE;
        case EventType::END:
            break;
    }
    throw std::invalid_argument("end marker carries no output");
}

ExecutionResult OutputClassifier::classify(const std::vector<RawEvent>& events) const {
    ExecutionResult result;
    size_t used = 0;

    for (const auto& event : events) {
        if (event.type == EventType::END) {
            continue;
        }

        OutputKind kind = kind_of(event.type);
        std::string payload = kind == OutputKind::IMAGE
            ? Encoding::base64_encode(event.data)
            : event.data;
        if (payload.empty()) {
            continue;
        }

        size_t remaining = budget_bytes_ - used;
        if (payload.size() <= remaining) {
            used += payload.size();
            result.records.push_back({kind, std::move(payload)});
            continue;
        }

        // Budget reached: keep what fits of a text record, never half an image
        if (kind != OutputKind::IMAGE) {
            size_t keep = Encoding::utf8_prefix_length(payload, remaining);
            if (keep > 0) {
                payload.resize(keep);
                result.records.push_back({kind, std::move(payload)});
            }
        }
        result.truncated = true;
        break;
    }

    return result;
}

} // namespace pyexec
