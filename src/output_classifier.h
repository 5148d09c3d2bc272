#pragma once

#include "execution_types.h"
#include "execution_protocol.h"
#include <vector>

namespace pyexec {

// Maps raw protocol events onto text/error/image records under a cumulative
// payload byte budget. Emission order is kept.
class OutputClassifier {
public:
    explicit OutputClassifier(size_t budget_bytes);

    // Status is left COMPLETED; the caller sets it from the protocol outcome
    ExecutionResult classify(const std::vector<RawEvent>& events) const;

    static OutputKind kind_of(EventType type);

private:
    size_t budget_bytes_;
};

} // namespace pyexec
