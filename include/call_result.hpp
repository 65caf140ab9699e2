#pragma once

#include "backend_registry.hpp"
#include <chrono>
#include <string>
#include <string_view>
#include <vector>

namespace elector {

enum class CallOutcome {
    Success,
    Timeout,
    Error
};

std::string_view to_string(CallOutcome outcome);

// Terminal result of one backend call. payload is set only for Success,
// reason only for Timeout and Error.
struct CallResult {
    BackendTarget target;
    CallOutcome outcome;
    std::string payload;
    std::string reason;
    std::chrono::milliseconds elapsed{0};

    static CallResult success(BackendTarget target, std::string payload,
                              std::chrono::milliseconds elapsed);
    static CallResult timeout(BackendTarget target, std::string reason,
                              std::chrono::milliseconds elapsed);
    static CallResult error(BackendTarget target, std::string reason,
                            std::chrono::milliseconds elapsed);

    bool is_success() const { return outcome == CallOutcome::Success; }
};

// Results in the order the calls finished, not the order they were sent.
struct AggregateOutcome {
    std::vector<CallResult> results;
    size_t dispatched = 0;
    bool deadline_exceeded = false;

    size_t pending() const { return dispatched - results.size(); }
};

} // namespace elector
