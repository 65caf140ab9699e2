#include "call_result.hpp"

namespace elector {

std::string_view to_string(CallOutcome outcome) {
    switch (outcome) {
        case CallOutcome::Success: return "SUCCESS";
        case CallOutcome::Timeout: return "TIMEOUT";
        case CallOutcome::Error: return "ERROR";
    }
    return "UNKNOWN";
}

CallResult CallResult::success(BackendTarget target, std::string payload,
                               std::chrono::milliseconds elapsed) {
    return CallResult{std::move(target), CallOutcome::Success, std::move(payload), "", elapsed};
}

CallResult CallResult::timeout(BackendTarget target, std::string reason,
                               std::chrono::milliseconds elapsed) {
    return CallResult{std::move(target), CallOutcome::Timeout, "", std::move(reason), elapsed};
}

CallResult CallResult::error(BackendTarget target, std::string reason,
                             std::chrono::milliseconds elapsed) {
    return CallResult{std::move(target), CallOutcome::Error, "", std::move(reason), elapsed};
}

} // namespace elector
