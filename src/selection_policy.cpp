#include "selection_policy.hpp"
#include <algorithm>

namespace elector {

std::string_view to_string(ElectionError error) {
    switch (error) {
        case ElectionError::InvalidRequest: return "invalid request";
        case ElectionError::NoBackendAvailable: return "no backend available";
        case ElectionError::DecodeError: return "backend payload is not valid JSON";
    }
    return "unknown error";
}

Decision PrimaryPreferencePolicy::select(const AggregateOutcome& outcome) const {
    const auto& results = outcome.results;

    auto primary = std::find_if(results.begin(), results.end(), [](const CallResult& r) {
        return r.target.is_primary && r.is_success();
    });

    auto chosen = primary != results.end()
        ? primary
        : std::find_if(results.begin(), results.end(), [](const CallResult& r) {
              return r.is_success();
          });

    if (chosen == results.end()) {
        return std::unexpected(ElectionError::NoBackendAvailable);
    }

    return Selection{chosen->payload, chosen->target, chosen->elapsed};
}

} // namespace elector
