#pragma once

#include "call_result.hpp"
#include "dispatcher.hpp"
#include <chrono>

namespace elector {

class Aggregator {
public:
    explicit Aggregator(std::chrono::milliseconds total_timeout);

    // Collects results in completion order until every call has reported or
    // total_timeout has elapsed since dispatch. Hitting the deadline is not an
    // error: whatever arrived in time is returned and stragglers are ignored.
    AggregateOutcome collect(InFlightCalls& calls) const;

private:
    std::chrono::milliseconds total_timeout_;
};

} // namespace elector
