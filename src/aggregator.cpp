#include "aggregator.hpp"
#include "logger.hpp"
#include <spdlog/fmt/fmt.h>

namespace elector {

Aggregator::Aggregator(std::chrono::milliseconds total_timeout)
    : total_timeout_(total_timeout) {}

AggregateOutcome Aggregator::collect(InFlightCalls& calls) const {
    AggregateOutcome outcome;
    outcome.dispatched = calls.dispatched();
    outcome.results.reserve(calls.dispatched());

    auto deadline = calls.started_at() + total_timeout_;

    while (outcome.results.size() < outcome.dispatched) {
        auto result = calls.next_until(deadline);
        if (!result.has_value()) {
            outcome.deadline_exceeded = true;
            Logger::warn(Logger::Component::Aggregate,
                fmt::format("Deadline of {}ms exceeded, {} of {} calls still pending",
                    total_timeout_.count(), outcome.pending(), outcome.dispatched));
            break;
        }

        Logger::debug(Logger::Component::Aggregate,
            fmt::format("Collected {} from {} ({}/{})",
                to_string(result->outcome), result->target.name,
                outcome.results.size() + 1, outcome.dispatched));
        outcome.results.push_back(std::move(result.value()));
    }

    return outcome;
}

} // namespace elector
