#pragma once

#include "aggregator.hpp"
#include "backend_registry.hpp"
#include "dispatcher.hpp"
#include "feature_vector.hpp"
#include "logger.hpp"
#include "selection_policy.hpp"
#include <expected>
#include <memory>
#include <string>
#include <nlohmann/json.hpp>
#include <spdlog/fmt/fmt.h>

namespace elector {

struct ElectionReply {
    nlohmann::json body;
    BackendTarget source;
};

template<SelectionPolicy Policy>
class Elector {
public:
    Elector(std::shared_ptr<const BackendRegistry> registry, Dispatcher dispatcher,
            Aggregator aggregator)
        : registry_(std::move(registry)), dispatcher_(std::move(dispatcher)),
          aggregator_(aggregator), policy_() {}

    // Scatter body to every backend, gather what arrives before the deadline
    // and let the policy pick one payload.
    Decision elect(const std::string& body) const {
        auto calls = dispatcher_.dispatch(registry_->targets(), body);
        AggregateOutcome outcome = aggregator_.collect(*calls);
        Decision decision = policy_.select(outcome);

        auto elapsed_ms = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - calls->started_at()).count();

        if (decision.has_value()) {
            Logger::info(Logger::Component::Selection,
                fmt::format("Selected {}{} ({} of {} collected, {}ms)",
                    decision->source.name, decision->source.is_primary ? " [primary]" : "",
                    outcome.results.size(), outcome.dispatched, elapsed_ms));
        } else {
            Logger::error(Logger::Component::Selection,
                fmt::format("No backend available ({} of {} collected, {}ms)",
                    outcome.results.size(), outcome.dispatched, elapsed_ms));
        }

        return decision;
    }

    // elect() plus decoding of the winning payload. A payload that is not JSON
    // is a DecodeError, distinct from every backend failing.
    std::expected<ElectionReply, ElectionError> predict(const FeatureVector& features) const {
        auto decision = elect(features.to_json().dump());
        if (!decision.has_value()) {
            return std::unexpected(decision.error());
        }

        try {
            return ElectionReply{nlohmann::json::parse(decision->payload), decision->source};
        } catch (const nlohmann::json::parse_error& e) {
            Logger::error(Logger::Component::Selection,
                fmt::format("Payload from {} could not be decoded: {}",
                    decision->source.name, e.what()));
            return std::unexpected(ElectionError::DecodeError);
        }
    }

private:
    std::shared_ptr<const BackendRegistry> registry_;
    Dispatcher dispatcher_;
    Aggregator aggregator_;
    Policy policy_;
};

} // namespace elector
