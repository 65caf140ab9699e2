#pragma once

#include "call_result.hpp"
#include <chrono>
#include <concepts>
#include <expected>
#include <string>
#include <string_view>

namespace elector {

enum class ElectionError {
    InvalidRequest,
    NoBackendAvailable,
    DecodeError
};

std::string_view to_string(ElectionError error);

struct Selection {
    std::string payload;
    BackendTarget source;
    std::chrono::milliseconds elapsed;
};

using Decision = std::expected<Selection, ElectionError>;

// Base concept for selection policies (C++20 concept)
template<typename T>
concept SelectionPolicy = requires(const T policy, const AggregateOutcome& outcome) {
    { policy.select(outcome) } -> std::same_as<Decision>;
};

// Primary wins whenever it succeeded, however late it finished. Otherwise the
// first success in completion order wins.
class PrimaryPreferencePolicy {
public:
    Decision select(const AggregateOutcome& outcome) const;
};

} // namespace elector
