#pragma once

#include "call_executor.hpp"
#include "call_result.hpp"
#include <chrono>
#include <condition_variable>
#include <deque>
#include <memory>
#include <mutex>
#include <optional>
#include <vector>

namespace elector {

// Fan-in point for the calls of one request. Workers append each result
// exactly once; the aggregator pops them in the order they were appended,
// which is the order the calls finished.
class InFlightCalls {
public:
    InFlightCalls(size_t dispatched, std::chrono::steady_clock::time_point started_at);

    void complete(CallResult result);

    // Next finished call, or nullopt once deadline passes with nothing ready
    std::optional<CallResult> next_until(std::chrono::steady_clock::time_point deadline);

    size_t dispatched() const { return dispatched_; }

    std::chrono::steady_clock::time_point started_at() const { return started_at_; }

private:
    const size_t dispatched_;
    const std::chrono::steady_clock::time_point started_at_;

    std::mutex mutex_;
    std::condition_variable ready_cv_;
    std::deque<CallResult> ready_;
};

class Dispatcher {
public:
    explicit Dispatcher(std::shared_ptr<const CallExecutor> executor);

    // Starts one call per target and returns immediately
    std::shared_ptr<InFlightCalls> dispatch(const std::vector<BackendTarget>& targets,
                                            const std::string& body) const;

private:
    std::shared_ptr<const CallExecutor> executor_;
};

} // namespace elector
