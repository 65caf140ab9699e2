#include "dispatcher.hpp"
#include "logger.hpp"
#include <spdlog/fmt/fmt.h>
#include <system_error>
#include <thread>

namespace elector {

InFlightCalls::InFlightCalls(size_t dispatched, std::chrono::steady_clock::time_point started_at)
    : dispatched_(dispatched), started_at_(started_at) {}

void InFlightCalls::complete(CallResult result) {
    {
        std::lock_guard lock(mutex_);
        ready_.push_back(std::move(result));
    }
    ready_cv_.notify_one();
}

std::optional<CallResult> InFlightCalls::next_until(std::chrono::steady_clock::time_point deadline) {
    std::unique_lock lock(mutex_);
    if (!ready_cv_.wait_until(lock, deadline, [this] { return !ready_.empty(); })) {
        return std::nullopt;
    }
    CallResult result = std::move(ready_.front());
    ready_.pop_front();
    return result;
}

Dispatcher::Dispatcher(std::shared_ptr<const CallExecutor> executor)
    : executor_(std::move(executor)) {}

std::shared_ptr<InFlightCalls> Dispatcher::dispatch(const std::vector<BackendTarget>& targets,
                                                    const std::string& body) const {
    auto started_at = std::chrono::steady_clock::now();
    auto calls = std::make_shared<InFlightCalls>(targets.size(), started_at);

    Logger::info(Logger::Component::Dispatch,
        fmt::format("Dispatching to {} backends", targets.size()));

    for (const auto& target : targets) {
        try {
            std::thread([executor = executor_, calls, target, body]() {
                calls->complete(executor->execute(target, body));
            }).detach();
        } catch (const std::system_error& e) {
            Logger::error(Logger::Component::Dispatch,
                fmt::format("Could not start call to {}: {}", target.name, e.what()));
            calls->complete(CallResult::error(target,
                fmt::format("failed to start call: {}", e.what()),
                std::chrono::duration_cast<std::chrono::milliseconds>(
                    std::chrono::steady_clock::now() - started_at)));
        }
    }

    return calls;
}

} // namespace elector
