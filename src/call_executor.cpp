#include "call_executor.hpp"
#include "logger.hpp"
#include <spdlog/fmt/fmt.h>
#include <future>
#include <system_error>
#include <thread>

namespace elector {

namespace {

std::chrono::milliseconds elapsed_since(std::chrono::steady_clock::time_point start) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start);
}

void log_result(const CallResult& result) {
    auto message = fmt::format("Backend {} ({}): {} ({}ms){}",
        result.target.name, result.target.base_url, to_string(result.outcome),
        result.elapsed.count(),
        result.reason.empty() ? "" : " - " + result.reason);

    switch (result.outcome) {
        case CallOutcome::Success:
            Logger::info(Logger::Component::Call, message);
            break;
        case CallOutcome::Timeout:
            Logger::warn(Logger::Component::Call, message);
            break;
        case CallOutcome::Error:
            Logger::error(Logger::Component::Call, message);
            break;
    }
}

} // namespace

CallExecutor::CallExecutor(std::shared_ptr<BackendTransport> transport,
                           std::chrono::milliseconds call_timeout)
    : transport_(std::move(transport)), call_timeout_(call_timeout) {}

CallResult CallExecutor::execute(const BackendTarget& target, const std::string& body) const {
    auto start = std::chrono::steady_clock::now();

    Logger::debug(Logger::Component::Call,
        fmt::format("Calling {} ({})", target.name, target.base_url));

    // The promise is shared with the transport thread so an abandoned call
    // can still complete into it after we stop waiting.
    auto promise = std::make_shared<std::promise<TransportResult>>();
    auto future = promise->get_future();

    try {
        std::thread([transport = transport_, target, body, timeout = call_timeout_, promise]() {
            try {
                promise->set_value(transport->post_predict(target, body, timeout));
            } catch (const std::exception& e) {
                promise->set_value(std::unexpected(TransportFailure{false, e.what()}));
            }
        }).detach();
    } catch (const std::system_error& e) {
        auto result = CallResult::error(target,
            fmt::format("failed to start call: {}", e.what()), elapsed_since(start));
        log_result(result);
        return result;
    }

    CallResult result = [&]() {
        if (future.wait_for(call_timeout_) == std::future_status::timeout) {
            return CallResult::timeout(target,
                fmt::format("no response within {}ms", call_timeout_.count()),
                elapsed_since(start));
        }

        TransportResult response = future.get();
        if (response.has_value()) {
            return CallResult::success(target, std::move(response.value()), elapsed_since(start));
        }
        if (response.error().timed_out) {
            return CallResult::timeout(target, response.error().reason, elapsed_since(start));
        }
        return CallResult::error(target, response.error().reason, elapsed_since(start));
    }();

    log_result(result);
    return result;
}

} // namespace elector
