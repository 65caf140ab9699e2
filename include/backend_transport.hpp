#pragma once

#include "backend_registry.hpp"
#include <chrono>
#include <expected>
#include <string>

namespace elector {

struct TransportFailure {
    bool timed_out;
    std::string reason;
};

using TransportResult = std::expected<std::string, TransportFailure>;

// One outbound POST {base_url}/predict. Implementations must be safe to call
// from several threads at once.
class BackendTransport {
public:
    virtual ~BackendTransport() = default;

    virtual TransportResult post_predict(const BackendTarget& target,
                                         const std::string& body,
                                         std::chrono::milliseconds timeout) = 0;
};

class HttpTransport : public BackendTransport {
public:
    static constexpr const char* kPredictPath = "/predict";

    TransportResult post_predict(const BackendTarget& target,
                                 const std::string& body,
                                 std::chrono::milliseconds timeout) override;

private:
    TransportResult send(const BackendTarget& target,
                         const std::string& body,
                         std::chrono::milliseconds timeout);
};

} // namespace elector
