#pragma once

#include "backend_transport.hpp"
#include "call_result.hpp"
#include <chrono>
#include <memory>
#include <string>

namespace elector {

class CallExecutor {
public:
    CallExecutor(std::shared_ptr<BackendTransport> transport,
                 std::chrono::milliseconds call_timeout);

    // Blocks for at most call_timeout. Never throws: transport failures,
    // non-2xx statuses and timeouts all come back as a tagged CallResult.
    // A transport still running when the timeout fires keeps going on its
    // own detached thread and whatever it eventually returns is discarded.
    // The transport is handed call_timeout as its own connect/read/write
    // limit, so an abandoned thread ends within a small multiple of it.
    // Live transport threads are bounded by backends x in-flight requests.
    CallResult execute(const BackendTarget& target, const std::string& body) const;

private:
    std::shared_ptr<BackendTransport> transport_;
    std::chrono::milliseconds call_timeout_;
};

} // namespace elector
