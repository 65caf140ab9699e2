#include "backend_transport.hpp"
#include <httplib.h>
#include <spdlog/fmt/fmt.h>
#include <stdexcept>

namespace elector {

TransportResult HttpTransport::post_predict(const BackendTarget& target,
                                            const std::string& body,
                                            std::chrono::milliseconds timeout) {
    try {
        return send(target, body, timeout);
    } catch (const std::invalid_argument& e) {
        // httplib rejects unsupported schemes by throwing from the client constructor
        return std::unexpected(TransportFailure{
            false, fmt::format("invalid base url '{}': {}", target.base_url, e.what())});
    } catch (const std::exception& e) {
        return std::unexpected(TransportFailure{false, e.what()});
    }
}

TransportResult HttpTransport::send(const BackendTarget& target,
                                    const std::string& body,
                                    std::chrono::milliseconds timeout) {
    auto url = split_base_url(target.base_url);
    if (!url.has_value()) {
        return std::unexpected(TransportFailure{
            false, fmt::format("invalid base url: {}", url.error())});
    }

    httplib::Client client(url->origin);
    if (!client.is_valid()) {
        return std::unexpected(TransportFailure{
            false, fmt::format("invalid base url '{}'", target.base_url)});
    }

    client.set_connection_timeout(timeout);
    client.set_read_timeout(timeout);
    client.set_write_timeout(timeout);

    std::string path = url->path_prefix + kPredictPath;
    auto res = client.Post(path, body, "application/json");

    if (!res) {
        auto err = res.error();
        return std::unexpected(TransportFailure{
            err == httplib::Error::ConnectionTimeout,
            fmt::format("{} failed: {}", path, httplib::to_string(err))});
    }

    if (res->status < 200 || res->status >= 300) {
        return std::unexpected(TransportFailure{
            false, fmt::format("HTTP {}", res->status)});
    }

    return res->body;
}

} // namespace elector
