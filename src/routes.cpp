#include "routes.hpp"
#include "feature_vector.hpp"
#include "logger.hpp"
#include <nlohmann/json.hpp>
#include <spdlog/fmt/fmt.h>
#include <chrono>

using json = nlohmann::json;

namespace elector {

namespace {

void reply_error(httplib::Response& res, int status, const std::string& message) {
    res.status = status;
    res.set_content(json{{"error", message}}.dump(), "application/json");
}

} // namespace

int status_for(ElectionError error) {
    switch (error) {
        case ElectionError::InvalidRequest: return 400;
        case ElectionError::NoBackendAvailable: return 503;
        case ElectionError::DecodeError: return 500;
    }
    return 500;
}

void register_routes(httplib::Server& server, const Elector<PrimaryPreferencePolicy>& coordinator) {
    server.Get("/health", [](const httplib::Request&, httplib::Response& res) {
        res.set_content(R"({"status": "healthy", "service": "elector"})", "application/json");
    });

    server.Post("/predict", [&coordinator](const httplib::Request& req, httplib::Response& res) {
        auto start_time = std::chrono::steady_clock::now();

        Logger::info(Logger::Component::Request,
            fmt::format("Client {} → {} {}", req.remote_addr, req.method, req.path));

        auto features = FeatureVector::parse(req.body);
        if (!features.has_value()) {
            Logger::warn(Logger::Component::Request,
                fmt::format("Rejected request: {}", features.error()));
            reply_error(res, status_for(ElectionError::InvalidRequest), features.error());
            return;
        }

        auto reply = coordinator.predict(features.value());

        auto duration_ms = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - start_time).count();

        if (!reply.has_value()) {
            int status = status_for(reply.error());
            reply_error(res, status, std::string(to_string(reply.error())));
            Logger::error(Logger::Component::Response,
                fmt::format("{} → Client ({}ms): {}", status, duration_ms, to_string(reply.error())));
            return;
        }

        res.set_header("X-Elected-Backend", reply->source.name);
        res.set_content(reply->body.dump(), "application/json");

        Logger::info(Logger::Component::Response,
            fmt::format("200 → Client ({}ms) via backend {}", duration_ms, reply->source.name));
    });
}

} // namespace elector
