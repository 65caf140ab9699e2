#include "feature_vector.hpp"
#include "logger.hpp"
#include "stub_predictor.hpp"
#include <httplib.h>
#include <nlohmann/json.hpp>
#include <spdlog/fmt/fmt.h>
#include <iostream>
#include <csignal>
#include <atomic>
#include <thread>

using json = nlohmann::json;
using namespace elector;

std::atomic<bool> shutdown_requested{false};

void signal_handler(int signal) {
    if (signal == SIGINT || signal == SIGTERM) {
        shutdown_requested.store(true);
    }
}

int main(int argc, char* argv[]) {
    if (argc < 3) {
        std::cerr << "Usage: " << argv[0] << " <port> <model_name> [delay_ms] [--fail]" << std::endl;
        return 1;
    }

    int port = 0;
    int delay_ms = 0;
    bool always_fail = false;
    try {
        port = std::stoi(argv[1]);
        for (int i = 3; i < argc; ++i) {
            std::string arg = argv[i];
            if (arg == "--fail") {
                always_fail = true;
            } else {
                delay_ms = std::stoi(arg);
            }
        }
    } catch (const std::exception& e) {
        std::cerr << "Invalid argument: " << e.what() << std::endl;
        return 1;
    }

    const StubPredictor predictor(argv[2]);

    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);

    Logger::init("predictor.log", "INFO", true, port);

    Logger::info(Logger::Component::Predictor,
        fmt::format("{} started on port {} (delay {}ms{})",
            predictor.model_type(), port, delay_ms, always_fail ? ", failing" : ""));

    httplib::Server server;

    server.Get("/health", [&predictor](const httplib::Request& req, httplib::Response& res) {
        Logger::debug(Logger::Component::Predictor,
            fmt::format("Health check from {}", req.remote_addr));
        res.set_content(predictor.health().dump(), "application/json");
    });

    server.Get("/metadata", [&predictor](const httplib::Request&, httplib::Response& res) {
        res.set_content(predictor.metadata().dump(), "application/json");
    });

    server.Post("/predict", [&predictor, delay_ms, always_fail](const httplib::Request& req,
                                                               httplib::Response& res) {
        auto start_time = std::chrono::steady_clock::now();

        Logger::info(Logger::Component::Request,
            fmt::format("{} {} from {}", req.method, req.path, req.remote_addr));

        if (delay_ms > 0) {
            std::this_thread::sleep_for(std::chrono::milliseconds(delay_ms));
        }

        if (always_fail) {
            res.status = 500;
            res.set_content(R"({"error": "Prediction failed"})", "application/json");
            Logger::warn(Logger::Component::Response, "500 forced failure");
            return;
        }

        auto features = FeatureVector::parse(req.body);
        if (!features.has_value()) {
            res.status = 400;
            res.set_content(json{{"error", features.error()}}.dump(), "application/json");
            Logger::warn(Logger::Component::Response, "400 " + features.error());
            return;
        }

        json prediction = predictor.predict(features.value());
        res.set_content(prediction.dump(), "application/json");

        auto duration_ms = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - start_time).count();

        Logger::info(Logger::Component::Response,
            fmt::format("200 OK species={} ({}ms)",
                prediction["predictions"]["predicted_species"].get<std::string>(), duration_ms));
    });

    std::cout << fmt::format("Predictor '{}' started on port {}\n", predictor.model_type(), port);
    std::cout << "Press Ctrl+C to stop\n";

    std::thread server_thread([&]() {
        server.listen("0.0.0.0", port);
    });

    while (!shutdown_requested.load()) {
        std::this_thread::sleep_for(std::chrono::milliseconds(100));
    }

    std::cout << "\nShutting down predictor...\n";
    Logger::info(Logger::Component::Predictor,
        fmt::format("Predictor on port {} shutting down", port));

    server.stop();

    if (server_thread.joinable()) {
        server_thread.join();
    }

    Logger::shutdown();

    return 0;
}
