#include "aggregator.hpp"
#include "backend_registry.hpp"
#include "backend_transport.hpp"
#include "call_executor.hpp"
#include "config_loader.hpp"
#include "dispatcher.hpp"
#include "elector.hpp"
#include "logger.hpp"
#include "routes.hpp"
#include "selection_policy.hpp"
#include <httplib.h>
#include <csignal>
#include <atomic>
#include <spdlog/fmt/fmt.h>
#include <iostream>
#include <thread>

using namespace elector;

std::atomic<bool> shutdown_requested{false};

void signal_handler(int signal) {
    if (signal == SIGINT || signal == SIGTERM) {
        shutdown_requested.store(true);
    }
}

int main(int argc, char* argv[]) {
    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);

    std::string config_path = argc > 1 ? argv[1] : "config.json";
    auto config_result = ConfigLoader::load(config_path);
    if (!config_result.has_value()) {
        std::cerr << "Failed to load configuration: " << config_result.error() << std::endl;
        return 1;
    }

    Config config = config_result.value();

    Logger::init(config.elector.log_file, config.elector.log_level);
    Logger::info(Logger::Component::Config,
        fmt::format("Timeouts: call {}ms, total {}ms",
            config.timeouts.call_ms, config.timeouts.total_ms));

    // The backend set is fixed for the lifetime of the process
    std::unique_ptr<TargetDiscovery> discovery;
    if (EnvironmentTargetDiscovery::available()) {
        discovery = std::make_unique<EnvironmentTargetDiscovery>();
    } else {
        discovery = std::make_unique<StaticTargetDiscovery>(config.backends);
    }

    auto registry_result = BackendRegistry::create(*discovery);
    if (!registry_result.has_value()) {
        Logger::error(Logger::Component::Registry, registry_result.error());
        std::cerr << "Failed to resolve backends: " << registry_result.error() << std::endl;
        Logger::shutdown();
        return 1;
    }

    auto registry = std::make_shared<const BackendRegistry>(std::move(registry_result.value()));
    for (const auto& target : registry->targets()) {
        Logger::info(Logger::Component::Registry,
            fmt::format("Backend {} at {}{}", target.name, target.base_url,
                target.is_primary ? " (primary)" : ""));
    }

    auto executor = std::make_shared<const CallExecutor>(
        std::make_shared<HttpTransport>(),
        std::chrono::milliseconds(config.timeouts.call_ms));

    const Elector<PrimaryPreferencePolicy> coordinator(
        registry, Dispatcher(executor),
        Aggregator(std::chrono::milliseconds(config.timeouts.total_ms)));

    httplib::Server server;

    server.set_read_timeout(5, 0);
    server.set_write_timeout(5, 0);

    register_routes(server, coordinator);

    Logger::info(Logger::Component::Elector,
        fmt::format("Started on port {}", config.elector.port));

    std::cout << fmt::format("Elector started on port {}\n", config.elector.port);
    std::cout << "Press Ctrl+C to stop\n";

    std::thread server_thread([&]() {
        server.listen("0.0.0.0", config.elector.port);
    });

    while (!shutdown_requested.load()) {
        std::this_thread::sleep_for(std::chrono::milliseconds(100));
    }

    std::cout << "\nShutting down gracefully...\n";
    Logger::info(Logger::Component::Elector, "Shutting down gracefully");

    server.stop();

    if (server_thread.joinable()) {
        server_thread.join();
    }

    Logger::shutdown();

    std::cout << "Shutdown complete\n";
    return 0;
}
