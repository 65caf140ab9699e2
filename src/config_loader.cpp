#include "config_loader.hpp"
#include <nlohmann/json.hpp>
#include <spdlog/fmt/fmt.h>
#include <fstream>
#include <sstream>

using json = nlohmann::json;

namespace elector {

std::expected<Config, std::string> ConfigLoader::load(const std::string& config_path) {
    // Try multiple locations for the config file
    std::vector<std::string> search_paths = {
        config_path,                           // Current directory
        "../" + config_path,                   // Parent directory (for build dirs)
        "../../" + config_path                 // Two levels up (for nested builds)
    };

    std::ifstream file;

    for (const auto& path : search_paths) {
        file.open(path);
        if (file.is_open()) {
            break;
        }
        file.clear();
    }

    if (!file.is_open()) {
        return std::unexpected("Failed to open config file: " + config_path +
                             " (searched in: ., .., ../..)");
    }

    std::stringstream buffer;
    buffer << file.rdbuf();

    return parse_config(buffer.str());
}

std::expected<Config, std::string> ConfigLoader::parse_config(const std::string& content) {
    try {
        json j = json::parse(content);

        Config config;

        // The server section is optional, every field has a default
        json server = j.value("elector", json::object());
        config.elector.port = server.value("port", 5002);
        config.elector.log_file = server.value("log_file", "logs/elector.log");
        config.elector.log_level = server.value("log_level", "INFO");

        if (!j.contains("backends") || !j["backends"].is_array()) {
            return std::unexpected("Missing 'backends' section");
        }
        for (const auto& backend : j["backends"]) {
            TargetConfig tc;
            tc.name = backend.value("name", "");
            tc.base_url = backend.value("base_url", "");
            tc.primary = backend.value("primary", false);
            config.backends.push_back(tc);
        }

        json timeouts = j.value("timeouts", json::object());
        config.timeouts.call_ms = timeouts.value("call_ms", kDefaultCallTimeoutMs);
        config.timeouts.total_ms = timeouts.value("total_ms", kDefaultTotalTimeoutMs);

        if (auto valid = validate_config(config); !valid) {
            return std::unexpected("Configuration validation failed: " + valid.error());
        }

        return config;

    } catch (const json::exception& e) {
        return std::unexpected(std::string("JSON parsing error: ") + e.what());
    }
}

std::expected<void, std::string> ConfigLoader::validate_config(const Config& config) {
    if (config.backends.empty()) {
        return std::unexpected("no backends configured");
    }

    for (size_t i = 0; i < config.backends.size(); ++i) {
        const auto& backend = config.backends[i];
        if (backend.name.empty()) {
            return std::unexpected(fmt::format("backend #{} has no name", i));
        }
        if (backend.base_url.empty()) {
            return std::unexpected(fmt::format("backend '{}' has no base_url", backend.name));
        }
    }

    if (config.timeouts.call_ms <= 0) {
        return std::unexpected("timeouts.call_ms must be positive");
    }

    if (config.timeouts.total_ms <= 0) {
        return std::unexpected("timeouts.total_ms must be positive");
    }

    return {};
}

} // namespace elector
