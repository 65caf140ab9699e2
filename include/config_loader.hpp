#pragma once

#include <string>
#include <vector>
#include <expected>
#include <cstdint>

namespace elector {

struct TargetConfig {
    std::string name;
    std::string base_url;
    bool primary;
};

struct ServerConfig {
    uint16_t port;
    std::string log_file;
    std::string log_level;
};

// T_call bounds a single backend call, T_total bounds collection of all of
// them, both measured from dispatch.
struct TimeoutConfig {
    int call_ms;
    int total_ms;
};

struct Config {
    ServerConfig elector;
    std::vector<TargetConfig> backends;
    TimeoutConfig timeouts;
};

class ConfigLoader {
public:
    static constexpr int kDefaultCallTimeoutMs = 5000;
    static constexpr int kDefaultTotalTimeoutMs = 10000;

    static std::expected<Config, std::string> load(const std::string& config_path);

    static std::expected<Config, std::string> parse_config(const std::string& content);

private:
    static std::expected<void, std::string> validate_config(const Config& config);
};

} // namespace elector
