#pragma once

#include "config_loader.hpp"
#include <vector>
#include <expected>
#include <string>
#include <memory>

namespace elector {

struct BackendTarget {
    std::string name;
    std::string base_url;
    bool is_primary;

    bool operator==(const BackendTarget&) const = default;
};

// base_url split for the HTTP client: "http://gateway:8080/models/main/"
// becomes origin "http://gateway:8080" and path_prefix "/models/main".
struct BaseUrl {
    std::string origin;
    std::string path_prefix;
};

std::expected<BaseUrl, std::string> split_base_url(const std::string& base_url);

// Source of the backend set. Resolved once at startup; the elector only ever
// sees the registry built from it.
class TargetDiscovery {
public:
    virtual ~TargetDiscovery() = default;

    virtual std::expected<std::vector<BackendTarget>, std::string> resolve_targets() const = 0;

    virtual std::string describe() const = 0;
};

// Backends listed in the config file
class StaticTargetDiscovery : public TargetDiscovery {
public:
    explicit StaticTargetDiscovery(std::vector<TargetConfig> backends);

    std::expected<std::vector<BackendTarget>, std::string> resolve_targets() const override;

    std::string describe() const override { return "static config"; }

private:
    std::vector<TargetConfig> backends_;
};

// ELECTOR_BACKENDS="model=http://model:5000,canary=http://canary:5001"
// ELECTOR_PRIMARY=model
class EnvironmentTargetDiscovery : public TargetDiscovery {
public:
    static constexpr const char* kBackendsVar = "ELECTOR_BACKENDS";
    static constexpr const char* kPrimaryVar = "ELECTOR_PRIMARY";

    // True when ELECTOR_BACKENDS is set and non-empty
    static bool available();

    std::expected<std::vector<BackendTarget>, std::string> resolve_targets() const override;

    std::string describe() const override { return "environment"; }

    static std::expected<std::vector<BackendTarget>, std::string> parse(
        const std::string& backends, const std::string& primary);
};

class BackendRegistry {
public:
    // Fails unless names are unique, every base_url is a usable http(s) URL
    // and exactly one target is primary
    static std::expected<BackendRegistry, std::string> create(const TargetDiscovery& discovery);
    static std::expected<BackendRegistry, std::string> create(std::vector<BackendTarget> targets);

    const std::vector<BackendTarget>& targets() const { return targets_; }

    const BackendTarget& primary() const { return targets_[primary_index_]; }

    size_t backend_count() const { return targets_.size(); }

private:
    BackendRegistry(std::vector<BackendTarget> targets, size_t primary_index);

    std::vector<BackendTarget> targets_;
    size_t primary_index_;
};

} // namespace elector
