#include "backend_registry.hpp"
#include "logger.hpp"
#include <spdlog/fmt/fmt.h>
#include <cstdlib>
#include <set>
#include <sstream>

namespace elector {

namespace {

std::string trim(const std::string& s) {
    auto first = s.find_first_not_of(" \t");
    if (first == std::string::npos) {
        return "";
    }
    auto last = s.find_last_not_of(" \t");
    return s.substr(first, last - first + 1);
}

} // namespace

std::expected<BaseUrl, std::string> split_base_url(const std::string& base_url) {
    auto scheme_end = base_url.find("://");
    if (scheme_end == std::string::npos) {
        return std::unexpected(fmt::format("'{}' has no scheme", base_url));
    }

    std::string scheme = base_url.substr(0, scheme_end);
    if (scheme != "http" && scheme != "https") {
        return std::unexpected(fmt::format("'{}' uses unsupported scheme '{}'", base_url, scheme));
    }

    auto authority_start = scheme_end + 3;
    auto path_start = base_url.find_first_of("/?#", authority_start);
    if (path_start == std::string::npos) {
        path_start = base_url.size();
    }
    if (path_start == authority_start) {
        return std::unexpected(fmt::format("'{}' has no host", base_url));
    }
    if (path_start < base_url.size() && base_url[path_start] != '/') {
        return std::unexpected(fmt::format("'{}' must not carry a query or fragment", base_url));
    }

    std::string prefix = base_url.substr(path_start);
    while (!prefix.empty() && prefix.back() == '/') {
        prefix.pop_back();
    }

    return BaseUrl{base_url.substr(0, path_start), prefix};
}

StaticTargetDiscovery::StaticTargetDiscovery(std::vector<TargetConfig> backends)
    : backends_(std::move(backends)) {}

std::expected<std::vector<BackendTarget>, std::string> StaticTargetDiscovery::resolve_targets() const {
    std::vector<BackendTarget> targets;
    targets.reserve(backends_.size());
    for (const auto& backend : backends_) {
        targets.push_back(BackendTarget{backend.name, backend.base_url, backend.primary});
    }
    return targets;
}

bool EnvironmentTargetDiscovery::available() {
    const char* backends = std::getenv(kBackendsVar);
    return backends != nullptr && *backends != '\0';
}

std::expected<std::vector<BackendTarget>, std::string> EnvironmentTargetDiscovery::resolve_targets() const {
    const char* backends = std::getenv(kBackendsVar);
    if (backends == nullptr) {
        return std::unexpected(fmt::format("{} is not set", kBackendsVar));
    }
    const char* primary = std::getenv(kPrimaryVar);
    return parse(backends, primary != nullptr ? primary : "");
}

std::expected<std::vector<BackendTarget>, std::string> EnvironmentTargetDiscovery::parse(
    const std::string& backends, const std::string& primary) {
    std::vector<BackendTarget> targets;
    std::stringstream stream(backends);
    std::string entry;

    while (std::getline(stream, entry, ',')) {
        entry = trim(entry);
        if (entry.empty()) {
            continue;
        }
        auto eq = entry.find('=');
        if (eq == std::string::npos || eq == 0 || eq + 1 == entry.size()) {
            return std::unexpected(fmt::format("Malformed backend entry '{}', expected name=url", entry));
        }
        std::string name = trim(entry.substr(0, eq));
        std::string url = trim(entry.substr(eq + 1));
        targets.push_back(BackendTarget{name, url, name == primary});
    }

    if (targets.empty()) {
        return std::unexpected(fmt::format("{} lists no backends", kBackendsVar));
    }

    // Without an explicit primary the first listed backend is preferred
    if (primary.empty()) {
        targets.front().is_primary = true;
    }

    return targets;
}

BackendRegistry::BackendRegistry(std::vector<BackendTarget> targets, size_t primary_index)
    : targets_(std::move(targets)), primary_index_(primary_index) {}

std::expected<BackendRegistry, std::string> BackendRegistry::create(const TargetDiscovery& discovery) {
    auto targets = discovery.resolve_targets();
    if (!targets.has_value()) {
        return std::unexpected(fmt::format("Target discovery ({}) failed: {}",
            discovery.describe(), targets.error()));
    }

    auto registry = create(std::move(targets.value()));
    if (registry.has_value()) {
        Logger::info(Logger::Component::Registry,
            fmt::format("Resolved {} backends via {}, primary '{}'",
                registry->backend_count(), discovery.describe(), registry->primary().name));
    }
    return registry;
}

std::expected<BackendRegistry, std::string> BackendRegistry::create(std::vector<BackendTarget> targets) {
    if (targets.empty()) {
        return std::unexpected("No backend targets");
    }

    std::set<std::string> names;
    size_t primary_count = 0;
    size_t primary_index = 0;

    for (size_t i = 0; i < targets.size(); ++i) {
        if (!names.insert(targets[i].name).second) {
            return std::unexpected(fmt::format("Duplicate backend name '{}'", targets[i].name));
        }
        if (auto url = split_base_url(targets[i].base_url); !url) {
            return std::unexpected(fmt::format("Backend '{}': {}", targets[i].name, url.error()));
        }
        if (targets[i].is_primary) {
            ++primary_count;
            primary_index = i;
        }
    }

    if (primary_count != 1) {
        return std::unexpected(fmt::format(
            "Exactly one backend must be primary, found {}", primary_count));
    }

    return BackendRegistry(std::move(targets), primary_index);
}

} // namespace elector
