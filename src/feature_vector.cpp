#include "feature_vector.hpp"
#include <spdlog/fmt/fmt.h>
#include <array>
#include <utility>

using json = nlohmann::json;

namespace elector {

std::expected<FeatureVector, std::string> FeatureVector::parse(const std::string& body) {
    try {
        return from_json(json::parse(body));
    } catch (const json::exception& e) {
        return std::unexpected(std::string("JSON parsing error: ") + e.what());
    }
}

std::expected<FeatureVector, std::string> FeatureVector::from_json(const json& j) {
    if (!j.is_object()) {
        return std::unexpected("Request body must be a JSON object");
    }

    FeatureVector features{};
    const std::array<std::pair<const char*, double*>, 4> fields = {{
        {"s_l", &features.s_l},
        {"s_w", &features.s_w},
        {"p_l", &features.p_l},
        {"p_w", &features.p_w},
    }};

    for (const auto& [name, target] : fields) {
        auto it = j.find(name);
        if (it == j.end()) {
            return std::unexpected(fmt::format("Missing field '{}'", name));
        }
        if (!it->is_number()) {
            return std::unexpected(fmt::format("Field '{}' must be a number", name));
        }
        *target = it->get<double>();
    }

    return features;
}

json FeatureVector::to_json() const {
    return json{{"s_l", s_l}, {"s_w", s_w}, {"p_l", p_l}, {"p_w", p_w}};
}

} // namespace elector
