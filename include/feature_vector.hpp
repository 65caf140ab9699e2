#pragma once

#include <expected>
#include <string>
#include <nlohmann/json.hpp>

namespace elector {

// The four iris measurements every predictor takes: sepal length and width,
// petal length and width.
struct FeatureVector {
    double s_l;
    double s_w;
    double p_l;
    double p_w;

    static std::expected<FeatureVector, std::string> parse(const std::string& body);
    static std::expected<FeatureVector, std::string> from_json(const nlohmann::json& j);

    nlohmann::json to_json() const;
};

} // namespace elector
