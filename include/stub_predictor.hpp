#pragma once

#include "feature_vector.hpp"
#include <array>
#include <string>
#include <nlohmann/json.hpp>

namespace elector {

// Local stand-in for a real predictor service. Scores by distance to the
// per-class means of the iris data set; nothing is trained. Immutable once
// constructed, so one instance is shared by every request handler.
class StubPredictor {
public:
    static constexpr std::array<const char*, 3> kClassNames = {"setosa", "versicolor", "virginica"};
    static constexpr const char* kVersion = "1.0.0";

    explicit StubPredictor(std::string model_type);

    nlohmann::json predict(const FeatureVector& features) const;

    nlohmann::json health() const;

    nlohmann::json metadata() const;

    const std::string& model_type() const { return model_type_; }

private:
    std::string model_type_;
};

} // namespace elector
