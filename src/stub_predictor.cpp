#include "stub_predictor.hpp"
#include <algorithm>
#include <cmath>
#include <iterator>
#include <utility>

using json = nlohmann::json;

namespace elector {

namespace {

// Mean sepal length, sepal width, petal length, petal width per class
constexpr std::array<std::array<double, 4>, 3> kCentroids = {{
    {5.006, 3.428, 1.462, 0.246},
    {5.936, 2.770, 4.260, 1.326},
    {6.588, 2.974, 5.552, 2.026},
}};

// Fixed per-feature weights reported with every prediction, summing to 1
constexpr std::array<std::pair<const char*, double>, 4> kFeatureImportances = {{
    {"s_l", 0.10},
    {"s_w", 0.02},
    {"p_l", 0.44},
    {"p_w", 0.44},
}};

// Nearest-centroid accuracy on the iris set; the stub is never trained
constexpr double kTrainingAccuracy = 0.93;
constexpr double kTestAccuracy = 0.92;

} // namespace

StubPredictor::StubPredictor(std::string model_type)
    : model_type_(std::move(model_type)) {}

json StubPredictor::predict(const FeatureVector& features) const {
    const std::array<double, 4> x = {features.s_l, features.s_w, features.p_l, features.p_w};

    // Softmax over negative squared distances
    std::array<double, 3> scores{};
    for (size_t c = 0; c < kCentroids.size(); ++c) {
        double dist = 0.0;
        for (size_t i = 0; i < x.size(); ++i) {
            double d = x[i] - kCentroids[c][i];
            dist += d * d;
        }
        scores[c] = -dist;
    }

    double max_score = *std::max_element(scores.begin(), scores.end());
    double total = 0.0;
    for (auto& s : scores) {
        s = std::exp(s - max_score);
        total += s;
    }

    json probabilities = json::array();
    for (double s : scores) {
        probabilities.push_back(s / total);
    }

    auto predicted = static_cast<int>(
        std::distance(scores.begin(), std::max_element(scores.begin(), scores.end())));

    json importances = json::object();
    for (const auto& [name, weight] : kFeatureImportances) {
        importances[name] = weight;
    }

    return json{
        {"model_type", model_type_},
        {"predictions", {
            {"probability_scores", probabilities},
            {"predicted_class", predicted},
            {"predicted_species", kClassNames[predicted]},
            {"feature_importances", importances},
        }},
        {"input_data", features.to_json()},
    };
}

json StubPredictor::health() const {
    return json{{"status", "healthy"}, {"model", model_type_}};
}

json StubPredictor::metadata() const {
    return json{
        {"model_type", model_type_},
        {"hyperparameters", {{"scorer", "nearest_centroid"}, {"classes", kCentroids.size()}}},
        {"feature_names", {"sepal length", "sepal width", "petal length", "petal width"}},
        {"target_classes", {kClassNames[0], kClassNames[1], kClassNames[2]}},
        {"metrics", {
            {"training_accuracy", kTrainingAccuracy},
            {"test_accuracy", kTestAccuracy},
        }},
        {"version", kVersion},
    };
}

} // namespace elector
