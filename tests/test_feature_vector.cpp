#include <gtest/gtest.h>
#include "feature_vector.hpp"

using namespace elector;

TEST(FeatureVectorTest, ParsesAllFourFeatures) {
    auto features = FeatureVector::parse(R"({"s_l": 5.1, "s_w": 3.5, "p_l": 1.4, "p_w": 0.2})");

    ASSERT_TRUE(features.has_value()) << features.error();
    EXPECT_DOUBLE_EQ(features->s_l, 5.1);
    EXPECT_DOUBLE_EQ(features->s_w, 3.5);
    EXPECT_DOUBLE_EQ(features->p_l, 1.4);
    EXPECT_DOUBLE_EQ(features->p_w, 0.2);
}

TEST(FeatureVectorTest, AcceptsIntegers) {
    auto features = FeatureVector::parse(R"({"s_l": 6, "s_w": 3, "p_l": 5, "p_w": 2})");

    ASSERT_TRUE(features.has_value());
    EXPECT_DOUBLE_EQ(features->p_l, 5.0);
}

TEST(FeatureVectorTest, IgnoresExtraFields) {
    auto features = FeatureVector::parse(
        R"({"s_l": 5.1, "s_w": 3.5, "p_l": 1.4, "p_w": 0.2, "client": "dashboard"})");

    ASSERT_TRUE(features.has_value());
    EXPECT_FALSE(features->to_json().contains("client"));
}

TEST(FeatureVectorTest, MissingField) {
    auto features = FeatureVector::parse(R"({"s_l": 5.1, "s_w": 3.5, "p_l": 1.4})");

    ASSERT_FALSE(features.has_value());
    EXPECT_EQ(features.error(), "Missing field 'p_w'");
}

TEST(FeatureVectorTest, NonNumericField) {
    auto features = FeatureVector::parse(R"({"s_l": "5.1", "s_w": 3.5, "p_l": 1.4, "p_w": 0.2})");

    ASSERT_FALSE(features.has_value());
    EXPECT_EQ(features.error(), "Field 's_l' must be a number");
}

TEST(FeatureVectorTest, NotAnObject) {
    EXPECT_FALSE(FeatureVector::parse("[5.1, 3.5, 1.4, 0.2]").has_value());
    EXPECT_FALSE(FeatureVector::parse("not json").has_value());
    EXPECT_FALSE(FeatureVector::parse("").has_value());
}

TEST(FeatureVectorTest, SerializesWireFieldNames) {
    FeatureVector features{6.7, 3.0, 5.2, 2.3};
    auto j = features.to_json();

    EXPECT_EQ(j.size(), 4);
    EXPECT_DOUBLE_EQ(j["s_l"].get<double>(), 6.7);
    EXPECT_DOUBLE_EQ(j["s_w"].get<double>(), 3.0);
    EXPECT_DOUBLE_EQ(j["p_l"].get<double>(), 5.2);
    EXPECT_DOUBLE_EQ(j["p_w"].get<double>(), 2.3);
}
