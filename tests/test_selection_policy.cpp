#include <gtest/gtest.h>
#include "selection_policy.hpp"

using namespace elector;
using std::chrono::milliseconds;

class SelectionPolicyTest : public ::testing::Test {
protected:
    CallResult ok(const BackendTarget& target, const std::string& payload, int ms) {
        return CallResult::success(target, payload, milliseconds(ms));
    }

    CallResult timed_out(const BackendTarget& target, int ms) {
        return CallResult::timeout(target, "no response", milliseconds(ms));
    }

    CallResult failed(const BackendTarget& target, int ms) {
        return CallResult::error(target, "connection refused", milliseconds(ms));
    }

    AggregateOutcome outcome_of(std::vector<CallResult> results, size_t dispatched = 3) {
        AggregateOutcome outcome;
        outcome.dispatched = dispatched;
        outcome.results = std::move(results);
        return outcome;
    }

    BackendTarget primary{"model", "http://localhost:5000", true};
    BackendTarget canary{"canary", "http://localhost:5001", false};
    BackendTarget shadow{"shadow", "http://localhost:5003", false};

    PrimaryPreferencePolicy policy;
};

static_assert(SelectionPolicy<PrimaryPreferencePolicy>);

TEST_F(SelectionPolicyTest, PrimarySuccessWinsEvenWhenLast) {
    auto decision = policy.select(outcome_of({
        ok(canary, "B", 100),
        ok(shadow, "C", 200),
        ok(primary, "A", 900),
    }));

    ASSERT_TRUE(decision.has_value());
    EXPECT_EQ(decision->payload, "A");
    EXPECT_EQ(decision->source, primary);
    EXPECT_EQ(decision->elapsed, milliseconds(900));
}

TEST_F(SelectionPolicyTest, FirstSecondarySuccessInCompletionOrder) {
    auto decision = policy.select(outcome_of({
        failed(canary, 10),
        ok(shadow, "C", 150),
        ok(canary, "B", 300),
        timed_out(primary, 500),
    }, 4));

    ASSERT_TRUE(decision.has_value());
    EXPECT_EQ(decision->payload, "C");
    EXPECT_EQ(decision->source.name, "shadow");
}

TEST_F(SelectionPolicyTest, CompletionOrderNotRegistryOrderDecides) {
    auto decision = policy.select(outcome_of({
        ok(shadow, "C", 100),
        ok(canary, "B", 200),
    }));

    ASSERT_TRUE(decision.has_value());
    EXPECT_EQ(decision->source.name, "shadow");
}

TEST_F(SelectionPolicyTest, PrimaryErrorFallsBackToSecondary) {
    auto decision = policy.select(outcome_of({
        failed(primary, 1),
        ok(canary, "B", 300),
    }, 2));

    ASSERT_TRUE(decision.has_value());
    EXPECT_EQ(decision->payload, "B");
}

TEST_F(SelectionPolicyTest, AbsentPrimaryTreatedLikeFailedPrimary) {
    auto decision = policy.select(outcome_of({ok(canary, "B", 300)}, 2));

    ASSERT_TRUE(decision.has_value());
    EXPECT_EQ(decision->payload, "B");
}

TEST_F(SelectionPolicyTest, AllFailedIsNoBackendAvailable) {
    auto decision = policy.select(outcome_of({
        timed_out(canary, 500),
        failed(shadow, 20),
        timed_out(primary, 500),
    }));

    ASSERT_FALSE(decision.has_value());
    EXPECT_EQ(decision.error(), ElectionError::NoBackendAvailable);
}

TEST_F(SelectionPolicyTest, NothingCollectedIsNoBackendAvailable) {
    auto decision = policy.select(outcome_of({}));

    ASSERT_FALSE(decision.has_value());
    EXPECT_EQ(decision.error(), ElectionError::NoBackendAvailable);
}

TEST_F(SelectionPolicyTest, SameInputSameDecision) {
    auto outcome = outcome_of({
        failed(primary, 5),
        ok(shadow, "C", 40),
        ok(canary, "B", 41),
    });

    auto first = policy.select(outcome);
    for (int i = 0; i < 20; ++i) {
        auto again = policy.select(outcome);
        ASSERT_TRUE(again.has_value());
        EXPECT_EQ(again->payload, first->payload);
        EXPECT_EQ(again->source, first->source);
    }
}

TEST_F(SelectionPolicyTest, ErrorNames) {
    EXPECT_EQ(to_string(ElectionError::NoBackendAvailable), "no backend available");
    EXPECT_EQ(to_string(CallOutcome::Timeout), "TIMEOUT");
}
