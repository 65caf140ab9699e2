#include <gtest/gtest.h>
#include "call_executor.hpp"
#include "mocks/scripted_transport.hpp"

using namespace elector;
using elector::test_support::ScriptedTransport;
using std::chrono::milliseconds;

class CallExecutorTest : public ::testing::Test {
protected:
    void SetUp() override {
        transport = std::make_shared<ScriptedTransport>();
        executor = std::make_unique<CallExecutor>(transport, milliseconds(200));
    }

    void TearDown() override {
        transport->wait_idle(milliseconds(2000));
    }

    BackendTarget model{"model", "http://localhost:5000", true};
    std::shared_ptr<ScriptedTransport> transport;
    std::unique_ptr<CallExecutor> executor;
};

TEST_F(CallExecutorTest, SuccessCarriesPayload) {
    transport->succeed("model", milliseconds(10), R"({"predicted_class": 0})");

    CallResult result = executor->execute(model, R"({"s_l": 5.1})");

    EXPECT_EQ(result.outcome, CallOutcome::Success);
    EXPECT_EQ(result.payload, R"({"predicted_class": 0})");
    EXPECT_EQ(result.target, model);
    EXPECT_TRUE(result.reason.empty());
    EXPECT_GE(result.elapsed, milliseconds(10));
    EXPECT_EQ(transport->last_body(), R"({"s_l": 5.1})");
}

TEST_F(CallExecutorTest, TransportErrorIsTaggedError) {
    transport->fail("model", milliseconds(0), "HTTP 500");

    CallResult result = executor->execute(model, "{}");

    EXPECT_EQ(result.outcome, CallOutcome::Error);
    EXPECT_EQ(result.reason, "HTTP 500");
    EXPECT_TRUE(result.payload.empty());
}

TEST_F(CallExecutorTest, TransportReportedTimeoutIsTaggedTimeout) {
    transport->fail("model", milliseconds(0), "connect timed out", true);

    CallResult result = executor->execute(model, "{}");

    EXPECT_EQ(result.outcome, CallOutcome::Timeout);
}

TEST_F(CallExecutorTest, SlowBackendTimesOutAtCallTimeout) {
    transport->succeed("model", milliseconds(600), "late");

    auto start = std::chrono::steady_clock::now();
    CallResult result = executor->execute(model, "{}");
    auto waited = std::chrono::steady_clock::now() - start;

    EXPECT_EQ(result.outcome, CallOutcome::Timeout);
    EXPECT_TRUE(result.payload.empty());
    EXPECT_GE(result.elapsed, milliseconds(200));
    EXPECT_LT(waited, milliseconds(500));
}

TEST_F(CallExecutorTest, LateResponseNeverReplacesTimeout) {
    transport->succeed("model", milliseconds(300), "late");

    CallResult result = executor->execute(model, "{}");
    ASSERT_EQ(result.outcome, CallOutcome::Timeout);

    ASSERT_TRUE(transport->wait_idle(milliseconds(2000)));
    std::this_thread::sleep_for(milliseconds(20));

    EXPECT_EQ(result.outcome, CallOutcome::Timeout);
    EXPECT_TRUE(result.payload.empty());
}

TEST_F(CallExecutorTest, AbandonedCallsDrainAfterTimeout) {
    transport->succeed("model", milliseconds(300), "late");

    for (int i = 0; i < 4; ++i) {
        ASSERT_EQ(executor->execute(model, "{}").outcome, CallOutcome::Timeout);
    }

    // Each abandoned call outlives its timeout by at most the transport delay
    EXPECT_TRUE(transport->wait_idle(milliseconds(500)));
    EXPECT_EQ(transport->call_count("model"), 4);
}

TEST_F(CallExecutorTest, ThrowingTransportIsContained) {
    transport->throw_after("model", milliseconds(0));

    CallResult result;
    EXPECT_NO_THROW(result = executor->execute(model, "{}"));
    EXPECT_EQ(result.outcome, CallOutcome::Error);
    EXPECT_EQ(result.reason, "transport exploded");
}

TEST_F(CallExecutorTest, UnknownBackendIsError) {
    BackendTarget ghost{"ghost", "http://localhost:1", false};

    CallResult result = executor->execute(ghost, "{}");

    EXPECT_EQ(result.outcome, CallOutcome::Error);
    EXPECT_EQ(result.reason, "connection refused");
}
