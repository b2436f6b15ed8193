#include <gtest/gtest.h>
#include <sstream>
#include "readiness_probe.hpp"
#include "fakes.hpp"

using namespace pgentry;
using namespace pgentry::probe;
using pgentry::test_support::BrokenConnector;
using pgentry::test_support::RecordingSleeper;
using pgentry::test_support::ScriptedConnector;

class ReadinessProbeTest : public ::testing::Test {
protected:
    std::ostringstream out_;
    log::Logger logger_{"test", log::Level::VERBOSE, out_};
    RecordingSleeper sleeper_;
    Environment env_ = pgentry::test_support::complete_env();
    db::EnvKeys keys_;
    Policy policy_;

    int count_lines(const std::string& needle) const {
        std::istringstream in(out_.str());
        std::string line;
        int n = 0;
        while (std::getline(in, line)) {
            if (line.find(needle) != std::string::npos) ++n;
        }
        return n;
    }
};

TEST_F(ReadinessProbeTest, DefaultPolicy) {
    Policy p;
    EXPECT_EQ(p.max_attempts, 30);
    EXPECT_EQ(p.attempt_timeout, std::chrono::seconds(2));
    EXPECT_EQ(p.retry_delay, std::chrono::seconds(1));
    EXPECT_FALSE(p.fail_fast_on_permanent_errors);
}

TEST_F(ReadinessProbeTest, MissingFieldFailsBeforeAnyAttempt) {
    const char* required[] = {"DB_HOST", "DB_PORT", "DB_NAME", "DB_USER", "DB_PASSWORD"};
    for (const char* key : required) {
        Environment env = env_;
        env.erase(key);

        ScriptedConnector connector(1);
        ReadinessProber prober(connector, sleeper_, logger_);
        Result result = prober.probe(env, keys_, policy_);

        EXPECT_EQ(result.outcome, Outcome::ConfigurationError) << key;
        EXPECT_EQ(result.key, key);
        EXPECT_EQ(result.attempts, 0) << key;
        EXPECT_EQ(connector.calls, 0) << key;
    }
    EXPECT_TRUE(sleeper_.sleeps.empty());
}

TEST_F(ReadinessProbeTest, ConnectsOnAttemptK) {
    for (int k : {1, 2, 7, 30}) {
        ScriptedConnector connector(k);
        RecordingSleeper sleeper;
        ReadinessProber prober(connector, sleeper, logger_);

        Result result = prober.probe(env_, keys_, policy_);

        EXPECT_TRUE(result.connected()) << "k=" << k;
        EXPECT_EQ(result.attempts, k);
        EXPECT_EQ(connector.calls, k);
        EXPECT_EQ(sleeper.sleeps.size(), static_cast<size_t>(k - 1));
        EXPECT_TRUE(result.error.empty());
    }
}

TEST_F(ReadinessProbeTest, NeverReachableExhaustsBudget) {
    ScriptedConnector connector(0);
    ReadinessProber prober(connector, sleeper_, logger_);

    Result result = prober.probe(env_, keys_, policy_);

    EXPECT_EQ(result.outcome, Outcome::Exhausted);
    EXPECT_EQ(result.attempts, 30);
    EXPECT_EQ(connector.calls, 30);
    ASSERT_EQ(sleeper_.sleeps.size(), 29u);
    for (auto d : sleeper_.sleeps) {
        EXPECT_EQ(d, std::chrono::seconds(1));
    }
    EXPECT_EQ(result.error, "connection refused (attempt 30)") << "Last error is carried";
}

TEST_F(ReadinessProbeTest, RepeatedProbesAreIndependent) {
    ScriptedConnector connector(1);
    ReadinessProber prober(connector, sleeper_, logger_);

    Result first = prober.probe(env_, keys_, policy_);
    Result second = prober.probe(env_, keys_, policy_);

    EXPECT_TRUE(first.connected());
    EXPECT_TRUE(second.connected());
    EXPECT_EQ(first.attempts, 1);
    EXPECT_EQ(second.attempts, 1);
    EXPECT_TRUE(sleeper_.sleeps.empty());
}

TEST_F(ReadinessProbeTest, SingleAttemptBudget) {
    ScriptedConnector connector(0);
    ReadinessProber prober(connector, sleeper_, logger_);
    policy_.max_attempts = 1;

    Result result = prober.probe(env_, keys_, policy_);

    EXPECT_EQ(result.outcome, Outcome::Exhausted);
    EXPECT_EQ(result.attempts, 1);
    EXPECT_TRUE(sleeper_.sleeps.empty());
}

TEST_F(ReadinessProbeTest, ZeroAttemptsIsAConfigurationError) {
    ScriptedConnector connector(1);
    ReadinessProber prober(connector, sleeper_, logger_);
    policy_.max_attempts = 0;

    Result result = prober.probe(env_, keys_, policy_);

    EXPECT_EQ(result.outcome, Outcome::ConfigurationError);
    EXPECT_EQ(connector.calls, 0);
}

TEST_F(ReadinessProbeTest, PassesAttemptTimeoutToConnector) {
    ScriptedConnector connector(1);
    ReadinessProber prober(connector, sleeper_, logger_);
    policy_.attempt_timeout = std::chrono::seconds(7);

    prober.probe(env_, keys_, policy_);

    EXPECT_EQ(connector.last_timeout, std::chrono::seconds(7));
    EXPECT_EQ(connector.last_target, "habit_tracker_user@db:5432/habit_tracker_db");
}

TEST_F(ReadinessProbeTest, PermanentErrorsRetriedByDefault) {
    ScriptedConnector connector(0, false);
    ReadinessProber prober(connector, sleeper_, logger_);
    policy_.max_attempts = 5;

    Result result = prober.probe(env_, keys_, policy_);

    EXPECT_EQ(result.outcome, Outcome::Exhausted);
    EXPECT_EQ(connector.calls, 5);
}

TEST_F(ReadinessProbeTest, PermanentErrorsFailFastWhenEnabled) {
    ScriptedConnector connector(0, false);
    ReadinessProber prober(connector, sleeper_, logger_);
    policy_.fail_fast_on_permanent_errors = true;

    Result result = prober.probe(env_, keys_, policy_);

    EXPECT_EQ(result.outcome, Outcome::Unexpected);
    EXPECT_EQ(result.attempts, 1);
    EXPECT_TRUE(sleeper_.sleeps.empty());
}

TEST_F(ReadinessProbeTest, TransientErrorsStillRetriedWithFailFast) {
    ScriptedConnector connector(3, true);
    ReadinessProber prober(connector, sleeper_, logger_);
    policy_.fail_fast_on_permanent_errors = true;

    Result result = prober.probe(env_, keys_, policy_);

    EXPECT_TRUE(result.connected());
    EXPECT_EQ(result.attempts, 3);
}

TEST_F(ReadinessProbeTest, UnexpectedErrorIsNotRetried) {
    BrokenConnector connector;
    ReadinessProber prober(connector, sleeper_, logger_);

    Result result = prober.probe(env_, keys_, policy_);

    EXPECT_EQ(result.outcome, Outcome::Unexpected);
    EXPECT_EQ(connector.calls, 1);
    EXPECT_EQ(result.error, "driver blew up");
    EXPECT_TRUE(sleeper_.sleeps.empty());
}

TEST_F(ReadinessProbeTest, InterruptedWaitPropagates) {
    class InterruptingSleeper : public Sleeper {
    public:
        void sleep(std::chrono::milliseconds) override { throw Interrupted(15); }
    } sleeper;

    ScriptedConnector connector(0);
    ReadinessProber prober(connector, sleeper, logger_);

    try {
        prober.probe(env_, keys_, policy_);
        FAIL() << "Expected Interrupted";
    } catch (const Interrupted& e) {
        EXPECT_EQ(e.signal(), 15);
    }
    EXPECT_EQ(connector.calls, 1);
}

TEST_F(ReadinessProbeTest, LogsOneLinePerAttempt) {
    ScriptedConnector connector(4);
    ReadinessProber prober(connector, sleeper_, logger_);

    prober.probe(env_, keys_, policy_);

    EXPECT_EQ(count_lines("PostgreSQL unavailable"), 3);
    EXPECT_EQ(count_lines("Attempt 4/30: PostgreSQL is up"), 1);
    EXPECT_EQ(out_.str().find("secret"), std::string::npos) << "Password must not be logged";
}

TEST_F(ReadinessProbeTest, OutcomeNames) {
    EXPECT_STREQ(outcome_to_string(Outcome::Connected), "connected");
    EXPECT_STREQ(outcome_to_string(Outcome::Exhausted), "readiness timeout");
    EXPECT_STREQ(outcome_to_string(Outcome::ConfigurationError), "configuration error");
    EXPECT_STREQ(outcome_to_string(Outcome::Unexpected), "unexpected error");
}
