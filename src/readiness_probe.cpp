#include "readiness_probe.hpp"
#include "shared/errors.hpp"

namespace pgentry {
namespace probe {

const char* outcome_to_string(Outcome outcome) {
    switch (outcome) {
        case Outcome::Connected:          return "connected";
        case Outcome::ConfigurationError: return "configuration error";
        case Outcome::Exhausted:          return "readiness timeout";
        case Outcome::Unexpected:         return "unexpected error";
        default:                          return "unknown";
    }
}

ReadinessProber::ReadinessProber(Connector& connector, Sleeper& sleeper, log::Logger& logger)
    : connector_(connector), sleeper_(sleeper), logger_(logger) {}

Result ReadinessProber::probe(const db::ConnectionTarget& target, const Policy& policy) {
    Result result;

    if (policy.max_attempts < 1) {
        result.outcome = Outcome::ConfigurationError;
        result.key = "probe.max_attempts";
        result.error = "max_attempts must be at least 1, got " + std::to_string(policy.max_attempts);
        return result;
    }

    const std::string total = std::to_string(policy.max_attempts);
    logger_.info("Waiting for PostgreSQL at " + target.describe() + "...");

    for (int attempt = 1; attempt <= policy.max_attempts; ++attempt) {
        result.attempts = attempt;
        const std::string prefix = "Attempt " + std::to_string(attempt) + "/" + total + ": ";

        try {
            connector_.check(target, policy.attempt_timeout);
            logger_.info(prefix + "PostgreSQL is up - connection established");
            result.outcome = Outcome::Connected;
            result.error.clear();
            return result;
        } catch (const ConnectError& e) {
            result.error = e.what();
            if (!e.transient() && policy.fail_fast_on_permanent_errors) {
                logger_.error(prefix + "PostgreSQL rejected the connection, not retrying (" + result.error + ")");
                result.outcome = Outcome::Unexpected;
                return result;
            }
            logger_.warning(prefix + "PostgreSQL unavailable, waiting... (" + result.error + ")");
        } catch (const std::exception& e) {
            logger_.error(prefix + "error while checking PostgreSQL: " + e.what());
            result.outcome = Outcome::Unexpected;
            result.error = e.what();
            return result;
        }

        if (attempt < policy.max_attempts) {
            sleeper_.sleep(policy.retry_delay);
        }
    }

    result.outcome = Outcome::Exhausted;
    return result;
}

Result ReadinessProber::probe(const Environment& env, const db::EnvKeys& keys, const Policy& policy) {
    db::ConnectionTarget target;
    try {
        target = db::ConnectionTarget::from_env(env, keys);
    } catch (const ConfigurationError& e) {
        Result result;
        result.outcome = Outcome::ConfigurationError;
        result.key = e.key();
        result.error = e.what();
        return result;
    }
    return probe(target, policy);
}

} // namespace probe
} // namespace pgentry
