#pragma once
#include <chrono>
#include <stdexcept>
#include <string>
#include "db_config.hpp"
#include "shared/environment.hpp"
#include "shared/logger.hpp"

namespace pgentry {
namespace probe {

// A single connection attempt failed
class ConnectError : public std::runtime_error {
public:
    ConnectError(const std::string& message, bool transient)
        : std::runtime_error(message), transient_(transient) {}

    // True when the server is merely not ready yet
    bool transient() const { return transient_; }

private:
    bool transient_;
};

// The retry wait was cut short by a termination signal
class Interrupted : public std::runtime_error {
public:
    explicit Interrupted(int signal)
        : std::runtime_error("interrupted by signal " + std::to_string(signal)), signal_(signal) {}

    int signal() const { return signal_; }

private:
    int signal_;
};

// Opens a connection to the target and closes it again.
// Throws ConnectError when the database cannot be reached.
class Connector {
public:
    virtual ~Connector() = default;
    virtual void check(const db::ConnectionTarget& target, std::chrono::seconds timeout) = 0;
};

class Sleeper {
public:
    virtual ~Sleeper() = default;
    virtual void sleep(std::chrono::milliseconds duration) = 0;
};

struct Policy {
    int max_attempts = 30;
    std::chrono::seconds attempt_timeout{2};
    std::chrono::seconds retry_delay{1};
    // Stop on authentication failures and the like instead of spending
    // the whole budget on them.
    bool fail_fast_on_permanent_errors = false;
};

enum class Outcome {
    Connected,
    ConfigurationError,
    Exhausted,
    Unexpected
};

const char* outcome_to_string(Outcome outcome);

struct Result {
    Outcome outcome = Outcome::Exhausted;
    int attempts = 0;
    std::string error;
    std::string key;    // set for ConfigurationError

    bool connected() const { return outcome == Outcome::Connected; }
};

class ReadinessProber {
public:
    ReadinessProber(Connector& connector, Sleeper& sleeper, log::Logger& logger);

    Result probe(const db::ConnectionTarget& target, const Policy& policy);

    // Builds the target from the environment first. A missing or invalid
    // variable yields ConfigurationError without any connection attempt.
    Result probe(const Environment& env, const db::EnvKeys& keys, const Policy& policy);

private:
    Connector& connector_;
    Sleeper& sleeper_;
    log::Logger& logger_;
};

} // namespace probe
} // namespace pgentry
