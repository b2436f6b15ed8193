#pragma once
#include "readiness_probe.hpp"
#include <stdexcept>
#include <string>
#include <vector>

namespace pgentry::test_support
{

// Fails until attempt `ready_on` (never when 0), then succeeds.
class ScriptedConnector : public probe::Connector
    {
    public:
        explicit ScriptedConnector(int ready_on, bool transient = true)
            : ready_on_(ready_on), transient_(transient) {}

        void check(const db::ConnectionTarget& target, std::chrono::seconds timeout) override
            {
            ++calls;
            last_timeout = timeout;
            last_target = target.describe();
            if (ready_on_ == 0 || calls < ready_on_)
                {
                throw probe::ConnectError("connection refused (attempt " + std::to_string(calls) + ")", transient_);
                }
            }

        int calls = 0;
        std::chrono::seconds last_timeout{0};
        std::string last_target;

    private:
        int ready_on_;
        bool transient_;
    };

// Raises something that is not a connection failure
class BrokenConnector : public probe::Connector
    {
    public:
        void check(const db::ConnectionTarget&, std::chrono::seconds) override
            {
            ++calls;
            throw std::logic_error("driver blew up");
            }

        int calls = 0;
    };

class RecordingSleeper : public probe::Sleeper
    {
    public:
        void sleep(std::chrono::milliseconds duration) override
            {
            sleeps.push_back(duration);
            }

        std::vector<std::chrono::milliseconds> sleeps;
    };

inline Environment complete_env()
    {
    return Environment{
        {"DB_HOST", "db"},
        {"DB_PORT", "5432"},
        {"DB_NAME", "habit_tracker_db"},
        {"DB_USER", "habit_tracker_user"},
        {"DB_PASSWORD", "secret"},
    };
    }

} // namespace pgentry::test_support
