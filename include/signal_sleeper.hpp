#pragma once
#include <boost/asio/io_context.hpp>
#include <boost/asio/signal_set.hpp>
#include "readiness_probe.hpp"

namespace pgentry {
namespace probe {

// Retry delay that gives up early on SIGINT/SIGTERM.
// Running as PID 1 the default SIGTERM action is ignored, so the wait has
// to notice the signal itself. Signals arriving while a connection attempt
// is in progress are queued and end the next wait.
class SignalAwareSleeper : public Sleeper {
public:
    SignalAwareSleeper();

    SignalAwareSleeper(const SignalAwareSleeper&) = delete;
    SignalAwareSleeper& operator=(const SignalAwareSleeper&) = delete;

    // Throws Interrupted when a watched signal is delivered
    void sleep(std::chrono::milliseconds duration) override;

private:
    boost::asio::io_context ioc_;
    boost::asio::signal_set signals_;
};

} // namespace probe
} // namespace pgentry
