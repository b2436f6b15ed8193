#include "signal_sleeper.hpp"
#include <boost/asio/steady_timer.hpp>
#include <csignal>

namespace pgentry {
namespace probe {

SignalAwareSleeper::SignalAwareSleeper()
    : signals_(ioc_, SIGINT, SIGTERM) {}

void SignalAwareSleeper::sleep(std::chrono::milliseconds duration) {
    boost::asio::steady_timer timer(ioc_, duration);
    int caught = 0;

    timer.async_wait([this](const boost::system::error_code& ec) {
        if (!ec) {
            signals_.cancel();
        }
    });

    signals_.async_wait([&caught, &timer](const boost::system::error_code& ec, int signo) {
        if (!ec) {
            caught = signo;
            timer.cancel();
        }
    });

    ioc_.restart();
    ioc_.run();

    if (caught != 0) {
        throw Interrupted(caught);
    }
}

} // namespace probe
} // namespace pgentry
