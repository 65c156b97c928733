#pragma once

#include <boost/asio/io_context.hpp>
#include <boost/asio/steady_timer.hpp>

#include <chrono>
#include <functional>
#include <utility>

namespace meshirc::networking {

// Runs `tick` every `interval` on the io_context until stopped.
class PeriodicTimer {
public:
    PeriodicTimer(boost::asio::io_context& ioc, std::chrono::milliseconds interval, std::function<void()> tick)
        : timer_(ioc), interval_(interval), tick_(std::move(tick)) {}

    PeriodicTimer(const PeriodicTimer&) = delete;
    PeriodicTimer& operator=(const PeriodicTimer&) = delete;

    void start() {
        if (running_) return;
        running_ = true;
        arm();
    }

    void stop() {
        running_ = false;
        timer_.cancel();
    }

private:
    void arm() {
        timer_.expires_after(interval_);
        timer_.async_wait([this](const boost::system::error_code& ec) {
            if (ec || !running_) return;
            tick_();
            arm();
        });
    }

    boost::asio::steady_timer timer_;
    std::chrono::milliseconds interval_;
    std::function<void()> tick_;
    bool running_ = false;
};

} // namespace meshirc::networking
