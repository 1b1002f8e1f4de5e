#pragma once

#include <boost/asio/io_context.hpp>
#include <boost/asio/steady_timer.hpp>

#include <chrono>
#include <cstdint>
#include <functional>
#include <string>

namespace walkierelay::relay {

// A no-argument job re-armed on a fixed interval until cancelled. The job
// runs on the event thread like everything else.
class PeriodicTask {
public:
    PeriodicTask(boost::asio::io_context& ioc, std::string name,
                 std::chrono::milliseconds interval, std::function<void()> job);
    ~PeriodicTask();

    PeriodicTask(const PeriodicTask&) = delete;
    PeriodicTask& operator=(const PeriodicTask&) = delete;

    void start();
    void cancel();

    bool running() const noexcept { return running_; }
    std::uint64_t runs() const noexcept { return runs_; }
    const std::string& name() const noexcept { return name_; }

private:
    void arm();

    boost::asio::steady_timer timer_;
    std::string name_;
    std::chrono::milliseconds interval_;
    std::function<void()> job_;

    bool running_ = false;
    std::uint64_t generation_ = 0;  // bumps on cancel; stale wakeups are ignored
    std::uint64_t runs_ = 0;
};

} // namespace walkierelay::relay
