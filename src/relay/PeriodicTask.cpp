#include "relay/PeriodicTask.h"

#include <boost/asio/error.hpp>

#include <iostream>
#include <utility>

namespace walkierelay::relay {

PeriodicTask::PeriodicTask(boost::asio::io_context& ioc, std::string name,
                           std::chrono::milliseconds interval, std::function<void()> job)
    : timer_(ioc), name_(std::move(name)), interval_(interval), job_(std::move(job)) {}

PeriodicTask::~PeriodicTask() {
    cancel();
}

void PeriodicTask::start() {
    if (running_) return;
    running_ = true;
    arm();
}

void PeriodicTask::cancel() {
    if (!running_) return;
    running_ = false;
    ++generation_;
    timer_.cancel();
}

void PeriodicTask::arm() {
    timer_.expires_after(interval_);
    timer_.async_wait([this, gen = generation_](const boost::system::error_code& ec) {
        if (ec == boost::asio::error::operation_aborted) return;
        if (!running_ || gen != generation_) return;

        try {
            job_();
        } catch (const std::exception& e) {
            std::cerr << "[" << name_ << "] run failed: " << e.what() << "\n";
        }
        ++runs_;

        if (running_ && gen == generation_) arm();
    });
}

} // namespace walkierelay::relay
