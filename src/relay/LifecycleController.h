#pragma once

#include "relay/RelayContext.h"

#include <boost/asio/io_context.hpp>
#include <boost/asio/signal_set.hpp>
#include <boost/asio/steady_timer.hpp>

#include <chrono>
#include <cstdint>
#include <exception>
#include <functional>
#include <string_view>

namespace walkierelay::relay {

enum class LifecycleState { Running, Draining, Stopped };

std::string_view to_string(LifecycleState state) noexcept;

// Running -> Draining -> Stopped. Only an explicit shutdown request moves the
// state forward; faults are counted and logged.
//
// Draining: every registered connection gets one `server-shutdown`, the
// transport stops accepting and closes connections behind their queued
// writes. Once all are closed the drain hook runs and the exit code is 0. If
// that has not happened when the deadline fires the exit code is 1.
class LifecycleController {
public:
    using StoppedFn = std::function<void(int exit_code)>;
    using DrainHook = std::function<void(std::function<void()> done)>;

    LifecycleController(boost::asio::io_context& ioc, RelayContext& ctx,
                        std::chrono::milliseconds deadline);

    LifecycleController(const LifecycleController&) = delete;
    LifecycleController& operator=(const LifecycleController&) = delete;

    void set_on_draining(std::function<void()> cb) { on_draining_ = std::move(cb); }
    void set_drain_hook(DrainHook hook) { drain_hook_ = std::move(hook); }
    void set_on_stopped(StoppedFn cb) { on_stopped_ = std::move(cb); }

    // SIGINT / SIGTERM -> begin_shutdown.
    void watch_signals();

    // Returns false when already draining or stopped.
    bool begin_shutdown(std::string_view reason);

    void report_fault(std::string_view where, const std::exception& e);

    LifecycleState state() const noexcept { return state_; }
    bool accepting_events() const noexcept { return state_ == LifecycleState::Running; }
    int exit_code() const noexcept { return exit_code_; }
    std::uint64_t fault_count() const noexcept { return faults_; }

private:
    void on_all_closed();
    void finish(int exit_code);

    RelayContext& ctx_;
    std::chrono::milliseconds deadline_;
    boost::asio::steady_timer deadline_timer_;
    boost::asio::signal_set signals_;

    std::function<void()> on_draining_;
    DrainHook drain_hook_;
    StoppedFn on_stopped_;

    LifecycleState state_ = LifecycleState::Running;
    int exit_code_ = 0;
    std::uint64_t faults_ = 0;
};

} // namespace walkierelay::relay
