#include "relay/LifecycleController.h"

#include <boost/asio/error.hpp>
#include <boost/json.hpp>

#include <csignal>
#include <iostream>

namespace walkierelay::relay {

std::string_view to_string(LifecycleState state) noexcept {
    switch (state) {
        case LifecycleState::Running:  return "running";
        case LifecycleState::Draining: return "draining";
        case LifecycleState::Stopped:  return "stopped";
    }
    return "unknown";
}

LifecycleController::LifecycleController(boost::asio::io_context& ioc, RelayContext& ctx,
                                         std::chrono::milliseconds deadline)
    : ctx_(ctx), deadline_(deadline), deadline_timer_(ioc), signals_(ioc) {}

void LifecycleController::watch_signals() {
    signals_.add(SIGINT);
    signals_.add(SIGTERM);
    signals_.async_wait([this](const boost::system::error_code& ec, int signo) {
        if (ec) return;
        begin_shutdown(signo == SIGINT ? "SIGINT" : "SIGTERM");
    });
}

bool LifecycleController::begin_shutdown(std::string_view reason) {
    if (state_ != LifecycleState::Running) return false;
    state_ = LifecycleState::Draining;
    std::cout << "[lifecycle] shutting down gracefully (" << reason << ")\n";

    if (on_draining_) on_draining_();

    auto& transport = ctx_.transport();
    const boost::json::object notice{{"message", "Server is shutting down"}};
    for (const auto& id : ctx_.registry().connection_ids()) {
        transport.send(id, "server-shutdown", notice);
    }
    transport.stop_accepting();

    deadline_timer_.expires_after(deadline_);
    deadline_timer_.async_wait([this](const boost::system::error_code& ec) {
        if (ec == boost::asio::error::operation_aborted) return;
        if (state_ != LifecycleState::Draining) return;
        std::cerr << "[lifecycle] forced shutdown after " << deadline_.count() << " ms\n";
        finish(1);
    });

    transport.close_all([this] { on_all_closed(); });
    return true;
}

void LifecycleController::report_fault(std::string_view where, const std::exception& e) {
    ++faults_;
    std::cerr << "[lifecycle] unhandled fault in " << where << ": " << e.what()
              << " (state stays " << to_string(state_) << ")\n";
}

void LifecycleController::on_all_closed() {
    if (state_ != LifecycleState::Draining) return;
    std::cout << "[lifecycle] all connections closed\n";

    if (!drain_hook_) {
        finish(0);
        return;
    }
    drain_hook_([this] {
        if (state_ == LifecycleState::Draining) finish(0);
    });
}

void LifecycleController::finish(int exit_code) {
    state_ = LifecycleState::Stopped;
    exit_code_ = exit_code;

    deadline_timer_.cancel();
    signals_.cancel();

    std::cout << "[lifecycle] stopped (exit code " << exit_code << ")\n";
    if (on_stopped_) on_stopped_(exit_code);
}

} // namespace walkierelay::relay
