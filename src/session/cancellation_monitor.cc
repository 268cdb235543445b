#include <csignal>
#include <cstdlib>
#include <session/cancellation_monitor.h>
#include <spdlog/spdlog.h>

namespace wormhole::session {

CancellationMonitor::CancellationMonitor(boost::asio::io_context& ioc,
                                         core::CancelToken& token,
                                         cli::Terminal& terminal,
                                         ForceTerminateHandler force_terminate)
    : signals_(ioc)
    , token_(token)
    , terminal_(terminal)
    , force_terminate_(std::move(force_terminate)) {
    if (!force_terminate_) {
        force_terminate_ = [](int signal_number) {
            spdlog::shutdown();
            std::_Exit(128 + signal_number);
        };
    }
}

CancellationMonitor::~CancellationMonitor() {
    Stop();
}

core::CancelToken& CancellationMonitor::Start() {
    if (listening_) {
        return token_;
    }
    boost::system::error_code ec;
    signals_.add(SIGINT, ec);
    if (ec) {
        spdlog::warn("Failed to listen for SIGINT: {}", ec.message());
    }
    signals_.add(SIGTERM, ec);
    if (ec) {
        spdlog::warn("Failed to listen for SIGTERM: {}", ec.message());
    }
    listening_ = true;
    waitForSignal();
    return token_;
}

void CancellationMonitor::Stop() {
    if (!listening_) {
        return;
    }
    listening_ = false;
    boost::system::error_code ec;
    signals_.cancel(ec);
    signals_.clear(ec);
}

void CancellationMonitor::Interrupt(int signal_number) {
    ++interrupts_;
    if (interrupts_ == 1) {
        spdlog::info("Received signal {}, cancelling the session", signal_number);
        token_.Signal();
        terminal_.PrintWarning("Interrupted, cancelling the transfer. Press Ctrl-C again to "
                               "quit immediately.");
        return;
    }
    spdlog::warn("Received signal {} again during shutdown, terminating now", signal_number);
    force_terminate_(signal_number);
}

void CancellationMonitor::waitForSignal() {
    signals_.async_wait([this](const boost::system::error_code& ec, int signal_number) {
        if (ec) {
            // operation_aborted after Stop()
            return;
        }
        Interrupt(signal_number);
        if (listening_) {
            waitForSignal();
        }
    });
}

} // namespace wormhole::session
