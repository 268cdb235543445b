#pragma once

#include <utility>
#include <boost/asio/io_context.hpp>
#include <boost/asio/signal_set.hpp>
#include <cli/terminal.h>
#include <core/util/cancel_token.h>
#include <cstddef>
#include <functional>

namespace wormhole::session {

// Turns SIGINT/SIGTERM into a cooperative cancellation request. The first interrupt
// signals the token and lets the session shut down gracefully; a second one before
// Stop() terminates the process immediately.
class CancellationMonitor {
public:
    using ForceTerminateHandler = std::function<void(int signal_number)>;

    CancellationMonitor(boost::asio::io_context& ioc,
                        core::CancelToken& token,
                        cli::Terminal& terminal,
                        ForceTerminateHandler force_terminate = nullptr);
    ~CancellationMonitor();
    CancellationMonitor(const CancellationMonitor&) = delete;
    CancellationMonitor& operator=(const CancellationMonitor&) = delete;

    // Installs the signal listener and returns the token it writes to
    core::CancelToken& Start();

    // Removes the listener; called once shutdown is complete
    void Stop();

    // Entry point of the signal listener, also used directly by tests
    void Interrupt(int signal_number);

    std::size_t interrupts() const { return interrupts_; }

private:
    void waitForSignal();

    boost::asio::signal_set signals_;
    core::CancelToken& token_;
    cli::Terminal& terminal_;
    ForceTerminateHandler force_terminate_;
    std::size_t interrupts_{0};
    bool listening_{false};
};

} // namespace wormhole::session
