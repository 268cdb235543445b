#pragma once

#include <utility>
#include <boost/asio/awaitable.hpp>
#include <chrono>
#include <cli/line_reader.h>
#include <cli/terminal.h>
#include <core/constant/transfer.h>
#include <core/engine/transfer_engine.h>
#include <core/model.h>
#include <core/util/cancel_token.h>
#include <memory>
#include <optional>
#include <session/code_presenter.h>
#include <session/confirmation_gate.h>
#include <session/progress_reporter.h>
#include <string>
#include <vector>

namespace wormhole::session {

struct SessionConfig {
    core::SessionRole role{core::SessionRole::kSend};
    core::TransferRequest request;
    std::string code; // receive only; prompted for when empty
    bool auto_accept{false};
    std::chrono::milliseconds cancel_grace_period{core::transfer::kDefaultCancelGracePeriod};
};

// Drives one send or receive session through
// Init -> CodeAllocation -> CodeAllocated -> [Confirmation] -> Transferring -> terminal state.
// Exactly one terminal state is entered, presentation channels are always dismissed, and
// exactly one closing message is printed.
class SessionController {
public:
    SessionController(SessionConfig config,
                      core::TransferEngine& engine,
                      CodePresenter& presenter,
                      ProgressReporter& reporter,
                      ConfirmationGate& gate,
                      cli::Terminal& terminal,
                      core::CancelToken& cancel,
                      std::shared_ptr<cli::LineReader> input = nullptr);

    SessionController(const SessionController&) = delete;
    SessionController& operator=(const SessionController&) = delete;

    // May only be awaited once
    boost::asio::awaitable<core::SessionResult> Run();

    core::SessionState state() const { return state_; }
    const std::vector<core::SessionState>& history() const { return history_; }

private:
    boost::asio::awaitable<core::SessionResult> drive(ActiveChannels& channels);
    boost::asio::awaitable<std::optional<std::string>> promptForCode();
    boost::asio::awaitable<core::SessionResult> transfer();

    void transitionTo(core::SessionState next);
    core::SessionResult cancelled(std::string message) const;
    core::SessionResult failed(core::ErrorKind error, std::string message) const;
    void announce(core::SessionResult& result);

    SessionConfig config_;
    core::TransferEngine& engine_;
    CodePresenter& presenter_;
    ProgressReporter& reporter_;
    ConfirmationGate& gate_;
    cli::Terminal& terminal_;
    core::CancelToken& cancel_;
    std::shared_ptr<cli::LineReader> input_;

    core::SessionState state_{core::SessionState::kInit};
    std::vector<core::SessionState> history_{core::SessionState::kInit};
    std::string code_;
    std::optional<core::TransferMetadata> offer_;
};

} // namespace wormhole::session
