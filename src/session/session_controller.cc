#include <utility>
#include <boost/asio/this_coro.hpp>
#include <core/util/pending_operation.h>
#include <core/util/wordlist.h>
#include <fmt/format.h>
#include <session/session_controller.h>
#include <spdlog/spdlog.h>
#include <stdexcept>

namespace net = boost::asio;

namespace wormhole::session {

using core::ErrorKind;
using core::SessionResult;
using core::SessionRole;
using core::SessionState;

namespace {

std::string trim(std::string text) {
    auto first = text.find_first_not_of(" \t");
    if (first == std::string::npos) {
        return {};
    }
    auto last = text.find_last_not_of(" \t");
    return text.substr(first, last - first + 1);
}

} // namespace

SessionController::SessionController(SessionConfig config,
                                     core::TransferEngine& engine,
                                     CodePresenter& presenter,
                                     ProgressReporter& reporter,
                                     ConfirmationGate& gate,
                                     cli::Terminal& terminal,
                                     core::CancelToken& cancel,
                                     std::shared_ptr<cli::LineReader> input)
    : config_(std::move(config))
    , engine_(engine)
    , presenter_(presenter)
    , reporter_(reporter)
    , gate_(gate)
    , terminal_(terminal)
    , cancel_(cancel)
    , input_(std::move(input)) {}

void SessionController::transitionTo(SessionState next) {
    if (core::IsTerminal(state_)) {
        throw std::logic_error(fmt::format("session already ended in {}, cannot enter {}",
                                           core::SessionStateToString(state_),
                                           core::SessionStateToString(next)));
    }
    spdlog::debug("Session state {} -> {}",
                  core::SessionStateToString(state_),
                  core::SessionStateToString(next));
    state_ = next;
    history_.push_back(next);
}

SessionResult SessionController::cancelled(std::string message) const {
    SessionResult result;
    result.state = SessionState::kCancelled;
    result.error = ErrorKind::kCancelled;
    result.message = std::move(message);
    return result;
}

SessionResult SessionController::failed(ErrorKind error, std::string message) const {
    SessionResult result;
    result.state = SessionState::kFailed;
    result.error = error;
    result.message = std::move(message);
    return result;
}

net::awaitable<SessionResult> SessionController::Run() {
    if (state_ != SessionState::kInit) {
        throw std::logic_error("SessionController::Run called twice");
    }
    auto started = std::chrono::steady_clock::now();
    spdlog::info("Starting {} session", core::SessionRoleToString(config_.role));

    ActiveChannels channels;
    SessionResult result;
    try {
        result = co_await drive(channels);
    } catch (const core::RendezvousError& e) {
        spdlog::error("Rendezvous failed: {}", e.what());
        result = failed(ErrorKind::kRendezvous, e.what());
    } catch (const core::TransferError& e) {
        spdlog::error("Transfer failed: {}", e.what());
        result = failed(ErrorKind::kTransfer, e.what());
    } catch (const std::exception& e) {
        spdlog::error("Session failed in state {}: {}",
                      core::SessionStateToString(state_),
                      e.what());
        auto error = state_ == SessionState::kTransferring ? ErrorKind::kTransfer
                                                            : ErrorKind::kRendezvous;
        result = failed(error, e.what());
    }

    presenter_.Dismiss(channels);

    result.code = code_;
    result.elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - started);
    transitionTo(result.state);
    announce(result);
    co_return result;
}

net::awaitable<SessionResult> SessionController::drive(ActiveChannels& channels) {
    auto executor = co_await net::this_coro::executor;

    transitionTo(SessionState::kCodeAllocation);
    if (cancel_.IsSignaled()) {
        co_return cancelled("Cancelled before a code was allocated");
    }

    if (config_.role == SessionRole::kSend) {
        auto allocation = core::PendingOperation<std::string>::Spawn(
            executor, engine_.AllocateCode(config_.request, cancel_));
        if (!co_await allocation->WaitUntil(cancel_)) {
            co_return cancelled("Cancelled while allocating a code");
        }
        code_ = allocation->Take();
        if (!core::IsValidCode(code_)) {
            throw core::RendezvousError(fmt::format("allocated code '{}' is malformed", code_));
        }
    } else {
        code_ = trim(config_.code);
        if (code_.empty()) {
            auto entered = co_await promptForCode();
            if (!entered) {
                co_return cancelled("Cancelled while waiting for a code");
            }
            code_ = *entered;
        }
        if (!core::IsValidCode(code_)) {
            throw core::RendezvousError(
                fmt::format("'{}' is not a valid code, expected e.g. 7-crossover-clockwork",
                            code_));
        }
        auto redemption = core::PendingOperation<core::TransferMetadata>::Spawn(
            executor, engine_.RedeemCode(code_, cancel_));
        if (!co_await redemption->WaitUntil(cancel_)) {
            co_return cancelled("Cancelled while connecting to the sender");
        }
        offer_ = redemption->Take();
    }

    transitionTo(SessionState::kCodeAllocated);
    spdlog::info("Session code {}", code_);
    channels = presenter_.Present(code_);

    if (config_.role == SessionRole::kReceive) {
        transitionTo(SessionState::kConfirmation);
        auto confirmation = co_await gate_.Confirm(*offer_, cancel_);
        if (!confirmation.accepted()) {
            if (confirmation.reason == RejectReason::kCancelled) {
                engine_.RejectOffer("cancelled by the receiver");
                co_return cancelled("Cancelled before the transfer started");
            }
            engine_.RejectOffer(confirmation.reason == RejectReason::kNoInput
                                    ? "the receiver gave no answer"
                                    : "declined by the receiver");
            auto result = cancelled(confirmation.reason == RejectReason::kNoInput
                                        ? "Transfer rejected, no answer to the prompt"
                                        : "Transfer rejected");
            result.error = ErrorKind::kUserRejected;
            co_return result;
        }
    }

    if (cancel_.IsSignaled()) {
        co_return cancelled("Cancelled before the transfer started");
    }
    co_return co_await transfer();
}

net::awaitable<std::optional<std::string>> SessionController::promptForCode() {
    if (!input_) {
        throw core::RendezvousError("no code given and no terminal to ask for one");
    }
    auto executor = co_await net::this_coro::executor;
    terminal_.PrintPrompt("Enter the wormhole code: ");
    auto read = core::PendingOperation<std::string>::Spawn(executor, input_->ReadLine());
    if (!co_await read->WaitUntil(cancel_)) {
        terminal_.Print("");
        co_return std::nullopt;
    }

    std::string line;
    try {
        line = read->Take();
    } catch (const std::exception& e) {
        spdlog::debug("Reading the code failed: {}", e.what());
        throw core::RendezvousError("no code entered");
    }

    auto entered = trim(line);
    auto completed = core::CompleteCode(entered, core::Wordlist::Default());
    if (completed != entered) {
        terminal_.Print("Completed code to " + completed);
    }
    co_return completed;
}

net::awaitable<SessionResult> SessionController::transfer() {
    auto executor = co_await net::this_coro::executor;

    transitionTo(SessionState::kTransferring);
    auto stream = engine_.StartTransfer(config_.request, cancel_);
    auto progress = core::PendingOperation<core::TransferOutcome>::Spawn(executor,
                                                                         reporter_.Attach(stream));

    bool interrupted = !co_await progress->WaitUntil(cancel_);
    if (interrupted) {
        spdlog::info("Waiting up to {} ms for the transfer to stop",
                     config_.cancel_grace_period.count());
        if (!co_await progress->WaitFor(config_.cancel_grace_period)) {
            spdlog::warn("Transfer did not stop within {} ms, abandoning it",
                         config_.cancel_grace_period.count());
            stream->Finish(core::TransferOutcome::Cancelled("grace period elapsed"));
            co_await progress->WaitFor(config_.cancel_grace_period);
        }
    }

    if (!progress->done()) {
        co_return cancelled("Transfer cancelled");
    }
    auto outcome = progress->Take();

    // A cancel observed mid-transfer wins over any outcome the engine reports afterwards.
    SessionResult result;
    if (interrupted) {
        result = cancelled("Transfer cancelled");
    } else if (outcome.tag == core::OutcomeTag::kSuccess) {
        result.state = SessionState::kCompleted;
    } else if (outcome.tag == core::OutcomeTag::kCancelled || cancel_.IsSignaled()) {
        result = cancelled("Transfer cancelled");
    } else {
        result = failed(ErrorKind::kTransfer, outcome.reason);
    }
    result.bytes_transferred = reporter_.tracker().bytes_done();
    co_return result;
}

void SessionController::announce(SessionResult& result) {
    auto amount = FormatBytes(result.bytes_transferred);
    auto elapsed = FormatDuration(result.elapsed);

    switch (result.state) {
    case SessionState::kCompleted:
        if (config_.role == SessionRole::kSend) {
            result.message = fmt::format("Transfer complete, sent {} in {}", amount, elapsed);
        } else {
            if (offer_ && offer_->kind == core::TransferKind::kText) {
                terminal_.Print(offer_->text);
            }
            result.message = fmt::format("Transfer complete, received {} in {}", amount, elapsed);
        }
        terminal_.PrintInfo(result.message);
        break;
    case SessionState::kFailed:
        if (result.error == ErrorKind::kRendezvous) {
            result.message = "Could not connect to the peer: " + result.message;
        } else {
            result.message = "Transfer failed: " + result.message;
        }
        terminal_.PrintError(result.message);
        break;
    case SessionState::kCancelled:
        terminal_.PrintWarning(result.message);
        break;
    default:
        break;
    }
    spdlog::info("Session ended in {} ({})",
                 core::SessionStateToString(result.state),
                 core::ErrorKindToString(result.error));
}

} // namespace wormhole::session
