#include <utility>
#include <algorithm>
#include <boost/asio/this_coro.hpp>
#include <cctype>
#include <core/util/pending_operation.h>
#include <fmt/format.h>
#include <session/confirmation_gate.h>
#include <session/progress_reporter.h>
#include <spdlog/spdlog.h>
#include <stdexcept>

namespace net = boost::asio;

namespace wormhole::session {

namespace {

bool isAffirmative(std::string answer) {
    auto not_space = [](unsigned char c) { return !std::isspace(c); };
    answer.erase(answer.begin(), std::find_if(answer.begin(), answer.end(), not_space));
    answer.erase(std::find_if(answer.rbegin(), answer.rend(), not_space).base(), answer.end());
    std::transform(answer.begin(), answer.end(), answer.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    return answer == "y" || answer == "yes";
}

} // namespace

std::string_view RejectReasonToString(RejectReason reason) {
    switch (reason) {
    case RejectReason::kNone:
        return "none";
    case RejectReason::kUserDeclined:
        return "declined by user";
    case RejectReason::kCancelled:
        return "cancelled";
    case RejectReason::kNoInput:
        return "no input available";
    }
    return "unknown";
}

ConfirmationGate::ConfirmationGate(cli::Terminal& terminal,
                                   std::shared_ptr<cli::LineReader> input,
                                   bool auto_accept)
    : terminal_(terminal)
    , input_(std::move(input))
    , auto_accept_(auto_accept) {}

void ConfirmationGate::describeOffer(const core::TransferMetadata& metadata) {
    switch (metadata.kind) {
    case core::TransferKind::kFile:
        terminal_.Print(fmt::format("Receiving file ({}) into: {}",
                                    FormatBytes(metadata.size),
                                    metadata.name));
        break;
    case core::TransferKind::kDirectory:
        terminal_.Print(fmt::format("Receiving directory ({}, {} files) into: {}",
                                    FormatBytes(metadata.size),
                                    metadata.entries.size(),
                                    metadata.name));
        break;
    case core::TransferKind::kText:
        terminal_.Print(fmt::format("Receiving text message ({})", FormatBytes(metadata.size)));
        break;
    }
}

net::awaitable<Confirmation> ConfirmationGate::Confirm(const core::TransferMetadata& metadata,
                                                       core::CancelToken& cancel) {
    if (decided_) {
        throw std::logic_error("ConfirmationGate already made its decision");
    }
    decided_ = true;

    describeOffer(metadata);

    if (cancel.IsSignaled()) {
        co_return Confirmation{Decision::kReject, RejectReason::kCancelled};
    }
    if (auto_accept_) {
        spdlog::info("Offer of {} accepted automatically", metadata.name);
        co_return Confirmation{Decision::kAccept, RejectReason::kNone};
    }
    if (!input_) {
        terminal_.PrintWarning("No input available to confirm the offer, use --accept");
        co_return Confirmation{Decision::kReject, RejectReason::kNoInput};
    }

    terminal_.PrintPrompt("Accept? [y/N] ");
    auto executor = co_await net::this_coro::executor;
    auto read = core::PendingOperation<std::string>::Spawn(executor, input_->ReadLine());
    if (!co_await read->WaitUntil(cancel)) {
        terminal_.Print("");
        co_return Confirmation{Decision::kReject, RejectReason::kCancelled};
    }

    std::string answer;
    try {
        answer = read->Take();
    } catch (const std::exception& e) {
        spdlog::debug("Reading the confirmation failed: {}", e.what());
        terminal_.Print("");
        co_return Confirmation{Decision::kReject, RejectReason::kNoInput};
    }

    if (isAffirmative(answer)) {
        spdlog::info("Offer of {} accepted", metadata.name);
        co_return Confirmation{Decision::kAccept, RejectReason::kNone};
    }
    spdlog::info("Offer of {} declined", metadata.name);
    co_return Confirmation{Decision::kReject, RejectReason::kUserDeclined};
}

} // namespace wormhole::session
