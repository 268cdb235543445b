#pragma once

#include <utility>
#include <boost/asio/awaitable.hpp>
#include <cli/line_reader.h>
#include <cli/terminal.h>
#include <core/model.h>
#include <core/util/cancel_token.h>
#include <memory>
#include <string>
#include <string_view>

namespace wormhole::session {

enum class Decision {
    kAccept,
    kReject,
};

enum class RejectReason {
    kNone,
    kUserDeclined,
    kCancelled,
    kNoInput, // stdin closed or not available and auto-accept is off
};

std::string_view RejectReasonToString(RejectReason reason);

struct Confirmation {
    Decision decision{Decision::kReject};
    RejectReason reason{RejectReason::kNone};

    bool accepted() const { return decision == Decision::kAccept; }
};

// Asks the receiving user whether to accept an offer. Exactly one decision is made per
// gate; the pending prompt is abandoned as soon as the cancel token fires.
class ConfirmationGate {
public:
    ConfirmationGate(cli::Terminal& terminal,
                     std::shared_ptr<cli::LineReader> input,
                     bool auto_accept);

    boost::asio::awaitable<Confirmation> Confirm(const core::TransferMetadata& metadata,
                                                 core::CancelToken& cancel);

    bool decided() const { return decided_; }

private:
    void describeOffer(const core::TransferMetadata& metadata);

    cli::Terminal& terminal_;
    std::shared_ptr<cli::LineReader> input_;
    bool auto_accept_;
    bool decided_{false};
};

} // namespace wormhole::session
