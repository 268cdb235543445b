#pragma once

#include <utility>
#include <boost/asio/awaitable.hpp>
#include <core/engine/transfer_event_stream.h>
#include <core/model.h>
#include <core/util/cancel_token.h>
#include <filesystem>
#include <memory>
#include <stdexcept>
#include <string>

namespace wormhole::core {

// Code allocation or redemption failed (unreachable peer, wrong or malformed code)
class RendezvousError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Data channel or integrity failure once the transfer is running
class TransferError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

struct TransferRequest {
    SessionRole role{SessionRole::kSend};
    TransferKind kind{TransferKind::kFile};
    std::filesystem::path path; // send: file or directory to offer; receive: output directory
    std::string text;           // send-text only
};

// The protocol implementation the session drives. Every operation honors the cancel
// token; the controller additionally stops waiting on it when the token fires.
class TransferEngine {
public:
    virtual ~TransferEngine() = default;

    // Send role. Prepares the offer for request and returns the code to hand to the peer.
    virtual boost::asio::awaitable<std::string> AllocateCode(const TransferRequest& request,
                                                             CancelToken& cancel)
        = 0;

    // Receive role. Meets the sender and returns what it offers.
    virtual boost::asio::awaitable<TransferMetadata> RedeemCode(const std::string& code,
                                                                CancelToken& cancel)
        = 0;

    // Receive role. Tells the sender the offer was declined and why; no data is exchanged.
    virtual void RejectOffer(const std::string& reason) = 0;

    // Starts moving data. The returned stream ends with Success, Failed or Cancelled.
    virtual std::shared_ptr<TransferEventStream> StartTransfer(const TransferRequest& request,
                                                               CancelToken& cancel)
        = 0;

    // Releases sockets and timers so the io_context can drain
    virtual void Shutdown() {}
};

} // namespace wormhole::core
