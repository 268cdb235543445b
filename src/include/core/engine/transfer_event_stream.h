#pragma once

#include <utility>
#include <boost/asio/any_io_executor.hpp>
#include <boost/asio/awaitable.hpp>
#include <boost/asio/steady_timer.hpp>
#include <chrono>
#include <core/model.h>
#include <deque>
#include <optional>

namespace wormhole::core {

// Finite, single-consumer sequence of progress samples that ends with exactly one
// TransferOutcome. The producer is the transfer engine, the consumer the progress
// reporter. Everything after the first outcome is dropped.
class TransferEventStream {
public:
    explicit TransferEventStream(const boost::asio::any_io_executor& executor);
    TransferEventStream(const TransferEventStream&) = delete;
    TransferEventStream& operator=(const TransferEventStream&) = delete;

    void Publish(const ProgressSample& sample);

    // Returns false if the stream was already finished
    bool Finish(TransferOutcome outcome);

    bool finished() const { return finished_; }

    std::optional<TransferEvent> TryNext();

    // Next event, or nullopt if nothing arrived within timeout
    boost::asio::awaitable<std::optional<TransferEvent>> NextFor(
        std::chrono::steady_clock::duration timeout);

private:
    boost::asio::steady_timer notify_;
    std::deque<TransferEvent> events_;
    bool finished_{false};
};

} // namespace wormhole::core
