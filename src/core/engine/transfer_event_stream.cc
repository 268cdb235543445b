#include <utility>
#include <boost/asio/redirect_error.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <core/engine/transfer_event_stream.h>
#include <spdlog/spdlog.h>

namespace net = boost::asio;

namespace wormhole::core {

TransferEventStream::TransferEventStream(const net::any_io_executor& executor)
    : notify_(executor) {}

void TransferEventStream::Publish(const ProgressSample& sample) {
    if (finished_) {
        spdlog::debug("Dropping progress sample published after the outcome");
        return;
    }
    events_.emplace_back(sample);
    notify_.cancel();
}

bool TransferEventStream::Finish(TransferOutcome outcome) {
    if (finished_) {
        spdlog::debug("Transfer stream already finished, ignoring outcome '{}'",
                      OutcomeTagToString(outcome.tag));
        return false;
    }
    finished_ = true;
    events_.emplace_back(std::move(outcome));
    notify_.cancel();
    return true;
}

std::optional<TransferEvent> TransferEventStream::TryNext() {
    if (events_.empty()) {
        return std::nullopt;
    }
    TransferEvent event = std::move(events_.front());
    events_.pop_front();
    return event;
}

net::awaitable<std::optional<TransferEvent>> TransferEventStream::NextFor(
    std::chrono::steady_clock::duration timeout) {
    if (auto event = TryNext(); event) {
        co_return event;
    }
    notify_.expires_after(timeout);
    boost::system::error_code ec;
    co_await notify_.async_wait(net::redirect_error(net::use_awaitable, ec));
    co_return TryNext();
}

} // namespace wormhole::core
