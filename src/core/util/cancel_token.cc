#include <utility>
#include <boost/asio/redirect_error.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <core/util/cancel_token.h>
#include <spdlog/spdlog.h>
#include <vector>

namespace net = boost::asio;

namespace wormhole::core {

CancelToken::Subscription::Subscription(Subscription&& other) noexcept
    : token_(other.token_)
    , id_(other.id_) {
    other.token_ = nullptr;
}

CancelToken::Subscription& CancelToken::Subscription::operator=(Subscription&& other) noexcept {
    if (this != &other) {
        Reset();
        token_ = other.token_;
        id_ = other.id_;
        other.token_ = nullptr;
    }
    return *this;
}

CancelToken::Subscription::~Subscription() {
    Reset();
}

void CancelToken::Subscription::Reset() {
    if (token_ != nullptr) {
        token_->unsubscribe(id_);
        token_ = nullptr;
    }
}

CancelToken::CancelToken(const net::any_io_executor& executor)
    : timer_(executor, net::steady_timer::time_point::max()) {}

bool CancelToken::Signal() {
    bool expected = false;
    if (!signaled_.compare_exchange_strong(expected, true, std::memory_order_acq_rel)) {
        return false;
    }
    spdlog::debug("Cancel token signaled, notifying {} subscriber(s)", callbacks_.size());

    // Callbacks may drop their own subscription while running
    std::vector<Callback> callbacks;
    callbacks.reserve(callbacks_.size());
    for (auto& [id, callback] : callbacks_) {
        callbacks.push_back(std::move(callback));
    }
    callbacks_.clear();
    for (auto& callback : callbacks) {
        callback();
    }
    timer_.cancel();
    return true;
}

net::awaitable<void> CancelToken::Wait() {
    while (!IsSignaled()) {
        boost::system::error_code ec;
        co_await timer_.async_wait(net::redirect_error(net::use_awaitable, ec));
    }
}

CancelToken::Subscription CancelToken::Subscribe(Callback callback) {
    if (IsSignaled()) {
        callback();
        return Subscription{};
    }
    auto id = next_id_++;
    callbacks_.emplace(id, std::move(callback));
    return Subscription{this, id};
}

void CancelToken::unsubscribe(std::uint64_t id) {
    callbacks_.erase(id);
}

} // namespace wormhole::core
