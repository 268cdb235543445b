#pragma once

#include <utility>
#include <boost/asio/any_io_executor.hpp>
#include <boost/asio/awaitable.hpp>
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/redirect_error.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <chrono>
#include <core/util/cancel_token.h>
#include <exception>
#include <memory>
#include <optional>
#include <stdexcept>

namespace wormhole::core {

// An awaitable spawned onto the executor whose completion can be raced against a
// CancelToken or a deadline. If the waiter gives up, the operation keeps running and its
// result is dropped when it eventually completes.
// T must be default constructible (co_spawn completion signature).
template <typename T>
class PendingOperation : public std::enable_shared_from_this<PendingOperation<T>> {
public:
    static std::shared_ptr<PendingOperation> Spawn(const boost::asio::any_io_executor& executor,
                                                   boost::asio::awaitable<T> operation) {
        std::shared_ptr<PendingOperation> pending(new PendingOperation(executor));
        boost::asio::co_spawn(executor,
                              std::move(operation),
                              [pending](std::exception_ptr error, T value) {
                                  pending->complete(std::move(error), std::move(value));
                              });
        return pending;
    }

    bool done() const { return done_; }

    // true if the operation finished, false if the token fired first
    boost::asio::awaitable<bool> WaitUntil(CancelToken& token) {
        auto self = this->shared_from_this();
        auto subscription = token.Subscribe([self] { self->timer_.cancel(); });
        while (!done_ && !token.IsSignaled()) {
            boost::system::error_code ec;
            co_await timer_.async_wait(boost::asio::redirect_error(boost::asio::use_awaitable, ec));
        }
        co_return done_;
    }

    // true if the operation finished before the timeout elapsed
    boost::asio::awaitable<bool> WaitFor(std::chrono::steady_clock::duration timeout) {
        auto self = this->shared_from_this();
        auto expired = std::make_shared<bool>(false);
        boost::asio::steady_timer deadline(timer_.get_executor(), timeout);
        deadline.async_wait([self, expired](const boost::system::error_code& ec) {
            if (!ec) {
                *expired = true;
                self->timer_.cancel();
            }
        });
        while (!done_ && !*expired) {
            boost::system::error_code ec;
            co_await timer_.async_wait(boost::asio::redirect_error(boost::asio::use_awaitable, ec));
        }
        deadline.cancel();
        co_return done_;
    }

    // Rethrows the operation's exception, if any
    T Take() {
        if (!done_) {
            throw std::logic_error("PendingOperation::Take called before completion");
        }
        if (error_) {
            std::rethrow_exception(error_);
        }
        return std::move(*value_);
    }

private:
    explicit PendingOperation(const boost::asio::any_io_executor& executor)
        : timer_(executor, boost::asio::steady_timer::time_point::max()) {}

    void complete(std::exception_ptr error, T value) {
        done_ = true;
        if (error) {
            error_ = std::move(error);
        } else {
            value_.emplace(std::move(value));
        }
        timer_.cancel();
    }

    boost::asio::steady_timer timer_;
    bool done_{false};
    std::exception_ptr error_;
    std::optional<T> value_;
};

} // namespace wormhole::core
