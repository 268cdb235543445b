#pragma once

#include <utility>
#include <atomic>
#include <boost/asio/any_io_executor.hpp>
#include <boost/asio/awaitable.hpp>
#include <boost/asio/steady_timer.hpp>
#include <cstdint>
#include <functional>
#include <map>

namespace wormhole::core {

// Single-shot cancellation signal shared between the interrupt listener (writer) and
// the session and transfer engine (readers). Once signaled it stays signaled.
// Signal(), Subscribe() and Wait() must run on the token's executor.
class CancelToken {
public:
    using Callback = std::function<void()>;

    // Keeps a callback registered until destroyed
    class Subscription {
    public:
        Subscription() = default;
        Subscription(Subscription&& other) noexcept;
        Subscription& operator=(Subscription&& other) noexcept;
        Subscription(const Subscription&) = delete;
        Subscription& operator=(const Subscription&) = delete;
        ~Subscription();

        void Reset();

    private:
        friend class CancelToken;
        Subscription(CancelToken* token, std::uint64_t id)
            : token_(token)
            , id_(id) {}

        CancelToken* token_{nullptr};
        std::uint64_t id_{0};
    };

    explicit CancelToken(const boost::asio::any_io_executor& executor);
    ~CancelToken() = default;
    CancelToken(const CancelToken&) = delete;
    CancelToken& operator=(const CancelToken&) = delete;

    // Returns true only for the call that actually flipped the token
    bool Signal();

    bool IsSignaled() const noexcept { return signaled_.load(std::memory_order_acquire); }

    // Suspends until the token is signaled
    boost::asio::awaitable<void> Wait();

    // Runs callback on Signal(); immediately if already signaled
    [[nodiscard]] Subscription Subscribe(Callback callback);

private:
    void unsubscribe(std::uint64_t id);

    boost::asio::steady_timer timer_;
    std::atomic<bool> signaled_{false};
    std::map<std::uint64_t, Callback> callbacks_;
    std::uint64_t next_id_{1};
};

} // namespace wormhole::core
