#include <utility>
#include <boost/asio/io_context.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/this_coro.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <core/util/cancel_token.h>
#include <core/util/pending_operation.h>
#include <gtest/gtest.h>
#include <test_support.h>

namespace net = boost::asio;
using wormhole::core::CancelToken;
using wormhole::core::PendingOperation;

namespace {

net::awaitable<int> slowValue(net::any_io_executor executor, std::chrono::milliseconds delay) {
    net::steady_timer timer(executor, delay);
    co_await timer.async_wait(net::use_awaitable);
    co_return 1;
}

net::awaitable<int> failingValue() {
    throw std::runtime_error("boom");
    co_return 0;
}

} // namespace

TEST(CancelTokenTest, SignalIsSingleShot) {
    net::io_context ioc;
    CancelToken token(ioc.get_executor());

    EXPECT_FALSE(token.IsSignaled());
    EXPECT_TRUE(token.Signal());
    EXPECT_TRUE(token.IsSignaled());
    EXPECT_FALSE(token.Signal());
    EXPECT_TRUE(token.IsSignaled());
}

TEST(CancelTokenTest, SubscribersRunOnce) {
    net::io_context ioc;
    CancelToken token(ioc.get_executor());
    int calls = 0;
    auto subscription = token.Subscribe([&calls] { ++calls; });

    token.Signal();
    token.Signal();
    EXPECT_EQ(calls, 1);
}

TEST(CancelTokenTest, SubscribeAfterSignalRunsImmediately) {
    net::io_context ioc;
    CancelToken token(ioc.get_executor());
    token.Signal();

    bool called = false;
    auto subscription = token.Subscribe([&called] { called = true; });
    EXPECT_TRUE(called);
}

TEST(CancelTokenTest, ResetSubscriptionIsNotCalled) {
    net::io_context ioc;
    CancelToken token(ioc.get_executor());
    bool called = false;
    {
        auto subscription = token.Subscribe([&called] { called = true; });
    }
    token.Signal();
    EXPECT_FALSE(called);
}

TEST(CancelTokenTest, WaitResumesOnSignal) {
    net::io_context ioc;
    CancelToken token(ioc.get_executor());
    wormhole::test::After(ioc, std::chrono::milliseconds(10), [&token] { token.Signal(); });

    auto waited = wormhole::test::RunToCompletion(ioc, [&token]() -> net::awaitable<bool> {
        co_await token.Wait();
        co_return token.IsSignaled();
    }());
    EXPECT_TRUE(waited);
}

TEST(PendingOperationTest, FinishesBeforeCancel) {
    net::io_context ioc;
    CancelToken token(ioc.get_executor());

    auto result = wormhole::test::RunToCompletion(ioc, [&]() -> net::awaitable<int> {
        auto executor = co_await net::this_coro::executor;
        auto op = PendingOperation<int>::Spawn(executor, []() -> net::awaitable<int> {
            co_return 42;
        }());
        EXPECT_TRUE(co_await op->WaitUntil(token));
        co_return op->Take();
    }());
    EXPECT_EQ(result, 42);
}

TEST(PendingOperationTest, CancelWinsOverSlowOperation) {
    net::io_context ioc;
    CancelToken token(ioc.get_executor());
    wormhole::test::After(ioc, std::chrono::milliseconds(5), [&token] { token.Signal(); });

    auto finished = wormhole::test::RunToCompletion(ioc, [&]() -> net::awaitable<bool> {
        auto executor = co_await net::this_coro::executor;
        auto op = PendingOperation<int>::Spawn(executor,
                                               slowValue(executor, std::chrono::milliseconds(200)));
        auto done = co_await op->WaitUntil(token);
        EXPECT_THROW(op->Take(), std::logic_error);
        co_return done;
    }());
    EXPECT_FALSE(finished);
}

TEST(PendingOperationTest, WaitForTimesOut) {
    net::io_context ioc;

    auto finished = wormhole::test::RunToCompletion(ioc, [&]() -> net::awaitable<bool> {
        auto executor = co_await net::this_coro::executor;
        auto op = PendingOperation<int>::Spawn(executor,
                                               slowValue(executor, std::chrono::milliseconds(200)));
        co_return co_await op->WaitFor(std::chrono::milliseconds(10));
    }());
    EXPECT_FALSE(finished);
}

TEST(PendingOperationTest, TakeRethrowsOperationError) {
    net::io_context ioc;
    CancelToken token(ioc.get_executor());

    auto run = [&]() -> net::awaitable<int> {
        auto executor = co_await net::this_coro::executor;
        auto op = PendingOperation<int>::Spawn(executor, failingValue());
        co_await op->WaitUntil(token);
        co_return op->Take();
    };
    EXPECT_THROW(wormhole::test::RunToCompletion(ioc, run()), std::runtime_error);
}
