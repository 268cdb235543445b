#include <utility>
#include <boost/asio/io_context.hpp>
#include <core/engine/transfer_event_stream.h>
#include <gtest/gtest.h>
#include <test_support.h>

namespace net = boost::asio;
using namespace wormhole::core;

TEST(TransferEventStreamTest, DeliversSamplesInOrderThenOutcome) {
    net::io_context ioc;
    TransferEventStream stream(ioc.get_executor());
    stream.Publish({10, 100, std::chrono::milliseconds(1)});
    stream.Publish({20, 100, std::chrono::milliseconds(2)});
    EXPECT_TRUE(stream.Finish(TransferOutcome::Success()));

    auto first = stream.TryNext();
    ASSERT_TRUE(first);
    EXPECT_EQ(std::get<ProgressSample>(*first).bytes_done, 10u);
    auto second = stream.TryNext();
    ASSERT_TRUE(second);
    EXPECT_EQ(std::get<ProgressSample>(*second).bytes_done, 20u);
    auto last = stream.TryNext();
    ASSERT_TRUE(last);
    EXPECT_EQ(std::get<TransferOutcome>(*last).tag, OutcomeTag::kSuccess);
    EXPECT_FALSE(stream.TryNext());
}

TEST(TransferEventStreamTest, OnlyFirstOutcomeCounts) {
    net::io_context ioc;
    TransferEventStream stream(ioc.get_executor());
    EXPECT_TRUE(stream.Finish(TransferOutcome::Failed("peer disconnected")));
    EXPECT_FALSE(stream.Finish(TransferOutcome::Success()));
    stream.Publish({5, 10, {}});

    auto event = stream.TryNext();
    ASSERT_TRUE(event);
    const auto& outcome = std::get<TransferOutcome>(*event);
    EXPECT_EQ(outcome.tag, OutcomeTag::kFailed);
    EXPECT_EQ(outcome.reason, "peer disconnected");
    EXPECT_FALSE(stream.TryNext());
    EXPECT_TRUE(stream.finished());
}

TEST(TransferEventStreamTest, NextForTimesOutWhenIdle) {
    net::io_context ioc;
    TransferEventStream stream(ioc.get_executor());

    auto event = wormhole::test::RunToCompletion(
        ioc,
        [&]() -> net::awaitable<std::optional<TransferEvent>> {
            co_return co_await stream.NextFor(std::chrono::milliseconds(5));
        }());
    EXPECT_FALSE(event);
}

TEST(TransferEventStreamTest, NextForWakesOnPublish) {
    net::io_context ioc;
    TransferEventStream stream(ioc.get_executor());
    wormhole::test::After(ioc, std::chrono::milliseconds(5), [&stream] {
        stream.Publish({7, 0, {}});
    });

    auto started = std::chrono::steady_clock::now();
    auto event = wormhole::test::RunToCompletion(
        ioc,
        [&]() -> net::awaitable<std::optional<TransferEvent>> {
            co_return co_await stream.NextFor(std::chrono::seconds(10));
        }());
    ASSERT_TRUE(event);
    EXPECT_EQ(std::get<ProgressSample>(*event).bytes_done, 7u);
    EXPECT_LT(std::chrono::steady_clock::now() - started, std::chrono::seconds(5));
}
