#include <utility>
#include <boost/asio/io_context.hpp>
#include <cli/terminal.h>
#include <core/util/cancel_token.h>
#include <csignal>
#include <gtest/gtest.h>
#include <session/cancellation_monitor.h>
#include <sstream>
#include <vector>

namespace net = boost::asio;
using wormhole::core::CancelToken;
using wormhole::session::CancellationMonitor;

class CancellationMonitorTest : public ::testing::Test {
protected:
    CancellationMonitorTest()
        : terminal_(out_, err_, false)
        , token_(ioc_.get_executor())
        , monitor_(ioc_, token_, terminal_, [this](int signal_number) {
            forced_.push_back(signal_number);
        }) {}

    net::io_context ioc_;
    std::ostringstream out_;
    std::ostringstream err_;
    wormhole::cli::Terminal terminal_;
    CancelToken token_;
    std::vector<int> forced_;
    CancellationMonitor monitor_;
};

TEST_F(CancellationMonitorTest, FirstInterruptCancelsPolitely) {
    monitor_.Interrupt(SIGINT);

    EXPECT_TRUE(token_.IsSignaled());
    EXPECT_TRUE(forced_.empty());
    EXPECT_EQ(monitor_.interrupts(), 1u);
    EXPECT_NE(err_.str().find("Press Ctrl-C again"), std::string::npos);
}

TEST_F(CancellationMonitorTest, SecondInterruptForcesTermination) {
    monitor_.Interrupt(SIGINT);
    monitor_.Interrupt(SIGTERM);

    ASSERT_EQ(forced_.size(), 1u);
    EXPECT_EQ(forced_.front(), SIGTERM);
    EXPECT_EQ(monitor_.interrupts(), 2u);
}

TEST_F(CancellationMonitorTest, StartReturnsTheSharedToken) {
    auto& token = monitor_.Start();
    EXPECT_EQ(&token, &token_);
    EXPECT_EQ(&monitor_.Start(), &token_);
    monitor_.Stop();
    monitor_.Stop();
    EXPECT_FALSE(token_.IsSignaled());
}

TEST_F(CancellationMonitorTest, DeliveredSignalCancelsToken) {
    monitor_.Start();
    ::raise(SIGINT);
    ioc_.run_one_for(std::chrono::seconds(5));
    monitor_.Stop();
    ioc_.run();

    EXPECT_TRUE(token_.IsSignaled());
    EXPECT_TRUE(forced_.empty());
}
