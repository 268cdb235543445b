#include <utility>
#include <boost/asio/io_context.hpp>
#include <cli/line_reader.h>
#include <cli/terminal.h>
#include <core/util/cancel_token.h>
#include <gtest/gtest.h>
#include <session/confirmation_gate.h>
#include <sstream>
#include <test_support.h>

namespace net = boost::asio;
using namespace wormhole::core;
using namespace wormhole::session;
using namespace std::chrono_literals;
using wormhole::cli::LineReader;
using wormhole::cli::Terminal;

class ConfirmationGateTest : public ::testing::Test {
protected:
    ConfirmationGateTest()
        : terminal_(out_, err_, false)
        , cancel_(ioc_.get_executor()) {}

    std::shared_ptr<LineReader> openInput() {
        auto reader = LineReader::Open(ioc_.get_executor(), pipe_.read_fd());
        pipe_.CloseRead();
        return reader;
    }

    Confirmation confirm(ConfirmationGate& gate, std::shared_ptr<LineReader> input = nullptr) {
        return wormhole::test::RunToCompletion(ioc_, gate.Confirm(offer_, cancel_), [input] {
            if (input) {
                input->Close();
            }
        });
    }

    net::io_context ioc_;
    std::ostringstream out_;
    std::ostringstream err_;
    Terminal terminal_;
    CancelToken cancel_;
    wormhole::test::Pipe pipe_;
    TransferMetadata offer_{TransferKind::kFile, "report.pdf", 2048, {}, {}};
};

TEST_F(ConfirmationGateTest, AcceptsYes) {
    auto input = openInput();
    pipe_.Write("  Yes \n");
    ConfirmationGate gate(terminal_, input, false);

    auto confirmation = confirm(gate, input);
    EXPECT_TRUE(confirmation.accepted());
    EXPECT_EQ(confirmation.reason, RejectReason::kNone);
    EXPECT_NE(out_.str().find("Receiving file (2.0 KiB) into: report.pdf"), std::string::npos);
    EXPECT_NE(out_.str().find("Accept? [y/N] "), std::string::npos);
}

TEST_F(ConfirmationGateTest, AnythingElseDeclines) {
    auto input = openInput();
    pipe_.Write("sure\n");
    ConfirmationGate gate(terminal_, input, false);

    auto confirmation = confirm(gate, input);
    EXPECT_FALSE(confirmation.accepted());
    EXPECT_EQ(confirmation.reason, RejectReason::kUserDeclined);
}

TEST_F(ConfirmationGateTest, EmptyAnswerDeclines) {
    auto input = openInput();
    pipe_.Write("\n");
    ConfirmationGate gate(terminal_, input, false);

    EXPECT_EQ(confirm(gate, input).reason, RejectReason::kUserDeclined);
}

TEST_F(ConfirmationGateTest, AutoAcceptSkipsPrompt) {
    ConfirmationGate gate(terminal_, nullptr, true);

    auto confirmation = confirm(gate);
    EXPECT_TRUE(confirmation.accepted());
    EXPECT_EQ(out_.str().find("Accept?"), std::string::npos);
}

TEST_F(ConfirmationGateTest, NoInputRejects) {
    ConfirmationGate gate(terminal_, nullptr, false);

    auto confirmation = confirm(gate);
    EXPECT_FALSE(confirmation.accepted());
    EXPECT_EQ(confirmation.reason, RejectReason::kNoInput);
    EXPECT_NE(err_.str().find("--accept"), std::string::npos);
}

TEST_F(ConfirmationGateTest, ClosedInputRejects) {
    auto input = openInput();
    pipe_.CloseWrite();
    ConfirmationGate gate(terminal_, input, false);

    EXPECT_EQ(confirm(gate, input).reason, RejectReason::kNoInput);
}

TEST_F(ConfirmationGateTest, AnswerWithoutNewlineAccepts) {
    auto input = openInput();
    pipe_.Write("y");
    pipe_.CloseWrite();
    ConfirmationGate gate(terminal_, input, false);

    auto confirmation = confirm(gate, input);
    EXPECT_TRUE(confirmation.accepted());
    EXPECT_EQ(confirmation.reason, RejectReason::kNone);
}

TEST_F(ConfirmationGateTest, ReaderReturnsFinalLineThenEndOfInput) {
    auto input = openInput();
    pipe_.Write("first\nlast");
    pipe_.CloseWrite();

    EXPECT_EQ(wormhole::test::RunToCompletion(ioc_, input->ReadLine()), "first");
    ioc_.restart();
    EXPECT_EQ(wormhole::test::RunToCompletion(ioc_, input->ReadLine()), "last");
    ioc_.restart();
    EXPECT_THROW(wormhole::test::RunToCompletion(ioc_, input->ReadLine()), std::exception);
}

TEST_F(ConfirmationGateTest, CancelAbandonsPrompt) {
    auto input = openInput();
    ConfirmationGate gate(terminal_, input, false);
    wormhole::test::After(ioc_, 10ms, [this] { cancel_.Signal(); });

    auto confirmation = confirm(gate, input);
    EXPECT_FALSE(confirmation.accepted());
    EXPECT_EQ(confirmation.reason, RejectReason::kCancelled);
}

TEST_F(ConfirmationGateTest, CancelledBeforehandWinsOverAutoAccept) {
    cancel_.Signal();
    ConfirmationGate gate(terminal_, nullptr, true);

    EXPECT_EQ(confirm(gate).reason, RejectReason::kCancelled);
}

TEST_F(ConfirmationGateTest, DecidesOnlyOnce) {
    ConfirmationGate gate(terminal_, nullptr, true);
    confirm(gate);
    EXPECT_TRUE(gate.decided());

    net::io_context other;
    EXPECT_THROW(wormhole::test::RunToCompletion(other, gate.Confirm(offer_, cancel_)),
                 std::logic_error);
}

TEST_F(ConfirmationGateTest, DescribesTextOffers) {
    offer_ = TransferMetadata{TransferKind::kText, "text", 5, "hello", {}};
    ConfirmationGate gate(terminal_, nullptr, true);
    confirm(gate);
    EXPECT_NE(out_.str().find("Receiving text message (5 B)"), std::string::npos);
}
