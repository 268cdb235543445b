#pragma once

#include <utility>
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/detached.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/redirect_error.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <chrono>
#include <core/engine/transfer_engine.h>
#include <optional>
#include <string>
#include <vector>

namespace wormhole::test {

// Scripted engine. Every field is read when the matching operation runs.
class FakeTransferEngine : public core::TransferEngine {
public:
    explicit FakeTransferEngine(boost::asio::io_context& ioc)
        : ioc_(ioc) {}

    std::string code{"7-crossover-clockwork"};
    std::optional<std::string> rendezvous_error;
    bool rendezvous_hangs{false}; // until cancelled
    core::TransferMetadata offer{core::TransferKind::kFile, "report.pdf", 100, {}, {}};

    std::vector<core::ProgressSample> samples;
    std::chrono::milliseconds sample_interval{1};
    core::TransferOutcome outcome{core::TransferOutcome::Success()};
    bool transfer_hangs{false}; // after the samples, until cancelled
    bool ignore_cancel{false};  // never acknowledges cancellation

    int allocate_calls{0};
    int redeem_calls{0};
    int reject_calls{0};
    int start_calls{0};
    int shutdown_calls{0};
    std::vector<std::string> redeemed_codes;
    std::vector<std::string> reject_reasons;

    boost::asio::awaitable<std::string> AllocateCode(const core::TransferRequest& /*request*/,
                                                     core::CancelToken& cancel) override {
        ++allocate_calls;
        co_await rendezvous(cancel);
        co_return code;
    }

    boost::asio::awaitable<core::TransferMetadata> RedeemCode(const std::string& redeemed,
                                                              core::CancelToken& cancel) override {
        ++redeem_calls;
        redeemed_codes.push_back(redeemed);
        co_await rendezvous(cancel);
        co_return offer;
    }

    void RejectOffer(const std::string& reason) override {
        ++reject_calls;
        reject_reasons.push_back(reason);
    }

    std::shared_ptr<core::TransferEventStream> StartTransfer(const core::TransferRequest&,
                                                             core::CancelToken& cancel) override {
        ++start_calls;
        auto stream = std::make_shared<core::TransferEventStream>(ioc_.get_executor());
        boost::asio::co_spawn(ioc_, play(stream, cancel), boost::asio::detached);
        return stream;
    }

    void Shutdown() override { ++shutdown_calls; }

private:
    boost::asio::awaitable<void> rendezvous(core::CancelToken& cancel) {
        if (rendezvous_hangs) {
            co_await cancel.Wait();
            throw core::RendezvousError("cancelled");
        }
        if (rendezvous_error) {
            throw core::RendezvousError(*rendezvous_error);
        }
    }

    boost::asio::awaitable<void> play(std::shared_ptr<core::TransferEventStream> stream,
                                      core::CancelToken& cancel) {
        boost::asio::steady_timer timer(ioc_);
        for (const auto& sample : samples) {
            timer.expires_after(sample_interval);
            boost::system::error_code ec;
            co_await timer.async_wait(boost::asio::redirect_error(boost::asio::use_awaitable, ec));
            if (cancel.IsSignaled() && !ignore_cancel) {
                stream->Finish(core::TransferOutcome::Cancelled());
                co_return;
            }
            stream->Publish(sample);
        }
        if (transfer_hangs) {
            co_await cancel.Wait();
            if (!ignore_cancel) {
                stream->Finish(core::TransferOutcome::Cancelled());
            }
            co_return;
        }
        stream->Finish(outcome);
    }

    boost::asio::io_context& ioc_;
};

} // namespace wormhole::test
