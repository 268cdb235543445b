#pragma once

#include <utility>
#include <boost/asio/awaitable.hpp>
#include <chrono>
#include <cli/terminal.h>
#include <core/constant/transfer.h>
#include <core/engine/transfer_event_stream.h>
#include <core/model.h>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>

namespace wormhole::session {

// Accumulates progress samples. Displayed progress never goes backwards.
class ProgressTracker {
public:
    void Update(const core::ProgressSample& sample);
    void MarkComplete();

    std::uint64_t bytes_done() const { return bytes_done_; }
    std::uint64_t bytes_total() const { return bytes_total_; }
    std::chrono::milliseconds elapsed() const { return elapsed_; }

    // nullopt while the total is unknown
    std::optional<double> Percent() const;
    double BytesPerSecond() const;
    std::optional<std::chrono::seconds> Eta() const;

private:
    std::uint64_t bytes_done_{0};
    std::uint64_t bytes_total_{0};
    std::chrono::milliseconds elapsed_{0};
};

std::string FormatBytes(std::uint64_t bytes);
std::string FormatDuration(std::chrono::milliseconds duration);

// Draws the transfer progress line from a TransferEventStream. Frames are rate limited
// to one per render interval however fast samples arrive, and exactly one closing frame
// is rendered when the stream ends.
class ProgressReporter {
public:
    explicit ProgressReporter(cli::Terminal& terminal,
                              std::chrono::milliseconds render_interval
                              = core::transfer::kRenderInterval,
                              std::chrono::milliseconds stall_threshold
                              = core::transfer::kStallThreshold);

    // Completes with the stream's outcome after the closing frame is drawn
    boost::asio::awaitable<core::TransferOutcome> Attach(
        std::shared_ptr<core::TransferEventStream> stream);

    const ProgressTracker& tracker() const { return tracker_; }
    std::size_t frames_rendered() const { return frames_rendered_; }
    std::size_t closing_frames() const { return closing_frames_; }

private:
    void renderFrame(bool stalled);
    void renderClosingFrame(const core::TransferOutcome& outcome);
    std::string describeAmount() const;

    cli::Terminal& terminal_;
    std::chrono::milliseconds render_interval_;
    std::chrono::milliseconds stall_threshold_;
    ProgressTracker tracker_;
    std::size_t frames_rendered_{0};
    std::size_t closing_frames_{0};
};

} // namespace wormhole::session
