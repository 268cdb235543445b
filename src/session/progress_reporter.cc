#include <algorithm>
#include <fmt/format.h>
#include <session/progress_reporter.h>
#include <spdlog/spdlog.h>
#include <variant>

namespace net = boost::asio;

namespace wormhole::session {

namespace {

constexpr std::size_t kBarWidth = 24;

std::string progressBar(double percent) {
    auto filled = static_cast<std::size_t>(percent / 100.0 * kBarWidth);
    filled = std::min(filled, kBarWidth);
    std::string bar(filled, '=');
    if (filled < kBarWidth) {
        bar += '>';
        bar.append(kBarWidth - filled - 1, ' ');
    }
    return "[" + bar + "]";
}

} // namespace

void ProgressTracker::Update(const core::ProgressSample& sample) {
    bytes_done_ = std::max(bytes_done_, sample.bytes_done);
    if (sample.bytes_total > 0) {
        bytes_total_ = sample.bytes_total;
    }
    elapsed_ = std::max(elapsed_, sample.elapsed);
}

void ProgressTracker::MarkComplete() {
    bytes_done_ = std::max(bytes_done_, bytes_total_);
}

std::optional<double> ProgressTracker::Percent() const {
    if (bytes_total_ == 0) {
        return std::nullopt;
    }
    auto ratio = static_cast<double>(bytes_done_) / static_cast<double>(bytes_total_);
    return std::min(ratio, 1.0) * 100.0;
}

double ProgressTracker::BytesPerSecond() const {
    if (elapsed_.count() <= 0) {
        return 0.0;
    }
    return static_cast<double>(bytes_done_) * 1000.0 / static_cast<double>(elapsed_.count());
}

std::optional<std::chrono::seconds> ProgressTracker::Eta() const {
    auto rate = BytesPerSecond();
    if (bytes_total_ == 0 || rate <= 0.0 || bytes_done_ >= bytes_total_) {
        return std::nullopt;
    }
    auto remaining = static_cast<double>(bytes_total_ - bytes_done_);
    return std::chrono::seconds(static_cast<std::int64_t>(remaining / rate + 0.5));
}

std::string FormatBytes(std::uint64_t bytes) {
    constexpr const char* kUnits[] = {"B", "KiB", "MiB", "GiB", "TiB"};
    if (bytes < 1024) {
        return fmt::format("{} B", bytes);
    }
    auto value = static_cast<double>(bytes);
    std::size_t unit = 0;
    while (value >= 1024.0 && unit + 1 < std::size(kUnits)) {
        value /= 1024.0;
        ++unit;
    }
    return fmt::format("{:.1f} {}", value, kUnits[unit]);
}

std::string FormatDuration(std::chrono::milliseconds duration) {
    auto total = std::chrono::duration_cast<std::chrono::seconds>(duration).count();
    auto hours = total / 3600;
    auto minutes = (total % 3600) / 60;
    auto seconds = total % 60;
    if (hours > 0) {
        return fmt::format("{}:{:02}:{:02}", hours, minutes, seconds);
    }
    return fmt::format("{:02}:{:02}", minutes, seconds);
}

ProgressReporter::ProgressReporter(cli::Terminal& terminal,
                                   std::chrono::milliseconds render_interval,
                                   std::chrono::milliseconds stall_threshold)
    : terminal_(terminal)
    , render_interval_(render_interval)
    , stall_threshold_(stall_threshold) {}

net::awaitable<core::TransferOutcome> ProgressReporter::Attach(
    std::shared_ptr<core::TransferEventStream> stream) {
    using Clock = std::chrono::steady_clock;

    std::optional<Clock::time_point> last_render;
    auto last_event = Clock::now();
    bool dirty = false;
    bool stalled = false;
    bool started = false; // a sender waits for its peer before the first sample

    while (true) {
        Clock::duration wait = render_interval_;
        if (dirty && last_render) {
            auto since = Clock::now() - *last_render;
            wait = since >= render_interval_ ? Clock::duration::zero() : render_interval_ - since;
        }

        auto event = co_await stream->NextFor(wait);
        auto now = Clock::now();

        if (event) {
            if (auto* outcome = std::get_if<core::TransferOutcome>(&*event)) {
                renderClosingFrame(*outcome);
                co_return *outcome;
            }
            tracker_.Update(std::get<core::ProgressSample>(*event));
            last_event = now;
            started = true;
            stalled = false;
            dirty = true;
        } else if (started && !stalled && now - last_event >= stall_threshold_) {
            spdlog::debug("No progress for {} ms", stall_threshold_.count());
            stalled = true;
            dirty = true;
        }

        if (dirty && (!last_render || now - *last_render >= render_interval_)) {
            renderFrame(stalled);
            last_render = now;
            dirty = false;
        }
    }
}

std::string ProgressReporter::describeAmount() const {
    if (tracker_.bytes_total() == 0) {
        return FormatBytes(tracker_.bytes_done());
    }
    return FormatBytes(tracker_.bytes_done()) + " / " + FormatBytes(tracker_.bytes_total());
}

void ProgressReporter::renderFrame(bool stalled) {
    std::string line;
    if (auto percent = tracker_.Percent(); percent) {
        line = fmt::format("{:5.1f}% {} ", *percent, progressBar(*percent));
    }
    line += describeAmount();
    if (stalled) {
        line += "  (stalled)";
    } else {
        line += "  " + FormatBytes(static_cast<std::uint64_t>(tracker_.BytesPerSecond())) + "/s";
        if (auto eta = tracker_.Eta(); eta) {
            line += "  ETA " + FormatDuration(*eta);
        }
    }
    terminal_.UpdateStatusLine(line);
    ++frames_rendered_;
}

void ProgressReporter::renderClosingFrame(const core::TransferOutcome& outcome) {
    std::string line;
    switch (outcome.tag) {
    case core::OutcomeTag::kSuccess:
        tracker_.MarkComplete();
        line = fmt::format("100.0% {} {} in {}",
                           progressBar(100.0),
                           describeAmount(),
                           FormatDuration(tracker_.elapsed()));
        break;
    case core::OutcomeTag::kFailed:
        line = "[failed: " + outcome.reason + "] " + describeAmount();
        break;
    case core::OutcomeTag::kCancelled:
        line = "[cancelled] " + describeAmount();
        break;
    }
    terminal_.FinishStatusLine(line);
    ++frames_rendered_;
    ++closing_frames_;
}

} // namespace wormhole::session
