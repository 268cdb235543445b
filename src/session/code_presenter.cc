#include <session/clipboard_channel.h>
#include <session/code_presenter.h>
#include <session/qr_channel.h>
#include <spdlog/spdlog.h>

namespace wormhole::session {

TextChannel::TextChannel(cli::Terminal& terminal, core::SessionRole role)
    : terminal_(terminal)
    , role_(role) {}

void TextChannel::Open(const std::string& code) {
    if (role_ == core::SessionRole::kSend) {
        terminal_.PrintInfo("Wormhole code is: " + code);
        terminal_.Print("On the other computer, please run:\n\n    wormhole-cli receive " + code
                        + "\n");
    } else {
        terminal_.PrintInfo("Using wormhole code: " + code);
    }
}

ActiveChannels::ActiveChannels(ActiveChannels&& other) noexcept
    : channels_(std::move(other.channels_))
    , dismissed_(other.dismissed_) {
    other.channels_.clear();
    other.dismissed_ = true;
}

ActiveChannels& ActiveChannels::operator=(ActiveChannels&& other) noexcept {
    if (this != &other) {
        closeAll();
        channels_ = std::move(other.channels_);
        dismissed_ = other.dismissed_;
        other.channels_.clear();
        other.dismissed_ = true;
    }
    return *this;
}

ActiveChannels::~ActiveChannels() {
    if (!dismissed_ && !channels_.empty()) {
        spdlog::debug("Closing {} presentation channel(s) that were never dismissed",
                      channels_.size());
    }
    closeAll();
}

std::vector<std::string> ActiveChannels::names() const {
    std::vector<std::string> result;
    for (const auto& channel : channels_) {
        result.emplace_back(channel->name());
    }
    return result;
}

void ActiveChannels::closeAll() {
    if (dismissed_) {
        return;
    }
    dismissed_ = true;
    // Reverse order of opening
    for (auto it = channels_.rbegin(); it != channels_.rend(); ++it) {
        try {
            (*it)->Close();
        } catch (const std::exception& e) {
            spdlog::warn("Failed to close {} channel: {}", (*it)->name(), e.what());
        }
    }
    channels_.clear();
}

CodePresenter::CodePresenter(cli::Terminal& terminal, std::vector<ChannelFactory> factories)
    : terminal_(terminal)
    , factories_(std::move(factories)) {}

CodePresenter CodePresenter::FromOptions(const PresenterOptions& options, cli::Terminal& terminal) {
    std::vector<ChannelFactory> factories;
    factories.emplace_back([&terminal, role = options.role] {
        return std::make_unique<TextChannel>(terminal, role);
    });
    if (options.qr) {
        factories.emplace_back([&terminal] { return std::make_unique<QrChannel>(terminal); });
    }
    if (options.clipboard) {
        factories.emplace_back([] { return std::make_unique<ClipboardChannel>(); });
    }
    return CodePresenter(terminal, std::move(factories));
}

ActiveChannels CodePresenter::Present(const std::string& code) {
    ActiveChannels active;
    for (const auto& factory : factories_) {
        std::unique_ptr<PresentationChannel> channel;
        try {
            channel = factory();
            channel->Open(code);
        } catch (const std::exception& e) {
            auto name = channel ? std::string(channel->name()) : std::string("presentation");
            spdlog::warn("{} channel unavailable: {}", name, e.what());
            terminal_.PrintWarning("Could not show the code via " + name + ": " + e.what());
            continue;
        }
        spdlog::debug("Opened {} channel", channel->name());
        active.channels_.push_back(std::move(channel));
    }
    return active;
}

void CodePresenter::Dismiss(ActiveChannels& channels) {
    if (channels.dismissed()) {
        return;
    }
    spdlog::debug("Dismissing {} presentation channel(s)", channels.size());
    channels.closeAll();
}

} // namespace wormhole::session
