#pragma once

#include <cli/terminal.h>
#include <core/model.h>
#include <functional>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace wormhole::session {

// One output surface for the code. Open() may throw; a failed channel is skipped.
class PresentationChannel {
public:
    virtual ~PresentationChannel() = default;

    virtual std::string_view name() const = 0;
    virtual void Open(const std::string& code) = 0;
    virtual void Close() = 0;
};

// Shows the code on the terminal. Always enabled.
class TextChannel : public PresentationChannel {
public:
    TextChannel(cli::Terminal& terminal, core::SessionRole role);

    std::string_view name() const override { return "text"; }
    void Open(const std::string& code) override;
    void Close() override {}

private:
    cli::Terminal& terminal_;
    core::SessionRole role_;
};

// Channels that were opened successfully. Each is closed exactly once, by
// CodePresenter::Dismiss or, failing that, by the destructor.
class ActiveChannels {
public:
    ActiveChannels() = default;
    ActiveChannels(ActiveChannels&& other) noexcept;
    ActiveChannels& operator=(ActiveChannels&& other) noexcept;
    ActiveChannels(const ActiveChannels&) = delete;
    ActiveChannels& operator=(const ActiveChannels&) = delete;
    ~ActiveChannels();

    std::size_t size() const { return channels_.size(); }
    bool dismissed() const { return dismissed_; }
    std::vector<std::string> names() const;

private:
    friend class CodePresenter;
    void closeAll();

    std::vector<std::unique_ptr<PresentationChannel>> channels_;
    bool dismissed_{false};
};

struct PresenterOptions {
    core::SessionRole role{core::SessionRole::kSend};
    bool qr{false};
    bool clipboard{false};
};

class CodePresenter {
public:
    using ChannelFactory = std::function<std::unique_ptr<PresentationChannel>()>;

    CodePresenter(cli::Terminal& terminal, std::vector<ChannelFactory> factories);

    // Text always, QR and clipboard when enabled
    static CodePresenter FromOptions(const PresenterOptions& options, cli::Terminal& terminal);

    // Never throws because of a channel; failures become warnings
    ActiveChannels Present(const std::string& code);

    // Idempotent
    void Dismiss(ActiveChannels& channels);

private:
    cli::Terminal& terminal_;
    std::vector<ChannelFactory> factories_;
};

} // namespace wormhole::session
