#pragma once

#include <memory>
#include <optional>
#include <session/code_presenter.h>
#include <string>

namespace wormhole::session {

class ClipboardBackend {
public:
    virtual ~ClipboardBackend() = default;

    // Throws std::runtime_error if the clipboard cannot be read
    virtual std::string Read() = 0;
    // Throws std::runtime_error if the clipboard cannot be written
    virtual void Write(const std::string& text) = 0;
};

// wl-copy/wl-paste under Wayland, xclip under X11
class SystemClipboard : public ClipboardBackend {
public:
    std::string Read() override;
    void Write(const std::string& text) override;
};

// Copies the code to the clipboard. On close the previous contents are restored, but
// only if the clipboard still holds the code.
class ClipboardChannel : public PresentationChannel {
public:
    explicit ClipboardChannel(std::unique_ptr<ClipboardBackend> backend
                              = std::make_unique<SystemClipboard>());

    std::string_view name() const override { return "clipboard"; }
    void Open(const std::string& code) override;
    void Close() override;

private:
    std::unique_ptr<ClipboardBackend> backend_;
    std::optional<std::string> previous_;
    std::string code_;
    bool open_{false};
};

} // namespace wormhole::session
