#pragma once

#include <cli/terminal.h>
#include <cstddef>
#include <session/code_presenter.h>
#include <string>
#include <vector>

namespace wormhole::session {

// modules[y][x] is true for a dark module
using QrMatrix = std::vector<std::vector<bool>>;

// Encodes text as a QR symbol. Throws std::runtime_error when QR support was not built in.
QrMatrix EncodeQr(const std::string& text);

// Two module rows per terminal line using half-block characters. Light modules are drawn
// filled so the symbol scans on a dark terminal background.
std::vector<std::string> RenderQrRows(const QrMatrix& modules, std::size_t quiet_zone = 2);

class QrChannel : public PresentationChannel {
public:
    explicit QrChannel(cli::Terminal& terminal);

    std::string_view name() const override { return "QR"; }
    void Open(const std::string& code) override;

    // Erases the block if nothing was printed below it, otherwise leaves it in scrollback
    void Close() override;

private:
    cli::Terminal& terminal_;
    std::size_t mark_{0};
    std::size_t lines_{0};
};

} // namespace wormhole::session
