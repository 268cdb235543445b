#include <session/qr_channel.h>
#include <spdlog/spdlog.h>
#include <stdexcept>

#ifdef WORMHOLE_HAS_QRENCODE
#include <memory>
#include <qrencode.h>
#endif

namespace wormhole::session {

QrMatrix EncodeQr(const std::string& text) {
#ifdef WORMHOLE_HAS_QRENCODE
    std::unique_ptr<QRcode, decltype(&QRcode_free)> qr(
        QRcode_encodeString(text.c_str(), 0, QR_ECLEVEL_L, QR_MODE_8, 1), &QRcode_free);
    if (!qr) {
        throw std::runtime_error("failed to encode QR code");
    }
    auto width = static_cast<std::size_t>(qr->width);
    QrMatrix modules(width, std::vector<bool>(width, false));
    for (std::size_t y = 0; y < width; ++y) {
        for (std::size_t x = 0; x < width; ++x) {
            modules[y][x] = (qr->data[y * width + x] & 0x01) != 0;
        }
    }
    return modules;
#else
    (void) text;
    throw std::runtime_error("QR support is not available in this build");
#endif
}

std::vector<std::string> RenderQrRows(const QrMatrix& modules, std::size_t quiet_zone) {
    auto size = modules.size();
    auto total = size + 2 * quiet_zone;
    auto light = [&](std::size_t row, std::size_t col) {
        if (row < quiet_zone || col < quiet_zone || row >= quiet_zone + size
            || col >= quiet_zone + size) {
            return true;
        }
        return !modules[row - quiet_zone][col - quiet_zone];
    };

    std::vector<std::string> rows;
    for (std::size_t row = 0; row < total; row += 2) {
        std::string line;
        for (std::size_t col = 0; col < total; ++col) {
            bool top = light(row, col);
            bool bottom = row + 1 < total ? light(row + 1, col) : false;
            if (top && bottom) {
                line += "█";
            } else if (top) {
                line += "▀";
            } else if (bottom) {
                line += "▄";
            } else {
                line += ' ';
            }
        }
        rows.push_back(std::move(line));
    }
    return rows;
}

QrChannel::QrChannel(cli::Terminal& terminal)
    : terminal_(terminal) {}

void QrChannel::Open(const std::string& code) {
    auto rows = RenderQrRows(EncodeQr(code));
    std::string block;
    for (const auto& row : rows) {
        if (!block.empty()) {
            block += '\n';
        }
        block += row;
    }
    terminal_.Print(block);
    lines_ = rows.size();
    mark_ = terminal_.lines_written();
}

void QrChannel::Close() {
    if (lines_ == 0) {
        return;
    }
    if (!terminal_.EraseLinesSince(mark_, lines_)) {
        spdlog::debug("QR block left in place, output followed it");
    }
    lines_ = 0;
}

} // namespace wormhole::session
