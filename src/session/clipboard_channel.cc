#include <boost/process.hpp>
#include <cstdlib>
#include <iterator>
#include <session/clipboard_channel.h>
#include <spdlog/spdlog.h>
#include <stdexcept>
#include <vector>

namespace wormhole::session {

namespace bp = boost::process;

namespace {

struct ClipboardCommand {
    boost::filesystem::path program;
    std::vector<std::string> args;
};

boost::filesystem::path findProgram(const std::string& name) {
    auto program = bp::search_path(name);
    if (program.empty()) {
        throw std::runtime_error(name + " not found in PATH");
    }
    return program;
}

ClipboardCommand clipboardCommand(bool read) {
    if (std::getenv("WAYLAND_DISPLAY") != nullptr) {
        if (read) {
            return {findProgram("wl-paste"), {"--no-newline"}};
        }
        return {findProgram("wl-copy"), {}};
    }
    if (std::getenv("DISPLAY") != nullptr) {
        if (read) {
            return {findProgram("xclip"), {"-selection", "clipboard", "-o"}};
        }
        return {findProgram("xclip"), {"-selection", "clipboard"}};
    }
    throw std::runtime_error("no graphical session to own a clipboard");
}

} // namespace

std::string SystemClipboard::Read() {
    auto command = clipboardCommand(true);
    bp::ipstream output;
    bp::child child(command.program,
                    bp::args(command.args),
                    bp::std_out > output,
                    bp::std_err > bp::null);
    std::string content{std::istreambuf_iterator<char>(output), std::istreambuf_iterator<char>()};
    child.wait();
    if (child.exit_code() != 0) {
        // Empty clipboards make both tools exit non-zero
        spdlog::debug("{} exited with {}", command.program.string(), child.exit_code());
        return {};
    }
    return content;
}

void SystemClipboard::Write(const std::string& text) {
    auto command = clipboardCommand(false);
    bp::opstream input;
    bp::child child(command.program,
                    bp::args(command.args),
                    bp::std_in < input,
                    bp::std_out > bp::null,
                    bp::std_err > bp::null);
    input << text;
    input.flush();
    input.pipe().close();
    child.wait();
    if (child.exit_code() != 0) {
        throw std::runtime_error(command.program.filename().string() + " exited with code "
                                 + std::to_string(child.exit_code()));
    }
}

ClipboardChannel::ClipboardChannel(std::unique_ptr<ClipboardBackend> backend)
    : backend_(std::move(backend)) {}

void ClipboardChannel::Open(const std::string& code) {
    try {
        previous_ = backend_->Read();
    } catch (const std::exception& e) {
        spdlog::debug("Could not save clipboard contents: {}", e.what());
        previous_.reset();
    }
    backend_->Write(code);
    code_ = code;
    open_ = true;
    spdlog::info("Copied wormhole code to the clipboard");
}

void ClipboardChannel::Close() {
    if (!open_) {
        return;
    }
    open_ = false;
    if (!previous_) {
        return;
    }
    std::string current;
    try {
        current = backend_->Read();
    } catch (const std::exception& e) {
        spdlog::warn("Could not read the clipboard, leaving it unchanged: {}", e.what());
        return;
    }
    if (current != code_) {
        spdlog::debug("Clipboard changed since the code was copied, not restoring");
        return;
    }
    backend_->Write(*previous_);
    spdlog::debug("Restored previous clipboard contents");
}

} // namespace wormhole::session
