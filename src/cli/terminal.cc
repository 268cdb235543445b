#include <algorithm>
#include <cli/terminal.h>
#include <string>

#include <unistd.h>

namespace wormhole::cli {

namespace {

constexpr std::string_view kClearLine = "\r\033[2K";

} // namespace

Terminal::Terminal()
    : Terminal(std::cout, std::cerr, ::isatty(STDOUT_FILENO) != 0) {}

Terminal::Terminal(std::ostream& out, std::ostream& err, bool interactive)
    : out_(out)
    , err_(err)
    , interactive_(interactive) {}

Terminal::~Terminal() {
    if (status_line_active_) {
        // Never leave the cursor parked on an unfinished progress line
        write(out_, "\n");
        out_.flush();
    }
}

void Terminal::write(std::ostream& stream, std::string_view text) {
    if (status_line_active_) {
        if (interactive_) {
            out_ << kClearLine;
        }
        status_line_active_ = false;
    }
    stream << text;
    lines_written_ += static_cast<std::size_t>(std::count(text.begin(), text.end(), '\n'));
}

void Terminal::Print(const std::string& text) {
    write(out_, text);
    write(out_, "\n");
    out_.flush();
}

void Terminal::PrintInfo(const std::string& message) {
    if (interactive_) {
        write(out_, "\033[32m" + message + "\033[0m\n");
    } else {
        write(out_, message + "\n");
    }
    out_.flush();
}

void Terminal::PrintWarning(const std::string& message) {
    if (interactive_) {
        write(err_, "\033[33m[WARN] " + message + "\033[0m\n");
    } else {
        write(err_, "[WARN] " + message + "\n");
    }
    err_.flush();
}

void Terminal::PrintError(const std::string& message) {
    if (interactive_) {
        write(err_, "\033[31m[ERROR] " + message + "\033[0m\n");
    } else {
        write(err_, "[ERROR] " + message + "\n");
    }
    err_.flush();
}

void Terminal::PrintPrompt(std::string_view prompt) {
    write(out_, prompt);
    out_.flush();
}

void Terminal::UpdateStatusLine(const std::string& line) {
    if (!interactive_) {
        // Redrawing in place only works on a terminal
        return;
    }
    out_ << kClearLine << line;
    out_.flush();
    status_line_active_ = true;
}

void Terminal::FinishStatusLine(const std::string& line) {
    if (interactive_) {
        out_ << kClearLine;
        status_line_active_ = false;
    }
    write(out_, line + "\n");
    out_.flush();
}

void Terminal::ClearStatusLine() {
    if (status_line_active_ && interactive_) {
        out_ << kClearLine;
        out_.flush();
    }
    status_line_active_ = false;
}

bool Terminal::EraseLinesSince(std::size_t mark, std::size_t count) {
    if (!interactive_ || lines_written_ != mark || count > lines_written_) {
        return false;
    }
    ClearStatusLine();
    for (std::size_t i = 0; i < count; ++i) {
        out_ << "\033[1A\033[2K";
    }
    out_ << "\r";
    out_.flush();
    lines_written_ -= count;
    return true;
}

} // namespace wormhole::cli
