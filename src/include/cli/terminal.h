#pragma once

#include <cstddef>
#include <iostream>
#include <string>
#include <string_view>

namespace wormhole::cli {

// The terminal is shared by every component of a session. The progress reporter owns
// the status line; everything else is printed on its own line after clearing it.
class Terminal {
public:
    Terminal();
    Terminal(std::ostream& out, std::ostream& err, bool interactive);
    ~Terminal();
    Terminal(const Terminal&) = delete;
    Terminal& operator=(const Terminal&) = delete;

    void Print(const std::string& text);
    void PrintInfo(const std::string& message);
    void PrintWarning(const std::string& message);
    void PrintError(const std::string& message);
    void PrintPrompt(std::string_view prompt);

    void UpdateStatusLine(const std::string& line);
    void FinishStatusLine(const std::string& line);
    void ClearStatusLine();

    // Erases the last count lines if nothing was printed after line mark `mark`.
    // Returns false if the lines could not be erased.
    bool EraseLinesSince(std::size_t mark, std::size_t count);

    std::size_t lines_written() const { return lines_written_; }
    bool interactive() const { return interactive_; }

private:
    void write(std::ostream& stream, std::string_view text);

    std::ostream& out_;
    std::ostream& err_;
    bool interactive_;
    bool status_line_active_{false};
    std::size_t lines_written_{0};
};

} // namespace wormhole::cli
