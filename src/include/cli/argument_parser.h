#pragma once

#include <boost/program_options.hpp>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

namespace wormhole::cli {

// Malformed command line; reported with the usage text and exit status 2
class UsageError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

enum class Command {
    kNone,
    kSend,
    kSendText,
    kReceive,
};

std::optional<Command> CommandFromString(std::string_view name);

struct CliOptions {
    Command command{Command::kNone};
    std::vector<std::string> args; // positional arguments after the command

    bool qr{false};
    bool clipboard{false};
    bool accept{false};
    int verbosity{0}; // -v: info, -vv: debug
    std::optional<std::size_t> code_length;
    std::optional<std::string> code;
    std::optional<std::filesystem::path> out_dir;
    std::optional<std::string> host;
    std::optional<std::uint16_t> port;
    std::optional<std::filesystem::path> config_path;
    bool show_help{false};
};

// Options may appear before or after the command. Parse() throws UsageError.
class ArgumentParser {
public:
    ArgumentParser(int argc, char* argv[]);

    CliOptions Parse();

    static std::string Usage();

private:
    void validate(CliOptions& options) const;

    int argc_;
    char** argv_;
};

} // namespace wormhole::cli
