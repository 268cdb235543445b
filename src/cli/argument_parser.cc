#include <cli/argument_parser.h>
#include <core/constant/transfer.h>
#include <fmt/format.h>
#include <sstream>

namespace po = boost::program_options;

namespace wormhole::cli {

namespace {

constexpr std::size_t kMaxCodeLength = 16;

po::options_description describeOptions() {
    po::options_description desc("Options");
    // clang-format off
    desc.add_options()
        ("help,h", "show this help message")
        ("verbose,v", po::value<std::vector<std::string>>()->zero_tokens()->composing(),
            "log progress to stderr, repeat for debug output")
        ("qr", "show the code as a QR code (send)")
        ("clipboard", "copy the code to the clipboard (send)")
        ("accept,y", "accept the offer without asking (receive)")
        ("code-length", po::value<std::size_t>(), "number of words in the generated code")
        ("code", po::value<std::string>(), "code to receive with")
        ("out-dir,o", po::value<std::string>(), "directory received files are saved to")
        ("host", po::value<std::string>(), "address the sender listens on")
        ("port", po::value<std::uint16_t>(), "transit base port")
        ("config", po::value<std::string>(), "configuration file");
    // clang-format on
    return desc;
}

po::options_description describePositionals() {
    po::options_description hidden;
    hidden.add_options()("command", po::value<std::string>())(
        "args", po::value<std::vector<std::string>>()->composing());
    return hidden;
}

} // namespace

std::optional<Command> CommandFromString(std::string_view name) {
    if (name == "send") {
        return Command::kSend;
    }
    if (name == "send-text") {
        return Command::kSendText;
    }
    if (name == "receive" || name == "recv") {
        return Command::kReceive;
    }
    return std::nullopt;
}

ArgumentParser::ArgumentParser(int argc, char* argv[])
    : argc_(argc)
    , argv_(argv) {}

CliOptions ArgumentParser::Parse() {
    po::options_description all;
    all.add(describeOptions()).add(describePositionals());
    po::positional_options_description positional;
    positional.add("command", 1).add("args", -1);

    po::variables_map vm;
    CliOptions options;
    try {
        auto parsed = po::command_line_parser(argc_, argv_)
                          .options(all)
                          .positional(positional)
                          .run();
        for (const auto& option : parsed.options) {
            if (option.string_key == "verbose") {
                ++options.verbosity;
            }
        }
        po::store(parsed, vm);
        po::notify(vm);
    } catch (const po::error& e) {
        throw UsageError(e.what());
    }

    options.show_help = vm.count("help") > 0;
    options.qr = vm.count("qr") > 0;
    options.clipboard = vm.count("clipboard") > 0;
    options.accept = vm.count("accept") > 0;
    if (vm.count("code-length")) {
        options.code_length = vm["code-length"].as<std::size_t>();
    }
    if (vm.count("code")) {
        options.code = vm["code"].as<std::string>();
    }
    if (vm.count("out-dir")) {
        options.out_dir = vm["out-dir"].as<std::string>();
    }
    if (vm.count("host")) {
        options.host = vm["host"].as<std::string>();
    }
    if (vm.count("port")) {
        options.port = vm["port"].as<std::uint16_t>();
    }
    if (vm.count("config")) {
        options.config_path = vm["config"].as<std::string>();
    }
    if (vm.count("args")) {
        options.args = vm["args"].as<std::vector<std::string>>();
    }

    if (options.show_help) {
        return options;
    }
    if (!vm.count("command")) {
        throw UsageError("missing command");
    }
    auto command = vm["command"].as<std::string>();
    auto parsed_command = CommandFromString(command);
    if (!parsed_command) {
        throw UsageError(fmt::format("unknown command '{}'", command));
    }
    options.command = *parsed_command;

    validate(options);
    return options;
}

void ArgumentParser::validate(CliOptions& options) const {
    switch (options.command) {
    case Command::kSend:
        if (options.args.size() != 1) {
            throw UsageError("send expects exactly one file or directory");
        }
        break;
    case Command::kSendText:
        if (options.args.empty()) {
            throw UsageError("send-text expects the text to send");
        }
        break;
    case Command::kReceive:
        if (options.args.size() > 1) {
            throw UsageError("receive expects at most one code");
        }
        if (options.code && !options.args.empty()) {
            throw UsageError("give the code either as an argument or with --code, not both");
        }
        break;
    case Command::kNone:
        throw UsageError("missing command");
    }

    if (options.code && options.command != Command::kReceive) {
        throw UsageError("--code only applies to receive");
    }
    if (options.code_length
        && (*options.code_length < 1 || *options.code_length > kMaxCodeLength)) {
        throw UsageError(fmt::format("--code-length must be between 1 and {}", kMaxCodeLength));
    }
    if (options.port
        && (*options.port < 1024 || *options.port > 65535 - core::transfer::kMaxNameplate)) {
        throw UsageError(fmt::format("--port must be between 1024 and {}",
                                     65535 - core::transfer::kMaxNameplate));
    }
}

std::string ArgumentParser::Usage() {
    std::ostringstream out;
    out << "Usage:\n"
        << "  wormhole-cli send [options] PATH        send a file or directory\n"
        << "  wormhole-cli send-text [options] TEXT   send a text message\n"
        << "  wormhole-cli receive [options] [CODE]   receive with a code (prompted if absent)\n\n"
        << describeOptions();
    return out.str();
}

} // namespace wormhole::cli
