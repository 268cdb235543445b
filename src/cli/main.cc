#include <cli/argument_parser.h>
#include <cli/cli_manager.h>
#include <core/constant/path.h>
#include <core/util/config.h>
#include <core/util/logger.h>
#include <iostream>
#include <spdlog/spdlog.h>

using namespace wormhole;

int main(int argc, char* argv[]) {
    cli::CliOptions options;
    try {
        options = cli::ArgumentParser(argc, argv).Parse();
    } catch (const cli::UsageError& e) {
        std::cerr << "Error: " << e.what() << "\n\n" << cli::ArgumentParser::Usage();
        return cli::kExitUsage;
    }
    if (options.show_help) {
        std::cout << cli::ArgumentParser::Usage();
        return cli::kExitSuccess;
    }

    auto console_level = options.verbosity >= 2   ? Logger::Level::debug
                         : options.verbosity == 1 ? Logger::Level::info
                                                  : Logger::Level::warn;
    Logger logger(
#ifdef WORMHOLE_DEBUG
        Logger::Level::debug,
#else
        options.verbosity >= 2 ? Logger::Level::debug : Logger::Level::info,
#endif
        console_level,
        (core::path::kLogDir / "wormhole.log").string());

    core::InitConfig(options.config_path.value_or(core::path::kConfigFile));
    core::SaveConfig();

    try {
        cli::CliManager manager(options, core::settings);
        return manager.Run();
    } catch (const cli::UsageError& e) {
        spdlog::error("Usage error: {}", e.what());
        std::cerr << "Error: " << e.what() << "\n";
        return cli::kExitUsage;
    } catch (const std::exception& e) {
        spdlog::error("Unhandled exception: {}", e.what());
        std::cerr << "Error: " << e.what() << "\n";
        return cli::kExitFailure;
    }
}
