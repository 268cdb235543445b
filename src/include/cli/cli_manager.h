#pragma once

#include <cli/argument_parser.h>
#include <cli/terminal.h>
#include <core/model.h>
#include <core/util/config.h>
#include <session/session_controller.h>
#include <transit/direct_transfer_engine.h>

namespace wormhole::cli {

constexpr int kExitSuccess = 0;
constexpr int kExitFailure = 1;
constexpr int kExitUsage = 2;
constexpr int kExitCancelled = 130;

// Wires one session together from the command line and the loaded settings and runs it
// to completion on a single-threaded io_context.
class CliManager {
public:
    CliManager(CliOptions options, const core::Settings& settings);
    CliManager(const CliManager&) = delete;
    CliManager& operator=(const CliManager&) = delete;

    // Returns the process exit status
    int Run();

    static int ExitCodeFor(const core::SessionResult& result);

    // Throws UsageError for a missing or unreadable send source
    static session::SessionConfig BuildSessionConfig(const CliOptions& options,
                                                     const core::Settings& settings);
    static transit::DirectTransitOptions BuildTransitOptions(const CliOptions& options,
                                                             const core::Settings& settings);

private:
    CliOptions options_;
    const core::Settings& settings_;
    Terminal terminal_;
};

} // namespace wormhole::cli
