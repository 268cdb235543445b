#include <utility>
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/io_context.hpp>
#include <cli/cli_manager.h>
#include <cli/line_reader.h>
#include <filesystem>
#include <fmt/format.h>
#include <session/cancellation_monitor.h>
#include <session/code_presenter.h>
#include <session/confirmation_gate.h>
#include <session/progress_reporter.h>
#include <spdlog/spdlog.h>

namespace net = boost::asio;
namespace fs = std::filesystem;

namespace wormhole::cli {

CliManager::CliManager(CliOptions options, const core::Settings& settings)
    : options_(std::move(options))
    , settings_(settings) {}

int CliManager::ExitCodeFor(const core::SessionResult& result) {
    switch (result.state) {
    case core::SessionState::kCompleted:
        return kExitSuccess;
    case core::SessionState::kCancelled:
        return kExitCancelled;
    default:
        return kExitFailure;
    }
}

session::SessionConfig CliManager::BuildSessionConfig(const CliOptions& options,
                                                      const core::Settings& settings) {
    session::SessionConfig config;
    switch (options.command) {
    case Command::kSend: {
        fs::path source = options.args.at(0);
        std::error_code ec;
        auto status = fs::status(source, ec);
        if (ec || !fs::exists(status)) {
            throw UsageError(fmt::format("{} does not exist", source.string()));
        }
        config.role = core::SessionRole::kSend;
        config.request.kind = fs::is_directory(status) ? core::TransferKind::kDirectory
                                                       : core::TransferKind::kFile;
        config.request.path = source;
        break;
    }
    case Command::kSendText: {
        std::string text;
        for (const auto& word : options.args) {
            if (!text.empty()) {
                text += ' ';
            }
            text += word;
        }
        config.role = core::SessionRole::kSend;
        config.request.kind = core::TransferKind::kText;
        config.request.text = std::move(text);
        break;
    }
    case Command::kReceive:
        config.role = core::SessionRole::kReceive;
        config.request.path = options.out_dir.value_or(settings.save_dir);
        if (options.code) {
            config.code = *options.code;
        } else if (!options.args.empty()) {
            config.code = options.args.front();
        }
        break;
    case Command::kNone:
        throw UsageError("missing command");
    }
    config.request.role = config.role;
    config.auto_accept = options.accept || settings.auto_accept;
    config.cancel_grace_period = std::chrono::milliseconds(settings.cancel_grace_ms);
    return config;
}

transit::DirectTransitOptions CliManager::BuildTransitOptions(const CliOptions& options,
                                                              const core::Settings& settings) {
    transit::DirectTransitOptions transit;
    transit.host = options.host.value_or(settings.transit_host);
    transit.base_port = options.port.value_or(settings.transit_base_port);
    transit.code_length = options.code_length.value_or(settings.code_length);
    return transit;
}

int CliManager::Run() {
    auto config = BuildSessionConfig(options_, settings_);

    net::io_context ioc;
    transit::DirectTransferEngine engine(ioc, BuildTransitOptions(options_, settings_));
    core::CancelToken cancel(ioc.get_executor());
    session::CancellationMonitor monitor(ioc, cancel, terminal_);

    std::shared_ptr<LineReader> input;
    if (config.role == core::SessionRole::kReceive) {
        try {
            input = LineReader::Open(ioc.get_executor());
        } catch (const std::system_error& e) {
            spdlog::warn("Standard input is unavailable: {}", e.what());
        }
    }

    // QR and clipboard only help someone read the code off this machine
    bool sending = config.role == core::SessionRole::kSend;
    session::PresenterOptions presenter_options{config.role,
                                                sending && (options_.qr || settings_.qr),
                                                sending
                                                    && (options_.clipboard || settings_.clipboard)};
    auto presenter = session::CodePresenter::FromOptions(presenter_options, terminal_);
    session::ProgressReporter reporter(terminal_);
    session::ConfirmationGate gate(terminal_, input, config.auto_accept);
    session::SessionController controller(std::move(config),
                                          engine,
                                          presenter,
                                          reporter,
                                          gate,
                                          terminal_,
                                          monitor.Start(),
                                          input);

    int exit_code = kExitFailure;
    net::co_spawn(ioc,
                  controller.Run(),
                  [&](std::exception_ptr error, core::SessionResult result) {
                      monitor.Stop();
                      if (input) {
                          input->Close();
                      }
                      engine.Shutdown();
                      if (error) {
                          try {
                              std::rethrow_exception(error);
                          } catch (const std::exception& e) {
                              spdlog::error("Session aborted: {}", e.what());
                              terminal_.PrintError(e.what());
                          }
                          return;
                      }
                      exit_code = ExitCodeFor(result);
                  });
    ioc.run();
    spdlog::debug("Exiting with status {}", exit_code);
    return exit_code;
}

} // namespace wormhole::cli
