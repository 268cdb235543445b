#pragma once

#include <chrono>
#include <cstdio>
#include <ctime>
#include <spdlog/async.h>
#include <spdlog/async_logger.h>
#include <spdlog/details/thread_pool.h>
#include <spdlog/sinks/daily_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>
#include <string>

namespace wormhole {

// Async logger with a daily file sink and a stderr console sink. The console sink keeps
// its own level so that user-facing output on stdout stays readable.
class Logger {
    using LoggerType = spdlog::async_logger;

public:
    using Level = spdlog::level::level_enum;
    Logger(Level level,
           Level console_level,
           const std::string& filepath,
           std::size_t q_max_items = 8192,
           std::size_t thread_count = 1) {
        spdlog::file_event_handlers handlers;
        handlers.after_open = [](const spdlog::filename_t& filename, std::FILE* fstream) {
            if (fstream) {
                auto now = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
                std::fprintf(fstream, "[Log Start: %s | %s]\n", filename.c_str(), std::ctime(&now));
            }
        };
        handlers.before_close = [](const spdlog::filename_t& filename, std::FILE* fstream) {
            if (fstream) {
                auto now = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
                std::fprintf(fstream, "[Log End: %s | %s]\n\n", filename.c_str(), std::ctime(&now));
            }
        };
        auto file_sink = std::make_shared<spdlog::sinks::daily_file_sink_mt>(filepath,
                                                                             0,
                                                                             0,
                                                                             false,
                                                                             0,
                                                                             handlers);
        console_sink_ = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
        thread_pool_ = std::make_shared<spdlog::details::thread_pool>(q_max_items, thread_count);
        logger_ = std::make_shared<LoggerType>("wormhole",
                                               spdlog::sinks_init_list{file_sink, console_sink_},
                                               thread_pool_);

        console_sink_->set_level(console_level);
#ifdef WORMHOLE_RELEASE
        if (console_level > Level::info) {
            console_sink_->set_level(Level::off);
        }
#endif
        logger_->set_level(level);
        logger_->set_error_handler(
            [this](const std::string& msg) { logger_->error("*** LOGGER ERROR ***: {}", msg); });

        /* more about pattern:
         * https://github.com/gabime/spdlog/wiki/3.-Custom-formatting
         */
        console_sink_->set_pattern("\033[36m[%H:%M:%S.%e] \033[0m%^[%l]%$ %v");
        spdlog::set_default_logger(logger_);
    }
    auto& logger() { return logger_; }
    [[nodiscard]] Level logLevel() const { return logger_->level(); }
    void set_log_level(Level level) { logger_->set_level(level); }
    void set_console_level(Level level) { console_sink_->set_level(level); }
    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;
    ~Logger() { spdlog::shutdown(); }

private:
    std::shared_ptr<LoggerType> logger_;
    std::shared_ptr<spdlog::sinks::stderr_color_sink_mt> console_sink_;
    std::shared_ptr<spdlog::details::thread_pool> thread_pool_;
};

} // namespace wormhole
