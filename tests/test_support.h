#pragma once

#include <utility>
#include <boost/asio/awaitable.hpp>
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/steady_timer.hpp>
#include <chrono>
#include <exception>
#include <functional>
#include <memory>
#include <optional>
#include <session/code_presenter.h>
#include <stdexcept>
#include <string>
#include <unistd.h>
#include <vector>

namespace wormhole::test {

// Runs op on ioc until the context has no more work and returns its result
template <typename T>
T RunToCompletion(boost::asio::io_context& ioc,
                  boost::asio::awaitable<T> op,
                  std::function<void()> on_complete = nullptr) {
    std::optional<T> result;
    std::exception_ptr error;
    boost::asio::co_spawn(ioc, std::move(op), [&](std::exception_ptr e, T value) {
        error = e;
        result = std::move(value);
        if (on_complete) {
            on_complete();
        }
    });
    ioc.run();
    if (error) {
        std::rethrow_exception(error);
    }
    return std::move(*result);
}

// Calls action once after delay
inline void After(boost::asio::io_context& ioc,
                  std::chrono::milliseconds delay,
                  std::function<void()> action) {
    auto timer = std::make_shared<boost::asio::steady_timer>(ioc, delay);
    timer->async_wait([timer, action = std::move(action)](const boost::system::error_code& ec) {
        if (!ec) {
            action();
        }
    });
}

struct ChannelLog {
    int opened{0};
    int closed{0};
    std::vector<std::string> codes;
};

class RecordingChannel : public session::PresentationChannel {
public:
    RecordingChannel(ChannelLog& log, bool fail_open = false)
        : log_(log)
        , fail_open_(fail_open) {}

    std::string_view name() const override { return "recording"; }

    void Open(const std::string& code) override {
        if (fail_open_) {
            throw std::runtime_error("device unavailable");
        }
        ++log_.opened;
        log_.codes.push_back(code);
    }

    void Close() override { ++log_.closed; }

private:
    ChannelLog& log_;
    bool fail_open_;
};

inline session::CodePresenter::ChannelFactory RecordingFactory(ChannelLog& log,
                                                               bool fail_open = false) {
    return [&log, fail_open] { return std::make_unique<RecordingChannel>(log, fail_open); };
}

// Both ends of a pipe, closed on destruction
class Pipe {
public:
    Pipe() {
        if (::pipe(fds_) != 0) {
            throw std::runtime_error("pipe failed");
        }
    }
    ~Pipe() {
        CloseRead();
        CloseWrite();
    }
    Pipe(const Pipe&) = delete;
    Pipe& operator=(const Pipe&) = delete;

    int read_fd() const { return fds_[0]; }

    void Write(const std::string& text) {
        auto written = ::write(fds_[1], text.data(), text.size());
        if (written != static_cast<ssize_t>(text.size())) {
            throw std::runtime_error("short write to pipe");
        }
    }

    void CloseRead() {
        if (fds_[0] >= 0) {
            ::close(fds_[0]);
            fds_[0] = -1;
        }
    }

    void CloseWrite() {
        if (fds_[1] >= 0) {
            ::close(fds_[1]);
            fds_[1] = -1;
        }
    }

private:
    int fds_[2]{-1, -1};
};

} // namespace wormhole::test
