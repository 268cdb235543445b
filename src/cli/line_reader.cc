#include <utility>
#include <boost/asio/read_until.hpp>
#include <boost/asio/redirect_error.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <boost/system/system_error.hpp>
#include <cerrno>
#include <cli/line_reader.h>
#include <istream>
#include <spdlog/spdlog.h>
#include <system_error>
#include <unistd.h>

namespace net = boost::asio;

namespace wormhole::cli {

std::shared_ptr<LineReader> LineReader::Open(const net::any_io_executor& executor, int fd) {
    int duplicated = ::dup(fd);
    if (duplicated < 0) {
        throw std::system_error(errno, std::generic_category(), "dup");
    }
    return std::shared_ptr<LineReader>(new LineReader(executor, duplicated));
}

LineReader::LineReader(const net::any_io_executor& executor, int fd)
    : input_(executor) {
    boost::system::error_code ec;
    input_.assign(fd, ec);
    if (ec) {
        ::close(fd);
        throw std::system_error(ec.value(), std::generic_category(), "watch input descriptor");
    }
}

LineReader::~LineReader() {
    Close();
}

net::awaitable<std::string> LineReader::ReadLine() {
    auto self = shared_from_this();
    boost::system::error_code ec;
    co_await net::async_read_until(input_, buffer_, '\n',
                                   net::redirect_error(net::use_awaitable, ec));
    // A final line without a newline still counts once the input is closed.
    if (ec && (ec != net::error::eof || buffer_.size() == 0)) {
        throw boost::system::system_error(ec);
    }

    std::istream stream(&buffer_);
    std::string line;
    std::getline(stream, line);
    if (!line.empty() && line.back() == '\r') {
        line.pop_back();
    }
    co_return line;
}

void LineReader::Close() {
    if (!input_.is_open()) {
        return;
    }
    boost::system::error_code ec;
    input_.cancel(ec);
    input_.close(ec);
    if (ec) {
        spdlog::debug("Closing input descriptor: {}", ec.message());
    }
}

} // namespace wormhole::cli
