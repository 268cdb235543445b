#pragma once

#include <utility>
#include <boost/asio/any_io_executor.hpp>
#include <boost/asio/awaitable.hpp>
#include <boost/asio/posix/stream_descriptor.hpp>
#include <boost/asio/streambuf.hpp>
#include <memory>
#include <string>

namespace wormhole::cli {

// Asynchronous line input from a file descriptor (stdin by default), so that a pending
// read never blocks the io_context and can be abandoned when the session is cancelled.
class LineReader : public std::enable_shared_from_this<LineReader> {
public:
    // Throws std::system_error if fd cannot be watched asynchronously (e.g. a regular file)
    static std::shared_ptr<LineReader> Open(const boost::asio::any_io_executor& executor,
                                            int fd = 0);

    ~LineReader();
    LineReader(const LineReader&) = delete;
    LineReader& operator=(const LineReader&) = delete;

    // One line without its terminator. Throws boost::system::system_error on EOF.
    boost::asio::awaitable<std::string> ReadLine();

    // Aborts a pending read and closes the descriptor
    void Close();

private:
    LineReader(const boost::asio::any_io_executor& executor, int fd);

    boost::asio::posix::stream_descriptor input_;
    boost::asio::streambuf buffer_;
};

} // namespace wormhole::cli
