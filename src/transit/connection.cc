#include <utility>
#include <arpa/inet.h>
#include <boost/asio/read.hpp>
#include <boost/asio/redirect_error.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <boost/asio/write.hpp>
#include <core/engine/transfer_engine.h>
#include <cstring>
#include <fmt/format.h>
#include <spdlog/spdlog.h>
#include <transit/connection.h>
#include <vector>

namespace net = boost::asio;
using json = nlohmann::json;

namespace wormhole::transit {

namespace {

bool isDisconnect(const boost::system::error_code& ec) {
    return ec == net::error::eof || ec == net::error::connection_reset
           || ec == net::error::broken_pipe || ec == net::error::operation_aborted
           || ec == net::error::bad_descriptor;
}

} // namespace

BinaryData EncodeMessage(const json& header, const BinaryData& payload) {
    auto header_text = header.dump();
    BinaryData message(sizeof(std::uint32_t) + header_text.size() + payload.size());

    std::uint32_t header_size = htonl(static_cast<std::uint32_t>(header_text.size()));
    std::memcpy(message.data(), &header_size, sizeof(header_size));
    std::memcpy(message.data() + sizeof(header_size), header_text.data(), header_text.size());
    if (!payload.empty()) {
        std::memcpy(message.data() + sizeof(header_size) + header_text.size(),
                    payload.data(),
                    payload.size());
    }
    return message;
}

Frame DecodeMessage(const BinaryData& message) {
    if (message.size() < sizeof(std::uint32_t)) {
        throw core::TransferError("truncated message");
    }
    std::uint32_t header_size = 0;
    std::memcpy(&header_size, message.data(), sizeof(header_size));
    header_size = ntohl(header_size);
    if (message.size() - sizeof(header_size) < header_size) {
        throw core::TransferError("message header exceeds message size");
    }

    Frame frame;
    std::string header_text(reinterpret_cast<const char*>(message.data() + sizeof(header_size)),
                            header_size);
    try {
        frame.header = json::parse(header_text);
    } catch (const json::exception& e) {
        throw core::TransferError(fmt::format("malformed message header: {}", e.what()));
    }
    if (!frame.header.is_object()) {
        throw core::TransferError("message header is not an object");
    }
    frame.payload.assign(message.begin() + sizeof(header_size) + header_size, message.end());
    return frame;
}

Connection::Connection(net::ip::tcp::socket socket)
    : socket_(std::move(socket)) {
    boost::system::error_code ec;
    socket_.set_option(net::ip::tcp::no_delay(true), ec);
}

BinaryData Connection::seal(const json& header, const BinaryData& payload) {
    auto body = EncodeMessage(header, payload);
    if (outbound_) {
        auto sealed = outbound_->Seal(body);
        if (!sealed) {
            throw core::TransferError("failed to encrypt frame: " + sealed.error());
        }
        body = std::move(*sealed);
    }
    if (body.size() > kMaxFrameSize) {
        throw core::TransferError(fmt::format("frame of {} bytes exceeds the limit", body.size()));
    }
    return body;
}

net::awaitable<void> Connection::Send(const json& header, const BinaryData& payload) {
    auto body = seal(header, payload);
    std::uint32_t length = htonl(static_cast<std::uint32_t>(body.size()));
    std::vector<net::const_buffer> buffers{net::buffer(&length, sizeof(length)),
                                           net::buffer(body)};
    boost::system::error_code ec;
    co_await net::async_write(socket_, buffers, net::redirect_error(net::use_awaitable, ec));
    if (ec) {
        if (isDisconnect(ec)) {
            throw core::TransferError("peer disconnected");
        }
        throw core::TransferError(fmt::format("send failed: {}", ec.message()));
    }
}

void Connection::SendNow(const json& header) {
    auto body = seal(header, {});
    std::uint32_t length = htonl(static_cast<std::uint32_t>(body.size()));
    std::vector<net::const_buffer> buffers{net::buffer(&length, sizeof(length)),
                                           net::buffer(body)};
    boost::system::error_code ec;
    net::write(socket_, buffers, ec);
    if (ec) {
        throw core::TransferError(fmt::format("send failed: {}", ec.message()));
    }
}

net::awaitable<Frame> Connection::Receive() {
    std::uint32_t length = 0;
    boost::system::error_code ec;
    co_await net::async_read(socket_,
                             net::buffer(&length, sizeof(length)),
                             net::redirect_error(net::use_awaitable, ec));
    if (!ec) {
        length = ntohl(length);
        if (length > kMaxFrameSize) {
            throw core::TransferError(fmt::format("peer sent an oversized frame ({} bytes)",
                                                  length));
        }
    }

    BinaryData body;
    if (!ec) {
        body.resize(length);
        co_await net::async_read(socket_,
                                 net::buffer(body),
                                 net::redirect_error(net::use_awaitable, ec));
    }
    if (ec) {
        if (isDisconnect(ec)) {
            throw core::TransferError("peer disconnected");
        }
        throw core::TransferError(fmt::format("receive failed: {}", ec.message()));
    }

    if (inbound_) {
        auto opened = inbound_->Open(body);
        if (!opened) {
            throw core::TransferError("failed to decrypt frame: " + opened.error());
        }
        body = std::move(*opened);
    }
    co_return DecodeMessage(body);
}

net::awaitable<Frame> Connection::Expect(std::string_view type) {
    auto frame = co_await Receive();
    auto received = frame.type();
    if (received == "error") {
        throw core::TransferError(frame.header.value("message", std::string("peer error")));
    }
    if (received != type) {
        throw core::TransferError(
            fmt::format("protocol error: expected '{}' but received '{}'", type, received));
    }
    co_return frame;
}

void Connection::EnableEncryption(RecordCipher outbound, RecordCipher inbound) {
    outbound_.emplace(std::move(outbound));
    inbound_.emplace(std::move(inbound));
}

void Connection::Close() {
    if (!socket_.is_open()) {
        return;
    }
    boost::system::error_code ec;
    socket_.shutdown(net::ip::tcp::socket::shutdown_both, ec);
    socket_.close(ec);
    if (ec) {
        spdlog::debug("Closing transit socket: {}", ec.message());
    }
}

} // namespace wormhole::transit
