#pragma once

#include <utility>
#include <boost/asio/awaitable.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <cstddef>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <string_view>
#include <transit/record_cipher.h>

namespace wormhole::transit {

constexpr std::size_t kMaxFrameSize = 16 * 1024 * 1024;

// A control message with an optional binary payload
struct Frame {
    nlohmann::json header;
    BinaryData payload;

    std::string type() const { return header.value("type", std::string{}); }
};

// [u32 header size][header JSON][payload]
BinaryData EncodeMessage(const nlohmann::json& header, const BinaryData& payload = {});

// Throws TransferError on malformed input
Frame DecodeMessage(const BinaryData& message);

// Length-prefixed frames over TCP. Once encryption is enabled every frame body is sealed
// with the outbound cipher and opened with the inbound one.
class Connection {
public:
    explicit Connection(boost::asio::ip::tcp::socket socket);
    Connection(const Connection&) = delete;
    Connection& operator=(const Connection&) = delete;

    boost::asio::awaitable<void> Send(const nlohmann::json& header,
                                      const BinaryData& payload = {});

    // Blocking variant for small frames sent outside a coroutine
    void SendNow(const nlohmann::json& header);

    // Throws TransferError("peer disconnected") on EOF or reset
    boost::asio::awaitable<Frame> Receive();

    // Receives a frame of the given type. An "error" frame from the peer becomes a
    // TransferError carrying its message.
    boost::asio::awaitable<Frame> Expect(std::string_view type);

    void EnableEncryption(RecordCipher outbound, RecordCipher inbound);
    bool encrypted() const { return outbound_.has_value(); }

    bool is_open() const { return socket_.is_open(); }
    void Close();

private:
    BinaryData seal(const nlohmann::json& header, const BinaryData& payload);

    boost::asio::ip::tcp::socket socket_;
    std::optional<RecordCipher> outbound_;
    std::optional<RecordCipher> inbound_;
};

} // namespace wormhole::transit
