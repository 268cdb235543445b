#pragma once

#include <utility>
#include <boost/asio/awaitable.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <chrono>
#include <core/constant/transfer.h>
#include <core/engine/transfer_engine.h>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <transit/connection.h>
#include <transit/key_confirmation.h>
#include <transit/sha256_hasher.h>

namespace wormhole::transit {

struct DirectTransitOptions {
    std::string host{"127.0.0.1"};
    std::uint16_t base_port{core::transfer::kDefaultBasePort};
    std::size_t code_length{core::transfer::kDefaultCodeLength};
    std::size_t chunk_size{core::transfer::kDefaultChunkSize};
};

// Peer-to-peer engine without a mailbox server: the nameplate of the code selects the
// TCP port (base_port + nameplate) the sender listens on, and the rest of the code keys
// the handshake and the encryption of everything after it.
class DirectTransferEngine : public core::TransferEngine {
public:
    DirectTransferEngine(boost::asio::io_context& ioc, DirectTransitOptions options);
    ~DirectTransferEngine() override;

    boost::asio::awaitable<std::string> AllocateCode(const core::TransferRequest& request,
                                                     core::CancelToken& cancel) override;
    boost::asio::awaitable<core::TransferMetadata> RedeemCode(const std::string& code,
                                                              core::CancelToken& cancel) override;
    void RejectOffer(const std::string& reason) override;
    std::shared_ptr<core::TransferEventStream> StartTransfer(const core::TransferRequest& request,
                                                             core::CancelToken& cancel) override;
    void Shutdown() override;

    // What a send request offers. Throws TransferError if the source cannot be read.
    static core::TransferMetadata DescribeSource(const core::TransferRequest& request);

    // Throws TransferError if the offer names paths outside the output directory
    static void ValidateOffer(const core::TransferMetadata& offer);

    std::optional<std::uint16_t> listening_port() const;

private:
    struct DataProgress {
        Sha256Hasher hasher;
        std::uint64_t done{0};
        std::uint64_t total{0};
        std::chrono::steady_clock::time_point started{std::chrono::steady_clock::now()};

        core::ProgressSample Sample() const;
    };

    boost::asio::awaitable<void> runSender(std::shared_ptr<core::TransferEventStream> stream,
                                           core::CancelToken& cancel);
    boost::asio::awaitable<void> runReceiver(std::shared_ptr<core::TransferEventStream> stream,
                                             std::filesystem::path out_dir,
                                             core::CancelToken& cancel);
    boost::asio::awaitable<void> confirmKey(core::SessionRole role);
    boost::asio::awaitable<void> sendFile(const std::filesystem::path& file,
                                          std::size_t entry,
                                          std::uint64_t size,
                                          DataProgress& progress,
                                          core::TransferEventStream& stream);
    boost::asio::awaitable<std::string> receiveData(const std::filesystem::path& partial,
                                                    DataProgress& progress,
                                                    core::TransferEventStream& stream);

    bool bindNameplate(int nameplate, const boost::asio::ip::address& address);
    void abort();

    boost::asio::io_context& ioc_;
    DirectTransitOptions options_;
    boost::asio::ip::tcp::acceptor acceptor_;
    boost::asio::ip::tcp::socket socket_; // connecting, before it becomes connection_
    std::unique_ptr<Connection> connection_;
    std::string session_id_;
    std::string code_;
    Key key_;
    core::TransferMetadata offer_;
    std::filesystem::path source_;
};

} // namespace wormhole::transit
