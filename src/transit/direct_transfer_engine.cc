#include <utility>
#include <algorithm>
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/connect.hpp>
#include <boost/asio/detached.hpp>
#include <boost/asio/redirect_error.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <boost/uuid/random_generator.hpp>
#include <boost/uuid/uuid_io.hpp>
#include <core/util/wordlist.h>
#include <fmt/format.h>
#include <fstream>
#include <random>
#include <spdlog/spdlog.h>
#include <string_view>
#include <transit/direct_transfer_engine.h>
#include <transit/record_cipher.h>

namespace net = boost::asio;
namespace fs = std::filesystem;
using json = nlohmann::json;
using tcp = net::ip::tcp;

namespace wormhole::transit {

using core::RendezvousError;
using core::TransferError;
using core::TransferKind;

namespace {

constexpr int kProtocolVersion = 1;
constexpr std::string_view kSenderRecords = "sender-records";
constexpr std::string_view kReceiverRecords = "receiver-records";

bool isSafeComponent(std::string_view component) {
    return !component.empty() && component != "." && component != ".."
           && component.find('/') == std::string_view::npos
           && component.find('\\') == std::string_view::npos
           && component.find('\0') == std::string_view::npos;
}

bool isSafeRelativePath(std::string_view path) {
    std::size_t start = 0;
    while (true) {
        auto end = path.find('/', start);
        auto component = path.substr(start, end == std::string_view::npos ? end : end - start);
        if (!isSafeComponent(component)) {
            return false;
        }
        if (end == std::string_view::npos) {
            return true;
        }
        start = end + 1;
    }
}

} // namespace

core::ProgressSample DirectTransferEngine::DataProgress::Sample() const {
    return core::ProgressSample{done,
                                total,
                                std::chrono::duration_cast<std::chrono::milliseconds>(
                                    std::chrono::steady_clock::now() - started)};
}

DirectTransferEngine::DirectTransferEngine(net::io_context& ioc, DirectTransitOptions options)
    : ioc_(ioc)
    , options_(std::move(options))
    , acceptor_(ioc)
    , socket_(ioc)
    , session_id_(boost::uuids::to_string(boost::uuids::random_generator()())) {}

DirectTransferEngine::~DirectTransferEngine() {
    Shutdown();
}

core::TransferMetadata DirectTransferEngine::DescribeSource(const core::TransferRequest& request) {
    core::TransferMetadata offer;
    offer.kind = request.kind;
    if (request.kind == TransferKind::kText) {
        offer.text = request.text;
        offer.size = request.text.size();
        return offer;
    }

    std::error_code ec;
    auto source = fs::absolute(request.path, ec).lexically_normal();
    if (ec) {
        throw TransferError(
            fmt::format("cannot resolve {}: {}", request.path.string(), ec.message()));
    }
    auto name = source.filename();
    if (name.empty()) {
        name = source.parent_path().filename();
    }
    offer.name = name.string();

    if (request.kind == TransferKind::kFile) {
        if (!fs::is_regular_file(source, ec)) {
            throw TransferError(fmt::format("{} is not a readable file", request.path.string()));
        }
        offer.size = fs::file_size(source, ec);
        if (ec) {
            throw TransferError(
                fmt::format("cannot read {}: {}", request.path.string(), ec.message()));
        }
        return offer;
    }

    if (!fs::is_directory(source, ec)) {
        throw TransferError(fmt::format("{} is not a directory", request.path.string()));
    }
    fs::recursive_directory_iterator it(source, fs::directory_options::none, ec);
    for (; !ec && it != fs::recursive_directory_iterator(); it.increment(ec)) {
        if (!it->is_regular_file(ec)) {
            spdlog::debug("Skipping {}, not a regular file", it->path().string());
            continue;
        }
        auto size = it->file_size(ec);
        if (ec) {
            break;
        }
        offer.entries.push_back({it->path().lexically_relative(source).generic_string(), size});
        offer.size += size;
    }
    if (ec) {
        throw TransferError(fmt::format("cannot read {}: {}", request.path.string(), ec.message()));
    }
    std::sort(offer.entries.begin(), offer.entries.end(), [](const auto& a, const auto& b) {
        return a.path < b.path;
    });
    return offer;
}

void DirectTransferEngine::ValidateOffer(const core::TransferMetadata& offer) {
    if (offer.kind == TransferKind::kText) {
        return;
    }
    if (!isSafeComponent(offer.name)) {
        throw TransferError(fmt::format("offer has an unsafe name '{}'", offer.name));
    }
    if (offer.kind == TransferKind::kDirectory) {
        std::uint64_t total = 0;
        for (const auto& entry : offer.entries) {
            if (!isSafeRelativePath(entry.path)) {
                throw TransferError(fmt::format("offer contains an unsafe path '{}'", entry.path));
            }
            total += entry.size;
        }
        if (total != offer.size) {
            throw TransferError("offer size does not match its entries");
        }
    }
}

std::optional<std::uint16_t> DirectTransferEngine::listening_port() const {
    if (!acceptor_.is_open()) {
        return std::nullopt;
    }
    boost::system::error_code ec;
    auto endpoint = acceptor_.local_endpoint(ec);
    if (ec) {
        return std::nullopt;
    }
    return endpoint.port();
}

bool DirectTransferEngine::bindNameplate(int nameplate, const net::ip::address& address) {
    tcp::endpoint endpoint(address, static_cast<std::uint16_t>(options_.base_port + nameplate));
    boost::system::error_code ec;
    acceptor_.open(endpoint.protocol(), ec);
    if (!ec) {
        acceptor_.set_option(tcp::acceptor::reuse_address(true), ec);
    }
    if (!ec) {
        acceptor_.bind(endpoint, ec);
    }
    if (!ec) {
        acceptor_.listen(net::socket_base::max_listen_connections, ec);
    }
    if (ec) {
        spdlog::debug("Nameplate {} unavailable on port {}: {}",
                      nameplate,
                      endpoint.port(),
                      ec.message());
        boost::system::error_code ignored;
        acceptor_.close(ignored);
        return false;
    }
    return true;
}

net::awaitable<std::string> DirectTransferEngine::AllocateCode(
    const core::TransferRequest& request, core::CancelToken& /*cancel*/) {
    if (acceptor_.is_open() || connection_) {
        throw std::logic_error("DirectTransferEngine can only run one session");
    }
    offer_ = DescribeSource(request);
    if (request.kind != TransferKind::kText) {
        source_ = fs::absolute(request.path).lexically_normal();
    }

    boost::system::error_code ec;
    auto address = net::ip::make_address(options_.host, ec);
    if (ec) {
        throw RendezvousError(fmt::format("invalid transit host '{}'", options_.host));
    }

    std::random_device rd;
    std::uniform_int_distribution<int> pick(1, core::transfer::kMaxNameplate);
    int first = pick(rd);
    for (int i = 0; i < core::transfer::kMaxNameplate; ++i) {
        int nameplate = (first - 1 + i) % core::transfer::kMaxNameplate + 1;
        if (!bindNameplate(nameplate, address)) {
            continue;
        }
        code_ = core::GenerateCode(nameplate, core::Wordlist::Default(options_.code_length));
        key_ = DeriveKey(code_);
        spdlog::info("Session {} waiting for a receiver on {}:{}",
                     session_id_,
                     options_.host,
                     options_.base_port + nameplate);
        co_return code_;
    }
    throw RendezvousError(fmt::format("no free nameplate on {}, ports {}-{} are all in use",
                                      options_.host,
                                      options_.base_port + 1,
                                      options_.base_port + core::transfer::kMaxNameplate));
}

net::awaitable<core::TransferMetadata> DirectTransferEngine::RedeemCode(const std::string& code,
                                                                        core::CancelToken& cancel) {
    auto nameplate = core::ParseNameplate(code);
    if (!nameplate || *nameplate > core::transfer::kMaxNameplate) {
        throw RendezvousError(fmt::format("the number in '{}' must be between 1 and {}",
                                          code,
                                          core::transfer::kMaxNameplate));
    }
    code_ = code;
    key_ = DeriveKey(code_);
    auto port = static_cast<std::uint16_t>(options_.base_port + *nameplate);
    auto subscription = cancel.Subscribe([this] { abort(); });

    tcp::resolver resolver(ioc_);
    boost::system::error_code ec;
    auto endpoints = co_await resolver.async_resolve(options_.host,
                                                     std::to_string(port),
                                                     net::redirect_error(net::use_awaitable, ec));
    if (!ec) {
        co_await net::async_connect(socket_,
                                    endpoints,
                                    net::redirect_error(net::use_awaitable, ec));
    }
    if (ec) {
        throw RendezvousError(fmt::format("no sender is waiting on {}:{} ({})",
                                          options_.host,
                                          port,
                                          ec.message()));
    }
    connection_ = std::make_unique<Connection>(std::move(socket_));
    spdlog::info("Session {} connected to the sender on {}:{}", session_id_, options_.host, port);

    try {
        co_await confirmKey(core::SessionRole::kReceive);
    } catch (const TransferError& e) {
        throw RendezvousError(e.what());
    }

    core::TransferMetadata offer;
    try {
        auto frame = co_await connection_->Expect("offer");
        offer = frame.header.at("offer").get<core::TransferMetadata>();
    } catch (const json::exception& e) {
        throw TransferError(fmt::format("malformed offer: {}", e.what()));
    }
    ValidateOffer(offer);
    offer_ = std::move(offer);
    spdlog::info("Sender offers {} '{}' ({} bytes)",
                 core::TransferKindToString(offer_.kind),
                 offer_.name,
                 offer_.size);
    co_return offer_;
}

net::awaitable<void> DirectTransferEngine::confirmKey(core::SessionRole role) {
    bool sending = role == core::SessionRole::kSend;
    auto own_label = sending ? kSenderLabel : kReceiverLabel;
    auto peer_label = sending ? kReceiverLabel : kSenderLabel;

    auto nonce = MakeNonce();
    co_await connection_->Send({{"type", "hello"},
                                {"side", std::string(own_label)},
                                {"nonce", nonce},
                                {"version", kProtocolVersion},
                                {"session", session_id_}});
    auto hello = co_await connection_->Expect("hello");
    if (hello.header.value("version", 0) != kProtocolVersion) {
        throw RendezvousError("peer speaks an incompatible protocol version");
    }
    if (hello.header.value("side", std::string{}) != peer_label) {
        throw RendezvousError(fmt::format("peer is not a {}", std::string(peer_label)));
    }
    auto peer_nonce = hello.header.value("nonce", std::string{});
    if (peer_nonce.empty()) {
        throw RendezvousError("malformed handshake from peer");
    }
    spdlog::debug("Peer session {}", hello.header.value("session", std::string("unknown")));

    const auto& sender_nonce = sending ? nonce : peer_nonce;
    const auto& receiver_nonce = sending ? peer_nonce : nonce;
    co_await connection_->Send(
        {{"type", "proof"}, {"mac", ComputeProof(key_, own_label, sender_nonce, receiver_nonce)}});
    auto proof = co_await connection_->Expect("proof");
    auto expected = ComputeProof(key_, peer_label, sender_nonce, receiver_nonce);
    if (!VerifyProof(expected, proof.header.value("mac", std::string{}))) {
        throw RendezvousError("key confirmation failed, the code is probably mistyped");
    }

    auto outbound = DeriveSubkey(key_, sending ? kSenderRecords : kReceiverRecords);
    auto inbound = DeriveSubkey(key_, sending ? kReceiverRecords : kSenderRecords);
    connection_->EnableEncryption(RecordCipher(std::move(outbound)),
                                  RecordCipher(std::move(inbound)));
    spdlog::debug("Key confirmed, data channel encrypted");
}

void DirectTransferEngine::RejectOffer(const std::string& reason) {
    if (!connection_ || !connection_->is_open()) {
        return;
    }
    try {
        connection_->SendNow(
            {{"type", "answer"}, {"accept", false}, {"reason", reason}});
    } catch (const std::exception& e) {
        spdlog::warn("Could not tell the sender about the rejection: {}", e.what());
    }
    connection_->Close();
}

std::shared_ptr<core::TransferEventStream> DirectTransferEngine::StartTransfer(
    const core::TransferRequest& request, core::CancelToken& cancel) {
    auto stream = std::make_shared<core::TransferEventStream>(ioc_.get_executor());
    if (request.role == core::SessionRole::kSend) {
        net::co_spawn(ioc_, runSender(stream, cancel), net::detached);
    } else {
        net::co_spawn(ioc_, runReceiver(stream, request.path, cancel), net::detached);
    }
    return stream;
}

net::awaitable<void> DirectTransferEngine::runSender(
    std::shared_ptr<core::TransferEventStream> stream, core::CancelToken& cancel) {
    auto subscription = cancel.Subscribe([this] { abort(); });
    try {
        if (!acceptor_.is_open()) {
            throw TransferError("no code was allocated");
        }
        auto socket = co_await acceptor_.async_accept(net::use_awaitable);
        boost::system::error_code ec;
        acceptor_.close(ec);
        connection_ = std::make_unique<Connection>(std::move(socket));
        spdlog::info("Receiver connected");

        co_await confirmKey(core::SessionRole::kSend);
        co_await connection_->Send({{"type", "offer"}, {"offer", offer_}});
        auto answer = co_await connection_->Expect("answer");
        if (!answer.header.value("accept", false)) {
            throw TransferError("the receiver rejected the transfer: "
                                + answer.header.value("reason", std::string("no reason given")));
        }

        DataProgress progress;
        progress.total = offer_.size;
        stream->Publish(progress.Sample());
        if (offer_.kind == TransferKind::kFile) {
            co_await sendFile(source_, 0, offer_.size, progress, *stream);
        } else if (offer_.kind == TransferKind::kDirectory) {
            for (std::size_t i = 0; i < offer_.entries.size(); ++i) {
                const auto& entry = offer_.entries[i];
                co_await sendFile(source_ / fs::path(entry.path), i, entry.size, progress, *stream);
            }
        }
        co_await connection_->Send({{"type", "done"}, {"sha256", progress.hasher.FinalHex()}});
        co_await connection_->Expect("ack");

        progress.done = progress.total;
        stream->Publish(progress.Sample());
        spdlog::info("Sent {} bytes", progress.total);
        stream->Finish(core::TransferOutcome::Success());
    } catch (const std::exception& e) {
        if (cancel.IsSignaled()) {
            spdlog::info("Send cancelled: {}", e.what());
            stream->Finish(core::TransferOutcome::Cancelled());
        } else {
            spdlog::error("Send failed: {}", e.what());
            stream->Finish(core::TransferOutcome::Failed(e.what()));
        }
    }
    if (connection_) {
        connection_->Close();
    }
}

net::awaitable<void> DirectTransferEngine::sendFile(const fs::path& file,
                                                    std::size_t entry,
                                                    std::uint64_t size,
                                                    DataProgress& progress,
                                                    core::TransferEventStream& stream) {
    std::ifstream input(file, std::ios::binary);
    if (!input) {
        throw TransferError(fmt::format("cannot open {}", file.string()));
    }

    std::uint64_t sent = 0;
    BinaryData chunk;
    while (sent < size) {
        auto want = static_cast<std::size_t>(
            std::min<std::uint64_t>(options_.chunk_size, size - sent));
        chunk.resize(want);
        input.read(reinterpret_cast<char*>(chunk.data()), static_cast<std::streamsize>(want));
        auto got = static_cast<std::size_t>(input.gcount());
        if (got == 0) {
            throw TransferError(fmt::format("{} shrank while it was being sent", file.string()));
        }
        chunk.resize(got);
        progress.hasher.Update(chunk.data(), chunk.size());
        co_await connection_->Send({{"type", "data"}, {"entry", entry}}, chunk);
        sent += got;
        progress.done += got;
        stream.Publish(progress.Sample());
    }
}

net::awaitable<void> DirectTransferEngine::runReceiver(
    std::shared_ptr<core::TransferEventStream> stream,
    fs::path out_dir,
    core::CancelToken& cancel) {
    auto subscription = cancel.Subscribe([this] { abort(); });
    fs::path partial;
    try {
        if (!connection_ || !connection_->is_open()) {
            throw TransferError("there is no offer to accept");
        }

        fs::path target;
        if (offer_.kind != TransferKind::kText) {
            target = out_dir / offer_.name;
            std::error_code ec;
            if (fs::exists(fs::symlink_status(target, ec))) {
                co_await connection_->Send({{"type", "answer"},
                                            {"accept", false},
                                            {"reason", "the target already exists"}});
                throw TransferError(
                    fmt::format("refusing to overwrite existing {}", target.string()));
            }
            fs::create_directories(out_dir);
            partial = target;
            partial += ".part";
            fs::remove_all(partial);
            if (offer_.kind == TransferKind::kDirectory) {
                fs::create_directories(partial);
                for (const auto& entry : offer_.entries) {
                    auto path = partial / fs::path(entry.path);
                    fs::create_directories(path.parent_path());
                    std::ofstream touch(path, std::ios::binary | std::ios::trunc);
                    if (!touch) {
                        throw TransferError(fmt::format("cannot create {}", path.string()));
                    }
                }
            } else {
                std::ofstream touch(partial, std::ios::binary | std::ios::trunc);
                if (!touch) {
                    throw TransferError(fmt::format("cannot create {}", partial.string()));
                }
            }
        }

        co_await connection_->Send({{"type", "answer"}, {"accept", true}});
        DataProgress progress;
        progress.total = offer_.size;
        stream->Publish(progress.Sample());

        auto expected = co_await receiveData(partial, progress, *stream);
        auto actual = progress.hasher.FinalHex();

        std::string problem;
        if (offer_.kind != TransferKind::kText && progress.done != progress.total) {
            problem = fmt::format("received {} of {} bytes", progress.done, progress.total);
        } else if (expected != actual) {
            problem = "checksum mismatch, the received data is corrupt";
        } else if (!target.empty() && fs::exists(fs::symlink_status(target))) {
            problem = fmt::format("refusing to overwrite existing {}", target.string());
        }
        if (!problem.empty()) {
            co_await connection_->Send({{"type", "error"}, {"message", problem}});
            throw TransferError(problem);
        }

        if (!target.empty()) {
            fs::rename(partial, target);
            partial.clear();
            spdlog::info("Received {} into {}", offer_.name, target.string());
        }
        try {
            co_await connection_->Send({{"type", "ack"}});
        } catch (const std::exception& e) {
            spdlog::warn("Could not acknowledge the transfer: {}", e.what());
        }

        progress.done = progress.total;
        stream->Publish(progress.Sample());
        stream->Finish(core::TransferOutcome::Success());
    } catch (const std::exception& e) {
        if (!partial.empty()) {
            std::error_code ec;
            fs::remove_all(partial, ec);
        }
        if (cancel.IsSignaled()) {
            spdlog::info("Receive cancelled: {}", e.what());
            stream->Finish(core::TransferOutcome::Cancelled());
        } else {
            spdlog::error("Receive failed: {}", e.what());
            stream->Finish(core::TransferOutcome::Failed(e.what()));
        }
    }
    if (connection_) {
        connection_->Close();
    }
}

net::awaitable<std::string> DirectTransferEngine::receiveData(const fs::path& partial,
                                                              DataProgress& progress,
                                                              core::TransferEventStream& stream) {
    bool directory = offer_.kind == TransferKind::kDirectory;
    std::vector<std::uint64_t> written(directory ? offer_.entries.size() : 1, 0);
    auto entrySize = [&](std::size_t index) {
        return directory ? offer_.entries[index].size : offer_.size;
    };
    auto entryPath = [&](std::size_t index) {
        return directory ? partial / fs::path(offer_.entries[index].path) : partial;
    };

    std::ofstream output;
    std::optional<std::size_t> current;
    while (true) {
        auto frame = co_await connection_->Receive();
        auto type = frame.type();
        if (type == "done") {
            output.close();
            co_return frame.header.value("sha256", std::string{});
        }
        if (type == "error") {
            throw TransferError(frame.header.value("message", std::string("peer error")));
        }
        if (type != "data" || offer_.kind == TransferKind::kText) {
            throw TransferError(fmt::format("protocol error: unexpected '{}' frame", type));
        }

        auto index = frame.header.value("entry", written.size());
        if (index >= written.size() || (current && index < *current)) {
            throw TransferError("protocol error: data for an unexpected entry");
        }
        if (written[index] + frame.payload.size() > entrySize(index)) {
            throw TransferError("the sender sent more data than it offered");
        }
        if (!current || *current != index) {
            output.close();
            output.open(entryPath(index), std::ios::binary | std::ios::trunc);
            if (!output) {
                throw TransferError(fmt::format("cannot write {}", entryPath(index).string()));
            }
            current = index;
        }
        output.write(reinterpret_cast<const char*>(frame.payload.data()),
                     static_cast<std::streamsize>(frame.payload.size()));
        if (!output) {
            throw TransferError(fmt::format("failed writing {}", entryPath(index).string()));
        }
        written[index] += frame.payload.size();
        progress.hasher.Update(frame.payload.data(), frame.payload.size());
        progress.done += frame.payload.size();
        stream.Publish(progress.Sample());
    }
}

void DirectTransferEngine::abort() {
    boost::system::error_code ec;
    acceptor_.close(ec);
    socket_.close(ec);
    if (connection_) {
        connection_->Close();
    }
}

void DirectTransferEngine::Shutdown() {
    spdlog::debug("Shutting down transit engine for session {}", session_id_);
    abort();
}

} // namespace wormhole::transit
