#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace wormhole::transit {

using Key = std::vector<std::uint8_t>;

constexpr std::string_view kSenderLabel = "sender";
constexpr std::string_view kReceiverLabel = "receiver";

// Both sides derive the same 32-byte key from the code alone
Key DeriveKey(std::string_view code);

// Key for one direction of the data channel, e.g. purpose "sender-records"
Key DeriveSubkey(const Key& key, std::string_view purpose);

// 16 random bytes, hex encoded. Throws std::runtime_error if the RNG fails.
std::string MakeNonce();

// HMAC-SHA256 over both nonces, hex encoded. side is kSenderLabel or kReceiverLabel.
std::string ComputeProof(const Key& key,
                         std::string_view side,
                         std::string_view sender_nonce,
                         std::string_view receiver_nonce);

// Constant-time comparison of two proofs
bool VerifyProof(std::string_view expected, std::string_view actual);

} // namespace wormhole::transit
