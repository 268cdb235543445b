#include <openssl/crypto.h>
#include <openssl/err.h>
#include <openssl/evp.h>
#include <openssl/hmac.h>
#include <openssl/rand.h>
#include <stdexcept>
#include <transit/key_confirmation.h>
#include <transit/sha256_hasher.h>

namespace wormhole::transit {

namespace {

constexpr std::string_view kKeyContext = "wormhole-cli/direct-transit/v1:";
constexpr std::size_t kNonceSize = 16;

Key hmacSha256(const Key& key, std::string_view message) {
    Key mac(EVP_MAX_MD_SIZE);
    unsigned int mac_len = 0;
    if (!HMAC(EVP_sha256(),
              key.data(),
              static_cast<int>(key.size()),
              reinterpret_cast<const unsigned char*>(message.data()),
              message.size(),
              mac.data(),
              &mac_len)) {
        throw std::runtime_error(ERR_error_string(ERR_get_error(), nullptr));
    }
    mac.resize(mac_len);
    return mac;
}

} // namespace

Key DeriveKey(std::string_view code) {
    std::string input(kKeyContext);
    input.append(code);

    Key key(EVP_MAX_MD_SIZE);
    unsigned int key_len = 0;
    if (EVP_Digest(input.data(), input.size(), key.data(), &key_len, EVP_sha256(), nullptr)
        != 1) {
        throw std::runtime_error(ERR_error_string(ERR_get_error(), nullptr));
    }
    key.resize(key_len);
    return key;
}

Key DeriveSubkey(const Key& key, std::string_view purpose) {
    return hmacSha256(key, purpose);
}

std::string MakeNonce() {
    unsigned char nonce[kNonceSize];
    if (RAND_bytes(nonce, sizeof(nonce)) != 1) {
        throw std::runtime_error(ERR_error_string(ERR_get_error(), nullptr));
    }
    return ToHex(nonce, sizeof(nonce));
}

std::string ComputeProof(const Key& key,
                         std::string_view side,
                         std::string_view sender_nonce,
                         std::string_view receiver_nonce) {
    std::string message(side);
    message += ':';
    message.append(sender_nonce);
    message += ':';
    message.append(receiver_nonce);
    auto mac = hmacSha256(key, message);
    return ToHex(mac.data(), mac.size());
}

bool VerifyProof(std::string_view expected, std::string_view actual) {
    if (expected.size() != actual.size() || expected.empty()) {
        return false;
    }
    return CRYPTO_memcmp(expected.data(), actual.data(), expected.size()) == 0;
}

} // namespace wormhole::transit
