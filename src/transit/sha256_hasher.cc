#include <stdexcept>
#include <transit/sha256_hasher.h>

namespace wormhole::transit {

std::string ToHex(const unsigned char* data, std::size_t size) {
    static constexpr char kDigits[] = "0123456789abcdef";
    std::string hex;
    hex.reserve(size * 2);
    for (std::size_t i = 0; i < size; ++i) {
        hex += kDigits[data[i] >> 4];
        hex += kDigits[data[i] & 0x0f];
    }
    return hex;
}

Sha256Hasher::Sha256Hasher()
    : ctx_(EVP_MD_CTX_new()) {
    if (!ctx_ || EVP_DigestInit_ex(ctx_, EVP_sha256(), nullptr) != 1) {
        EVP_MD_CTX_free(ctx_);
        throw std::runtime_error("Failed to initialize SHA-256 digest");
    }
}

Sha256Hasher::~Sha256Hasher() {
    EVP_MD_CTX_free(ctx_);
}

void Sha256Hasher::Update(const void* data, std::size_t size) {
    if (finalized_) {
        throw std::logic_error("Sha256Hasher updated after FinalHex");
    }
    if (size > 0 && EVP_DigestUpdate(ctx_, data, size) != 1) {
        throw std::runtime_error("SHA-256 update failed");
    }
}

std::string Sha256Hasher::FinalHex() {
    if (finalized_) {
        throw std::logic_error("Sha256Hasher finalized twice");
    }
    finalized_ = true;
    unsigned char hash[EVP_MAX_MD_SIZE];
    unsigned int hash_len = 0;
    if (EVP_DigestFinal_ex(ctx_, hash, &hash_len) != 1) {
        throw std::runtime_error("SHA-256 finalization failed");
    }
    return ToHex(hash, hash_len);
}

} // namespace wormhole::transit
