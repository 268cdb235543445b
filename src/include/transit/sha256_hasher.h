#pragma once

#include <cstddef>
#include <openssl/evp.h>
#include <string>

namespace wormhole::transit {

// Incremental SHA-256 over everything that goes through a transfer
class Sha256Hasher {
public:
    Sha256Hasher();
    ~Sha256Hasher();
    Sha256Hasher(const Sha256Hasher&) = delete;
    Sha256Hasher& operator=(const Sha256Hasher&) = delete;

    void Update(const void* data, std::size_t size);

    // Lowercase hex digest. The hasher cannot be updated afterwards.
    std::string FinalHex();

private:
    EVP_MD_CTX* ctx_;
    bool finalized_{false};
};

std::string ToHex(const unsigned char* data, std::size_t size);

} // namespace wormhole::transit
