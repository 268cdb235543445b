#include <memory>
#include <openssl/crypto.h>
#include <openssl/err.h>
#include <openssl/evp.h>
#include <stdexcept>
#include <transit/record_cipher.h>

namespace wormhole::transit {

namespace {

using CipherContext = std::unique_ptr<EVP_CIPHER_CTX, decltype(&EVP_CIPHER_CTX_free)>;

std::string lastError() {
    auto code = ERR_get_error();
    if (code == 0) {
        return "authentication failed";
    }
    return ERR_error_string(code, nullptr);
}

} // namespace

RecordCipher::RecordCipher(Key key)
    : key_(std::move(key)) {
    if (key_.size() != kKeySize) {
        throw std::invalid_argument("record key must be 32 bytes");
    }
}

RecordCipher::RecordCipher(RecordCipher&& other) noexcept
    : key_(std::move(other.key_))
    , counter_(other.counter_) {
    other.key_.clear();
}

RecordCipher& RecordCipher::operator=(RecordCipher&& other) noexcept {
    if (this != &other) {
        secureZeroMemory(key_.data(), key_.size());
        key_ = std::move(other.key_);
        counter_ = other.counter_;
        other.key_.clear();
    }
    return *this;
}

RecordCipher::~RecordCipher() {
    secureZeroMemory(key_.data(), key_.size());
}

void RecordCipher::secureZeroMemory(void* data_ptr, std::size_t len) {
    if (data_ptr && len > 0) {
        OPENSSL_cleanse(data_ptr, len);
    }
}

std::vector<std::uint8_t> RecordCipher::nextIv() {
    std::vector<std::uint8_t> iv(kIvSize, 0);
    auto counter = counter_++;
    for (std::size_t i = 0; i < sizeof(counter); ++i) {
        iv[kIvSize - 1 - i] = static_cast<std::uint8_t>(counter >> (8 * i));
    }
    return iv;
}

std::expected<BinaryData, RecordCipher::ErrorType> RecordCipher::Seal(
    const BinaryData& plaintext) {
    CipherContext ctx(EVP_CIPHER_CTX_new(), &EVP_CIPHER_CTX_free);
    if (!ctx) {
        return std::unexpected(lastError());
    }
    auto iv = nextIv();

    auto iv_len = static_cast<int>(kIvSize);
    if (EVP_EncryptInit_ex(ctx.get(), EVP_aes_256_gcm(), nullptr, nullptr, nullptr) != 1
        || EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_SET_IVLEN, iv_len, nullptr) != 1
        || EVP_EncryptInit_ex(ctx.get(), nullptr, nullptr, key_.data(), iv.data()) != 1) {
        return std::unexpected(lastError());
    }

    BinaryData sealed(plaintext.size() + EVP_MAX_BLOCK_LENGTH + kTagSize);
    int len = 0;
    if (EVP_EncryptUpdate(ctx.get(),
                          sealed.data(),
                          &len,
                          plaintext.data(),
                          static_cast<int>(plaintext.size()))
        != 1) {
        return std::unexpected(lastError());
    }
    int sealed_len = len;

    if (EVP_EncryptFinal_ex(ctx.get(), sealed.data() + sealed_len, &len) != 1) {
        return std::unexpected(lastError());
    }
    sealed_len += len;

    if (EVP_CIPHER_CTX_ctrl(ctx.get(),
                            EVP_CTRL_GCM_GET_TAG,
                            static_cast<int>(kTagSize),
                            sealed.data() + sealed_len)
        != 1) {
        return std::unexpected(lastError());
    }
    sealed.resize(static_cast<std::size_t>(sealed_len) + kTagSize);
    return sealed;
}

std::expected<BinaryData, RecordCipher::ErrorType> RecordCipher::Open(const BinaryData& sealed) {
    if (sealed.size() < kTagSize) {
        return std::unexpected("record shorter than its tag");
    }
    CipherContext ctx(EVP_CIPHER_CTX_new(), &EVP_CIPHER_CTX_free);
    if (!ctx) {
        return std::unexpected(lastError());
    }
    auto iv = nextIv();

    auto iv_len = static_cast<int>(kIvSize);
    if (EVP_DecryptInit_ex(ctx.get(), EVP_aes_256_gcm(), nullptr, nullptr, nullptr) != 1
        || EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_SET_IVLEN, iv_len, nullptr) != 1
        || EVP_DecryptInit_ex(ctx.get(), nullptr, nullptr, key_.data(), iv.data()) != 1) {
        return std::unexpected(lastError());
    }

    auto ciphertext_len = sealed.size() - kTagSize;
    BinaryData plaintext(ciphertext_len + EVP_MAX_BLOCK_LENGTH);
    int len = 0;
    if (EVP_DecryptUpdate(ctx.get(),
                          plaintext.data(),
                          &len,
                          sealed.data(),
                          static_cast<int>(ciphertext_len))
        != 1) {
        return std::unexpected(lastError());
    }
    int plaintext_len = len;

    BinaryData tag(sealed.end() - static_cast<std::ptrdiff_t>(kTagSize), sealed.end());
    if (EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_SET_TAG, static_cast<int>(kTagSize), tag.data())
        != 1) {
        return std::unexpected(lastError());
    }

    if (EVP_DecryptFinal_ex(ctx.get(), plaintext.data() + plaintext_len, &len) <= 0) {
        return std::unexpected(lastError());
    }
    plaintext_len += len;
    plaintext.resize(static_cast<std::size_t>(plaintext_len));
    return plaintext;
}

} // namespace wormhole::transit
