#pragma once

#include <cstddef>
#include <cstdint>
#include <expected>
#include <string>
#include <transit/key_confirmation.h>
#include <vector>

namespace wormhole::transit {

using BinaryData = std::vector<std::uint8_t>;

/**
 * @brief AES-256-GCM protection for the records of one direction of a connection
 *
 * The IV is the record counter, so records must be opened in the order they were sealed.
 * A sealed record is the ciphertext followed by the 16-byte tag.
 */
class RecordCipher {
    using ErrorType = std::string;

public:
    static constexpr std::size_t kKeySize = 32;
    static constexpr std::size_t kIvSize = 12;
    static constexpr std::size_t kTagSize = 16;

    explicit RecordCipher(Key key);
    RecordCipher(RecordCipher&& other) noexcept;
    RecordCipher& operator=(RecordCipher&& other) noexcept;
    ~RecordCipher();

    std::expected<BinaryData, ErrorType> Seal(const BinaryData& plaintext);
    std::expected<BinaryData, ErrorType> Open(const BinaryData& sealed);

    std::uint64_t records() const { return counter_; }

private:
    std::vector<std::uint8_t> nextIv();
    static void secureZeroMemory(void* data_ptr, std::size_t len);

    Key key_;
    std::uint64_t counter_{0};
};

} // namespace wormhole::transit
