#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>

namespace wormhole::core {

namespace transfer {

constexpr std::size_t kDefaultChunkSize = 64 * 1024; // 64 KiB
constexpr std::size_t kDefaultCodeLength = 2;        // words after the nameplate

constexpr std::uint16_t kDefaultBasePort = 47600; // nameplate N listens on base + N
constexpr int kMaxNameplate = 99;

constexpr std::chrono::milliseconds kDefaultCancelGracePeriod{2000};
constexpr std::chrono::milliseconds kRenderInterval{100}; // at most 10 frames per second
constexpr std::chrono::milliseconds kStallThreshold{5000};

} // namespace transfer

} // namespace wormhole::core
