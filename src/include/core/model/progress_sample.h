#pragma once

#include <chrono>
#include <cstdint>

namespace wormhole::core {

struct ProgressSample {
    std::uint64_t bytes_done{0}; // absolute, not a delta
    std::uint64_t bytes_total{0};
    std::chrono::milliseconds elapsed{0};
};

} // namespace wormhole::core
