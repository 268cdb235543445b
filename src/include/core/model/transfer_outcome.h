#pragma once

#include "progress_sample.h"
#include <string>
#include <string_view>
#include <variant>

namespace wormhole::core {

enum class OutcomeTag {
    kSuccess,
    kFailed,
    kCancelled,
};

inline std::string_view OutcomeTagToString(OutcomeTag tag) {
    switch (tag) {
    case OutcomeTag::kSuccess:
        return "success";
    case OutcomeTag::kFailed:
        return "failed";
    case OutcomeTag::kCancelled:
        return "cancelled";
    }
    return "unknown";
}

// Final tag of a transfer event stream
struct TransferOutcome {
    OutcomeTag tag{OutcomeTag::kSuccess};
    std::string reason;

    static TransferOutcome Success() { return TransferOutcome{OutcomeTag::kSuccess, {}}; }
    static TransferOutcome Failed(std::string reason) {
        return TransferOutcome{OutcomeTag::kFailed, std::move(reason)};
    }
    static TransferOutcome Cancelled(std::string reason = {}) {
        return TransferOutcome{OutcomeTag::kCancelled, std::move(reason)};
    }
};

using TransferEvent = std::variant<ProgressSample, TransferOutcome>;

} // namespace wormhole::core
