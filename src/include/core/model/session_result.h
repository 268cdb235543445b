#pragma once

#include "session_state.h"
#include <chrono>
#include <cstdint>
#include <string>
#include <string_view>

namespace wormhole::core {

enum class ErrorKind {
    kNone,
    kRendezvous,   // code allocation or redemption failed
    kTransfer,     // data channel or integrity failure
    kUserRejected, // declined at the confirmation prompt
    kCancelled,    // interrupt driven
};

inline std::string_view ErrorKindToString(ErrorKind kind) {
    switch (kind) {
    case ErrorKind::kNone:
        return "None";
    case ErrorKind::kRendezvous:
        return "RendezvousError";
    case ErrorKind::kTransfer:
        return "TransferError";
    case ErrorKind::kUserRejected:
        return "UserRejected";
    case ErrorKind::kCancelled:
        return "Cancelled";
    }
    return "Unknown";
}

struct SessionResult {
    SessionState state{SessionState::kInit};
    ErrorKind error{ErrorKind::kNone};
    std::string message; // the single user-facing closing line
    std::string code;
    std::uint64_t bytes_transferred{0};
    std::chrono::milliseconds elapsed{0};
};

} // namespace wormhole::core
