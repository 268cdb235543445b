#pragma once

#include <string_view>

namespace wormhole::core {

enum class SessionState {
    kInit,
    kCodeAllocation, // allocating (send) or redeeming (receive) a code
    kCodeAllocated,  // code known, presentation channels open
    kConfirmation,   // receive only, waiting for accept/reject
    kTransferring,   // the only state in which bulk data moves
    kCompleted,
    kFailed,
    kCancelled,
};

inline bool IsTerminal(SessionState state) {
    return state == SessionState::kCompleted || state == SessionState::kFailed
           || state == SessionState::kCancelled;
}

inline std::string_view SessionStateToString(SessionState state) {
    switch (state) {
    case SessionState::kInit:
        return "Init";
    case SessionState::kCodeAllocation:
        return "CodeAllocation";
    case SessionState::kCodeAllocated:
        return "CodeAllocated";
    case SessionState::kConfirmation:
        return "Confirmation";
    case SessionState::kTransferring:
        return "Transferring";
    case SessionState::kCompleted:
        return "Completed";
    case SessionState::kFailed:
        return "Failed";
    case SessionState::kCancelled:
        return "Cancelled";
    }
    return "Unknown";
}

} // namespace wormhole::core
