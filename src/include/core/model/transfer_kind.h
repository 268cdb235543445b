#pragma once

#include <nlohmann/json.hpp>
#include <string_view>

namespace wormhole::core {

enum class SessionRole {
    kSend,
    kReceive,
};

enum class TransferKind {
    kFile,
    kText,
    kDirectory,
};

NLOHMANN_JSON_SERIALIZE_ENUM(TransferKind,
                             {
                                 {TransferKind::kFile, "file"},
                                 {TransferKind::kText, "text"},
                                 {TransferKind::kDirectory, "directory"},
                             });

inline std::string_view SessionRoleToString(SessionRole role) {
    return role == SessionRole::kSend ? "send" : "receive";
}

inline std::string_view TransferKindToString(TransferKind kind) {
    switch (kind) {
    case TransferKind::kFile:
        return "file";
    case TransferKind::kText:
        return "text";
    case TransferKind::kDirectory:
        return "directory";
    }
    return "unknown";
}

} // namespace wormhole::core
