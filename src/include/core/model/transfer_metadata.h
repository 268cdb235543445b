#pragma once

#include "transfer_kind.h"
#include <cstdint>
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

namespace wormhole::core {

struct DirectoryEntry {
    std::string path; // relative to the offered directory, '/' separated
    std::uint64_t size;

    NLOHMANN_DEFINE_TYPE_INTRUSIVE(DirectoryEntry, path, size);
};

// What the sender offers. Immutable once received.
struct TransferMetadata {
    TransferKind kind{TransferKind::kFile};
    std::string name;
    std::uint64_t size{0};
    std::string text;                    // text offers only
    std::vector<DirectoryEntry> entries; // directory offers only

    NLOHMANN_DEFINE_TYPE_INTRUSIVE(TransferMetadata, kind, name, size, text, entries);
};

} // namespace wormhole::core
