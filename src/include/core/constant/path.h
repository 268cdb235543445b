#pragma once

#include <cstdlib>
#include <filesystem>

namespace wormhole::core {
namespace path {

inline const std::filesystem::path kHomeDir = []() -> std::filesystem::path {
#if defined(_WIN32) || defined(_WIN64)
    const char* home = std::getenv("USERPROFILE");
#else
    const char* home = std::getenv("HOME");
#endif
    return home != nullptr ? std::filesystem::path(home) : std::filesystem::temp_directory_path();
}();

inline const std::filesystem::path kLogDir = std::filesystem::temp_directory_path() / "wormhole-cli"
                                             / "logs";

inline const std::filesystem::path kConfigDir =
#if defined(_WIN32) || defined(_WIN64)
    kHomeDir / "AppData" / "Roaming" / "wormhole-cli";
#elif defined(__APPLE__)
    kHomeDir / "Library" / "Application Support" / "wormhole-cli";
#else
    kHomeDir / ".config" / "wormhole-cli";
#endif

inline const std::filesystem::path kConfigFile = kConfigDir / "config.toml";

} // namespace path
} // namespace wormhole::core
