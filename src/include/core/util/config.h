/*
    config.h
    Application settings backed by a TOML file.

    Reading a setting:
        bool qr = wormhole::core::settings.qr;
        auto grace = wormhole::core::settings.cancel_grace_ms;
    Writing a setting:
        wormhole::core::settings.clipboard = true;

    Initialization and saving:
        wormhole::core::InitConfig();               // default location
        wormhole::core::InitConfig("my.toml");      // explicit file
        wormhole::core::SaveConfig();
*/

#pragma once

#include <core/constant/path.h>
#include <cstdint>
#include <filesystem>
#include <string>
#include <toml++/toml.h>

namespace wormhole::core {

inline toml::table config;

struct Settings {
    bool qr;                        // render the code as a QR block when sending
    bool clipboard;                 // copy the code to the clipboard when sending
    bool auto_accept;               // accept offers without prompting
    std::filesystem::path save_dir; // where received files land
    std::size_t code_length;        // number of words in generated codes
    std::int64_t cancel_grace_ms;   // how long to wait for the engine to stop after Ctrl-C
    std::string transit_host;       // host a receiver connects to
    std::uint16_t transit_base_port;
};

inline Settings settings;

void InitConfig(const std::filesystem::path& config_file = path::kConfigFile);

void SaveConfig();

} // namespace wormhole::core
