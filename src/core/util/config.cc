#include <core/constant/transfer.h>
#include <core/util/config.h>
#include <fstream>
#include <spdlog/spdlog.h>

namespace wormhole::core {

static std::filesystem::path config_file_path;

static void LoadSetting() {
    if (!config.contains("setting")) {
        config.insert("setting", toml::table{});
    }
    auto& setting = *config["setting"].as_table();

    settings.qr = setting["qr"].value_or(false);
    settings.clipboard = setting["clipboard"].value_or(false);
    settings.auto_accept = setting["auto-accept"].value_or(false);
    settings.save_dir = setting["save-dir"].value_or(std::string{"."});
    settings.transit_host = setting["transit-host"].value_or(std::string{"127.0.0.1"});

    auto code_length = setting["code-length"].value_or<std::int64_t>(transfer::kDefaultCodeLength);
    if (code_length < 1 || code_length > 16) {
        spdlog::warn("Ignoring code-length {} from config, using {}",
                     code_length,
                     transfer::kDefaultCodeLength);
        code_length = transfer::kDefaultCodeLength;
    }
    settings.code_length = static_cast<std::size_t>(code_length);

    auto grace = setting["cancel-grace-ms"].value_or<std::int64_t>(
        transfer::kDefaultCancelGracePeriod.count());
    if (grace < 0) {
        spdlog::warn("Ignoring negative cancel-grace-ms from config");
        grace = transfer::kDefaultCancelGracePeriod.count();
    }
    settings.cancel_grace_ms = grace;

    auto base_port = setting["transit-base-port"].value_or<std::int64_t>(
        transfer::kDefaultBasePort);
    if (base_port < 1024 || base_port + transfer::kMaxNameplate > 65535) {
        spdlog::warn("Ignoring transit-base-port {} from config", base_port);
        base_port = transfer::kDefaultBasePort;
    }
    settings.transit_base_port = static_cast<std::uint16_t>(base_port);
}

void InitConfig(const std::filesystem::path& config_file) {
    config_file_path = config_file;
    auto dir = config_file.parent_path();
    std::error_code ec;
    if (!dir.empty() && !std::filesystem::exists(dir, ec)) {
        spdlog::info("Config directory does not exist, creating...");
        std::filesystem::create_directories(dir, ec);
        if (ec) {
            spdlog::warn("Failed to create config directory \"{}\": {}",
                         dir.string(),
                         ec.message());
        }
    }
    if (!std::filesystem::exists(config_file, ec)) {
        std::ofstream ofs(config_file);
        spdlog::info("Config file does not exist, creating...");
    }
    try {
        config = toml::parse_file(config_file.string());
    } catch (const toml::parse_error& err) {
        spdlog::error("\"{}\" could not be parsed: {}", config_file.string(), err.description());
        config = toml::table{};
    }

    LoadSetting();
}

void SaveConfig() {
    if (config_file_path.empty()) {
        config_file_path = path::kConfigFile;
    }
    std::ofstream ofs(config_file_path);
    if (!ofs.is_open()) {
        spdlog::error("Failed to open \"{}\" for saving config.", config_file_path.string());
        return;
    }
    config.insert_or_assign("setting",
                            toml::table{
                                {"qr", settings.qr},
                                {"clipboard", settings.clipboard},
                                {"auto-accept", settings.auto_accept},
                                {"save-dir", settings.save_dir.string()},
                                {"code-length", static_cast<std::int64_t>(settings.code_length)},
                                {"cancel-grace-ms", settings.cancel_grace_ms},
                                {"transit-host", settings.transit_host},
                                {"transit-base-port",
                                 static_cast<std::int64_t>(settings.transit_base_port)},
                            });
    ofs << config;
}

} // namespace wormhole::core
