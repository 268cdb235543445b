#include <core/constant/transfer.h>
#include <core/util/config.h>
#include <filesystem>
#include <fstream>
#include <gtest/gtest.h>
#include <random>

namespace fs = std::filesystem;
using namespace wormhole::core;

class ConfigTest : public ::testing::Test {
protected:
    void SetUp() override {
        std::random_device rd;
        dir_ = fs::temp_directory_path() / ("wormhole-config-test-" + std::to_string(rd()));
        fs::create_directories(dir_);
        file_ = dir_ / "config.toml";
    }

    void TearDown() override {
        std::error_code ec;
        fs::remove_all(dir_, ec);
    }

    void writeConfig(const std::string& content) {
        std::ofstream ofs(file_);
        ofs << content;
    }

    fs::path dir_;
    fs::path file_;
};

TEST_F(ConfigTest, MissingFileYieldsDefaults) {
    InitConfig(dir_ / "nested" / "config.toml");

    EXPECT_TRUE(fs::exists(dir_ / "nested" / "config.toml"));
    EXPECT_FALSE(settings.qr);
    EXPECT_FALSE(settings.clipboard);
    EXPECT_FALSE(settings.auto_accept);
    EXPECT_EQ(settings.save_dir.string(), ".");
    EXPECT_EQ(settings.code_length, transfer::kDefaultCodeLength);
    EXPECT_EQ(settings.cancel_grace_ms, transfer::kDefaultCancelGracePeriod.count());
    EXPECT_EQ(settings.transit_host, "127.0.0.1");
    EXPECT_EQ(settings.transit_base_port, transfer::kDefaultBasePort);
}

TEST_F(ConfigTest, ReadsSettingTable) {
    writeConfig(R"([setting]
qr = true
clipboard = true
auto-accept = true
save-dir = "/tmp/incoming"
code-length = 3
cancel-grace-ms = 500
transit-host = "10.0.0.2"
transit-base-port = 50000
)");
    InitConfig(file_);

    EXPECT_TRUE(settings.qr);
    EXPECT_TRUE(settings.clipboard);
    EXPECT_TRUE(settings.auto_accept);
    EXPECT_EQ(settings.save_dir.string(), "/tmp/incoming");
    EXPECT_EQ(settings.code_length, 3u);
    EXPECT_EQ(settings.cancel_grace_ms, 500);
    EXPECT_EQ(settings.transit_host, "10.0.0.2");
    EXPECT_EQ(settings.transit_base_port, 50000);
}

TEST_F(ConfigTest, OutOfRangeValuesFallBackToDefaults) {
    writeConfig(R"([setting]
code-length = 0
cancel-grace-ms = -5
transit-base-port = 80
)");
    InitConfig(file_);

    EXPECT_EQ(settings.code_length, transfer::kDefaultCodeLength);
    EXPECT_EQ(settings.cancel_grace_ms, transfer::kDefaultCancelGracePeriod.count());
    EXPECT_EQ(settings.transit_base_port, transfer::kDefaultBasePort);
}

TEST_F(ConfigTest, UnparsableFileYieldsDefaults) {
    writeConfig("[setting\nqr = ");
    InitConfig(file_);

    EXPECT_FALSE(settings.qr);
    EXPECT_EQ(settings.code_length, transfer::kDefaultCodeLength);
}

TEST_F(ConfigTest, SaveConfigPersistsSettings) {
    InitConfig(file_);
    settings.clipboard = true;
    settings.code_length = 4;
    SaveConfig();

    settings.clipboard = false;
    settings.code_length = 2;
    InitConfig(file_);
    EXPECT_TRUE(settings.clipboard);
    EXPECT_EQ(settings.code_length, 4u);
}
