/**
 * @file settings_manager_test.cpp
 * @brief Tests for config.json loading, validation and persistence
 */

#include "p2lan/SettingsManager.h"
#include "p2lan/config.h"

#include <gtest/gtest.h>
#include <nlohmann/json.hpp>

#include <filesystem>
#include <fstream>
#include <sstream>
#include <string>

using namespace P2Lan;
namespace fs = std::filesystem;

namespace {

class SettingsManagerTest : public ::testing::Test {
protected:
    fs::path dir;
    fs::path configPath;

    void SetUp() override {
        const auto* info = ::testing::UnitTest::GetInstance()->current_test_info();
        dir = fs::temp_directory_path() / (std::string("p2lan_settings_") + info->name());
        fs::remove_all(dir);
        fs::create_directories(dir);
        configPath = dir / "config.json";
    }

    void TearDown() override {
        std::error_code ec;
        fs::remove_all(dir, ec);
    }

    void writeConfig(const std::string& text) {
        std::ofstream out(configPath, std::ios::binary | std::ios::trunc);
        out << text;
    }

    nlohmann::json readConfig() {
        std::ifstream in(configPath, std::ios::binary);
        std::stringstream buffer;
        buffer << in.rdbuf();
        return nlohmann::json::parse(buffer.str(), nullptr, false);
    }
};

}  // namespace

TEST_F(SettingsManagerTest, FirstRunCreatesDefaultsWithDeviceUuid) {
    SettingsManager mgr(configPath);
    std::string err;
    ASSERT_TRUE(mgr.load(err)) << err;

    const AppSettings s = mgr.settings();
    EXPECT_FALSE(s.deviceUuid.empty());
    EXPECT_FALSE(s.displayName.empty());
    EXPECT_EQ(s.transfer.maxReceiveFileSize, DEFAULT_MAX_FILE_SIZE_BYTES);
    EXPECT_EQ(s.transfer.maxTotalReceiveSize, -1);
    EXPECT_EQ(s.transfer.maxConcurrentTasks, MAX_CONCURRENT_TRANSFERS);
    EXPECT_EQ(s.transfer.maxChunkSizeKb, DEFAULT_CHUNK_SIZE_KB);
    EXPECT_TRUE(s.autoAcceptTrustedRemoteControl);
    EXPECT_TRUE(s.autoAcceptTrustedScreenSharing);
    EXPECT_FALSE(s.allowUnverifiedNetworks);

    ASSERT_TRUE(fs::exists(configPath));
    EXPECT_EQ(readConfig().value("device_uuid", ""), s.deviceUuid);
}

TEST_F(SettingsManagerTest, DeviceUuidSurvivesReload) {
    std::string uuid;
    {
        SettingsManager first(configPath);
        std::string err;
        ASSERT_TRUE(first.load(err)) << err;
        uuid = first.settings().deviceUuid;
    }

    SettingsManager second(configPath);
    std::string err;
    ASSERT_TRUE(second.load(err)) << err;
    EXPECT_EQ(second.settings().deviceUuid, uuid);
    EXPECT_EQ(second.identity().id, uuid);
}

TEST_F(SettingsManagerTest, IdentityKeyIsGeneratedOnceAndKept) {
    std::string privateKey;
    std::string publicKey;
    {
        SettingsManager first(configPath);
        std::string err;
        ASSERT_TRUE(first.load(err)) << err;
        privateKey = first.settings().identityKey;
        publicKey = first.identity().identityKey;
        EXPECT_EQ(privateKey.size(), 64u);
        EXPECT_EQ(publicKey.size(), 64u);
        EXPECT_NE(privateKey, publicKey);

        AppSettings changed = first.settings();
        changed.identityKey = std::string(64, 'a');
        ASSERT_TRUE(first.update(changed, err)) << err;
        EXPECT_EQ(first.settings().identityKey, privateKey);
    }

    SettingsManager second(configPath);
    std::string err;
    ASSERT_TRUE(second.load(err)) << err;
    EXPECT_EQ(second.settings().identityKey, privateKey);
    EXPECT_EQ(second.identity().identityKey, publicKey);
    EXPECT_FALSE(second.settings().transfer.encryptTransfers);
    EXPECT_FALSE(second.settings().transfer.compressChunks);
}

TEST_F(SettingsManagerTest, CorruptIdentityKeyIsReplaced) {
    writeConfig(R"({"device_uuid": "fixed-uuid", "identity_key": "not-hex"})");

    SettingsManager mgr(configPath);
    std::string err;
    ASSERT_TRUE(mgr.load(err)) << err;
    const std::string key = mgr.settings().identityKey;
    EXPECT_EQ(key.size(), 64u);
    EXPECT_EQ(readConfig().value("identity_key", ""), key);
}

TEST_F(SettingsManagerTest, InvalidJsonIsReplacedWithDefaults) {
    writeConfig("{ this is not json");

    SettingsManager mgr(configPath);
    std::string err;
    ASSERT_TRUE(mgr.load(err)) << err;
    EXPECT_FALSE(mgr.settings().deviceUuid.empty());

    const nlohmann::json onDisk = readConfig();
    ASSERT_TRUE(onDisk.is_object());
    EXPECT_EQ(onDisk.value("max_concurrent_tasks", 0), static_cast<int>(MAX_CONCURRENT_TRANSFERS));
}

TEST_F(SettingsManagerTest, OutOfRangeValuesAreClamped) {
    writeConfig(R"({
        "device_uuid": "fixed-uuid",
        "display_name": "Desk",
        "max_concurrent_tasks": 99,
        "max_chunk_size_kb": 0,
        "max_receive_file_size": -5,
        "max_total_receive_size": -1,
        "auto_cleanup_delay_seconds": 100000,
        "allow_unverified_networks": "yes"
    })");

    SettingsManager mgr(configPath);
    std::string err;
    ASSERT_TRUE(mgr.load(err)) << err;

    const AppSettings s = mgr.settings();
    EXPECT_EQ(s.deviceUuid, "fixed-uuid");
    EXPECT_EQ(s.displayName, "Desk");
    EXPECT_EQ(s.transfer.maxConcurrentTasks, MAX_CONCURRENT_TRANSFERS_LIMIT);
    EXPECT_EQ(s.transfer.maxChunkSizeKb, MIN_CHUNK_SIZE_KB);
    EXPECT_EQ(s.transfer.maxReceiveFileSize, DEFAULT_MAX_FILE_SIZE_BYTES);
    EXPECT_EQ(s.transfer.maxTotalReceiveSize, -1);
    EXPECT_EQ(s.transfer.autoCleanupDelaySeconds, 3600);
    // Wrong type falls back to the default
    EXPECT_FALSE(s.allowUnverifiedNetworks);

    // The corrected values are written back
    EXPECT_EQ(readConfig().value("max_concurrent_tasks", 0), static_cast<int>(MAX_CONCURRENT_TRANSFERS_LIMIT));
}

TEST_F(SettingsManagerTest, UpdateKeepsDeviceUuidAndPersists) {
    SettingsManager mgr(configPath);
    std::string err;
    ASSERT_TRUE(mgr.load(err)) << err;
    const std::string uuid = mgr.settings().deviceUuid;

    AppSettings changed = mgr.settings();
    changed.deviceUuid = "attempted-change";
    changed.displayName = std::string(MAX_DISPLAY_NAME + 10, 'd');
    changed.transfer.maxConcurrentTasks = 5;
    changed.transfer.autoCleanupCompleted = true;
    changed.transfer.encryptTransfers = true;
    changed.transfer.compressChunks = true;
    changed.autoAcceptTrustedScreenSharing = false;
    ASSERT_TRUE(mgr.update(changed, err)) << err;

    SettingsManager reloaded(configPath);
    ASSERT_TRUE(reloaded.load(err)) << err;
    const AppSettings s = reloaded.settings();
    EXPECT_EQ(s.deviceUuid, uuid);
    EXPECT_EQ(s.displayName.size(), MAX_DISPLAY_NAME);
    EXPECT_EQ(s.transfer.maxConcurrentTasks, 5u);
    EXPECT_TRUE(s.transfer.autoCleanupCompleted);
    EXPECT_TRUE(s.transfer.encryptTransfers);
    EXPECT_TRUE(s.transfer.compressChunks);
    EXPECT_FALSE(s.autoAcceptTrustedScreenSharing);
}

TEST_F(SettingsManagerTest, UnwritableLocationReportsError) {
    // A directory where the file should be makes the rename fail
    fs::create_directories(dir / "blocked" / "config.json");

    SettingsManager mgr(dir / "blocked" / "config.json");
    std::string err;
    EXPECT_FALSE(mgr.load(err));
    EXPECT_FALSE(err.empty());
}
