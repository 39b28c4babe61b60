/**
 * @file test_config.cpp
 * @brief Unit tests for service configuration loading and saving
 */

#include <filesystem>
#include <fstream>
#include <gtest/gtest.h>
#include <p2plink/config.h>

using namespace p2plink;
namespace fs = std::filesystem;

class ConfigTest : public ::testing::Test {
protected:
  fs::path test_dir;
  fs::path config_path;

  void SetUp() override {
    test_dir = fs::temp_directory_path() / "p2plink_config_test";
    fs::remove_all(test_dir);
    fs::create_directories(test_dir);
    config_path = test_dir / "p2plink.conf";
  }

  void TearDown() override { fs::remove_all(test_dir); }

  void write_config(const std::string &text) {
    std::ofstream file(config_path);
    file << text;
  }
};

// ============================================================================
// Defaults and Validation
// ============================================================================

TEST(ServiceConfigTest, DefaultsAreValid) {
  P2pServiceConfig config;
  config.load_defaults();
  EXPECT_TRUE(config.validate().is_ok());
  EXPECT_EQ(config.default_group_owner_intent, kGroupOwnerIntentAuto);
  EXPECT_EQ(config.frequency_conflict_policy, FrequencyConflictPolicy::Ask);
  EXPECT_EQ(config.group_owner_address, "192.168.49.1");
  EXPECT_EQ(config.config_file_path.filename().string(), "p2plink.conf");
}

TEST(ServiceConfigTest, RejectsBadValues) {
  P2pServiceConfig config;
  config.load_defaults();

  config.group_creating_timeout_ms = 0;
  EXPECT_EQ(config.validate().error().code, ErrorCode::InvalidArgument);
  config.load_defaults();

  config.default_group_owner_intent = 16;
  EXPECT_EQ(config.validate().error().code, ErrorCode::InvalidGroupOwnerIntent);
  config.load_defaults();

  config.device_name = std::string(33, 'x');
  EXPECT_EQ(config.validate().error().code, ErrorCode::InvalidDeviceName);
}

TEST(ServiceConfigTest, PolicyNames) {
  EXPECT_STREQ(frequency_conflict_policy_name(FrequencyConflictPolicy::Never),
               "never");
  EXPECT_STREQ(
      frequency_conflict_policy_name(FrequencyConflictPolicy::AlwaysDropInfra),
      "always_drop_infra");
}

// ============================================================================
// File Handling
// ============================================================================

TEST_F(ConfigTest, MissingFileKeepsDefaults) {
  ConfigManager manager;
  ASSERT_TRUE(manager.init(config_path).is_ok());
  EXPECT_FALSE(fs::exists(config_path));

  auto config = manager.get();
  EXPECT_EQ(config.reject_wait_ms, 3000);
  EXPECT_EQ(config.config_file_path.string(), config_path.string());
}

TEST_F(ConfigTest, LoadsKeyValueFile) {
  write_config("# test settings\n"
               "device_name = Living Room\n"
               "\n"
               "reject_wait_ms = 500\n"
               "wait_for_peer_invite = yes\n"
               "frequency_conflict_policy = never\n"
               "client_ip_mode = link_local\n"
               "auto_accept_requests = true\n"
               "some_future_key = 42\n");

  ConfigManager manager;
  ASSERT_TRUE(manager.init(config_path).is_ok());

  auto config = manager.get();
  EXPECT_EQ(config.device_name, "Living Room");
  EXPECT_EQ(config.reject_wait_ms, 500);
  EXPECT_TRUE(config.wait_for_peer_invite_on_info_unavailable);
  EXPECT_EQ(config.frequency_conflict_policy, FrequencyConflictPolicy::Never);
  EXPECT_EQ(config.client_ip_mode, IpProvisioningMode::LinkLocal);
  EXPECT_TRUE(config.auto_accept_requests);
}

TEST_F(ConfigTest, ParseErrorFallsBackToDefaults) {
  write_config("reject_wait_ms = soon\n");

  ConfigManager manager;
  auto result = manager.init(config_path);
  ASSERT_TRUE(result.is_error());
  EXPECT_EQ(result.error().code, ErrorCode::ConfigReadError);
  EXPECT_EQ(manager.get().reject_wait_ms, 3000);
}

TEST_F(ConfigTest, MissingEqualsIsAnError) {
  write_config("device_name Living Room\n");

  ConfigManager manager;
  EXPECT_TRUE(manager.init(config_path).is_error());
}

TEST_F(ConfigTest, InvalidValuesRejectedOnLoad) {
  write_config("idle_shutdown_timeout_ms = -1\n");

  ConfigManager manager;
  auto result = manager.init(config_path);
  ASSERT_TRUE(result.is_error());
  EXPECT_EQ(result.error().code, ErrorCode::InvalidArgument);
}

TEST_F(ConfigTest, SaveAndReload) {
  {
    ConfigManager manager;
    ASSERT_TRUE(manager.init(config_path).is_ok());
    P2pServiceConfig config = manager.get();
    config.group_idle_time_s = 25;
    config.frequency_conflict_policy = FrequencyConflictPolicy::AlwaysDropInfra;
    ASSERT_TRUE(manager.set(config).is_ok());
    ASSERT_TRUE(manager.save().is_ok());
  }

  ConfigManager reloaded;
  ASSERT_TRUE(reloaded.init(config_path).is_ok());
  EXPECT_EQ(reloaded.get().group_idle_time_s, 25);
  EXPECT_EQ(reloaded.get().frequency_conflict_policy,
            FrequencyConflictPolicy::AlwaysDropInfra);
}

TEST_F(ConfigTest, SetValidates) {
  ConfigManager manager;
  ASSERT_TRUE(manager.init(config_path).is_ok());

  P2pServiceConfig config = manager.get();
  config.reject_wait_ms = 0;
  EXPECT_TRUE(manager.set(config).is_error());
  EXPECT_EQ(manager.get().reject_wait_ms, 3000);
}

// ============================================================================
// Individual Settings
// ============================================================================

TEST_F(ConfigTest, DeviceNamePersists) {
  ConfigManager manager;
  ASSERT_TRUE(manager.init(config_path).is_ok());

  EXPECT_EQ(manager.set_device_name("").error().code,
            ErrorCode::InvalidDeviceName);
  EXPECT_EQ(manager.set_device_name(std::string(33, 'a')).error().code,
            ErrorCode::InvalidDeviceName);

  ASSERT_TRUE(manager.set_device_name("Kitchen").is_ok());
  ASSERT_TRUE(fs::exists(config_path));

  ConfigManager reloaded;
  ASSERT_TRUE(reloaded.init(config_path).is_ok());
  EXPECT_EQ(reloaded.get().device_name, "Kitchen");
}

TEST_F(ConfigTest, PendingFactoryResetPersists) {
  ConfigManager manager;
  ASSERT_TRUE(manager.init(config_path).is_ok());
  ASSERT_TRUE(manager.set_pending_factory_reset(true).is_ok());

  ConfigManager reloaded;
  ASSERT_TRUE(reloaded.init(config_path).is_ok());
  EXPECT_TRUE(reloaded.get().pending_factory_reset);

  reloaded.reset_defaults();
  EXPECT_FALSE(reloaded.get().pending_factory_reset);
}
