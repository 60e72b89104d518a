#include <gtest/gtest.h>

#include <cstdlib>
#include <filesystem>
#include <fstream>

#include "vmsandbox/core/errors.hpp"
#include "vmsandbox/core/sandbox_config.hpp"

using namespace vmsandbox::core;

namespace fs = std::filesystem;

namespace {

class ConfigFile : public ::testing::Test {
 protected:
  void SetUp() override {
    path_ = fs::temp_directory_path() /
            ("vmsandbox_config_" + std::string(::testing::UnitTest::GetInstance()->current_test_info()->name()) + ".json");
  }
  void TearDown() override {
    unsetenv("VMSANDBOX_GUEST_PASSWORD");
    std::error_code ec;
    fs::remove(path_, ec);
  }
  void Write(const std::string& content) {
    std::ofstream out(path_);
    out << content;
  }
  fs::path path_;
};

}  // namespace

TEST(SandboxConfiguration, DefaultsAreValid) {
  SandboxConfiguration config;
  EXPECT_NO_THROW(config.Validate());
  EXPECT_EQ(config.clean_snapshot, "CleanSnapshot1");
  EXPECT_EQ(config.workspace_root.String(), "/home/kali/SandboxAnalysis");
  EXPECT_EQ(config.default_timeout, std::chrono::seconds(100));
  EXPECT_EQ(config.start_mode, StartMode::HEADLESS);
}

TEST_F(ConfigFile, LoadsOverridesAndKeepsDefaults) {
  Write(R"({
    "vm_target": "/vms/lab/lab.vmx",
    "guest_user": "analyst",
    "guest_password": "pw",
    "timeout_seconds": 30,
    "start_mode": "interactive"
  })");
  auto config = SandboxConfiguration::LoadFromFile(path_);
  EXPECT_EQ(config.vm_target, "/vms/lab/lab.vmx");
  EXPECT_EQ(config.credentials.user, "analyst");
  EXPECT_EQ(config.credentials.password, "pw");
  EXPECT_EQ(config.default_timeout, std::chrono::seconds(30));
  EXPECT_EQ(config.start_mode, StartMode::INTERACTIVE);
  EXPECT_EQ(config.clean_snapshot, "CleanSnapshot1");
}

TEST_F(ConfigFile, EnvironmentPasswordWins) {
  Write(R"({"guest_password": "from-file"})");
  setenv("VMSANDBOX_GUEST_PASSWORD", "from-env", 1);
  EXPECT_EQ(SandboxConfiguration::LoadFromFile(path_).credentials.password, "from-env");
}

TEST_F(ConfigFile, MalformedFileIsConfigError) {
  Write("{ not json");
  EXPECT_THROW(SandboxConfiguration::LoadFromFile(path_), ConfigError);
  Write(R"({"start_mode": "fullscreen"})");
  EXPECT_THROW(SandboxConfiguration::LoadFromFile(path_), ConfigError);
}

TEST(SandboxConfiguration, MissingFileIsConfigError) {
  EXPECT_THROW(SandboxConfiguration::LoadFromFile("/nonexistent/vmsandbox.json"), ConfigError);
}

TEST(SandboxConfiguration, ValidateRejectsBadValues) {
  SandboxConfiguration config;
  config.workspace_root = GuestPath("relative/dir");
  EXPECT_THROW(config.Validate(), ConfigError);

  config = SandboxConfiguration();
  config.default_timeout = std::chrono::seconds(0);
  EXPECT_THROW(config.Validate(), ConfigError);

  config = SandboxConfiguration();
  config.vm_target.clear();
  EXPECT_THROW(config.Validate(), ConfigError);
}

TEST(SandboxConfigurationBuilder, BuildsAndValidates) {
  auto config = SandboxConfigurationBuilder()
      .WithTarget("/vms/x.vmx")
      .WithCredentials("root", "toor")
      .WithSnapshot("Base")
      .WithTimeout(std::chrono::seconds(5))
      .Build();
  EXPECT_EQ(config.vm_target, "/vms/x.vmx");
  EXPECT_EQ(config.credentials.password, "toor");
  EXPECT_EQ(config.clean_snapshot, "Base");

  EXPECT_THROW(SandboxConfigurationBuilder().WithSnapshot("").Build(), ConfigError);
}
