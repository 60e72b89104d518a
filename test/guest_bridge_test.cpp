#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>

#include "fake_control.hpp"
#include "vmsandbox/core/cancellation.hpp"
#include "vmsandbox/core/errors.hpp"
#include "vmsandbox/core/guest_bridge.hpp"

using namespace vmsandbox::core;
using vmsandbox::control::ExitPolicy;

namespace fs = std::filesystem;

namespace vmsandbox_test {
namespace {

class GuestBridgeTest : public ::testing::Test {
 protected:
  void SetUp() override {
    host_dir_ = fs::temp_directory_path() /
        ("vmsandbox_bridge_test_" + std::string(::testing::UnitTest::GetInstance()->current_test_info()->name()));
    fs::remove_all(host_dir_);
    fs::create_directories(host_dir_);
    control_.SetRunning(true);
  }
  void TearDown() override {
    std::error_code ec;
    fs::remove_all(host_dir_, ec);
  }
  fs::path HostFile(const std::string& name, const std::string& content) {
    fs::path path = host_dir_ / name;
    std::ofstream out(path);
    out << content;
    return path;
  }

  RecordingControl control_;
  SandboxConfiguration config_;
  fs::path host_dir_;
};

TEST_F(GuestBridgeTest, EnsureDirectoryCreatesOnce) {
  GuestBridge bridge(control_, config_);
  bridge.EnsureDirectory(config_.workspace_root);
  EXPECT_TRUE(control_.GuestDirectoryExists("/home/kali/SandboxAnalysis"));
  EXPECT_EQ(control_.CountProgram("/bin/mkdir"), 1u);

  bridge.EnsureDirectory(config_.workspace_root);
  EXPECT_EQ(control_.CountProgram("/bin/mkdir"), 1u);
  EXPECT_EQ(control_.CountProgram("/usr/bin/test"), 2u);
}

TEST_F(GuestBridgeTest, EnsureDirectoryToleratesConcurrentCreation) {
  control_.AddGuestDirectory("/home/kali/SandboxAnalysis");
  control_.ScriptProgram("/usr/bin/test", Script::Exit(1, "").Once());
  control_.ScriptProgram("/bin/mkdir", Script::Exit(1, "mkdir: cannot create directory: File exists"));
  GuestBridge bridge(control_, config_);
  EXPECT_NO_THROW(bridge.EnsureDirectory(config_.workspace_root));
}

TEST_F(GuestBridgeTest, EnsureDirectoryFailureIsControlError) {
  control_.ScriptProgram("/bin/mkdir", Script::Exit(1, "mkdir: Permission denied"));
  GuestBridge bridge(control_, config_);
  EXPECT_THROW(bridge.EnsureDirectory(GuestPath("/root/forbidden")), ControlError);
}

TEST_F(GuestBridgeTest, RelativePathsResolveAgainstWorkspace) {
  GuestBridge bridge(control_, config_);
  EXPECT_EQ(bridge.Resolve(GuestPath("sample.py")).String(), "/home/kali/SandboxAnalysis/sample.py");
  EXPECT_EQ(bridge.Resolve(GuestPath("/tmp/x")).String(), "/tmp/x");
  EXPECT_EQ(bridge.Tool("python3").String(), "/usr/bin/python3");
}

TEST_F(GuestBridgeTest, TransferToGuestUsesWorkspaceAndBasename) {
  auto host = HostFile("sample.py", "print('hi')\n");
  GuestBridge bridge(control_, config_);
  GuestPath dest = bridge.TransferToGuest(host);
  EXPECT_EQ(dest.String(), "/home/kali/SandboxAnalysis/sample.py");
  EXPECT_EQ(control_.GuestFileContent(dest.String()), "print('hi')\n");
}

TEST_F(GuestBridgeTest, MissingHostFileFailsWithoutGuestIo) {
  GuestBridge bridge(control_, config_);
  EXPECT_THROW(bridge.TransferToGuest(host_dir_ / "missing.py"), TransferError);
  EXPECT_TRUE(control_.Commands().empty());
}

TEST_F(GuestBridgeTest, CopyFailureIsTransferError) {
  auto host = HostFile("sample.py", "x");
  control_.ScriptVerb(vmsandbox::control::ControlVerb::COPY_FILE_FROM_HOST_TO_GUEST,
                      Script::Exit(255, "Error: A file was not found"));
  GuestBridge bridge(control_, config_);
  EXPECT_THROW(bridge.TransferToGuest(host), TransferError);
}

TEST_F(GuestBridgeTest, TransferFromGuestCreatesHostDirectories) {
  control_.AddGuestFile("/home/kali/SandboxAnalysis/log.txt", "trace");
  GuestBridge bridge(control_, config_);
  fs::path dest = host_dir_ / "nested" / "deeper" / "log.txt";
  bridge.TransferFromGuest(GuestPath("log.txt"), dest);
  std::ifstream in(dest);
  std::string content((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
  EXPECT_EQ(content, "trace");
}

TEST_F(GuestBridgeTest, TransferFromGuestMissingFile) {
  GuestBridge bridge(control_, config_);
  EXPECT_THROW(bridge.TransferFromGuest(GuestPath("absent.txt"), host_dir_ / "absent.txt"), TransferError);
}

TEST_F(GuestBridgeTest, StatusFollowsListOutput) {
  GuestBridge bridge(control_, config_);
  EXPECT_EQ(bridge.GetStatus(), GuestStatus::RUNNING);
  control_.SetRunning(false);
  EXPECT_EQ(bridge.GetStatus(), GuestStatus::STOPPED);
  control_.ScriptVerb(vmsandbox::control::ControlVerb::LIST, Script::TransportFailure());
  EXPECT_EQ(bridge.GetStatus(), GuestStatus::UNKNOWN);
  EXPECT_EQ(GuestStatusToString(GuestStatus::UNKNOWN), "Unknown");
}

TEST_F(GuestBridgeTest, HardStopAndRevertIgnoreCancellation) {
  CancellationToken token;
  token.Cancel();
  GuestBridge bridge(control_, config_, &token);
  EXPECT_THROW(bridge.Start(StartMode::HEADLESS), CancelledError);
  EXPECT_NO_THROW(bridge.Stop(StopMode::HARD));
  EXPECT_NO_THROW(bridge.RevertToClean());
  EXPECT_THROW(bridge.Run({"/usr/bin/true"}, ExitPolicy::TOLERANT), CancelledError);
}

TEST_F(GuestBridgeTest, RevertToNamedSnapshot) {
  GuestBridge bridge(control_, config_);
  bridge.CreateSnapshot("Baseline2");
  EXPECT_NO_THROW(bridge.RevertToClean(std::string("Baseline2")));
  EXPECT_THROW(bridge.RevertToClean(std::string("NoSuchSnapshot")), ControlError);
  auto commands = control_.Commands();
  EXPECT_EQ(commands.back().command.arguments, std::vector<std::string>{"NoSuchSnapshot"});
}

TEST_F(GuestBridgeTest, RunUsesTimeoutOverride) {
  GuestBridge bridge(control_, config_);
  bridge.Run({"/usr/bin/test", "-d", "/tmp"}, ExitPolicy::STRICT, std::chrono::seconds(7));
  EXPECT_EQ(control_.Commands().back().timeout, std::chrono::seconds(7));
  bridge.Run({"/usr/bin/test", "-d", "/tmp"}, ExitPolicy::STRICT);
  EXPECT_EQ(control_.Commands().back().timeout, config_.default_timeout);
}

}  // namespace
}  // namespace vmsandbox_test
