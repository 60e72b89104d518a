#include <gtest/gtest.h>

#include "fake_control.hpp"
#include "vmsandbox/core/cancellation.hpp"
#include "vmsandbox/core/errors.hpp"

using namespace vmsandbox::control;
using namespace vmsandbox::core;

namespace vmsandbox_test {
namespace {

const std::chrono::seconds kTimeout(5);

TEST(ControlCommand, LifecycleArguments) {
  EXPECT_EQ(ControlCommand::Start(StartMode::HEADLESS).arguments, std::vector<std::string>{"nogui"});
  EXPECT_EQ(ControlCommand::Start(StartMode::INTERACTIVE).arguments, std::vector<std::string>{"gui"});
  EXPECT_EQ(ControlCommand::Stop(StopMode::HARD).arguments, std::vector<std::string>{"hard"});
  EXPECT_EQ(ControlCommand::Stop(StopMode::SOFT).arguments, std::vector<std::string>{"soft"});
  EXPECT_TRUE(ControlCommand::List().arguments.empty());
  auto copy = ControlCommand::CopyFileFromHostToGuest(HostPath("/tmp/a.py"), GuestPath("/home/kali/a.py"));
  EXPECT_EQ(copy.arguments, (std::vector<std::string>{"/tmp/a.py", "/home/kali/a.py"}));
  EXPECT_EQ(VerbName(ControlVerb::REVERT_TO_SNAPSHOT), "revertToSnapshot");
  EXPECT_EQ(VerbName(ControlVerb::COPY_FILE_FROM_GUEST_TO_HOST), "copyFileFromGuestToHost");
}

TEST(ControlInterface, StrictRaisesOnNonZeroExit) {
  RecordingControl control;
  control.SetRunning(true);
  control.ScriptProgram("/usr/bin/false", Script::Exit(3, "boom"));
  try {
    control.InvokeStrict(ControlCommand::RunProgramInGuest({"/usr/bin/false"}), kTimeout);
    FAIL() << "expected ControlError";
  } catch (const ControlError& e) {
    EXPECT_EQ(e.ExitCode(), 3);
    EXPECT_EQ(e.Verb(), "runProgramInGuest");
    EXPECT_EQ(e.StderrOutput(), "boom");
  }
}

TEST(ControlInterface, TolerantReturnsExitCode) {
  RecordingControl control;
  control.SetRunning(true);
  control.ScriptProgram("/usr/bin/false", Script::Exit(3, "boom"));
  auto result = control.InvokeTolerant(ControlCommand::RunProgramInGuest({"/usr/bin/false"}), kTimeout);
  EXPECT_EQ(result.exit_code, 3);
  EXPECT_EQ(result.stderr_output, "boom");
}

TEST(ControlInterface, TimeoutIsDistinctUnderBothPolicies) {
  RecordingControl control;
  control.ScriptVerb(ControlVerb::START, Script::Timeout());
  EXPECT_THROW(control.InvokeStrict(ControlCommand::Start(StartMode::HEADLESS), kTimeout), TimeoutError);
  EXPECT_THROW(control.InvokeTolerant(ControlCommand::Start(StartMode::HEADLESS), kTimeout), TimeoutError);
}

TEST(ControlInterface, TransportFailureIgnoresPolicy) {
  RecordingControl control;
  control.ScriptVerb(ControlVerb::LIST, Script::TransportFailure());
  EXPECT_THROW(control.InvokeTolerant(ControlCommand::List(), kTimeout), ControlError);
}

TEST(ControlInterface, RaisedTokenIssuesNothing) {
  RecordingControl control;
  CancellationToken token;
  token.Cancel();
  EXPECT_THROW(control.InvokeStrict(ControlCommand::List(), kTimeout, &token), CancelledError);
  EXPECT_TRUE(control.Commands().empty());
}

TEST(ControlInterface, TimeoutIsForwarded) {
  RecordingControl control;
  control.InvokeStrict(ControlCommand::List(), std::chrono::seconds(42));
  ASSERT_EQ(control.Commands().size(), 1u);
  EXPECT_EQ(control.Commands()[0].timeout, std::chrono::seconds(42));
}

}  // namespace
}  // namespace vmsandbox_test
