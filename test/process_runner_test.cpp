#include <gtest/gtest.h>

#include <thread>

#include "vmsandbox/control/process_runner.hpp"
#include "vmsandbox/core/cancellation.hpp"

using namespace vmsandbox::control;
using vmsandbox::core::CancellationToken;

namespace {

ProcessSpec Shell(const std::string& script, std::chrono::milliseconds timeout = std::chrono::seconds(10)) {
  ProcessSpec spec;
  spec.argv = {"/bin/sh", "-c", script};
  spec.timeout = timeout;
  return spec;
}

}  // namespace

TEST(ProcessRunner, CapturesOutputAndExitCode) {
  auto result = RunProcess(Shell("echo out; echo err >&2; exit 7"));
  EXPECT_FALSE(result.spawn_failed);
  EXPECT_FALSE(result.timed_out);
  EXPECT_EQ(result.exit_code, 7);
  EXPECT_EQ(result.stdout_output, "out\n");
  EXPECT_EQ(result.stderr_output, "err\n");
}

TEST(ProcessRunner, ArgumentsAreNotReinterpreted) {
  ProcessSpec spec;
  spec.argv = {"/bin/echo", "a b", "$HOME", "'q'"};
  auto result = RunProcess(spec);
  EXPECT_EQ(result.exit_code, 0);
  EXPECT_EQ(result.stdout_output, "a b $HOME 'q'\n");
}

TEST(ProcessRunner, TimeoutKillsChild) {
  auto start = std::chrono::steady_clock::now();
  auto result = RunProcess(Shell("sleep 30", std::chrono::milliseconds(300)));
  EXPECT_TRUE(result.timed_out);
  EXPECT_NE(result.exit_code, 0);
  EXPECT_LT(std::chrono::steady_clock::now() - start, std::chrono::seconds(10));
}

TEST(ProcessRunner, TimeoutKillsWholeProcessGroup) {
  // The grandchild inherits stdout; without a group kill the read loop would wait for it
  auto start = std::chrono::steady_clock::now();
  auto result = RunProcess(Shell("sleep 30 & sleep 30", std::chrono::milliseconds(300)));
  EXPECT_TRUE(result.timed_out);
  EXPECT_LT(std::chrono::steady_clock::now() - start, std::chrono::seconds(10));
}

TEST(ProcessRunner, CancelFromAnotherThread) {
  CancellationToken token;
  auto spec = Shell("sleep 30");
  spec.cancel = &token;
  std::thread canceller([&token] {
    std::this_thread::sleep_for(std::chrono::milliseconds(200));
    token.Cancel();
  });
  auto result = RunProcess(spec);
  canceller.join();
  EXPECT_TRUE(result.cancelled);
  EXPECT_FALSE(result.timed_out);
}

TEST(ProcessRunner, MissingProgramIsSpawnFailure) {
  ProcessSpec spec;
  spec.argv = {"/nonexistent/vmsandbox-binary"};
  auto result = RunProcess(spec);
  EXPECT_TRUE(result.spawn_failed);
  EXPECT_NE(result.error_message.find("/nonexistent/vmsandbox-binary"), std::string::npos);
}

TEST(ProcessRunner, EmptyArgvIsSpawnFailure) {
  EXPECT_TRUE(RunProcess(ProcessSpec{}).spawn_failed);
}

TEST(ProcessRunner, OutputIsCappedButDrained) {
  auto spec = Shell("head -c 100000 /dev/zero; echo done >&2");
  spec.max_output_bytes = 1024;
  auto result = RunProcess(spec);
  EXPECT_EQ(result.exit_code, 0);
  EXPECT_EQ(result.stdout_output.size(), 1024u);
  EXPECT_EQ(result.stderr_output, "done\n");
}

TEST(ProcessRunner, ConcurrentChildrenDoNotInheritPipes) {
  // Lists the descriptors of the shell itself
  const auto list_fds = Shell("ls /proc/$$/fd");
  auto baseline = RunProcess(list_fds);
  ASSERT_EQ(baseline.exit_code, 0);

  std::thread busy([] {
    auto result = RunProcess(Shell("sleep 1"));
    EXPECT_EQ(result.exit_code, 0);
  });
  std::this_thread::sleep_for(std::chrono::milliseconds(300));
  auto during = RunProcess(list_fds);
  busy.join();

  ASSERT_EQ(during.exit_code, 0);
  EXPECT_EQ(during.stdout_output, baseline.stdout_output);
}
