#include <gtest/gtest.h>

#include "fake_control.hpp"
#include "vmsandbox/core/errors.hpp"
#include "vmsandbox/core/execution_orchestrator.hpp"
#include "vmsandbox/core/guest_bridge.hpp"

using namespace vmsandbox::core;

namespace vmsandbox_test {
namespace {

using Argv = std::vector<std::string>;

const std::string kRoot = "/home/kali/SandboxAnalysis";

class OrchestratorTest : public ::testing::Test {
 protected:
  OrchestratorTest() : bridge_(control_, config_), orchestrator_(bridge_) {}

  void SetUp() override {
    control_.SetRunning(true);
    control_.AddGuestDirectory(kRoot);
  }

  RecordingControl control_;
  SandboxConfiguration config_;
  GuestBridge bridge_;
  ExecutionOrchestrator orchestrator_;
};

struct DispatchCase {
  std::string file;
  Argv expected;
};

class InterpretedDispatch : public OrchestratorTest,
                            public ::testing::WithParamInterface<DispatchCase> {};

TEST_P(InterpretedDispatch, RunsWithRuntime) {
  const auto& param = GetParam();
  control_.AddGuestFile(kRoot + "/" + param.file);
  orchestrator_.Execute(GuestPath(param.file), {"--flag"});
  auto programs = control_.GuestPrograms();
  ASSERT_FALSE(programs.empty());
  Argv expected = param.expected;
  expected.push_back("--flag");
  EXPECT_EQ(programs.back(), expected);
}

INSTANTIATE_TEST_SUITE_P(Runtimes, InterpretedDispatch, ::testing::Values(
    DispatchCase{"a.py", {"/usr/bin/python3", kRoot + "/a.py"}},
    DispatchCase{"a.js", {"/usr/bin/node", kRoot + "/a.js"}},
    DispatchCase{"a.sh", {"/usr/bin/bash", kRoot + "/a.sh"}},
    DispatchCase{"a.rb", {"/usr/bin/ruby", kRoot + "/a.rb"}},
    DispatchCase{"a.pl", {"/usr/bin/perl", kRoot + "/a.pl"}},
    DispatchCase{"a.php", {"/usr/bin/php", kRoot + "/a.php"}}));

TEST_F(OrchestratorTest, CompilesCBeforeRunning) {
  control_.AddGuestFile(kRoot + "/prog.c");
  auto outcome = orchestrator_.Execute(GuestPath("prog.c"));
  EXPECT_EQ(outcome.stage, ExecutionStage::COMPLETED);
  auto programs = control_.GuestPrograms();
  ASSERT_EQ(programs.size(), 2u);
  EXPECT_EQ(programs[0], (Argv{"/usr/bin/gcc", kRoot + "/prog.c", "-o", kRoot + "/prog_compiled"}));
  EXPECT_EQ(programs[1], (Argv{kRoot + "/prog_compiled"}));
}

TEST_F(OrchestratorTest, CompilesCppAndGo) {
  control_.AddGuestFile(kRoot + "/prog.cpp");
  control_.AddGuestFile(kRoot + "/tool.go");
  orchestrator_.Compile(GuestPath("prog.cpp"));
  orchestrator_.Compile(GuestPath("tool.go"));
  auto programs = control_.GuestPrograms();
  ASSERT_EQ(programs.size(), 2u);
  EXPECT_EQ(programs[0], (Argv{"/usr/bin/g++", kRoot + "/prog.cpp", "-o", kRoot + "/prog_compiled"}));
  EXPECT_EQ(programs[1], (Argv{"/usr/bin/go", "build", "-o", kRoot + "/tool_compiled", kRoot + "/tool.go"}));
}

TEST_F(OrchestratorTest, JavaRunsClassFromSourceDirectory) {
  control_.AddGuestFile(kRoot + "/Main.java");
  auto program = orchestrator_.Compile(GuestPath("Main.java"));
  EXPECT_TRUE(program.is_java_class);
  EXPECT_EQ(program.class_name, "Main");
  EXPECT_TRUE(control_.GuestFileExists(kRoot + "/Main.class"));
  EXPECT_EQ(program.launch_command, (Argv{"/usr/bin/java", "-cp", kRoot, "Main"}));

  control_.ClearLog();
  orchestrator_.Execute(GuestPath("Main.java"), {"x"});
  auto programs = control_.GuestPrograms();
  ASSERT_EQ(programs.size(), 2u);
  EXPECT_EQ(programs[0], (Argv{"/usr/bin/javac", kRoot + "/Main.java"}));
  EXPECT_EQ(programs[1], (Argv{"/usr/bin/java", "-cp", kRoot, "Main", "x"}));
}

TEST_F(OrchestratorTest, CompilerFailureIsCompileError) {
  control_.AddGuestFile(kRoot + "/broken.c");
  control_.ScriptProgram("/usr/bin/gcc", Script::Exit(1, "broken.c:3: error: expected ';'"));
  try {
    orchestrator_.Execute(GuestPath("broken.c"));
    FAIL() << "expected CompileError";
  } catch (const CompileError& e) {
    EXPECT_NE(e.CompilerOutput().find("expected ';'"), std::string::npos);
  }
  EXPECT_EQ(control_.GuestPrograms().size(), 1u);
}

TEST_F(OrchestratorTest, NonZeroExitIsExecutionError) {
  control_.AddGuestFile(kRoot + "/fail.py");
  control_.ScriptProgram("/usr/bin/python3", Script::Exit(2, "Traceback"));
  try {
    orchestrator_.Execute(GuestPath("fail.py"));
    FAIL() << "expected ExecutionError";
  } catch (const ExecutionError& e) {
    EXPECT_EQ(e.ExitCode(), 2);
    EXPECT_EQ(e.StderrOutput(), "Traceback");
  }
}

TEST_F(OrchestratorTest, DocumentsAndUnknownTypesIssueNothing) {
  EXPECT_THROW(orchestrator_.Execute(GuestPath("report.pdf")), UnsupportedTypeError);
  EXPECT_THROW(orchestrator_.Execute(GuestPath("blob.xyz")), UnsupportedTypeError);
  EXPECT_THROW(orchestrator_.TraceSyscalls(GuestPath("blob.xyz"), {}, "log.txt"), UnsupportedTypeError);
  EXPECT_THROW(orchestrator_.Compile(GuestPath("a.py")), UnsupportedTypeError);
  EXPECT_TRUE(control_.Commands().empty());
}

TEST_F(OrchestratorTest, TraceArgvLayout) {
  control_.AddGuestFile(kRoot + "/a.py");
  auto trace = orchestrator_.TraceSyscalls(GuestPath("a.py"), {"arg1"}, "analysis_log_1.txt");
  auto programs = control_.GuestPrograms();
  ASSERT_FALSE(programs.empty());
  EXPECT_EQ(programs.back(), (Argv{"/usr/bin/strace", "-f", "-o", kRoot + "/analysis_log_1.txt",
                                   "/usr/bin/python3", kRoot + "/a.py", "arg1"}));
  ASSERT_TRUE(trace.log_path.has_value());
  EXPECT_EQ(trace.log_path->String(), kRoot + "/analysis_log_1.txt");
  EXPECT_EQ(trace.outcome.stage, ExecutionStage::COMPLETED);
  EXPECT_EQ(trace.outcome.exit_code, 0);
  EXPECT_NE(control_.GuestFileContent(kRoot + "/analysis_log_1.txt").find("execve"), std::string::npos);
}

TEST_F(OrchestratorTest, TraceToleratesNonZeroExit) {
  control_.AddGuestFile(kRoot + "/a.py");
  control_.ScriptProgram("/usr/bin/python3", Script::Exit(1, "exit(1)"));
  TraceResult trace;
  ASSERT_NO_THROW(trace = orchestrator_.TraceSyscalls(GuestPath("a.py"), {}, "analysis_log_x.txt"));
  ASSERT_TRUE(trace.log_path.has_value());
  EXPECT_EQ(trace.outcome.exit_code, 1);
  EXPECT_EQ(trace.outcome.stage, ExecutionStage::COMPLETED);
}

TEST_F(OrchestratorTest, TraceTimeoutKeepsPartialLog) {
  control_.AddGuestFile(kRoot + "/slow.py");
  control_.ScriptProgram("/usr/bin/python3", Script::Timeout());
  auto trace = orchestrator_.TraceSyscalls(GuestPath("slow.py"), {}, "analysis_log_t.txt");
  EXPECT_EQ(trace.outcome.stage, ExecutionStage::FAILED);
  EXPECT_FALSE(trace.outcome.failure_reason.empty());
  ASSERT_TRUE(trace.log_path.has_value());
  EXPECT_TRUE(control_.GuestFileExists(kRoot + "/analysis_log_t.txt"));
}

TEST_F(OrchestratorTest, TraceLogNameIsConfinedToWorkspace) {
  control_.AddGuestFile(kRoot + "/a.py");
  auto trace = orchestrator_.TraceSyscalls(GuestPath("a.py"), {}, "/etc/evil.txt");
  ASSERT_TRUE(trace.log_path.has_value());
  EXPECT_EQ(trace.log_path->String(), kRoot + "/evil.txt");
}

TEST_F(OrchestratorTest, TraceCompileFailurePropagates) {
  control_.AddGuestFile(kRoot + "/broken.c");
  control_.ScriptProgram("/usr/bin/gcc", Script::Exit(1, "error"));
  EXPECT_THROW(orchestrator_.TraceSyscalls(GuestPath("broken.c"), {}, "log.txt"), CompileError);
  EXPECT_EQ(control_.CountProgram("/usr/bin/strace"), 0u);
}

TEST_F(OrchestratorTest, CustomTrackerWrapsTarget) {
  control_.AddGuestFile(kRoot + "/tracker.c");
  control_.AddGuestFile(kRoot + "/a.py");
  auto outcome = orchestrator_.RunCustomTracker(GuestPath("tracker.c"), GuestPath("a.py"), {"-v"});
  EXPECT_EQ(outcome.stage, ExecutionStage::COMPLETED);
  auto programs = control_.GuestPrograms();
  ASSERT_FALSE(programs.empty());
  EXPECT_EQ(programs.back(), (Argv{kRoot + "/tracker_compiled", "/usr/bin/python3", kRoot + "/a.py", "-v"}));
}

TEST_F(OrchestratorTest, CustomTrackerMustBeCompiled) {
  EXPECT_THROW(orchestrator_.RunCustomTracker(GuestPath("tracker.py"), GuestPath("a.py")), UnsupportedTypeError);
}

}  // namespace
}  // namespace vmsandbox_test
