/**
 * @file execution_orchestrator.cpp
 * @brief Compilation, strict execution and traced execution in the guest
 *
 * @date 2025
 */

#include "vmsandbox/core/execution_orchestrator.hpp"
#include "vmsandbox/core/errors.hpp"
#include "vmsandbox/utils/string_utils.hpp"

#include <spdlog/spdlog.h>

#include <type_traits>
#include <variant>

namespace vmsandbox {
namespace core {

using analyzers::ContentCategory;
using analyzers::ContentClassifier;
using analyzers::ContentProfile;
using control::ExitPolicy;

namespace {

const char* const kTouchBinary = "/usr/bin/touch";
const char* const kCompiledSuffix = "_compiled";

ExecutionOutcome OutcomeFrom(const control::ControlResult& result) {
    ExecutionOutcome outcome;
    outcome.stage = ExecutionStage::COMPLETED;
    outcome.exit_code = result.exit_code;
    outcome.stdout_output = result.stdout_output;
    outcome.stderr_output = result.stderr_output;
    outcome.duration = result.duration;
    return outcome;
}

std::vector<std::string> Concat(std::vector<std::string> head, const std::vector<std::string>& tail) {
    head.insert(head.end(), tail.begin(), tail.end());
    return head;
}

} // anonymous namespace

std::string ExecutionStageToString(ExecutionStage stage) {
    switch (stage) {
        case ExecutionStage::CLASSIFIED: return "classified";
        case ExecutionStage::COMPILING:  return "compiling";
        case ExecutionStage::RUNNING:    return "running";
        case ExecutionStage::COMPLETED:  return "completed";
        case ExecutionStage::FAILED:     return "failed";
    }
    return "failed";
}

ExecutionOrchestrator::ExecutionOrchestrator(GuestBridge& bridge)
    : bridge_(bridge) {}

// ============================================================================
// COMPILATION
// ============================================================================

CompiledProgram ExecutionOrchestrator::Compile(const GuestPath& source) {
    const GuestPath path = bridge_.Resolve(source);
    const ContentProfile profile = ContentClassifier::Classify(path);
    const auto* compiled = std::get_if<analyzers::Compiled>(&profile.toolchain);
    if (compiled == nullptr) {
        throw UnsupportedTypeError(profile.extension);
    }

    const std::string compiler = bridge_.Tool(compiled->compiler).String();
    CompiledProgram program;
    std::vector<std::string> argv;

    if (profile.extension == ".java") {
        // javac leaves <Class>.class next to the source
        program.is_java_class = true;
        program.class_name = path.Stem();
        program.artifact = path.Parent() / program.class_name;
        program.launch_command = {bridge_.Tool("java").String(), "-cp",
                                  path.Parent().String(), program.class_name};
        argv = {compiler, path.String()};
    } else if (profile.extension == ".go") {
        program.artifact = path.ReplaceExtension(kCompiledSuffix);
        program.launch_command = {program.artifact.String()};
        argv = {compiler, "build", "-o", program.artifact.String(), path.String()};
    } else {
        program.artifact = path.ReplaceExtension(kCompiledSuffix);
        program.launch_command = {program.artifact.String()};
        argv = {compiler, path.String(), "-o", program.artifact.String()};
    }

    spdlog::info("Compiling {} with {}", path.String(), compiled->compiler);
    try {
        bridge_.Run(argv, ExitPolicy::STRICT);
    }
    catch (const TimeoutError&) {
        throw;
    }
    catch (const ControlError& e) {
        throw CompileError("Compilation failed for " + path.String() + ": " + e.what(),
                           e.StderrOutput());
    }

    spdlog::info("✓ Compiled: {}", program.artifact.String());
    return program;
}

// ============================================================================
// EXECUTION
// ============================================================================

ExecutionOutcome ExecutionOrchestrator::Execute(const GuestPath& path,
                                                const std::vector<std::string>& args,
                                                std::optional<std::chrono::seconds> timeout) {
    const GuestPath target = bridge_.Resolve(path);
    const ContentProfile profile = RequireExecutable(target);

    const auto argv = Concat(PrepareLaunch(target, profile), args);
    spdlog::info("Executing {} with args: [{}]", target.String(), utils::StringUtils::Join(args, ", "));

    try {
        ExecutionOutcome outcome = OutcomeFrom(bridge_.Run(argv, ExitPolicy::STRICT, timeout));
        spdlog::info("✓ Execution completed");
        return outcome;
    }
    catch (const TimeoutError&) {
        throw;
    }
    catch (const ControlError& e) {
        throw ExecutionError("Execution failed for " + target.String() + ": " + e.what(),
                             e.ExitCode(), e.StderrOutput());
    }
}

TraceResult ExecutionOrchestrator::TraceSyscalls(const GuestPath& path,
                                                 const std::vector<std::string>& args,
                                                 const std::string& log_name,
                                                 std::optional<std::chrono::seconds> timeout) {
    const GuestPath target = bridge_.Resolve(path);
    const ContentProfile profile = RequireExecutable(target);

    const GuestPath& workspace = bridge_.Config().workspace_root;
    const GuestPath log_path = workspace / GuestPath(log_name).Filename();

    TraceResult trace;
    bool log_exists = false;

    try {
        bridge_.EnsureDirectory(workspace);
        bridge_.Run({kTouchBinary, log_path.String()}, ExitPolicy::STRICT);
        log_exists = true;
    }
    catch (const ControlError& e) {
        spdlog::warn("Could not prepare trace log {}: {}", log_path.String(), e.what());
    }

    // Compilation errors are not tracing failures; they propagate
    const auto launch = PrepareLaunch(target, profile);
    const auto argv = Concat(Concat({bridge_.Config().tracer_path.String(), "-f", "-o", log_path.String()},
                                    launch),
                             args);

    spdlog::info("Running syscall trace on {}, logging to {}", target.String(), log_path.String());
    try {
        trace.outcome = OutcomeFrom(bridge_.Run(argv, ExitPolicy::TOLERANT, timeout));
        trace.log_path = log_path;
        if (trace.outcome.exit_code != 0) {
            spdlog::info("Traced program exited with code {}", trace.outcome.exit_code);
        }
        spdlog::info("✓ Syscall trace completed");
        return trace;
    }
    catch (const ControlError& e) {
        spdlog::warn("Syscall trace encountered issues: {}", e.what());
        trace.outcome.stage = ExecutionStage::FAILED;
        trace.outcome.failure_reason = e.what();
    }

    // Whatever the tracer managed to write before the failure is still evidence
    try {
        log_exists = bridge_.PathExists(log_path);
    }
    catch (const ControlError& e) {
        spdlog::warn("Cannot confirm trace log {}: {}", log_path.String(), e.what());
    }

    if (log_exists) {
        trace.log_path = log_path;
    }
    return trace;
}

ExecutionOutcome ExecutionOrchestrator::RunCustomTracker(const GuestPath& tracker_source,
                                                         const GuestPath& target,
                                                         const std::vector<std::string>& args) {
    const CompiledProgram tracker = Compile(tracker_source);

    const GuestPath target_path = bridge_.Resolve(target);
    const ContentProfile profile = RequireExecutable(target_path);

    const auto argv = Concat(Concat(tracker.launch_command, PrepareLaunch(target_path, profile)), args);

    spdlog::info("Running tracker {} on {}", tracker.artifact.String(), target_path.String());
    try {
        ExecutionOutcome outcome = OutcomeFrom(bridge_.Run(argv, ExitPolicy::STRICT));
        spdlog::info("✓ Custom tracker execution completed");
        return outcome;
    }
    catch (const TimeoutError&) {
        throw;
    }
    catch (const ControlError& e) {
        throw ExecutionError("Custom tracker execution failed: " + std::string(e.what()),
                             e.ExitCode(), e.StderrOutput());
    }
}

// ============================================================================
// DISPATCH
// ============================================================================

ContentProfile ExecutionOrchestrator::RequireExecutable(const GuestPath& path) const {
    ContentProfile profile = ContentClassifier::Classify(path);
    const ContentCategory category = profile.Category();
    if (category != ContentCategory::INTERPRETED && category != ContentCategory::COMPILED) {
        spdlog::warn("Not executable: {} ({})", path.String(), ContentClassifier::CategoryToString(category));
        throw UnsupportedTypeError(profile.extension);
    }
    return profile;
}

std::vector<std::string> ExecutionOrchestrator::PrepareLaunch(const GuestPath& path,
                                                              const ContentProfile& profile) {
    return std::visit([&](const auto& tool) -> std::vector<std::string> {
        using T = std::decay_t<decltype(tool)>;
        if constexpr (std::is_same_v<T, analyzers::Interpreted>) {
            return {bridge_.Tool(tool.runtime).String(), path.String()};
        } else if constexpr (std::is_same_v<T, analyzers::Compiled>) {
            return Compile(path).launch_command;
        } else {
            throw UnsupportedTypeError(profile.extension);
        }
    }, profile.toolchain);
}

} // namespace core
} // namespace vmsandbox
