/**
 * @file execution_orchestrator.hpp
 * @brief Compile, run and syscall-trace submitted content inside the guest
 *
 * Per request the orchestrator moves through
 * CLASSIFIED -> (COMPILING) -> RUNNING -> COMPLETED | FAILED.
 *
 * **Dispatch** (tools resolved under SandboxConfiguration::tool_directory):
 * - Interpreted: `runtime <file> args...`
 * - Compiled C/C++/Go: compile to `<stem>_compiled`, run it with args
 * - Compiled Java: `javac <file>`, then `java -cp <dir> <Class> args...`
 * - Document / Unsupported: UnsupportedTypeError before any guest I/O
 *
 * **Tracing vs. execution**: Execute() is strict, a non-zero exit is an
 * ExecutionError. TraceSyscalls() is tolerant, the traced program's exit
 * code is analysis data and only transport or timeout failures are reported
 * (as warnings, never thrown).
 *
 * @date 2025
 */

#pragma once

#include <chrono>
#include <optional>
#include <string>
#include <vector>

#include "vmsandbox/analyzers/content_classifier.hpp"
#include "vmsandbox/core/guest_bridge.hpp"
#include "vmsandbox/core/guest_path.hpp"

namespace vmsandbox {
namespace core {

/**
 * @enum ExecutionStage
 * @brief Where a request ended up
 */
enum class ExecutionStage {
    CLASSIFIED,
    COMPILING,
    RUNNING,
    COMPLETED,   ///< Program ran to completion (any exit code when traced)
    FAILED       ///< Program did not complete (transport failure or timeout)
};

std::string ExecutionStageToString(ExecutionStage stage);

/**
 * @struct CompiledProgram
 * @brief Result of compiling a source file in the guest
 *
 * For Java the artifact is the class name, not a runnable file; use
 * launch_command, which already carries the runtime invocation.
 */
struct CompiledProgram {
    GuestPath artifact;                      ///< Binary path, or the class file's directory + stem for Java
    std::vector<std::string> launch_command; ///< Argv that runs the program (without user args)
    bool is_java_class{false};
    std::string class_name;                  ///< Java class name when is_java_class
};

/**
 * @struct ExecutionOutcome
 * @brief What happened when a program ran in the guest
 */
struct ExecutionOutcome {
    ExecutionStage stage{ExecutionStage::CLASSIFIED};
    int exit_code{-1};                       ///< Program exit code, -1 if it never completed
    std::string stdout_output;               ///< Control-utility output
    std::string stderr_output;
    std::chrono::milliseconds duration{0};
    std::string failure_reason;              ///< Set when stage is FAILED
};

/**
 * @struct TraceResult
 * @brief Syscall trace log location and the traced program's outcome
 */
struct TraceResult {
    std::optional<GuestPath> log_path;   ///< Absent when no usable trace exists
    ExecutionOutcome outcome;
};

class ExecutionOrchestrator {
public:
    /// @param bridge Guest bridge; must outlive the orchestrator
    explicit ExecutionOrchestrator(GuestBridge& bridge);

    /**
     * @brief Compile a source file in the guest
     *
     * @throws UnsupportedTypeError if the file is not a compiled type
     * @throws CompileError wrapping the compiler's stderr on failure
     */
    CompiledProgram Compile(const GuestPath& source);

    /**
     * @brief Run a program strictly
     *
     * Compiles first when needed.
     *
     * @throws UnsupportedTypeError for documents and unknown types (no guest I/O)
     * @throws CompileError, ExecutionError, TimeoutError
     */
    ExecutionOutcome Execute(const GuestPath& path,
                             const std::vector<std::string>& args = {},
                             std::optional<std::chrono::seconds> timeout = std::nullopt);

    /**
     * @brief Run a program under the syscall tracer
     *
     * Builds `tracer -f -o <workspace>/<log_name> <dispatch> args...`. The log
     * is touched before the run so it exists even if the program never
     * starts. Transport failures and timeouts are logged as warnings; the
     * log path is still returned when the log exists.
     *
     * @throws UnsupportedTypeError for documents and unknown types (no guest I/O)
     * @throws CompileError if compilation fails
     * @throws CancelledError if the session was cancelled
     */
    TraceResult TraceSyscalls(const GuestPath& path,
                              const std::vector<std::string>& args,
                              const std::string& log_name,
                              std::optional<std::chrono::seconds> timeout = std::nullopt);

    /**
     * @brief Compile a tracker program and run the target under it
     *
     * Runs `<tracker> <dispatch of target> args...` strictly.
     *
     * @throws UnsupportedTypeError, CompileError, ExecutionError
     */
    ExecutionOutcome RunCustomTracker(const GuestPath& tracker_source,
                                      const GuestPath& target,
                                      const std::vector<std::string>& args = {});

private:
    analyzers::ContentProfile RequireExecutable(const GuestPath& path) const;
    std::vector<std::string> PrepareLaunch(const GuestPath& path,
                                           const analyzers::ContentProfile& profile);

    GuestBridge& bridge_;
};

} // namespace core
} // namespace vmsandbox
