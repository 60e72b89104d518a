/**
 * @file errors.hpp
 * @brief Exception taxonomy for sandbox orchestration failures
 *
 * Every failure surfaced by the orchestrator derives from SandboxError so
 * callers can catch the whole family at once, or branch on the concrete
 * kind (a hung guest is a TimeoutError, a guest command that exited
 * non-zero is a plain ControlError).
 *
 * Messages never contain guest credentials.
 *
 * @date 2025
 */

#pragma once

#include <chrono>
#include <stdexcept>
#include <string>
#include <utility>

namespace vmsandbox {
namespace core {

/**
 * @class SandboxError
 * @brief Root of all sandbox orchestration errors
 */
class SandboxError : public std::runtime_error {
public:
    explicit SandboxError(const std::string& message)
        : std::runtime_error(message) {}
};

/**
 * @class ControlError
 * @brief The VM control mechanism failed or a strict command exited non-zero
 */
class ControlError : public SandboxError {
public:
    ControlError(const std::string& message,
                 std::string verb = {},
                 int exit_code = -1,
                 std::string stderr_output = {})
        : SandboxError(message)
        , verb_(std::move(verb))
        , exit_code_(exit_code)
        , stderr_output_(std::move(stderr_output)) {}

    const std::string& Verb() const { return verb_; }
    int ExitCode() const { return exit_code_; }
    const std::string& StderrOutput() const { return stderr_output_; }

private:
    std::string verb_;           ///< Control verb that failed (e.g. "runProgramInGuest")
    int exit_code_;              ///< Exit code, -1 when the command never completed
    std::string stderr_output_;  ///< Captured error output
};

/**
 * @class TimeoutError
 * @brief A control command did not complete within its timeout
 */
class TimeoutError : public ControlError {
public:
    TimeoutError(const std::string& message,
                 std::string verb,
                 std::chrono::seconds timeout)
        : ControlError(message, std::move(verb))
        , timeout_(timeout) {}

    std::chrono::seconds Timeout() const { return timeout_; }

private:
    std::chrono::seconds timeout_;
};

/**
 * @class TransferError
 * @brief Copying a file across the host/guest boundary failed
 */
class TransferError : public SandboxError {
public:
    explicit TransferError(const std::string& message)
        : SandboxError(message) {}
};

/**
 * @class CompileError
 * @brief Compiling a submitted source file inside the guest failed
 */
class CompileError : public SandboxError {
public:
    CompileError(const std::string& message, std::string compiler_output)
        : SandboxError(message)
        , compiler_output_(std::move(compiler_output)) {}

    const std::string& CompilerOutput() const { return compiler_output_; }

private:
    std::string compiler_output_;
};

/**
 * @class ExecutionError
 * @brief Strict execution of a program in the guest failed
 */
class ExecutionError : public SandboxError {
public:
    ExecutionError(const std::string& message,
                   int exit_code = -1,
                   std::string stderr_output = {})
        : SandboxError(message)
        , exit_code_(exit_code)
        , stderr_output_(std::move(stderr_output)) {}

    int ExitCode() const { return exit_code_; }
    const std::string& StderrOutput() const { return stderr_output_; }

private:
    int exit_code_;
    std::string stderr_output_;
};

/**
 * @class UnsupportedTypeError
 * @brief The content classifier has no profile for this file
 *
 * Raised before any guest I/O takes place.
 */
class UnsupportedTypeError : public SandboxError {
public:
    explicit UnsupportedTypeError(const std::string& extension)
        : SandboxError("Unsupported file type: " + (extension.empty() ? std::string("<none>") : extension))
        , extension_(extension) {}

    const std::string& Extension() const { return extension_; }

private:
    std::string extension_;
};

/**
 * @class CancelledError
 * @brief The session's cancellation signal was raised
 */
class CancelledError : public SandboxError {
public:
    explicit CancelledError(const std::string& message = "Sandbox session cancelled")
        : SandboxError(message) {}
};

/**
 * @class SessionBusyError
 * @brief Another sandbox session already holds the guest
 */
class SessionBusyError : public SandboxError {
public:
    explicit SessionBusyError(const std::string& message = "A sandbox session is already active")
        : SandboxError(message) {}
};

/**
 * @class ConfigError
 * @brief Sandbox configuration is invalid or unreadable
 */
class ConfigError : public SandboxError {
public:
    explicit ConfigError(const std::string& message)
        : SandboxError(message) {}
};

} // namespace core
} // namespace vmsandbox
