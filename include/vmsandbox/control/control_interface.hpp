/**
 * @file control_interface.hpp
 * @brief Opaque VM control surface used by the rest of the sandbox
 *
 * Every guest operation (power, snapshots, in-guest programs, file copies)
 * is one blocking control command with an explicit timeout. Backends only
 * implement Execute(); exit-code policy, timeout and cancellation checks
 * live here so that every backend (the vmrun utility, the recording fake in
 * the tests) behaves the same way.
 *
 * **Exit-code policies**:
 * - STRICT: non-zero exit raises ControlError
 * - TOLERANT: the exit code is returned to the caller as data
 *
 * Both policies raise TimeoutError on expiry and ControlError when the
 * command could not be issued at all.
 *
 * @date 2025
 */

#pragma once

#include <chrono>
#include <string>
#include <vector>

#include "vmsandbox/core/guest_path.hpp"
#include "vmsandbox/core/sandbox_config.hpp"

namespace vmsandbox {
namespace core {
class CancellationToken;
}

namespace control {

/**
 * @enum ControlVerb
 * @brief Commands understood by the control mechanism
 */
enum class ControlVerb {
    START,
    STOP,
    REVERT_TO_SNAPSHOT,
    SNAPSHOT,
    LIST,
    RUN_PROGRAM_IN_GUEST,
    COPY_FILE_FROM_HOST_TO_GUEST,
    COPY_FILE_FROM_GUEST_TO_HOST
};

/// Wire name of a verb ("revertToSnapshot", "runProgramInGuest", ...)
std::string VerbName(ControlVerb verb);

/**
 * @enum ExitPolicy
 * @brief How a non-zero exit code is treated
 */
enum class ExitPolicy {
    STRICT,
    TOLERANT
};

/**
 * @struct ControlCommand
 * @brief One control command, without target or credentials
 *
 * The backend adds the virtualization target and the guest credentials;
 * callers never handle them.
 */
struct ControlCommand {
    ControlVerb verb{ControlVerb::LIST};
    std::vector<std::string> arguments;   ///< Verb-specific arguments

    static ControlCommand Start(core::StartMode mode);
    static ControlCommand Stop(core::StopMode mode);
    static ControlCommand RevertToSnapshot(const std::string& snapshot);
    static ControlCommand Snapshot(const std::string& snapshot);
    static ControlCommand List();
    static ControlCommand RunProgramInGuest(const std::vector<std::string>& argv);
    static ControlCommand CopyFileFromHostToGuest(const core::HostPath& source, const core::GuestPath& dest);
    static ControlCommand CopyFileFromGuestToHost(const core::GuestPath& source, const core::HostPath& dest);
};

/**
 * @struct ControlResult
 * @brief Captured outcome of a completed control command
 */
struct ControlResult {
    int exit_code{0};                      ///< Exit code (guest program's code for runProgramInGuest)
    std::string stdout_output;             ///< Standard output
    std::string stderr_output;             ///< Standard error
    std::chrono::milliseconds duration{0}; ///< Wall-clock duration
};

/**
 * @class ControlInterface
 * @brief Abstract adapter over the external VM control mechanism
 *
 * **Thread Safety**: a single instance may be shared, but the guest is one
 * mutable resource; serialize sessions with core::SessionManager.
 */
class ControlInterface {
public:
    virtual ~ControlInterface() = default;

    /**
     * @brief Issue a command and apply an exit-code policy
     *
     * @param command Command to issue
     * @param policy STRICT or TOLERANT
     * @param timeout Wall-clock limit for this call
     * @param cancel Optional cancellation token; a raised token aborts the
     *        call (or prevents it from being issued)
     * @return Result of the completed command
     *
     * @throws core::TimeoutError if the command did not finish in time
     * @throws core::ControlError on transport failure, or on non-zero exit
     *         under STRICT
     * @throws core::CancelledError if @p cancel was raised
     */
    ControlResult Invoke(const ControlCommand& command,
                         ExitPolicy policy,
                         std::chrono::seconds timeout,
                         const core::CancellationToken* cancel = nullptr);

    ControlResult InvokeStrict(const ControlCommand& command,
                               std::chrono::seconds timeout,
                               const core::CancellationToken* cancel = nullptr) {
        return Invoke(command, ExitPolicy::STRICT, timeout, cancel);
    }

    ControlResult InvokeTolerant(const ControlCommand& command,
                                 std::chrono::seconds timeout,
                                 const core::CancellationToken* cancel = nullptr) {
        return Invoke(command, ExitPolicy::TOLERANT, timeout, cancel);
    }

    /// Identifier of the controlled guest, as reported by List()
    virtual std::string TargetIdentifier() const = 0;

protected:
    /**
     * @brief Run one command to completion
     *
     * Implementations return the exit code as data and throw only when the
     * command could not complete: TimeoutError, CancelledError, or
     * ControlError for transport failures.
     */
    virtual ControlResult Execute(const ControlCommand& command,
                                  std::chrono::seconds timeout,
                                  const core::CancellationToken* cancel) = 0;
};

} // namespace control
} // namespace vmsandbox
