/**
 * @file control_interface.cpp
 * @brief Command construction and exit-code policy for the control surface
 *
 * @date 2025
 */

#include "vmsandbox/control/control_interface.hpp"
#include "vmsandbox/core/cancellation.hpp"
#include "vmsandbox/core/errors.hpp"
#include "vmsandbox/utils/string_utils.hpp"

#include <spdlog/spdlog.h>

namespace vmsandbox {
namespace control {

std::string VerbName(ControlVerb verb) {
    switch (verb) {
        case ControlVerb::START:                        return "start";
        case ControlVerb::STOP:                         return "stop";
        case ControlVerb::REVERT_TO_SNAPSHOT:           return "revertToSnapshot";
        case ControlVerb::SNAPSHOT:                     return "snapshot";
        case ControlVerb::LIST:                         return "list";
        case ControlVerb::RUN_PROGRAM_IN_GUEST:         return "runProgramInGuest";
        case ControlVerb::COPY_FILE_FROM_HOST_TO_GUEST: return "copyFileFromHostToGuest";
        case ControlVerb::COPY_FILE_FROM_GUEST_TO_HOST: return "copyFileFromGuestToHost";
    }
    return "unknown";
}

// ============================================================================
// COMMAND CONSTRUCTION
// ============================================================================

ControlCommand ControlCommand::Start(core::StartMode mode) {
    return {ControlVerb::START, {mode == core::StartMode::INTERACTIVE ? "gui" : "nogui"}};
}

ControlCommand ControlCommand::Stop(core::StopMode mode) {
    return {ControlVerb::STOP, {mode == core::StopMode::HARD ? "hard" : "soft"}};
}

ControlCommand ControlCommand::RevertToSnapshot(const std::string& snapshot) {
    return {ControlVerb::REVERT_TO_SNAPSHOT, {snapshot}};
}

ControlCommand ControlCommand::Snapshot(const std::string& snapshot) {
    return {ControlVerb::SNAPSHOT, {snapshot}};
}

ControlCommand ControlCommand::List() {
    return {ControlVerb::LIST, {}};
}

ControlCommand ControlCommand::RunProgramInGuest(const std::vector<std::string>& argv) {
    return {ControlVerb::RUN_PROGRAM_IN_GUEST, argv};
}

ControlCommand ControlCommand::CopyFileFromHostToGuest(const core::HostPath& source,
                                                       const core::GuestPath& dest) {
    return {ControlVerb::COPY_FILE_FROM_HOST_TO_GUEST, {source.string(), dest.String()}};
}

ControlCommand ControlCommand::CopyFileFromGuestToHost(const core::GuestPath& source,
                                                       const core::HostPath& dest) {
    return {ControlVerb::COPY_FILE_FROM_GUEST_TO_HOST, {source.String(), dest.string()}};
}

// ============================================================================
// POLICY
// ============================================================================

ControlResult ControlInterface::Invoke(const ControlCommand& command,
                                       ExitPolicy policy,
                                       std::chrono::seconds timeout,
                                       const core::CancellationToken* cancel) {
    if (cancel != nullptr) {
        cancel->ThrowIfCancelled();
    }

    const std::string verb = VerbName(command.verb);
    ControlResult result = Execute(command, timeout, cancel);

    if (!result.stdout_output.empty()) {
        spdlog::debug("STDOUT: {}", utils::StringUtils::Trim(result.stdout_output));
    }
    if (!result.stderr_output.empty()) {
        spdlog::debug("STDERR: {}", utils::StringUtils::Trim(result.stderr_output));
    }

    if (result.exit_code != 0) {
        if (policy == ExitPolicy::STRICT) {
            std::string detail = utils::StringUtils::Trim(
                !result.stderr_output.empty() ? result.stderr_output : result.stdout_output);
            throw core::ControlError(
                verb + " failed with exit code " + std::to_string(result.exit_code) +
                    (detail.empty() ? "" : ": " + detail),
                verb, result.exit_code, result.stderr_output);
        }
        spdlog::debug("{} exited with {} (tolerated)", verb, result.exit_code);
    }

    return result;
}

} // namespace control
} // namespace vmsandbox
