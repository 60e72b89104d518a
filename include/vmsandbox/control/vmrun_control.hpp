/**
 * @file vmrun_control.hpp
 * @brief ControlInterface backed by the VMware vmrun utility
 *
 * Every command becomes one vmrun invocation:
 * @code
 * vmrun -T <host_type> -gu <user> -gp <password> <verb> <target> [arguments...]
 * @endcode
 *
 * The command line is logged at debug level with the password replaced by
 * "<hidden>". For runProgramInGuest, vmrun reports the guest program's
 * non-zero status in its output; that code is returned as the command's
 * exit code.
 *
 * @date 2025
 */

#pragma once

#include <optional>
#include <string>
#include <vector>

#include "vmsandbox/control/control_interface.hpp"
#include "vmsandbox/core/sandbox_config.hpp"

namespace vmsandbox {
namespace control {

class VmrunControl : public ControlInterface {
public:
    explicit VmrunControl(core::SandboxConfiguration config);

    std::string TargetIdentifier() const override { return config_.vm_target; }

    /**
     * @brief Full vmrun argument vector for a command
     *
     * Contains the plain password; never log it, use DescribeCommand().
     */
    std::vector<std::string> BuildArgv(const ControlCommand& command) const;

    /// Loggable rendering of BuildArgv() with the password hidden
    std::string DescribeCommand(const ControlCommand& command) const;

    /**
     * @brief Check that the control utility can be launched at all
     * @return false if the binary is missing or not executable
     */
    bool IsAvailable() const;

    /**
     * @brief Extract the guest exit code from vmrun output
     *
     * Recognizes "Guest program exited with non-zero exit code: N".
     */
    static std::optional<int> ParseGuestExitCode(const std::string& output);

protected:
    ControlResult Execute(const ControlCommand& command,
                          std::chrono::seconds timeout,
                          const core::CancellationToken* cancel) override;

private:
    core::SandboxConfiguration config_;
};

} // namespace control
} // namespace vmsandbox
