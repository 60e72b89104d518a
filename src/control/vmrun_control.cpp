/**
 * @file vmrun_control.cpp
 * @brief vmrun command construction and execution
 *
 * @date 2025
 */

#include "vmsandbox/control/vmrun_control.hpp"
#include "vmsandbox/control/process_runner.hpp"
#include "vmsandbox/core/errors.hpp"
#include "vmsandbox/utils/string_utils.hpp"

#include <spdlog/spdlog.h>

#include <regex>
#include <stdexcept>
#include <utility>

namespace vmsandbox {
namespace control {

using utils::StringUtils;

VmrunControl::VmrunControl(core::SandboxConfiguration config)
    : config_(std::move(config)) {
    spdlog::debug("vmrun control: binary={} host_type={} target={}",
                  config_.control_binary.string(), config_.host_type, config_.vm_target);
}

std::vector<std::string> VmrunControl::BuildArgv(const ControlCommand& command) const {
    std::vector<std::string> argv = {
        config_.control_binary.string(),
        "-T", config_.host_type,
        "-gu", config_.credentials.user,
        "-gp", config_.credentials.password,
        VerbName(command.verb)
    };

    // list is the only verb without a target
    if (command.verb != ControlVerb::LIST) {
        argv.push_back(config_.vm_target);
    }

    argv.insert(argv.end(), command.arguments.begin(), command.arguments.end());
    return argv;
}

std::string VmrunControl::DescribeCommand(const ControlCommand& command) const {
    return StringUtils::DescribeCommand(BuildArgv(command), config_.credentials.password);
}

bool VmrunControl::IsAvailable() const {
    ProcessSpec spec;
    spec.argv = {config_.control_binary.string()};
    spec.timeout = std::chrono::seconds(10);

    ProcessResult result = RunProcess(spec);
    if (result.spawn_failed) {
        spdlog::error("vmrun not found: {}", result.error_message);
        return false;
    }
    return true;
}

std::optional<int> VmrunControl::ParseGuestExitCode(const std::string& output) {
    static const std::regex kExitCodePattern(
        R"(Guest program exited with non-zero exit code:\s*(-?\d+))");

    std::smatch match;
    if (std::regex_search(output, match, kExitCodePattern)) {
        try {
            return std::stoi(match[1].str());
        } catch (const std::out_of_range&) {
            return std::nullopt;
        }
    }
    return std::nullopt;
}

ControlResult VmrunControl::Execute(const ControlCommand& command,
                                    std::chrono::seconds timeout,
                                    const core::CancellationToken* cancel) {
    const std::string& secret = config_.credentials.password;
    const std::string verb = VerbName(command.verb);

    spdlog::debug("Executing: {}", DescribeCommand(command));

    ProcessSpec spec;
    spec.argv = BuildArgv(command);
    spec.timeout = timeout;
    spec.cancel = cancel;

    ProcessResult process = RunProcess(spec);

    if (process.spawn_failed) {
        throw core::ControlError(
            "Cannot run " + config_.control_binary.string() + ": " +
                StringUtils::Redact(process.error_message, secret),
            verb);
    }
    if (process.cancelled) {
        throw core::CancelledError(verb + " aborted by cancellation");
    }
    if (process.timed_out) {
        throw core::TimeoutError(
            verb + " timed out after " + std::to_string(timeout.count()) + " seconds",
            verb, timeout);
    }

    ControlResult result;
    result.exit_code = process.exit_code;
    result.stdout_output = StringUtils::Redact(process.stdout_output, secret);
    result.stderr_output = StringUtils::Redact(process.stderr_output, secret);
    result.duration = process.duration;

    if (command.verb == ControlVerb::RUN_PROGRAM_IN_GUEST && result.exit_code != 0) {
        auto guest_code = ParseGuestExitCode(result.stdout_output + "\n" + result.stderr_output);
        if (guest_code) {
            result.exit_code = *guest_code;
        }
    }

    return result;
}

} // namespace control
} // namespace vmsandbox
