/**
 * @file guest_bridge.cpp
 * @brief Guest lifecycle, transfer and execution on top of the control interface
 *
 * @date 2025
 */

#include "vmsandbox/core/guest_bridge.hpp"
#include "vmsandbox/core/cancellation.hpp"
#include "vmsandbox/core/errors.hpp"
#include "vmsandbox/utils/string_utils.hpp"

#include <spdlog/spdlog.h>

#include <filesystem>
#include <system_error>

namespace vmsandbox {
namespace core {

namespace fs = std::filesystem;
using control::ControlCommand;
using control::ExitPolicy;

namespace {

const char* const kMkdirBinary = "/bin/mkdir";
const char* const kTestBinary = "/usr/bin/test";

} // anonymous namespace

std::string GuestStatusToString(GuestStatus status) {
    switch (status) {
        case GuestStatus::RUNNING: return "Running";
        case GuestStatus::STOPPED: return "Stopped";
        case GuestStatus::UNKNOWN: return "Unknown";
    }
    return "Unknown";
}

GuestBridge::GuestBridge(control::ControlInterface& control,
                         const SandboxConfiguration& config,
                         const CancellationToken* cancel)
    : control_(control)
    , config_(config)
    , cancel_(cancel) {}

// ============================================================================
// LIFECYCLE
// ============================================================================

void GuestBridge::Start(StartMode mode) {
    spdlog::info("Starting guest ({})", mode == StartMode::INTERACTIVE ? "gui" : "nogui");
    control_.InvokeStrict(ControlCommand::Start(mode), config_.default_timeout, cancel_);
    spdlog::info("✓ Guest started");
}

void GuestBridge::Stop(StopMode mode) {
    spdlog::info("Stopping guest ({})", mode == StopMode::HARD ? "hard" : "soft");
    // A hard stop is how a cancelled session regains control of the guest
    const CancellationToken* token = mode == StopMode::HARD ? nullptr : cancel_;
    control_.InvokeStrict(ControlCommand::Stop(mode), config_.default_timeout, token);
    spdlog::info("✓ Guest stopped");
}

void GuestBridge::RevertToClean(const std::optional<std::string>& snapshot) {
    const std::string& name = snapshot && !snapshot->empty() ? *snapshot : config_.clean_snapshot;
    spdlog::info("Reverting guest to snapshot: {}", name);
    control_.InvokeStrict(ControlCommand::RevertToSnapshot(name), config_.default_timeout, nullptr);
    spdlog::info("✓ Guest reverted to {}", name);
}

void GuestBridge::CreateSnapshot(const std::string& name) {
    spdlog::info("Creating snapshot: {}", name);
    control_.InvokeStrict(ControlCommand::Snapshot(name), config_.default_timeout, cancel_);
    spdlog::info("✓ Snapshot created: {}", name);
}

GuestStatus GuestBridge::GetStatus() {
    try {
        auto result = control_.InvokeStrict(ControlCommand::List(), config_.default_timeout, nullptr);
        if (utils::StringUtils::Contains(result.stdout_output, control_.TargetIdentifier())) {
            return GuestStatus::RUNNING;
        }
        return GuestStatus::STOPPED;
    }
    catch (const ControlError& e) {
        spdlog::warn("Cannot query guest status: {}", e.what());
        return GuestStatus::UNKNOWN;
    }
}

// ============================================================================
// FILESYSTEM
// ============================================================================

void GuestBridge::EnsureDirectory(const GuestPath& path) {
    const GuestPath dir = Resolve(path);
    spdlog::debug("Ensuring guest directory: {}", dir.String());

    if (Run({kTestBinary, "-d", dir.String()}, ExitPolicy::TOLERANT).exit_code == 0) {
        return;
    }

    try {
        Run({kMkdirBinary, "-p", dir.String()}, ExitPolicy::STRICT);
    }
    catch (const TimeoutError&) {
        throw;
    }
    catch (const ControlError& e) {
        // mkdir -p also fails when something raced us to it
        if (Run({kTestBinary, "-d", dir.String()}, ExitPolicy::TOLERANT).exit_code == 0) {
            spdlog::debug("Directory {} already exists", dir.String());
            return;
        }
        throw ControlError("Cannot create guest directory " + dir.String() + ": " + e.what(),
                           e.Verb(), e.ExitCode(), e.StderrOutput());
    }
}

bool GuestBridge::PathExists(const GuestPath& path) {
    return Run({kTestBinary, "-e", Resolve(path).String()}, ExitPolicy::TOLERANT).exit_code == 0;
}

GuestPath GuestBridge::TransferToGuest(const HostPath& host_file) {
    std::error_code ec;
    HostPath source = fs::absolute(host_file, ec);
    if (ec) {
        source = host_file;
    }

    if (!fs::is_regular_file(source, ec)) {
        throw TransferError("Source file not found: " + source.string());
    }

    const GuestPath dest = config_.workspace_root / GuestPath::FromHostName(source);
    EnsureDirectory(config_.workspace_root);

    spdlog::info("Copying {} to {}", source.string(), dest.String());
    try {
        control_.InvokeStrict(ControlCommand::CopyFileFromHostToGuest(source, dest),
                              config_.default_timeout, cancel_);
    }
    catch (const TimeoutError&) {
        throw;
    }
    catch (const ControlError& e) {
        throw TransferError("Copy to guest failed for " + source.string() + ": " + e.what());
    }

    spdlog::info("✓ File copied to guest");
    return dest;
}

void GuestBridge::TransferFromGuest(const GuestPath& guest_file, const HostPath& host_dest) {
    const GuestPath source = Resolve(guest_file);

    std::error_code ec;
    HostPath dest = fs::absolute(host_dest, ec);
    if (ec) {
        dest = host_dest;
    }

    if (dest.has_parent_path()) {
        fs::create_directories(dest.parent_path(), ec);
        if (ec) {
            throw TransferError("Cannot create host directory " + dest.parent_path().string() +
                                ": " + ec.message());
        }
    }

    spdlog::info("Copying {} to {}", source.String(), dest.string());
    try {
        control_.InvokeStrict(ControlCommand::CopyFileFromGuestToHost(source, dest),
                              config_.default_timeout, cancel_);
    }
    catch (const TimeoutError&) {
        throw;
    }
    catch (const ControlError& e) {
        throw TransferError("Copy from guest failed for " + source.String() + ": " + e.what());
    }

    spdlog::info("✓ File copied from guest");
}

// ============================================================================
// EXECUTION
// ============================================================================

control::ControlResult GuestBridge::Run(const std::vector<std::string>& argv,
                                        ExitPolicy policy,
                                        std::optional<std::chrono::seconds> timeout) {
    return control_.Invoke(ControlCommand::RunProgramInGuest(argv), policy,
                           EffectiveTimeout(timeout), cancel_);
}

// ============================================================================
// PATHS
// ============================================================================

GuestPath GuestBridge::Resolve(const GuestPath& path) const {
    return path.ResolveAgainst(config_.workspace_root);
}

GuestPath GuestBridge::Tool(const std::string& name) const {
    return config_.tool_directory / name;
}

std::chrono::seconds GuestBridge::EffectiveTimeout(std::optional<std::chrono::seconds> timeout) const {
    return timeout ? *timeout : config_.default_timeout;
}

} // namespace core
} // namespace vmsandbox
