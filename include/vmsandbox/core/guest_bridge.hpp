/**
 * @file guest_bridge.hpp
 * @brief Guest lifecycle, file transfer and in-guest command execution
 *
 * Thin layer over the control interface that knows about the workspace
 * root and guest tool locations. Every call is synchronous; the per-call
 * timeout defaults to SandboxConfiguration::default_timeout.
 *
 * **Cancellation**: when a token is attached, every guest call except
 * Stop(HARD) and RevertToClean() is aborted once the token fires. Those two
 * are the cleanup path and must still reach the guest after cancellation.
 *
 * @date 2025
 */

#pragma once

#include <chrono>
#include <optional>
#include <string>
#include <vector>

#include "vmsandbox/control/control_interface.hpp"
#include "vmsandbox/core/guest_path.hpp"
#include "vmsandbox/core/sandbox_config.hpp"

namespace vmsandbox {
namespace core {

class CancellationToken;

/**
 * @enum GuestStatus
 * @brief Power state as reported by the control mechanism
 */
enum class GuestStatus {
    RUNNING,
    STOPPED,
    UNKNOWN    ///< The list command itself failed
};

std::string GuestStatusToString(GuestStatus status);

class GuestBridge {
public:
    /**
     * @brief Create bridge
     * @param control Control interface; must outlive the bridge
     * @param config Sandbox configuration; must outlive the bridge
     * @param cancel Optional cancellation token; must outlive the bridge
     */
    GuestBridge(control::ControlInterface& control,
                const SandboxConfiguration& config,
                const CancellationToken* cancel = nullptr);

    // ========================================================================
    // Lifecycle
    // ========================================================================

    /// Power on. Starting an already-running guest may fail.
    void Start(StartMode mode);

    void Stop(StopMode mode);

    /**
     * @brief Restore a snapshot
     * @param snapshot Snapshot name; the configured clean snapshot if empty
     */
    void RevertToClean(const std::optional<std::string>& snapshot = std::nullopt);

    void CreateSnapshot(const std::string& name);

    /**
     * @brief Query power state via the list command
     *
     * Never throws for control failures; reports UNKNOWN instead.
     */
    GuestStatus GetStatus();

    // ========================================================================
    // Filesystem
    // ========================================================================

    /**
     * @brief Make sure a guest directory exists
     *
     * Postcondition: the directory exists on return. Probes with `test -d`
     * first and only creates it when missing; a failed `mkdir -p` is
     * accepted when the directory turns out to exist after all.
     *
     * @throws ControlError if the directory cannot be created
     */
    void EnsureDirectory(const GuestPath& path);

    /// True if @p path exists in the guest (`test -e`)
    bool PathExists(const GuestPath& path);

    /**
     * @brief Copy a host file into the workspace root
     *
     * @param host_file Existing host file
     * @return workspace_root/basename(host_file)
     *
     * @throws TransferError if the host file does not exist (no guest I/O
     *         happens) or the copy fails
     */
    GuestPath TransferToGuest(const HostPath& host_file);

    /**
     * @brief Copy a guest file to the host
     *
     * Relative guest paths resolve against the workspace root. The host
     * destination's parent directory is created first.
     *
     * @throws TransferError if the guest source is unreachable
     */
    void TransferFromGuest(const GuestPath& guest_file, const HostPath& host_dest);

    // ========================================================================
    // Execution
    // ========================================================================

    /**
     * @brief Run a program inside the guest
     *
     * @param argv Program and arguments; argv[0] is an absolute guest path
     * @param policy STRICT raises ControlError on non-zero exit
     * @param timeout Per-call override of the default timeout
     */
    control::ControlResult Run(const std::vector<std::string>& argv,
                               control::ExitPolicy policy,
                               std::optional<std::chrono::seconds> timeout = std::nullopt);

    // ========================================================================
    // Paths
    // ========================================================================

    /// Resolve a relative guest path against the workspace root
    GuestPath Resolve(const GuestPath& path) const;

    /// Absolute guest path of a tool in the configured tool directory
    GuestPath Tool(const std::string& name) const;

    const SandboxConfiguration& Config() const { return config_; }

private:
    std::chrono::seconds EffectiveTimeout(std::optional<std::chrono::seconds> timeout) const;

    control::ControlInterface& control_;
    const SandboxConfiguration& config_;
    const CancellationToken* cancel_;
};

} // namespace core
} // namespace vmsandbox
