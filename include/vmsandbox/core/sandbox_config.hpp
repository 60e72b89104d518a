/**
 * @file sandbox_config.hpp
 * @brief Immutable configuration of the analysis guest
 *
 * Identifies the guest (control target, credentials, clean snapshot,
 * workspace root) and the defaults every control call inherits. A session
 * copies the configuration when it opens and never mutates it.
 *
 * @date 2025
 */

#pragma once

#include <chrono>
#include <filesystem>
#include <string>
#include <utility>

#include "vmsandbox/core/guest_path.hpp"

namespace vmsandbox {
namespace core {

/**
 * @enum StartMode
 * @brief How the guest is powered on
 */
enum class StartMode {
    HEADLESS,     ///< No console window ("nogui")
    INTERACTIVE   ///< With console window ("gui")
};

/**
 * @enum StopMode
 * @brief How the guest is powered off
 */
enum class StopMode {
    SOFT,   ///< Guest OS shutdown
    HARD    ///< Immediate power-off
};

/**
 * @struct GuestCredentials
 * @brief Guest OS account used for in-guest operations
 *
 * The password must never be logged; use StringUtils::Redact() on anything
 * that may contain it.
 */
struct GuestCredentials {
    std::string user{"kali"};       ///< Guest user name
    std::string password{"kali"};   ///< Guest password (secret)
};

/**
 * @struct SandboxConfiguration
 * @brief Complete sandbox configuration
 */
struct SandboxConfiguration {
    // Guest Identity
    std::string vm_target{"kali-linux.vmx"};          ///< Control target (e.g. .vmx path)
    GuestCredentials credentials;                     ///< Guest account
    std::string clean_snapshot{"CleanSnapshot1"};     ///< Snapshot restored after every session
    GuestPath workspace_root{"/home/kali/SandboxAnalysis"};  ///< Guest-side working directory

    // Control Mechanism
    std::filesystem::path control_binary{"vmrun"};    ///< VM control utility
    std::string host_type{"ws"};                      ///< vmrun -T host type
    std::chrono::seconds default_timeout{100};        ///< Per-call timeout
    StartMode start_mode{StartMode::HEADLESS};        ///< Power-on mode for sessions

    // Guest Tooling
    GuestPath tool_directory{"/usr/bin"};             ///< Where runtimes and compilers live
    GuestPath tracer_path{"/usr/bin/strace"};         ///< Syscall tracer
    std::size_t document_sample_bytes{1000};          ///< Text sample size in document logs

    // Host Output
    std::filesystem::path results_directory{"./sandbox_results"};  ///< Retrieved artifacts and reports

    /**
     * @brief Load configuration from a JSON file
     *
     * Missing keys keep their defaults, unknown keys are ignored. When the
     * environment variable VMSANDBOX_GUEST_PASSWORD is set it overrides the
     * file's password.
     *
     * @param config_file Path to the JSON file
     * @return Parsed configuration (not yet validated)
     *
     * @throws ConfigError if the file cannot be read or is malformed
     */
    static SandboxConfiguration LoadFromFile(const std::filesystem::path& config_file);

    /**
     * @brief Check configuration invariants
     *
     * @throws ConfigError naming the first offending field
     */
    void Validate() const;
};

/**
 * @class SandboxConfigurationBuilder
 * @brief Fluent API for constructing sandbox configurations
 *
 * **Usage Example**:
 * @code
 * auto config = SandboxConfigurationBuilder()
 *     .WithTarget("/vms/kali/kali.vmx")
 *     .WithCredentials("kali", password)
 *     .WithSnapshot("CleanSnapshot1")
 *     .WithTimeout(std::chrono::seconds(120))
 *     .Build();
 * @endcode
 */
class SandboxConfigurationBuilder {
public:
    SandboxConfigurationBuilder() = default;
    explicit SandboxConfigurationBuilder(SandboxConfiguration base)
        : config_(std::move(base)) {}

    SandboxConfigurationBuilder& WithTarget(const std::string& target) {
        config_.vm_target = target;
        return *this;
    }

    SandboxConfigurationBuilder& WithCredentials(const std::string& user, const std::string& password) {
        config_.credentials.user = user;
        config_.credentials.password = password;
        return *this;
    }

    SandboxConfigurationBuilder& WithSnapshot(const std::string& snapshot) {
        config_.clean_snapshot = snapshot;
        return *this;
    }

    SandboxConfigurationBuilder& WithWorkspaceRoot(const std::string& root) {
        config_.workspace_root = GuestPath(root);
        return *this;
    }

    SandboxConfigurationBuilder& WithTimeout(std::chrono::seconds timeout) {
        config_.default_timeout = timeout;
        return *this;
    }

    SandboxConfigurationBuilder& WithControlBinary(const std::filesystem::path& binary) {
        config_.control_binary = binary;
        return *this;
    }

    SandboxConfigurationBuilder& WithStartMode(StartMode mode) {
        config_.start_mode = mode;
        return *this;
    }

    SandboxConfigurationBuilder& WithResultsDirectory(const std::filesystem::path& dir) {
        config_.results_directory = dir;
        return *this;
    }

    /**
     * @brief Build final configuration
     * @return Validated SandboxConfiguration
     * @throws ConfigError if the result is invalid
     */
    SandboxConfiguration Build() const {
        config_.Validate();
        return config_;
    }

private:
    SandboxConfiguration config_;
};

} // namespace core
} // namespace vmsandbox
