/**
 * @file sandbox_config.cpp
 * @brief JSON loading and validation of the sandbox configuration
 *
 * **File Format**:
 * ```
 * {
 *   "vm_target": "/vms/kali/kali-linux-2025.2-vmware-amd64.vmx",
 *   "guest_user": "kali",
 *   "guest_password": "kali",
 *   "clean_snapshot": "CleanSnapshot1",
 *   "workspace_root": "/home/kali/SandboxAnalysis",
 *   "timeout_seconds": 100,
 *   "control_binary": "vmrun",
 *   "host_type": "ws",
 *   "start_mode": "headless",
 *   "tool_directory": "/usr/bin",
 *   "tracer_path": "/usr/bin/strace",
 *   "document_sample_bytes": 1000,
 *   "results_directory": "./sandbox_results"
 * }
 * ```
 *
 * @date 2025
 */

#include "vmsandbox/core/sandbox_config.hpp"
#include "vmsandbox/core/errors.hpp"

#include <spdlog/spdlog.h>
#include <nlohmann/json.hpp>

#include <cstdlib>
#include <fstream>

using json = nlohmann::json;

namespace vmsandbox {
namespace core {

SandboxConfiguration SandboxConfiguration::LoadFromFile(const std::filesystem::path& config_file) {
    std::ifstream file(config_file);
    if (!file.is_open()) {
        throw ConfigError("Cannot open configuration file: " + config_file.string());
    }

    SandboxConfiguration config;

    try {
        json j = json::parse(file);

        config.vm_target = j.value("vm_target", config.vm_target);
        config.credentials.user = j.value("guest_user", config.credentials.user);
        config.credentials.password = j.value("guest_password", config.credentials.password);
        config.clean_snapshot = j.value("clean_snapshot", config.clean_snapshot);
        config.workspace_root = GuestPath(j.value("workspace_root", config.workspace_root.String()));
        config.default_timeout = std::chrono::seconds(
            j.value("timeout_seconds", static_cast<long long>(config.default_timeout.count())));
        config.control_binary = j.value("control_binary", config.control_binary.string());
        config.host_type = j.value("host_type", config.host_type);
        config.tool_directory = GuestPath(j.value("tool_directory", config.tool_directory.String()));
        config.tracer_path = GuestPath(j.value("tracer_path", config.tracer_path.String()));
        config.document_sample_bytes = j.value("document_sample_bytes", config.document_sample_bytes);
        config.results_directory = j.value("results_directory", config.results_directory.string());

        std::string mode = j.value("start_mode", std::string("headless"));
        if (mode == "headless") {
            config.start_mode = StartMode::HEADLESS;
        } else if (mode == "interactive") {
            config.start_mode = StartMode::INTERACTIVE;
        } else {
            throw ConfigError("Invalid start_mode '" + mode + "' (expected headless or interactive)");
        }
    }
    catch (const json::exception& e) {
        throw ConfigError("Malformed configuration file " + config_file.string() + ": " + e.what());
    }

    if (const char* password = std::getenv("VMSANDBOX_GUEST_PASSWORD")) {
        config.credentials.password = password;
        spdlog::debug("Guest password taken from VMSANDBOX_GUEST_PASSWORD");
    }

    spdlog::debug("Loaded sandbox configuration from {}", config_file.string());
    return config;
}

void SandboxConfiguration::Validate() const {
    if (vm_target.empty()) {
        throw ConfigError("vm_target is required");
    }
    if (credentials.user.empty()) {
        throw ConfigError("guest_user is required");
    }
    if (clean_snapshot.empty()) {
        throw ConfigError("clean_snapshot is required");
    }
    if (!workspace_root.IsAbsolute()) {
        throw ConfigError("workspace_root must be an absolute guest path: " + workspace_root.String());
    }
    if (!tool_directory.IsAbsolute() || !tracer_path.IsAbsolute()) {
        throw ConfigError("tool_directory and tracer_path must be absolute guest paths");
    }
    if (default_timeout.count() <= 0) {
        throw ConfigError("Invalid timeout: must be > 0");
    }
    if (control_binary.empty()) {
        throw ConfigError("control_binary is required");
    }
}

} // namespace core
} // namespace vmsandbox
