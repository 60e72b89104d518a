/**
 * @file main.cpp
 * @brief vmsandbox - Command-line interface
 *
 * Entry point for the VM sandbox orchestrator. Manages the analysis guest
 * (start, stop, restart, status, cleanup, snapshot) and runs analyses of
 * host files inside it with syscall tracing, document inspection and JSON
 * reporting.
 *
 * Ctrl+C during an analysis cancels the active session; the guest is then
 * powered off and reverted to the clean snapshot.
 *
 * @date 2025
 */

#include <CLI/CLI.hpp>
#include <spdlog/spdlog.h>

#include "vmsandbox/control/vmrun_control.hpp"
#include "vmsandbox/core/errors.hpp"
#include "vmsandbox/core/sandbox_config.hpp"
#include "vmsandbox/core/sandbox_session.hpp"
#include "vmsandbox/reporters/json_reporter.hpp"

#include <atomic>
#include <chrono>
#include <csignal>
#include <filesystem>
#include <iostream>
#include <optional>
#include <thread>

using vmsandbox::core::SandboxConfiguration;
using vmsandbox::core::SandboxConfigurationBuilder;
using vmsandbox::core::SessionManager;

namespace {

std::atomic<bool> g_interrupted{false};

void HandleInterrupt(int) {
    g_interrupted.store(true);
}

/*******************************************************************************
 * Cancellation Watcher
 ******************************************************************************/

// Signal handlers cannot take locks; a watcher thread forwards Ctrl+C
class InterruptWatcher {
public:
    explicit InterruptWatcher(SessionManager& manager)
        : manager_(manager)
        , thread_([this] { Run(); }) {}

    ~InterruptWatcher() {
        done_.store(true);
        thread_.join();
    }

    InterruptWatcher(const InterruptWatcher&) = delete;
    InterruptWatcher& operator=(const InterruptWatcher&) = delete;

private:
    void Run() {
        while (!done_.load()) {
            if (g_interrupted.exchange(false)) {
                spdlog::warn("Interrupt received, cancelling active session");
                manager_.CancelActive();
            }
            std::this_thread::sleep_for(std::chrono::milliseconds(100));
        }
    }

    SessionManager& manager_;
    std::atomic<bool> done_{false};
    std::thread thread_;
};

/*******************************************************************************
 * UI and Display Functions
 ******************************************************************************/

void PrintStatus(const vmsandbox::core::GuestDescriptor& guest) {
    std::cout << "\n";
    std::cout << "╔═══════════════════════════════════════════════════════════════╗\n";
    std::cout << "║                        GUEST STATUS                           ║\n";
    std::cout << "╚═══════════════════════════════════════════════════════════════╝\n";
    std::cout << "  Target:     " << guest.target << "\n";
    std::cout << "  Status:     " << vmsandbox::core::GuestStatusToString(guest.status) << "\n";
    std::cout << "  Snapshot:   " << guest.clean_snapshot << "\n";
    std::cout << "  User:       " << guest.user << "\n";
    std::cout << "  Workspace:  " << guest.workspace_root.String() << "\n";
    std::cout << "  Health:     " << vmsandbox::core::SessionHealthToString(guest.last_health) << "\n";
}

void PrintAnalysisSummary(const vmsandbox::core::AnalysisReport& report,
                          const std::filesystem::path& report_path) {
    std::cout << "\n";
    std::cout << "╔═══════════════════════════════════════════════════════════════╗\n";
    std::cout << "║                      ANALYSIS SUMMARY                         ║\n";
    std::cout << "╚═══════════════════════════════════════════════════════════════╝\n";
    std::cout << "  Sample:     " << report.sample.String() << "\n";
    std::cout << "  Category:   "
              << vmsandbox::analyzers::ContentClassifier::CategoryToString(report.profile.Category()) << "\n";
    if (report.sha256) {
        std::cout << "  SHA-256:    " << *report.sha256 << "\n";
    }
    if (report.execution_outcome) {
        std::cout << "  Outcome:    "
                  << vmsandbox::core::ExecutionStageToString(report.execution_outcome->stage)
                  << " (exit code " << report.execution_outcome->exit_code << ")\n";
    }
    for (const auto& artifact : report.artifacts) {
        std::cout << "  Artifact:   " << artifact.guest_path.String();
        if (artifact.retrieved_path) {
            std::cout << " -> " << artifact.retrieved_path->string();
        }
        std::cout << "\n";
    }
    std::cout << "  Report:     " << report_path.string() << "\n";
}

/*******************************************************************************
 * Commands
 ******************************************************************************/

struct AnalyzeArgs {
    std::vector<std::string> paths;
    bool trace{true};
    bool execute{false};
    std::vector<std::string> program_args;
    std::string output_dir;
};

int RunAnalyze(SessionManager& manager, const AnalyzeArgs& args) {
    namespace fs = std::filesystem;
    using namespace vmsandbox;

    const fs::path output_dir = args.output_dir.empty()
        ? manager.Config().results_directory
        : fs::path(args.output_dir);
    fs::create_directories(output_dir);

    reporters::JsonReporterConfig report_config;
    report_config.output_directory = output_dir;
    reporters::JsonReporter reporter(report_config);

    int failures = 0;
    auto session = manager.Acquire();

    std::vector<core::GuestPath> submitted;
    for (const auto& path : args.paths) {
        if (fs::is_directory(path)) {
            auto files = session->SubmitDirectory(path);
            submitted.insert(submitted.end(), files.begin(), files.end());
        } else {
            submitted.push_back(session->SubmitFile(path));
        }
    }

    core::AnalysisOptions options;
    options.trace = args.trace;
    options.execute = args.execute;
    options.args = args.program_args;
    options.retrieve_to = output_dir;

    for (const auto& guest_file : submitted) {
        try {
            auto report = session->RunAnalysis(guest_file, options);
            auto report_path = reporter.GenerateReport(report);
            PrintAnalysisSummary(report, report_path);
        }
        catch (const core::UnsupportedTypeError& e) {
            spdlog::warn("Skipping {}: {}", guest_file.String(), e.what());
        }
        catch (const core::CancelledError&) {
            throw;
        }
        catch (const core::SandboxError& e) {
            spdlog::error("Analysis of {} failed: {}", guest_file.String(), e.what());
            ++failures;
        }
    }

    session->Close();
    if (session->Health() == core::SessionHealth::TAINTED) {
        spdlog::error("Guest could not be reverted; run 'cleanup' before the next analysis");
        return 1;
    }
    return failures == 0 ? 0 : 1;
}

} // anonymous namespace

/*******************************************************************************
 * Main Application Entry Point
 ******************************************************************************/

int main(int argc, char** argv) {
    CLI::App app{"vmsandbox - VM sandbox session orchestrator"};
    app.require_subcommand(1);
    app.fallthrough();

    std::string config_file;
    std::string vmx;
    std::string user;
    std::string snapshot;
    std::string workspace;
    int timeout_seconds = 0;
    bool verbose = false;

    app.add_option("-c,--config", config_file, "JSON configuration file")
        ->check(CLI::ExistingFile);
    app.add_option("--vmx", vmx, "VM control target (.vmx path)");
    app.add_option("--user", user, "Guest user name");
    app.add_option("--snapshot", snapshot, "Clean snapshot name");
    app.add_option("--workspace", workspace, "Guest workspace root");
    app.add_option("--timeout", timeout_seconds, "Per-command timeout in seconds")
        ->check(CLI::PositiveNumber);
    app.add_flag("-v,--verbose", verbose, "Enable verbose logging");

    auto* start_cmd = app.add_subcommand("start", "Start the guest");
    auto* stop_cmd = app.add_subcommand("stop", "Stop the guest");
    bool hard_stop = false;
    stop_cmd->add_flag("--hard", hard_stop, "Power off immediately");
    auto* restart_cmd = app.add_subcommand("restart", "Stop and start the guest");
    auto* status_cmd = app.add_subcommand("status", "Show guest status");
    auto* cleanup_cmd = app.add_subcommand("cleanup", "Revert the guest to the clean snapshot");

    auto* snapshot_cmd = app.add_subcommand("snapshot", "Create a snapshot of the guest");
    std::string snapshot_name;
    snapshot_cmd->add_option("name", snapshot_name, "Snapshot name")->required();

    auto* analyze_cmd = app.add_subcommand("analyze", "Analyze files inside the guest");
    AnalyzeArgs analyze_args;
    analyze_cmd->add_option("paths", analyze_args.paths, "Files or directories to analyze")
        ->required()
        ->check(CLI::ExistingPath);
    analyze_cmd->add_flag("--trace,!--no-trace", analyze_args.trace, "Run under the syscall tracer")
        ->default_val(true);
    analyze_cmd->add_flag("--execute", analyze_args.execute, "Also run strictly (non-zero exit fails)");
    analyze_cmd->add_option("--arg", analyze_args.program_args, "Argument passed to the program (repeatable)");
    analyze_cmd->add_option("-o,--output", analyze_args.output_dir, "Host directory for logs and reports");

    CLI11_PARSE(app, argc, argv);

    if (verbose) {
        spdlog::set_level(spdlog::level::debug);
        spdlog::debug("Verbose logging enabled");
    } else {
        spdlog::set_level(spdlog::level::info);
    }
    spdlog::set_pattern("[%H:%M:%S] [%^%l%$] %v");

    try {
        SandboxConfiguration base = config_file.empty()
            ? SandboxConfiguration()
            : SandboxConfiguration::LoadFromFile(config_file);

        SandboxConfigurationBuilder builder(base);
        if (!vmx.empty()) {
            builder.WithTarget(vmx);
        }
        if (!user.empty()) {
            builder.WithCredentials(user, base.credentials.password);
        }
        if (!snapshot.empty()) {
            builder.WithSnapshot(snapshot);
        }
        if (!workspace.empty()) {
            builder.WithWorkspaceRoot(workspace);
        }
        if (timeout_seconds > 0) {
            builder.WithTimeout(std::chrono::seconds(timeout_seconds));
        }
        SandboxConfiguration config = builder.Build();

        vmsandbox::control::VmrunControl control(config);
        if (!control.IsAvailable()) {
            spdlog::error("VM control utility is not available: {}", config.control_binary.string());
            return 1;
        }

        SessionManager manager(control, config);
        manager.Init();

        std::signal(SIGINT, HandleInterrupt);
        std::signal(SIGTERM, HandleInterrupt);
        InterruptWatcher watcher(manager);

        int rc = 0;
        if (*start_cmd) {
            manager.StartGuest();
        } else if (*stop_cmd) {
            manager.StopGuest(hard_stop ? vmsandbox::core::StopMode::HARD : vmsandbox::core::StopMode::SOFT);
        } else if (*restart_cmd) {
            manager.StopGuest(vmsandbox::core::StopMode::SOFT);
            manager.StartGuest();
        } else if (*status_cmd) {
            PrintStatus(manager.DescribeGuest());
        } else if (*cleanup_cmd) {
            manager.ResetEnvironment();
            spdlog::info("✓ Guest reverted to {}", config.clean_snapshot);
        } else if (*snapshot_cmd) {
            manager.CreateSnapshot(snapshot_name);
        } else if (*analyze_cmd) {
            rc = RunAnalyze(manager, analyze_args);
        }

        manager.Teardown();
        return rc;

    } catch (const CLI::ParseError& e) {
        return app.exit(e);
    } catch (const std::filesystem::filesystem_error& e) {
        spdlog::error("Filesystem error: {}", e.what());
        return 1;
    } catch (const vmsandbox::core::SandboxError& e) {
        spdlog::error("Sandbox error: {}", e.what());
        return 1;
    } catch (const std::exception& e) {
        spdlog::error("Fatal error: {}", e.what());
        return 1;
    }
}
