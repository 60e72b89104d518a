/**
 * @file sandbox_session.cpp
 * @brief Session lifecycle, analysis dispatch and the session gate
 *
 * **Analysis Workflow** (RunAnalysis):
 * 1. Classify; unsupported content stops here with no guest I/O
 * 2. Documents: run the inspection script, record the log
 * 3. Programs: trace (tolerant) and/or execute (strict)
 * 4. Optionally copy the produced logs to a host directory
 *
 * **Close Workflow**:
 * 1. Cancelled sessions hard-stop the guest
 * 2. Revert to the clean snapshot (last control command of the session)
 * 3. Record health with the manager, release the gate
 *
 * @date 2025
 */

#include "vmsandbox/core/sandbox_session.hpp"
#include "vmsandbox/core/errors.hpp"
#include "vmsandbox/utils/hash_utils.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <ctime>
#include <filesystem>
#include <iomanip>
#include <sstream>
#include <utility>

namespace vmsandbox {
namespace core {

namespace fs = std::filesystem;
using analyzers::ContentCategory;
using analyzers::ContentClassifier;

namespace {

// Puts the session back to RUNNING when an analysis step ends, however it ends
class AnalyzingScope {
public:
    explicit AnalyzingScope(std::atomic<SessionState>& state)
        : state_(state) {
        state_.store(SessionState::ANALYZING);
    }
    ~AnalyzingScope() {
        state_.store(SessionState::RUNNING);
    }

    AnalyzingScope(const AnalyzingScope&) = delete;
    AnalyzingScope& operator=(const AnalyzingScope&) = delete;

private:
    std::atomic<SessionState>& state_;
};

} // anonymous namespace

std::string SessionStateToString(SessionState state) {
    switch (state) {
        case SessionState::STOPPED:   return "Stopped";
        case SessionState::STARTING:  return "Starting";
        case SessionState::RUNNING:   return "Running";
        case SessionState::ANALYZING: return "Analyzing";
        case SessionState::REVERTING: return "Reverting";
    }
    return "Stopped";
}

std::string SessionHealthToString(SessionHealth health) {
    return health == SessionHealth::CLEAN ? "Clean" : "Tainted";
}

// ============================================================================
// SESSION GATE
// ============================================================================

SessionGate::Lease::Lease(Lease&& other) noexcept
    : gate_(std::exchange(other.gate_, nullptr)) {}

SessionGate::Lease& SessionGate::Lease::operator=(Lease&& other) noexcept {
    if (this != &other) {
        Release();
        gate_ = std::exchange(other.gate_, nullptr);
    }
    return *this;
}

SessionGate::Lease::~Lease() {
    Release();
}

void SessionGate::Lease::Release() noexcept {
    if (gate_ != nullptr) {
        gate_->Unlock();
        gate_ = nullptr;
    }
}

SessionGate::Lease SessionGate::Acquire() {
    std::unique_lock<std::mutex> lock(mutex_);
    released_.wait(lock, [this] { return !held_; });
    held_ = true;
    return Lease(*this);
}

SessionGate::Lease SessionGate::TryAcquire() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (held_) {
        return Lease();
    }
    held_ = true;
    return Lease(*this);
}

void SessionGate::Unlock() noexcept {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        held_ = false;
    }
    released_.notify_one();
}

// ============================================================================
// SANDBOX SESSION
// ============================================================================

SandboxSession::SandboxSession(ConstructionKey /*key*/,
                               SessionManager& manager,
                               SessionGate::Lease gate,
                               std::uint64_t id)
    : manager_(manager)
    , gate_(std::move(gate))
    , config_(manager.Config())
    , bridge_(manager.control_, manager.Config(), &cancel_)
    , orchestrator_(bridge_)
    , document_analyzer_(bridge_)
    , id_(id) {}

SandboxSession::~SandboxSession() {
    Close();
}

void SandboxSession::Open() {
    spdlog::info("═══════════════════════════════════════════════════════════════");
    spdlog::info("OPENING SANDBOX SESSION #{}", id_);
    spdlog::info("═══════════════════════════════════════════════════════════════");
    spdlog::info("Target: {}", config_.vm_target);
    spdlog::info("Workspace: {}", config_.workspace_root.String());

    state_.store(SessionState::STARTING);
    try {
        StartGuest();
        bridge_.EnsureDirectory(config_.workspace_root);
    }
    catch (const SandboxError& e) {
        spdlog::error("Session start failed: {}", e.what());
        throw;
    }

    state_.store(SessionState::RUNNING);
    spdlog::info("✓ Session #{} running", id_);
}

void SandboxSession::StartGuest() {
    try {
        bridge_.Start(config_.start_mode);
    }
    catch (const TimeoutError&) {
        throw;
    }
    catch (const ControlError& e) {
        if (bridge_.GetStatus() == GuestStatus::RUNNING) {
            spdlog::warn("⚠ Start failed but the guest is already running, continuing: {}", e.what());
            return;
        }
        throw;
    }
}

void SandboxSession::Close() {
    if (closed_) {
        return;
    }
    closed_ = true;

    spdlog::info("═══════════════════════════════════════════════════════════════");
    spdlog::info("CLOSING SANDBOX SESSION #{}", id_);
    spdlog::info("═══════════════════════════════════════════════════════════════");

    state_.store(SessionState::REVERTING);

    if (cancel_.IsCancelled()) {
        spdlog::warn("Session was cancelled, forcing guest power-off");
        try {
            bridge_.Stop(StopMode::HARD);
        }
        catch (const std::exception& e) {
            spdlog::warn("Hard stop failed: {}", e.what());
        }
    }

    try {
        bridge_.RevertToClean();
        health_.store(SessionHealth::CLEAN);
        spdlog::info("✓ Guest restored to {}", config_.clean_snapshot);
    }
    catch (const std::exception& e) {
        health_.store(SessionHealth::TAINTED);
        spdlog::error("Revert to {} failed, guest marked TAINTED: {}", config_.clean_snapshot, e.what());
    }

    artifacts_.clear();
    sample_hashes_.clear();
    state_.store(SessionState::STOPPED);

    manager_.OnSessionClosed(*this);
    gate_.Release();

    spdlog::info("Session #{} closed ({})", id_, SessionHealthToString(health_.load()));
}

void SandboxSession::RequireRunning() const {
    cancel_.ThrowIfCancelled();
    if (closed_ || state_.load() != SessionState::RUNNING) {
        throw SandboxError("Session #" + std::to_string(id_) + " is not running (state: " +
                           SessionStateToString(state_.load()) + ")");
    }
}

// ============================================================================
// FRONT-END OPERATIONS
// ============================================================================

GuestPath SandboxSession::SubmitFile(const HostPath& host_file) {
    RequireRunning();

    GuestPath dest = bridge_.TransferToGuest(host_file);

    try {
        sample_hashes_[dest] = utils::HashUtils::ComputeSHA256(host_file);
        spdlog::debug("SHA256({}) = {}", host_file.filename().string(), sample_hashes_[dest]);
    }
    catch (const std::runtime_error& e) {
        spdlog::warn("Cannot hash {}: {}", host_file.string(), e.what());
    }

    return dest;
}

std::vector<GuestPath> SandboxSession::SubmitDirectory(const HostPath& host_dir) {
    RequireRunning();

    std::error_code ec;
    if (!fs::is_directory(host_dir, ec)) {
        throw TransferError("Source directory not found: " + host_dir.string());
    }

    std::vector<HostPath> files;
    for (const auto& entry : fs::recursive_directory_iterator(host_dir)) {
        if (entry.is_regular_file()) {
            files.push_back(entry.path());
        }
    }
    std::sort(files.begin(), files.end());

    spdlog::info("Submitting {} files from {}", files.size(), host_dir.string());

    std::vector<GuestPath> copied;
    copied.reserve(files.size());
    for (const auto& file : files) {
        copied.push_back(SubmitFile(file));
    }
    return copied;
}

AnalysisReport SandboxSession::RunAnalysis(const GuestPath& guest_path, const AnalysisOptions& options) {
    RequireRunning();

    AnalysisReport report;
    report.started_at = std::chrono::system_clock::now();
    report.analysis_id = options.analysis_id.empty() ? NextAnalysisId() : options.analysis_id;
    report.sample = bridge_.Resolve(guest_path);
    report.profile = ContentClassifier::Classify(report.sample);

    auto hash = sample_hashes_.find(report.sample);
    if (hash != sample_hashes_.end()) {
        report.sha256 = hash->second;
    }

    const ContentCategory category = report.profile.Category();
    if (category == ContentCategory::UNSUPPORTED) {
        spdlog::warn("Analysis skipped: unsupported file type {}", report.sample.String());
        throw UnsupportedTypeError(report.profile.extension);
    }

    spdlog::info("═══════════════════════════════════════════════════════════════");
    spdlog::info("ANALYSIS {}", report.analysis_id);
    spdlog::info("═══════════════════════════════════════════════════════════════");
    spdlog::info("Sample: {}", report.sample.String());
    spdlog::info("Category: {}", ContentClassifier::CategoryToString(category));

    AnalyzingScope analyzing(state_);
    bool recorded = false;

    if (category == ContentCategory::DOCUMENT) {
        auto log = document_analyzer_.Analyze(report.sample, "document_analysis_" + report.analysis_id + ".txt");
        if (log) {
            report.document_log_guest_path = log;
            report.artifacts.push_back({ArtifactKind::DOCUMENT_LOG, *log, std::nullopt});
        }
    } else {
        if (options.trace) {
            TraceResult trace = orchestrator_.TraceSyscalls(
                report.sample, options.args, "analysis_log_" + report.analysis_id + ".txt", options.timeout);
            report.execution_outcome = trace.outcome;
            if (trace.log_path) {
                report.trace_log_guest_path = trace.log_path;
                report.artifacts.push_back({ArtifactKind::SYSCALL_TRACE, *trace.log_path, std::nullopt});
            } else {
                spdlog::warn("No usable syscall trace for {}", report.sample.String());
            }
        }
        if (options.execute) {
            // A failing strict run must not lose the trace it follows
            RecordArtifacts(report, options);
            recorded = true;
            report.execution_outcome = orchestrator_.Execute(report.sample, options.args, options.timeout);
        }
    }

    if (!recorded) {
        RecordArtifacts(report, options);
    }

    report.finished_at = std::chrono::system_clock::now();

    spdlog::info("═══════════════════════════════════════════════════════════════");
    spdlog::info("ANALYSIS COMPLETE");
    spdlog::info("═══════════════════════════════════════════════════════════════");
    if (report.execution_outcome) {
        spdlog::info("Exit code: {}", report.execution_outcome->exit_code);
        spdlog::info("Duration: {} ms", report.execution_outcome->duration.count());
    }
    if (report.trace_log_guest_path) {
        spdlog::info("Trace log: {}", report.trace_log_guest_path->String());
    }
    if (report.document_log_guest_path) {
        spdlog::info("Document log: {}", report.document_log_guest_path->String());
    }

    return report;
}

void SandboxSession::RetrieveArtifact(const GuestPath& guest_path, const HostPath& host_dest) {
    if (guest_path.Empty()) {
        spdlog::warn("No log file specified");
        return;
    }
    RequireRunning();

    const GuestPath source = bridge_.Resolve(guest_path);
    bridge_.TransferFromGuest(source, host_dest);

    for (auto& artifact : artifacts_) {
        if (artifact.guest_path == source) {
            artifact.retrieved_path = host_dest;
        }
    }
    spdlog::info("Log file copied to: {}", host_dest.string());
}

void SandboxSession::RecordArtifacts(AnalysisReport& report, const AnalysisOptions& options) {
    artifacts_.insert(artifacts_.end(), report.artifacts.begin(), report.artifacts.end());

    if (options.retrieve_to) {
        for (auto& artifact : report.artifacts) {
            RetrieveInto(artifact, *options.retrieve_to);
        }
    }
}

void SandboxSession::RetrieveInto(AnalysisArtifact& artifact, const HostPath& directory) {
    const HostPath dest = directory / artifact.guest_path.Filename();
    bridge_.TransferFromGuest(artifact.guest_path, dest);
    artifact.retrieved_path = dest;

    for (auto& known : artifacts_) {
        if (known.guest_path == artifact.guest_path) {
            known.retrieved_path = dest;
        }
    }
}

ExecutionOutcome SandboxSession::RunCustomTracker(const GuestPath& tracker_source,
                                                  const GuestPath& target,
                                                  const std::vector<std::string>& args) {
    RequireRunning();
    AnalyzingScope analyzing(state_);
    return orchestrator_.RunCustomTracker(tracker_source, target, args);
}

void SandboxSession::ResetEnvironment() {
    RequireRunning();

    spdlog::info("═══════════════════════════════════════════════════════════════");
    spdlog::info("RESETTING GUEST ENVIRONMENT");
    spdlog::info("═══════════════════════════════════════════════════════════════");

    // A failed step leaves the session out of RUNNING; only Close() remains
    state_.store(SessionState::REVERTING);
    try {
        bridge_.RevertToClean();
    }
    catch (const ControlError& e) {
        health_.store(SessionHealth::TAINTED);
        spdlog::error("Revert failed, guest marked TAINTED: {}", e.what());
        throw;
    }

    artifacts_.clear();
    sample_hashes_.clear();
    health_.store(SessionHealth::CLEAN);

    state_.store(SessionState::STARTING);
    StartGuest();
    bridge_.EnsureDirectory(config_.workspace_root);
    state_.store(SessionState::RUNNING);

    spdlog::info("✓ Guest environment reset");
}

GuestStatus SandboxSession::GetStatus() {
    return bridge_.GetStatus();
}

std::string SandboxSession::NextAnalysisId() {
    auto now = std::chrono::system_clock::now();
    auto t = std::chrono::system_clock::to_time_t(now);
    std::ostringstream id;
    id << std::put_time(std::localtime(&t), "%Y%m%d_%H%M%S")
       << "_" << id_ << "_" << ++analysis_counter_;
    return id.str();
}

// ============================================================================
// SESSION MANAGER
// ============================================================================

SessionManager::SessionManager(control::ControlInterface& control, SandboxConfiguration config)
    : control_(control)
    , config_(std::move(config)) {
    spdlog::debug("Session manager created for {}", config_.vm_target);
}

SessionManager::~SessionManager() {
    if (IsInitialized()) {
        Teardown();
    }
}

void SessionManager::Init() {
    std::lock_guard<std::mutex> lock(state_mutex_);
    if (initialized_) {
        return;
    }

    config_.Validate();
    initialized_ = true;

    spdlog::info("✓ Session manager initialized");
    spdlog::debug("Target: {}", config_.vm_target);
    spdlog::debug("Snapshot: {}", config_.clean_snapshot);
    spdlog::debug("Timeout: {}s", config_.default_timeout.count());
}

void SessionManager::Teardown() {
    CancelActive();

    auto gate = gate_.Acquire();
    std::lock_guard<std::mutex> lock(state_mutex_);
    initialized_ = false;
    spdlog::info("Session manager torn down");
}

bool SessionManager::IsInitialized() const {
    std::lock_guard<std::mutex> lock(state_mutex_);
    return initialized_;
}

void SessionManager::RequireInitialized() const {
    if (!IsInitialized()) {
        throw SandboxError("Session manager is not initialized");
    }
}

std::unique_ptr<SandboxSession> SessionManager::Acquire() {
    RequireInitialized();
    return OpenSession(gate_.Acquire());
}

std::unique_ptr<SandboxSession> SessionManager::TryAcquire() {
    RequireInitialized();
    auto gate = gate_.TryAcquire();
    if (!gate.Held()) {
        throw SessionBusyError();
    }
    return OpenSession(std::move(gate));
}

std::unique_ptr<SandboxSession> SessionManager::OpenSession(SessionGate::Lease gate) {
    // Teardown may have run while we waited for the gate
    RequireInitialized();
    RecoverIfTainted();

    std::uint64_t id = 0;
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        id = next_session_id_++;
    }

    auto session = std::make_unique<SandboxSession>(
        SandboxSession::ConstructionKey(), *this, std::move(gate), id);
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        active_ = session.get();
    }

    // On failure the session's destructor reverts and releases the gate
    session->Open();
    return session;
}

void SessionManager::RecoverIfTainted() {
    if (LastHealth() != SessionHealth::TAINTED) {
        return;
    }

    spdlog::warn("⚠ Previous session left the guest TAINTED, reverting before reuse");
    GuestBridge bridge(control_, config_);
    try {
        bridge.RevertToClean();
    }
    catch (const ControlError& e) {
        spdlog::error("Recovery revert failed: {}", e.what());
        throw ControlError(std::string("Guest is tainted and the recovery revert failed: ") + e.what(),
                           e.Verb(), e.ExitCode(), e.StderrOutput());
    }

    std::lock_guard<std::mutex> lock(state_mutex_);
    last_health_ = SessionHealth::CLEAN;
    spdlog::info("✓ Guest recovered");
}

void SessionManager::OnSessionClosed(const SandboxSession& session) {
    std::lock_guard<std::mutex> lock(state_mutex_);
    last_health_ = session.Health();
    if (active_ == &session) {
        active_ = nullptr;
    }
}

void SessionManager::CancelActive() {
    std::lock_guard<std::mutex> lock(state_mutex_);
    if (active_ != nullptr) {
        spdlog::warn("Cancelling active session #{}", active_->Id());
        active_->Cancel();
    }
}

// ============================================================================
// GUEST MANAGEMENT
// ============================================================================

void SessionManager::StartGuest() {
    RequireInitialized();
    auto gate = gate_.Acquire();
    GuestBridge bridge(control_, config_);
    bridge.Start(config_.start_mode);
}

void SessionManager::StopGuest(StopMode mode) {
    RequireInitialized();
    auto gate = gate_.Acquire();
    GuestBridge bridge(control_, config_);
    bridge.Stop(mode);
}

void SessionManager::CreateSnapshot(const std::string& name) {
    RequireInitialized();
    auto gate = gate_.Acquire();
    GuestBridge bridge(control_, config_);
    bridge.CreateSnapshot(name);
}

void SessionManager::ResetEnvironment() {
    RequireInitialized();
    auto gate = gate_.Acquire();
    GuestBridge bridge(control_, config_);
    try {
        bridge.RevertToClean();
    }
    catch (const ControlError& e) {
        std::lock_guard<std::mutex> lock(state_mutex_);
        last_health_ = SessionHealth::TAINTED;
        spdlog::error("Forced revert failed, guest marked TAINTED: {}", e.what());
        throw;
    }

    std::lock_guard<std::mutex> lock(state_mutex_);
    last_health_ = SessionHealth::CLEAN;
}

GuestStatus SessionManager::GetStatus() {
    GuestBridge bridge(control_, config_);
    return bridge.GetStatus();
}

GuestDescriptor SessionManager::DescribeGuest() {
    GuestDescriptor descriptor;
    descriptor.target = config_.vm_target;
    descriptor.status = GetStatus();
    descriptor.clean_snapshot = config_.clean_snapshot;
    descriptor.user = config_.credentials.user;
    descriptor.workspace_root = config_.workspace_root;

    std::lock_guard<std::mutex> lock(state_mutex_);
    descriptor.last_health = last_health_;
    descriptor.session_active = active_ != nullptr;
    return descriptor;
}

SessionHealth SessionManager::LastHealth() const {
    std::lock_guard<std::mutex> lock(state_mutex_);
    return last_health_;
}

} // namespace core
} // namespace vmsandbox
