/**
 * @file sandbox_session.hpp
 * @brief Session state machine and the single-guest session gate
 *
 * A SandboxSession is one start -> analyze* -> revert cycle on the guest.
 * Sessions are only created by SessionManager, which holds the gate that
 * keeps at most one session alive at a time.
 *
 * **Lifecycle**:
 * ```
 * STOPPED -> STARTING -> RUNNING <-> ANALYZING
 *                           |
 *                           v
 *                       REVERTING -> STOPPED (health CLEAN or TAINTED)
 * ```
 *
 * Closing always routes through REVERTING: on success, on error, on
 * cancellation, and from the destructor. A cancelled session hard-stops the
 * guest before reverting. The revert is the last control command a session
 * issues. A failed revert never escapes Close(); it marks the session
 * TAINTED and the manager reverts again before handing out the next session.
 *
 * **Usage Example**:
 * @code
 * VmrunControl control(config);
 * SessionManager manager(control, config);
 * manager.Init();
 *
 * auto session = manager.Acquire();
 * auto guest_file = session->SubmitFile("/samples/dropper.py");
 * auto report = session->RunAnalysis(guest_file);
 * session->RetrieveArtifact(*report.trace_log_guest_path, "./results/trace.txt");
 * session.reset();   // revert, release the gate
 * @endcode
 *
 * @date 2025
 */

#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "vmsandbox/analyzers/content_classifier.hpp"
#include "vmsandbox/analyzers/document_analyzer.hpp"
#include "vmsandbox/control/control_interface.hpp"
#include "vmsandbox/core/cancellation.hpp"
#include "vmsandbox/core/execution_orchestrator.hpp"
#include "vmsandbox/core/guest_bridge.hpp"
#include "vmsandbox/core/guest_path.hpp"
#include "vmsandbox/core/sandbox_config.hpp"

namespace vmsandbox {
namespace core {

/**
 * @enum SessionState
 * @brief Lifecycle state of a session
 */
enum class SessionState {
    STOPPED,
    STARTING,
    RUNNING,
    ANALYZING,
    REVERTING
};

/**
 * @enum SessionHealth
 * @brief Whether the guest is known to be back at the clean snapshot
 */
enum class SessionHealth {
    CLEAN,
    TAINTED    ///< Analysis side effects may remain in the guest
};

std::string SessionStateToString(SessionState state);
std::string SessionHealthToString(SessionHealth health);

/**
 * @enum ArtifactKind
 * @brief What produced an artifact
 */
enum class ArtifactKind {
    SYSCALL_TRACE,
    DOCUMENT_LOG
};

/**
 * @struct AnalysisArtifact
 * @brief Guest file produced during analysis
 */
struct AnalysisArtifact {
    ArtifactKind kind{ArtifactKind::SYSCALL_TRACE};
    GuestPath guest_path;
    std::optional<HostPath> retrieved_path;   ///< Set once copied to the host
};

/**
 * @struct AnalysisOptions
 * @brief How RunAnalysis() treats one submitted file
 */
struct AnalysisOptions {
    bool trace{true};                         ///< Run under the syscall tracer (tolerant)
    bool execute{false};                      ///< Also run strictly; ExecutionError propagates
    std::vector<std::string> args;            ///< Arguments for the program
    std::string analysis_id;                  ///< Generated when empty
    std::optional<HostPath> retrieve_to;      ///< Copy produced logs into this host directory
    std::optional<std::chrono::seconds> timeout;  ///< Override for the program run
};

/**
 * @struct AnalysisReport
 * @brief Result of one RunAnalysis() call
 */
struct AnalysisReport {
    std::string analysis_id;
    GuestPath sample;
    analyzers::ContentProfile profile;
    std::optional<std::string> sha256;        ///< Digest of the submitted host file
    std::optional<ExecutionOutcome> execution_outcome;
    std::optional<GuestPath> trace_log_guest_path;
    std::optional<GuestPath> document_log_guest_path;
    std::vector<AnalysisArtifact> artifacts;
    std::chrono::system_clock::time_point started_at;
    std::chrono::system_clock::time_point finished_at;
};

/**
 * @struct GuestDescriptor
 * @brief Non-secret description of the configured guest
 */
struct GuestDescriptor {
    std::string target;
    GuestStatus status{GuestStatus::UNKNOWN};
    std::string clean_snapshot;
    std::string user;
    GuestPath workspace_root;
    SessionHealth last_health{SessionHealth::CLEAN};
    bool session_active{false};
};

/**
 * @class SessionGate
 * @brief Admits one holder at a time to the guest
 *
 * Unlike a mutex, a lease may be released on a different thread than the
 * one that acquired it, so a session can be handed to a worker thread and
 * closed there.
 */
class SessionGate {
public:
    /// Move-only ownership of the gate; releases it on destruction
    class Lease {
    public:
        Lease() = default;
        Lease(Lease&& other) noexcept;
        Lease& operator=(Lease&& other) noexcept;
        ~Lease();

        Lease(const Lease&) = delete;
        Lease& operator=(const Lease&) = delete;

        bool Held() const noexcept { return gate_ != nullptr; }
        void Release() noexcept;

    private:
        friend class SessionGate;
        explicit Lease(SessionGate& gate) : gate_(&gate) {}

        SessionGate* gate_{nullptr};
    };

    SessionGate() = default;
    SessionGate(const SessionGate&) = delete;
    SessionGate& operator=(const SessionGate&) = delete;

    /// Block until the gate is free
    Lease Acquire();

    /// Returns an empty lease if the gate is held
    Lease TryAcquire();


private:
    void Unlock() noexcept;

    std::mutex mutex_;
    std::condition_variable released_;
    bool held_{false};
};

class SessionManager;

class SandboxSession {
public:
    /// Only SessionManager can mint one
    class ConstructionKey {
    private:
        friend class SessionManager;
        ConstructionKey() {}
    };

    SandboxSession(ConstructionKey key,
                   SessionManager& manager,
                   SessionGate::Lease gate,
                   std::uint64_t id);
    ~SandboxSession();

    SandboxSession(const SandboxSession&) = delete;
    SandboxSession& operator=(const SandboxSession&) = delete;

    // ========================================================================
    // Front-end operations
    // ========================================================================

    /**
     * @brief Copy a host file into the guest workspace
     * @return Guest path of the copy
     * @throws TransferError if the host file is missing or the copy fails
     */
    GuestPath SubmitFile(const HostPath& host_file);

    /**
     * @brief Copy every regular file under a host directory
     *
     * Files land flat in the workspace root, in path order.
     *
     * @throws TransferError if @p host_dir is not a directory
     */
    std::vector<GuestPath> SubmitDirectory(const HostPath& host_dir);

    /**
     * @brief Analyze a file already in the guest
     *
     * Documents go to the document analyzer; programs are traced and/or
     * executed according to @p options. Analyses in one session share the
     * guest state; call ResetEnvironment() between them for isolation.
     *
     * @throws UnsupportedTypeError before any guest I/O for unknown types
     * @throws CompileError, ExecutionError (execute only), TransferError,
     *         TimeoutError, CancelledError. A trace taken before a failing
     *         strict run is still recorded in Artifacts() and retrieved.
     */
    AnalysisReport RunAnalysis(const GuestPath& guest_path, const AnalysisOptions& options = {});

    /**
     * @brief Copy a guest file to the host
     *
     * An empty guest path logs a warning and does nothing.
     *
     * @throws TransferError if the guest file is unreachable
     */
    void RetrieveArtifact(const GuestPath& guest_path, const HostPath& host_dest);

    /// Compile @p tracker_source and run @p target under it (strict)
    ExecutionOutcome RunCustomTracker(const GuestPath& tracker_source,
                                      const GuestPath& target,
                                      const std::vector<std::string>& args = {});

    /**
     * @brief Revert to the clean snapshot and bring the guest back up
     *
     * Discards all artifacts. A failed revert marks the session TAINTED and
     * is rethrown.
     */
    void ResetEnvironment();

    GuestStatus GetStatus();

    // ========================================================================
    // Lifecycle
    // ========================================================================

    /**
     * @brief Raise the cancellation signal
     *
     * Safe from any thread. The in-flight control command is killed, later
     * ones fail with CancelledError, and Close() hard-stops the guest
     * before reverting.
     */
    void Cancel() noexcept { cancel_.Cancel(); }

    bool IsCancelled() const noexcept { return cancel_.IsCancelled(); }

    /**
     * @brief Revert the guest and end the session
     *
     * Idempotent. Never throws; failures are logged and reflected in
     * Health(). May run on any thread, not only the one that acquired the
     * session.
     */
    void Close();

    SessionState State() const { return state_.load(); }
    SessionHealth Health() const { return health_.load(); }
    std::uint64_t Id() const { return id_; }
    const std::vector<AnalysisArtifact>& Artifacts() const { return artifacts_; }

private:
    friend class SessionManager;

    /// STOPPED -> STARTING -> RUNNING
    void Open();

    void StartGuest();
    void RequireRunning() const;
    std::string NextAnalysisId();
    /// Register the report's artifacts and copy them to options.retrieve_to
    void RecordArtifacts(AnalysisReport& report, const AnalysisOptions& options);
    void RetrieveInto(AnalysisArtifact& artifact, const HostPath& directory);

    SessionManager& manager_;
    SessionGate::Lease gate_;                ///< Released last, after the revert
    const SandboxConfiguration& config_;
    CancellationToken cancel_;
    GuestBridge bridge_;
    ExecutionOrchestrator orchestrator_;
    analyzers::DocumentAnalyzer document_analyzer_;

    std::uint64_t id_;
    std::uint64_t analysis_counter_{0};
    std::atomic<SessionState> state_{SessionState::STOPPED};
    std::atomic<SessionHealth> health_{SessionHealth::CLEAN};
    bool closed_{false};

    std::vector<AnalysisArtifact> artifacts_;
    std::map<GuestPath, std::string> sample_hashes_;
};

/**
 * @class SessionManager
 * @brief Owns the guest and serializes sessions on it
 *
 * Explicitly constructed and passed to callers; there is no global
 * instance. Init() must be called before sessions are acquired and
 * Teardown() ends the manager's use of the guest.
 *
 * **Thread Safety**: all methods are thread-safe. Acquire() blocks while
 * another session is alive; TryAcquire() fails fast with SessionBusyError.
 * Guest-management calls (start, stop, snapshot, reset) take the same gate.
 */
class SessionManager {
public:
    /**
     * @param control Control interface; must outlive the manager
     * @param config Configuration, copied
     */
    SessionManager(control::ControlInterface& control, SandboxConfiguration config);
    ~SessionManager();

    SessionManager(const SessionManager&) = delete;
    SessionManager& operator=(const SessionManager&) = delete;

    /**
     * @brief Validate the configuration and mark the manager usable
     * @throws ConfigError
     */
    void Init();

    /**
     * @brief Cancel the active session, wait for it to close, and stop
     *        handing out sessions
     */
    void Teardown();

    bool IsInitialized() const;

    /**
     * @brief Start a session, waiting for the gate if necessary
     *
     * Starts the guest and ensures the workspace. If the previous session
     * left the guest TAINTED, a recovery revert runs first.
     *
     * @throws ControlError if the guest cannot be started or recovered
     * @throws SandboxError if the manager is not initialized
     */
    std::unique_ptr<SandboxSession> Acquire();

    /**
     * @brief Like Acquire(), but fails if a session is active
     * @throws SessionBusyError
     */
    std::unique_ptr<SandboxSession> TryAcquire();

    /// Raise the cancellation signal of the active session, if any
    void CancelActive();

    // ========================================================================
    // Guest management (outside sessions)
    // ========================================================================

    void StartGuest();
    void StopGuest(StopMode mode);
    void CreateSnapshot(const std::string& name);

    /**
     * @brief Forced revert to the clean snapshot
     *
     * Updates LastHealth(); rethrows the revert failure.
     */
    void ResetEnvironment();

    GuestStatus GetStatus();
    GuestDescriptor DescribeGuest();
    SessionHealth LastHealth() const;

    const SandboxConfiguration& Config() const { return config_; }

private:
    friend class SandboxSession;

    std::unique_ptr<SandboxSession> OpenSession(SessionGate::Lease gate);
    void RecoverIfTainted();
    void RequireInitialized() const;

    /// Called by a closing session while it still holds the gate
    void OnSessionClosed(const SandboxSession& session);

    control::ControlInterface& control_;
    const SandboxConfiguration config_;

    SessionGate gate_;                       ///< Held by the live session

    mutable std::mutex state_mutex_;
    bool initialized_{false};
    SessionHealth last_health_{SessionHealth::CLEAN};
    SandboxSession* active_{nullptr};
    std::uint64_t next_session_id_{1};
};

} // namespace core
} // namespace vmsandbox
