/**
 * @file json_reporter.cpp
 * @brief JSON serialization of analysis reports
 *
 * **Report Layout**:
 * ```
 * {
 *   "analysis_id": "...",
 *   "sample": { "guest_path", "extension", "category", "toolchain", "sha256" },
 *   "execution": { "stage", "exit_code", "duration_ms", "stdout", "stderr", "failure_reason" },
 *   "trace_log": "<guest path>" | null,
 *   "document_log": "<guest path>" | null,
 *   "artifacts": [ { "kind", "guest_path", "host_path" } ],
 *   "started_at", "finished_at"
 * }
 * ```
 *
 * @date 2025
 */

#include "vmsandbox/reporters/json_reporter.hpp"
#include "vmsandbox/core/sandbox_session.hpp"

#include <spdlog/spdlog.h>

#include <ctime>
#include <fstream>
#include <iomanip>
#include <sstream>
#include <stdexcept>

using json = nlohmann::json;

namespace vmsandbox {
namespace reporters {

using analyzers::ContentClassifier;

namespace {

json SampleToJson(const core::AnalysisReport& report) {
    json sample;
    sample["guest_path"] = report.sample.String();
    sample["extension"] = report.profile.extension;
    sample["category"] = ContentClassifier::CategoryToString(report.profile.Category());

    if (auto runtime = report.profile.RuntimeCommand()) {
        sample["toolchain"] = *runtime;
    } else if (const auto* doc = std::get_if<analyzers::Document>(&report.profile.toolchain)) {
        sample["toolchain"] = ContentClassifier::DocumentKindToString(doc->kind);
    } else {
        sample["toolchain"] = nullptr;
    }

    sample["sha256"] = report.sha256 ? json(*report.sha256) : json(nullptr);
    return sample;
}

json OutcomeToJson(const core::ExecutionOutcome& outcome) {
    json execution;
    execution["stage"] = core::ExecutionStageToString(outcome.stage);
    execution["exit_code"] = outcome.exit_code;
    execution["duration_ms"] = outcome.duration.count();
    execution["stdout"] = outcome.stdout_output;
    execution["stderr"] = outcome.stderr_output;
    if (!outcome.failure_reason.empty()) {
        execution["failure_reason"] = outcome.failure_reason;
    }
    return execution;
}

std::string ArtifactKindToString(core::ArtifactKind kind) {
    return kind == core::ArtifactKind::SYSCALL_TRACE ? "syscall_trace" : "document_log";
}

} // anonymous namespace

JsonReporter::JsonReporter(const JsonReporterConfig& config)
    : config_(config) {
    spdlog::debug("JSON Reporter output directory: {}", config_.output_directory.string());
}

json JsonReporter::ToJson(const core::AnalysisReport& report) {
    json j;
    j["analysis_id"] = report.analysis_id;
    j["sample"] = SampleToJson(report);
    j["execution"] = report.execution_outcome ? OutcomeToJson(*report.execution_outcome) : json(nullptr);
    j["trace_log"] = report.trace_log_guest_path ? json(report.trace_log_guest_path->String()) : json(nullptr);
    j["document_log"] = report.document_log_guest_path
        ? json(report.document_log_guest_path->String()) : json(nullptr);

    j["artifacts"] = json::array();
    for (const auto& artifact : report.artifacts) {
        json entry;
        entry["kind"] = ArtifactKindToString(artifact.kind);
        entry["guest_path"] = artifact.guest_path.String();
        entry["host_path"] = artifact.retrieved_path ? json(artifact.retrieved_path->string()) : json(nullptr);
        j["artifacts"].push_back(entry);
    }

    j["started_at"] = FormatTimestamp(report.started_at);
    j["finished_at"] = FormatTimestamp(report.finished_at);
    return j;
}

std::string JsonReporter::GenerateJsonString(const core::AnalysisReport& report) const {
    json j = ToJson(report);
    // Sample output and file names are arbitrary bytes; invalid UTF-8 becomes U+FFFD
    if (config_.pretty_print) {
        return j.dump(config_.indent_size, ' ', false, json::error_handler_t::replace);
    }
    return j.dump(-1, ' ', false, json::error_handler_t::replace);
}

std::filesystem::path JsonReporter::GenerateReport(const core::AnalysisReport& report) {
    if (!std::filesystem::exists(config_.output_directory)) {
        std::filesystem::create_directories(config_.output_directory);
    }

    const std::filesystem::path output_path =
        config_.output_directory / ("report_" + report.analysis_id + ".json");

    std::ofstream file(output_path);
    if (!file) {
        throw std::runtime_error("Failed to open file for writing: " + output_path.string());
    }
    file << GenerateJsonString(report) << "\n";
    file.close();
    if (!file) {
        throw std::runtime_error("Failed to write report: " + output_path.string());
    }

    spdlog::info("✓ JSON report generated: {}", output_path.string());
    return output_path;
}

std::string JsonReporter::FormatTimestamp(const std::chrono::system_clock::time_point& time) {
    auto t = std::chrono::system_clock::to_time_t(time);
    std::ostringstream oss;
    oss << std::put_time(std::gmtime(&t), "%Y-%m-%dT%H:%M:%SZ");
    return oss.str();
}

} // namespace reporters
} // namespace vmsandbox
