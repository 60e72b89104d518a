/**
 * @file document_analyzer.hpp
 * @brief Guest-side inspection of non-executable documents
 *
 * Documents are never executed, but the tools that parse them can be
 * exploitable, so inspection runs inside the disposable guest. The analyzer
 * writes a fixed shell script into the workspace and runs it as
 *
 * @code
 * /bin/bash <workspace>/analyze_document.sh <document> <log> <sample-bytes> <type>
 * @endcode
 *
 * The document and log paths only ever reach the script as positional
 * arguments; the script body itself is a constant. Every tool probe in the
 * script is guarded by `command -v`, so the script completes with a
 * best-effort log even when tools are missing.
 *
 * **Templates**:
 * - PDF: file info, pdfinfo metadata, pdftotext sample, pdfdetach
 *   attachment list, qpdf encryption status
 * - Everything else: file info and the first N bytes
 *
 * @date 2025
 */

#pragma once

#include <optional>
#include <string>

#include "vmsandbox/analyzers/content_classifier.hpp"
#include "vmsandbox/core/guest_bridge.hpp"
#include "vmsandbox/core/guest_path.hpp"

namespace vmsandbox {
namespace analyzers {

class DocumentAnalyzer {
public:
    static constexpr const char* kScriptName = "analyze_document.sh";
    static constexpr const char* kDefaultLogName = "document_analysis.txt";

    /// @param bridge Guest bridge; must outlive the analyzer
    explicit DocumentAnalyzer(core::GuestBridge& bridge);

    /**
     * @brief Inspect a document already in the guest
     *
     * @param path Guest path of the document (relative paths resolve
     *        against the workspace root)
     * @param log_name File name of the log inside the workspace root
     * @return Log path, or std::nullopt if no log could be produced
     *
     * @throws core::UnsupportedTypeError if @p path is not a document type
     *         (no guest I/O happens)
     * @throws core::CancelledError if the session was cancelled
     */
    std::optional<core::GuestPath> Analyze(const core::GuestPath& path,
                                           const std::string& log_name = kDefaultLogName);

    /// Script body used for a document kind
    static const std::string& ScriptTemplate(DocumentKind kind);

private:
    core::GuestBridge& bridge_;
};

} // namespace analyzers
} // namespace vmsandbox
