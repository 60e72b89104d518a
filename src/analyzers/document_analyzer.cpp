/**
 * @file document_analyzer.cpp
 * @brief Inspection script templates and their execution in the guest
 *
 * @date 2025
 */

#include "vmsandbox/analyzers/document_analyzer.hpp"
#include "vmsandbox/core/errors.hpp"
#include "vmsandbox/utils/string_utils.hpp"

#include <spdlog/spdlog.h>

namespace vmsandbox {
namespace analyzers {

using control::ExitPolicy;
using utils::StringUtils;

namespace {

const char* const kBashBinary = "/bin/bash";
const char* const kChmodBinary = "/bin/chmod";
const char* const kHeredocDelimiter = "VMSANDBOX_SCRIPT_EOF";

// Arguments: $1 document, $2 log, $3 sample bytes, $4 type tag
const std::string kPdfScript = R"SCRIPT(#!/bin/bash
doc="$1"
log="$2"
sample="${3:-1000}"

echo "=== PDF Document Analysis ===" > "$log"
echo "File: $doc" >> "$log"
echo "Analysis Time: $(date)" >> "$log"
echo "" >> "$log"

if [ ! -f "$doc" ]; then
    echo "ERROR: File not found" >> "$log"
    exit 1
fi

echo "=== File Information ===" >> "$log"
ls -la "$doc" >> "$log" 2>&1
file "$doc" >> "$log" 2>&1
echo "" >> "$log"

if command -v pdfinfo >/dev/null 2>&1; then
    echo "=== PDF Metadata ===" >> "$log"
    pdfinfo "$doc" >> "$log" 2>&1
    echo "" >> "$log"
fi

if command -v pdftotext >/dev/null 2>&1; then
    echo "=== PDF Text Content (first $sample chars) ===" >> "$log"
    pdftotext "$doc" - 2>>"$log" | head -c "$sample" >> "$log"
    echo "" >> "$log"
fi

if command -v pdfdetach >/dev/null 2>&1; then
    echo "=== PDF Attachments ===" >> "$log"
    pdfdetach -list "$doc" >> "$log" 2>&1
    echo "" >> "$log"
fi

if command -v qpdf >/dev/null 2>&1; then
    echo "=== PDF Security Analysis ===" >> "$log"
    qpdf --show-encryption "$doc" >> "$log" 2>&1
    echo "" >> "$log"
fi

echo "=== Analysis Complete ===" >> "$log"
)SCRIPT";

const std::string kGenericScript = R"SCRIPT(#!/bin/bash
doc="$1"
log="$2"
sample="${3:-1000}"
kind="${4:-unknown}"

echo "=== Document Analysis ===" > "$log"
echo "File: $doc" >> "$log"
echo "Type: $kind" >> "$log"
echo "Analysis Time: $(date)" >> "$log"
echo "" >> "$log"

if [ ! -f "$doc" ]; then
    echo "ERROR: File not found" >> "$log"
    exit 1
fi

echo "=== File Information ===" >> "$log"
ls -la "$doc" >> "$log" 2>&1
if command -v file >/dev/null 2>&1; then
    file "$doc" >> "$log" 2>&1
fi
echo "" >> "$log"

echo "=== Text Content (first $sample chars) ===" >> "$log"
head -c "$sample" "$doc" >> "$log" 2>&1
echo "" >> "$log"

echo "=== Analysis Complete ===" >> "$log"
)SCRIPT";

} // anonymous namespace

DocumentAnalyzer::DocumentAnalyzer(core::GuestBridge& bridge)
    : bridge_(bridge) {}

const std::string& DocumentAnalyzer::ScriptTemplate(DocumentKind kind) {
    return kind == DocumentKind::PDF ? kPdfScript : kGenericScript;
}

std::optional<core::GuestPath> DocumentAnalyzer::Analyze(const core::GuestPath& path,
                                                         const std::string& log_name) {
    const core::GuestPath document = bridge_.Resolve(path);
    const ContentProfile profile = ContentClassifier::Classify(document);
    const auto* doc = std::get_if<Document>(&profile.toolchain);
    if (doc == nullptr) {
        throw core::UnsupportedTypeError(profile.extension);
    }

    const auto& config = bridge_.Config();
    const core::GuestPath log_path = config.workspace_root / core::GuestPath(log_name).Filename();
    const core::GuestPath script_path = config.workspace_root / kScriptName;
    const std::string kind = ContentClassifier::DocumentKindToString(doc->kind);

    spdlog::info("Analyzing {} document {}, logging to {}", kind, document.String(), log_path.String());

    // Quoted delimiter: the heredoc body is taken literally
    const std::string write_script =
        "cat > " + StringUtils::ShellQuote(script_path.String()) +
        " << '" + kHeredocDelimiter + "'\n" +
        ScriptTemplate(doc->kind) +
        kHeredocDelimiter + "\n";

    try {
        bridge_.EnsureDirectory(config.workspace_root);
        bridge_.Run({kBashBinary, "-c", write_script}, ExitPolicy::STRICT);
        bridge_.Run({kChmodBinary, "+x", script_path.String()}, ExitPolicy::STRICT);

        auto result = bridge_.Run({kBashBinary, script_path.String(), document.String(),
                                   log_path.String(), std::to_string(config.document_sample_bytes), kind},
                                  ExitPolicy::TOLERANT);
        if (result.exit_code != 0) {
            spdlog::warn("Document inspection script exited with code {}", result.exit_code);
        } else {
            spdlog::info("✓ Document analysis completed");
        }
        return log_path;
    }
    catch (const core::ControlError& e) {
        spdlog::warn("Document analysis encountered issues: {}", e.what());
    }

    try {
        if (bridge_.PathExists(log_path)) {
            return log_path;
        }
    }
    catch (const core::ControlError& e) {
        spdlog::warn("Cannot confirm document log {}: {}", log_path.String(), e.what());
    }
    return std::nullopt;
}

} // namespace analyzers
} // namespace vmsandbox
