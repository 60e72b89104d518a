/**
 * @file content_classifier.hpp
 * @brief Maps a file extension to the toolchain that handles it
 *
 * Classification is pure: no I/O, no guest access. The result is a closed
 * variant so that every consumer dispatches exhaustively with std::visit.
 *
 * **Profile Table**:
 * | Extension                     | Category    | Toolchain |
 * |-------------------------------|-------------|-----------|
 * | .py .js .sh .rb .pl .php      | Interpreted | python3, node, bash, ruby, perl, php |
 * | .c .cpp .java .go             | Compiled    | gcc, g++, javac, go |
 * | .pdf .doc .docx .txt .rtf     | Document    | type tag only |
 * | anything else                 | Unsupported | none |
 *
 * Lookup ignores case (".PY" is ".py").
 *
 * @date 2025
 */

#pragma once

#include <optional>
#include <string>
#include <variant>

#include "vmsandbox/core/guest_path.hpp"

namespace vmsandbox {
namespace analyzers {

/**
 * @enum ContentCategory
 * @brief How submitted content is handled inside the guest
 */
enum class ContentCategory {
    INTERPRETED,   ///< Run by a runtime: `runtime file args...`
    COMPILED,      ///< Compiled in the guest, then run
    DOCUMENT,      ///< Inspected by a guest-side script, never executed
    UNSUPPORTED    ///< Terminal; no guest operation may proceed
};

/**
 * @enum DocumentKind
 * @brief Document type tag selecting the inspection template
 */
enum class DocumentKind {
    PDF,
    DOC,
    DOCX,
    TXT,
    RTF
};

struct Interpreted {
    std::string runtime;    ///< Runtime binary name (e.g. "python3")
};

struct Compiled {
    std::string compiler;   ///< Compiler binary name (e.g. "gcc")
};

struct Document {
    DocumentKind kind;
};

struct Unsupported {};

using Toolchain = std::variant<Interpreted, Compiled, Document, Unsupported>;

/**
 * @struct ContentProfile
 * @brief Classification result for one file
 */
struct ContentProfile {
    std::string extension;   ///< Lowercased extension including the dot ("" if none)
    Toolchain toolchain{Unsupported{}};

    ContentCategory Category() const;

    /// Runtime or compiler name; empty for documents and unsupported files
    std::optional<std::string> RuntimeCommand() const;

    bool IsSupported() const { return Category() != ContentCategory::UNSUPPORTED; }
};

class ContentClassifier {
public:
    static ContentProfile Classify(const core::GuestPath& path);
    static ContentProfile Classify(const core::HostPath& path);

    /**
     * @brief Classify by extension alone
     * @param extension Extension with or without the leading dot, any case
     */
    static ContentProfile ClassifyExtension(const std::string& extension);

    static std::string CategoryToString(ContentCategory category);
    static std::string DocumentKindToString(DocumentKind kind);
};

} // namespace analyzers
} // namespace vmsandbox
