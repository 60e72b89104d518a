/**
 * @file content_classifier.cpp
 * @brief Extension table for the content classifier
 *
 * @date 2025
 */

#include "vmsandbox/analyzers/content_classifier.hpp"
#include "vmsandbox/utils/string_utils.hpp"

#include <map>
#include <type_traits>

namespace vmsandbox {
namespace analyzers {

namespace {

// One entry per extension, so no extension can map to two categories
const std::map<std::string, Toolchain>& ProfileTable() {
    static const std::map<std::string, Toolchain> table = {
        // Interpreted
        {".py",   Interpreted{"python3"}},
        {".js",   Interpreted{"node"}},
        {".sh",   Interpreted{"bash"}},
        {".rb",   Interpreted{"ruby"}},
        {".pl",   Interpreted{"perl"}},
        {".php",  Interpreted{"php"}},

        // Compiled
        {".c",    Compiled{"gcc"}},
        {".cpp",  Compiled{"g++"}},
        {".java", Compiled{"javac"}},
        {".go",   Compiled{"go"}},

        // Documents
        {".pdf",  Document{DocumentKind::PDF}},
        {".doc",  Document{DocumentKind::DOC}},
        {".docx", Document{DocumentKind::DOCX}},
        {".txt",  Document{DocumentKind::TXT}},
        {".rtf",  Document{DocumentKind::RTF}}
    };
    return table;
}

} // anonymous namespace

ContentCategory ContentProfile::Category() const {
    return std::visit([](const auto& tool) -> ContentCategory {
        using T = std::decay_t<decltype(tool)>;
        if constexpr (std::is_same_v<T, Interpreted>) {
            return ContentCategory::INTERPRETED;
        } else if constexpr (std::is_same_v<T, Compiled>) {
            return ContentCategory::COMPILED;
        } else if constexpr (std::is_same_v<T, Document>) {
            return ContentCategory::DOCUMENT;
        } else {
            return ContentCategory::UNSUPPORTED;
        }
    }, toolchain);
}

std::optional<std::string> ContentProfile::RuntimeCommand() const {
    if (const auto* interpreted = std::get_if<Interpreted>(&toolchain)) {
        return interpreted->runtime;
    }
    if (const auto* compiled = std::get_if<Compiled>(&toolchain)) {
        return compiled->compiler;
    }
    return std::nullopt;
}

ContentProfile ContentClassifier::Classify(const core::GuestPath& path) {
    return ClassifyExtension(path.Extension());
}

ContentProfile ContentClassifier::Classify(const core::HostPath& path) {
    return ClassifyExtension(path.extension().string());
}

ContentProfile ContentClassifier::ClassifyExtension(const std::string& extension) {
    ContentProfile profile;
    profile.extension = utils::StringUtils::ToLower(extension);
    if (!profile.extension.empty() && profile.extension.front() != '.') {
        profile.extension.insert(profile.extension.begin(), '.');
    }

    const auto& table = ProfileTable();
    auto it = table.find(profile.extension);
    if (it != table.end()) {
        profile.toolchain = it->second;
    }
    return profile;
}

std::string ContentClassifier::CategoryToString(ContentCategory category) {
    switch (category) {
        case ContentCategory::INTERPRETED: return "interpreted";
        case ContentCategory::COMPILED:    return "compiled";
        case ContentCategory::DOCUMENT:    return "document";
        case ContentCategory::UNSUPPORTED: return "unsupported";
    }
    return "unsupported";
}

std::string ContentClassifier::DocumentKindToString(DocumentKind kind) {
    switch (kind) {
        case DocumentKind::PDF:  return "pdf";
        case DocumentKind::DOC:  return "doc";
        case DocumentKind::DOCX: return "docx";
        case DocumentKind::TXT:  return "txt";
        case DocumentKind::RTF:  return "rtf";
    }
    return "txt";
}

} // namespace analyzers
} // namespace vmsandbox
