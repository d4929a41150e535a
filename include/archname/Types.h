#ifndef ARCHNAME_TYPES_H
#define ARCHNAME_TYPES_H

#include <cstdint>
#include <string>
#include <optional>

namespace arn {

// Source platform of an archived page
enum class Platform {
    X,
    Instagram,
    LinkedIn,
    YouTube,
    Reddit,
    TikTok,
    Generic
};

// Which assembly branch produced a candidate
enum class AssemblyBranch {
    Placeholder,    // Nothing usable in the title
    Content,        // "{platform}_上的_{user}_{content}" or plain content
    Url             // "{platform}_上的_{user}_[URL]_{encoded}"
};

// Which resolver strategy produced the final stem
enum class ResolveStrategy {
    AsIs,
    Numbered,
    Timestamp,
    Literal
};

// Title decomposed into platform / author / content
struct StructuredTitle {
    std::optional<Platform> platform;
    std::string platformLabel;          // "X", "Instagram", or the token found in the title
    std::optional<std::string> user;
    std::string content;
    std::string text;                   // Sanitized source text
    std::string rule;                   // Name of the matching pattern, empty if none

    bool isStructured() const { return platform.has_value(); }
};

// Stem produced by the resolver together with how it was obtained
struct ResolvedName {
    std::string stem;
    ResolveStrategy strategy = ResolveStrategy::AsIs;
    unsigned attempts = 0;
};

// Helper functions
inline const char* platformToString(Platform p) {
    switch (p) {
        case Platform::X: return "X";
        case Platform::Instagram: return "Instagram";
        case Platform::LinkedIn: return "LinkedIn";
        case Platform::YouTube: return "YouTube";
        case Platform::Reddit: return "Reddit";
        case Platform::TikTok: return "TikTok";
        default: return "Generic";
    }
}

inline const char* branchToString(AssemblyBranch b) {
    switch (b) {
        case AssemblyBranch::Content: return "content";
        case AssemblyBranch::Url: return "url";
        default: return "placeholder";
    }
}

inline const char* strategyToString(ResolveStrategy s) {
    switch (s) {
        case ResolveStrategy::AsIs: return "as-is";
        case ResolveStrategy::Numbered: return "numbered";
        case ResolveStrategy::Timestamp: return "timestamp";
        case ResolveStrategy::Literal: return "literal";
        default: return "unknown";
    }
}

} // namespace arn

#endif // ARCHNAME_TYPES_H
