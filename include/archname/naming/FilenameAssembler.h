#ifndef ARCHNAME_NAMING_FILENAME_ASSEMBLER_H
#define ARCHNAME_NAMING_FILENAME_ASSEMBLER_H

#include "archname/NamingConfig.h"
#include "archname/Types.h"
#include "archname/naming/SafeFilenameEncoder.h"
#include "archname/text/SemanticTruncator.h"
#include <string>
#include <string_view>

namespace arn {

// Stem proposed by the assembler, before disambiguation
struct Candidate {
    std::string stem;
    AssemblyBranch branch = AssemblyBranch::Placeholder;
    std::string url;            // URL used by the URL branch
};

/**
 * Recombines a structured title into one filesystem-safe stem
 *
 * URL branch (title carries URL indicators and a URL is known):
 *     {platform}_上的_{user}_[URL]_{percent-encoded url}
 * Content branch:
 *     {platform}_上的_{user}_{content}, or the content alone without a platform
 *
 * The returned stem already went through the encoder's character pass and
 * fits the stem budget of the given total budget.
 */
class FilenameAssembler {
public:
    // Platform tokens longer than this are cut
    static constexpr size_t MAX_LABEL_BYTES = 32;

    explicit FilenameAssembler(const NamingConfig& config = NamingConfig());

    /**
     * Build a candidate
     * @param title Structured title
     * @param sourceUrl Source URL, may be empty
     * @param totalBudget Total byte budget including the extension
     */
    Candidate assemble(const StructuredTitle& title, std::string_view sourceUrl,
                       size_t totalBudget) const;

    /**
     * Decide whether the URL branch applies
     * @param url Receives the URL to encode when it does
     */
    bool selectsUrlBranch(const StructuredTitle& title, std::string_view sourceUrl,
                          std::string& url) const;

private:
    std::string platformPart(const StructuredTitle& title) const;
    std::string assembleUrl(const StructuredTitle& title, const std::string& url,
                            size_t stemBudget) const;
    std::string assembleContent(const StructuredTitle& title, size_t stemBudget) const;
    std::string fitPrefixed(const std::string& prefix, std::string content,
                            size_t stemBudget) const;

    NamingConfig m_config;
    SemanticTruncator m_truncator;
    SafeFilenameEncoder m_encoder;
};

} // namespace arn

#endif // ARCHNAME_NAMING_FILENAME_ASSEMBLER_H
