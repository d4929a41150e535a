#ifndef ARCHNAME_NAMING_FILENAME_ENGINE_H
#define ARCHNAME_NAMING_FILENAME_ENGINE_H

#include "archname/NamingConfig.h"
#include "archname/Types.h"
#include "archname/naming/FilenameAssembler.h"
#include "archname/naming/NameRegistry.h"
#include "archname/naming/SafeFilenameEncoder.h"
#include "archname/naming/UniquenessResolver.h"
#include "archname/text/TitleExtractor.h"
#include <string>
#include <string_view>
#include <utility>

namespace arn {

// Everything known about one assignment
struct NamingResult {
    std::string stem;
    std::string filename;               // stem + extension
    StructuredTitle title;
    AssemblyBranch branch = AssemblyBranch::Placeholder;
    ResolveStrategy strategy = ResolveStrategy::AsIs;
    size_t budget = 0;                  // Total budget actually applied
};

/**
 * Filename synthesis pipeline
 *
 *   sanitize -> extract -> assemble -> resolve -> encode
 *
 * The engine never throws for any title, URL or registry content. A
 * result that breaks the byte ceiling, UTF-8 validity or uniqueness is a
 * defect and raises InvariantViolationException.
 */
class FilenameEngine {
public:
    // Title bytes considered by the extractor
    static constexpr size_t MAX_TITLE_BYTES = 4096;

    /**
     * @param config Naming configuration
     * @throws InvalidConfigException if the configuration is inconsistent
     */
    explicit FilenameEngine(const NamingConfig& config = NamingConfig());

    const NamingConfig& config() const { return m_config; }

    /**
     * Sanitize and decompose a title
     */
    StructuredTitle analyze(std::string_view title) const;

    /**
     * Build the candidate stem for a title without consulting a registry
     * @param totalBudget Total budget including extension, 0 for the configured target
     */
    Candidate synthesize(std::string_view title, std::string_view url = {},
                         size_t totalBudget = 0) const;

    /**
     * Disambiguate a candidate stem against a registry (registry unchanged)
     */
    ResolvedName resolve(std::string_view candidate, const NameRegistry& registry,
                         size_t totalBudget = 0) const;

    /**
     * Full pipeline; the returned stem is inserted into the registry
     * @return Unique stem (callers append the extension)
     */
    std::string assign(std::string_view title, std::string_view url, NameRegistry& registry,
                       size_t totalBudget = 0) const;

    /**
     * Full pipeline with details of each stage
     */
    NamingResult assignDetailed(std::string_view title, std::string_view url,
                                NameRegistry& registry, size_t totalBudget = 0) const;

    /**
     * Budget applied for a requested total: 0 selects the target budget,
     * larger requests are capped at hardCeiling.
     * @throws InvalidParameterException below minimumTotalBudget
     */
    size_t effectiveBudget(size_t requested) const;

    std::string filename(const std::string& stem) const { return stem + m_config.extension; }

    void setClock(UniquenessResolver::Clock clock) { m_resolver.setClock(std::move(clock)); }

private:
    void verify(const std::string& stem, const NameRegistry& registry, size_t totalBudget) const;

    NamingConfig m_config;
    TitleExtractor m_extractor;
    FilenameAssembler m_assembler;
    UniquenessResolver m_resolver;
    SafeFilenameEncoder m_encoder;
};

} // namespace arn

#endif // ARCHNAME_NAMING_FILENAME_ENGINE_H
