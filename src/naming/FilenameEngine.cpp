#include "archname/naming/FilenameEngine.h"
#include "archname/Exceptions.h"
#include "archname/Utf8.h"
#include "archname/text/Sanitizer.h"
#include <algorithm>

namespace arn {

namespace {

const NamingConfig& validated(const NamingConfig& config) {
    config.validate();
    return config;
}

} // namespace

FilenameEngine::FilenameEngine(const NamingConfig& config)
    : m_config(validated(config)),
      m_extractor(config),
      m_assembler(config),
      m_resolver(config),
      m_encoder(config) {
}

size_t FilenameEngine::effectiveBudget(size_t requested) const {
    if (requested == 0) {
        return m_config.targetBudget;
    }
    if (requested < m_config.minimumTotalBudget()) {
        throw InvalidParameterException("budget of " + std::to_string(requested) +
                                        " bytes is below the minimum of " +
                                        std::to_string(m_config.minimumTotalBudget()));
    }
    return std::min(requested, m_config.hardCeiling);
}

StructuredTitle FilenameEngine::analyze(std::string_view title) const {
    std::string clean = Sanitizer::sanitize(title);
    if (clean.size() > MAX_TITLE_BYTES) {
        clean.resize(Utf8::floorBoundary(clean, MAX_TITLE_BYTES));
    }
    return m_extractor.extract(clean);
}

Candidate FilenameEngine::synthesize(std::string_view title, std::string_view url,
                                     size_t totalBudget) const {
    return m_assembler.assemble(analyze(title), url, effectiveBudget(totalBudget));
}

ResolvedName FilenameEngine::resolve(std::string_view candidate, const NameRegistry& registry,
                                     size_t totalBudget) const {
    return m_resolver.resolve(candidate, registry, effectiveBudget(totalBudget));
}

void FilenameEngine::verify(const std::string& stem, const NameRegistry& registry,
                            size_t totalBudget) const {
    const size_t total = stem.size() + m_config.extension.size();
    if (total > m_config.hardCeiling || total > totalBudget) {
        throw InvariantViolationException("name of " + std::to_string(total) +
                                          " bytes exceeds budget " + std::to_string(totalBudget));
    }
    if (stem.empty() || !Utf8::isValid(stem)) {
        throw InvariantViolationException("name is empty or not valid UTF-8");
    }
    if (registry.contains(stem)) {
        throw InvariantViolationException("name already issued: " + stem);
    }
}

NamingResult FilenameEngine::assignDetailed(std::string_view title, std::string_view url,
                                            NameRegistry& registry, size_t totalBudget) const {
    NamingResult result;
    result.budget = effectiveBudget(totalBudget);
    result.title = analyze(title);

    Candidate candidate = m_assembler.assemble(result.title, url, result.budget);
    result.branch = candidate.branch;

    ResolvedName resolved = m_resolver.resolve(candidate.stem, registry, result.budget);
    result.strategy = resolved.strategy;

    // No-op unless the hard ceiling is hit
    result.stem = m_encoder.encode(resolved.stem);
    verify(result.stem, registry, result.budget);

    registry.insert(result.stem);
    result.filename = filename(result.stem);
    return result;
}

std::string FilenameEngine::assign(std::string_view title, std::string_view url,
                                   NameRegistry& registry, size_t totalBudget) const {
    return assignDetailed(title, url, registry, totalBudget).stem;
}

} // namespace arn
