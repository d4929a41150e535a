#ifndef ARCHNAME_NAMING_UNIQUENESS_RESOLVER_H
#define ARCHNAME_NAMING_UNIQUENESS_RESOLVER_H

#include "archname/NamingConfig.h"
#include "archname/Types.h"
#include "archname/naming/NameRegistry.h"
#include "archname/text/SemanticTruncator.h"
#include "archname/utils/TimestampUtils.h"
#include <string>
#include <string_view>
#include <utility>

namespace arn {

/**
 * Disambiguates a candidate stem against a registry
 *
 * Strategy chain, first free name wins:
 * 1. Candidate as is
 * 2. _001 .. _999 (stem shortened to leave room for the suffix)
 * 3. _HHMMSS, _YYYYMMDDHHMMSS, _YYYYMMDDHHMMSSffffff (UTC)
 * 4. t<base36 microseconds>_<base36 counter>, counting until free
 *
 * Always terminates: the registry is finite and step 4 is unbounded.
 */
class UniquenessResolver {
public:
    using Clock = TimestampUtils::Clock;

    explicit UniquenessResolver(const NamingConfig& config = NamingConfig());

    /**
     * Find a stem not present in the registry
     * @param candidate Filesystem-safe stem
     * @param registry Names already in use (not modified)
     * @param totalBudget Total byte budget including the extension
     * @return Free stem with strategy and number of registry probes
     */
    ResolvedName resolve(std::string_view candidate, const NameRegistry& registry,
                         size_t totalBudget) const;

    /**
     * Replace the time source used by the timestamp strategies
     */
    void setClock(Clock clock) { m_clock = std::move(clock); }

    /**
     * "_001" style suffix (at least three digits)
     */
    static std::string numberedSuffix(unsigned number);

private:
    std::string fitStem(std::string_view stem, size_t suffixBytes, size_t stemBudget) const;

    NamingConfig m_config;
    SemanticTruncator m_truncator;
    Clock m_clock;
};

} // namespace arn

#endif // ARCHNAME_NAMING_UNIQUENESS_RESOLVER_H
