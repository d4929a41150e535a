#include "archname/naming/UniquenessResolver.h"
#include <algorithm>
#include <cstdio>
#include <utility>
#include <vector>

namespace arn {

UniquenessResolver::UniquenessResolver(const NamingConfig& config)
    : m_config(config),
      m_truncator(config.ellipsis),
      m_clock(TimestampUtils::systemClock()) {
}

std::string UniquenessResolver::numberedSuffix(unsigned number) {
    char buf[16];
    std::snprintf(buf, sizeof(buf), "_%03u", number);
    return buf;
}

std::string UniquenessResolver::fitStem(std::string_view stem, size_t suffixBytes,
                                        size_t stemBudget) const {
    if (suffixBytes >= stemBudget) {
        return "";
    }
    return m_truncator.truncate(stem, stemBudget - suffixBytes);
}

ResolvedName UniquenessResolver::resolve(std::string_view candidate, const NameRegistry& registry,
                                         size_t totalBudget) const {
    const size_t stemBudget = m_config.stemBudget(totalBudget);
    ResolvedName result;

    auto probe = [&](const std::string& stem, ResolveStrategy strategy) {
        ++result.attempts;
        if (stem.empty() || stem.size() > stemBudget || registry.contains(stem)) {
            return false;
        }
        result.stem = stem;
        result.strategy = strategy;
        return true;
    };

    // 1. As is
    const std::string base = m_truncator.truncate(candidate, stemBudget);
    if (probe(base, ResolveStrategy::AsIs)) {
        return result;
    }

    // 2. Numbered suffixes; all share one width up to 999
    std::string numberedBase;
    size_t numberedBaseFor = 0;
    for (unsigned n = 1; n <= m_config.maxNumberedSuffix; ++n) {
        const std::string suffix = numberedSuffix(n);
        if (suffix.size() != numberedBaseFor) {
            numberedBase = fitStem(base, suffix.size(), stemBudget);
            numberedBaseFor = suffix.size();
        }
        if (probe(numberedBase + suffix, ResolveStrategy::Numbered)) {
            return result;
        }
    }

    // 3. Timestamps, coarse to fine
    const auto now = m_clock();
    const std::vector<std::string> stamps = {
        TimestampUtils::formatTime(now),
        TimestampUtils::formatDateTime(now),
        TimestampUtils::formatDateTimeMicros(now),
    };
    for (const auto& stamp : stamps) {
        const std::string suffix = "_" + stamp;
        if (suffix.size() >= stemBudget) {
            continue;
        }
        if (probe(fitStem(base, suffix.size(), stemBudget) + suffix, ResolveStrategy::Timestamp)) {
            return result;
        }
    }

    // 4. Timestamp literal with a counter
    const int64_t micros = TimestampUtils::microsSinceEpoch(now);
    const std::string digits = TimestampUtils::toBase36(static_cast<uint64_t>(micros < 0 ? -micros : micros));
    for (uint64_t counter = 1;; ++counter) {
        const std::string suffix = "_" + TimestampUtils::toBase36(counter);
        std::string stamp = digits;
        if (1 + stamp.size() + suffix.size() > stemBudget) {
            // Keep the fastest-changing digits
            size_t room = stemBudget > suffix.size() + 1 ? stemBudget - suffix.size() - 1 : 0;
            stamp = stamp.substr(stamp.size() - std::min(room, stamp.size()));
        }
        if (probe("t" + stamp + suffix, ResolveStrategy::Literal)) {
            return result;
        }
    }
}

} // namespace arn
