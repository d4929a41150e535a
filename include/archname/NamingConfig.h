#ifndef ARCHNAME_NAMING_CONFIG_H
#define ARCHNAME_NAMING_CONFIG_H

#include <cstddef>
#include <string>

namespace arn {

/**
 * Budgets and strategy toggles for filename synthesis
 *
 * All budgets are UTF-8 byte counts. The total budget always includes
 * the extension: the extension's bytes are reserved before any truncation
 * decision is made.
 */
struct NamingConfig {
    // Smallest stem budget the resolver can always satisfy
    static constexpr size_t MIN_STEM_BYTES = 16;

    size_t targetBudget = 150;          // Total bytes (stem + extension)
    size_t hardCeiling = 255;           // Filesystem name limit (stem + extension)
    size_t minContentBytes = 20;        // Below this, skip the content segment
    std::string extension = ".html";
    std::string ellipsis = "\xE2\x80\xA6";                 // "…"
    std::string connective = "\xE4\xB8\x8A\xE7\x9A\x84";   // "上的"
    std::string placeholderStem = "untitled";
    std::string contentPlaceholder = "Content";
    std::string userPlaceholder = "user";
    std::string genericPlatform = "Web";
    unsigned maxNumberedSuffix = 999;
    bool urlBranchEnabled = true;
    size_t similarGroupBonus = 20;

    /**
     * Stem bytes available under a total budget
     * @param totalBudget Total budget including the extension
     * @return Budget minus extension bytes (0 if the extension alone overflows)
     */
    size_t stemBudget(size_t totalBudget) const {
        return totalBudget > extension.size() ? totalBudget - extension.size() : 0;
    }

    /**
     * Stem bytes available under the configured target budget
     */
    size_t stemBudget() const { return stemBudget(targetBudget); }

    /**
     * Smallest total budget accepted by the engine
     */
    size_t minimumTotalBudget() const { return MIN_STEM_BYTES + extension.size(); }

    /**
     * Check all fields for consistency
     * @throws InvalidConfigException describing the first problem found
     */
    void validate() const;
};

} // namespace arn

#endif // ARCHNAME_NAMING_CONFIG_H
