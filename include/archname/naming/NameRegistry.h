#ifndef ARCHNAME_NAMING_NAME_REGISTRY_H
#define ARCHNAME_NAMING_NAME_REGISTRY_H

#include <cstddef>
#include <string>
#include <string_view>
#include <unordered_set>
#include <vector>

namespace arn {

/**
 * Case-insensitive set of stems already issued or present on disk
 *
 * Append-only for the lifetime of a batch. Not synchronized: callers that
 * share one registry between threads must serialize access.
 */
class NameRegistry {
public:
    NameRegistry() = default;
    explicit NameRegistry(const std::vector<std::string>& stems);

    bool contains(std::string_view stem) const;

    /**
     * Add a stem
     * @return false if an equal (case-folded) stem was already present
     */
    bool insert(std::string_view stem);

    size_t size() const { return m_names.size(); }
    bool empty() const { return m_names.empty(); }

    /**
     * Comparison key used by the registry
     */
    static std::string normalize(std::string_view stem);

private:
    std::unordered_set<std::string> m_names;
};

} // namespace arn

#endif // ARCHNAME_NAMING_NAME_REGISTRY_H
