#include "archname/naming/NameRegistry.h"
#include "archname/Utf8.h"

namespace arn {

NameRegistry::NameRegistry(const std::vector<std::string>& stems) {
    for (const auto& stem : stems) {
        insert(stem);
    }
}

std::string NameRegistry::normalize(std::string_view stem) {
    return Utf8::toLower(stem);
}

bool NameRegistry::contains(std::string_view stem) const {
    return m_names.find(normalize(stem)) != m_names.end();
}

bool NameRegistry::insert(std::string_view stem) {
    return m_names.insert(normalize(stem)).second;
}

} // namespace arn
