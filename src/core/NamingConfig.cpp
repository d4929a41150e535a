#include "archname/NamingConfig.h"
#include "archname/Exceptions.h"
#include "archname/Utf8.h"

namespace arn {

void NamingConfig::validate() const {
    if (hardCeiling == 0) {
        throw InvalidConfigException("hard ceiling must be positive");
    }
    if (targetBudget > hardCeiling) {
        throw InvalidConfigException("target budget " + std::to_string(targetBudget) +
                                     " exceeds hard ceiling " + std::to_string(hardCeiling));
    }
    if (targetBudget < minimumTotalBudget()) {
        throw InvalidConfigException("target budget " + std::to_string(targetBudget) +
                                     " is below the minimum of " +
                                     std::to_string(minimumTotalBudget()) + " bytes");
    }
    if (!extension.empty() && extension[0] != '.') {
        throw InvalidConfigException("extension must start with '.': " + extension);
    }
    if (maxNumberedSuffix == 0 || maxNumberedSuffix > 999) {
        throw InvalidConfigException("numbered suffix limit must be within 1..999");
    }
    if (placeholderStem.empty() || placeholderStem.size() > MIN_STEM_BYTES) {
        throw InvalidConfigException("placeholder stem must be 1.." +
                                     std::to_string(MIN_STEM_BYTES) + " bytes");
    }
    if (!Utf8::isValid(ellipsis) || !Utf8::isValid(connective) ||
        !Utf8::isValid(placeholderStem)) {
        throw InvalidConfigException("configured markers must be valid UTF-8");
    }
}

} // namespace arn
