#include "archname/naming/FilenameAssembler.h"
#include "archname/utils/UrlCodec.h"
#include "archname/Utf8.h"

namespace arn {

namespace {

const char URL_MARKER[] = "_[URL]_";

} // namespace

FilenameAssembler::FilenameAssembler(const NamingConfig& config)
    : m_config(config),
      m_truncator(config.ellipsis),
      m_encoder(config) {
}

bool FilenameAssembler::selectsUrlBranch(const StructuredTitle& title, std::string_view sourceUrl,
                                         std::string& url) const {
    if (!m_config.urlBranchEnabled || !UrlCodec::hasUrlIndicators(title.text)) {
        return false;
    }
    url = sourceUrl.empty() ? UrlCodec::extractUrl(title.text) : std::string(sourceUrl);
    return !url.empty();
}

std::string FilenameAssembler::platformPart(const StructuredTitle& title) const {
    std::string label = title.platformLabel;
    if (label.empty() && title.platform) {
        label = platformToString(*title.platform);
    }
    return Utf8::truncateBytes(label, MAX_LABEL_BYTES);
}

Candidate FilenameAssembler::assemble(const StructuredTitle& title, std::string_view sourceUrl,
                                      size_t totalBudget) const {
    const size_t stemBudget = m_config.stemBudget(totalBudget);
    Candidate candidate;

    std::string url;
    if (selectsUrlBranch(title, sourceUrl, url)) {
        candidate.branch = AssemblyBranch::Url;
        candidate.url = url;
        candidate.stem = assembleUrl(title, url, stemBudget);
    } else if (title.isStructured() || !title.content.empty()) {
        candidate.branch = AssemblyBranch::Content;
        candidate.stem = assembleContent(title, stemBudget);
    }

    if (candidate.stem.empty()) {
        candidate.branch = AssemblyBranch::Placeholder;
        candidate.url.clear();
        candidate.stem = m_encoder.sanitizeCharacters(m_config.placeholderStem);
    }

    // Guard for configurations whose fixed parts alone overflow
    if (candidate.stem.size() > stemBudget) {
        candidate.stem = Utf8::truncateBytes(candidate.stem, stemBudget);
    }
    return candidate;
}

std::string FilenameAssembler::assembleUrl(const StructuredTitle& title, const std::string& url,
                                           size_t stemBudget) const {
    std::string platform;
    std::string user;
    if (title.isStructured()) {
        platform = platformPart(title);
        user = title.user.value_or(m_config.userPlaceholder);
    } else {
        platform = m_config.genericPlatform;
        user = m_config.contentPlaceholder;
    }

    const std::string encoded = UrlCodec::percentEncode(url);
    const std::string head = platform + "_" + m_config.connective + "_";
    const std::string marker = URL_MARKER;
    const std::string prefix = head + user + marker;

    if (prefix.size() + encoded.size() <= stemBudget) {
        return m_encoder.sanitizeCharacters(prefix + encoded);
    }

    // (a) Shorten the encoded URL
    if (prefix.size() + m_config.minContentBytes <= stemBudget) {
        return m_encoder.sanitizeCharacters(
            prefix + UrlCodec::truncateEncoded(encoded, stemBudget - prefix.size()));
    }

    // (b) Shorten the user
    const size_t fixed = head.size() + marker.size() + m_config.minContentBytes;
    if (fixed < stemBudget) {
        std::string shortUser = m_truncator.truncate(user, stemBudget - fixed);
        if (!shortUser.empty() && shortUser != m_truncator.ellipsis()) {
            const std::string shortPrefix = head + shortUser + marker;
            return m_encoder.sanitizeCharacters(
                shortPrefix + UrlCodec::truncateEncoded(encoded, stemBudget - shortPrefix.size()));
        }
    }

    // (c) Platform and URL fragment only
    const std::string collapsed = platform + marker;
    if (collapsed.size() < stemBudget) {
        return m_encoder.sanitizeCharacters(
            collapsed + UrlCodec::truncateEncoded(encoded, stemBudget - collapsed.size()));
    }
    return Utf8::truncateBytes(m_encoder.sanitizeCharacters(collapsed), stemBudget);
}

std::string FilenameAssembler::fitPrefixed(const std::string& prefix, std::string content,
                                           size_t stemBudget) const {
    std::string stem = m_encoder.sanitizeCharacters(prefix + content);

    // Re-truncate the content until the safe form fits
    while (stem.size() > stemBudget && !content.empty()) {
        const size_t reduction = (stem.size() - stemBudget) + m_truncator.reserve();
        const size_t next = content.size() > reduction ? content.size() - reduction : 0;
        content = next > 0 ? m_truncator.truncate(content, next) : std::string();
        stem = m_encoder.sanitizeCharacters(prefix + content);
    }

    if (stem.size() > stemBudget) {
        stem = Utf8::truncateBytes(stem, stemBudget);
    }
    return stem;
}

std::string FilenameAssembler::assembleContent(const StructuredTitle& title,
                                               size_t stemBudget) const {
    if (!title.isStructured()) {
        if (title.content.empty()) {
            return "";
        }
        return fitPrefixed("", m_truncator.truncate(title.content, stemBudget), stemBudget);
    }

    const std::string platform = platformPart(title);
    const std::string user = title.user.value_or(m_config.userPlaceholder);
    const std::string head = platform + "_" + m_config.connective + "_";
    const std::string prefix = head + user + "_";

    if (prefix.size() + m_config.minContentBytes <= stemBudget) {
        const std::string content = m_truncator.truncate(title.content, stemBudget - prefix.size());
        return fitPrefixed(prefix, content, stemBudget);
    }

    // Not enough room for meaningful content
    const std::string collapsed = head + user;
    if (collapsed.size() <= stemBudget) {
        return fitPrefixed(collapsed, "", stemBudget);
    }
    if (head.size() < stemBudget) {
        return fitPrefixed(head + m_truncator.truncate(user, stemBudget - head.size()), "", stemBudget);
    }
    return fitPrefixed(head, "", stemBudget);
}

} // namespace arn
