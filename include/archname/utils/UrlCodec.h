#ifndef ARCHNAME_URL_CODEC_H
#define ARCHNAME_URL_CODEC_H

#include <string>
#include <string_view>
#include <vector>

namespace arn {

// Components of an absolute URL; empty when absent
struct UrlParts {
    std::string scheme;
    std::string host;
    std::string path;
    std::string query;
    std::string fragment;
};

/**
 * URL helpers for titles and filenames
 * - Percent encoding with only unreserved characters kept literal
 * - Detection of URL indicators inside titles
 * - Recovery of a URL from a title (marker, raw, encoded, or a
 *   domain/path shape such as "twitter.com_user_status_123")
 */
class UrlCodec {
public:
    /**
     * Percent-encode every byte outside A-Z a-z 0-9 - _ . ~
     * Hex digits are upper case.
     */
    static std::string percentEncode(std::string_view text);

    /**
     * Decode %XX escapes; malformed escapes are copied verbatim
     */
    static std::string percentDecode(std::string_view text);

    /**
     * Longest prefix length <= maxBytes that does not end inside a %XX triplet
     */
    static size_t safeCut(std::string_view encoded, size_t maxBytes);

    static std::string truncateEncoded(std::string_view encoded, size_t maxBytes);

    /**
     * Check a title for URL indicators:
     * "[URL]" marker, http(s)://, an encoded "%3A%2F%2F", or a known social domain
     */
    static bool hasUrlIndicators(std::string_view title);

    /**
     * Find a known social domain as a standalone token (case-insensitive)
     */
    static bool containsKnownDomain(std::string_view text);

    /**
     * Recover a URL from a title
     * @return Absolute URL, or empty string when none can be found
     */
    static std::string extractUrl(std::string_view title);

    /**
     * Remove URLs, encoded URLs, "[URL]" markers and domain/path fragments
     * Removed spans are replaced by a space.
     */
    static std::string stripUrls(std::string_view text);

    /**
     * Split an absolute URL into its components
     * Userinfo and port are dropped from the host.
     */
    static UrlParts split(std::string_view url);

    static const std::vector<std::string_view>& knownDomains();
};

} // namespace arn

#endif // ARCHNAME_URL_CODEC_H
