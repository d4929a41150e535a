#ifndef ARCHNAME_BATCH_TITLE_SOURCES_H
#define ARCHNAME_BATCH_TITLE_SOURCES_H

#include <string>
#include <string_view>

namespace arn {

/**
 * Where a title comes from when none is supplied directly
 */
class TitleSources {
public:
    /**
     * Recover the title from an archived filename
     * - "(title) [URL] ..." yields title
     * - "title [URL] ..." yields the part before the marker
     * - anything else yields the stem
     * @param filename File name with or without a .html/.htm extension
     */
    static std::string fromArchivedFilename(std::string_view filename);

    /**
     * Text of the first <title> element, entities decoded and whitespace
     * collapsed; empty when there is none
     */
    static std::string fromHtml(std::string_view html);

    /**
     * host + path (+ "?" + query); "page" without a host,
     * "archived_page" for an empty URL
     */
    static std::string fallbackFromUrl(std::string_view url);

    /**
     * fromHtml(), falling back to fallbackFromUrl()
     */
    static std::string derive(std::string_view html, std::string_view url);

    /**
     * Decode the common named entities and numeric character references
     * Unknown or malformed references are kept verbatim.
     */
    static std::string decodeEntities(std::string_view text);
};

} // namespace arn

#endif // ARCHNAME_BATCH_TITLE_SOURCES_H
