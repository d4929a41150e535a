#include "archname/text/TitleExtractor.h"
#include "archname/text/Sanitizer.h"
#include "archname/utils/UrlCodec.h"
#include "archname/Utf8.h"
#include <utility>

namespace arn {

namespace {

const auto REGEX_FLAGS = std::regex::ECMAScript | std::regex::icase;

std::string asciiLower(std::string_view text) {
    std::string out(text);
    for (char& c : out) {
        if (c >= 'A' && c <= 'Z') {
            c = static_cast<char>(c + 0x20);
        }
    }
    return out;
}

std::string escapeRegex(std::string_view text) {
    static const std::string_view special = "\\^$.|?*+()[]{}";
    std::string out;
    for (char c : text) {
        if (special.find(c) != std::string_view::npos) {
            out += '\\';
        }
        out += c;
    }
    return out;
}

// Separators and quotation marks stripped from both ends of a segment
bool isTrimmable(char32_t cp) {
    switch (cp) {
        case ' ': case '_': case '-': case ':': case '|': case '/': case '\\':
        case '"': case '\'': case ',': case '~':
        case 0x00B7:                    // ·
        case 0x2018: case 0x2019:       // ‘ ’
        case 0x201C: case 0x201D:       // “ ”
        case 0x3001:                    // 、
        case 0x300C: case 0x300D:       // 「 」
        case 0x300E: case 0x300F:       // 『 』
        case 0xFF0C:                    // ，
        case 0xFF1A:                    // ：
            return true;
        default:
            return false;
    }
}

std::string trimSeparators(std::string_view text) {
    size_t first = std::string_view::npos;
    size_t lastEnd = 0;
    size_t pos = 0;
    char32_t cp;

    while (pos < text.size()) {
        size_t len = Utf8::decode(text, pos, cp);
        if (len == 0) {
            len = 1;
            cp = Utf8::INVALID;
        }
        if (!isTrimmable(cp)) {
            if (first == std::string_view::npos) {
                first = pos;
            }
            lastEnd = pos + len;
        }
        pos += len;
    }

    if (first == std::string_view::npos) {
        return "";
    }
    return std::string(text.substr(first, lastEnd - first));
}

// Byte offset and length of the first delimiter from the set, npos if absent
std::pair<size_t, size_t> findFirstOf(std::string_view text,
                                      const std::vector<std::string_view>& delimiters) {
    size_t best = std::string_view::npos;
    size_t bestLen = 0;
    for (const auto& delimiter : delimiters) {
        size_t pos = text.find(delimiter);
        if (pos < best) {
            best = pos;
            bestLen = delimiter.size();
        }
    }
    return {best, bestLen};
}

} // namespace

TitleExtractor::TitleExtractor(const NamingConfig& config)
    : m_config(config) {
    buildPatterns();
}

void TitleExtractor::buildPatterns() {
    const std::string connective = escapeRegex(m_config.connective);
    const std::string platforms =
        "X|Twitter|Instagram|LinkedIn|YouTube|TikTok|Reddit|Facebook|Threads|Bluesky|Weibo";

    auto add = [this](const char* name, const std::string& expression,
                      std::optional<Platform> platform, int platformGroup,
                      std::vector<int> userGroups, int contentGroup, bool splitsUser) {
        TitlePattern pattern;
        pattern.name = name;
        pattern.expression = std::regex(expression, REGEX_FLAGS);
        pattern.platform = platform;
        pattern.platformGroup = platformGroup;
        pattern.userGroups = std::move(userGroups);
        pattern.contentGroup = contentGroup;
        pattern.splitsUser = splitsUser;
        m_patterns.push_back(std::move(pattern));
    };

    // 1. Connective marker
    add("connective",
        "^\\s*([^\\s_]+)[ _]+" + connective + "[ _]+(.+)$",
        std::nullopt, 1, {}, -1, true);

    // 2. English connective with optional notification counter
    add("english_on",
        "^\\s*(?:\\([0-9]+\\)\\s*)?(.+?)\\s+on\\s+(" + platforms + ")\\s*(?::|\xEF\xBC\x9A)\\s*(.*)$",
        std::nullopt, 2, {1}, 3, false);

    // 3. Id-bearing URL shapes
    add("x_status",
        R"((?:x|twitter)\.com[/_]@?([A-Za-z0-9_]+?)[/_]status[/_][0-9]+)",
        Platform::X, -1, {1}, -1, false);
    add("tiktok_video",
        R"(tiktok\.com[/_]@([A-Za-z0-9_.]+?)[/_]video[/_][0-9]+)",
        Platform::TikTok, -1, {1}, -1, false);
    add("reddit_comments",
        R"(reddit\.com[/_]r[/_]([A-Za-z0-9_]+?)[/_]comments[/_][A-Za-z0-9]+)",
        Platform::Reddit, -1, {1}, -1, false);
    add("instagram_post",
        R"(instagram\.com[/_](?:([A-Za-z0-9_.]+?)[/_])?(?:p|reel)[/_][A-Za-z0-9_-]+)",
        Platform::Instagram, -1, {1}, -1, false);
    add("youtube_watch",
        R"(youtube\.com[/_]watch\?v=[A-Za-z0-9_-]+)",
        Platform::YouTube, -1, {}, -1, false);
    add("youtu_be",
        R"(youtu\.be[/_][A-Za-z0-9_-]{6,})",
        Platform::YouTube, -1, {}, -1, false);

    // 4. Domain-only shapes; '/' separators allow '_' inside the user
    add("youtube_channel",
        R"(youtube\.com(?:/@([A-Za-z0-9_.-]+)|_@([A-Za-z0-9.-]+)))",
        Platform::YouTube, -1, {1, 2}, -1, false);
    add("tiktok_profile",
        R"(tiktok\.com(?:/@([A-Za-z0-9_.]+)|_@([A-Za-z0-9.]+)))",
        Platform::TikTok, -1, {1, 2}, -1, false);
    add("reddit_domain",
        R"(reddit\.com(?:/(?:r|u)/([A-Za-z0-9_]+)|_(?:r|u)_([A-Za-z0-9]+)))",
        Platform::Reddit, -1, {1, 2}, -1, false);
    add("linkedin_domain",
        R"(linkedin\.com(?:/(?:in|company|posts)/([A-Za-z0-9_-]+)|_(?:in|company|posts)_([A-Za-z0-9-]+)))",
        Platform::LinkedIn, -1, {1, 2}, -1, false);
    add("instagram_domain",
        R"((?:^|[^A-Za-z0-9.])instagram\.com(?:/@?([A-Za-z0-9_.]+)|_@?([A-Za-z0-9.]+))?)",
        Platform::Instagram, -1, {1, 2}, -1, false);
    add("x_domain",
        R"((?:^|[^A-Za-z0-9.])(?:x|twitter)\.com(?:/@?([A-Za-z0-9_]+)|_@?([A-Za-z0-9]+))?(?![A-Za-z0-9]))",
        Platform::X, -1, {1, 2}, -1, false);
}

Platform TitleExtractor::platformFromToken(std::string_view token) {
    const std::string lower = asciiLower(token);
    if (lower == "x" || lower == "twitter" || lower == "x.com" || lower == "twitter.com" ||
        token == "\xE6\x8E\xA8\xE7\x89\xB9") {                 // 推特
        return Platform::X;
    }
    if (lower == "instagram" || lower == "ig" || lower == "instagram.com") {
        return Platform::Instagram;
    }
    if (lower == "linkedin" || lower == "linkedin.com" ||
        token == "\xE9\xA2\x86\xE8\x8B\xB1") {                 // 领英
        return Platform::LinkedIn;
    }
    if (lower == "youtube" || lower == "youtube.com" ||
        token == "\xE6\xB2\xB9\xE7\xAE\xA1") {                 // 油管
        return Platform::YouTube;
    }
    if (lower == "reddit" || lower == "reddit.com") {
        return Platform::Reddit;
    }
    if (lower == "tiktok" || lower == "tiktok.com") {
        return Platform::TikTok;
    }
    return Platform::Generic;
}

bool TitleExtractor::isStructuralKeyword(std::string_view token) {
    static const std::vector<std::string_view> keywords = {
        "status", "statuses", "watch", "p", "reel", "reels", "video", "videos",
        "comments", "posts", "post", "in", "r", "u", "user", "www", "com",
        "http", "https", "company", "channel", "c", "shorts", "i", "web",
        "home", "explore", "hashtag", "search",
    };
    const std::string lower = asciiLower(token);
    for (const auto& keyword : keywords) {
        if (lower == keyword) {
            return true;
        }
    }
    return false;
}

std::string TitleExtractor::cleanUser(std::string_view raw) const {
    std::vector<std::string> pieces;
    size_t start = 0;
    while (start <= raw.size()) {
        size_t end = raw.find_first_of("/\\", start);
        if (end == std::string_view::npos) {
            end = raw.size();
        }
        std::string piece = trimSeparators(raw.substr(start, end - start));
        while (!piece.empty() && piece[0] == '@') {
            piece.erase(0, 1);
        }
        if (!piece.empty() && !isStructuralKeyword(piece)) {
            pieces.push_back(piece);
        }
        start = end + 1;
    }

    std::string user;
    bool meaningful = false;
    for (const auto& piece : pieces) {
        if (!user.empty()) {
            user += '_';
        }
        user += piece;

        // "www_com" style leftovers carry no author
        size_t subStart = 0;
        while (subStart <= piece.size()) {
            size_t subEnd = piece.find('_', subStart);
            if (subEnd == std::string::npos) {
                subEnd = piece.size();
            }
            std::string_view sub(piece.data() + subStart, subEnd - subStart);
            if (!sub.empty() && !isStructuralKeyword(sub)) {
                meaningful = true;
            }
            subStart = subEnd + 1;
        }
    }

    user = trimSeparators(user);
    if (user.empty() || !meaningful) {
        return m_config.userPlaceholder;
    }
    return user;
}

std::string TitleExtractor::cleanContent(std::string_view raw) const {
    static const std::regex siteSuffix(R"(\s*/\s*(?:X|Twitter)\s*$)", REGEX_FLAGS);

    std::string content = UrlCodec::stripUrls(raw);
    content = std::regex_replace(content, siteSuffix, "");
    content = Sanitizer::collapseWhitespace(content);
    content = trimSeparators(content);

    if (content.empty()) {
        return m_config.contentPlaceholder;
    }
    return content;
}

void TitleExtractor::splitUserAndContent(std::string_view rest, std::string& user,
                                         std::string& content, bool& hasUser) const {
    static const std::vector<std::string_view> colons = {":", "\xEF\xBC\x9A"};
    static const std::vector<std::string_view> delimiters = {
        "_", " ", "\"", "'", "\xE2\x80\x9C", "\xE3\x80\x8C", "\xE3\x80\x8E",   // “ 「 『
    };

    hasUser = true;

    auto [colon, colonLen] = findFirstOf(rest, colons);
    if (colon != std::string_view::npos && colon <= USER_DELIMITER_WINDOW) {
        user = std::string(rest.substr(0, colon));
        content = std::string(rest.substr(colon + colonLen));
        return;
    }

    auto [delim, delimLen] = findFirstOf(rest, delimiters);
    if (delim != std::string_view::npos && delim <= USER_DELIMITER_WINDOW) {
        user = std::string(rest.substr(0, delim));
        content = std::string(rest.substr(delim + delimLen));
        return;
    }

    if (delim == std::string_view::npos && rest.size() <= USER_DELIMITER_WINDOW) {
        user = std::string(rest);
        content.clear();
        return;
    }

    // No short author token: everything is content
    hasUser = false;
    user.clear();
    content = std::string(rest);
}

StructuredTitle TitleExtractor::extract(std::string_view text) const {
    StructuredTitle result;
    result.text = std::string(text);
    result.content = result.text;

    if (text.empty()) {
        return result;
    }

    const std::string subject(text);
    std::smatch match;

    for (const auto& pattern : m_patterns) {
        if (!std::regex_search(subject, match, pattern.expression)) {
            continue;
        }

        Platform platform = Platform::Generic;
        std::string label;
        if (pattern.platformGroup >= 0 && match[pattern.platformGroup].matched) {
            std::string token = match.str(pattern.platformGroup);
            platform = platformFromToken(token);
            label = (platform == Platform::Generic) ? token : platformToString(platform);
        } else if (pattern.platform) {
            platform = *pattern.platform;
            label = platformToString(platform);
        }

        std::string rawUser;
        std::string rawContent;
        bool hasUser = false;

        if (pattern.splitsUser) {
            splitUserAndContent(match.str(2), rawUser, rawContent, hasUser);
        } else {
            for (int group : pattern.userGroups) {
                if (match[group].matched && match[group].length() > 0) {
                    rawUser = match.str(group);
                    hasUser = true;
                    break;
                }
            }
            rawContent = pattern.contentGroup >= 0 ? match.str(pattern.contentGroup) : subject;
        }

        result.platform = platform;
        result.platformLabel = label;
        result.rule = pattern.name;
        if (hasUser) {
            result.user = cleanUser(rawUser);
        }
        result.content = cleanContent(rawContent);
        return result;
    }

    return result;
}

} // namespace arn
