#include "archname/utils/UrlCodec.h"
#include <regex>

namespace arn {

namespace {

const char HEX_DIGITS[] = "0123456789ABCDEF";

bool isUnreserved(unsigned char c) {
    return (c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z') || (c >= '0' && c <= '9') ||
           c == '-' || c == '_' || c == '.' || c == '~';
}

int hexValue(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

bool isAsciiAlnum(char c) {
    return (c >= '0' && c <= '9') || (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z');
}

std::string asciiLower(std::string_view text) {
    std::string out(text);
    for (char& c : out) {
        if (c >= 'A' && c <= 'Z') {
            c = static_cast<char>(c + 0x20);
        }
    }
    return out;
}

bool isSpace(char c) {
    return c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\f' || c == '\v';
}

// Trailing characters that close a sentence or bracket rather than the URL
std::string trimUrlTail(std::string url) {
    static const std::string_view tail = ")]}>\"'.,;:!?";
    while (!url.empty() && tail.find(url.back()) != std::string_view::npos) {
        url.pop_back();
    }
    return url;
}

struct DomainShape {
    std::regex pattern;
    const char* format;
};

// Domain/path shapes with '/' or '_' separators, rebuilt into canonical URLs
const std::vector<DomainShape>& domainShapes() {
    static const auto flags = std::regex::ECMAScript | std::regex::icase;
    static const std::vector<DomainShape> shapes = {
        {std::regex(R"((?:x|twitter)\.com[/_]([A-Za-z0-9_]+?)[/_]status[/_]([0-9]+))", flags),
         "https://x.com/$1/status/$2"},
        {std::regex(R"(tiktok\.com[/_]@([A-Za-z0-9_.]+?)[/_]video[/_]([0-9]+))", flags),
         "https://tiktok.com/@$1/video/$2"},
        {std::regex(R"(reddit\.com[/_]r[/_]([A-Za-z0-9_]+?)[/_]comments[/_]([a-z0-9]+))", flags),
         "https://reddit.com/r/$1/comments/$2"},
        {std::regex(R"(instagram\.com[/_](?:[A-Za-z0-9_.]+[/_])?(p|reel)[/_]([A-Za-z0-9_-]+))", flags),
         "https://instagram.com/$1/$2"},
        {std::regex(R"(youtube\.com[/_]watch\?v=([A-Za-z0-9_-]{6,}))", flags),
         "https://youtube.com/watch?v=$1"},
        {std::regex(R"(youtu\.be[/_]([A-Za-z0-9_-]{6,}))", flags),
         "https://youtu.be/$1"},
    };
    return shapes;
}

} // namespace

const std::vector<std::string_view>& UrlCodec::knownDomains() {
    static const std::vector<std::string_view> domains = {
        "x.com", "twitter.com", "instagram.com", "youtube.com", "youtu.be",
        "tiktok.com", "reddit.com", "linkedin.com", "facebook.com", "weibo.com",
    };
    return domains;
}

std::string UrlCodec::percentEncode(std::string_view text) {
    std::string out;
    out.reserve(text.size() * 3);
    for (char ch : text) {
        auto c = static_cast<unsigned char>(ch);
        if (isUnreserved(c)) {
            out += ch;
        } else {
            out += '%';
            out += HEX_DIGITS[c >> 4];
            out += HEX_DIGITS[c & 0x0F];
        }
    }
    return out;
}

std::string UrlCodec::percentDecode(std::string_view text) {
    std::string out;
    out.reserve(text.size());
    for (size_t i = 0; i < text.size(); ++i) {
        if (text[i] == '%' && i + 2 < text.size()) {
            int hi = hexValue(text[i + 1]);
            int lo = hexValue(text[i + 2]);
            if (hi >= 0 && lo >= 0) {
                out += static_cast<char>((hi << 4) | lo);
                i += 2;
                continue;
            }
        }
        out += text[i];
    }
    return out;
}

size_t UrlCodec::safeCut(std::string_view encoded, size_t maxBytes) {
    if (maxBytes >= encoded.size()) {
        return encoded.size();
    }
    size_t cut = maxBytes;
    if (cut >= 1 && encoded[cut - 1] == '%') {
        cut -= 1;
    } else if (cut >= 2 && encoded[cut - 2] == '%') {
        cut -= 2;
    }
    return cut;
}

std::string UrlCodec::truncateEncoded(std::string_view encoded, size_t maxBytes) {
    return std::string(encoded.substr(0, safeCut(encoded, maxBytes)));
}

bool UrlCodec::containsKnownDomain(std::string_view text) {
    const std::string lower = asciiLower(text);
    for (const auto& domain : knownDomains()) {
        size_t pos = lower.find(domain);
        while (pos != std::string::npos) {
            bool leftOk = (pos == 0) || !isAsciiAlnum(lower[pos - 1]);
            size_t end = pos + domain.size();
            bool rightOk = (end >= lower.size()) || !isAsciiAlnum(lower[end]);
            if (leftOk && rightOk) {
                return true;
            }
            pos = lower.find(domain, pos + 1);
        }
    }
    return false;
}

bool UrlCodec::hasUrlIndicators(std::string_view title) {
    if (title.find("[URL]") != std::string_view::npos) {
        return true;
    }
    const std::string lower = asciiLower(title);
    if (lower.find("http://") != std::string::npos ||
        lower.find("https://") != std::string::npos ||
        lower.find("%3a%2f%2f") != std::string::npos) {
        return true;
    }
    return containsKnownDomain(title);
}

std::string UrlCodec::extractUrl(std::string_view title) {
    // 1. "[URL]" marker followed by an encoded or raw URL token
    size_t marker = title.find("[URL]");
    if (marker != std::string_view::npos) {
        size_t start = marker + 5;
        while (start < title.size() && (title[start] == '_' || isSpace(title[start]))) {
            ++start;
        }
        size_t end = start;
        while (end < title.size() && !isSpace(title[end])) {
            ++end;
        }
        std::string token(title.substr(start, end - start));
        if (!token.empty()) {
            const std::string lower = asciiLower(token);
            if (lower.find("%2f") != std::string::npos || lower.find("%3a") != std::string::npos) {
                std::string decoded = percentDecode(token);
                if (asciiLower(decoded).rfind("http", 0) != 0) {
                    decoded = "https://" + decoded;
                }
                return trimUrlTail(decoded);
            }
            if (lower.rfind("http://", 0) == 0 || lower.rfind("https://", 0) == 0) {
                return trimUrlTail(token);
            }
        }
    }

    const std::string text(title);
    std::smatch match;

    // 2. Raw URL
    static const std::regex rawUrl(R"(https?://[^\s]+)", std::regex::ECMAScript | std::regex::icase);
    if (std::regex_search(text, match, rawUrl)) {
        return trimUrlTail(match.str(0));
    }

    // 3. Encoded URL
    static const std::regex encodedUrl(R"(https?%3A%2F%2F[A-Za-z0-9%._~-]+)",
                                       std::regex::ECMAScript | std::regex::icase);
    if (std::regex_search(text, match, encodedUrl)) {
        return trimUrlTail(percentDecode(match.str(0)));
    }

    // 4. Domain/path shape
    for (const auto& shape : domainShapes()) {
        if (std::regex_search(text, match, shape.pattern)) {
            return match.format(shape.format);
        }
    }

    return "";
}

std::string UrlCodec::stripUrls(std::string_view text) {
    static const auto flags = std::regex::ECMAScript | std::regex::icase;
    static const std::regex markerWithToken(R"(\[URL\][ _]*[^\s]*)", flags);
    static const std::regex rawUrl(R"(https?://[^\s]+)", flags);
    static const std::regex encodedUrl(R"(https?%3A%2F%2F[A-Za-z0-9%._~-]*)", flags);
    // '_'-joined shapes stop after the user and any "_status_<id>" style pairs
    static const std::regex domainFragment(
        R"((^|[^A-Za-z0-9.])(?:www\.)?(?:(?:x|twitter|instagram|youtube|tiktok|reddit|linkedin|facebook|weibo)\.com|youtu\.be))"
        R"((?:/[^\s]*|_(?:(?:r|u|in|company|posts|user|channel|c|p|reel)_)*@?[A-Za-z0-9.?=&%-]+)"
        R"((?:_(?:status|statuses|video|videos|comments|p|reel|reels|shorts|watch|posts)_[A-Za-z0-9.?=&%-]+)*)?)"
        R"((?![A-Za-z0-9]))",
        flags);

    std::string out(text);
    out = std::regex_replace(out, markerWithToken, " ");
    out = std::regex_replace(out, rawUrl, " ");
    out = std::regex_replace(out, encodedUrl, " ");
    out = std::regex_replace(out, domainFragment, "$1 ");
    return out;
}

UrlParts UrlCodec::split(std::string_view url) {
    UrlParts parts;
    std::string_view rest = url;

    size_t schemeEnd = rest.find("://");
    if (schemeEnd != std::string_view::npos) {
        parts.scheme = asciiLower(rest.substr(0, schemeEnd));
        rest.remove_prefix(schemeEnd + 3);

        size_t hostEnd = rest.find_first_of("/?#");
        std::string_view authority = rest.substr(0, hostEnd);
        rest.remove_prefix(hostEnd == std::string_view::npos ? rest.size() : hostEnd);

        size_t at = authority.rfind('@');
        if (at != std::string_view::npos) {
            authority.remove_prefix(at + 1);
        }
        size_t colon = authority.find(':');
        parts.host = asciiLower(authority.substr(0, colon));
    }

    size_t hash = rest.find('#');
    if (hash != std::string_view::npos) {
        parts.fragment = std::string(rest.substr(hash + 1));
        rest = rest.substr(0, hash);
    }
    size_t question = rest.find('?');
    if (question != std::string_view::npos) {
        parts.query = std::string(rest.substr(question + 1));
        rest = rest.substr(0, question);
    }
    parts.path = std::string(rest);
    return parts;
}

} // namespace arn
