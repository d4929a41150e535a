#include "archname/batch/TitleSources.h"
#include "archname/text/Sanitizer.h"
#include "archname/utils/UrlCodec.h"
#include "archname/Utf8.h"
#include <cstdint>

namespace arn {

namespace {

std::string asciiLower(std::string_view text) {
    std::string out(text);
    for (char& c : out) {
        if (c >= 'A' && c <= 'Z') {
            c = static_cast<char>(c + 0x20);
        }
    }
    return out;
}

bool endsWith(std::string_view text, std::string_view suffix) {
    return text.size() >= suffix.size() &&
           text.compare(text.size() - suffix.size(), suffix.size(), suffix) == 0;
}

std::string_view trimChars(std::string_view text, std::string_view chars) {
    while (!text.empty() && chars.find(text.front()) != std::string_view::npos) {
        text.remove_prefix(1);
    }
    while (!text.empty() && chars.find(text.back()) != std::string_view::npos) {
        text.remove_suffix(1);
    }
    return text;
}

// Parse "#123" / "#x1F" into a codepoint, INVALID on error
char32_t parseNumericReference(std::string_view ref) {
    if (ref.size() < 2 || ref[0] != '#') {
        return Utf8::INVALID;
    }
    int base = 10;
    size_t pos = 1;
    if (ref[1] == 'x' || ref[1] == 'X') {
        base = 16;
        pos = 2;
    }
    if (pos >= ref.size()) {
        return Utf8::INVALID;
    }

    uint32_t value = 0;
    for (; pos < ref.size(); ++pos) {
        char c = ref[pos];
        int digit;
        if (c >= '0' && c <= '9') {
            digit = c - '0';
        } else if (base == 16 && c >= 'a' && c <= 'f') {
            digit = c - 'a' + 10;
        } else if (base == 16 && c >= 'A' && c <= 'F') {
            digit = c - 'A' + 10;
        } else {
            return Utf8::INVALID;
        }
        value = value * static_cast<uint32_t>(base) + static_cast<uint32_t>(digit);
        if (value > 0x10FFFF) {
            return Utf8::INVALID;
        }
    }

    if (value == 0 || (value >= 0xD800 && value <= 0xDFFF)) {
        return Utf8::INVALID;
    }
    return value;
}

} // namespace

std::string TitleSources::fromArchivedFilename(std::string_view filename) {
    std::string_view base = filename;
    const std::string lower = asciiLower(base);
    if (endsWith(lower, ".html")) {
        base.remove_suffix(5);
    } else if (endsWith(lower, ".htm")) {
        base.remove_suffix(4);
    }

    // "(title) [URL] encoded_url"
    if (!base.empty() && base.front() == '(') {
        size_t close = base.find(')');
        if (close != std::string_view::npos && close > 1) {
            return std::string(base.substr(1, close - 1));
        }
    }

    size_t marker = base.find("[URL]");
    if (marker != std::string_view::npos) {
        std::string_view title = trimChars(base.substr(0, marker), " _");
        if (!title.empty()) {
            return std::string(title);
        }
    }

    return std::string(base);
}

std::string TitleSources::decodeEntities(std::string_view text) {
    std::string out;
    out.reserve(text.size());

    size_t i = 0;
    while (i < text.size()) {
        if (text[i] != '&') {
            out += text[i++];
            continue;
        }

        size_t semi = text.find(';', i + 1);
        if (semi == std::string_view::npos || semi - i > 10) {
            out += text[i++];
            continue;
        }

        std::string_view name = text.substr(i + 1, semi - i - 1);
        if (name == "amp") {
            out += '&';
        } else if (name == "lt") {
            out += '<';
        } else if (name == "gt") {
            out += '>';
        } else if (name == "quot") {
            out += '"';
        } else if (name == "apos") {
            out += '\'';
        } else if (name == "nbsp") {
            Utf8::append(out, 0xA0);
        } else {
            char32_t cp = parseNumericReference(name);
            if (cp == Utf8::INVALID) {
                out += text[i++];
                continue;
            }
            Utf8::append(out, cp);
        }
        i = semi + 1;
    }
    return out;
}

std::string TitleSources::fromHtml(std::string_view html) {
    const std::string lower = asciiLower(html);

    size_t open = lower.find("<title");
    while (open != std::string::npos) {
        size_t after = open + 6;
        if (after < lower.size() &&
            (lower[after] == '>' || lower[after] == ' ' || lower[after] == '\t' ||
             lower[after] == '\n' || lower[after] == '\r')) {
            break;
        }
        open = lower.find("<title", after);
    }
    if (open == std::string::npos) {
        return "";
    }

    size_t contentStart = lower.find('>', open);
    if (contentStart == std::string::npos) {
        return "";
    }
    ++contentStart;

    size_t close = lower.find("</title", contentStart);
    if (close == std::string::npos) {
        return "";
    }

    return Sanitizer::collapseWhitespace(
        decodeEntities(html.substr(contentStart, close - contentStart)));
}

std::string TitleSources::fallbackFromUrl(std::string_view url) {
    std::string_view trimmed = trimChars(url, " \t\r\n");
    if (trimmed.empty()) {
        return "archived_page";
    }

    UrlParts parts = UrlCodec::split(trimmed);
    if (parts.host.empty()) {
        return "page";
    }

    std::string title = parts.host + parts.path;
    while (title.size() > parts.host.size() && title.back() == '/') {
        title.pop_back();
    }
    if (!parts.query.empty()) {
        title += "?" + parts.query;
    }
    return title;
}

std::string TitleSources::derive(std::string_view html, std::string_view url) {
    std::string title = fromHtml(html);
    if (!title.empty()) {
        return title;
    }
    return fallbackFromUrl(url);
}

} // namespace arn
