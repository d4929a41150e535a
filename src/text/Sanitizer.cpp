#include "archname/text/Sanitizer.h"
#include "archname/Utf8.h"

namespace arn {

const std::vector<CodepointRange>& Sanitizer::emojiRanges() {
    static const std::vector<CodepointRange> ranges = {
        {0x200D, 0x200D},       // Zero width joiner
        {0x20E3, 0x20E3},       // Combining enclosing keycap
        {0x231A, 0x231B},       // Watch, hourglass
        {0x23E9, 0x23FA},       // Media control symbols
        {0x2700, 0x27BF},       // Dingbats
        {0xFE00, 0xFE0F},       // Variation selectors
        {0x1F000, 0x1F02F},     // Mahjong tiles
        {0x1F0A0, 0x1F0FF},     // Playing cards
        {0x1F170, 0x1F1FF},     // Squared letters, regional indicators
        {0x1F200, 0x1F2FF},     // Enclosed ideographic supplement
        {0x1F300, 0x1F5FF},     // Misc symbols and pictographs
        {0x1F600, 0x1F64F},     // Emoticons
        {0x1F650, 0x1F67F},     // Ornamental dingbats
        {0x1F680, 0x1F6FF},     // Transport and map symbols
        {0x1F780, 0x1F7FF},     // Geometric shapes extended
        {0x1F900, 0x1F9FF},     // Supplemental symbols and pictographs
        {0x1FA70, 0x1FAFF},     // Symbols and pictographs extended-A
        {0xE0020, 0xE007F},     // Tag characters
        {0xE0100, 0xE01EF},     // Variation selectors supplement
    };
    return ranges;
}

const std::vector<NamedSymbol>& Sanitizer::namedSymbols() {
    static const std::vector<NamedSymbol> symbols = {
        {0x00B0, 0x00B0, "DEGREE SIGN"},
        {0x00A9, 0x00A9, "COPYRIGHT SIGN"},
        {0x2122, 0x2122, "TRADE MARK SIGN"},
        {0x2600, 0x2600, "BLACK SUN WITH RAYS"},
        {0x2601, 0x2601, "CLOUD"},
        {0x2602, 0x2602, "UMBRELLA"},
        {0x2603, 0x2603, "SNOWMAN"},
        {0x2604, 0x2604, "COMET"},
        {0x2605, 0x2605, "BLACK STAR"},
        {0x2606, 0x2606, "WHITE STAR"},
        {0x260E, 0x260E, "BLACK TELEPHONE"},
        {0x2611, 0x2611, "BALLOT BOX WITH CHECK"},
        {0x2614, 0x2614, "UMBRELLA WITH RAIN DROPS"},
        {0x2615, 0x2615, "HOT BEVERAGE"},
        {0x2618, 0x2618, "SHAMROCK"},
        {0x261D, 0x261D, "WHITE UP POINTING INDEX"},
        {0x2620, 0x2620, "SKULL AND CROSSBONES"},
        {0x2622, 0x2622, "RADIOACTIVE SIGN"},
        {0x2623, 0x2623, "BIOHAZARD SIGN"},
        {0x2639, 0x2639, "WHITE FROWNING FACE"},
        {0x263A, 0x263A, "WHITE SMILING FACE"},
        {0x263B, 0x263B, "BLACK SMILING FACE"},
        {0x2640, 0x2640, "FEMALE SIGN"},
        {0x2642, 0x2642, "MALE SIGN"},
        {0x2660, 0x2660, "BLACK SPADE SUIT"},
        {0x2661, 0x2661, "WHITE HEART SUIT"},
        {0x2663, 0x2663, "BLACK CLUB SUIT"},
        {0x2665, 0x2665, "BLACK HEART SUIT"},
        {0x2666, 0x2666, "BLACK DIAMOND SUIT"},
        {0x2668, 0x2668, "HOT SPRINGS"},
        {0x267B, 0x267B, "BLACK UNIVERSAL RECYCLING SYMBOL"},
        {0x267F, 0x267F, "WHEELCHAIR SYMBOL"},
        {0x2693, 0x2693, "ANCHOR"},
        {0x26A0, 0x26A0, "WARNING SIGN"},
        {0x26A1, 0x26A1, "HIGH VOLTAGE SIGN"},
        {0x26AA, 0x26AA, "MEDIUM WHITE CIRCLE"},
        {0x26AB, 0x26AB, "MEDIUM BLACK CIRCLE"},
        {0x26BD, 0x26BD, "SOCCER BALL"},
        {0x26BE, 0x26BE, "BASEBALL"},
        {0x26C4, 0x26C4, "SNOWMAN WITHOUT SNOW"},
        {0x26C5, 0x26C5, "SUN BEHIND CLOUD"},
        {0x26D4, 0x26D4, "NO ENTRY"},
        {0x26EA, 0x26EA, "CHURCH"},
        {0x26F2, 0x26F2, "FOUNTAIN"},
        {0x26F3, 0x26F3, "FLAG IN HOLE"},
        {0x26F5, 0x26F5, "SAILBOAT"},
        {0x26FA, 0x26FA, "TENT"},
        {0x26FD, 0x26FD, "FUEL PUMP"},
        {0x2B1B, 0x2B1B, "BLACK LARGE SQUARE"},
        {0x2B1C, 0x2B1C, "WHITE LARGE SQUARE"},
        {0x2B50, 0x2B50, "WHITE MEDIUM STAR"},
        {0x2B55, 0x2B55, "HEAVY LARGE CIRCLE"},
        {0x3297, 0x3297, "CIRCLED IDEOGRAPH CONGRATULATION"},
        {0x3299, 0x3299, "CIRCLED IDEOGRAPH SECRET"},
    };
    return symbols;
}

const std::vector<std::string_view>& Sanitizer::decorativeKeywords() {
    static const std::vector<std::string_view> keywords = {
        "FACE", "HEART", "STAR", "FIRE", "BALLOON", "SUN", "CLOUD", "UMBRELLA",
        "SNOWMAN", "COMET", "VOLTAGE", "BALL", "BASEBALL", "BEVERAGE", "SKULL",
        "TELEPHONE", "INDEX", "SUIT", "SPRINGS", "RECYCLING", "SHAMROCK",
        "CHECK", "CIRCLE", "SQUARE", "ANCHOR", "SAILBOAT", "TENT", "FOUNTAIN",
        "CHURCH", "FLAG", "FUEL", "CONGRATULATION", "SECRET", "WARNING",
        "WHEELCHAIR", "ENTRY", "RADIOACTIVE", "BIOHAZARD",
    };
    return keywords;
}

bool Sanitizer::isDecorativeName(std::string_view name) {
    const auto& keywords = decorativeKeywords();
    size_t start = 0;
    while (start < name.size()) {
        size_t end = name.find(' ', start);
        if (end == std::string_view::npos) {
            end = name.size();
        }
        std::string_view word = name.substr(start, end - start);
        for (const auto& keyword : keywords) {
            if (word == keyword) {
                return true;
            }
        }
        start = end + 1;
    }
    return false;
}

bool Sanitizer::isEmoji(char32_t cp) {
    for (const auto& range : emojiRanges()) {
        if (cp >= range.first && cp <= range.last) {
            return true;
        }
    }
    return false;
}

bool Sanitizer::isDecorativeSymbol(char32_t cp) {
    for (const auto& symbol : namedSymbols()) {
        if (cp >= symbol.first && cp <= symbol.last) {
            return isDecorativeName(symbol.name);
        }
    }
    return false;
}

bool Sanitizer::shouldStrip(char32_t cp) {
    // Everything in the tables sits above Latin-1 except the named signs
    if (cp < 0xA9) {
        return false;
    }
    return isEmoji(cp) || isDecorativeSymbol(cp);
}

std::string Sanitizer::sanitize(std::string_view text) {
    std::string out;
    out.reserve(text.size());

    bool pendingSpace = false;
    size_t pos = 0;
    char32_t cp;

    while (pos < text.size()) {
        size_t len = Utf8::decode(text, pos, cp);
        if (len == 0) {
            ++pos;
            continue;
        }

        if (Utf8::isWhitespace(cp)) {
            pendingSpace = !out.empty();
        } else if (!Utf8::isControl(cp) && !shouldStrip(cp)) {
            if (pendingSpace) {
                out += ' ';
                pendingSpace = false;
            }
            out.append(text.substr(pos, len));
        }
        pos += len;
    }

    return out;
}

std::string Sanitizer::collapseWhitespace(std::string_view text) {
    std::string out;
    out.reserve(text.size());

    bool pendingSpace = false;
    size_t pos = 0;
    char32_t cp;

    while (pos < text.size()) {
        size_t len = Utf8::decode(text, pos, cp);
        if (len == 0) {
            out += text[pos];
            ++pos;
            continue;
        }
        if (Utf8::isWhitespace(cp)) {
            pendingSpace = !out.empty();
        } else {
            if (pendingSpace) {
                out += ' ';
                pendingSpace = false;
            }
            out.append(text.substr(pos, len));
        }
        pos += len;
    }
    return out;
}

} // namespace arn
