#include "Tokenizer.hpp"
#include <cctype>
#include <cstdint>

namespace {

// Decode one UTF-8 sequence starting at pos. Returns its length, 0 when invalid
size_t decode_utf8(const std::string& s, size_t pos, uint32_t& cp) {
    unsigned char lead = static_cast<unsigned char>(s[pos]);
    size_t len;
    if (lead < 0x80) { cp = lead; return 1; }
    else if ((lead & 0xE0) == 0xC0) { cp = lead & 0x1F; len = 2; }
    else if ((lead & 0xF0) == 0xE0) { cp = lead & 0x0F; len = 3; }
    else if ((lead & 0xF8) == 0xF0) { cp = lead & 0x07; len = 4; }
    else return 0;

    if (pos + len > s.size()) return 0;
    for (size_t k = 1; k < len; ++k) {
        unsigned char cont = static_cast<unsigned char>(s[pos + k]);
        if ((cont & 0xC0) != 0x80) return 0;
        cp = (cp << 6) | (cont & 0x3F);
    }

    // Reject overlong forms and surrogates
    static const uint32_t min_for_len[] = {0, 0, 0x80, 0x800, 0x10000};
    if (cp < min_for_len[len] || cp > 0x10FFFF || (cp >= 0xD800 && cp <= 0xDFFF)) return 0;
    return len;
}

bool is_emoji_code_point(uint32_t cp) {
    return (cp >= 0x2600 && cp <= 0x27BF)      // misc symbols, dingbats
        || (cp >= 0x1F300 && cp <= 0x1F5FF)    // symbols & pictographs
        || (cp >= 0x1F600 && cp <= 0x1F64F)    // emoticons
        || (cp >= 0x1F680 && cp <= 0x1F6FF)    // transport & map
        || (cp >= 0x1F900 && cp <= 0x1F9FF);   // supplemental symbols
}

// Joiners and presentation selectors glue emoji sequences together; they carry no meaning here
bool is_emoji_glue(uint32_t cp) {
    return cp == 0x200D || cp == 0xFE0E || cp == 0xFE0F;
}

// Non-ASCII code points treated as separators: Latin-1 punctuation, general punctuation, CJK punctuation
bool is_unicode_separator(uint32_t cp) {
    return (cp >= 0x0080 && cp <= 0x00BF && cp != 0x00AA && cp != 0x00B5 && cp != 0x00BA)
        || cp == 0x00D7 || cp == 0x00F7
        || (cp >= 0x2000 && cp <= 0x206F)
        || (cp >= 0x3000 && cp <= 0x303F);
}

}  // namespace

bool is_censor_symbol(char c) {
    switch (c) {
        case '*': case '@': case '#': case '$':
        case '%': case '^': case '&': case '_':
            return true;
        default:
            return false;
    }
}

std::vector<std::string> tokenize(const std::string& text) {
    std::vector<std::string> tokens;
    std::string current;

    auto flush = [&]() {
        if (!current.empty()) {
            tokens.push_back(current);
            current.clear();
        }
    };

    size_t i = 0;
    while (i < text.size()) {
        unsigned char c = static_cast<unsigned char>(text[i]);

        if (c < 0x80) {
            if (std::isalnum(c) || is_censor_symbol(static_cast<char>(c))) {
                current += static_cast<char>(c);
            } else {
                flush();
            }
            ++i;
            continue;
        }

        uint32_t cp = 0;
        size_t len = decode_utf8(text, i, cp);
        if (len == 0) {
            // Invalid byte: treat as a boundary and resync on the next byte
            flush();
            ++i;
            continue;
        }

        if (is_emoji_code_point(cp)) {
            flush();
            tokens.push_back(text.substr(i, len));
        } else if (is_emoji_glue(cp)) {
            // dropped
        } else if (is_unicode_separator(cp)) {
            flush();
        } else {
            current.append(text, i, len);
        }
        i += len;
    }
    flush();

    return tokens;
}

bool is_emoji_token(const std::string& token) {
    if (token.empty()) return false;
    uint32_t cp = 0;
    size_t len = decode_utf8(token, 0, cp);
    return len == token.size() && is_emoji_code_point(cp);
}

bool contains_word_character(const std::string& token) {
    if (is_emoji_token(token)) return false;
    for (unsigned char c : token) {
        if (c >= 0x80 || std::isalnum(c)) return true;
    }
    return false;
}

std::string trim(const std::string& text) {
    size_t start = text.find_first_not_of(" \t\r\n\f\v");
    if (start == std::string::npos) {
        return "";
    }
    size_t end = text.find_last_not_of(" \t\r\n\f\v");
    return text.substr(start, end - start + 1);
}
