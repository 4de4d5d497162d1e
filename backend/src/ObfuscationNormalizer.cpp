#include "ObfuscationNormalizer.hpp"
#include "Tokenizer.hpp"
#include <cctype>

ObfuscationNormalizer::ObfuscationNormalizer(const std::vector<ObfuscationRule>& rules)
    : rules_(rules) {
    rule_index_.fill(-1);
    for (size_t i = 0; i < rules_.size(); ++i) {
        unsigned char key = static_cast<unsigned char>(rules_[i].symbol);
        if (rule_index_[key] < 0) {
            rule_index_[key] = static_cast<int>(i);
        }
    }
}

const std::vector<ObfuscationRule>& ObfuscationNormalizer::default_rules() {
    static const std::vector<ObfuscationRule> RULES = {
        {'@', "a"},
        {'$', "s"},
        {'*', ""},
        {'#', ""},
        {'%', ""},
        {'^', ""},
        {'&', ""},
        {'_', ""}
    };
    return RULES;
}

std::string ObfuscationNormalizer::normalize(const std::string& raw_token) const {
    if (raw_token.empty()) return raw_token;

    // Emoji are matched as-is against the emoji table
    if (is_emoji_token(raw_token)) return raw_token;

    std::string lowered = raw_token;
    for (char& c : lowered) {
        unsigned char uc = static_cast<unsigned char>(c);
        if (uc < 0x80) c = static_cast<char>(std::tolower(uc));
    }

    std::string substituted = substitute(lowered);
    std::string collapsed = collapse_repeats(substituted, 2);
    return strip_edge_punctuation(collapsed);
}

std::string ObfuscationNormalizer::collapse_repeats(const std::string& word, size_t max_run) {
    if (word.empty() || max_run == 0) return word;

    std::string result;
    result.reserve(word.size());

    char prev = '\0';
    size_t run = 0;
    for (char c : word) {
        // Bytes of multi-byte UTF-8 sequences are never collapsed
        if (static_cast<unsigned char>(c) >= 0x80) {
            result += c;
            prev = '\0';
            run = 0;
            continue;
        }
        if (run > 0 && c == prev) {
            ++run;
        } else {
            run = 1;
            prev = c;
        }
        if (run <= max_run) {
            result += c;
        }
    }
    return result;
}

std::string ObfuscationNormalizer::substitute(const std::string& token) const {
    std::string out;
    out.reserve(token.size());
    for (char c : token) {
        int idx = rule_index_[static_cast<unsigned char>(c)];
        if (idx >= 0) {
            out += rules_[idx].replacement;
        } else {
            out += c;
        }
    }
    return out;
}

std::string ObfuscationNormalizer::strip_edge_punctuation(const std::string& token) {
    size_t start = 0;
    size_t end = token.size();

    while (start < end && std::ispunct(static_cast<unsigned char>(token[start])))
        ++start;
    while (end > start && std::ispunct(static_cast<unsigned char>(token[end - 1])))
        --end;

    return token.substr(start, end - start);
}
