#include "AbuseDetector.hpp"
#include "Tokenizer.hpp"
#include <cctype>
#include <stdexcept>

namespace {

// Symbols that stand in for a letter inside an obfuscated word
const char* const MASK_CLASS = "[*#@$%&^!_]";
// Same set plus 'x', which is also used as filler ("fxxk")
const char* const FILLER_CLASS = "[*#x@$%&^!_]";

// Longest token the elastic patterns are run against. Longer tokens are still
// checked by the trie; the cap bounds backtracking on long symbol runs
const size_t MAX_PATTERN_TOKEN_LENGTH = 24;

std::string regex_escape(char c) {
    static const std::string special = "\\^$.|?*+()[]{}";
    std::string out;
    if (special.find(c) != std::string::npos) out += '\\';
    out += c;
    return out;
}

}  // namespace

const char* to_string(AbuseSignal signal) {
    switch (signal) {
        case AbuseSignal::PrefixMatch:        return "prefix_match";
        case AbuseSignal::ObfuscationPattern: return "obfuscation_pattern";
        case AbuseSignal::AbusiveEmoji:       return "abusive_emoji";
        case AbuseSignal::None:               break;
    }
    return "none";
}

AbuseDetector::AbuseDetector(const AbuseRules& rules, const ObfuscationNormalizer& normalizer)
    : normalizer_(normalizer) {
    for (const auto& prefix : rules.abusive_prefixes) {
        trie_.insert(prefix);
    }

    // An empty trie would silently disable abuse detection
    if (trie_.empty()) {
        throw std::invalid_argument("AbuseDetector: no abusive prefixes configured");
    }

    std::unordered_set<std::string> compiled;
    for (const auto& prefix : rules.abusive_prefixes) {
        std::string term = lowercase_ascii(prefix);
        if (term.size() < 2 || !compiled.insert(term).second) continue;
        patterns_.push_back(compile_pattern(term));
    }

    for (const auto& word : rules.safe_words) {
        safe_words_.insert(normalizer_.normalize(word));
    }
    abusive_emoji_.insert(rules.abusive_emoji.begin(), rules.abusive_emoji.end());
}

bool AbuseDetector::is_abusive(const std::string& text) const {
    return inspect(text).abusive();
}

AbuseFinding AbuseDetector::inspect(const std::string& text) const {
    return inspect_tokens(tokenize(text));
}

AbuseFinding AbuseDetector::inspect_tokens(const std::vector<std::string>& tokens) const {
    std::vector<std::string> normalized;
    normalized.reserve(tokens.size());
    for (const auto& token : tokens) {
        normalized.push_back(normalizer_.normalize(token));
    }

    // Prefix trie over normalized tokens
    for (const auto& norm : normalized) {
        if (norm.empty() || is_safe_word(norm)) continue;
        if (auto prefix = trie_.find_prefix_match(norm)) {
            return {AbuseSignal::PrefixMatch, norm, *prefix};
        }
    }

    // Obfuscation patterns over the raw tokens
    for (size_t i = 0; i < tokens.size(); ++i) {
        if (normalized[i].empty() || is_safe_word(normalized[i])) continue;
        if (is_emoji_token(tokens[i])) continue;

        std::string lowered = lowercase_ascii(tokens[i]);
        for (const auto& pattern : patterns_) {
            if (matches_pattern(pattern, lowered)) {
                return {AbuseSignal::ObfuscationPattern, tokens[i], pattern.term};
            }
        }
    }

    // Abusive emoji
    for (const auto& token : tokens) {
        if (abusive_emoji_.count(token)) {
            return {AbuseSignal::AbusiveEmoji, token, token};
        }
    }

    return {};
}

AbuseDetector::ObfuscationPattern AbuseDetector::compile_pattern(const std::string& term) {
    const char first = term.front();
    const char last = term.back();

    // ^f(?:u|[..])+(?:c|[..])+[..]*k$
    // Every inner letter keeps at least one position, so "we" never matches "whore"
    std::string elastic = "^" + regex_escape(first);
    for (size_t i = 1; i + 1 < term.size(); ++i) {
        elastic += "(?:" + regex_escape(term[i]) + "|" + FILLER_CLASS + ")+";
    }
    elastic += std::string(MASK_CLASS) + "*" + regex_escape(last) + "$";

    ObfuscationPattern pattern{term, std::regex(elastic, std::regex::ECMAScript | std::regex::optimize), std::nullopt};

    // ^f(?:u|[..])(?:c|[..])(?:k|[..])$
    if (term.size() >= 3) {
        std::string masked = "^" + regex_escape(first);
        for (size_t i = 1; i < term.size(); ++i) {
            masked += "(?:" + regex_escape(term[i]) + "|" + MASK_CLASS + ")";
        }
        masked += "$";
        pattern.masked = std::regex(masked, std::regex::ECMAScript | std::regex::optimize);
    }

    return pattern;
}

bool AbuseDetector::matches_pattern(const ObfuscationPattern& pattern, const std::string& token) {
    if (token.empty() || token.front() != pattern.term.front()) return false;

    if (pattern.masked && token.size() == pattern.term.size() &&
        std::regex_match(token, *pattern.masked)) {
        return true;
    }

    if (token.size() < pattern.term.size() || token.size() > MAX_PATTERN_TOKEN_LENGTH) return false;
    if (token.back() != pattern.term.back()) return false;
    return std::regex_match(token, pattern.elastic);
}

std::string AbuseDetector::lowercase_ascii(const std::string& text) {
    std::string out = text;
    for (char& c : out) {
        unsigned char uc = static_cast<unsigned char>(c);
        if (uc < 0x80) c = static_cast<char>(std::tolower(uc));
    }
    return out;
}
