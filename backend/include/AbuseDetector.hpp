#pragma once
// AbuseDetector.hpp
// Decides whether a feedback text is abusive. Signals, checked in order, first hit wins:
//   1. normalized token has an abusive prefix in the trie (safe words are skipped)
//   2. raw token matches a precompiled obfuscation pattern ("f@ck", "ch##tiya", "f***")
//   3. token is a listed abusive emoji
// Matching is exact-structural only; no fuzzy similarity is used here

#include <optional>
#include <regex>
#include <string>
#include <unordered_set>
#include <vector>
#include "AbuseRules.hpp"
#include "AbusiveTrie.hpp"
#include "ObfuscationNormalizer.hpp"

enum class AbuseSignal {
    None,
    PrefixMatch,
    ObfuscationPattern,
    AbusiveEmoji
};

const char* to_string(AbuseSignal signal);

struct AbuseFinding {
    AbuseSignal signal = AbuseSignal::None;
    std::string token;  // token that fired (raw for patterns and emoji, normalized for prefixes)
    std::string rule;   // matched prefix, pattern term or emoji

    bool abusive() const { return signal != AbuseSignal::None; }
};

class AbuseDetector {
public:
    // Builds the trie and compiles the obfuscation patterns once.
    // Throws std::invalid_argument when rules contain no abusive prefixes
    AbuseDetector(const AbuseRules& rules, const ObfuscationNormalizer& normalizer);

    bool is_abusive(const std::string& text) const;

    // Same decision, with the signal that fired
    AbuseFinding inspect(const std::string& text) const;
    AbuseFinding inspect_tokens(const std::vector<std::string>& tokens) const;

    bool is_safe_word(const std::string& normalized_token) const {
        return safe_words_.count(normalized_token) > 0;
    }

    size_t prefix_count() const { return trie_.size(); }
    size_t pattern_count() const { return patterns_.size(); }

private:
    struct ObfuscationPattern {
        std::string term;
        std::regex elastic;               // inner letters may be swapped for or padded with symbols
        std::optional<std::regex> masked; // same length, any letter after the first masked
    };

    const ObfuscationNormalizer& normalizer_;
    AbusiveTrie trie_;
    std::vector<ObfuscationPattern> patterns_;
    std::unordered_set<std::string> safe_words_;
    std::unordered_set<std::string> abusive_emoji_;

    static ObfuscationPattern compile_pattern(const std::string& term);
    static bool matches_pattern(const ObfuscationPattern& pattern, const std::string& token);
    static std::string lowercase_ascii(const std::string& text);
};
