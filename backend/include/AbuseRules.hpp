#pragma once
// AbuseRules.hpp
// Curated, in-core data the abuse detector is built from:
//   abusive prefixes (English + Hinglish), safe words, abusive emoji, censor-symbol substitutions
// One immutable value, built once at startup and passed by const reference

#include <string>
#include <vector>
#include "ObfuscationNormalizer.hpp"

struct AbuseRules {
    // Order matters: obfuscation patterns are compiled and tried in this order
    std::vector<std::string> abusive_prefixes;
    std::vector<std::string> safe_words;
    std::vector<std::string> abusive_emoji;  // UTF-8 encoded, one code point each
    std::vector<ObfuscationRule> substitutions;

    // Built-in curated lists
    static AbuseRules defaults();

    // Append extra entries (duplicates are ignored); extra substitutions take precedence
    void extend(const std::vector<std::string>& extra_prefixes,
                const std::vector<std::string>& extra_safe_words,
                const std::vector<std::string>& extra_emoji,
                const std::vector<ObfuscationRule>& extra_substitutions);
};
