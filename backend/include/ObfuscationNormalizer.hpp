#pragma once
// ObfuscationNormalizer.hpp
// Turns an obfuscated token into its canonical spelling before matching:
//   lowercase -> censor-symbol substitution -> collapse elongation -> strip edge punctuation
// Pure and locale independent, so normalize(normalize(t)) == normalize(t)

#include <array>
#include <string>
#include <vector>

// One censor-symbol substitution. An empty replacement elides the symbol
struct ObfuscationRule {
    char symbol;
    std::string replacement;
};

class ObfuscationNormalizer {
public:
    // Rules are applied in the given order; the first rule for a symbol wins
    explicit ObfuscationNormalizer(const std::vector<ObfuscationRule>& rules = default_rules());

    std::string normalize(const std::string& raw_token) const;

    // Keep at most max_run consecutive copies of the same character ("goooood" -> "good")
    static std::string collapse_repeats(const std::string& word, size_t max_run = 2);

    // @ -> a, $ -> s, the rest of * # % ^ & _ elided
    static const std::vector<ObfuscationRule>& default_rules();

    const std::vector<ObfuscationRule>& rules() const { return rules_; }

private:
    std::vector<ObfuscationRule> rules_;
    std::array<int, 256> rule_index_;  // symbol -> index into rules_, -1 if none

    std::string substitute(const std::string& token) const;
    static std::string strip_edge_punctuation(const std::string& token);
};
