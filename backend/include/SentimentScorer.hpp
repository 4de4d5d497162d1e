#pragma once
// SentimentScorer.hpp
// Lexicon-based sentiment for clean feedback.
// Each non-stopword token is compared with the positive and negative lexicons:
// an exact hit counts directly, otherwise the best fuzzy similarity must reach the threshold.
// Label = whichever side has more matched tokens; equal counts (or none) give Neutral

#include <string>
#include <vector>
#include "LexiconStore.hpp"
#include "ObfuscationNormalizer.hpp"

enum class Sentiment {
    Positive,
    Negative,
    Neutral
};

const char* to_string(Sentiment sentiment);

enum class LexiconMatch {
    None,
    ExactPositive,
    ExactNegative,
    FuzzyPositive,
    FuzzyNegative,
    Tie  // both lexicons matched equally well, counts toward neither
};

const char* to_string(LexiconMatch match);

// Per-token detail for debug output
struct TokenSentiment {
    std::string token;
    std::string normalized;
    LexiconMatch match = LexiconMatch::None;
    double best_positive = 0.0;
    std::string best_positive_word;
    double best_negative = 0.0;
    std::string best_negative_word;
};

struct SentimentBreakdown {
    Sentiment label = Sentiment::Neutral;
    int positive_count = 0;
    int negative_count = 0;
    std::vector<TokenSentiment> tokens;  // stopwords and empty tokens are not listed
};

class SentimentScorer {
public:
    static constexpr double DEFAULT_THRESHOLD = 0.8;

    // Throws std::invalid_argument unless 0 < threshold <= 1
    SentimentScorer(const LexiconStore& lexicons,
                    const ObfuscationNormalizer& normalizer,
                    double threshold = DEFAULT_THRESHOLD);

    Sentiment score(const std::string& text) const;
    Sentiment score_tokens(const std::vector<std::string>& tokens) const;

    SentimentBreakdown analyze(const std::string& text) const;
    SentimentBreakdown analyze_tokens(const std::vector<std::string>& tokens) const;

    double threshold() const { return threshold_; }

private:
    const LexiconStore& lexicons_;
    const ObfuscationNormalizer& normalizer_;
    double threshold_;

    TokenSentiment score_token(const std::string& token, const std::string& normalized) const;

    // Best similarity of word against lexicon entries that can still reach the threshold
    double best_match(const std::string& word,
                      const std::vector<std::string>& lexicon,
                      std::string& best_word) const;
};
