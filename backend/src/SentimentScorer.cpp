#include "SentimentScorer.hpp"
#include "StringSimilarity.hpp"
#include "Tokenizer.hpp"
#include <stdexcept>

const char* to_string(Sentiment sentiment) {
    switch (sentiment) {
        case Sentiment::Positive: return "Positive";
        case Sentiment::Negative: return "Negative";
        case Sentiment::Neutral:  break;
    }
    return "Neutral";
}

const char* to_string(LexiconMatch match) {
    switch (match) {
        case LexiconMatch::ExactPositive: return "exact_positive";
        case LexiconMatch::ExactNegative: return "exact_negative";
        case LexiconMatch::FuzzyPositive: return "fuzzy_positive";
        case LexiconMatch::FuzzyNegative: return "fuzzy_negative";
        case LexiconMatch::Tie:           return "tie";
        case LexiconMatch::None:          break;
    }
    return "none";
}

SentimentScorer::SentimentScorer(const LexiconStore& lexicons,
                                 const ObfuscationNormalizer& normalizer,
                                 double threshold)
    : lexicons_(lexicons), normalizer_(normalizer), threshold_(threshold) {
    if (!(threshold_ > 0.0 && threshold_ <= 1.0)) {
        throw std::invalid_argument("SentimentScorer: similarity threshold must be in (0, 1]");
    }
}

Sentiment SentimentScorer::score(const std::string& text) const {
    return analyze_tokens(tokenize(text)).label;
}

Sentiment SentimentScorer::score_tokens(const std::vector<std::string>& tokens) const {
    return analyze_tokens(tokens).label;
}

SentimentBreakdown SentimentScorer::analyze(const std::string& text) const {
    return analyze_tokens(tokenize(text));
}

SentimentBreakdown SentimentScorer::analyze_tokens(const std::vector<std::string>& tokens) const {
    SentimentBreakdown result;

    for (const auto& token : tokens) {
        std::string norm = normalizer_.normalize(token);
        if (norm.empty() || !contains_word_character(norm)) continue;
        if (lexicons_.is_stopword(norm)) continue;

        TokenSentiment detail = score_token(token, norm);
        switch (detail.match) {
            case LexiconMatch::ExactPositive:
            case LexiconMatch::FuzzyPositive:
                ++result.positive_count;
                break;
            case LexiconMatch::ExactNegative:
            case LexiconMatch::FuzzyNegative:
                ++result.negative_count;
                break;
            default:
                break;
        }
        result.tokens.push_back(std::move(detail));
    }

    if (result.positive_count > result.negative_count) {
        result.label = Sentiment::Positive;
    } else if (result.negative_count > result.positive_count) {
        result.label = Sentiment::Negative;
    } else {
        result.label = Sentiment::Neutral;
    }
    return result;
}

TokenSentiment SentimentScorer::score_token(const std::string& token, const std::string& normalized) const {
    TokenSentiment detail;
    detail.token = token;
    detail.normalized = normalized;

    // Exact lexicon hits first; fuzzy matching only when neither list has the word
    bool exact_pos = lexicons_.is_positive(normalized);
    bool exact_neg = lexicons_.is_negative(normalized);
    if (exact_pos || exact_neg) {
        if (exact_pos) { detail.best_positive = 1.0; detail.best_positive_word = normalized; }
        if (exact_neg) { detail.best_negative = 1.0; detail.best_negative_word = normalized; }
        if (exact_pos && exact_neg) detail.match = LexiconMatch::Tie;
        else detail.match = exact_pos ? LexiconMatch::ExactPositive : LexiconMatch::ExactNegative;
        return detail;
    }

    detail.best_positive = best_match(normalized, lexicons_.positive_words(), detail.best_positive_word);
    detail.best_negative = best_match(normalized, lexicons_.negative_words(), detail.best_negative_word);

    bool pos_match = detail.best_positive >= threshold_;
    bool neg_match = detail.best_negative >= threshold_;

    if (pos_match && neg_match) {
        if (detail.best_positive > detail.best_negative) detail.match = LexiconMatch::FuzzyPositive;
        else if (detail.best_negative > detail.best_positive) detail.match = LexiconMatch::FuzzyNegative;
        else detail.match = LexiconMatch::Tie;
    } else if (pos_match) {
        detail.match = LexiconMatch::FuzzyPositive;
    } else if (neg_match) {
        detail.match = LexiconMatch::FuzzyNegative;
    }
    return detail;
}

double SentimentScorer::best_match(const std::string& word,
                                   const std::vector<std::string>& lexicon,
                                   std::string& best_word) const {
    double best = 0.0;
    best_word.clear();

    for (const auto& entry : lexicon) {
        // Entries whose length alone rules out the threshold are skipped
        double bound = similarity_upper_bound(word.size(), entry.size());
        if (bound < threshold_ || bound <= best) continue;

        double score = similarity(word, entry);
        if (score > best) {
            best = score;
            best_word = entry;
            if (best >= 1.0) break;
        }
    }
    return best;
}
