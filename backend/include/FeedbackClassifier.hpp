#pragma once
// FeedbackClassifier.hpp
// Single entry point of the core: raw feedback text in, {classification, sentiment?} out
//   empty / whitespace only  -> "Please give meaningful feedback", no sentiment
//   abusive                  -> "Abusive", no sentiment
//   otherwise                -> "Clean" + Positive / Negative / Neutral
// classify() is const and touches only immutable state, so one instance serves all threads

#include <optional>
#include <string>
#include <nlohmann/json.hpp>
#include "AbuseDetector.hpp"
#include "AbuseRules.hpp"
#include "LexiconStore.hpp"
#include "ObfuscationNormalizer.hpp"
#include "SentimentScorer.hpp"

enum class Classification {
    Abusive,
    Clean,
    Empty
};

// Wire names: "Abusive", "Clean", "Please give meaningful feedback"
const char* to_string(Classification classification);

struct ClassificationResult {
    Classification classification = Classification::Empty;
    std::optional<Sentiment> sentiment;  // only set for Clean

    bool operator==(const ClassificationResult& other) const {
        return classification == other.classification && sentiment == other.sentiment;
    }
};

// {"classification": ...} plus "sentiment" when present
nlohmann::json to_json(const ClassificationResult& result);

class FeedbackClassifier {
public:
    // lexicons must outlive the classifier. Throws std::invalid_argument on unusable
    // rules (no abusive prefixes) or an out-of-range threshold
    FeedbackClassifier(const LexiconStore& lexicons,
                       const AbuseRules& rules,
                       double similarity_threshold = SentimentScorer::DEFAULT_THRESHOLD);

    FeedbackClassifier(const FeedbackClassifier&) = delete;
    FeedbackClassifier& operator=(const FeedbackClassifier&) = delete;

    ClassificationResult classify(const std::string& raw_text) const;

    // classify() plus tokens, normalized tokens, the abuse signal and per-token sentiment detail
    nlohmann::json classify_verbose(const std::string& raw_text) const;

    const AbuseDetector& detector() const { return detector_; }
    const SentimentScorer& scorer() const { return scorer_; }
    const ObfuscationNormalizer& normalizer() const { return normalizer_; }

private:
    // Declared first: detector_ and scorer_ hold references to it
    ObfuscationNormalizer normalizer_;
    AbuseDetector detector_;
    SentimentScorer scorer_;
};
