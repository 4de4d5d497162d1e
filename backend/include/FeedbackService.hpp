#pragma once
#include <memory>
#include <string>
#include "ClassifierConfig.hpp"
#include "FeedbackClassifier.hpp"
#include "LexiconStore.hpp"

// Owns everything a process needs to classify feedback: config, lexicons, rules and the classifier.
// initialize() runs once at startup; afterwards the service is read-only and shared by all handlers
class FeedbackService {
public:
    FeedbackService() = default;

    // Load lexicons and build the classifier. Returns false (reason on std::cerr) when any
    // lexicon is missing or empty or the rules are unusable; the service must not serve then
    bool initialize(const ClassifierConfig& config);

    bool is_ready() const { return classifier_ != nullptr; }

    // Returns a raw JSON string: {"classification": ..., "sentiment": ...}
    // With debug, the verbose report of FeedbackClassifier::classify_verbose
    std::string check_feedback(const std::string& text, bool debug = false) const;

    // Returns a raw JSON string with lexicon sizes, rule counts and the threshold
    std::string status() const;

    // Throws std::logic_error before a successful initialize()
    const FeedbackClassifier& classifier() const;

    const ClassifierConfig& config() const { return config_; }
    const LexiconStore& lexicons() const { return lexicons_; }

private:
    ClassifierConfig config_;
    LexiconStore lexicons_;
    std::unique_ptr<FeedbackClassifier> classifier_;
};
