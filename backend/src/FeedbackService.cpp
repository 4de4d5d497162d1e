#include "../include/FeedbackService.hpp"
#include <iostream>
#include <stdexcept>

using json = nlohmann::json;

bool FeedbackService::initialize(const ClassifierConfig& config) {
    if (classifier_) {
        std::cerr << "[Service] Already initialized; lexicons are not reloaded\n";
        return false;
    }

    std::cout << "[Service] Initializing feedback classifier...\n";

    if (!lexicons_.load_from_files(config.stopwords_path, config.positive_path, config.negative_path)) {
        std::cerr << "[Service] CRITICAL: Could not load lexicons\n";
        return false;
    }

    AbuseRules rules = config.build_rules();
    try {
        classifier_ = std::make_unique<FeedbackClassifier>(lexicons_, rules, config.similarity_threshold);
    } catch (const std::invalid_argument& e) {
        std::cerr << "[Service] CRITICAL: " << e.what() << "\n";
        return false;
    }
    config_ = config;

    std::cout << "[Rules] " << classifier_->detector().prefix_count() << " abusive prefixes, "
              << classifier_->detector().pattern_count() << " obfuscation patterns, "
              << rules.safe_words.size() << " safe words, "
              << rules.abusive_emoji.size() << " abusive emoji\n";
    std::cout << "[Service] Feedback classifier ready!\n";
    return true;
}

std::string FeedbackService::check_feedback(const std::string& text, bool debug) const {
    const FeedbackClassifier& clf = classifier();
    json out = debug ? clf.classify_verbose(text) : to_json(clf.classify(text));
    return out.dump(-1, ' ', false, json::error_handler_t::replace);
}

std::string FeedbackService::status() const {
    json out;
    out["service"] = "feedback-classifier";
    out["ready"] = is_ready();
    if (is_ready()) {
        out["lexicons"] = {
            {"stopwords", lexicons_.stopword_count()},
            {"positive", lexicons_.positive_count()},
            {"negative", lexicons_.negative_count()}
        };
        out["abusive_prefixes"] = classifier_->detector().prefix_count();
        out["obfuscation_patterns"] = classifier_->detector().pattern_count();
        out["similarity_threshold"] = classifier_->scorer().threshold();
    }
    return out.dump();
}

const FeedbackClassifier& FeedbackService::classifier() const {
    if (!classifier_) {
        throw std::logic_error("FeedbackService: classifier used before initialize()");
    }
    return *classifier_;
}
