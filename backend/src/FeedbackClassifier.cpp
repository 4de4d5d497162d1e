#include "FeedbackClassifier.hpp"
#include "Tokenizer.hpp"

using json = nlohmann::json;

const char* to_string(Classification classification) {
    switch (classification) {
        case Classification::Abusive: return "Abusive";
        case Classification::Clean:   return "Clean";
        case Classification::Empty:   break;
    }
    return "Please give meaningful feedback";
}

json to_json(const ClassificationResult& result) {
    json out;
    out["classification"] = to_string(result.classification);
    if (result.sentiment) {
        out["sentiment"] = to_string(*result.sentiment);
    }
    return out;
}

FeedbackClassifier::FeedbackClassifier(const LexiconStore& lexicons,
                                       const AbuseRules& rules,
                                       double similarity_threshold)
    : normalizer_(rules.substitutions),
      detector_(rules, normalizer_),
      scorer_(lexicons, normalizer_, similarity_threshold) {}

ClassificationResult FeedbackClassifier::classify(const std::string& raw_text) const {
    ClassificationResult result;

    if (trim(raw_text).empty()) {
        result.classification = Classification::Empty;
        return result;
    }

    std::vector<std::string> tokens = tokenize(raw_text);
    if (detector_.inspect_tokens(tokens).abusive()) {
        result.classification = Classification::Abusive;
        return result;
    }

    result.classification = Classification::Clean;
    result.sentiment = scorer_.score_tokens(tokens);
    return result;
}

json FeedbackClassifier::classify_verbose(const std::string& raw_text) const {
    json out;

    if (trim(raw_text).empty()) {
        out = to_json(ClassificationResult{});
        out["tokens"] = json::array();
        return out;
    }

    std::vector<std::string> tokens = tokenize(raw_text);
    json normalized = json::array();
    for (const auto& token : tokens) {
        normalized.push_back(normalizer_.normalize(token));
    }

    AbuseFinding finding = detector_.inspect_tokens(tokens);
    if (finding.abusive()) {
        out = to_json(ClassificationResult{Classification::Abusive, std::nullopt});
        out["abuse"] = {
            {"signal", to_string(finding.signal)},
            {"token", finding.token},
            {"rule", finding.rule}
        };
    } else {
        SentimentBreakdown breakdown = scorer_.analyze_tokens(tokens);
        out = to_json(ClassificationResult{Classification::Clean, breakdown.label});

        json details = json::array();
        for (const auto& t : breakdown.tokens) {
            details.push_back({
                {"token", t.token},
                {"normalized", t.normalized},
                {"match", to_string(t.match)},
                {"best_positive", {{"word", t.best_positive_word}, {"score", t.best_positive}}},
                {"best_negative", {{"word", t.best_negative_word}, {"score", t.best_negative}}}
            });
        }
        out["details"] = {
            {"positive_count", breakdown.positive_count},
            {"negative_count", breakdown.negative_count},
            {"token_details", details}
        };
    }

    out["tokens"] = tokens;
    out["normalized_tokens"] = normalized;
    return out;
}
