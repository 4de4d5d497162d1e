#include "AbuseRules.hpp"
#include <algorithm>

namespace {

void append_unique(std::vector<std::string>& target, const std::vector<std::string>& extra) {
    for (const auto& item : extra) {
        if (item.empty()) continue;
        if (std::find(target.begin(), target.end(), item) == target.end()) {
            target.push_back(item);
        }
    }
}

}  // namespace

AbuseRules AbuseRules::defaults() {
    AbuseRules rules;

    rules.abusive_prefixes = {
        // Hindi / Hinglish
        "chut", "chu", "chodu", "madar", "behenchod", "bhenchod",
        "bhosdike", "randi", "harami", "gand", "lodu", "laude", "lavde", "lauda", "loda", "lund",
        "tatti", "gaand", "bhadwe", "bhadwa", "chinal", "kutta", "kuttiya",
        "kamina", "haram", "chud", "lendi", "saala", "saale",

        // English
        "fuck", "motherfucker", "bullshit", "shit", "bastard",
        "slut", "whore", "asshole", "dick", "pussy", "bitch", "cock", "cunt",
        "dildo", "jerk", "wanker", "retard",

        // Short forms and common misspellings
        "fck", "fuk", "fk", "phuck", "fuq",
        "mc", "bc", "bsdk", "chod", "ch0d",
        "kutti", "kutte", "rndi"
    };

    // Real words that start with one of the prefixes above
    rules.safe_words = {
        "gandhi", "gandhiji", "gandagi", "gandhak",
        "church", "churches", "churchill",
        "chuck", "chucks", "chucked", "chucking",
        "chuckle", "chuckles", "chuckled", "chuckling",
        "chunk", "chunks", "chunky", "chutney", "chutneys", "chubby", "chummy",
        "chum", "chums", "chuffed", "chug", "chugs", "chugged", "chugging",
        "chump", "chumps", "churn", "churns", "churned", "churning",
        "churro", "churros", "chute", "chutes",
        "cockpit", "cocktail", "cocktails", "cockroach", "cockroaches", "cockatoo",
        "dickens", "gander", "jerky", "cockney",
        "laudable", "laudably", "lauded", "laudatory",
        "lending", "lendings",
        "retardant",
        "bcz", "bcoz", "bcos", "bcc", "bce",
        "mcq", "mcqs", "mcdonalds", "mcdonald", "mcd", "mcafee", "mcflurry"
    };

    rules.abusive_emoji = {
        "\xF0\x9F\x96\x95",  // U+1F595 reversed hand with middle finger extended
        "\xF0\x9F\xA4\xAC"   // U+1F92C face with symbols on mouth
    };

    rules.substitutions = ObfuscationNormalizer::default_rules();
    return rules;
}

void AbuseRules::extend(const std::vector<std::string>& extra_prefixes,
                        const std::vector<std::string>& extra_safe_words,
                        const std::vector<std::string>& extra_emoji,
                        const std::vector<ObfuscationRule>& extra_substitutions) {
    append_unique(abusive_prefixes, extra_prefixes);
    append_unique(safe_words, extra_safe_words);
    append_unique(abusive_emoji, extra_emoji);

    // The normalizer keeps the first rule per symbol, so configured rules go in front
    if (!extra_substitutions.empty()) {
        std::vector<ObfuscationRule> merged = extra_substitutions;
        merged.insert(merged.end(), substitutions.begin(), substitutions.end());
        substitutions = std::move(merged);
    }
}
