#pragma once
// ClassifierConfig.hpp
// Startup configuration, read from a JSON file. Every key is optional:
// {
//   "data":      {"stopwords": "...", "positive": "...", "negative": "..."},
//   "sentiment": {"similarity_threshold": 0.8},
//   "rules":     {"extra_abusive_prefixes": [], "extra_safe_words": [],
//                 "extra_abusive_emoji": [], "substitutions": {"@": "a"}},
//   "server":    {"host": "0.0.0.0", "port": 8080, "static_dir": "./static"}
// }
// Relative paths are resolved against the directory of the config file

#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "AbuseRules.hpp"

struct ClassifierConfig {
    // Lexicon files
    std::string stopwords_path = "data/lexicons/stopwords.txt";
    std::string positive_path = "data/lexicons/positive.txt";
    std::string negative_path = "data/lexicons/negative.txt";

    double similarity_threshold = 0.8;

    // Additions to the built-in abuse rules
    std::vector<std::string> extra_abusive_prefixes;
    std::vector<std::string> extra_safe_words;
    std::vector<std::string> extra_abusive_emoji;
    std::vector<ObfuscationRule> extra_substitutions;

    // HTTP server
    std::string host = "0.0.0.0";
    int port = 8080;
    std::string static_dir = "./static";

    // Read and validate a config file. On failure the config is left unchanged
    // and the reason is written to std::cerr
    bool load_from_file(const std::string& path);

    // Apply an already parsed document; base_dir is used for relative paths
    bool load_from_json(const nlohmann::json& doc, const std::string& base_dir = "");

    // Built-in rules extended with the configured additions
    AbuseRules build_rules() const;
};

// First candidate that names an existing regular file, or an empty string.
// Used when no config file is given on the command line
std::string find_default_config(const std::vector<std::string>& candidates);

// Where the binaries look for classifier.json: the working directory (run from backend/ or
// from the repo root), then the source tree the build was configured from
std::vector<std::string> default_config_candidates();
