#include "ClassifierConfig.hpp"
#include <cctype>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <stdexcept>

using json = nlohmann::json;
namespace fs = std::filesystem;

namespace {

std::string resolve_path(const std::string& path, const std::string& base_dir) {
    if (path.empty() || base_dir.empty()) return path;
    fs::path p(path);
    if (p.is_absolute()) return path;
    return (fs::path(base_dir) / p).lexically_normal().string();
}

std::vector<std::string> read_string_list(const json& parent, const char* key) {
    std::vector<std::string> out;
    if (!parent.contains(key)) return out;
    const json& arr = parent.at(key);
    if (!arr.is_array()) {
        throw std::invalid_argument(std::string("'") + key + "' must be an array of strings");
    }
    for (const auto& item : arr) {
        out.push_back(item.get<std::string>());
    }
    return out;
}

std::string to_lower_ascii(std::string s) {
    for (char& c : s) {
        unsigned char uc = static_cast<unsigned char>(c);
        if (uc < 0x80) c = static_cast<char>(std::tolower(uc));
    }
    return s;
}

// Abusive prefixes feed the trie and the obfuscation regexes: lowercase ASCII letters and digits only
std::string validate_prefix(const std::string& raw) {
    std::string prefix = to_lower_ascii(raw);
    if (prefix.empty()) throw std::invalid_argument("abusive prefix must not be empty");
    for (unsigned char c : prefix) {
        if (!std::isalnum(c)) {
            throw std::invalid_argument("abusive prefix '" + raw + "' may only contain ASCII letters and digits");
        }
    }
    return prefix;
}

ObfuscationRule validate_substitution(const std::string& symbol, const json& value) {
    if (symbol.size() != 1 || static_cast<unsigned char>(symbol[0]) >= 0x80) {
        throw std::invalid_argument("substitution key '" + symbol + "' must be a single ASCII character");
    }
    std::string replacement = value.get<std::string>();
    for (unsigned char c : replacement) {
        if (!std::islower(c)) {
            throw std::invalid_argument("substitution for '" + symbol + "' must be lowercase letters");
        }
    }
    return {symbol[0], replacement};
}

}  // namespace

bool ClassifierConfig::load_from_file(const std::string& path) {
    std::ifstream in(path);
    if (!in.is_open()) {
        std::cerr << "[Config] Could not open config file: " << path << "\n";
        return false;
    }

    json doc;
    try {
        in >> doc;
    } catch (const json::parse_error& e) {
        std::cerr << "[Config] Invalid JSON in " << path << ": " << e.what() << "\n";
        return false;
    }

    std::string base_dir = fs::path(path).parent_path().string();
    if (!load_from_json(doc, base_dir)) {
        std::cerr << "[Config] Rejected config file: " << path << "\n";
        return false;
    }

    std::cout << "[Config] Loaded " << path << "\n";
    return true;
}

bool ClassifierConfig::load_from_json(const json& doc, const std::string& base_dir) {
    // Work on a copy so a bad document leaves the current values intact
    ClassifierConfig next = *this;

    try {
        if (!doc.is_object()) throw std::invalid_argument("top level must be an object");

        if (doc.contains("data")) {
            const json& data = doc.at("data");
            if (data.contains("stopwords")) next.stopwords_path = resolve_path(data.at("stopwords").get<std::string>(), base_dir);
            if (data.contains("positive")) next.positive_path = resolve_path(data.at("positive").get<std::string>(), base_dir);
            if (data.contains("negative")) next.negative_path = resolve_path(data.at("negative").get<std::string>(), base_dir);
        }

        if (doc.contains("sentiment")) {
            const json& sentiment = doc.at("sentiment");
            if (sentiment.contains("similarity_threshold")) {
                next.similarity_threshold = sentiment.at("similarity_threshold").get<double>();
                if (!(next.similarity_threshold > 0.0 && next.similarity_threshold <= 1.0)) {
                    throw std::invalid_argument("similarity_threshold must be in (0, 1]");
                }
            }
        }

        if (doc.contains("rules")) {
            const json& rules = doc.at("rules");

            next.extra_abusive_prefixes.clear();
            for (const auto& p : read_string_list(rules, "extra_abusive_prefixes")) {
                next.extra_abusive_prefixes.push_back(validate_prefix(p));
            }

            next.extra_safe_words.clear();
            for (const auto& w : read_string_list(rules, "extra_safe_words")) {
                if (!w.empty()) next.extra_safe_words.push_back(to_lower_ascii(w));
            }

            next.extra_abusive_emoji = read_string_list(rules, "extra_abusive_emoji");

            next.extra_substitutions.clear();
            if (rules.contains("substitutions")) {
                const json& subs = rules.at("substitutions");
                if (!subs.is_object()) throw std::invalid_argument("'substitutions' must be an object");
                for (auto it = subs.begin(); it != subs.end(); ++it) {
                    next.extra_substitutions.push_back(validate_substitution(it.key(), it.value()));
                }
            }
        }

        if (doc.contains("server")) {
            const json& server = doc.at("server");
            if (server.contains("host")) next.host = server.at("host").get<std::string>();
            if (server.contains("port")) {
                next.port = server.at("port").get<int>();
                if (next.port < 1 || next.port > 65535) {
                    throw std::invalid_argument("port must be in 1..65535");
                }
            }
            if (server.contains("static_dir")) next.static_dir = resolve_path(server.at("static_dir").get<std::string>(), base_dir);
        }
    } catch (const json::exception& e) {
        std::cerr << "[Config] " << e.what() << "\n";
        return false;
    } catch (const std::invalid_argument& e) {
        std::cerr << "[Config] " << e.what() << "\n";
        return false;
    }

    *this = std::move(next);
    return true;
}

AbuseRules ClassifierConfig::build_rules() const {
    AbuseRules rules = AbuseRules::defaults();
    rules.extend(extra_abusive_prefixes, extra_safe_words, extra_abusive_emoji, extra_substitutions);
    return rules;
}

std::string find_default_config(const std::vector<std::string>& candidates) {
    for (const auto& candidate : candidates) {
        std::error_code ec;
        if (!candidate.empty() && fs::is_regular_file(candidate, ec)) {
            return candidate;
        }
    }
    return "";
}

std::vector<std::string> default_config_candidates() {
    std::vector<std::string> candidates = {"config/classifier.json", "backend/config/classifier.json"};
#ifdef FEEDBACK_DEFAULT_CONFIG
    candidates.push_back(FEEDBACK_DEFAULT_CONFIG);
#endif
    return candidates;
}
