#include "AbusiveTrie.hpp"
#include <cctype>

AbusiveTrie::AbusiveTrie() : root_(std::make_unique<TrieNode>()), prefix_count_(0) {}

void AbusiveTrie::insert(const std::string& prefix) {
    if (prefix.empty()) return;

    TrieNode* current = root_.get();

    for (char c : prefix) {
        char lower_c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));

        auto it = current->children.find(lower_c);
        if (it == current->children.end()) {
            it = current->children.emplace(lower_c, std::make_unique<TrieNode>()).first;
        }
        current = it->second.get();
    }

    // Only count a path the first time it becomes terminal
    if (!current->is_terminal) {
        current->is_terminal = true;
        ++prefix_count_;
    }
}

size_t AbusiveTrie::match_length(const std::string& token) const {
    const TrieNode* current = root_.get();
    size_t depth = 0;

    for (char c : token) {
        char lower_c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
        auto it = current->children.find(lower_c);
        if (it == current->children.end()) {
            return 0;
        }
        current = it->second.get();
        ++depth;
        if (current->is_terminal) {
            return depth;
        }
    }

    // Token ran out before reaching a terminal node
    return 0;
}

bool AbusiveTrie::has_prefix_match(const std::string& token) const {
    return match_length(token) > 0;
}

std::optional<std::string> AbusiveTrie::find_prefix_match(const std::string& token) const {
    size_t len = match_length(token);
    if (len == 0) return std::nullopt;

    std::string matched = token.substr(0, len);
    for (char& c : matched) {
        c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }
    return matched;
}

void AbusiveTrie::clear() {
    root_ = std::make_unique<TrieNode>();
    prefix_count_ = 0;
}
