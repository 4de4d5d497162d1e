#pragma once
// AbusiveTrie.hpp
// Prefix tree over the curated abusive-prefix list
// A token is flagged when any prefix of it spells a complete entry
// Built once at startup and only read afterwards, so concurrent lookups need no lock

#include <string>
#include <map>
#include <memory>
#include <optional>

class TrieNode {
public:
    std::map<char, std::unique_ptr<TrieNode>> children;
    bool is_terminal;

    TrieNode() : is_terminal(false) {}
};

class AbusiveTrie {
public:
    AbusiveTrie();

    // Insert a prefix (lowercased). Inserting the same prefix twice is a no-op
    void insert(const std::string& prefix);

    // True as soon as a terminal node is reached while walking the token
    bool has_prefix_match(const std::string& token) const;

    // Same walk, but returns the matched prefix (shortest one) for reporting
    std::optional<std::string> find_prefix_match(const std::string& token) const;

    // Number of distinct prefixes inserted
    size_t size() const { return prefix_count_; }

    bool empty() const { return prefix_count_ == 0; }

    void clear();

private:
    std::unique_ptr<TrieNode> root_;
    size_t prefix_count_;

    // Length of the shortest matching prefix, 0 if none
    size_t match_length(const std::string& token) const;
};
