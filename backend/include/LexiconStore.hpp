#pragma once
// LexiconStore.hpp
// The three word lists used by sentiment scoring: stopwords, positive and negative terms
// Files are line-delimited UTF-8; blank lines and lines starting with '#' or ';' are skipped
// Words are stored lowercase. Loaded once at startup, read-only afterwards

#include <string>
#include <vector>
#include <unordered_set>

class LexiconStore {
public:
    LexiconStore() = default;

    // Build directly from word lists (words are trimmed and lowercased)
    LexiconStore(const std::vector<std::string>& stopwords,
                 const std::vector<std::string>& positive,
                 const std::vector<std::string>& negative);

    // Load all three files. On any failure (missing file, empty list) the store is left
    // untouched and false is returned; the reason goes to std::cerr
    bool load_from_files(const std::string& stopwords_path,
                         const std::string& positive_path,
                         const std::string& negative_path);

    bool is_stopword(const std::string& word) const { return stopwords_.count(word) > 0; }
    bool is_positive(const std::string& word) const { return positive_set_.count(word) > 0; }
    bool is_negative(const std::string& word) const { return negative_set_.count(word) > 0; }

    // Sorted word lists, iterated by fuzzy matching
    const std::vector<std::string>& positive_words() const { return positive_words_; }
    const std::vector<std::string>& negative_words() const { return negative_words_; }

    size_t stopword_count() const { return stopwords_.size(); }
    size_t positive_count() const { return positive_words_.size(); }
    size_t negative_count() const { return negative_words_.size(); }

    // All three lists are non-empty
    bool is_loaded() const;

private:
    std::unordered_set<std::string> stopwords_;
    std::unordered_set<std::string> positive_set_;
    std::unordered_set<std::string> negative_set_;
    std::vector<std::string> positive_words_;
    std::vector<std::string> negative_words_;

    void assign(std::unordered_set<std::string> stopwords,
                std::unordered_set<std::string> positive,
                std::unordered_set<std::string> negative);

    static bool read_word_list(const std::string& path, std::unordered_set<std::string>& out);
    static std::string clean_word(const std::string& line);
};
