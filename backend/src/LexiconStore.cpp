#include "LexiconStore.hpp"
#include <algorithm>
#include <cctype>
#include <fstream>
#include <iostream>

using namespace std;

LexiconStore::LexiconStore(const vector<string>& stopwords,
                           const vector<string>& positive,
                           const vector<string>& negative) {
    auto to_set = [](const vector<string>& words) {
        unordered_set<string> out;
        for (const auto& w : words) {
            string cleaned = clean_word(w);
            if (!cleaned.empty()) out.insert(cleaned);
        }
        return out;
    };
    assign(to_set(stopwords), to_set(positive), to_set(negative));
}

bool LexiconStore::load_from_files(const string& stopwords_path,
                                   const string& positive_path,
                                   const string& negative_path) {
    unordered_set<string> stopwords, positive, negative;

    if (!read_word_list(stopwords_path, stopwords)) return false;
    if (!read_word_list(positive_path, positive)) return false;
    if (!read_word_list(negative_path, negative)) return false;

    assign(move(stopwords), move(positive), move(negative));

    cout << "[Lexicon] Loaded " << stopwords_.size() << " stopwords, "
         << positive_words_.size() << " positive and "
         << negative_words_.size() << " negative terms\n";
    return true;
}

bool LexiconStore::is_loaded() const {
    return !stopwords_.empty() && !positive_words_.empty() && !negative_words_.empty();
}

void LexiconStore::assign(unordered_set<string> stopwords,
                          unordered_set<string> positive,
                          unordered_set<string> negative) {
    stopwords_ = move(stopwords);
    positive_set_ = move(positive);
    negative_set_ = move(negative);

    // Sorted copies keep fuzzy matching independent of hash order
    positive_words_.assign(positive_set_.begin(), positive_set_.end());
    sort(positive_words_.begin(), positive_words_.end());
    negative_words_.assign(negative_set_.begin(), negative_set_.end());
    sort(negative_words_.begin(), negative_words_.end());
}

bool LexiconStore::read_word_list(const string& path, unordered_set<string>& out) {
    ifstream in(path);
    if (!in.is_open()) {
        cerr << "[Lexicon] Could not open word list: " << path << "\n";
        return false;
    }

    out.clear();
    string line;
    while (getline(in, line)) {
        string word = clean_word(line);
        if (word.empty() || word[0] == '#' || word[0] == ';') continue;
        out.insert(word);
    }

    if (in.bad()) {
        cerr << "[Lexicon] Read error in word list: " << path << "\n";
        return false;
    }
    if (out.empty()) {
        cerr << "[Lexicon] Word list is empty: " << path << "\n";
        return false;
    }
    return true;
}

string LexiconStore::clean_word(const string& line) {
    auto start = line.find_first_not_of(" \t\r\n");
    if (start == string::npos) return "";
    auto end = line.find_last_not_of(" \t\r\n");
    string word = line.substr(start, end - start + 1);

    // Drop a UTF-8 byte order mark left at the top of a file
    if (word.compare(0, 3, "\xEF\xBB\xBF") == 0) word.erase(0, 3);

    transform(word.begin(), word.end(), word.begin(), [](unsigned char c) {
        return c < 0x80 ? static_cast<char>(tolower(c)) : static_cast<char>(c);
    });
    return word;
}
